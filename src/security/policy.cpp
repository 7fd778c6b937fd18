#include "codebox/security/policy.hpp"

#include <array>

namespace codebox::security {

namespace {

constexpr std::array kAllowedModules = {
    // data analysis
    "numpy", "pandas", "scipy", "sklearn", "statsmodels",
    // text and data formats
    "json", "csv", "re", "string", "textwrap", "base64", "hashlib", "uuid", "pprint",
    // numbers
    "math", "statistics", "decimal", "fractions", "random",
    // containers and functional helpers
    "collections", "itertools", "functools", "operator", "copy",
    // dates
    "datetime", "time", "calendar", "dateutil", "pytz",
    // misc
    "urllib.parse", "typing", "typing_extensions", "io",
};

constexpr std::array kDeniedModules = {
    // process and filesystem
    "os", "sys", "subprocess", "shutil", "pathlib", "glob", "fnmatch", "tempfile", "pty", "tty",
    "termios", "resource", "signal", "atexit", "gc",
    // interpreter internals
    "importlib", "builtins", "code", "codeop", "ast", "dis", "inspect", "ctypes", "cffi",
    // network
    "socket", "socketserver", "ssl", "ftplib", "smtplib", "poplib", "imaplib", "telnetlib", "http",
    "urllib", "requests", "httpx", "aiohttp", "asyncio", "webbrowser",
    // concurrency
    "multiprocessing", "threading", "concurrent", "_thread",
    // persistence and archives
    "shelve", "dbm", "sqlite3", "pickle", "marshal", "gzip", "zipfile", "tarfile",
    // library submodules that reach files, the network or native code
    "numpy.f2py", "numpy.distutils", "numpy.testing", "numpy.ctypeslib", "pandas.io",
    "scipy.io", "scipy.datasets", "statsmodels.datasets",
};

constexpr std::array kDeniedBuiltins = {
    "eval",   "exec",    "compile",    "open",    "input", "__import__", "globals",
    "locals", "vars",    "dir",        "getattr", "setattr", "delattr",  "hasattr",
    "breakpoint", "memoryview", "help", "exit",   "quit",
};

constexpr std::array kDeniedAttributes = {
    // object model
    "__class__", "__bases__", "__subclasses__", "__mro__", "mro", "__dict__", "__getattribute__",
    "__reduce__", "__reduce_ex__",
    // functions and their scopes
    "__code__", "__globals__", "__builtins__", "__import__", "__closure__", "__self__", "__func__",
    "__wrapped__",
    // module machinery
    "__loader__", "__spec__",
    // frames and tracebacks
    "__traceback__", "tb_frame", "tb_next", "f_back", "f_globals", "f_locals", "f_builtins", "f_code",
    "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code",
    // shells out to the system clipboard tools
    "to_clipboard",
};

// Library methods whose first argument (or a destination keyword) is a path or
// writable buffer.
constexpr std::array kFileWriterMethods = {
    "to_csv",   "to_json",  "to_excel", "to_parquet", "to_pickle",   "to_hdf",
    "to_feather", "to_stata", "to_orc", "to_xml",     "to_html",     "to_latex",
    "to_markdown", "to_string", "tofile", "dump",     "savefig",
};

struct MemberDenial {
  const char *module;
  std::vector<const char *> members;
};

const std::vector<MemberDenial> &member_denials() {
  static const std::vector<MemberDenial> denials = {
      {"io", {"open", "open_code", "FileIO"}},
      {"operator", {"attrgetter", "methodcaller"}},
      {"string", {"Formatter"}},
      {"typing", {"get_type_hints", "ForwardRef"}},
      // Blocks in C; the trace-based timeout cannot interrupt it.
      {"time", {"sleep"}},
      {"numpy",
       {"load", "save", "savez", "savez_compressed", "loadtxt", "savetxt", "genfromtxt", "fromfile",
        "fromregex", "memmap", "DataSource", "ctypeslib"}},
      {"pandas",
       {"read_csv", "read_table", "read_fwf", "read_excel", "read_json", "read_html", "read_xml",
        "read_parquet", "read_orc", "read_feather", "read_pickle", "read_hdf", "read_sql",
        "read_sql_query", "read_sql_table", "read_sas", "read_spss", "read_stata",
        "read_clipboard", "read_gbq", "to_pickle", "HDFStore", "ExcelWriter", "ExcelFile"}},
      {"sklearn",
       {"fetch_openml", "fetch_california_housing", "fetch_20newsgroups",
        "fetch_20newsgroups_vectorized", "fetch_covtype", "fetch_kddcup99", "fetch_lfw_pairs",
        "fetch_lfw_people", "fetch_olivetti_faces", "fetch_rcv1", "fetch_species_distributions",
        "get_data_home", "clear_data_home", "load_svmlight_file", "load_svmlight_files",
        "dump_svmlight_file"}},
      {"statsmodels", {"load", "load_pickle"}},
  };
  return denials;
}

std::string attribute_alternation(const bool dunders_only) {
  std::string alternation;
  for (const char *attribute : kDeniedAttributes) {
    const std::string name = attribute;
    if (dunders_only && (name.size() < 5 || name.rfind("__", 0) != 0)) {
      continue;
    }
    if (!alternation.empty()) {
      alternation += '|';
    }
    alternation += name;
  }
  return alternation;
}

std::vector<PatternRule> build_dangerous_patterns() {
  const auto flags = std::regex::ECMAScript | std::regex::icase;
  std::vector<PatternRule> rules;
  rules.push_back({std::regex(R"(\bos\s*\.\s*system\s*\()", flags), "os.system() is not permitted"});
  rules.push_back({std::regex(R"(\bos\s*\.\s*popen\s*\()", flags), "os.popen() is not permitted"});
  rules.push_back({std::regex(R"(\bsubprocess\s*\.)", flags), "subprocess is not permitted"});
  rules.push_back({std::regex(R"(\b__import__\s*\()", flags), "__import__() is not permitted"});
  // Bare calls only: df.eval(...) and re.compile(...) are ordinary library methods.
  rules.push_back({std::regex(R"((^|[^.\w])eval\s*\()", flags), "eval() is not permitted"});
  rules.push_back({std::regex(R"((^|[^.\w])exec\s*\()", flags), "exec() is not permitted"});
  rules.push_back({std::regex(R"((^|[^.\w])compile\s*\()", flags), "compile() is not permitted"});
  rules.push_back({std::regex(R"(\bopen\s*\([^)]*["']/(?!tmp))", flags),
                   "open() with an absolute path is not permitted"});
  // "{0.gi_frame.f_back}".format(g) walks attributes without an Attribute node.
  rules.push_back({std::regex("[\"'][^\"'\\n]*\\{[^{}\"'\\n]*[.\\[](" +
                                  attribute_alternation(false) + ")\\b",
                              flags),
                   "format fields that reach blocked attributes are not permitted"});
  rules.push_back({std::regex("[\"'][^\"'\\n]*(" + attribute_alternation(true) + ")", flags),
                   "string literals naming blocked attributes are not permitted"});
  return rules;
}

PolicySet build_default_policy() {
  PolicySet policy;
  policy.allowed_modules.insert(kAllowedModules.begin(), kAllowedModules.end());
  policy.denied_modules.insert(kDeniedModules.begin(), kDeniedModules.end());
  policy.denied_builtins.insert(kDeniedBuiltins.begin(), kDeniedBuiltins.end());
  policy.denied_attributes.insert(kDeniedAttributes.begin(), kDeniedAttributes.end());
  policy.file_writer_methods.insert(kFileWriterMethods.begin(), kFileWriterMethods.end());
  for (const auto &denial : member_denials()) {
    auto &members = policy.denied_module_members[denial.module];
    members.insert(denial.members.begin(), denial.members.end());
  }
  policy.dangerous_patterns = build_dangerous_patterns();
  return policy;
}

} // namespace

std::string PolicySet::top_level(const std::string &module_name) {
  return module_name.substr(0, module_name.find('.'));
}

ModuleVerdict PolicySet::classify_module(const std::string &module_name) const {
  if (module_name.empty()) {
    return ModuleVerdict::Unlisted;
  }
  std::string prefix = module_name;
  while (true) {
    if (denied_modules.contains(prefix)) {
      return ModuleVerdict::Denied;
    }
    if (allowed_modules.contains(prefix)) {
      return ModuleVerdict::Allowed;
    }
    const auto dot = prefix.rfind('.');
    if (dot == std::string::npos) {
      return ModuleVerdict::Unlisted;
    }
    prefix.resize(dot);
  }
}

bool PolicySet::is_module_allowed(const std::string &module_name) const {
  return classify_module(module_name) == ModuleVerdict::Allowed;
}

bool PolicySet::is_module_denied(const std::string &module_name) const {
  return classify_module(module_name) == ModuleVerdict::Denied;
}

bool PolicySet::is_builtin_denied(const std::string &name) const {
  return denied_builtins.contains(name);
}

bool PolicySet::is_attribute_denied(const std::string &name) const {
  return denied_attributes.contains(name);
}

bool PolicySet::is_file_writer(const std::string &method) const {
  return file_writer_methods.contains(method);
}

bool PolicySet::is_member_denied(const std::string &module_name, const std::string &member) const {
  const auto it = denied_module_members.find(top_level(module_name));
  return it != denied_module_members.end() && it->second.contains(member);
}

std::vector<std::string> PolicySet::match_dangerous_patterns(const std::string &code) const {
  std::vector<std::string> messages;
  for (const auto &rule : dangerous_patterns) {
    if (std::regex_search(code, rule.regex)) {
      messages.push_back(rule.message);
    }
  }
  return messages;
}

const PolicySet &default_policy() {
  static const PolicySet policy = build_default_policy();
  return policy;
}

} // namespace codebox::security
