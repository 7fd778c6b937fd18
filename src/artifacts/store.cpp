#include "codebox/artifacts/store.hpp"

#include "codebox/observability/global.hpp"

#include <curl/curl.h>

namespace codebox::artifacts {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *output = static_cast<std::string *>(userdata);
  const auto total = size * nmemb;
  output->append(ptr, total);
  return total;
}

std::string escape_segments(CURL *curl, const std::string &path) {
  std::string out;
  std::size_t start = 0;
  while (start <= path.size()) {
    const std::size_t slash = path.find('/', start);
    const std::size_t end = slash == std::string::npos ? path.size() : slash;
    const std::string segment = path.substr(start, end - start);
    char *escaped = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
    if (escaped != nullptr) {
      out += escaped;
      curl_free(escaped);
    }
    if (slash == std::string::npos) {
      break;
    }
    out.push_back('/');
    start = slash + 1;
  }
  return out;
}

std::string strip_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

struct HttpOutcome {
  CURLcode code = CURLE_OK;
  long status = 0;
  std::string body;
};

HttpOutcome perform(CURL *curl, const std::string &url, const std::optional<std::string> &token,
                    const std::string *post_body, const std::string &content_type,
                    const std::chrono::milliseconds timeout) {
  HttpOutcome outcome;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &outcome.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "codebox/" CODEBOX_VERSION);

  struct curl_slist *header_list = nullptr;
  if (token.has_value() && !token->empty()) {
    const std::string line = "Authorization: Bearer " + *token;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (post_body != nullptr) {
    const std::string line = "Content-Type: " + content_type;
    header_list = curl_slist_append(header_list, line.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  outcome.code = curl_easy_perform(curl);
  if (outcome.code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &outcome.status);
  }
  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  return outcome;
}

common::Result<std::string> to_result(const HttpOutcome &outcome, const std::string &action,
                                      const std::string &path) {
  if (outcome.code != CURLE_OK) {
    return common::Result<std::string>::failure(action + " '" + path +
                                                "' failed: " + curl_easy_strerror(outcome.code));
  }
  if (outcome.status < 200 || outcome.status >= 300) {
    std::string message =
        action + " '" + path + "' failed: HTTP " + std::to_string(outcome.status);
    if (!outcome.body.empty()) {
      message += " " + outcome.body.substr(0, 200);
    }
    return common::Result<std::string>::failure(message);
  }
  return common::Result<std::string>::success(outcome.body);
}

} // namespace

std::string normalize_artifact_path(const std::string &path) {
  const auto first = path.find_first_not_of('/');
  return first == std::string::npos ? "" : path.substr(first);
}

std::string build_canonical_path(const std::string &path, const std::optional<std::string> &run_id,
                                 const std::string &artifact_type) {
  const std::string clean = normalize_artifact_path(path);
  if (!run_id.has_value() || clean.rfind("runs/", 0) == 0) {
    return clean;
  }
  return "runs/" + *run_id + "/" + artifact_type + "/" + clean;
}

HttpArtifactStore::HttpArtifactStore(config::ArtifactStoreConfig config)
    : config_(std::move(config)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpArtifactStore::~HttpArtifactStore() { curl_global_cleanup(); }

std::string HttpArtifactStore::artifact_url(const std::string &session_id,
                                            const std::string &path) const {
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return "";
  }
  const std::string url = strip_trailing_slashes(config_.url) + "/artifacts/" +
                          escape_segments(curl, session_id) + "/" +
                          escape_segments(curl, normalize_artifact_path(path));
  curl_easy_cleanup(curl);
  return url;
}

common::Result<std::string> HttpArtifactStore::fetch(const std::string &session_id,
                                                     const std::string &path,
                                                     const std::chrono::milliseconds timeout) {
  if (!configured()) {
    return common::Result<std::string>::failure("artifact store is not configured");
  }
  const std::string url = artifact_url(session_id, path);
  CURL *curl = curl_easy_init();
  if (url.empty() || curl == nullptr) {
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
    return common::Result<std::string>::failure("curl init failed");
  }

  const HttpOutcome outcome = perform(curl, url, config_.token, nullptr, "", timeout);
  curl_easy_cleanup(curl);

  auto result = to_result(outcome, "fetch", normalize_artifact_path(path));
  observability::record_artifact_request("GET", normalize_artifact_path(path), outcome.status,
                                         result.ok());
  return result;
}

common::Result<std::string> HttpArtifactStore::upload(const std::string &session_id,
                                                      const std::string &canonical_path,
                                                      const std::string &data,
                                                      const std::string &content_type,
                                                      const std::chrono::milliseconds timeout) {
  if (!configured()) {
    return common::Result<std::string>::failure("artifact store is not configured");
  }
  const std::string base = artifact_url(session_id, canonical_path);
  CURL *curl = curl_easy_init();
  if (base.empty() || curl == nullptr) {
    if (curl != nullptr) {
      curl_easy_cleanup(curl);
    }
    return common::Result<std::string>::failure("curl init failed");
  }

  const HttpOutcome outcome =
      perform(curl, base + "?upload=true", config_.token, &data, content_type, timeout);
  curl_easy_cleanup(curl);

  auto result = to_result(outcome, "upload", canonical_path);
  observability::record_artifact_request("POST", canonical_path, outcome.status, result.ok());
  return result;
}

} // namespace codebox::artifacts
