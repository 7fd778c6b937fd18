#include "test_framework.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/common/json_util.hpp"
#include "codebox/common/result.hpp"
#include "codebox/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_common_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;
  namespace common = codebox::common;

  tests.push_back({"result_carries_value_or_error", [] {
                     const auto ok = common::Result<int>::success(7);
                     require(ok.ok(), "success should be ok");
                     require(ok.value() == 7, "value mismatch");
                     const auto bad = common::Result<int>::failure("nope");
                     require(!bad.ok(), "failure should not be ok");
                     require(bad.error() == "nope", "error mismatch");
                     bool threw = false;
                     try {
                       (void)bad.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure throws");
                     const auto status = common::Status::error("broken");
                     require(!status.ok() && status.error() == "broken", "status error");
                   }});

  tests.push_back({"result_take_moves_value_out", [] {
                     auto text = common::Result<std::string>::success("payload");
                     const std::string taken = text.take();
                     require(taken == "payload", "taken value");
                     auto bad = common::Result<std::string>::failure("gone");
                     bool threw = false;
                     try {
                       (void)bad.take();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "take() on failure throws");
                   }});

  tests.push_back({"string_helpers", [] {
                     require(common::trim("  a b \n") == "a b", "trim");
                     require(common::starts_with("runs/1", "runs/"), "starts_with");
                     require(!common::starts_with("ru", "runs/"), "short starts_with");
                     require(common::to_lower("MCP-Session-Id") == "mcp-session-id", "to_lower");
                   }});

  tests.push_back({"sha256_hex_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                     require(common::sha256_hex("").size() == 64, "digest length");
                   }});

  tests.push_back({"read_file_roundtrip_and_missing", [] {
                     codebox::testing::TempDir dir;
                     dir.create_file("a.txt", "hello");
                     const auto read = common::read_file(dir.path() / "a.txt");
                     require(read.ok() && read.value() == "hello", "read_file content");
                     require(!common::read_file(dir.path() / "missing.txt").ok(),
                             "missing file should fail");
                   }});

  tests.push_back({"json_escape_control_and_quotes", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "escape");
                     require(common::json_quote("x") == "\"x\"", "quote");
                     require(common::json_unescape("\\u00e9\\n") == "\xC3\xA9\n", "unescape");
                   }});

  tests.push_back({"json_field_extraction", [] {
                     const std::string json =
                         R"({"ok":true,"runtime":{"python":"3.11.4"},"count":12,)"
                         R"json("helper_functions":["a()","b()"],"name":"x\"y"})json";
                     require(common::json_get_literal(json, "ok") == "true", "literal");
                     require(common::json_get_string(json, "name") == "x\"y", "string");
                     require(common::json_get_string(common::json_get_object(json, "runtime"),
                                                     "python") == "3.11.4",
                             "nested object");
                     const auto helpers = common::json_get_string_array(json, "helper_functions");
                     require(helpers.size() == 2 && helpers[1] == "b()", "string array");
                     require(common::json_get_string(json, "missing").empty(), "missing field");
                   }});

  tests.push_back({"toml_sections_fold_into_dotted_keys", [] {
                     const auto parsed = common::parse_toml("# top\n"
                                                            "[execution]\n"
                                                            "max_timeout_seconds = 90 # comment\n"
                                                            "[artifact_store]\n"
                                                            "url = \"http://store#1\"\n"
                                                            "enabled = true\n");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_u64("execution.max_timeout_seconds", 0) == 90, "u64");
                     require(doc.get_string("artifact_store.url") == "http://store#1",
                             "hash inside string kept");
                     require(doc.get_u64("execution.missing", 5) == 5, "fallback");
                     require(!doc.has("execution.missing"), "has");
                   }});
}
