#include "test_framework.hpp"

#include "pairlink/common/crypto.hpp"
#include "pairlink/common/fs.hpp"
#include "pairlink/common/json_util.hpp"
#include "pairlink/common/result.hpp"
#include "pairlink/common/toml.hpp"

#include <set>

void register_common_tests(std::vector<pairlink::tests::TestCase> &tests) {
  using pairlink::tests::require;
  namespace common = pairlink::common;

  tests.push_back({"common_status_carries_code_and_detail", [] {
                     const auto status = common::Status::error(common::ErrorCode::InvalidPayload,
                                                               "bad", "{raw");
                     require(!status.ok(), "error status should not be ok");
                     require(status.code() == common::ErrorCode::InvalidPayload, "code mismatch");
                     require(status.detail() == "{raw", "detail mismatch");
                     require(common::error_code_name(status.code()) == "invalid_payload",
                             "code name mismatch");
                     require(common::Status::success().ok(), "success should be ok");
                   }});

  tests.push_back({"common_result_failure_from_status_keeps_code", [] {
                     const auto status = common::Status::error(common::ErrorCode::Timeout, "slow");
                     const auto result = common::Result<int>::failure(status);
                     require(!result.ok(), "result should fail");
                     require(result.code() == common::ErrorCode::Timeout, "code should carry over");
                     require(result.status().error() == "slow", "message should carry over");
                   }});

  tests.push_back({"common_result_value_on_failure_throws", [] {
                     const auto result = common::Result<int>::failure("nope");
                     bool threw = false;
                     try {
                       (void)result.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on a failure should throw");
                     require(result.code() == common::ErrorCode::Internal, "default code");
                   }});

  tests.push_back({"common_trim_and_lower", [] {
                     require(common::trim("  a b \r\n") == "a b", "trim mismatch");
                     require(common::to_lower("Content-LENGTH") == "content-length",
                             "lower mismatch");
                     require(common::starts_with("--config=x", "--config="), "prefix mismatch");
                   }});

  tests.push_back({"json_escape_control_characters", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n",
                             "basic escapes");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control escape");
                     require(common::json_quote("x") == "\"x\"", "quote mismatch");
                   }});

  tests.push_back({"json_parse_object_decodes_escapes", [] {
                     const auto parsed = common::json_parse_object(
                         R"({"e":"\u00e9","smile":"\ud83d\ude00","path":"a\/b\tc",)"
                         "\"raw\":\"caf\xC3\xA9\"}");
                     require(parsed.ok(), parsed.error());
                     const auto &object = parsed.value();
                     require(object.get_string("e") == "\xC3\xA9", "two-byte utf8");
                     require(object.get_string("smile") == "\xF0\x9F\x98\x80", "surrogate pair");
                     require(object.get_string("path") == "a/b\tc", "solidus and tab");
                     require(object.get_string("raw") == "caf\xC3\xA9", "raw utf8 kept");
                   }});

  tests.push_back({"json_parse_object_rejects_bad_strings", [] {
                     const std::vector<std::string> bad = {
                         R"({"t":"abc\q"})",        R"({"t":"\uZZZZ"})",
                         R"({"t":"\u12"})",         R"({"t":"\ud800"})",
                         R"({"t":"\ud800x"})",      R"({"t":"\ud800\u0041"})",
                         R"({"t":"\udc00"})",       "{\"t\":\"\xFF\"}",
                         "{\"t\":\"\xC3\"}",        "{\"t\":\"\xC0\xAF\"}",
                         "{\"t\":\"\xED\xA0\x80\"}", "{\"t\":\"\xF5\x80\x80\x80\"}",
                         "{\"\xFE\":\"x\"}"};
                     for (const auto &input : bad) {
                       const auto parsed = common::json_parse_object(input);
                       require(!parsed.ok(), "should reject: " + input);
                       require(parsed.code() == common::ErrorCode::InvalidPayload,
                               "wrong code for: " + input);
                     }
                   }});

  tests.push_back({"json_parse_object_reads_members", [] {
                     const auto parsed = common::json_parse_object(
                         R"( {"url":"ws://10.0.0.2:8080","token":"t\"1","n":12.5e1,
                              "flag":true,"nested":{"a":[1,2,{"b":null}]},"s":"true"} )");
                     require(parsed.ok(), parsed.error());
                     const auto &object = parsed.value();
                     require(object.get_string("url") == "ws://10.0.0.2:8080", "url mismatch");
                     require(object.get_string("token") == "t\"1", "token mismatch");
                     require(!object.get_string("n").has_value(), "number is not a string");
                     require(object.get_bool("flag") == true, "bool mismatch");
                     require(object.get_bool("s") == true, "string bool mismatch");
                     require(object.fields().at("nested").kind == common::JsonKind::Object,
                             "nested kind mismatch");
                     require(object.size() == 6, "member count mismatch");
                   }});

  tests.push_back({"json_parse_object_rejects_malformed_input", [] {
                     const std::vector<std::string> bad = {
                         "",          "not json",          "{\"url\":}",      "{\"a\":1,}",
                         "[1,2]",     "{\"a\":\"x\"} tail", "{\"a\":tru}",     "{\"a\":01}",
                         "{\"a\":\"x", "{'a':1}",           "{\"a\":\"\x01\"}"};
                     for (const auto &input : bad) {
                       const auto parsed = common::json_parse_object(input);
                       require(!parsed.ok(), "should reject: " + input);
                       require(parsed.code() == common::ErrorCode::InvalidPayload,
                               "wrong code for: " + input);
                       require(parsed.detail() == input, "detail should echo the input");
                     }
                   }});

  tests.push_back({"json_parse_object_limits_depth", [] {
                     std::string deep = "{\"a\":";
                     for (int i = 0; i < 40; ++i) {
                       deep += "[";
                     }
                     for (int i = 0; i < 40; ++i) {
                       deep += "]";
                     }
                     deep += "}";
                     require(!common::json_parse_object(deep).ok(), "deep nesting should fail");
                   }});

  tests.push_back({"toml_parse_sections_and_comments", [] {
                     const auto parsed = common::parse_toml(R"(
top = 'single'
[listener]
host = "0.0.0.0" # trailing comment
port = 10_035
enabled = TRUE
label = "a # not a comment"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("top") == "single", "single-quoted value");
                     require(doc.get_string("listener.host") == "0.0.0.0", "host mismatch");
                     require(doc.get_u64("listener.port", 0) == 10035, "underscore number");
                     require(doc.get_bool("listener.enabled", false), "bool mismatch");
                     require(doc.get_string("listener.label") == "a # not a comment",
                             "hash inside string");
                     require(!doc.get_bounded("listener.port", 1, 1000).has_value(),
                             "bound should reject");
                   }});

  tests.push_back({"toml_parse_reports_line_numbers", [] {
                     const auto parsed = common::parse_toml("a = 1\n[broken\n");
                     require(!parsed.ok(), "unterminated section should fail");
                     require(parsed.error().find("line 2") != std::string::npos,
                             "error should name the line");
                     require(!common::parse_toml("just text").ok(), "missing '=' should fail");
                   }});

  tests.push_back({"toml_quote_round_trips_through_parser", [] {
                     const std::string quoted = common::quote_toml_string("a\"b\\c");
                     const auto parsed = common::parse_toml("k = " + quoted);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get_string("k") == "a\"b\\c", "quote mismatch");
                   }});

  tests.push_back({"crypto_sha256_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 mismatch");
                   }});

  tests.push_back({"crypto_token_fingerprint_hides_token", [] {
                     const std::string token = "super-secret-token";
                     const auto fingerprint = common::token_fingerprint(token);
                     require(fingerprint.find(token) == std::string::npos,
                             "fingerprint must not contain the token");
                     require(fingerprint.find("len=18") == 0, "length prefix mismatch");
                     require(common::token_fingerprint("") == "len=0", "empty token");
                   }});

  tests.push_back({"crypto_random_below_stays_in_range", [] {
                     std::set<std::uint32_t> seen;
                     for (int i = 0; i < 200; ++i) {
                       const auto value = common::random_below(10);
                       require(value < 10, "value out of range");
                       seen.insert(value);
                     }
                     require(seen.size() > 1, "values should vary");
                   }});
}
