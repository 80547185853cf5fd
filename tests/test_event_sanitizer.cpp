#include <catch2/catch_test_macros.hpp>
#include "events/event_sanitizer.hpp"

#include <string>

using namespace agentcore;

TEST_CASE("Sanitizer: sensitive parameter keys redacted", "[events][sanitize]") {
    nlohmann::json params = {
        {"query", "SELECT 1"},
        {"api_key", "sk-123"},
        {"Password", "hunter2"},
        {"auth_header", "Bearer x"},
        {"nested", {{"access_token", "abc"}, {"limit", 10}}}
    };

    const auto out = sanitize::parameters(params);
    CHECK(out["query"] == "SELECT 1");
    CHECK(out["api_key"] == sanitize::kRedacted);
    CHECK(out["Password"] == sanitize::kRedacted);
    CHECK(out["auth_header"] == sanitize::kRedacted);
    CHECK(out["nested"]["access_token"] == sanitize::kRedacted);
    CHECK(out["nested"]["limit"] == 10);
}

TEST_CASE("Sanitizer: long parameter strings cut", "[events][sanitize]") {
    const std::string long_value(1000, 'x');
    const auto out = sanitize::parameters({{"text", long_value}});
    CHECK(out["text"].get<std::string>().size() == sanitize::kMaxParameterLength + 3);
}

TEST_CASE("Sanitizer: result lists capped", "[events][sanitize]") {
    nlohmann::json rows = nlohmann::json::array();
    for (int i = 0; i < 25; ++i) rows.push_back(i);

    const auto out = sanitize::result({{"rows", rows}, {"count", 25}});
    CHECK(out["rows"].size() == sanitize::kMaxResultListItems + 1);
    CHECK(out["rows"].back() == "...(truncated)");
    CHECK(out["count"] == 25);
}

TEST_CASE("Sanitizer: non-object inputs become empty objects", "[events][sanitize]") {
    CHECK(sanitize::parameters(nlohmann::json::array({1, 2})).empty());
    CHECK(sanitize::result("plain").empty());
    CHECK(sanitize::custom(nullptr).empty());
}

TEST_CASE("Sanitizer: error message hides home paths", "[events][sanitize]") {
    const auto msg = sanitize::error_message("open failed: /home/alice/.config/x and /Users/bob/y");
    CHECK(msg.find("/home/") == std::string::npos);
    CHECK(msg.find("/Users/") == std::string::npos);
    CHECK(msg.find("[PATH]/alice") != std::string::npos);
    CHECK(msg.find("[PATH]/bob") != std::string::npos);

    CHECK(sanitize::error_message("") == "An error occurred");
    CHECK(sanitize::error_message(std::string(1000, 'e')).size() == sanitize::kMaxErrorLength + 3);
}

TEST_CASE("Sanitizer: error context keeps allow-listed fields", "[events][sanitize]") {
    const auto out = sanitize::error_context({
        {"error_type", "timeout"},
        {"stack_trace", "secret internals"},
        {"agent_step", "planning"}
    });
    CHECK(out["error_type"] == "timeout");
    CHECK(out["agent_step"] == "planning");
    CHECK(out["user_facing"] == true);
    CHECK_FALSE(out.contains("stack_trace"));

    CHECK(sanitize::error_context(nlohmann::json::object()).empty());
}

TEST_CASE("Sanitizer: progress keeps allow-listed keys", "[events][sanitize]") {
    const auto out = sanitize::progress({
        {"percentage", 40},
        {"message", "Analyzing"},
        {"internal_state", "x"}
    });
    CHECK(out.size() == 2);
    CHECK(out["percentage"] == 40);
    CHECK_FALSE(out.contains("internal_state"));
}

TEST_CASE("Sanitizer: death messages per cause", "[events][sanitize]") {
    CHECK(sanitize::death_message("timeout", "triage").find("took too long") != std::string::npos);
    CHECK(sanitize::death_message("cancelled", "triage").find("was cancelled") != std::string::npos);
    CHECK(sanitize::death_message("something_else", "triage").find("critical error") != std::string::npos);
    CHECK(sanitize::death_message("memory_limit", "triage").find("triage") != std::string::npos);
}
