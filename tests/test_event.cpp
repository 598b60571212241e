#include <catch2/catch_test_macros.hpp>

#include "bus/event.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

TEST_CASE("Event wire format", "[event]") {

    SECTION("ParseFullRecord") {
        auto e = parse_event(
            R"({"type":"agent.completed","project":"myapp","source":"reviewer",)"
            R"("ts":"2026-02-12T15:30:00Z","level":"success","title":"Code review complete",)"
            R"("body":"All 5 files approved","meta":{"files":5}})");
        REQUIRE(e.has_value());
        REQUIRE(e->type == "agent.completed");
        REQUIRE(e->project == "myapp");
        REQUIRE(e->source == "reviewer");
        REQUIRE(e->ts == "2026-02-12T15:30:00Z");
        REQUIRE(e->level == "success");
        REQUIRE(e->title == "Code review complete");
        REQUIRE(e->body == "All 5 files approved");
        REQUIRE(e->meta["files"] == 5);
        REQUIRE_FALSE(e->priority.has_value());
    }

    SECTION("DefaultsFilled") {
        auto e = parse_event(R"({"type":"build.done","project":"myapp"})");
        REQUIRE(e.has_value());
        REQUIRE(e->level == "info");
        REQUIRE(e->source.empty());
        REQUIRE(e->ts.size() == 20);
        REQUIRE(e->ts.back() == 'Z');
        REQUIRE(e->meta.is_null());
    }

    SECTION("RejectsMalformed") {
        auto check = [](const char* line) {
            auto e = parse_event(line);
            REQUIRE_FALSE(e.has_value());
            REQUIRE(e.error().code == ErrorCode::MalformedEvent);
        };
        check("not json");
        check("[1,2,3]");
        check(R"({"project":"myapp"})");
        check(R"({"type":"x"})");
        check(R"({"type":7,"project":"myapp"})");
        check(R"({"type":"x","project":""})");
        check(R"({"type":"x","project":"p","title":42})");
    }

    SECTION("UnknownLevelKeptVerbatim") {
        auto e = parse_event(R"({"type":"x","project":"p","level":"trace"})");
        REQUIRE(e.has_value());
        REQUIRE(e->level == "trace");
    }

    SECTION("SerializationOmitsEmptyOptionals") {
        auto e = make_event("service.started", "myapp", "supervisor", "info");
        auto j = to_json(e);
        REQUIRE(j["type"] == "service.started");
        REQUIRE_FALSE(j.contains("title"));
        REQUIRE_FALSE(j.contains("body"));
        REQUIRE_FALSE(j.contains("meta"));
        REQUIRE_FALSE(j.contains("priority"));
        REQUIRE_FALSE(j.contains("seq"));

        e.priority = Priority::High;
        e.title = "Started";
        j = to_json(e);
        REQUIRE(j["priority"] == "high");
        REQUIRE(j["title"] == "Started");
    }

    SECTION("LineIsNewlineTerminated") {
        auto line = to_line(make_event("a.b", "p", "s", "warn", "t"));
        REQUIRE(line.back() == '\n');
        REQUIRE(line.find('\n') == line.size() - 1);

        auto back = parse_event(std::string_view(line).substr(0, line.size() - 1));
        REQUIRE(back.has_value());
        REQUIRE(back->title == "t");
    }
}
