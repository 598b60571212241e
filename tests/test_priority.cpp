#include <catch2/catch_test_macros.hpp>

#include "bus/priority.hpp"

TEST_CASE("Priority classification", "[priority]") {

    SECTION("ActiveProject") {
        REQUIRE(classify(true, "error") == Priority::Critical);
        REQUIRE(classify(true, "warn") == Priority::High);
        REQUIRE(classify(true, "success") == Priority::High);
        REQUIRE(classify(true, "info") == Priority::Medium);
    }

    SECTION("InactiveProject") {
        REQUIRE(classify(false, "error") == Priority::High);
        REQUIRE(classify(false, "warn") == Priority::Medium);
        REQUIRE(classify(false, "success") == Priority::Medium);
        REQUIRE(classify(false, "info") == Priority::Low);
    }

    SECTION("WarningIsAliasOfWarn") {
        REQUIRE(classify(true, "warning") == Priority::High);
        REQUIRE(classify(false, "warning") == Priority::Medium);
    }

    SECTION("UnknownLevelIsSilent") {
        REQUIRE(classify(true, "debug") == Priority::Silent);
        REQUIRE(classify(false, "debug") == Priority::Silent);
        REQUIRE(classify(true, "") == Priority::Silent);
        REQUIRE(classify(true, "ERROR") == Priority::Silent);
    }

    SECTION("NamesRoundTrip") {
        for (auto p : {Priority::Critical, Priority::High, Priority::Medium, Priority::Low,
                       Priority::Silent}) {
            REQUIRE(priority_from_string(to_string(p)) == p);
        }
        REQUIRE_FALSE(priority_from_string("urgent").has_value());
    }
}
