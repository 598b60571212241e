#include <catch2/catch_test_macros.hpp>

#include "compositor/request_issuer.hpp"
#include "fake_compositor.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Calls = std::vector<std::string>;

namespace {

Workspace workspace(uint64_t id, std::string name) {
    return {.id = id, .idx = static_cast<uint32_t>(id), .name = std::move(name), .output = "DP-1"};
}

Window window(uint64_t id, uint64_t workspace_id) {
    return {.id = id, .title = "w", .app_id = "foot", .workspace_id = workspace_id};
}

bool wait_until(const std::function<bool()>& done, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST_CASE("RequestIssuer open", "[compositor]") {
    FakeCompositor fake;
    RequestIssuer issuer(fake, 8);

    SECTION("FocusesExistingWorkspace") {
        fake.set_workspaces({workspace(1, ""), workspace(2, "myapp")});
        REQUIRE(issuer.execute(OpenProjectWorkspace{"myapp", {"foot"}}));
        CHECK(fake.calls() == Calls{"focus_workspace myapp"});
    }

    SECTION("CreatesWorkspaceAndLaunchesWindows") {
        fake.set_workspaces({workspace(1, ""), workspace(2, "other")});
        REQUIRE(issuer.execute(OpenProjectWorkspace{"myapp", {"foot", "", "firefox --new-window"}}));
        CHECK(fake.calls() == Calls{
                                  "focus_workspace_down",
                                  "focus_workspace_down",
                                  "set_workspace_name myapp",
                                  "spawn sh -c foot",
                                  "spawn sh -c firefox --new-window",
                              });
    }

    SECTION("CompositorRefusal") {
        fake.set_workspaces({workspace(1, "myapp")});
        fake.fail_actions(true);
        auto r = issuer.execute(OpenProjectWorkspace{"myapp", {}});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::CompositorRequest);
    }
}

TEST_CASE("RequestIssuer close", "[compositor]") {
    FakeCompositor fake;
    RequestIssuer issuer(fake, 8);

    SECTION("ClosesWindowsThenReleasesName") {
        fake.set_workspaces({workspace(1, "myapp"), workspace(2, "other")});
        fake.set_windows({window(7, 1), window(8, 2), window(9, 1)});
        REQUIRE(issuer.execute(CloseProjectWorkspace{"myapp"}));
        CHECK(fake.calls() == Calls{"close_window 7", "close_window 9", "unset_workspace_name myapp"});
    }

    SECTION("MissingWorkspaceIsNotAnError") {
        fake.set_workspaces({workspace(1, "other")});
        REQUIRE(issuer.execute(CloseProjectWorkspace{"myapp"}));
        CHECK(fake.calls().empty());
    }
}

TEST_CASE("RequestIssuer worker", "[compositor]") {
    FakeCompositor fake;
    RequestIssuer issuer(fake, 8);

    SECTION("RunsSubmittedRequestsInOrder") {
        fake.set_workspaces({workspace(1, "myapp")});
        issuer.start();
        issuer.submit(MarkWindowUrgent{3});
        issuer.submit(OpenProjectWorkspace{"myapp", {}});
        REQUIRE(wait_until([&] { return fake.calls().size() == 2; }));
        CHECK(fake.calls() == Calls{"set_window_urgent 3", "focus_workspace myapp"});
        CHECK(issuer.failed_count() == 0);
        issuer.stop();
    }

    SECTION("CountsFailures") {
        fake.fail_actions(true);
        issuer.start();
        issuer.submit(MarkWindowUrgent{3});
        issuer.submit(MarkWindowUrgent{4});
        REQUIRE(wait_until([&] { return issuer.failed_count() == 2; }));
        issuer.stop();
    }

    SECTION("StopIsPrompt") {
        issuer.start();
        auto t0 = std::chrono::steady_clock::now();
        issuer.stop();
        CHECK(std::chrono::steady_clock::now() - t0 < 1s);
    }
}
