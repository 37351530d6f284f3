#include <catch2/catch_test_macros.hpp>

#include "app/SingleInstance.hpp"
#include "infrastructure/ipc/ControlListener.hpp"
#include "infrastructure/ipc/MessageRelay.hpp"

#include "support/TestSocketDir.hpp"

#include <chrono>
#include <fstream>
#include <thread>

using namespace pipeweaver::app;
using namespace pipeweaver::infra;
using pipeweaver::core::WindowMessage;
using pipeweaver::test::TestSocketDir;
using pipeweaver::test::waitForPending;

TEST_CASE("SingleInstance with no running instance", "[SingleInstance]") {
    TestSocketDir dir("single_none");
    SingleInstance detector(dir.address());

    SECTION("Absent address reports no instance") {
        REQUIRE_FALSE(detector.detectAndForward());
        REQUIRE_FALSE(detector.isRunning());
    }

    SECTION("Detection creates nothing on disk") {
        detector.detectAndForward();

        REQUIRE_FALSE(dir.address().exists());
        REQUIRE(std::filesystem::is_empty(dir.path()));
    }
}

TEST_CASE("SingleInstance with a stale socket", "[SingleInstance]") {
    TestSocketDir dir("single_stale");
    pipeweaver::test::createStaleSocket(dir.address());
    REQUIRE(dir.address().exists());

    SingleInstance detector(dir.address());

    SECTION("Stale socket is removed and no instance reported") {
        REQUIRE_FALSE(detector.detectAndForward());
        REQUIRE_FALSE(dir.address().exists());
    }

    SECTION("A listener can bind after cleanup") {
        REQUIRE_FALSE(detector.detectAndForward());

        MessageRelay relay;
        ControlListener listener(dir.address(), relay, std::chrono::milliseconds(20));
        REQUIRE(listener.start().get() == ControlListener::BindStatus::Bound);
    }

    SECTION("Leftover regular files are treated as stale") {
        dir.address().remove();
        std::ofstream(dir.address().path()) << "junk";

        REQUIRE_FALSE(detector.detectAndForward());
        REQUIRE_FALSE(dir.address().exists());
    }
}

TEST_CASE("SingleInstance with a running instance", "[SingleInstance]") {
    TestSocketDir dir("single_live");
    MessageRelay relay;
    ControlListener listener(dir.address(), relay, std::chrono::milliseconds(20));
    REQUIRE(listener.start().get() == ControlListener::BindStatus::Bound);

    SingleInstance detector(dir.address());

    SECTION("Forwards a focus request") {
        REQUIRE(detector.detectAndForward());
        REQUIRE(detector.isRunning());

        REQUIRE(waitForPending(relay, 1));
        REQUIRE(relay.tryReceive() == WindowMessage::Trigger);
    }

    SECTION("Leaves the running instance's socket in place") {
        REQUIRE(detector.detectAndForward());

        REQUIRE(dir.address().exists());
        REQUIRE(listener.isRunning());
    }
}
