#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/WindowStateStore.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace pipeweaver::infra;
using pipeweaver::core::WindowGeometry;

namespace {

class TestStateDir {
public:
    TestStateDir() : dir_(std::filesystem::temp_directory_path() / "pipeweaver_window_test") {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    ~TestStateDir() { std::filesystem::remove_all(dir_); }

    std::filesystem::path path() const { return dir_; }

private:
    std::filesystem::path dir_;
};

} // namespace

TEST_CASE("WindowStateStore load", "[WindowStateStore]") {
    TestStateDir dir;
    WindowStateStore store(dir.path() / "window.json");

    SECTION("Missing file yields the default geometry") {
        auto geometry = store.load();

        REQUIRE(geometry == WindowGeometry{});
        REQUIRE(geometry.width == 1000);
        REQUIRE(geometry.height == 600);
        REQUIRE(geometry.x == 100);
        REQUIRE(geometry.y == 100);
    }

    SECTION("Reads a stored geometry") {
        std::ofstream(store.path()) << R"({"width": 1280, "height": 720, "x": 40, "y": -20})";

        REQUIRE(store.load() == WindowGeometry{1280, 720, 40, -20});
    }

    SECTION("Invalid JSON yields the default geometry") {
        std::ofstream(store.path()) << "not json";

        REQUIRE(store.load() == WindowGeometry{});
    }

    SECTION("Missing or mistyped fields yield the default geometry") {
        std::ofstream(store.path()) << R"({"width": 1280, "height": 720, "x": 40})";
        REQUIRE(store.load() == WindowGeometry{});

        std::ofstream(store.path()) << R"({"width": "wide", "height": 720, "x": 40, "y": 0})";
        REQUIRE(store.load() == WindowGeometry{});
    }
}

TEST_CASE("WindowStateStore save", "[WindowStateStore]") {
    TestStateDir dir;

    SECTION("Writes all four fields") {
        WindowStateStore store(dir.path() / "window.json");
        REQUIRE(store.save(WindowGeometry{1400, 900, 10, 20}));

        std::ifstream file(store.path());
        nlohmann::json j;
        file >> j;
        REQUIRE(j["width"] == 1400);
        REQUIRE(j["height"] == 900);
        REQUIRE(j["x"] == 10);
        REQUIRE(j["y"] == 20);
    }

    SECTION("Saved geometry loads back") {
        WindowStateStore store(dir.path() / "window.json");
        WindowGeometry geometry{1100, 650, 300, 200};

        REQUIRE(store.save(geometry));
        REQUIRE(store.load() == geometry);
    }

    SECTION("Creates a missing parent directory") {
        WindowStateStore store(dir.path() / "nested" / "pipeweaver" / "window.json");

        REQUIRE(store.save(WindowGeometry{}));
        REQUIRE(std::filesystem::exists(store.path()));
    }
}
