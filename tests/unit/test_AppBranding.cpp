#include <catch2/catch_test_macros.hpp>

#include "ui/resources/AppIcon.hpp"

#include <QApplication>
#include <QColor>
#include <QIcon>
#include <QImage>
#include <QPixmap>

using namespace pipeweaver::ui;

namespace {

// Ensure QApplication is initialized for Qt GUI tests
struct QtAppInitializer {
    QtAppInitializer() {
        if (!QApplication::instance()) {
            static int argc = 1;
            static char* argv[] = {const_cast<char*>("test"), nullptr};
            app = new QApplication(argc, argv);
        }
    }
    QApplication* app{nullptr};
};

static QtAppInitializer qtInit;

} // namespace

TEST_CASE("AppIcon generates valid application icon", "[branding]") {
    SECTION("Application icon is not null") {
        QIcon icon = AppIcon::applicationIcon();
        REQUIRE(!icon.isNull());
    }

    SECTION("Application icon provides window and taskbar sizes") {
        QIcon icon = AppIcon::applicationIcon();

        for (int size : {16, 24, 32, 48, 64, 128, 256}) {
            QPixmap px = icon.pixmap(size, size);
            REQUIRE(!px.isNull());
            REQUIRE(px.width() == size);
            REQUIRE(px.height() == size);
        }
    }
}

TEST_CASE("AppIcon::createPixmap generates valid pixmaps", "[branding]") {
    SECTION("Creates pixmaps at requested sizes") {
        REQUIRE(AppIcon::createPixmap(16).width() == 16);
        REQUIRE(AppIcon::createPixmap(48).width() == 48);
        REQUIRE(AppIcon::createPixmap(64).height() == 64);
    }

    SECTION("Corners stay transparent around the rounded badge") {
        QImage image = AppIcon::createPixmap(64).toImage();

        REQUIRE(image.hasAlphaChannel());
        REQUIRE(qAlpha(image.pixel(0, 0)) == 0);
        REQUIRE(qAlpha(image.pixel(63, 63)) == 0);
    }

    SECTION("Badge interior is opaque") {
        QImage image = AppIcon::createPixmap(64).toImage();

        REQUIRE(qAlpha(image.pixel(32, 10)) == 255);
    }

    SECTION("Simplified and detailed renderings differ") {
        QImage simple = AppIcon::createPixmap(64, true).toImage();
        QImage detailed = AppIcon::createPixmap(64, false).toImage();

        REQUIRE(simple != detailed);
    }
}

TEST_CASE("AppIcon handles edge cases", "[branding]") {
    SECTION("Very small sizes work") {
        QPixmap px8 = AppIcon::createPixmap(8);
        REQUIRE(!px8.isNull());
        REQUIRE(px8.width() == 8);
    }

    SECTION("Large sizes work") {
        QPixmap px512 = AppIcon::createPixmap(512);
        REQUIRE(!px512.isNull());
        REQUIRE(px512.width() == 512);
    }

    SECTION("Odd sizes work") {
        REQUIRE(AppIcon::createPixmap(17).width() == 17);
        REQUIRE(AppIcon::createPixmap(37).width() == 37);
    }
}
