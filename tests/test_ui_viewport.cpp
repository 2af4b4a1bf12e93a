#include <catch2/catch.hpp>
#include "core_render/composite/ui_viewport.h"

using namespace uicomp;
using namespace uicomp::render;

TEST_CASE("UiViewport defaults", "[composite][viewport]") {
    UiViewport viewport;
    REQUIRE(viewport.GetPhysicalWidth() == 1600);
    REQUIRE(viewport.GetPhysicalHeight() == 900);
    REQUIRE(viewport.GetScaleFactor() == 1.0);
    REQUIRE(viewport.GetLogicalSize() == util::vec2(1600.0f, 900.0f));
}

TEST_CASE("UiViewport physical size follows the scale factor", "[composite][viewport]") {
    SECTION("integer scale") {
        UiViewport viewport(util::vec2(800.0f, 600.0f), 2.0);
        REQUIRE(viewport.GetPhysicalWidth() == 1600);
        REQUIRE(viewport.GetPhysicalHeight() == 1200);
    }

    SECTION("fractional scale rounds to nearest") {
        UiViewport viewport(util::vec2(101.0f, 33.0f), 1.5);
        REQUIRE(viewport.GetPhysicalWidth() == 152);  // 151.5
        REQUIRE(viewport.GetPhysicalHeight() == 50);  // 49.5
    }

    SECTION("tiny sizes clamp to one pixel") {
        UiViewport viewport(util::vec2(0.0f, 0.2f), 1.0);
        REQUIRE(viewport.GetPhysicalWidth() == 1);
        REQUIRE(viewport.GetPhysicalHeight() == 1);
    }

    SECTION("non-positive scale falls back to 1") {
        UiViewport viewport(util::vec2(640.0f, 480.0f), 0.0);
        REQUIRE(viewport.GetScaleFactor() == 1.0);
        REQUIRE(viewport.GetPhysicalWidth() == 640);
        REQUIRE(viewport.GetPhysicalHeight() == 480);
    }
}

TEST_CASE("UiViewport from window with settings", "[composite][viewport]") {
    SECTION("without override the window scale is used") {
        auto viewport = UiViewport::FromWindow(2560, 1440, 2.0, UiSettings{});
        REQUIRE(viewport.GetLogicalSize() == util::vec2(1280.0f, 720.0f));
        REQUIRE(viewport.GetScaleFactor() == 2.0);
        REQUIRE(viewport.GetPhysicalWidth() == 2560);
        REQUIRE(viewport.GetPhysicalHeight() == 1440);
    }

    SECTION("override replaces the window scale") {
        UiSettings settings;
        settings.scale_factor_override = 1.0;
        auto viewport = UiViewport::FromWindow(2560, 1440, 2.0, settings);
        REQUIRE(viewport.GetScaleFactor() == 1.0);
        REQUIRE(viewport.GetPhysicalWidth() == 1280);
        REQUIRE(viewport.GetPhysicalHeight() == 720);
    }

    SECTION("equal inputs give equal viewports") {
        auto a = UiViewport::FromWindow(800, 600, 1.25, UiSettings{});
        auto b = UiViewport::FromWindow(800, 600, 1.25, UiSettings{});
        auto c = UiViewport::FromWindow(801, 600, 1.25, UiSettings{});
        REQUIRE(a == b);
        REQUIRE(a != c);
    }
}

TEST_CASE("UiViewport clamps to the texture dimension limit", "[composite][viewport]") {
    UiSettings settings;
    settings.scale_factor_override = 2.0;

    SECTION("default limit is the WebGPU default") {
        REQUIRE(UiViewport::kDefaultMaxDimension == 8192);
        auto viewport = UiViewport::FromWindow(7680, 4320, 1.0, settings);
        REQUIRE(viewport.GetPhysicalWidth() == 8192);
        REQUIRE(viewport.GetPhysicalHeight() == 8192);
        REQUIRE(viewport.GetScaleFactor() == 2.0);
    }

    SECTION("a larger device limit allows the full size") {
        auto viewport = UiViewport::FromWindow(7680, 4320, 1.0, settings, 16384);
        REQUIRE(viewport.GetPhysicalWidth() == 15360);
        REQUIRE(viewport.GetPhysicalHeight() == 8640);
    }

    SECTION("each axis is clamped independently") {
        UiViewport viewport(util::vec2(3000.0f, 500.0f), 1.0, 2048);
        REQUIRE(viewport.GetPhysicalWidth() == 2048);
        REQUIRE(viewport.GetPhysicalHeight() == 500);
    }
}
