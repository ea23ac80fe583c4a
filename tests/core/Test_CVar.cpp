#include <doctest/doctest.h>
#include "rigview/app/ViewerConfig.hpp"
#include "rigview/core/cvar.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace rigview;
namespace fs = std::filesystem;

TEST_CASE("Viewer cvars are registered with defaults") {
    app::resetViewerConfig();

    auto* cellSize = core::CVarSystem::find("grid_cell_size");
    REQUIRE(cellSize != nullptr);
    CHECK((cellSize->flags & core::CVarFlags::save));
    CHECK(app::grid_cell_size.get() == doctest::Approx(120.0F));
    CHECK(app::grid_outlines_visible.get());
    CHECK(app::outline_color.get() == 0xff6b6b);
    CHECK(core::CVarSystem::find("no_such_cvar") == nullptr);
}

TEST_CASE("Reset restores registered defaults") {
    app::grid_cell_size.set(300.0F);
    app::grid_outlines_visible.set(false);

    app::resetViewerConfig();

    CHECK(app::grid_cell_size.get() == doctest::Approx(app::grid_cell_size.defaultValue()));
    CHECK(app::grid_outlines_visible.get());

    const auto names = core::CVarSystem::names();
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(std::find(names.begin(), names.end(), "single_scale") != names.end());
}

TEST_CASE("CVar ini round trip") {
    app::resetViewerConfig();
    const fs::path dir = fs::temp_directory_path() / "rigview_cvar_test";
    const fs::path ini = dir / "rigview.ini";

    SUBCASE("Save then load restores values") {
        app::grid_cell_size.set(64.0F);
        app::grid_multi_scale.set(false);
        core::CVarSystem::saveToIni(ini);

        app::resetViewerConfig();
        CHECK(core::CVarSystem::loadFromIni(ini) >= 2);
        CHECK(app::grid_cell_size.get() == doctest::Approx(64.0F));
        CHECK_FALSE(app::grid_multi_scale.get());
    }

    SUBCASE("Comments, unknown keys and bad values are skipped") {
        fs::create_directories(dir);
        std::ofstream(ini) << "; viewer settings\n"
                           << "# another comment\n"
                           << "  grid_cell_gap = 5  \n"
                           << "outline_color=0x00ff00\n"
                           << "grid_scale=abc\n"
                           << "mystery=1\n"
                           << "no equals sign\n";

        CHECK(core::CVarSystem::loadFromIni(ini) == 2);
        CHECK(app::grid_cell_gap.get() == doctest::Approx(5.0F));
        CHECK(app::outline_color.get() == 0x00ff00);
        CHECK(app::grid_scale.get() == doctest::Approx(1.0F));
    }

    SUBCASE("A missing file applies nothing") {
        CHECK(core::CVarSystem::loadFromIni(dir / "missing.ini") == 0);
    }

    fs::remove_all(dir);
    app::resetViewerConfig();
}
