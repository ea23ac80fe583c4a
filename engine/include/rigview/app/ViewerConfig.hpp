#pragma once

#include "rigview/core/cvar.hpp"

namespace rigview::app
{
    // Persisted viewer settings, read once when a session starts.
    extern core::CVar<float> grid_cell_size;
    extern core::CVar<float> grid_cell_gap;
    extern core::CVar<float> grid_cell_radius;
    extern core::CVar<bool> grid_outlines_visible;
    extern core::CVar<bool> grid_multi_scale;
    extern core::CVar<float> grid_scale;
    extern core::CVar<float> single_scale;
    extern core::CVar<int> outline_color;

    // Restores every viewer cvar to its default value.
    void resetViewerConfig();
}
