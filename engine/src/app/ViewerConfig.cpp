#include "rigview/app/ViewerConfig.hpp"

namespace rigview::app
{
    using core::CVarFlags;

    AUTO_CVAR_FLOAT(grid_cell_size, "Grid cell size in pixels, clamped to [40, 400]", 120.0F, CVarFlags::save);
    AUTO_CVAR_FLOAT(grid_cell_gap, "Gap between drawn grid cells in pixels", 3.0F, CVarFlags::save);
    AUTO_CVAR_FLOAT(grid_cell_radius, "Corner radius of drawn grid cells", 8.0F, CVarFlags::save);
    AUTO_CVAR_BOOL(grid_outlines_visible, "Draw rig bounds outlines in the grid", true, CVarFlags::save);
    AUTO_CVAR_BOOL(grid_multi_scale, "One scale for every grid slot", true, CVarFlags::save);
    AUTO_CVAR_FLOAT(grid_scale, "Shared grid scale when grid_multi_scale is on", 1.0F, CVarFlags::save);
    AUTO_CVAR_FLOAT(single_scale, "Scale of the single view rig", 1.0F, CVarFlags::save);
    AUTO_CVAR_INT(outline_color, "Bounds outline color (0xRRGGBB)", 0xff6b6b, CVarFlags::save);

    void resetViewerConfig()
    {
        core::CVarSystem::resetAll();
    }
}
