#pragma once

/**
 * @file engine.hpp
 * @brief Main rigview header - include this for the viewer core
 */

#define RIGVIEW_VERSION_MAJOR 0
#define RIGVIEW_VERSION_MINOR 1
#define RIGVIEW_VERSION_PATCH 0

#include "rigview/app/ViewerSession.hpp"
#include "rigview/core/logger.hpp"

namespace rigview
{
    using Log = core::Logger;
    using ViewerSession = app::ViewerSession;
    using SlotId = slots::SlotId;
    using PresentationMode = stage::PresentationMode;
}
