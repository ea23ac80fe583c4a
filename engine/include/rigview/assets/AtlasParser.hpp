#pragma once

#include "rigview/assets/BindError.hpp"
#include "rigview/core/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rigview::assets
{
    /**
     * @brief Extracts page names from atlas descriptor text.
     *
     * A non-empty line without a colon names a page when the next non-empty
     * line starts with "size:". Names keep declaration order and duplicates.
     * Fails with MalformedAtlas when no page is declared.
     */
    core::Result<std::vector<std::string>, BindError> extractAtlasPageNames(std::string_view atlasText);
}
