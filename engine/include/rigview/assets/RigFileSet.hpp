#pragma once

#include "rigview/assets/RigDescriptor.hpp"
#include "rigview/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rigview::assets
{
    // A user's file selection sorted into the three rig inputs.
    struct RigFileSet
    {
        std::optional<std::filesystem::path> skeleton;
        std::optional<std::filesystem::path> atlas;
        std::vector<std::filesystem::path> images;

        // First .json is the skeleton, first .atlas the atlas, every .png a page.
        static RigFileSet fromPaths(const std::vector<std::filesystem::path>& paths);

        [[nodiscard]] bool isComplete() const { return skeleton && atlas && !images.empty(); }

        // Comma separated file names, for status lines.
        [[nodiscard]] std::string describe() const;

        // Reads every file; image blobs are named by file name.
        [[nodiscard]] core::Result<RigDescriptor> read() const;
    };

    inline constexpr const char* kIncompleteSelectionMessage =
        "Select the .json, .atlas, and at least one .png file.";
}
