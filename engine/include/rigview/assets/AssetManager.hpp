#pragma once

#include "rigview/assets/RigDescriptor.hpp"
#include "rigview/core/result.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rigview::assets
{
    enum class AssetKind
    {
        SkeletonData,
        TextureAtlas
    };

    constexpr std::string_view toString(AssetKind kind)
    {
        switch (kind)
        {
        case AssetKind::SkeletonData: return "SkeletonData";
        case AssetKind::TextureAtlas: return "TextureAtlas";
        default:                      return "Unknown";
        }
    }

    // One image serves the only atlas page, whatever its file name.
    struct SingleImage
    {
        NamedBlob image;
    };

    // Page name -> image.
    struct NamedImages
    {
        std::map<std::string, NamedBlob> pages;
    };

    using AtlasImages = std::variant<SingleImage, NamedImages>;

    struct AssetRegistration
    {
        std::string key;
        std::string sourceUri;
        AssetKind kind = AssetKind::SkeletonData;
        std::optional<AtlasImages> images;
    };

    using AssetCallback = std::function<void(core::Result<void>)>;

    /**
     * @brief Process-wide registry the rig runtime reads loaded assets from.
     *
     * Completions are delivered on the main thread, possibly synchronously
     * from within load()/unload().
     */
    class AssetManager
    {
    public:
        virtual ~AssetManager() = default;

        virtual core::Result<void> registerAsset(AssetRegistration registration) = 0;

        virtual void load(std::vector<std::string> keys, AssetCallback onComplete) = 0;

        // Unloads and unregisters. Unknown keys are ignored.
        virtual void unload(std::vector<std::string> keys, AssetCallback onComplete) = 0;
    };
}
