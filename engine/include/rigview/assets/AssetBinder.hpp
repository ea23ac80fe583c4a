#pragma once

#include "rigview/assets/AssetBundle.hpp"
#include "rigview/assets/AssetManager.hpp"
#include "rigview/assets/BindError.hpp"
#include "rigview/assets/RigDescriptor.hpp"
#include "rigview/core/result.hpp"
#include "rigview/stage/RigInstance.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace rigview::assets
{
    class TransientUriRegistry;

    struct BindResult
    {
        // Declared first so the instance is destroyed before its assets.
        AssetBundle bundle;
        std::unique_ptr<stage::RigInstance> instance;
        std::vector<std::string> animationNames;
        std::vector<std::string> skinNames;
    };

    using BindOutcome = core::Result<BindResult, BindError>;
    using BindCallback = std::function<void(BindOutcome)>;

    /**
     * @brief Turns raw rig files into a live instance plus the bundle that frees it.
     *
     * The callback runs exactly once, possibly before bind() returns. On every
     * failure path the partial registration is unwound before the callback
     * sees the error. If the callback drops a successful result, the bundle
     * and instance release themselves.
     */
    class AssetBinder
    {
    public:
        AssetBinder(AssetManager& manager, stage::RigRuntime& runtime, TransientUriRegistry& uris);

        AssetBinder(const AssetBinder&) = delete;
        AssetBinder& operator=(const AssetBinder&) = delete;

        void bind(const RigDescriptor& descriptor, const std::string& keyPrefix, BindCallback onComplete);

        // Single page + single image binds that image regardless of its name.
        // Otherwise every page needs an image named after it, with or
        // without the image's file extension.
        static core::Result<AtlasImages, BindError> matchPages(const std::vector<std::string>& pageNames,
                                                               const std::vector<NamedBlob>& images);

        std::string makeAssetId(const std::string& prefix);

        uint64_t bindsStarted() const { return m_bindsStarted; }

    private:
        struct PendingBind;

        static void finishLoad(const std::shared_ptr<PendingBind>& pending, core::Result<void> loadResult);

        AssetManager* m_manager = nullptr;
        stage::RigRuntime* m_runtime = nullptr;
        TransientUriRegistry* m_uris = nullptr;

        std::mt19937_64 m_rng;
        uint64_t m_sequence = 0;
        uint64_t m_bindsStarted = 0;
    };
}
