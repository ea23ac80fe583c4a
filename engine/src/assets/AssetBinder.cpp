#include "rigview/assets/AssetBinder.hpp"
#include "rigview/assets/AtlasParser.hpp"
#include "rigview/assets/TransientUriRegistry.hpp"
#include "rigview/core/logger.hpp"

#include <exception>
#include <filesystem>
#include <unordered_map>

namespace rigview::assets
{
    struct AssetBinder::PendingBind
    {
        stage::RigRuntime* runtime = nullptr;
        std::string skeletonKey;
        std::string atlasKey;
        AssetBundle bundle;
        BindCallback onComplete;
    };

    AssetBinder::AssetBinder(AssetManager& manager, stage::RigRuntime& runtime, TransientUriRegistry& uris)
        : m_manager(&manager), m_runtime(&runtime), m_uris(&uris), m_rng(std::random_device{}())
    {
    }

    std::string AssetBinder::makeAssetId(const std::string& prefix)
    {
        return fmt::format("{}-{}-{:016x}", prefix, ++m_sequence, m_rng());
    }

    core::Result<AtlasImages, BindError> AssetBinder::matchPages(const std::vector<std::string>& pageNames,
                                                                 const std::vector<NamedBlob>& images)
    {
        if (pageNames.size() <= 1 && images.size() == 1)
        {
            return SingleImage{images.front()};
        }

        std::unordered_map<std::string, const NamedBlob*> byName;
        std::unordered_map<std::string, const NamedBlob*> byStem;
        for (const auto& image : images)
        {
            byName.emplace(image.name, &image);
            byStem.emplace(std::filesystem::path(image.name).stem().string(), &image);
        }

        NamedImages matched;
        std::vector<std::string> missing;
        for (const auto& page : pageNames)
        {
            const NamedBlob* image = nullptr;
            if (auto it = byName.find(page); it != byName.end())
            {
                image = it->second;
            }
            else if (auto stemIt = byStem.find(page); stemIt != byStem.end())
            {
                image = stemIt->second;
            }

            if (image == nullptr)
            {
                missing.push_back(page);
                continue;
            }
            matched.pages.emplace(page, *image);
        }

        if (!missing.empty())
        {
            return core::Unexpected(BindError::missing(std::move(missing)));
        }
        return matched;
    }

    void AssetBinder::bind(const RigDescriptor& descriptor, const std::string& keyPrefix, BindCallback onComplete)
    {
        ++m_bindsStarted;

        auto pageNames = extractAtlasPageNames(descriptor.atlas.text());
        if (!pageNames)
        {
            core::Logger::warn("[{}] {}", keyPrefix, pageNames.error().message);
            onComplete(core::Unexpected(std::move(pageNames.error())));
            return;
        }

        auto images = matchPages(*pageNames, descriptor.images);
        if (!images)
        {
            core::Logger::warn("[{}] {}", keyPrefix, images.error().message);
            onComplete(core::Unexpected(std::move(images.error())));
            return;
        }

        auto pending = std::make_shared<PendingBind>();
        pending->runtime = m_runtime;
        pending->bundle = AssetBundle(*m_manager, *m_uris);
        pending->onComplete = std::move(onComplete);

        const std::string skeletonUri = m_uris->create(descriptor.skeleton.data);
        const std::string atlasUri = m_uris->create(descriptor.atlas.data);
        pending->bundle.adoptUri(skeletonUri);
        pending->bundle.adoptUri(atlasUri);

        const std::string assetId = makeAssetId(keyPrefix);
        pending->skeletonKey = "rig-skeleton-" + assetId;
        pending->atlasKey = "rig-atlas-" + assetId;

        // Unwinds whatever was registered so far, then reports.
        auto fail = [&pending](BindError error)
        {
            auto callback = std::move(pending->onComplete);
            pending->onComplete = nullptr;
            pending->bundle.release();
            callback(core::Unexpected(std::move(error)));
        };

        const std::vector<AssetRegistration> registrations{
            {pending->skeletonKey, skeletonUri, AssetKind::SkeletonData, std::nullopt},
            {pending->atlasKey, atlasUri, AssetKind::TextureAtlas, std::move(*images)},
        };

        for (const auto& registration : registrations)
        {
            core::Result<void> registered;
            try
            {
                registered = m_manager->registerAsset(registration);
            }
            catch (const std::exception& e)
            {
                registered = core::Unexpected(std::string(e.what()));
            }

            if (!registered)
            {
                core::Logger::error("[{}] Failed to register {}: {}", keyPrefix, registration.key, registered.error());
                fail(BindError::registrationFailure(registered.error()));
                return;
            }
            pending->bundle.adoptKey(registration.key);
        }

        core::Logger::debug("[{}] Loading {} and {}", keyPrefix, pending->skeletonKey, pending->atlasKey);
        try
        {
            m_manager->load({pending->skeletonKey, pending->atlasKey},
                            [pending](core::Result<void> loaded) { finishLoad(pending, std::move(loaded)); });
        }
        catch (const std::exception& e)
        {
            core::Logger::error("[{}] Asset load rejected: {}", keyPrefix, e.what());
            if (pending->onComplete)
            {
                fail(BindError::registrationFailure(e.what()));
            }
        }
    }

    void AssetBinder::finishLoad(const std::shared_ptr<PendingBind>& pending, core::Result<void> loadResult)
    {
        if (!pending->onComplete)
        {
            return;
        }
        auto callback = std::move(pending->onComplete);
        pending->onComplete = nullptr;

        if (!loadResult)
        {
            core::Logger::error("Asset load failed for {}: {}", pending->skeletonKey, loadResult.error());
            pending->bundle.release();
            callback(core::Unexpected(BindError::registrationFailure(loadResult.error())));
            return;
        }

        core::Result<std::unique_ptr<stage::RigInstance>> instance;
        try
        {
            instance = pending->runtime->instantiate(pending->skeletonKey, pending->atlasKey);
        }
        catch (const std::exception& e)
        {
            instance = core::Unexpected(std::string(e.what()));
        }

        if (!instance || !*instance)
        {
            const std::string reason = instance ? std::string("runtime returned no instance") : instance.error();
            core::Logger::error("Rig instantiation failed for {}: {}", pending->skeletonKey, reason);
            pending->bundle.release();
            callback(core::Unexpected(BindError::instantiationFailure(reason)));
            return;
        }

        BindResult result;
        result.instance = std::move(*instance);
        result.animationNames = result.instance->animationNames();
        result.skinNames = result.instance->skinNames();
        result.bundle = std::move(pending->bundle);
        callback(std::move(result));
    }
}
