#include "rigview/assets/AssetBundle.hpp"
#include "rigview/assets/AssetManager.hpp"
#include "rigview/assets/TransientUriRegistry.hpp"
#include "rigview/core/logger.hpp"

#include <utility>

namespace rigview::assets
{
    AssetBundle::AssetBundle(AssetManager& manager, TransientUriRegistry& uris)
        : m_manager(&manager), m_uriRegistry(&uris)
    {
    }

    AssetBundle::~AssetBundle()
    {
        release();
    }

    AssetBundle::AssetBundle(AssetBundle&& other) noexcept
        : m_manager(std::exchange(other.m_manager, nullptr)),
          m_uriRegistry(std::exchange(other.m_uriRegistry, nullptr)),
          m_keys(std::exchange(other.m_keys, {})),
          m_uris(std::exchange(other.m_uris, {}))
    {
    }

    AssetBundle& AssetBundle::operator=(AssetBundle&& other) noexcept
    {
        if (this != &other)
        {
            release();
            m_manager = std::exchange(other.m_manager, nullptr);
            m_uriRegistry = std::exchange(other.m_uriRegistry, nullptr);
            m_keys = std::exchange(other.m_keys, {});
            m_uris = std::exchange(other.m_uris, {});
        }
        return *this;
    }

    void AssetBundle::release()
    {
        if (empty())
        {
            return;
        }

        auto keys = std::exchange(m_keys, {});
        auto uris = std::exchange(m_uris, {});

        if (!keys.empty() && m_manager != nullptr)
        {
            core::Logger::debug("Releasing asset keys: {} ... ({} total)", keys.front(), keys.size());
            const std::string first = keys.front();
            m_manager->unload(std::move(keys), [first](core::Result<void> result)
            {
                if (!result)
                {
                    core::Logger::warn("Unload of bundle {} reported: {}", first, result.error());
                }
            });
        }

        if (m_uriRegistry != nullptr)
        {
            for (const auto& uri : uris)
            {
                m_uriRegistry->revoke(uri);
            }
        }
    }
}
