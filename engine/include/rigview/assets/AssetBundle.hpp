#pragma once

#include <string>
#include <vector>

namespace rigview::assets
{
    class AssetManager;
    class TransientUriRegistry;

    /**
     * @brief Registration keys and transient URIs created while binding one rig.
     *
     * Move-only. Released exactly once: by release() or by the destructor,
     * whichever comes first. The asset manager and URI registry must outlive
     * every bundle that refers to them.
     */
    class AssetBundle
    {
    public:
        AssetBundle() = default;
        AssetBundle(AssetManager& manager, TransientUriRegistry& uris);
        ~AssetBundle();

        AssetBundle(const AssetBundle&) = delete;
        AssetBundle& operator=(const AssetBundle&) = delete;
        AssetBundle(AssetBundle&& other) noexcept;
        AssetBundle& operator=(AssetBundle&& other) noexcept;

        void adoptKey(std::string key) { m_keys.push_back(std::move(key)); }
        void adoptUri(std::string uri) { m_uris.push_back(std::move(uri)); }

        // Unregisters keys and revokes URIs; no-op once released.
        void release();

        [[nodiscard]] bool empty() const { return m_keys.empty() && m_uris.empty(); }
        explicit operator bool() const { return !empty(); }

        const std::vector<std::string>& keys() const { return m_keys; }
        const std::vector<std::string>& uris() const { return m_uris; }

    private:
        AssetManager* m_manager = nullptr;
        TransientUriRegistry* m_uriRegistry = nullptr;
        std::vector<std::string> m_keys;
        std::vector<std::string> m_uris;
    };
}
