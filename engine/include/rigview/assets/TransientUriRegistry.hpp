#pragma once

#include "rigview/assets/RigDescriptor.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>

namespace rigview::assets
{
    // Object-URI style handles for in-memory blobs. Whoever creates a URI
    // revokes it; the asset manager only resolves them.
    class TransientUriRegistry
    {
    public:
        TransientUriRegistry();

        TransientUriRegistry(const TransientUriRegistry&) = delete;
        TransientUriRegistry& operator=(const TransientUriRegistry&) = delete;

        std::string create(BlobPtr blob);
        bool revoke(const std::string& uri);

        // Returns nullptr for unknown or revoked URIs.
        BlobPtr resolve(const std::string& uri) const;

        bool isLive(const std::string& uri) const { return m_entries.contains(uri); }
        size_t liveCount() const { return m_entries.size(); }
        uint64_t revokedCount() const { return m_revoked; }

    private:
        std::unordered_map<std::string, BlobPtr> m_entries;
        std::mt19937_64 m_rng;
        uint64_t m_nextId = 1;
        uint64_t m_revoked = 0;
    };
}
