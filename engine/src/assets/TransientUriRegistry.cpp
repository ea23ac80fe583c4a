#include "rigview/assets/TransientUriRegistry.hpp"
#include "rigview/core/logger.hpp"

namespace rigview::assets
{
    TransientUriRegistry::TransientUriRegistry()
        : m_rng(std::random_device{}())
    {
    }

    std::string TransientUriRegistry::create(BlobPtr blob)
    {
        std::string uri = fmt::format("blob:rigview/{:08x}-{:016x}", m_nextId++, m_rng());
        m_entries.emplace(uri, std::move(blob));
        return uri;
    }

    bool TransientUriRegistry::revoke(const std::string& uri)
    {
        if (m_entries.erase(uri) == 0)
        {
            core::Logger::warn("Revoking unknown transient URI {}", uri);
            return false;
        }
        ++m_revoked;
        return true;
    }

    BlobPtr TransientUriRegistry::resolve(const std::string& uri) const
    {
        auto it = m_entries.find(uri);
        if (it == m_entries.end())
        {
            return nullptr;
        }
        return it->second;
    }
}
