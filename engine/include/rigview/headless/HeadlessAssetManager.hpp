#pragma once

#include "rigview/assets/AssetManager.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rigview::assets {
class TransientUriRegistry;
}

namespace rigview::headless {

// In-memory asset manager. Completions are queued and delivered from
// update(), the way a real manager resolves them on a later frame.
class HeadlessAssetManager : public assets::AssetManager {
public:
  explicit HeadlessAssetManager(const assets::TransientUriRegistry &uris);
  ~HeadlessAssetManager() override;

  core::Result<void> registerAsset(assets::AssetRegistration registration) override;
  void load(std::vector<std::string> keys, assets::AssetCallback onComplete) override;
  void unload(std::vector<std::string> keys, assets::AssetCallback onComplete) override;

  // Delivers every completion queued before the call. Returns how many ran.
  size_t update();
  // Delivers the index-th pending load only, leaving the rest queued.
  bool completeLoad(size_t index);

  size_t pendingLoadCount() const;
  size_t pendingCount() const { return m_pending.size(); }

  size_t registeredCount() const { return m_entries.size(); }
  bool isRegistered(const std::string &key) const { return m_entries.contains(key); }
  bool isLoaded(const std::string &key) const;
  const assets::AssetRegistration *registration(const std::string &key) const;
  std::vector<std::string> registeredKeys() const;

  // The next load fails with `reason`.
  void failNextLoad(std::string reason) { m_failNextLoad = std::move(reason); }
  // A registration fails with `reason` after `skip` more have succeeded.
  void failNextRegistration(std::string reason, size_t skip = 0) {
    m_failNextRegistration = std::move(reason);
    m_registrationsBeforeFailure = skip;
  }

  size_t loadsRequested() const { return m_loadsRequested; }
  size_t unloadsRequested() const { return m_unloadsRequested; }

private:
  struct Entry {
    assets::AssetRegistration registration;
    bool loaded = false;
  };

  struct PendingOp {
    enum class Kind { Load, Unload };
    Kind kind = Kind::Load;
    std::vector<std::string> keys;
    assets::AssetCallback onComplete;
    std::optional<std::string> injectedFailure;
  };

  void complete(PendingOp op);
  core::Result<void> resolve(const std::vector<std::string> &keys) const;

  const assets::TransientUriRegistry &m_uris;
  std::map<std::string, Entry> m_entries;
  std::deque<PendingOp> m_pending;

  std::optional<std::string> m_failNextLoad;
  std::optional<std::string> m_failNextRegistration;
  size_t m_registrationsBeforeFailure = 0;
  size_t m_loadsRequested = 0;
  size_t m_unloadsRequested = 0;
};

} // namespace rigview::headless
