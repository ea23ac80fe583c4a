#include "rigview/headless/HeadlessAssetManager.hpp"
#include "rigview/assets/TransientUriRegistry.hpp"
#include "rigview/core/logger.hpp"

#include <fmt/format.h>
#include <type_traits>
#include <variant>

namespace rigview::headless {

HeadlessAssetManager::HeadlessAssetManager(const assets::TransientUriRegistry &uris)
    : m_uris(uris) {}

HeadlessAssetManager::~HeadlessAssetManager() {
  // Dropping a queued callback can release a bundle, which unloads through
  // this manager again; drain while the members are still alive.
  while (!m_pending.empty()) {
    auto pending = std::move(m_pending);
    m_pending.clear();
    pending.clear();
  }
}

core::Result<void> HeadlessAssetManager::registerAsset(assets::AssetRegistration registration) {
  if (m_failNextRegistration && m_registrationsBeforeFailure > 0) {
    --m_registrationsBeforeFailure;
  } else if (m_failNextRegistration) {
    std::string reason = std::move(*m_failNextRegistration);
    m_failNextRegistration.reset();
    return core::Unexpected(std::move(reason));
  }
  if (registration.key.empty()) {
    return core::Unexpected(std::string("Asset key is empty"));
  }
  if (m_entries.contains(registration.key)) {
    return core::Unexpected(fmt::format("Asset key already registered: {}", registration.key));
  }

  core::Logger::trace("[HeadlessAssets] register {} ({}) -> {}", registration.key,
                      assets::toString(registration.kind), registration.sourceUri);
  std::string key = registration.key;
  m_entries.emplace(std::move(key), Entry{std::move(registration), false});
  return {};
}

void HeadlessAssetManager::load(std::vector<std::string> keys, assets::AssetCallback onComplete) {
  ++m_loadsRequested;
  PendingOp op;
  op.kind = PendingOp::Kind::Load;
  op.keys = std::move(keys);
  op.onComplete = std::move(onComplete);
  op.injectedFailure = std::move(m_failNextLoad);
  m_failNextLoad.reset();
  m_pending.push_back(std::move(op));
}

void HeadlessAssetManager::unload(std::vector<std::string> keys, assets::AssetCallback onComplete) {
  ++m_unloadsRequested;
  for (const auto &key : keys) {
    if (m_entries.erase(key) > 0) {
      core::Logger::trace("[HeadlessAssets] unregister {}", key);
    }
  }

  PendingOp op;
  op.kind = PendingOp::Kind::Unload;
  op.keys = std::move(keys);
  op.onComplete = std::move(onComplete);
  m_pending.push_back(std::move(op));
}

size_t HeadlessAssetManager::update() {
  // Completions queued by callbacks wait for the next update.
  size_t count = m_pending.size();
  size_t processed = 0;
  while (processed < count && !m_pending.empty()) {
    PendingOp op = std::move(m_pending.front());
    m_pending.pop_front();
    complete(std::move(op));
    ++processed;
  }
  return processed;
}

bool HeadlessAssetManager::completeLoad(size_t index) {
  size_t loadIndex = 0;
  for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
    if (it->kind != PendingOp::Kind::Load) {
      continue;
    }
    if (loadIndex++ == index) {
      PendingOp op = std::move(*it);
      m_pending.erase(it);
      complete(std::move(op));
      return true;
    }
  }
  return false;
}

size_t HeadlessAssetManager::pendingLoadCount() const {
  size_t count = 0;
  for (const auto &op : m_pending) {
    if (op.kind == PendingOp::Kind::Load) {
      ++count;
    }
  }
  return count;
}

bool HeadlessAssetManager::isLoaded(const std::string &key) const {
  auto it = m_entries.find(key);
  return it != m_entries.end() && it->second.loaded;
}

const assets::AssetRegistration *HeadlessAssetManager::registration(const std::string &key) const {
  auto it = m_entries.find(key);
  return it != m_entries.end() ? &it->second.registration : nullptr;
}

std::vector<std::string> HeadlessAssetManager::registeredKeys() const {
  std::vector<std::string> keys;
  keys.reserve(m_entries.size());
  for (const auto &[key, entry] : m_entries) {
    keys.push_back(key);
  }
  return keys;
}

core::Result<void> HeadlessAssetManager::resolve(const std::vector<std::string> &keys) const {
  for (const auto &key : keys) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
      return core::Unexpected(fmt::format("Asset not registered: {}", key));
    }

    const auto &registration = it->second.registration;
    if (!m_uris.resolve(registration.sourceUri)) {
      return core::Unexpected(fmt::format("Cannot fetch {} for {}", registration.sourceUri, key));
    }

    if (registration.kind != assets::AssetKind::TextureAtlas) {
      continue;
    }
    if (!registration.images) {
      return core::Unexpected(fmt::format("Atlas {} has no page images", key));
    }

    const bool pagesPresent = std::visit(
        [](const auto &images) {
          using T = std::decay_t<decltype(images)>;
          if constexpr (std::is_same_v<T, assets::SingleImage>) {
            return !images.image.empty();
          } else {
            for (const auto &[page, blob] : images.pages) {
              if (blob.empty()) {
                return false;
              }
            }
            return !images.pages.empty();
          }
        },
        *registration.images);

    if (!pagesPresent) {
      return core::Unexpected(fmt::format("Atlas {} references an empty page image", key));
    }
  }
  return {};
}

void HeadlessAssetManager::complete(PendingOp op) {
  core::Result<void> result;

  if (op.kind == PendingOp::Kind::Load) {
    if (op.injectedFailure) {
      result = core::Unexpected(std::move(*op.injectedFailure));
    } else {
      result = resolve(op.keys);
    }
    if (result) {
      for (const auto &key : op.keys) {
        m_entries.at(key).loaded = true;
      }
    }
  }

  if (op.onComplete) {
    op.onComplete(std::move(result));
  }
}

} // namespace rigview::headless
