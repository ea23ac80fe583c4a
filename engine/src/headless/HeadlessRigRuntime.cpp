#include "rigview/headless/HeadlessRigRuntime.hpp"
#include "rigview/core/logger.hpp"
#include "rigview/headless/HeadlessAssetManager.hpp"

#include <fmt/format.h>

namespace rigview::headless {

HeadlessRig::HeadlessRig(const RigProfile &profile, std::shared_ptr<size_t> liveCounter)
    : m_animations(profile.animations), m_skins(profile.skins),
      m_localBounds(profile.localBounds), m_liveCounter(std::move(liveCounter)) {
  ++*m_liveCounter;
}

HeadlessRig::~HeadlessRig() { --*m_liveCounter; }

void HeadlessRig::setAnimation(const std::string &name, bool loop) {
  m_animation = name;
  m_looping = loop;
}

void HeadlessRig::setSkin(const std::string &name) {
  m_skin = name;
  ++m_setupPoseResets;
}

stage::Rect HeadlessRig::screenBounds() const {
  return {m_position.x + (m_localBounds.x - m_pivot.x) * m_scale,
          m_position.y + (m_localBounds.y - m_pivot.y) * m_scale,
          m_localBounds.width * m_scale, m_localBounds.height * m_scale};
}

HeadlessRigRuntime::HeadlessRigRuntime(const HeadlessAssetManager &assets, RigProfile profile)
    : m_assets(assets), m_profile(std::move(profile)) {}

core::Result<std::unique_ptr<stage::RigInstance>>
HeadlessRigRuntime::instantiate(const std::string &skeletonKey, const std::string &atlasKey) {
  if (m_failNext) {
    std::string reason = std::move(*m_failNext);
    m_failNext.reset();
    return core::Unexpected(std::move(reason));
  }

  for (const auto *key : {&skeletonKey, &atlasKey}) {
    if (!m_assets.isLoaded(*key)) {
      return core::Unexpected(fmt::format("Asset {} is not loaded", *key));
    }
  }

  const auto *skeleton = m_assets.registration(skeletonKey);
  const auto *atlas = m_assets.registration(atlasKey);
  if (skeleton->kind != assets::AssetKind::SkeletonData ||
      atlas->kind != assets::AssetKind::TextureAtlas) {
    return core::Unexpected(fmt::format("Wrong asset kinds for {} / {}", skeletonKey, atlasKey));
  }

  ++m_created;
  core::Logger::trace("[HeadlessRuntime] instantiate {} + {}", skeletonKey, atlasKey);
  return std::make_unique<HeadlessRig>(m_profile, m_live);
}

} // namespace rigview::headless
