#pragma once

#include "rigview/stage/RigInstance.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rigview::headless {

class HeadlessAssetManager;

// What every rig produced by a HeadlessRigRuntime declares.
struct RigProfile {
  std::vector<std::string> animations{"idle", "walk"};
  std::vector<std::string> skins{"default"};
  stage::Rect localBounds{-50.0F, -100.0F, 100.0F, 200.0F};
};

class HeadlessRig : public stage::RigInstance {
public:
  HeadlessRig(const RigProfile &profile, std::shared_ptr<size_t> liveCounter);
  ~HeadlessRig() override;

  const std::vector<std::string> &animationNames() const override { return m_animations; }
  const std::vector<std::string> &skinNames() const override { return m_skins; }

  void setAnimation(const std::string &name, bool loop) override;
  const std::string &currentAnimation() const override { return m_animation; }
  bool isLooping() const override { return m_looping; }

  void setSkin(const std::string &name) override;
  const std::string &currentSkin() const override { return m_skin; }

  void setTimeScale(float timeScale) override { m_timeScale = timeScale; }
  float timeScale() const override { return m_timeScale; }

  void setScale(float scale) override { m_scale = scale; }
  float scale() const override { return m_scale; }

  void setPivot(glm::vec2 pivot) override { m_pivot = pivot; }
  glm::vec2 pivot() const { return m_pivot; }
  void setPosition(glm::vec2 position) override { m_position = position; }
  glm::vec2 position() const override { return m_position; }

  stage::Rect localBounds() const override { return m_localBounds; }
  stage::Rect screenBounds() const override;

  // Setup-pose resets caused by skin changes.
  size_t setupPoseResets() const { return m_setupPoseResets; }

private:
  std::vector<std::string> m_animations;
  std::vector<std::string> m_skins;
  std::string m_animation;
  std::string m_skin;
  bool m_looping = false;
  float m_timeScale = 1.0F;
  float m_scale = 1.0F;
  glm::vec2 m_pivot{0.0F};
  glm::vec2 m_position{0.0F};
  stage::Rect m_localBounds;
  size_t m_setupPoseResets = 0;
  std::shared_ptr<size_t> m_liveCounter;
};

// Builds HeadlessRig instances from assets the headless manager has loaded.
class HeadlessRigRuntime : public stage::RigRuntime {
public:
  explicit HeadlessRigRuntime(const HeadlessAssetManager &assets, RigProfile profile = {});

  core::Result<std::unique_ptr<stage::RigInstance>> instantiate(const std::string &skeletonKey,
                                                                const std::string &atlasKey) override;

  void setProfile(RigProfile profile) { m_profile = std::move(profile); }
  const RigProfile &profile() const { return m_profile; }

  void failNextInstantiation(std::string reason) { m_failNext = std::move(reason); }

  size_t instancesCreated() const { return m_created; }
  size_t liveInstances() const { return *m_live; }

private:
  const HeadlessAssetManager &m_assets;
  RigProfile m_profile;
  std::optional<std::string> m_failNext;
  size_t m_created = 0;
  std::shared_ptr<size_t> m_live = std::make_shared<size_t>(0);
};

} // namespace rigview::headless
