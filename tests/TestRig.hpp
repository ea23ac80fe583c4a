#pragma once

#include "rigview/assets/AssetBinder.hpp"
#include "rigview/assets/RigDescriptor.hpp"
#include "rigview/assets/TransientUriRegistry.hpp"
#include "rigview/headless/HeadlessAssetManager.hpp"
#include "rigview/headless/HeadlessRigRuntime.hpp"
#include "rigview/headless/HeadlessStage.hpp"
#include "rigview/slots/LifecycleCoordinator.hpp"
#include "rigview/slots/SlotArena.hpp"
#include "rigview/slots/SlotRegistry.hpp"
#include "rigview/stage/StageSynchronizer.hpp"

#include <string>
#include <vector>

namespace rigview::test {

// Atlas text in the libGDX layout: page name, then a size: line, then regions.
inline std::string makeAtlas(const std::vector<std::string> &pages) {
  std::string text;
  for (const auto &page : pages) {
    text += "\n" + page + "\n";
    text += "size: 256, 256\nformat: RGBA8888\nfilter: Linear, Linear\nrepeat: none\n";
    text += "head\n  rotate: false\n  xy: 2, 2\n  size: 64, 64\n  orig: 64, 64\n  offset: 0, 0\n  index: -1\n";
  }
  return text;
}

inline assets::RigDescriptor makeDescriptor(const std::vector<std::string> &pages,
                                            const std::vector<std::string> &imageNames) {
  assets::RigDescriptor descriptor;
  descriptor.skeleton = assets::NamedBlob::fromString("hero.json", R"({"skeleton":{"spine":"4.2"}})");
  descriptor.atlas = assets::NamedBlob::fromString("hero.atlas", makeAtlas(pages));
  for (const auto &name : imageNames) {
    descriptor.images.push_back(assets::NamedBlob::fromString(name, "\x89PNG"));
  }
  return descriptor;
}

inline assets::RigDescriptor heroDescriptor() { return makeDescriptor({"hero"}, {"hero.png"}); }

// The three external collaborators, headless.
struct HeadlessBackend {
  assets::TransientUriRegistry uris;
  headless::HeadlessAssetManager assets{uris};
  headless::HeadlessRigRuntime runtime{assets};
  headless::HeadlessStage stage{{800.0F, 600.0F}};

  // Runs completions until nothing new is queued.
  void pump() {
    while (assets.update() > 0) {
    }
  }
};

// Backend plus the slot core, wired the way a viewer session wires it.
struct SlotCore : HeadlessBackend {
  slots::SlotRegistry registry;
  slots::SlotArena arena;
  assets::AssetBinder binder{assets, runtime, uris};
  stage::StageSynchronizer synchronizer{stage, arena};
  slots::LifecycleCoordinator coordinator{registry, arena, binder, stage, synchronizer};

  // "has bundle" <=> "has instance" for every slot.
  bool ownershipConsistent() const {
    for (const auto id : registry.allSlots()) {
      if (arena.hasBundle(id) != arena.hasInstance(id)) {
        return false;
      }
      if (registry.get(id).hasRig != arena.hasInstance(id)) {
        return false;
      }
    }
    return true;
  }
};

} // namespace rigview::test
