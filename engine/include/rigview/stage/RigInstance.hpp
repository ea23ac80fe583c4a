#pragma once

#include "rigview/core/result.hpp"
#include "rigview/stage/Rect.hpp"
#include "rigview/stage/StageNode.hpp"

#include <glm/vec2.hpp>
#include <memory>
#include <string>
#include <vector>

namespace rigview::stage
{
    /**
     * @brief Live, renderable rig handle produced by the skeletal runtime.
     *
     * Destroying the instance releases its runtime-side resources (textures
     * included). It must be detached from the stage first.
     */
    class RigInstance : public StageNode
    {
    public:
        using StageNode::StageNode;

        virtual const std::vector<std::string>& animationNames() const = 0;
        virtual const std::vector<std::string>& skinNames() const = 0;

        // Track 0 only.
        virtual void setAnimation(const std::string& name, bool loop) = 0;
        virtual const std::string& currentAnimation() const = 0;
        virtual bool isLooping() const = 0;

        // Sets the skin, resets slots to the setup pose and re-applies state.
        virtual void setSkin(const std::string& name) = 0;
        virtual const std::string& currentSkin() const = 0;

        virtual void setTimeScale(float timeScale) = 0;
        virtual float timeScale() const = 0;

        virtual void setScale(float scale) = 0;
        virtual float scale() const = 0;

        virtual void setPivot(glm::vec2 pivot) = 0;
        virtual void setPosition(glm::vec2 position) = 0;
        virtual glm::vec2 position() const = 0;

        // Unscaled bounds in rig space.
        virtual Rect localBounds() const = 0;
        // Current bounds in viewport pixels.
        virtual Rect screenBounds() const = 0;
    };

    class RigRuntime
    {
    public:
        virtual ~RigRuntime() = default;

        // Both keys must already be loaded in the asset manager.
        virtual core::Result<std::unique_ptr<RigInstance>> instantiate(const std::string& skeletonKey,
                                                                       const std::string& atlasKey) = 0;
    };
}
