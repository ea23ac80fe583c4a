#pragma once

#include "rigview/stage/StageNode.hpp"

#include <glm/vec2.hpp>

namespace rigview::stage
{
    // Root of the external render tree. Children are borrowed, never owned.
    class RenderStage
    {
    public:
        virtual ~RenderStage() = default;

        // False until the render surface exists.
        virtual bool isReady() const = 0;

        virtual void attach(StageNode& node) = 0;
        virtual void detach(StageNode& node) = 0;
        virtual void detachAll() = 0;
        virtual bool isAttached(const StageNode& node) const = 0;

        virtual glm::vec2 viewportSize() const = 0;
        virtual glm::vec2 clientToViewport(glm::vec2 client) const = 0;
    };
}
