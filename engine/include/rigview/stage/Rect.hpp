#pragma once

#include <glm/vec2.hpp>

namespace rigview::stage
{
    // Axis-aligned rectangle in viewport pixels, half-open on the far edges.
    struct Rect
    {
        float x = 0.0F;
        float y = 0.0F;
        float width = 0.0F;
        float height = 0.0F;

        constexpr float left() const { return x; }
        constexpr float top() const { return y; }
        constexpr float right() const { return x + width; }
        constexpr float bottom() const { return y + height; }

        glm::vec2 origin() const { return {x, y}; }
        glm::vec2 size() const { return {width, height}; }
        glm::vec2 center() const { return {x + width * 0.5F, y + height * 0.5F}; }

        bool contains(glm::vec2 p) const
        {
            return p.x >= x && p.y >= y && p.x < x + width && p.y < y + height;
        }

        constexpr bool operator==(const Rect&) const = default;
    };
}
