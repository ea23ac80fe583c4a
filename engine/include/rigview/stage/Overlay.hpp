#pragma once

#include "rigview/stage/Rect.hpp"
#include "rigview/stage/StageNode.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rigview::stage
{
    struct FillStyle
    {
        uint32_t color = 0xffffff;
        float alpha = 1.0F;
    };

    struct StrokeStyle
    {
        float width = 1.0F;
        uint32_t color = 0xffffff;
        float alpha = 1.0F;
    };

    struct OverlayShape
    {
        Rect rect;
        float cornerRadius = 0.0F;
        std::optional<FillStyle> fill;
        std::optional<StrokeStyle> stroke;
    };

    // Retained 2D vector overlay: the renderer draws whatever shapes it holds.
    class Overlay : public StageNode
    {
    public:
        explicit Overlay(std::string debugName = {}, int zIndex = 0);

        void clear();

        Overlay& rect(const Rect& r, const StrokeStyle& stroke);
        Overlay& roundRect(const Rect& r, float radius, const FillStyle& fill);
        Overlay& roundRect(const Rect& r, float radius, const FillStyle& fill, const StrokeStyle& stroke);

        const std::vector<OverlayShape>& shapes() const { return m_shapes; }
        bool empty() const { return m_shapes.empty(); }

        // Bumped on every change so a renderer can skip re-tessellation.
        uint64_t revision() const { return m_revision; }

        void setHitArea(const std::optional<Rect>& area) { m_hitArea = area; }
        const std::optional<Rect>& hitArea() const { return m_hitArea; }

    private:
        std::vector<OverlayShape> m_shapes;
        std::optional<Rect> m_hitArea;
        uint64_t m_revision = 0;
    };
}
