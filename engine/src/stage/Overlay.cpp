#include "rigview/stage/Overlay.hpp"

namespace rigview::stage
{
    Overlay::Overlay(std::string debugName, int zIndex)
        : StageNode(std::move(debugName))
    {
        setZIndex(zIndex);
    }

    void Overlay::clear()
    {
        m_shapes.clear();
        m_hitArea.reset();
        ++m_revision;
    }

    Overlay& Overlay::rect(const Rect& r, const StrokeStyle& stroke)
    {
        m_shapes.push_back({r, 0.0F, std::nullopt, stroke});
        ++m_revision;
        return *this;
    }

    Overlay& Overlay::roundRect(const Rect& r, float radius, const FillStyle& fill)
    {
        m_shapes.push_back({r, radius, fill, std::nullopt});
        ++m_revision;
        return *this;
    }

    Overlay& Overlay::roundRect(const Rect& r, float radius, const FillStyle& fill, const StrokeStyle& stroke)
    {
        m_shapes.push_back({r, radius, fill, stroke});
        ++m_revision;
        return *this;
    }
}
