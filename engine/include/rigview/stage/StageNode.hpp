#pragma once

#include <string>
#include <utility>

namespace rigview::stage
{
    namespace zorder
    {
        inline constexpr int kGuide = 0;
        inline constexpr int kHover = 2;
        inline constexpr int kRig = 5;
        inline constexpr int kOutline = 10;
    }

    // Anything the render stage can hold as a child. The stage never owns nodes.
    class StageNode
    {
    public:
        explicit StageNode(std::string debugName = {}) : m_debugName(std::move(debugName)) {}
        virtual ~StageNode() = default;

        StageNode(const StageNode&) = delete;
        StageNode& operator=(const StageNode&) = delete;

        int zIndex() const { return m_zIndex; }
        void setZIndex(int z) { m_zIndex = z; }

        const std::string& debugName() const { return m_debugName; }
        void setDebugName(std::string name) { m_debugName = std::move(name); }

    private:
        std::string m_debugName;
        int m_zIndex = 0;
    };
}
