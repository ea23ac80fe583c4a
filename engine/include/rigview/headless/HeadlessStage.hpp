#pragma once

#include "rigview/stage/RenderStage.hpp"

#include <vector>

namespace rigview::headless {

// Render tree without a renderer: records children in z order.
class HeadlessStage : public stage::RenderStage {
public:
  explicit HeadlessStage(glm::vec2 viewportSize = {800.0F, 600.0F}, bool ready = true);

  bool isReady() const override { return m_ready; }
  void setReady(bool ready) { m_ready = ready; }

  void attach(stage::StageNode &node) override;
  void detach(stage::StageNode &node) override;
  void detachAll() override { m_children.clear(); }
  bool isAttached(const stage::StageNode &node) const override;

  glm::vec2 viewportSize() const override { return m_viewportSize; }
  void resize(glm::vec2 viewportSize) { m_viewportSize = viewportSize; }

  // Client coordinates are relative to the page; the canvas sits at `origin`.
  glm::vec2 clientToViewport(glm::vec2 client) const override { return client - m_canvasOrigin; }
  void setCanvasOrigin(glm::vec2 origin) { m_canvasOrigin = origin; }

  // Sorted by z index, insertion order within the same z.
  const std::vector<stage::StageNode *> &children() const { return m_children; }
  size_t childCount() const { return m_children.size(); }

private:
  glm::vec2 m_viewportSize;
  glm::vec2 m_canvasOrigin{0.0F};
  bool m_ready = true;
  std::vector<stage::StageNode *> m_children;
};

} // namespace rigview::headless
