#include "rigview/headless/HeadlessStage.hpp"

#include <algorithm>

namespace rigview::headless {

HeadlessStage::HeadlessStage(glm::vec2 viewportSize, bool ready)
    : m_viewportSize(viewportSize), m_ready(ready) {}

void HeadlessStage::attach(stage::StageNode &node) {
  if (isAttached(node)) {
    return;
  }
  auto pos = std::upper_bound(m_children.begin(), m_children.end(), node.zIndex(),
                              [](int z, const stage::StageNode *child) { return z < child->zIndex(); });
  m_children.insert(pos, &node);
}

void HeadlessStage::detach(stage::StageNode &node) {
  std::erase(m_children, &node);
}

bool HeadlessStage::isAttached(const stage::StageNode &node) const {
  return std::find(m_children.begin(), m_children.end(), &node) != m_children.end();
}

} // namespace rigview::headless
