#include "ContainmentTree.hpp"

#include <algorithm>

namespace cvat {

namespace {

// True if candidate may become the parent of child: it must contain the
// child and rank strictly above it by (area, lower id).
bool canContain(const CVATElement &candidate, const CVATElement &child,
                double tolerance) {
  if (candidate.id == child.id)
    return false;
  if (!candidate.bbox.contains(child.bbox, tolerance))
    return false;

  double candidateArea = candidate.bbox.area();
  double childArea = child.bbox.area();
  if (candidateArea > childArea)
    return true;
  return candidateArea == childArea && candidate.id < child.id;
}

TreeNode buildSubtree(const std::vector<CVATElement> &elements,
                      const std::vector<std::vector<size_t>> &childIndices,
                      size_t index) {
  TreeNode node(elements[index]);
  for (size_t childIndex : childIndices[index]) {
    node.addChild(buildSubtree(elements, childIndices, childIndex));
  }
  sortNodesByPosition(node.children);
  return node;
}

bool collectAncestors(const TreeNode &node, int elementId,
                      std::vector<int> &path) {
  if (node.id() == elementId)
    return true;

  path.push_back(node.id());
  for (const auto &child : node.children) {
    if (collectAncestors(child, elementId, path))
      return true;
  }
  path.pop_back();
  return false;
}

void collectDescendants(const TreeNode &node, std::vector<int> &ids) {
  for (const auto &child : node.children) {
    ids.push_back(child.id());
    collectDescendants(child, ids);
  }
}

void collectNodes(const TreeNode &node, std::vector<const TreeNode *> &out) {
  out.push_back(&node);
  for (const auto &child : node.children) {
    collectNodes(child, out);
  }
}

} // anonymous namespace

std::vector<TreeNode> buildContainmentTree(
    const std::vector<CVATElement> &elements, double tolerance) {
  const size_t count = elements.size();
  std::vector<std::vector<size_t>> childIndices(count);
  std::vector<size_t> rootIndices;

  for (size_t i = 0; i < count; i++) {
    const CVATElement &child = elements[i];

    // Tightest enclosing element wins, lower id breaks ties
    bool found = false;
    size_t best = 0;
    for (size_t j = 0; j < count; j++) {
      if (i == j || !canContain(elements[j], child, tolerance))
        continue;

      if (!found) {
        best = j;
        found = true;
        continue;
      }

      double area = elements[j].bbox.area();
      double bestArea = elements[best].bbox.area();
      if (area < bestArea ||
          (area == bestArea && elements[j].id < elements[best].id)) {
        best = j;
      }
    }

    if (found) {
      childIndices[best].push_back(i);
    } else {
      rootIndices.push_back(i);
    }
  }

  std::vector<TreeNode> roots;
  roots.reserve(rootIndices.size());
  for (size_t index : rootIndices) {
    roots.push_back(buildSubtree(elements, childIndices, index));
  }
  sortNodesByPosition(roots);
  return roots;
}

bool positionLess(const TreeNode &a, const TreeNode &b) {
  // Exact keys with the id last keep this a strict weak ordering
  double aTop = a.element.bbox.topKey();
  double bTop = b.element.bbox.topKey();
  if (aTop != bTop)
    return aTop < bTop;
  if (a.element.bbox.l != b.element.bbox.l)
    return a.element.bbox.l < b.element.bbox.l;
  return a.id() < b.id();
}

void sortNodesByPosition(std::vector<TreeNode> &nodes) {
  std::sort(nodes.begin(), nodes.end(), positionLess);
}

const TreeNode *findNode(const std::vector<TreeNode> &roots, int elementId) {
  for (const auto &root : roots) {
    if (root.id() == elementId)
      return &root;
    const TreeNode *found = findNode(root.children, elementId);
    if (found)
      return found;
  }
  return nullptr;
}

std::vector<int> findAncestorIds(const std::vector<TreeNode> &roots,
                                 int elementId) {
  std::vector<int> path;
  for (const auto &root : roots) {
    if (collectAncestors(root, elementId, path))
      return path;
  }
  return {};
}

std::vector<int> collectDescendantIds(const TreeNode &node) {
  std::vector<int> ids;
  collectDescendants(node, ids);
  return ids;
}

std::vector<const TreeNode *> flattenTree(const std::vector<TreeNode> &roots) {
  std::vector<const TreeNode *> nodes;
  for (const auto &root : roots) {
    collectNodes(root, nodes);
  }
  return nodes;
}

} // namespace cvat
