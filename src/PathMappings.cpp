#include "PathMappings.hpp"

#include <algorithm>
#include <set>

namespace cvat {

namespace {

// Tightest strict common ancestor of all listed elements that the list does
// not itself contain. Returns false when there is none.
bool findEnclosingContainer(const std::vector<int> &elementIds,
                            const std::vector<TreeNode> &roots,
                            int &containerId) {
  if (elementIds.empty())
    return false;

  std::vector<int> common = findAncestorIds(roots, elementIds.front());
  for (size_t i = 1; i < elementIds.size() && !common.empty(); i++) {
    std::vector<int> ancestors = findAncestorIds(roots, elementIds[i]);
    size_t shared = 0;
    while (shared < common.size() && shared < ancestors.size() &&
           common[shared] == ancestors[shared]) {
      shared++;
    }
    common.resize(shared);
  }

  for (auto it = common.rbegin(); it != common.rend(); ++it) {
    if (std::find(elementIds.begin(), elementIds.end(), *it) ==
        elementIds.end()) {
      containerId = *it;
      return true;
    }
  }
  return false;
}

bool isAncestorOf(const std::vector<TreeNode> &roots, int ancestorId,
                  int elementId) {
  std::vector<int> ancestors = findAncestorIds(roots, elementId);
  return std::find(ancestors.begin(), ancestors.end(), ancestorId) !=
         ancestors.end();
}

PathElementMap *mappingForLabel(PathMappings &mappings,
                                const std::string &label) {
  if (label == "reading_order")
    return &mappings.readingOrder;
  if (label == "merge")
    return &mappings.merge;
  if (label == "group")
    return &mappings.group;
  if (label == "to_caption")
    return &mappings.toCaption;
  if (label == "to_footnote")
    return &mappings.toFootnote;
  if (label == "to_value")
    return &mappings.toValue;
  return nullptr;
}

} // anonymous namespace

PathMappings mapPathsToElements(const std::vector<CVATAnnotationPath> &paths,
                                const std::vector<CVATElement> &elements,
                                double pointTolerance) {
  PathMappings mappings;

  for (const auto &path : paths) {
    PathElementMap *target = mappingForLabel(mappings, path.label);
    if (!target)
      continue;

    std::vector<int> touched;
    for (const auto &point : path.points) {
      const CVATElement *best = nullptr;
      for (const auto &element : elements) {
        if (!element.bbox.expanded(pointTolerance).containsPoint(point))
          continue;

        if (!best) {
          best = &element;
          continue;
        }

        double area = element.bbox.area();
        double bestArea = best->bbox.area();
        if (area < bestArea || (area == bestArea && element.id < best->id)) {
          best = &element;
        }
      }

      if (best && std::find(touched.begin(), touched.end(), best->id) ==
                      touched.end()) {
        touched.push_back(best->id);
      }
    }

    (*target)[path.id] = touched;
  }

  return mappings;
}

std::map<int, int>
inferPathContainers(const std::vector<CVATAnnotationPath> &paths,
                    const PathElementMap &readingOrder,
                    const std::vector<TreeNode> &treeRoots) {
  std::map<int, int> containers;
  for (const auto &path : paths) {
    if (path.level <= 1)
      continue;

    auto it = readingOrder.find(path.id);
    if (it == readingOrder.end())
      continue;

    int containerId = 0;
    if (findEnclosingContainer(it->second, treeRoots, containerId)) {
      containers[path.id] = containerId;
    }
  }
  return containers;
}

PathElementMap
resolveReadingOrderConflicts(const PathElementMap &readingOrder,
                             const std::vector<CVATAnnotationPath> &paths,
                             const std::vector<CVATElement> &elements,
                             double containmentTolerance) {
  PathElementMap result = readingOrder;
  const std::vector<TreeNode> roots =
      buildContainmentTree(elements, containmentTolerance);

  // Paths the mapping knows but the path list does not count as level 1
  std::map<int, int> levels;
  for (const auto &path : paths) {
    levels[path.id] = path.level;
  }
  auto levelOf = [&levels](int pathId) {
    auto it = levels.find(pathId);
    return it == levels.end() ? 1 : it->second;
  };

  // Element listed by a nested path -> container enclosing that path. When
  // an element sits in several nested paths the outermost container wins.
  std::map<int, int> elementContainer;
  for (const auto &entry : readingOrder) {
    if (levelOf(entry.first) <= 1)
      continue;

    int containerId = 0;
    if (!findEnclosingContainer(entry.second, roots, containerId))
      continue;

    for (int elementId : entry.second) {
      auto it = elementContainer.find(elementId);
      if (it == elementContainer.end()) {
        elementContainer[elementId] = containerId;
      } else if (isAncestorOf(roots, containerId, it->second)) {
        it->second = containerId;
      }
    }
  }

  if (elementContainer.empty())
    return result;

  for (auto &entry : result) {
    if (levelOf(entry.first) != 1)
      continue;

    const std::vector<int> &original = entry.second;

    std::set<int> chosen;
    for (int elementId : original) {
      auto it = elementContainer.find(elementId);
      if (it != elementContainer.end())
        chosen.insert(it->second);
    }
    if (chosen.empty())
      continue;

    // Collapse nested choices onto the outermost chosen container
    std::set<int> outermost;
    for (int containerId : chosen) {
      bool covered = false;
      for (int other : chosen) {
        if (other != containerId && isAncestorOf(roots, other, containerId)) {
          covered = true;
          break;
        }
      }
      if (!covered)
        outermost.insert(containerId);
    }

    auto subsumingContainer = [&](int elementId, int &containerId) {
      if (outermost.count(elementId)) {
        containerId = elementId;
        return true;
      }
      for (int ancestor : findAncestorIds(roots, elementId)) {
        if (outermost.count(ancestor)) {
          containerId = ancestor;
          return true;
        }
      }
      return false;
    };

    std::vector<int> updated;
    std::set<int> emitted;
    for (int elementId : original) {
      int target = elementId;
      int containerId = 0;
      if (subsumingContainer(elementId, containerId))
        target = containerId;

      if (emitted.insert(target).second)
        updated.push_back(target);
    }
    entry.second = updated;
  }

  return result;
}

PathMappings
applyTableCrossBoundaryPromotion(const PathMappings &mappings,
                                 const std::vector<CVATAnnotationPath> &paths,
                                 const std::vector<TreeNode> &treeRoots,
                                 double tolerance) {
  PathMappings result = mappings;

  for (const TreeNode *node : flattenTree(treeRoots)) {
    if (!isTableLabel(node->element.label))
      continue;

    const std::vector<int> descendants = collectDescendantIds(*node);
    if (descendants.empty())
      continue;
    const std::set<int> descendantSet(descendants.begin(), descendants.end());
    const BoundingBox tableBox = node->element.bbox.expanded(tolerance);

    for (const auto &path : paths) {
      auto it = result.readingOrder.find(path.id);
      if (it == result.readingOrder.end())
        continue;

      std::vector<int> &order = it->second;
      if (std::find(order.begin(), order.end(), node->id()) != order.end())
        continue;

      auto firstInside =
          std::find_if(order.begin(), order.end(), [&](int elementId) {
            return descendantSet.count(elementId) > 0;
          });
      if (firstInside == order.end())
        continue;

      // A path that stays inside the table does not enter it
      if (polylineInside(path.points, tableBox))
        continue;

      order.insert(firstInside, node->id());
    }
  }

  return result;
}

void promoteTableCrossBoundaryReadingOrder(
    PathMappings &mappings, const std::vector<CVATAnnotationPath> &paths,
    const std::vector<TreeNode> &treeRoots, double tolerance) {
  mappings =
      applyTableCrossBoundaryPromotion(mappings, paths, treeRoots, tolerance);
}

} // namespace cvat
