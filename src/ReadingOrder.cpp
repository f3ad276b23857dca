#include "ReadingOrder.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>

namespace cvat {

namespace {

std::string formatIds(const std::vector<int> &ids) {
  std::string text = "[";
  for (size_t i = 0; i < ids.size(); i++) {
    if (i > 0)
      text += ", ";
    text += std::to_string(ids[i]);
  }
  return text + "]";
}

/**
 * @brief Assembles the global order of one page
 *
 * Holds the indexes built from the forest and the set of placed elements.
 * Lives for a single buildGlobalReadingOrder() call.
 */
class GlobalOrderBuilder {
public:
  GlobalOrderBuilder(const std::vector<CVATAnnotationPath> &paths,
                     const PathElementMap &pathToElements,
                     const std::map<int, int> &pathToContainer,
                     const std::vector<TreeNode> &treeRoots)
      : m_pathToElements(pathToElements), m_roots(treeRoots) {
    indexForest(treeRoots, -1);

    for (const auto &entry : pathToElements) {
      m_listed.insert(entry.second.begin(), entry.second.end());
    }

    for (const auto &path : paths) {
      if (path.level <= 1) {
        m_outerPaths.push_back(&path);
        continue;
      }

      int containerId = -1;
      auto it = pathToContainer.find(path.id);
      if (it != pathToContainer.end() && m_nodes.count(it->second)) {
        containerId = it->second;
      } else {
        containerId = enclosingContainer(path.id);
      }

      if (containerId != -1) {
        m_containerPaths[containerId].push_back(&path);
      } else {
        m_unscopedPaths.push_back(&path);
      }
    }

    auto byLevel = [](const CVATAnnotationPath *a,
                      const CVATAnnotationPath *b) {
      return a->level < b->level;
    };
    for (auto &entry : m_containerPaths) {
      std::stable_sort(entry.second.begin(), entry.second.end(), byLevel);
    }
    std::stable_sort(m_unscopedPaths.begin(), m_unscopedPaths.end(), byLevel);
  }

  std::vector<int> build() {
    std::vector<int> order;
    for (const CVATAnnotationPath *path : m_outerPaths) {
      walkPath(*path, -1, order);
    }
    for (const CVATAnnotationPath *path : m_unscopedPaths) {
      walkPath(*path, -1, order);
    }
    placeRemaining(m_roots, -1, order);
    return order;
  }

private:
  void indexForest(const std::vector<TreeNode> &nodes, int parentId) {
    for (const auto &node : nodes) {
      m_nodes[node.id()] = &node;
      m_parent[node.id()] = parentId;
      indexForest(node.children, node.id());
    }
  }

  // Ancestors of an element, root first
  std::vector<int> ancestorsOf(int elementId) const {
    std::vector<int> chain;
    auto it = m_parent.find(elementId);
    while (it != m_parent.end() && it->second != -1) {
      chain.push_back(it->second);
      it = m_parent.find(it->second);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
  }

  // Deepest common strict ancestor of a path's elements that the path does
  // not list, or -1. Used when the caller gives no container for the path.
  int enclosingContainer(int pathId) const {
    auto it = m_pathToElements.find(pathId);
    if (it == m_pathToElements.end())
      return -1;

    bool first = true;
    std::vector<int> common;
    for (int elementId : it->second) {
      if (!m_nodes.count(elementId))
        continue;

      std::vector<int> ancestors = ancestorsOf(elementId);
      if (first) {
        common = ancestors;
        first = false;
        continue;
      }

      size_t shared = 0;
      while (shared < common.size() && shared < ancestors.size() &&
             common[shared] == ancestors[shared]) {
        shared++;
      }
      common.resize(shared);
    }

    for (auto anc = common.rbegin(); anc != common.rend(); ++anc) {
      if (std::find(it->second.begin(), it->second.end(), *anc) ==
          it->second.end())
        return *anc;
    }
    return -1;
  }

  bool isAncestor(int ancestorId, int elementId) const {
    auto it = m_parent.find(elementId);
    while (it != m_parent.end() && it->second != -1) {
      if (it->second == ancestorId)
        return true;
      it = m_parent.find(it->second);
    }
    return false;
  }

  bool isPlaced(int elementId) const { return m_placed.count(elementId) > 0; }

  void emit(int elementId, std::vector<int> &out) {
    if (isPlaced(elementId) || !m_nodes.count(elementId))
      return;

    m_placed.insert(elementId);
    out.push_back(elementId);
    expandContainer(elementId, out);
  }

  void expandContainer(int containerId, std::vector<int> &out) {
    auto it = m_containerPaths.find(containerId);
    if (it == m_containerPaths.end())
      return;

    for (const CVATAnnotationPath *path : it->second) {
      walkPath(*path, containerId, out);
    }
  }

  void walkPath(const CVATAnnotationPath &path, int scopeId,
                std::vector<int> &out) {
    if (!m_walked.insert(path.id).second)
      return;

    auto it = m_pathToElements.find(path.id);
    if (it == m_pathToElements.end())
      return;

    bool hasPrevious = false;
    int previous = 0;
    for (int elementId : it->second) {
      if (!m_nodes.count(elementId))
        continue;

      if (!isPlaced(elementId)) {
        std::vector<int> ancestors = ancestorsOf(elementId);

        // Only ancestors strictly inside the path's scope are candidates
        auto first = ancestors.begin();
        if (scopeId != -1) {
          first = std::find(ancestors.begin(), ancestors.end(), scopeId);
          if (first != ancestors.end())
            ++first;
        }

        for (auto anc = first; anc != ancestors.end(); ++anc) {
          int containerId = *anc;
          if (isPlaced(containerId) || m_listed.count(containerId))
            continue;

          bool scopesNestedPath = m_containerPaths.count(containerId) > 0;
          bool entered = hasPrevious && !isAncestor(containerId, previous);
          if (scopesNestedPath || entered)
            emit(containerId, out);
        }

        emit(elementId, out);
      }

      hasPrevious = true;
      previous = elementId;
    }
  }

  // Position of the last placed element of a subtree, or -1
  long lastPositionOfSubtree(const TreeNode &node,
                             const std::vector<int> &order) const {
    long last = -1;
    for (long i = 0; i < static_cast<long>(order.size()); i++) {
      if (order[i] == node.id() || isAncestor(node.id(), order[i]))
        last = i;
    }
    return last;
  }

  long firstPositionOfSubtree(const TreeNode &node,
                              const std::vector<int> &order) const {
    for (long i = 0; i < static_cast<long>(order.size()); i++) {
      if (order[i] == node.id() || isAncestor(node.id(), order[i]))
        return i;
    }
    return -1;
  }

  long insertionPoint(const TreeNode &node,
                      const std::vector<const TreeNode *> &siblings,
                      size_t index, int parentId,
                      const std::vector<int> &order) const {
    long firstDescendant = -1;
    for (long i = 0; i < static_cast<long>(order.size()); i++) {
      if (isAncestor(node.id(), order[i])) {
        firstDescendant = i;
        break;
      }
    }

    if (firstDescendant != -1) {
      // Containers of nested paths open their block, others follow the run
      // of descendants that starts at their first placed descendant
      if (m_containerPaths.count(node.id()))
        return firstDescendant;

      long position = firstDescendant;
      while (position + 1 < static_cast<long>(order.size()) &&
             isAncestor(node.id(), order[position + 1])) {
        position++;
      }
      return position + 1;
    }

    for (size_t i = index; i-- > 0;) {
      long last = lastPositionOfSubtree(*siblings[i], order);
      if (last != -1)
        return last + 1;
    }

    for (size_t i = index + 1; i < siblings.size(); i++) {
      long first = firstPositionOfSubtree(*siblings[i], order);
      if (first != -1)
        return first;
    }

    if (parentId != -1) {
      auto it = std::find(order.begin(), order.end(), parentId);
      if (it != order.end())
        return static_cast<long>(it - order.begin()) + 1;
    }

    return static_cast<long>(order.size());
  }

  void placeRemaining(const std::vector<TreeNode> &nodes, int parentId,
                      std::vector<int> &order) {
    std::vector<const TreeNode *> siblings;
    for (const auto &node : nodes) {
      siblings.push_back(&node);
    }
    std::sort(siblings.begin(), siblings.end(),
              [](const TreeNode *a, const TreeNode *b) {
                return positionLess(*a, *b);
              });

    for (size_t i = 0; i < siblings.size(); i++) {
      const TreeNode &node = *siblings[i];
      if (!isPlaced(node.id())) {
        long position = insertionPoint(node, siblings, i, parentId, order);

        std::vector<int> block;
        emit(node.id(), block);
        order.insert(order.begin() + position, block.begin(), block.end());
      }

      placeRemaining(node.children, node.id(), order);
    }
  }

  const PathElementMap &m_pathToElements;
  const std::vector<TreeNode> &m_roots;

  std::map<int, const TreeNode *> m_nodes; ///< Element id -> node
  std::map<int, int> m_parent;             ///< Element id -> parent id or -1
  std::set<int> m_listed;                  ///< Ids listed by any path
  std::map<int, std::vector<const CVATAnnotationPath *>> m_containerPaths;
  std::vector<const CVATAnnotationPath *> m_outerPaths;
  std::vector<const CVATAnnotationPath *> m_unscopedPaths;

  std::set<int> m_placed;
  std::set<int> m_walked;
};

} // anonymous namespace

std::vector<int>
buildGlobalReadingOrder(const std::vector<CVATAnnotationPath> &paths,
                        const PathElementMap &pathToElements,
                        const std::map<int, int> &pathToContainer,
                        const std::vector<TreeNode> &treeRoots) {
  GlobalOrderBuilder builder(paths, pathToElements, pathToContainer,
                             treeRoots);
  return builder.build();
}

ReadingOrderResult
resolvePageReadingOrder(const std::vector<CVATElement> &elements,
                        const std::vector<CVATAnnotationPath> &paths,
                        const ReadingOrderConfig &config) {
  PathMappings mappings =
      mapPathsToElements(paths, elements, config.pointTolerance);

  if (config.debug) {
    for (const auto &entry : mappings.readingOrder) {
      std::cerr << "DEBUG: Path " << entry.first << " touches "
                << formatIds(entry.second) << std::endl;
    }
  }

  return resolvePageReadingOrder(elements, paths, mappings, config);
}

ReadingOrderResult
resolvePageReadingOrder(const std::vector<CVATElement> &elements,
                        const std::vector<CVATAnnotationPath> &paths,
                        const PathMappings &mappings,
                        const ReadingOrderConfig &config) {
  ReadingOrderResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::vector<TreeNode> roots =
        buildContainmentTree(elements, config.containmentTolerance);

    if (config.debug) {
      std::cerr << "DEBUG: Containment tree has " << roots.size()
                << " roots for " << elements.size() << " elements"
                << std::endl;
    }

    PathMappings current = mappings;

    if (config.resolveConflicts) {
      current.readingOrder =
          resolveReadingOrderConflicts(current.readingOrder, paths, elements,
                                       config.containmentTolerance);
    }

    if (config.promoteTables) {
      current = applyTableCrossBoundaryPromotion(
          current, paths, roots, config.tableCrossingTolerance);
    }

    if (config.debug) {
      for (const auto &entry : current.readingOrder) {
        std::cerr << "DEBUG: Resolved path " << entry.first << ": "
                  << formatIds(entry.second) << std::endl;
      }
    }

    std::vector<CVATAnnotationPath> readingPaths;
    for (const auto &path : paths) {
      if (path.label == "reading_order")
        readingPaths.push_back(path);
    }

    result.pathToContainer =
        inferPathContainers(readingPaths, current.readingOrder, roots);

    if (config.debug) {
      for (const auto &entry : result.pathToContainer) {
        std::cerr << "DEBUG: Nested path " << entry.first
                  << " is scoped to element " << entry.second << std::endl;
      }
    }

    result.globalOrder = buildGlobalReadingOrder(
        readingPaths, current.readingOrder, result.pathToContainer, roots);
    result.mappings = current;
    result.success = true;

    if (config.debug) {
      std::cerr << "DEBUG: Global order " << formatIds(result.globalOrder)
                << std::endl;
    }
  } catch (const std::exception &e) {
    result.errorMessage =
        std::string("Reading order resolution failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace cvat
