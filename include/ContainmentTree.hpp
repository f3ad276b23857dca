#ifndef CVAT_CONTAINMENT_TREE_HPP
#define CVAT_CONTAINMENT_TREE_HPP

#include "CVATModels.hpp"

#include <utility>
#include <vector>

namespace cvat {

/**
 * @brief Node of the containment forest
 *
 * Each node owns its children. Parent links are not stored; use
 * findAncestorIds() to walk upwards from the roots.
 */
struct TreeNode {
  CVATElement element;
  std::vector<TreeNode> children;

  TreeNode() = default;
  explicit TreeNode(const CVATElement &elem) : element(elem) {}

  void addChild(TreeNode child) { children.push_back(std::move(child)); }

  int id() const { return element.id; }
};

/**
 * @brief Build the containment forest of a page
 *
 * Every element is attached to the smallest-area element whose bbox contains
 * it within tolerance. Equal areas are broken by the lower id, and a parent
 * must be larger than its child (or equal in area with a lower id), so no
 * cycles can form. Elements that nothing contains become roots. Siblings are
 * ordered top-to-bottom, then left-to-right, then by id.
 *
 * @param elements Elements of one page
 * @param tolerance Amount in page units by which a child may stick out
 * @return Root nodes in spatial order
 */
std::vector<TreeNode> buildContainmentTree(
    const std::vector<CVATElement> &elements, double tolerance = 1.0);

/**
 * @brief Spatial order of two nodes: top edge, then left edge, then id
 */
bool positionLess(const TreeNode &a, const TreeNode &b);

/**
 * @brief Sort nodes top-to-bottom, then left-to-right, then by id
 */
void sortNodesByPosition(std::vector<TreeNode> &nodes);

/**
 * @brief Find the node holding an element
 * @return The node, or nullptr if the id is not in the forest
 */
const TreeNode *findNode(const std::vector<TreeNode> &roots, int elementId);

/**
 * @brief Ids of the ancestors of an element, root first
 *
 * The element itself is not included. Unknown ids give an empty list.
 */
std::vector<int> findAncestorIds(const std::vector<TreeNode> &roots,
                                 int elementId);

/**
 * @brief Ids of all descendants of a node in pre-order, node excluded
 */
std::vector<int> collectDescendantIds(const TreeNode &node);

/**
 * @brief All nodes of the forest in pre-order
 */
std::vector<const TreeNode *> flattenTree(const std::vector<TreeNode> &roots);

} // namespace cvat

#endif // CVAT_CONTAINMENT_TREE_HPP
