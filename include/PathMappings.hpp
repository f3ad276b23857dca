#ifndef CVAT_PATH_MAPPINGS_HPP
#define CVAT_PATH_MAPPINGS_HPP

#include "CVATModels.hpp"
#include "ContainmentTree.hpp"

#include <map>
#include <vector>

namespace cvat {

/// Path id -> element ids in the order the path threads through them
using PathElementMap = std::map<int, std::vector<int>>;

/**
 * @brief Relations drawn as paths on one page, keyed by path id
 *
 * Only readingOrder is rewritten by the resolution passes; the other
 * mappings are carried through unchanged.
 */
struct PathMappings {
  PathElementMap readingOrder; ///< "reading_order" paths
  PathElementMap merge;        ///< "merge" paths
  PathElementMap group;        ///< "group" paths
  PathElementMap toCaption;    ///< "to_caption" paths
  PathElementMap toFootnote;   ///< "to_footnote" paths
  PathElementMap toValue;      ///< "to_value" paths
};

/**
 * @brief Associate every path with the elements its points fall into
 *
 * Each point picks the smallest-area element whose bbox, grown by
 * pointTolerance, contains it (lower id on ties). Points outside every
 * element are ignored and each element is listed once, at its first hit.
 * Paths are filed under the mapping matching their label; paths with other
 * labels are left out.
 *
 * @param paths Paths of one page
 * @param elements Elements of the same page
 * @param pointTolerance Leniency in page units for point hits
 */
PathMappings mapPathsToElements(const std::vector<CVATAnnotationPath> &paths,
                                const std::vector<CVATElement> &elements,
                                double pointTolerance = 0.0);

/**
 * @brief Find the container element scoping each nested path
 *
 * For every path with level > 1 the result holds the tightest element that
 * is a strict ancestor of all elements the path lists and is not listed by
 * the path itself. Paths without such an element are absent.
 *
 * @return Path id -> container element id
 */
std::map<int, int>
inferPathContainers(const std::vector<CVATAnnotationPath> &paths,
                    const PathElementMap &readingOrder,
                    const std::vector<TreeNode> &treeRoots);

/**
 * @brief Let nested paths take precedence over level-1 paths
 *
 * An element listed both by a level-1 path and by a nested path is replaced
 * in the level-1 list, at its original index, by the container enclosing the
 * nested path. Other descendants of that container are dropped from the
 * level-1 list so the container is listed once. When the nested path has no
 * enclosing container the level-1 entry is kept.
 *
 * @param readingOrder Current reading-order mapping (not modified)
 * @param paths Paths of the page, used for their levels
 * @param elements Elements of the page, used to build the containment tree
 * @param containmentTolerance Tolerance passed to buildContainmentTree()
 * @return The updated mapping
 */
PathElementMap
resolveReadingOrderConflicts(const PathElementMap &readingOrder,
                             const std::vector<CVATAnnotationPath> &paths,
                             const std::vector<CVATElement> &elements,
                             double containmentTolerance = 1.0);

/**
 * @brief Register tables in the paths that cross into them
 *
 * For each table and each reading-order path listing one of the table's
 * descendants but not the table, the table id is inserted right before the
 * first such descendant, unless every point of the path lies inside the
 * table bbox grown by tolerance.
 *
 * @return Copy of mappings with the promoted reading order
 */
PathMappings
applyTableCrossBoundaryPromotion(const PathMappings &mappings,
                                 const std::vector<CVATAnnotationPath> &paths,
                                 const std::vector<TreeNode> &treeRoots,
                                 double tolerance);

/**
 * @brief In-place form of applyTableCrossBoundaryPromotion()
 */
void promoteTableCrossBoundaryReadingOrder(
    PathMappings &mappings, const std::vector<CVATAnnotationPath> &paths,
    const std::vector<TreeNode> &treeRoots, double tolerance);

} // namespace cvat

#endif // CVAT_PATH_MAPPINGS_HPP
