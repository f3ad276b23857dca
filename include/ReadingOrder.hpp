#ifndef CVAT_READING_ORDER_HPP
#define CVAT_READING_ORDER_HPP

#include "CVATModels.hpp"
#include "ContainmentTree.hpp"
#include "PathMappings.hpp"

#include <map>
#include <string>
#include <vector>

namespace cvat {

/**
 * @brief Configuration options for reading-order resolution
 */
struct ReadingOrderConfig {
  double containmentTolerance = 1.0; ///< Leniency of bbox nesting, page units
  double pointTolerance = 0.0;       ///< Leniency of path point hits
  double tableCrossingTolerance = 2.0; ///< Jitter ignored at table edges
  bool resolveConflicts = true; ///< Let nested paths subsume level-1 entries
  bool promoteTables = true;    ///< Insert tables entered by a path
  bool debug = false;           ///< Print DEBUG: diagnostics to stderr
};

/**
 * @brief Result of resolving the reading order of one page
 */
struct ReadingOrderResult {
  bool success = false;         ///< Whether resolution succeeded
  std::string errorMessage;     ///< Error message if failed
  PathMappings mappings;        ///< Final path mappings
  std::map<int, int> pathToContainer; ///< Nested path id -> container id
  std::vector<int> globalOrder; ///< Every element id, in reading order
  double processingTimeMs = 0;  ///< Processing time in milliseconds
};

/**
 * @brief Merge the reading-order paths of a page into one global order
 *
 * Level-1 paths are walked first, in input order. A container that scopes
 * nested paths is followed directly by the elements of those paths; when it
 * is not listed by any path it is placed right before the first of its
 * descendants a walk reaches. When a path moves from A into an element B
 * whose unlisted ancestor C does not contain A, C is placed between them.
 * Elements no path reaches are placed by a spatial walk of the forest:
 * after their leading run of placed descendants, after the previous placed
 * sibling, before the next placed sibling or after the parent.
 *
 * @param paths Reading-order paths of the page
 * @param pathToElements Path id -> element ids it threads through
 * @param pathToContainer Nested path id -> element id scoping it. Nested
 *        paths missing here are scoped to the tightest unlisted element
 *        enclosing all their elements, if any.
 * @param treeRoots Containment forest of the page
 * @return Each element id of the forest exactly once
 */
std::vector<int>
buildGlobalReadingOrder(const std::vector<CVATAnnotationPath> &paths,
                        const PathElementMap &pathToElements,
                        const std::map<int, int> &pathToContainer,
                        const std::vector<TreeNode> &treeRoots);

/**
 * @brief Resolve the reading order of a page from its raw annotations
 *
 * Builds the containment tree, associates paths with elements and then
 * delegates to the overload taking mappings.
 */
ReadingOrderResult
resolvePageReadingOrder(const std::vector<CVATElement> &elements,
                        const std::vector<CVATAnnotationPath> &paths,
                        const ReadingOrderConfig &config = ReadingOrderConfig());

/**
 * @brief Resolve the reading order of a page from precomputed mappings
 *
 * Runs conflict resolution and table promotion (as enabled in config), infers
 * the containers of nested paths and assembles the global order.
 */
ReadingOrderResult
resolvePageReadingOrder(const std::vector<CVATElement> &elements,
                        const std::vector<CVATAnnotationPath> &paths,
                        const PathMappings &mappings,
                        const ReadingOrderConfig &config = ReadingOrderConfig());

} // namespace cvat

#endif // CVAT_READING_ORDER_HPP
