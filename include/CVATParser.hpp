#ifndef CVAT_PARSER_HPP
#define CVAT_PARSER_HPP

#include "CVATModels.hpp"

#include <string>
#include <vector>

namespace cvat {

/**
 * @brief Annotations of one image (page) in a CVAT export
 */
struct CVATImageAnnotation {
  int id = 0;                               ///< CVAT image id
  std::string name;                         ///< Image file name
  int width = 0;                            ///< Image width in pixels
  int height = 0;                           ///< Image height in pixels
  std::vector<CVATElement> elements;        ///< Boxes, ids from 0
  std::vector<CVATAnnotationPath> paths;    ///< Polylines, ids from 0
};

/**
 * @brief Result of reading a CVAT annotation file
 */
struct CVATParseResult {
  bool success = false;                    ///< Whether parsing succeeded
  std::string errorMessage;                ///< Error message if failed
  std::vector<std::string> warnings;       ///< Skipped records and why
  std::vector<CVATImageAnnotation> images; ///< Images in document order

  /**
   * @brief Look up an image by file name
   * @return The image, or nullptr if absent
   */
  const CVATImageAnnotation *getImage(const std::string &name) const;
};

/**
 * @brief Read a CVAT for images 1.1 XML export
 *
 * Boxes become elements and polylines become paths. A box with a non-zero
 * "rotation" keeps the drawn box in bboxUnrotated and gets the enclosing
 * axis-aligned box of the rotated rectangle as bbox. Boxes with unknown
 * labels or non-positive extent, and polylines with fewer than two points,
 * are skipped and reported in warnings.
 *
 * @param xmlPath Path to annotations.xml
 * @return CVATParseResult with the parsed images
 */
CVATParseResult parseCVATFile(const std::string &xmlPath);

/**
 * @brief Same as parseCVATFile() for XML held in memory
 */
CVATParseResult parseCVATString(const std::string &xml);

} // namespace cvat

#endif // CVAT_PARSER_HPP
