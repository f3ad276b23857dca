#ifndef CVAT_MODELS_HPP
#define CVAT_MODELS_HPP

#include "Geometry.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cvat {

/**
 * @brief Kind of document element an annotated box describes
 */
enum class DocItemLabel {
  Caption,
  Chart,
  CheckboxSelected,
  CheckboxUnselected,
  Code,
  DocumentIndex,
  EmptyValue,
  Footnote,
  Form,
  Formula,
  GradingScale,
  HandwrittenText,
  KeyValueRegion,
  ListItem,
  PageFooter,
  PageHeader,
  Paragraph,
  Picture,
  Reference,
  SectionHeader,
  Table,
  Text,
  Title
};

/**
 * @brief Content layer an element belongs to
 */
enum class ContentLayer {
  Body,       ///< Main document flow
  Furniture,  ///< Headers, footers, page numbers
  Background, ///< Watermarks and decoration
  Invisible,  ///< Present in the source but not rendered
  Notes       ///< Marginal and editorial notes
};

/**
 * @brief Parse a CVAT label name such as "section_header"
 * @return The label, or std::nullopt for unknown names
 */
std::optional<DocItemLabel> labelFromString(const std::string &name);

/**
 * @brief CVAT name of a label, e.g. "list_item"
 */
std::string labelToString(DocItemLabel label);

/**
 * @brief Parse a content layer name, case-insensitive ("BODY", "furniture")
 */
std::optional<ContentLayer> contentLayerFromString(const std::string &name);

std::string contentLayerToString(ContentLayer layer);

/// Tables are promoted into paths that cross their boundary
bool isTableLabel(DocItemLabel label);

/// Labels whose regions usually enclose other annotated elements. Only used
/// to mark nodes in printed trees; nesting itself comes from geometry.
bool isContainerLabel(DocItemLabel label);

/**
 * @brief A page element drawn as a box in CVAT
 */
struct CVATElement {
  int id = 0;                                     ///< Unique per page
  DocItemLabel label = DocItemLabel::Text;        ///< Element kind
  BoundingBox bbox;                               ///< Axis-aligned box
  ContentLayer contentLayer = ContentLayer::Body; ///< Content layer
  std::optional<double> rotationDeg; ///< Rotation of the drawn box, degrees
  std::optional<BoundingBox> bboxUnrotated; ///< Box as drawn, when rotated
  std::optional<std::string> type;          ///< CVAT "type" attribute
  std::optional<int> level;                 ///< CVAT "level" attribute
  std::map<std::string, std::string> attributes; ///< Remaining attributes
};

/**
 * @brief An ordering or relation path drawn as a polyline in CVAT
 */
struct CVATAnnotationPath {
  int id = 0;                      ///< Unique per page
  std::string label;               ///< e.g. "reading_order", "to_caption"
  std::vector<cv::Point2d> points; ///< Polyline, at least two points
  int level = 1; ///< Nesting depth; 1 is the outermost, page-wide path
  std::map<std::string, std::string> attributes; ///< Remaining attributes
};

/**
 * @brief Build an element, applying the rotation contract of the reader
 *
 * A non-zero rotation stores drawnBox as bboxUnrotated and replaces bbox with
 * the enclosing box of the rotated rectangle. Zero rotation keeps drawnBox.
 */
CVATElement makeElement(int id, DocItemLabel label,
                        const BoundingBox &drawnBox,
                        ContentLayer contentLayer = ContentLayer::Body,
                        double rotationDeg = 0.0);

} // namespace cvat

#endif // CVAT_MODELS_HPP
