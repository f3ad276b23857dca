#include "CVATModels.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace cvat {

namespace {

const std::pair<DocItemLabel, const char *> kLabelNames[] = {
    {DocItemLabel::Caption, "caption"},
    {DocItemLabel::Chart, "chart"},
    {DocItemLabel::CheckboxSelected, "checkbox_selected"},
    {DocItemLabel::CheckboxUnselected, "checkbox_unselected"},
    {DocItemLabel::Code, "code"},
    {DocItemLabel::DocumentIndex, "document_index"},
    {DocItemLabel::EmptyValue, "empty_value"},
    {DocItemLabel::Footnote, "footnote"},
    {DocItemLabel::Form, "form"},
    {DocItemLabel::Formula, "formula"},
    {DocItemLabel::GradingScale, "grading_scale"},
    {DocItemLabel::HandwrittenText, "handwritten_text"},
    {DocItemLabel::KeyValueRegion, "key_value_region"},
    {DocItemLabel::ListItem, "list_item"},
    {DocItemLabel::PageFooter, "page_footer"},
    {DocItemLabel::PageHeader, "page_header"},
    {DocItemLabel::Paragraph, "paragraph"},
    {DocItemLabel::Picture, "picture"},
    {DocItemLabel::Reference, "reference"},
    {DocItemLabel::SectionHeader, "section_header"},
    {DocItemLabel::Table, "table"},
    {DocItemLabel::Text, "text"},
    {DocItemLabel::Title, "title"},
};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // anonymous namespace

std::optional<DocItemLabel> labelFromString(const std::string &name) {
  std::string key = toLower(name);
  for (const auto &entry : kLabelNames) {
    if (key == entry.second)
      return entry.first;
  }
  return std::nullopt;
}

std::string labelToString(DocItemLabel label) {
  for (const auto &entry : kLabelNames) {
    if (entry.first == label)
      return entry.second;
  }
  return "text";
}

std::optional<ContentLayer> contentLayerFromString(const std::string &name) {
  std::string key = toLower(name);
  if (key == "body")
    return ContentLayer::Body;
  if (key == "furniture")
    return ContentLayer::Furniture;
  if (key == "background")
    return ContentLayer::Background;
  if (key == "invisible")
    return ContentLayer::Invisible;
  if (key == "notes")
    return ContentLayer::Notes;
  return std::nullopt;
}

std::string contentLayerToString(ContentLayer layer) {
  switch (layer) {
  case ContentLayer::Body:
    return "BODY";
  case ContentLayer::Furniture:
    return "FURNITURE";
  case ContentLayer::Background:
    return "BACKGROUND";
  case ContentLayer::Invisible:
    return "INVISIBLE";
  case ContentLayer::Notes:
  default:
    return "NOTES";
  }
}

bool isTableLabel(DocItemLabel label) { return label == DocItemLabel::Table; }

bool isContainerLabel(DocItemLabel label) {
  switch (label) {
  case DocItemLabel::Table:
  case DocItemLabel::Form:
  case DocItemLabel::KeyValueRegion:
  case DocItemLabel::Picture:
  case DocItemLabel::Chart:
  case DocItemLabel::DocumentIndex:
    return true;
  default:
    return false;
  }
}

CVATElement makeElement(int id, DocItemLabel label,
                        const BoundingBox &drawnBox,
                        ContentLayer contentLayer, double rotationDeg) {
  CVATElement element;
  element.id = id;
  element.label = label;
  element.contentLayer = contentLayer;

  if (rotationDeg != 0.0) {
    element.rotationDeg = rotationDeg;
    element.bboxUnrotated = drawnBox;
    element.bbox = bboxEnclosingRotatedRect(drawnBox, rotationDeg);
  } else {
    element.bbox = drawnBox;
  }
  return element;
}

} // namespace cvat
