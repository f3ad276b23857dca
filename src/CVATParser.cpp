#include "CVATParser.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <cmath>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cvat {

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

bool isElement(const xmlNode *node, const char *name) {
  return node->type == XML_ELEMENT_NODE &&
         xmlStrcmp(node->name, reinterpret_cast<const xmlChar *>(name)) == 0;
}

std::optional<std::string> getAttr(const xmlNode *node, const char *name) {
  xmlChar *attr = xmlGetProp(node, reinterpret_cast<const xmlChar *>(name));
  if (attr == nullptr)
    return std::nullopt;

  std::string value(reinterpret_cast<const char *>(attr));
  xmlFree(attr);
  return value;
}

std::string getContent(const xmlNode *node) {
  xmlChar *content = xmlNodeGetContent(node);
  if (content == nullptr)
    return "";

  std::string value(reinterpret_cast<const char *>(content));
  xmlFree(content);

  // Trim surrounding whitespace
  const char *blanks = " \t\r\n";
  size_t begin = value.find_first_not_of(blanks);
  if (begin == std::string::npos)
    return "";
  size_t end = value.find_last_not_of(blanks);
  return value.substr(begin, end - begin + 1);
}

double requireNumber(const xmlNode *node, const char *name) {
  std::optional<std::string> value = getAttr(node, name);
  if (!value)
    throw std::invalid_argument(std::string("missing attribute ") + name);

  size_t consumed = 0;
  double number = std::stod(*value, &consumed);
  if (consumed != value->size())
    throw std::invalid_argument(std::string("bad number in ") + name);
  if (!std::isfinite(number))
    throw std::invalid_argument(std::string("non-finite number in ") + name);
  return number;
}

// <attribute name="...">value</attribute> children of a shape
std::map<std::string, std::string> readShapeAttributes(const xmlNode *shape) {
  std::map<std::string, std::string> attributes;
  for (const xmlNode *child = shape->children; child; child = child->next) {
    if (!isElement(child, "attribute"))
      continue;

    std::optional<std::string> name = getAttr(child, "name");
    if (name)
      attributes[*name] = getContent(child);
  }
  return attributes;
}

std::vector<cv::Point2d> parsePoints(const std::string &text) {
  std::vector<cv::Point2d> points;
  std::stringstream pairs(text);
  std::string pair;
  while (std::getline(pairs, pair, ';')) {
    size_t comma = pair.find(',');
    if (comma == std::string::npos)
      throw std::invalid_argument("bad point \"" + pair + "\"");
    double x = std::stod(pair.substr(0, comma));
    double y = std::stod(pair.substr(comma + 1));
    if (!std::isfinite(x) || !std::isfinite(y))
      throw std::invalid_argument("non-finite point \"" + pair + "\"");
    points.emplace_back(x, y);
  }
  return points;
}

std::string describe(const CVATImageAnnotation &image, const char *shape,
                     int index) {
  return "image \"" + image.name + "\" " + shape + " #" +
         std::to_string(index);
}

void readBox(const xmlNode *node, CVATImageAnnotation &image, int index,
             CVATParseResult &result) {
  std::string labelName = getAttr(node, "label").value_or("");
  std::optional<DocItemLabel> label = labelFromString(labelName);
  if (!label) {
    result.warnings.push_back(describe(image, "box", index) +
                              ": unknown label \"" + labelName + "\"");
    return;
  }

  BoundingBox drawn;
  double rotation = 0.0;
  try {
    drawn = BoundingBox(requireNumber(node, "xtl"), requireNumber(node, "ytl"),
                        requireNumber(node, "xbr"), requireNumber(node, "ybr"),
                        CoordOrigin::TopLeft);
    if (getAttr(node, "rotation"))
      rotation = requireNumber(node, "rotation");
  } catch (const std::exception &e) {
    result.warnings.push_back(describe(image, "box", index) + ": " +
                              e.what());
    return;
  }

  if (drawn.width() <= 0.0 || drawn.height() <= 0.0) {
    result.warnings.push_back(describe(image, "box", index) +
                              ": non-positive extent");
    return;
  }

  std::map<std::string, std::string> attributes = readShapeAttributes(node);

  ContentLayer layer = ContentLayer::Body;
  auto layerIt = attributes.find("content_layer");
  if (layerIt != attributes.end()) {
    std::optional<ContentLayer> parsed = contentLayerFromString(layerIt->second);
    if (parsed) {
      layer = *parsed;
    } else {
      result.warnings.push_back(describe(image, "box", index) +
                                ": unknown content layer \"" +
                                layerIt->second + "\", using BODY");
    }
    attributes.erase(layerIt);
  }

  CVATElement element = makeElement(static_cast<int>(image.elements.size()),
                                    *label, drawn, layer, rotation);

  auto typeIt = attributes.find("type");
  if (typeIt != attributes.end()) {
    if (!typeIt->second.empty())
      element.type = typeIt->second;
    attributes.erase(typeIt);
  }

  auto levelIt = attributes.find("level");
  if (levelIt != attributes.end()) {
    try {
      if (!levelIt->second.empty())
        element.level = std::stoi(levelIt->second);
    } catch (const std::exception &) {
      result.warnings.push_back(describe(image, "box", index) +
                                ": ignoring level \"" + levelIt->second +
                                "\"");
    }
    attributes.erase(levelIt);
  }

  element.attributes = attributes;
  image.elements.push_back(element);
}

// <polyline> and <points> shapes both carry an ordered point list
void readPolyline(const xmlNode *node, CVATImageAnnotation &image, int index,
                  CVATParseResult &result) {
  const char *shape = reinterpret_cast<const char *>(node->name);
  CVATAnnotationPath path;
  path.id = static_cast<int>(image.paths.size());
  path.label = getAttr(node, "label").value_or("");

  try {
    path.points = parsePoints(getAttr(node, "points").value_or(""));
  } catch (const std::exception &e) {
    result.warnings.push_back(describe(image, shape, index) + ": " +
                              e.what());
    return;
  }

  if (path.points.size() < 2) {
    result.warnings.push_back(describe(image, shape, index) +
                              ": fewer than two points");
    return;
  }

  path.attributes = readShapeAttributes(node);
  auto levelIt = path.attributes.find("level");
  if (levelIt != path.attributes.end()) {
    try {
      if (!levelIt->second.empty())
        path.level = std::stoi(levelIt->second);
    } catch (const std::exception &) {
      result.warnings.push_back(describe(image, shape, index) +
                                ": ignoring level \"" + levelIt->second +
                                "\"");
    }
    path.attributes.erase(levelIt);
  }

  image.paths.push_back(path);
}

CVATImageAnnotation readImage(const xmlNode *node, CVATParseResult &result) {
  CVATImageAnnotation image;
  image.name = getAttr(node, "name").value_or("");
  try {
    image.id = static_cast<int>(requireNumber(node, "id"));
    image.width = static_cast<int>(requireNumber(node, "width"));
    image.height = static_cast<int>(requireNumber(node, "height"));
  } catch (const std::exception &e) {
    result.warnings.push_back("image \"" + image.name + "\": " + e.what());
  }

  int boxIndex = 0;
  int polylineIndex = 0;
  for (const xmlNode *child = node->children; child; child = child->next) {
    if (isElement(child, "box")) {
      readBox(child, image, boxIndex++, result);
    } else if (isElement(child, "polyline") || isElement(child, "points")) {
      readPolyline(child, image, polylineIndex++, result);
    }
  }
  return image;
}

// Message of the last libxml2 error, e.g. "line 3: Premature end of data"
std::string lastXmlError() {
  const xmlError *error = xmlGetLastError();
  if (error == nullptr || error->message == nullptr)
    return "unknown error";

  std::string message(error->message);
  while (!message.empty() &&
         (message.back() == '\n' || message.back() == ' ')) {
    message.pop_back();
  }
  if (error->line > 0)
    return "line " + std::to_string(error->line) + ": " + message;
  return message;
}

CVATParseResult parseDocument(XmlDocPtr doc) {
  CVATParseResult result;
  result.success = false;

  if (!doc) {
    result.errorMessage = "Failed to parse XML: " + lastXmlError();
    return result;
  }

  const xmlNode *root = xmlDocGetRootElement(doc.get());
  if (root == nullptr || !isElement(root, "annotations")) {
    result.errorMessage = "Missing <annotations> root element";
    return result;
  }

  try {
    for (const xmlNode *child = root->children; child; child = child->next) {
      if (isElement(child, "image"))
        result.images.push_back(readImage(child, result));
    }
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Failed to read annotations: ") +
                          e.what();
  }

  return result;
}

// Errors are reported through CVATParseResult, not libxml2's stderr handler
const int kParseOptions =
    XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR |
    XML_PARSE_NOWARNING;

} // anonymous namespace

const CVATImageAnnotation *
CVATParseResult::getImage(const std::string &name) const {
  for (const auto &image : images) {
    if (image.name == name)
      return &image;
  }
  return nullptr;
}

CVATParseResult parseCVATFile(const std::string &xmlPath) {
  xmlResetLastError();
  XmlDocPtr doc(xmlReadFile(xmlPath.c_str(), nullptr, kParseOptions),
                &xmlFreeDoc);
  if (!doc) {
    CVATParseResult result;
    result.errorMessage =
        "Failed to load annotations: " + xmlPath + " (" + lastXmlError() + ")";
    return result;
  }
  return parseDocument(std::move(doc));
}

CVATParseResult parseCVATString(const std::string &xml) {
  if (xml.size() > static_cast<size_t>(INT_MAX)) {
    CVATParseResult result;
    result.errorMessage = "Annotation document too large";
    return result;
  }

  xmlResetLastError();
  XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                              "annotations.xml", nullptr, kParseOptions),
                &xmlFreeDoc);
  return parseDocument(std::move(doc));
}

} // namespace cvat
