#include "CVATParser.hpp"
#include "ContainmentTree.hpp"
#include "ReadingOrder.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <annotations.xml> [options]\n"
      << "\nOptions:\n"
      << "  -i, --image <name>      Only process the named image\n"
      << "  -t, --tolerance <val>   Table crossing tolerance (default: 2)\n"
      << "  -c, --containment <val> Containment tolerance (default: 1)\n"
      << "      --no-conflicts      Skip multi-level conflict resolution\n"
      << "      --no-promotion      Skip table cross-boundary promotion\n"
      << "      --tree              Print the containment tree\n"
      << "  -d, --debug             Print diagnostics to stderr\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " annotations.xml\n"
      << "  " << programName << " annotations.xml -i page_001.png --tree\n";
}

std::string formatBox(const cvat::BoundingBox &bbox) {
  std::ostringstream text;
  text << std::fixed << std::setprecision(1) << "(" << bbox.l << "," << bbox.t
       << "," << bbox.r << "," << bbox.b << ")";
  return text.str();
}

void printTree(const std::vector<cvat::TreeNode> &nodes, int depth) {
  for (const auto &node : nodes) {
    std::cout << std::string(depth * 2 + 2, ' ') << node.id() << " "
              << cvat::labelToString(node.element.label);
    if (cvat::isContainerLabel(node.element.label))
      std::cout << " [container]";
    std::cout << " " << formatBox(node.element.bbox) << "\n";
    printTree(node.children, depth + 1);
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string xmlPath;
  std::string imageName;
  cvat::ReadingOrderConfig config;
  bool showTree = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    try {
      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-i" || arg == "--image") {
        if (i + 1 < argc) {
          imageName = argv[++i];
        } else {
          std::cerr << "Error: --image requires an argument\n";
          return 1;
        }
      } else if (arg == "-t" || arg == "--tolerance") {
        if (i + 1 < argc) {
          config.tableCrossingTolerance = std::stod(argv[++i]);
        } else {
          std::cerr << "Error: --tolerance requires an argument\n";
          return 1;
        }
      } else if (arg == "-c" || arg == "--containment") {
        if (i + 1 < argc) {
          config.containmentTolerance = std::stod(argv[++i]);
        } else {
          std::cerr << "Error: --containment requires an argument\n";
          return 1;
        }
      } else if (arg == "--no-conflicts") {
        config.resolveConflicts = false;
      } else if (arg == "--no-promotion") {
        config.promoteTables = false;
      } else if (arg == "--tree") {
        showTree = true;
      } else if (arg == "-d" || arg == "--debug") {
        config.debug = true;
      } else if (arg[0] != '-') {
        xmlPath = arg;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    } catch (const std::exception &e) {
      std::cerr << "Error: invalid value for " << arg << " (" << e.what()
                << ")\n";
      return 1;
    }
  }

  if (xmlPath.empty()) {
    std::cerr << "Error: No annotation file provided\n";
    printUsage(argv[0]);
    return 1;
  }

  std::cout << "=== CVAT Reading Order ===\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Annotations: " << xmlPath << "\n"
            << "==========================\n\n";

  cvat::CVATParseResult parsed = cvat::parseCVATFile(xmlPath);
  if (!parsed.success) {
    std::cerr << "Error: " << parsed.errorMessage << "\n";
    return 1;
  }

  for (const auto &warning : parsed.warnings) {
    std::cerr << "Warning: " << warning << "\n";
  }

  bool found = false;
  for (const auto &image : parsed.images) {
    if (!imageName.empty() && image.name != imageName)
      continue;
    found = true;

    std::cout << "[" << image.name << "] " << image.elements.size()
              << " elements, " << image.paths.size() << " paths\n";
    std::cout << "-------------------------------------------\n";

    if (showTree) {
      std::cout << "Containment tree:\n";
      printTree(cvat::buildContainmentTree(image.elements,
                                           config.containmentTolerance),
                0);
      std::cout << "\n";
    }

    cvat::ReadingOrderResult result =
        cvat::resolvePageReadingOrder(image.elements, image.paths, config);
    if (!result.success) {
      std::cerr << "Error: " << image.name << ": " << result.errorMessage
                << "\n";
      return 1;
    }

    std::map<int, const cvat::CVATElement *> byId;
    for (const auto &element : image.elements) {
      byId[element.id] = &element;
    }

    std::cout << std::setw(6) << "No." << std::setw(6) << "Id" << "  "
              << std::setw(18) << std::left << "Label" << std::right
              << "Bounding Box\n";
    std::cout << std::string(60, '-') << "\n";

    for (size_t i = 0; i < result.globalOrder.size(); ++i) {
      const cvat::CVATElement &element = *byId[result.globalOrder[i]];
      std::cout << std::setw(6) << (i + 1) << std::setw(6) << element.id
                << "  " << std::setw(18) << std::left
                << cvat::labelToString(element.label) << std::right
                << formatBox(element.bbox);
      if (element.rotationDeg)
        std::cout << "  rot=" << *element.rotationDeg;
      std::cout << "\n";
    }

    std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
              << result.processingTimeMs << " ms\n\n";
    std::cout.unsetf(std::ios::fixed);
  }

  if (!imageName.empty() && !found) {
    std::cerr << "Error: image not found: " << imageName << "\n";
    return 1;
  }

  return 0;
}
