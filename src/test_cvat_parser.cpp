#include "CVATParser.hpp"
#include "ReadingOrder.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

int failures = 0;

void check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
  if (!condition)
    failures++;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

const char *kRotatedPage = R"(<?xml version="1.0" encoding="UTF-8"?>
<annotations>
  <image id="1" name="page.png" width="100" height="100">
    <box label="text" source="" occluded="0" xtl="30" ytl="10" xbr="70" ybr="90" rotation="90.0" z_order="0">
      <attribute name="content_layer">BODY</attribute>
    </box>
  </image>
</annotations>
)";

const char *kMixedPage = R"(<?xml version="1.0" encoding="UTF-8"?>
<annotations>
  <version>1.1</version>
  <image id="0" name="page_000.png" width="200" height="300">
    <box label="page_header" xtl="0" ytl="0" xbr="200" ybr="20">
      <attribute name="content_layer">furniture</attribute>
    </box>
    <box label="table" xtl="0" ytl="40" xbr="200" ybr="140">
      <attribute name="content_layer">BODY</attribute>
      <attribute name="type">bordered</attribute>
    </box>
    <box label="text" xtl="10" ytl="50" xbr="90" ybr="70"/>
    <box label="text" xtl="110" ytl="50" xbr="190" ybr="70"/>
    <box label="doodle" xtl="0" ytl="0" xbr="10" ybr="10"/>
    <box label="text" xtl="50" ytl="50" xbr="40" ybr="60"/>
    <box label="section_header" xtl="0" ytl="160" xbr="200" ybr="190">
      <attribute name="level">2</attribute>
    </box>
    <polyline label="reading_order" points="100.0,10.0;50.0,60.0;100.0,175.0">
      <attribute name="level">1</attribute>
    </polyline>
    <polyline label="reading_order" points="150,60;50,60">
      <attribute name="level">2</attribute>
    </polyline>
    <polyline label="reading_order" points="5,5"/>
    <polyline label="to_caption" points="5,5;6,6"/>
  </image>
  <image id="1" name="page_001.png" width="200" height="300"/>
</annotations>
)";

const char *kNonFinitePage = R"(<?xml version="1.0" encoding="UTF-8"?>
<annotations>
  <image id="0" name="page.png" width="100" height="100">
    <box label="text" xtl="nan" ytl="10" xbr="50" ybr="20"/>
    <box label="text" xtl="0" ytl="inf" xbr="50" ybr="inf"/>
    <box label="text" xtl="0" ytl="30" xbr="50" ybr="40"/>
    <polyline label="reading_order" points="inf,1;2,2"/>
    <points label="reading_order" points="1,1;5,5"/>
  </image>
</annotations>
)";

void testRotatedBox() {
  std::cout << "--- rotated box ---" << std::endl;
  cvat::CVATParseResult parsed = cvat::parseCVATString(kRotatedPage);
  check(parsed.success, "file parses");

  const cvat::CVATImageAnnotation *image = parsed.getImage("page.png");
  check(image && image->elements.size() == 1, "one element on the page");
  if (!image || image->elements.empty())
    return;

  const cvat::CVATElement &elem = image->elements[0];
  check(elem.rotationDeg && *elem.rotationDeg == 90.0, "rotation preserved");
  check(elem.bboxUnrotated &&
            *elem.bboxUnrotated == cvat::BoundingBox(30, 10, 70, 90),
        "drawn box kept as unrotated");
  check(elem.bbox.coordOrigin == cvat::CoordOrigin::TopLeft &&
            near(elem.bbox.l, 10.0) && near(elem.bbox.t, 30.0) &&
            near(elem.bbox.r, 90.0) && near(elem.bbox.b, 70.0),
        "bbox is the enclosing box of the rotated rectangle");
}

void testMixedPage() {
  std::cout << "--- boxes, polylines and bad records ---" << std::endl;
  cvat::CVATParseResult parsed = cvat::parseCVATString(kMixedPage);
  check(parsed.success, "file parses");
  check(parsed.images.size() == 2, "both images read");

  for (const auto &warning : parsed.warnings) {
    std::cout << "  Warning: " << warning << std::endl;
  }
  check(parsed.warnings.size() == 3,
        "unknown label, inverted box and short polyline reported");

  const cvat::CVATImageAnnotation *image = parsed.getImage("page_000.png");
  check(image != nullptr && parsed.getImage("missing.png") == nullptr,
        "images looked up by name");
  if (!image)
    return;

  check(image->width == 200 && image->height == 300, "image size read");
  check(image->elements.size() == 5, "valid boxes kept");
  check(image->paths.size() == 3, "valid polylines kept");

  const cvat::CVATElement &header = image->elements[0];
  check(header.id == 0 && header.label == cvat::DocItemLabel::PageHeader &&
            header.contentLayer == cvat::ContentLayer::Furniture,
        "content layer read case-insensitively");
  check(!header.rotationDeg && !header.bboxUnrotated,
        "unrotated box has no unrotated copy");

  const cvat::CVATElement &table = image->elements[1];
  check(table.label == cvat::DocItemLabel::Table && table.type &&
            *table.type == "bordered" && table.attributes.empty(),
        "type attribute carried");

  const cvat::CVATElement &heading = image->elements[4];
  check(heading.id == 4 && heading.level && *heading.level == 2,
        "ids are dense after skipped boxes");

  check(image->paths[0].level == 1 && image->paths[1].level == 2 &&
            image->paths[2].label == "to_caption",
        "path levels and labels read");
  check(image->paths[0].points.size() == 3 &&
            near(image->paths[0].points[1].x, 50.0) &&
            near(image->paths[0].points[1].y, 60.0),
        "points parsed");

  cvat::ReadingOrderResult result =
      cvat::resolvePageReadingOrder(image->elements, image->paths);
  check(result.success && result.globalOrder == std::vector<int>({0, 1, 3, 2, 4}),
        "page resolves to header, table, cells by nested path, heading");
}

void testNonFiniteAndPointShapes() {
  std::cout << "--- non-finite numbers and point shapes ---" << std::endl;
  cvat::CVATParseResult parsed = cvat::parseCVATString(kNonFinitePage);
  check(parsed.success, "file parses");

  for (const auto &warning : parsed.warnings) {
    std::cout << "  Warning: " << warning << std::endl;
  }
  check(parsed.warnings.size() == 3,
        "nan box, inf box and inf point reported");

  const cvat::CVATImageAnnotation *image = parsed.getImage("page.png");
  if (!image)
    return;

  check(image->elements.size() == 1 && image->elements[0].id == 0 &&
            image->elements[0].bbox == cvat::BoundingBox(0, 30, 50, 40),
        "only the finite box is kept");
  check(image->paths.size() == 1 && image->paths[0].id == 0 &&
            image->paths[0].label == "reading_order" &&
            image->paths[0].points.size() == 2,
        "<points> shape read as a path");
}

void testFileErrors() {
  std::cout << "--- file handling ---" << std::endl;
  namespace fs = std::filesystem;

  fs::path xmlPath = fs::temp_directory_path() / "cvat_reading_order_test.xml";
  {
    std::ofstream out(xmlPath);
    out << kRotatedPage;
  }
  cvat::CVATParseResult fromFile = cvat::parseCVATFile(xmlPath.string());
  check(fromFile.success && fromFile.images.size() == 1, "file read from disk");
  std::error_code ec;
  fs::remove(xmlPath, ec);

  cvat::CVATParseResult missing =
      cvat::parseCVATFile("/nonexistent/annotations.xml");
  check(!missing.success && !missing.errorMessage.empty(),
        "missing file reported");

  cvat::CVATParseResult wrongRoot =
      cvat::parseCVATString("<?xml version=\"1.0\"?><page/>");
  check(!wrongRoot.success, "unexpected root element reported");

  cvat::CVATParseResult truncated =
      cvat::parseCVATString("<?xml version=\"1.0\"?><annotations><image");
  std::cout << "  Error: " << truncated.errorMessage << std::endl;
  check(!truncated.success &&
            truncated.errorMessage.rfind("Failed to parse XML: ", 0) == 0,
        "malformed XML reported through the result");
}

} // namespace

int main() {
  std::cout << "=== Test CVAT parser ===" << std::endl << std::endl;

  testRotatedBox();
  testMixedPage();
  testNonFiniteAndPointShapes();
  testFileErrors();

  std::cout << std::endl
            << (failures == 0 ? "All checks passed" : "Some checks FAILED")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
