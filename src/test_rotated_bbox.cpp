#include "CVATModels.hpp"
#include "Geometry.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

namespace {

int failures = 0;

void check(bool condition, const std::string &what) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
  if (!condition)
    failures++;
}

bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

void printBox(const char *name, const cvat::BoundingBox &bbox) {
  std::cout << "  " << std::setw(10) << std::left << name << std::right
            << "l=" << bbox.l << " t=" << bbox.t << " r=" << bbox.r
            << " b=" << bbox.b << std::endl;
}

} // namespace

int main() {
  std::cout << "=== Test bboxEnclosingRotatedRect ===" << std::endl
            << std::endl;

  // Identity for 0 and any multiple of 360
  cvat::BoundingBox box(10.0, 20.0, 30.0, 60.0, cvat::CoordOrigin::TopLeft);
  check(cvat::bboxEnclosingRotatedRect(box, 0.0) == box, "rotation 0 is identity");
  check(cvat::bboxEnclosingRotatedRect(box, 360.0) == box,
        "rotation 360 is identity");
  check(cvat::bboxEnclosingRotatedRect(box, -720.0) == box,
        "rotation -720 is identity");

  // Center is (50, 50). Width 40 and height 80 become 80 and 40.
  cvat::BoundingBox tall(30.0, 10.0, 70.0, 90.0, cvat::CoordOrigin::TopLeft);
  cvat::BoundingBox rotated = cvat::bboxEnclosingRotatedRect(tall, 90.0);
  printBox("input", tall);
  printBox("rot 90", rotated);
  check(rotated.coordOrigin == cvat::CoordOrigin::TopLeft,
        "rotation keeps the origin convention");
  check(near(rotated.l, 10.0) && near(rotated.r, 90.0) &&
            near(rotated.t, 30.0) && near(rotated.b, 70.0),
        "rotation 90 swaps extents about the center");

  cvat::BoundingBox negative = cvat::bboxEnclosingRotatedRect(tall, -90.0);
  cvat::BoundingBox threeQuarter = cvat::bboxEnclosingRotatedRect(tall, 270.0);
  check(near(negative.l, 10.0) && near(negative.b, 70.0) &&
            near(threeQuarter.l, 10.0) && near(threeQuarter.b, 70.0),
        "rotation -90 and 270 give the same enclosing box");

  // A square turned by 45 degrees grows to its diagonal
  cvat::BoundingBox square(0.0, 0.0, 10.0, 10.0);
  cvat::BoundingBox diamond = cvat::bboxEnclosingRotatedRect(square, 45.0);
  printBox("rot 45", diamond);
  double diagonal = 10.0 * std::sqrt(2.0);
  check(near(diamond.width(), diagonal) && near(diamond.height(), diagonal),
        "rotation 45 of a square spans its diagonal");
  check(near(diamond.center().x, 5.0) && near(diamond.center().y, 5.0),
        "rotation 45 keeps the center");

  // Bottom-left boxes keep t >= b
  cvat::BoundingBox pdfBox(30.0, 90.0, 70.0, 10.0, cvat::CoordOrigin::BottomLeft);
  cvat::BoundingBox pdfRotated = cvat::bboxEnclosingRotatedRect(pdfBox, 90.0);
  printBox("pdf rot", pdfRotated);
  check(pdfRotated.coordOrigin == cvat::CoordOrigin::BottomLeft &&
            near(pdfRotated.l, 10.0) && near(pdfRotated.r, 90.0) &&
            near(pdfRotated.t, 70.0) && near(pdfRotated.b, 30.0),
        "bottom-left rotation 90 swaps extents");

  // Degenerate boxes must not produce NaN
  cvat::BoundingBox point(5.0, 5.0, 5.0, 5.0);
  cvat::BoundingBox rotatedPoint = cvat::bboxEnclosingRotatedRect(point, 33.0);
  check(near(rotatedPoint.l, 5.0) && near(rotatedPoint.b, 5.0),
        "zero-area box stays a point");

  std::cout << std::endl << "=== Test makeElement rotation contract ==="
            << std::endl << std::endl;

  cvat::CVATElement plain = cvat::makeElement(
      1, cvat::DocItemLabel::Text, tall, cvat::ContentLayer::Body, 0.0);
  check(!plain.rotationDeg && !plain.bboxUnrotated && plain.bbox == tall,
        "unrotated element keeps the drawn box");

  cvat::CVATElement turned = cvat::makeElement(
      2, cvat::DocItemLabel::Text, tall, cvat::ContentLayer::Body, 90.0);
  check(turned.rotationDeg && *turned.rotationDeg == 90.0,
        "rotated element records its rotation");
  check(turned.bboxUnrotated && *turned.bboxUnrotated == tall,
        "rotated element keeps the drawn box as unrotated");
  check(near(turned.bbox.l, 10.0) && near(turned.bbox.t, 30.0) &&
            near(turned.bbox.r, 90.0) && near(turned.bbox.b, 70.0),
        "rotated element bbox is the enclosing box");

  std::cout << std::endl
            << (failures == 0 ? "All checks passed" : "Some checks FAILED")
            << std::endl;
  return failures == 0 ? 0 : 1;
}
