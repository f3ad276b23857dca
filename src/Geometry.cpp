#include "Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

// Define M_PI if not already defined (Windows)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cvat {

std::array<cv::Point2d, 4> BoundingBox::corners() const {
  return {cv::Point2d(l, t), cv::Point2d(r, t), cv::Point2d(r, b),
          cv::Point2d(l, b)};
}

BoundingBox BoundingBox::expanded(double tolerance) const {
  if (coordOrigin == CoordOrigin::TopLeft) {
    return BoundingBox(l - tolerance, t - tolerance, r + tolerance,
                       b + tolerance, coordOrigin);
  }
  return BoundingBox(l - tolerance, t + tolerance, r + tolerance,
                     b - tolerance, coordOrigin);
}

bool BoundingBox::containsPoint(const cv::Point2d &point) const {
  if (point.x < l || point.x > r)
    return false;

  double minY = std::min(t, b);
  double maxY = std::max(t, b);
  return point.y >= minY && point.y <= maxY;
}

bool BoundingBox::contains(const BoundingBox &other, double tolerance) const {
  BoundingBox outer = expanded(tolerance);
  if (other.l < outer.l || other.r > outer.r)
    return false;

  if (coordOrigin == CoordOrigin::TopLeft) {
    return other.t >= outer.t && other.b <= outer.b;
  }
  return other.t <= outer.t && other.b >= outer.b;
}

cv::Rect2d BoundingBox::toRect() const {
  return cv::Rect2d(l, std::min(t, b), width(), height());
}

BoundingBox BoundingBox::toTopLeftOrigin(double pageHeight) const {
  if (coordOrigin == CoordOrigin::TopLeft)
    return *this;
  return BoundingBox(l, pageHeight - t, r, pageHeight - b,
                     CoordOrigin::TopLeft);
}

BoundingBox BoundingBox::toBottomLeftOrigin(double pageHeight) const {
  if (coordOrigin == CoordOrigin::BottomLeft)
    return *this;
  return BoundingBox(l, pageHeight - t, r, pageHeight - b,
                     CoordOrigin::BottomLeft);
}

BoundingBox bboxEnclosingRotatedRect(const BoundingBox &bbox,
                                     double rotationDeg) {
  // Reduce first so that large angles do not lose precision in cos/sin
  double reduced = std::fmod(rotationDeg, 360.0);
  if (reduced == 0.0)
    return bbox;

  double radians = reduced * M_PI / 180.0;
  double c = std::cos(radians);
  double s = std::sin(radians);

  // Clockwise on the page: with y pointing down this is the usual
  // counterclockwise matrix, with y pointing up the sine terms flip.
  cv::Matx22d rotation;
  if (bbox.coordOrigin == CoordOrigin::TopLeft) {
    rotation = cv::Matx22d(c, -s, s, c);
  } else {
    rotation = cv::Matx22d(c, s, -s, c);
  }

  const cv::Point2d center = bbox.center();
  double minX = std::numeric_limits<double>::max();
  double minY = std::numeric_limits<double>::max();
  double maxX = std::numeric_limits<double>::lowest();
  double maxY = std::numeric_limits<double>::lowest();

  for (const cv::Point2d &corner : bbox.corners()) {
    cv::Vec2d offset(corner.x - center.x, corner.y - center.y);
    cv::Vec2d rotated = rotation * offset;
    double x = center.x + rotated[0];
    double y = center.y + rotated[1];
    minX = std::min(minX, x);
    maxX = std::max(maxX, x);
    minY = std::min(minY, y);
    maxY = std::max(maxY, y);
  }

  if (bbox.coordOrigin == CoordOrigin::TopLeft) {
    return BoundingBox(minX, minY, maxX, maxY, CoordOrigin::TopLeft);
  }
  return BoundingBox(minX, maxY, maxX, minY, CoordOrigin::BottomLeft);
}

bool polylineInside(const std::vector<cv::Point2d> &points,
                    const BoundingBox &bbox) {
  return std::all_of(points.begin(), points.end(),
                     [&bbox](const cv::Point2d &p) {
                       return bbox.containsPoint(p);
                     });
}

} // namespace cvat
