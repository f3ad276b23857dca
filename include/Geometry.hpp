#ifndef CVAT_GEOMETRY_HPP
#define CVAT_GEOMETRY_HPP

#include <opencv2/core.hpp>

#include <array>
#include <vector>

namespace cvat {

/**
 * @brief Origin convention of page coordinates
 */
enum class CoordOrigin {
  TopLeft,   ///< y grows downwards (image coordinates, CVAT)
  BottomLeft ///< y grows upwards (PDF coordinates)
};

/**
 * @brief Axis-aligned rectangle in page coordinates
 *
 * With CoordOrigin::TopLeft the top edge has the smaller y (t <= b). With
 * CoordOrigin::BottomLeft the top edge has the larger y (t >= b).
 */
struct BoundingBox {
  double l = 0.0; ///< Left edge
  double t = 0.0; ///< Top edge
  double r = 0.0; ///< Right edge
  double b = 0.0; ///< Bottom edge
  CoordOrigin coordOrigin = CoordOrigin::TopLeft; ///< Origin convention

  BoundingBox() = default;
  BoundingBox(double left, double top, double right, double bottom,
              CoordOrigin origin = CoordOrigin::TopLeft)
      : l(left), t(top), r(right), b(bottom), coordOrigin(origin) {}

  double width() const { return r - l; }
  double height() const {
    return coordOrigin == CoordOrigin::TopLeft ? b - t : t - b;
  }
  double area() const { return width() * height(); }

  cv::Point2d center() const { return {(l + r) / 2.0, (t + b) / 2.0}; }

  /**
   * @brief Corners in the order top-left, top-right, bottom-right,
   * bottom-left
   */
  std::array<cv::Point2d, 4> corners() const;

  /**
   * @brief Grow the box by tolerance on every side (shrink if negative)
   */
  BoundingBox expanded(double tolerance) const;

  /**
   * @brief Check whether a point lies inside the box (edges included)
   */
  bool containsPoint(const cv::Point2d &point) const;

  /**
   * @brief Check whether another box lies inside this one
   * @param other Box to test, in the same origin convention
   * @param tolerance Amount in page units by which other may stick out
   */
  bool contains(const BoundingBox &other, double tolerance = 0.0) const;

  /**
   * @brief Convert to an OpenCV rectangle with top-left semantics
   *
   * For BottomLeft boxes y is the bottom edge, as in the PDF convention.
   */
  cv::Rect2d toRect() const;

  /**
   * @brief Re-express the box in the TopLeft convention
   * @param pageHeight Height of the page the box belongs to
   */
  BoundingBox toTopLeftOrigin(double pageHeight) const;

  /**
   * @brief Re-express the box in the BottomLeft convention
   * @param pageHeight Height of the page the box belongs to
   */
  BoundingBox toBottomLeftOrigin(double pageHeight) const;

  /**
   * @brief Sort key that grows towards the bottom of the page
   */
  double topKey() const { return coordOrigin == CoordOrigin::TopLeft ? t : -t; }

  bool operator==(const BoundingBox &other) const {
    return l == other.l && t == other.t && r == other.r && b == other.b &&
           coordOrigin == other.coordOrigin;
  }
  bool operator!=(const BoundingBox &other) const { return !(*this == other); }
};

/**
 * @brief Compute the axis-aligned box enclosing a rotated rectangle
 *
 * The rectangle is rotated about its center by rotationDeg degrees, clockwise
 * as seen on the page (the CVAT convention), and the minimal axis-aligned
 * box around the rotated corners is returned in the input's origin
 * convention. Multiples of 360 degrees return the input unchanged.
 *
 * @param bbox Rectangle as drawn
 * @param rotationDeg Rotation in degrees, any real value
 * @return Enclosing axis-aligned bounding box
 */
BoundingBox bboxEnclosingRotatedRect(const BoundingBox &bbox,
                                     double rotationDeg);

/**
 * @brief Check whether every point of a polyline lies inside a box
 */
bool polylineInside(const std::vector<cv::Point2d> &points,
                    const BoundingBox &bbox);

} // namespace cvat

#endif // CVAT_GEOMETRY_HPP
