#include "calibration/camera_position.h"

#include <cmath>

namespace calibration {

Status CameraPositionModel::set(CameraEdge edge, double distance,
                                double height) {
  if (!std::isfinite(distance) || distance <= 0.0) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "camera distance must be positive");
  }
  if (!std::isfinite(height) || height <= 0.0) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "camera height must be positive");
  }
  guess_.edge = edge;
  guess_.distance = distance;
  guess_.height = height;
  is_set_ = true;
  return Status::Ok();
}

Status CameraPositionModel::set(const std::string& edge, double distance,
                                double height) {
  CameraEdge parsed;
  if (!ParseCameraEdge(edge, &parsed)) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "unknown camera edge: " + edge);
  }
  return set(parsed, distance, height);
}

cv::Point3d CameraPositionModel::estimatedPosition(
    const CourtModel& court) const {
  const double cx = court.width * 0.5;
  const double cy = court.length * 0.5;
  switch (guess_.edge) {
    case CameraEdge::kTop:
      return cv::Point3d(cx, court.length + guess_.distance, guess_.height);
    case CameraEdge::kLeft:
      return cv::Point3d(-guess_.distance, cy, guess_.height);
    case CameraEdge::kRight:
      return cv::Point3d(court.width + guess_.distance, cy, guess_.height);
    case CameraEdge::kBottom:
    default:
      return cv::Point3d(cx, -guess_.distance, guess_.height);
  }
}

double CameraPositionModel::viewingAngleDeg(const CourtModel& court) const {
  const cv::Point3d pos = estimatedPosition(court);
  const double dx = court.width * 0.5 - pos.x;
  const double dy = court.length * 0.5 - pos.y;
  const double ground = std::sqrt(dx * dx + dy * dy);
  if (ground <= 0.0) return 90.0;
  return std::atan2(pos.z, ground) * 180.0 / CV_PI;
}

double CameraPositionModel::lineWeight(LineAxis axis) const {
  if (!is_set_) return 1.0;
  const bool along = axis == LineAxis::kAlongLength;
  return along == looksAlongLength() ? kAlignedLineWeight : 1.0;
}

ImageOrientation CameraPositionModel::expectedOrientation(LineAxis axis) const {
  // 沿视轴方向的线在画面中竖直，垂直视轴的线水平。
  const bool along = axis == LineAxis::kAlongLength;
  return along == looksAlongLength() ? ImageOrientation::kVertical
                                     : ImageOrientation::kHorizontal;
}

bool CameraPositionModel::looksAlongLength() const {
  return guess_.edge == CameraEdge::kTop || guess_.edge == CameraEdge::kBottom;
}

bool ParseCameraEdge(const std::string& name, CameraEdge* out_edge) {
  if (!out_edge) return false;
  if (name == "top") {
    *out_edge = CameraEdge::kTop;
  } else if (name == "bottom") {
    *out_edge = CameraEdge::kBottom;
  } else if (name == "left") {
    *out_edge = CameraEdge::kLeft;
  } else if (name == "right") {
    *out_edge = CameraEdge::kRight;
  } else {
    return false;
  }
  return true;
}

const char* CameraEdgeName(CameraEdge edge) {
  switch (edge) {
    case CameraEdge::kTop:
      return "top";
    case CameraEdge::kLeft:
      return "left";
    case CameraEdge::kRight:
      return "right";
    case CameraEdge::kBottom:
    default:
      return "bottom";
  }
}

const char* OrientationName(ImageOrientation orientation) {
  switch (orientation) {
    case ImageOrientation::kHorizontal:
      return "horizontal";
    case ImageOrientation::kVertical:
      return "vertical";
    case ImageOrientation::kDiagonal:
    default:
      return "diagonal";
  }
}

}  // namespace calibration
