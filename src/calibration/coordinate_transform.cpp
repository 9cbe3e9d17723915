#include "calibration/coordinate_transform.h"

#include <cmath>
#include <limits>
#include <utility>

namespace calibration {

namespace {

Status Transform(const std::shared_ptr<const Homography>& homography,
                 bool forward, const cv::Point2d& in, cv::Point2d* out) {
  if (!homography) {
    return Status::Error(ErrorCode::kNotCalibrated,
                         "no calibration available yet");
  }
  if (!out) return Status::Error(ErrorCode::kInvalidInput, "null output");
  if (!std::isfinite(in.x) || !std::isfinite(in.y)) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "point coordinates must be finite");
  }
  const cv::Matx33d& h =
      forward ? homography->image_to_world : homography->world_to_image;
  if (!ApplyHomography(h, in, out)) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "point lies on the horizon line");
  }
  return Status::Ok();
}

}  // namespace

void CoordinateTransformService::publish(
    std::shared_ptr<const Homography> homography) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(homography);
}

void CoordinateTransformService::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  current_.reset();
}

bool CoordinateTransformService::isCalibrated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_ != nullptr;
}

std::shared_ptr<const Homography> CoordinateTransformService::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

Status CoordinateTransformService::imageToWorld(const cv::Point2d& image_point,
                                                cv::Point2d* out_world) const {
  return Transform(current(), true, image_point, out_world);
}

Status CoordinateTransformService::worldToImage(const cv::Point2d& world_point,
                                                cv::Point2d* out_image) const {
  return Transform(current(), false, world_point, out_image);
}

Status CoordinateTransformService::batchTransform(
    const std::vector<cv::Point2d>& image_points,
    std::vector<cv::Point2d>* out_world) const {
  if (!out_world) return Status::Error(ErrorCode::kInvalidInput, "null output");
  // 整批只取一次快照，避免中途被替换。
  const std::shared_ptr<const Homography> snapshot = current();
  if (!snapshot) {
    return Status::Error(ErrorCode::kNotCalibrated,
                         "no calibration available yet");
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<cv::Point2d> result;
  result.reserve(image_points.size());
  for (const auto& p : image_points) {
    cv::Point2d world;
    if (Transform(snapshot, true, p, &world).ok()) {
      result.push_back(world);
    } else {
      result.emplace_back(nan, nan);
    }
  }
  *out_world = std::move(result);
  return Status::Ok();
}

}  // namespace calibration
