#include "analysis/speed_tracker.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace analysis {

namespace {

using calibration::ErrorCode;
using calibration::Status;

// 参与地面锚点的脚部关键点。
const int kFootAnchors[] = {kLeftAnkle, kRightAnkle, kLeftFootIndex,
                            kRightFootIndex};

bool IsFinite(const cv::Point2d& p) {
  return std::isfinite(p.x) && std::isfinite(p.y);
}

// 非脚部关键点的离地高度估计（米）。
double EstimatedHeight(int index) {
  if (index >= kLeftAnkle && index <= kRightFootIndex) return 0.0;
  if (index <= kRightShoulder) return 1.5;  // 头部与肩
  if (index == kLeftHip || index == kRightHip) return 0.9;
  return 0.7;
}

}  // namespace

SpeedTracker::SpeedTracker(
    const calibration::CoordinateTransformService& transforms,
    const SpeedTrackerConfig& config)
    : transforms_(transforms), config_(config) {
  if (config_.smoothing_window < 1) config_.smoothing_window = 1;
}

bool SpeedTracker::isVisible(const std::vector<PoseLandmark>& landmarks,
                             int index) const {
  if (index < 0 || index >= static_cast<int>(landmarks.size())) return false;
  const PoseLandmark& lm = landmarks[index];
  return std::isfinite(lm.x) && std::isfinite(lm.y) &&
         lm.visibility > config_.min_visibility;
}

Status SpeedTracker::update(int frame, double time_sec,
                            const std::vector<PoseLandmark>& landmarks) {
  if (!transforms_.isCalibrated()) {
    return Status::Error(ErrorCode::kNotCalibrated,
                         "speed tracking requires a calibration");
  }
  if (!std::isfinite(time_sec)) {
    return Status::Error(ErrorCode::kInvalidInput, "timestamp must be finite");
  }

  std::vector<cv::Point2d> image_points;
  int right_foot_slot = -1;
  for (int index : kFootAnchors) {
    if (!isVisible(landmarks, index)) continue;
    if (index == kRightFootIndex) {
      right_foot_slot = static_cast<int>(image_points.size());
    }
    image_points.emplace_back(landmarks[index].x, landmarks[index].y);
  }
  if (image_points.empty()) {
    return Status::Error(ErrorCode::kInsufficientData,
                         "no visible foot landmarks");
  }

  std::vector<cv::Point2d> world_points;
  Status status = transforms_.batchTransform(image_points, &world_points);
  if (!status.ok()) return status;

  cv::Point2d anchor(0.0, 0.0);
  int used = 0;
  for (const auto& p : world_points) {
    if (!IsFinite(p)) continue;
    anchor += p;
    ++used;
  }
  if (used == 0) {
    return Status::Error(ErrorCode::kInsufficientData,
                         "foot landmarks could not be projected");
  }
  anchor *= 1.0 / used;

  bool has_right_foot = false;
  cv::Point2d right_foot;
  if (right_foot_slot >= 0 && IsFinite(world_points[right_foot_slot])) {
    has_right_foot = true;
    right_foot = world_points[right_foot_slot];
  }

  if (has_previous_) {
    const double dt = std::max(config_.min_delta_time, time_sec - previous_time_);
    const cv::Point2d delta = anchor - previous_position_;
    const double distance = cv::norm(delta);

    velocity_ = delta * (1.0 / dt);
    current_speed_ = distance / dt;
    total_distance_ += distance;
    right_foot_speed_ =
        (has_right_foot && has_previous_right_foot_)
            ? cv::norm(right_foot - previous_right_foot_) / dt
            : 0.0;

    SpeedSample sample;
    sample.frame = frame;
    sample.time_sec = time_sec;
    sample.speed_mps = current_speed_;
    sample.distance_m = distance;
    samples_.push_back(sample);
    while (static_cast<int>(samples_.size()) > config_.smoothing_window) {
      samples_.pop_front();
    }
  }

  has_previous_ = true;
  previous_frame_ = frame;
  previous_time_ = time_sec;
  previous_position_ = anchor;
  has_previous_right_foot_ = has_right_foot;
  if (has_right_foot) previous_right_foot_ = right_foot;
  return Status::Ok();
}

SpeedMetrics SpeedTracker::metrics() const {
  SpeedMetrics m;
  if (!has_previous_ || !transforms_.isCalibrated()) return m;

  m.valid = true;
  m.current_speed_mps = current_speed_;
  m.velocity = velocity_;
  m.right_foot_speed_mps = right_foot_speed_;
  m.total_distance_m = total_distance_;
  m.court_position = previous_position_;
  m.frame = previous_frame_;
  m.samples.assign(samples_.begin(), samples_.end());
  if (!samples_.empty()) {
    double sum = 0.0;
    for (const auto& s : samples_) sum += s.speed_mps;
    m.average_speed_mps = sum / samples_.size();
  }
  return m;
}

void SpeedTracker::reset() {
  has_previous_ = false;
  previous_frame_ = 0;
  previous_time_ = 0.0;
  previous_position_ = cv::Point2d();
  has_previous_right_foot_ = false;
  previous_right_foot_ = cv::Point2d();
  velocity_ = cv::Point2d();
  current_speed_ = 0.0;
  right_foot_speed_ = 0.0;
  total_distance_ = 0.0;
  samples_.clear();
}

double MpsToKmh(double mps) { return mps * 3.6; }

double MpsToMph(double mps) { return mps * 2.23694; }

calibration::Status ProjectLandmarksToCourt(
    const calibration::CoordinateTransformService& transforms,
    const std::vector<PoseLandmark>& landmarks,
    std::vector<cv::Point3d>* out_points) {
  if (!out_points) {
    return Status::Error(ErrorCode::kInvalidInput, "null output");
  }
  std::vector<cv::Point2d> image_points;
  image_points.reserve(landmarks.size());
  for (const auto& lm : landmarks) image_points.emplace_back(lm.x, lm.y);

  std::vector<cv::Point2d> world_points;
  Status status = transforms.batchTransform(image_points, &world_points);
  if (!status.ok()) return status;

  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<cv::Point3d> result;
  result.reserve(world_points.size());
  for (size_t i = 0; i < world_points.size(); ++i) {
    const cv::Point2d& p = world_points[i];
    if (!IsFinite(p)) {
      result.emplace_back(nan, nan, nan);
      continue;
    }
    result.emplace_back(p.x, p.y, EstimatedHeight(static_cast<int>(i)));
  }
  *out_points = std::move(result);
  return Status::Ok();
}

}  // namespace analysis
