#include "analysis/position_heatmap.h"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace analysis {

namespace {

const char* const kDepthNames[] = {"front", "mid", "back"};
const char* const kLateralNames[] = {"left", "center", "right"};

// 距网深度占半场长度比例的分界。
constexpr double kFrontDepth = 0.5;
constexpr double kMidDepth = 0.7;
constexpr double kLeftLateral = 0.33;
constexpr double kCenterLateral = 0.67;

}  // namespace

PositionHeatmap::PositionHeatmap(const calibration::CourtModel& court,
                                 const HeatmapSettings& settings)
    : court_(court), settings_(settings) {
  if (settings_.cells_per_meter <= 0.0) settings_.cells_per_meter = 4.0;
  if (settings_.smoothing_radius < 0) settings_.smoothing_radius = 0;
  if (settings_.max_history < 1) settings_.max_history = 1;
  initializeZones();
}

void PositionHeatmap::initializeZones() {
  time_in_zones_.clear();
  for (const char* depth : kDepthNames) {
    for (const char* lateral : kLateralNames) {
      time_in_zones_[std::string(depth) + "-" + lateral] = 0.0;
    }
  }
}

bool PositionHeatmap::insideCourt(const cv::Point2d& world) const {
  return world.x >= 0.0 && world.x <= court_.width && world.y >= 0.0 &&
         world.y <= court_.length;
}

bool PositionHeatmap::addSample(const cv::Point2d& world, double time_sec,
                                int frame, double confidence) {
  if (!std::isfinite(world.x) || !std::isfinite(world.y) ||
      !std::isfinite(time_sec)) {
    return false;
  }
  if (confidence < settings_.min_confidence) return false;
  if (has_last_ && std::abs(time_sec - last_.time_sec) < settings_.sample_interval) {
    return false;
  }

  PositionSample sample;
  sample.world = world;
  sample.time_sec = time_sec;
  sample.frame = frame;
  sample.confidence = confidence;

  if (has_last_) {
    total_distance_ += cv::norm(world - last_.world);
    // 时间倒退（回放跳转）不计入停留时间。
    const double dt = time_sec - last_.time_sec;
    const std::string zone = zoneName(world);
    if (dt > 0.0 && zone != "out") time_in_zones_[zone] += dt;
  }

  history_.push_back(sample);
  while (static_cast<int>(history_.size()) > settings_.max_history) {
    history_.pop_front();
  }
  last_ = sample;
  has_last_ = true;
  return true;
}

HeatmapData PositionHeatmap::generate() const {
  HeatmapData data;
  const double cells = settings_.cells_per_meter;
  const int rows = std::max(1, static_cast<int>(std::ceil(court_.length * cells)));
  const int cols = std::max(1, static_cast<int>(std::ceil(court_.width * cells)));
  data.cell_size_m = 1.0 / cells;
  data.counts = cv::Mat::zeros(rows, cols, CV_32F);

  for (const auto& sample : history_) {
    if (!insideCourt(sample.world)) continue;
    const int col = std::min(cols - 1, static_cast<int>(sample.world.x * cells));
    const int row = std::min(rows - 1, static_cast<int>(sample.world.y * cells));
    data.counts.at<float>(row, col) += 1.0f;
    ++data.total_samples;
  }

  double max_count = 0.0;
  cv::minMaxLoc(data.counts, nullptr, &max_count);
  data.max_count = static_cast<float>(max_count);

  const int radius = settings_.smoothing_radius;
  if (radius > 0) {
    const int ksize = 2 * radius + 1;
    cv::GaussianBlur(data.counts, data.smoothed, cv::Size(ksize, ksize),
                     radius, radius, cv::BORDER_CONSTANT);
  } else {
    data.smoothed = data.counts.clone();
  }

  double max_smoothed = 0.0;
  cv::minMaxLoc(data.smoothed, nullptr, &max_smoothed);
  if (max_smoothed > 0.0) {
    data.smoothed.convertTo(data.intensity, CV_32F, 1.0 / max_smoothed);
  } else {
    data.intensity = cv::Mat::zeros(rows, cols, CV_32F);
  }
  return data;
}

std::string PositionHeatmap::zoneName(const cv::Point2d& world) const {
  if (!std::isfinite(world.x) || !std::isfinite(world.y) ||
      !insideCourt(world) || court_.width <= 0.0 || court_.length <= 0.0) {
    return "out";
  }
  const double net_y = court_.netY();
  const double half_length = court_.length * 0.5;
  const bool far_half = world.y > net_y;

  const double depth = std::abs(world.y - net_y) / half_length;
  // 球员面向球网，远端半场的左右与 x 轴方向相反。
  double lateral = world.x / court_.width;
  if (far_half) lateral = 1.0 - lateral;

  const char* depth_name = depth < kFrontDepth ? kDepthNames[0]
                           : depth < kMidDepth ? kDepthNames[1]
                                               : kDepthNames[2];
  const char* lateral_name = lateral < kLeftLateral     ? kLateralNames[0]
                             : lateral < kCenterLateral ? kLateralNames[1]
                                                        : kLateralNames[2];
  return std::string(depth_name) + "-" + lateral_name;
}

std::string PositionHeatmap::mostVisitedZone() const {
  std::string best;
  double best_time = 0.0;
  for (const auto& entry : time_in_zones_) {
    if (entry.second > best_time) {
      best_time = entry.second;
      best = entry.first;
    }
  }
  return best;
}

void PositionHeatmap::clear() {
  history_.clear();
  initializeZones();
  total_distance_ = 0.0;
  has_last_ = false;
  last_ = PositionSample();
}

}  // namespace analysis
