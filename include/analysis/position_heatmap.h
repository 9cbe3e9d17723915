#pragma once

#include <opencv2/core.hpp>
#include <deque>
#include <map>
#include <string>

#include "calibration/court_model.h"

namespace analysis {

struct HeatmapSettings {
  double cells_per_meter = 4.0;
  // 高斯平滑半径（格），sigma 与之相同。
  int smoothing_radius = 1;
  double min_confidence = 0.5;
  // 两次采样的最小时间间隔（秒）。
  double sample_interval = 0.05;
  int max_history = 10000;
};

struct PositionSample {
  cv::Point2d world;
  double time_sec = 0.0;
  int frame = 0;
  double confidence = 0.0;
};

// 行对应场长方向，列对应场宽方向，均为 CV_32F。
struct HeatmapData {
  cv::Mat counts;
  cv::Mat smoothed;
  // smoothed 按最大值归一化到 [0, 1]。
  cv::Mat intensity;
  float max_count = 0.0f;
  int total_samples = 0;
  double cell_size_m = 0.0;
};

// 球员场上位置热力图与分区停留时间统计。
class PositionHeatmap {
 public:
  explicit PositionHeatmap(const calibration::CourtModel& court,
                           const HeatmapSettings& settings = {});

  // 置信度不足或距上次采样过近时返回 false。
  bool addSample(const cv::Point2d& world, double time_sec, int frame,
                 double confidence);
  HeatmapData generate() const;

  // 以球员所在半场为参照的分区名，例如 "front-left"；场外为 "out"。
  std::string zoneName(const cv::Point2d& world) const;
  const std::map<std::string, double>& timeInZones() const {
    return time_in_zones_;
  }
  // 停留时间最长的分区，尚无统计时为空串。
  std::string mostVisitedZone() const;
  double totalDistance() const { return total_distance_; }
  int sampleCount() const { return static_cast<int>(history_.size()); }
  void clear();

  const HeatmapSettings& settings() const { return settings_; }

 private:
  bool insideCourt(const cv::Point2d& world) const;
  void initializeZones();

  calibration::CourtModel court_;
  HeatmapSettings settings_;
  std::deque<PositionSample> history_;
  std::map<std::string, double> time_in_zones_;
  double total_distance_ = 0.0;
  bool has_last_ = false;
  PositionSample last_;
};

}  // namespace analysis
