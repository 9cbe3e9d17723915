#pragma once

#include <opencv2/core.hpp>
#include <deque>
#include <vector>

#include "calibration/coordinate_transform.h"
#include "calibration/status.h"

namespace analysis {

// MediaPipe 姿态关键点：x、y 为归一化图像坐标。
struct PoseLandmark {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
  double visibility = 1.0;
};

// MediaPipe 姿态索引。
enum PoseIndex {
  kLeftShoulder = 11,
  kRightShoulder = 12,
  kLeftHip = 23,
  kRightHip = 24,
  kLeftAnkle = 27,
  kRightAnkle = 28,
  kLeftHeel = 29,
  kRightHeel = 30,
  kLeftFootIndex = 31,
  kRightFootIndex = 32,
};

struct SpeedTrackerConfig {
  // 滑动平均窗口（样本数）。
  int smoothing_window = 5;
  // 可见度高于该值的关键点才参与计算。
  double min_visibility = 0.5;
  // 帧间时间差下限（秒），避免除零。
  double min_delta_time = 1e-6;
};

struct SpeedSample {
  int frame = 0;
  double time_sec = 0.0;
  double speed_mps = 0.0;
  double distance_m = 0.0;
};

struct SpeedMetrics {
  bool valid = false;
  double current_speed_mps = 0.0;
  double average_speed_mps = 0.0;
  cv::Point2d velocity;  // 场地坐标系下 (m/s)
  double right_foot_speed_mps = 0.0;
  double total_distance_m = 0.0;
  cv::Point2d court_position;
  int frame = 0;
  std::vector<SpeedSample> samples;
};

// 球员移动速度跟踪：以可见脚部关键点的地面投影为锚点。
// 只读使用标定结果，未标定时不产生任何状态变化。
class SpeedTracker {
 public:
  explicit SpeedTracker(const calibration::CoordinateTransformService& transforms,
                        const SpeedTrackerConfig& config = {});

  calibration::Status update(int frame, double time_sec,
                             const std::vector<PoseLandmark>& landmarks);
  SpeedMetrics metrics() const;
  void reset();

  const SpeedTrackerConfig& config() const { return config_; }

 private:
  bool isVisible(const std::vector<PoseLandmark>& landmarks, int index) const;

  const calibration::CoordinateTransformService& transforms_;
  SpeedTrackerConfig config_;

  bool has_previous_ = false;
  int previous_frame_ = 0;
  double previous_time_ = 0.0;
  cv::Point2d previous_position_;
  bool has_previous_right_foot_ = false;
  cv::Point2d previous_right_foot_;

  cv::Point2d velocity_;
  double current_speed_ = 0.0;
  double right_foot_speed_ = 0.0;
  double total_distance_ = 0.0;
  std::deque<SpeedSample> samples_;
};

double MpsToKmh(double mps);
double MpsToMph(double mps);

// 将全部关键点投影到场地三维坐标。脚部 z=0，其余按身体部位估计高度。
// 输出与输入一一对应，无法投影的点为 NaN。
calibration::Status ProjectLandmarksToCourt(
    const calibration::CoordinateTransformService& transforms,
    const std::vector<PoseLandmark>& landmarks,
    std::vector<cv::Point3d>* out_points);

}  // namespace analysis
