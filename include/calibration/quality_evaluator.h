#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

#include "calibration/camera_position.h"
#include "calibration/court_model.h"
#include "calibration/homography_solver.h"
#include "calibration/line_store.h"

namespace calibration {

enum class QualityLabel { kExcellent, kGood, kFair, kAcceptable, kPoor };

// 质量分级阈值（像素）。
struct LabelThresholds {
  double excellent_below = 2.0;
  double good_below = 5.0;
  double fair_below = 10.0;
  double acceptable_below = 15.0;
};

// 评估参数。误差阈值单位为像素。
struct EvaluatorConfig {
  double excellent_below = 2.0;
  double good_below = 5.0;
  double fair_below = 10.0;
  double acceptable_below = 15.0;
  // 按运动名覆盖上面的默认分级阈值。
  std::map<std::string, LabelThresholds> sport_thresholds;

  // 与水平方向夹角不超过该值视为水平。
  double horizontal_max_deg = 35.0;
  // 与竖直方向夹角不超过该值视为竖直。
  double vertical_max_deg = 40.0;
  double wrong_orientation_penalty = 5.0;
  double diagonal_penalty = 2.0;

  // 线对齐得分：平均端点误差达到该像素值时得分为 0。
  double alignment_error_scale_px = 50.0;
  // 建议触发阈值。
  double max_condition_number = 1e4;
  double min_alignment_score = 0.7;
  double max_scale_variation = 1.0;

  // 坐标往返验证：平均误差上限（像素），最大误差上限为其两倍。
  double round_trip_tolerance_px = 2.0;
  // 场地范围验证：允许超出场地的距离（以场地宽/长为单位）与越界比例上限。
  double court_bounds_margin = 1.5;
  double max_out_of_bounds_ratio = 0.1;
};

// 一项坐标系验证的结果。
// 往返验证中 error 为平均像素误差；范围验证中 error 为越界比例。
struct ValidationCheck {
  bool passed = false;
  double error = 0.0;
  double max_error = 0.0;
  double confidence = 0.0;
  int valid_points = 0;
  int tested_points = 0;
};

// 单条线的方向检查结果。
struct LineOrientationCheck {
  std::string court_line_id;
  double angle_deg = 0.0;  // 与水平方向夹角 [0, 90]
  ImageOrientation observed = ImageOrientation::kHorizontal;
  ImageOrientation expected = ImageOrientation::kHorizontal;
  double penalty = 0.0;
};

// 示例变换，供界面展示。
struct ExampleTransform {
  cv::Point2d image_point;
  cv::Point2d world_point;
  double pixels_per_meter = 0.0;
};

// 标定质量结果，每次求解后整体替换。
struct CalibrationResult {
  double accuracy_percent = 0.0;
  // 基础重投影误差 + 方向惩罚。
  double reprojection_error_px = 0.0;
  double base_error_px = 0.0;
  double orientation_penalty = 0.0;
  QualityLabel label = QualityLabel::kPoor;
  bool has_example = false;
  ExampleTransform example;

  std::vector<LineOrientationCheck> orientation_checks;
  std::vector<double> line_alignment_scores;
  double condition_number = 0.0;
  // 不同画面区域米/像素比例的变异系数。
  double scale_variation = 0.0;
  ValidationCheck round_trip;
  ValidationCheck court_bounds;
  std::vector<std::string> recommendations;
};

// 标定质量评估器。结果只取决于输入，不依赖时钟或随机数。
class QualityEvaluator {
 public:
  explicit QualityEvaluator(const EvaluatorConfig& config = {});

  // 世界点经 H^-1 投影回画面，与绘制点比较，按原始分辨率换算为像素后取平均。
  double reprojectionError(const Homography& homography,
                           const std::vector<LineCorrespondence>& lines,
                           const CourtModel& court) const;
  // 按相机所在边检查每条线在画面中的朝向。
  std::vector<LineOrientationCheck> checkOrientation(
      const std::vector<LineCorrespondence>& lines, const CourtModel& court,
      const CameraPositionModel& camera) const;
  // 每条线的对齐得分 [0, 1]。
  std::vector<double> lineAlignmentScores(
      const Homography& homography,
      const std::vector<LineCorrespondence>& lines,
      const CourtModel& court) const;
  double scaleVariation(const Homography& homography) const;
  // 图像点 -> 场地 -> 图像，检查两个方向的矩阵是否一致。
  ValidationCheck roundTripCheck(const Homography& homography,
                                 const cv::Size2d& native_size) const;
  // 画面内的采样点映射到场地后应大致落在场地附近。
  ValidationCheck courtBoundsCheck(const Homography& homography,
                                   const CourtModel& court,
                                   const cv::Size2d& native_size) const;

  CalibrationResult evaluate(const Homography& homography,
                             const std::vector<LineCorrespondence>& lines,
                             const CourtModel& court,
                             const CameraPositionModel& camera) const;

  ImageOrientation classifyOrientation(double angle_deg) const;
  QualityLabel labelForError(double error_px) const;
  QualityLabel labelForError(double error_px, const CourtModel& court) const;
  LabelThresholds thresholdsFor(const CourtModel& court) const;

  const EvaluatorConfig& config() const { return config_; }

 private:
  EvaluatorConfig config_;
};

// 标签对应的准确度分数：95/85/75/65/50。
double AccuracyForLabel(QualityLabel label);
const char* QualityLabelName(QualityLabel label);

// 坐标验证采样点（归一化坐标）：5x5 网格、画面中心与内缩的四角。
std::vector<cv::Point2d> ValidationTestPoints(const cv::Size2d& native_size);

}  // namespace calibration
