#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "calibration/camera_position.h"
#include "calibration/coordinate_transform.h"
#include "calibration/court_model.h"
#include "calibration/homography_solver.h"
#include "calibration/line_store.h"
#include "calibration/quality_evaluator.h"
#include "calibration/status.h"

namespace calibration {

struct SessionConfig {
  SolverConfig solver;
  EvaluatorConfig evaluator;
  // 输入变化且线数足够时自动重新标定。
  bool auto_recalibrate = true;
};

// 一次重新标定的结果。
// fresh：本次求解成功并已发布；using_previous：求解失败但仍沿用上一次有效标定。
struct CalibrationOutcome {
  Status status;
  bool fresh = false;
  bool using_previous = false;
  bool has_result = false;
  CalibrationResult result;
};

// 当前标定的一致快照：矩阵、结果及求解时的输入来自同一次求解。
// stale 表示此后输入已变化（例如新线求解失败），导出的仍是上一次有效标定。
struct CalibrationSnapshot {
  std::shared_ptr<const Homography> homography;
  CalibrationResult result;
  CourtModel court;
  CameraPositionModel camera;
  std::vector<LineCorrespondence> lines;
  std::vector<LineCorrespondence> current_lines;
  bool stale = false;
};

// 标定会话：持有场地模型、相机位置、线对应与当前标定。
// 所有更新经显式接口进入；重新标定总是基于当前输入，过期的求解结果被丢弃。
class CalibrationSession {
 public:
  explicit CalibrationSession(const SessionConfig& config = {});

  // 切换运动会清空已绘制的线与当前标定。
  Status setCourtModel(const std::string& sport);
  Status setCameraPosition(CameraEdge edge, double distance, double height);
  Status setCameraPosition(const std::string& edge, double distance,
                           double height);
  // 坐标为原始视频像素；线 id 必须属于当前场地模型。
  Status addLine(const std::string& court_line_id, const cv::Point2d& pixel_start,
                 const cv::Point2d& pixel_end, double native_width,
                 double native_height, bool* out_of_frame = nullptr);
  bool removeLine(const std::string& court_line_id);
  // 清空线对应与标定，保留场地模型与相机位置。
  void reset();

  CalibrationOutcome recalibrate();

  // 当前有效结果；尚无成功标定时返回 false。
  bool currentResult(CalibrationResult* out_result) const;
  CalibrationOutcome lastOutcome() const;
  const CoordinateTransformService& transforms() const { return transforms_; }

  // 尚未绘制的必需线，用于提示用户。
  std::vector<std::string> missingRequiredLines() const;
  std::vector<LineCorrespondence> lines() const;
  CourtModel courtModel() const;
  CameraPositionModel camera() const;
  int lineCount() const;

  // 尚无有效标定时返回 false。
  bool snapshot(CalibrationSnapshot* out_snapshot) const;

  // 将当前标定保存为 YAML。
  bool saveYaml(const std::string& path) const;
  // 从 saveYaml 写出的文件恢复标定：场地、相机、线与两个矩阵全部校验通过后
  // 才替换会话状态，直接发布保存的矩阵而不重新求解。
  Status loadYaml(const std::string& path);

 private:
  // 调用方需持有 mutex_。
  void markChangedLocked();
  bool shouldAutoRecalibrateLocked() const;
  void clearCalibrationLocked();

  SessionConfig config_;
  QualityEvaluator evaluator_;
  CoordinateTransformService transforms_;

  mutable std::mutex mutex_;
  CourtModel court_;
  CameraPositionModel camera_;
  LineCorrespondenceStore store_;
  std::uint64_t revision_ = 0;
  bool has_result_ = false;
  CalibrationResult result_;
  CalibrationOutcome last_outcome_;
  // 已发布矩阵对应的输入及其 revision。
  std::uint64_t solved_revision_ = 0;
  std::vector<LineCorrespondence> solved_lines_;
  CameraPositionModel solved_camera_;
};

}  // namespace calibration
