#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <vector>

#include "calibration/camera_position.h"
#include "calibration/court_model.h"
#include "calibration/line_store.h"
#include "calibration/status.h"

namespace calibration {

// 平面单应：归一化图像坐标 -> 场地地面坐标（米），H(2,2) 归一为 1。
// 生成后不再修改，重新标定时整体替换。
struct Homography {
  cv::Matx33d image_to_world = cv::Matx33d::eye();
  cv::Matx33d world_to_image = cv::Matx33d::eye();
  // DLT 系数矩阵条件数 sigma_0 / sigma_7。
  double condition_number = 0.0;
  int point_count = 0;
};

// 单个点对，由一条线的起点或终点生成。
struct PointPair {
  cv::Point2d image;  // 归一化图像坐标
  cv::Point2d world;  // 地面坐标 (x, y)
  double weight = 1.0;
};

// 求解参数。
struct SolverConfig {
  // 超过该条件数视为近似共线/退化。
  double max_condition_number = 1e6;
  // 点集散布的最小/最大特征值比下限。
  double min_spread_ratio = 1e-4;
  // 归一化坐标下的最短线长。
  double min_line_length = 0.002;
};

// 求解结果：失败时 homography 为上一次有效结果（可能为空），stale 置位。
struct SolveResult {
  Status status;
  std::shared_ptr<const Homography> homography;
  bool stale = false;
};

// 对点施加单应变换；齐次分量接近 0（地平线上的点）时返回 false。
bool ApplyHomography(const cv::Matx33d& h, const cv::Point2d& in,
                     cv::Point2d* out);

// 由线对应生成加权点对，线 id 不在场地模型中时返回 kInvalidInput。
Status BuildPointPairs(const std::vector<LineCorrespondence>& lines,
                       const CourtModel& court,
                       const CameraPositionModel& camera,
                       std::vector<PointPair>* out_pairs);

// 加权 DLT 求解，无状态。
Status EstimateHomography(const std::vector<LineCorrespondence>& lines,
                          const CourtModel& court,
                          const CameraPositionModel& camera,
                          const SolverConfig& config, Homography* out);

// 单应求解器：缓存最近一次有效结果，失败时不覆盖。
class HomographySolver {
 public:
  explicit HomographySolver(const SolverConfig& config = {});

  SolveResult solve(const std::vector<LineCorrespondence>& lines,
                    const CourtModel& court, const CameraPositionModel& camera);

  std::shared_ptr<const Homography> lastGood() const { return last_good_; }
  void reset();
  const SolverConfig& config() const { return config_; }

 private:
  SolverConfig config_;
  std::shared_ptr<const Homography> last_good_;
};

}  // namespace calibration
