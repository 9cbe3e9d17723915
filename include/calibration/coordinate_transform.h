#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <mutex>
#include <vector>

#include "calibration/homography_solver.h"
#include "calibration/status.h"

namespace calibration {

// 坐标变换服务：持有唯一的“当前”单应，发布时整体替换指针。
// 并发读取只会看到完整的旧矩阵或新矩阵。
class CoordinateTransformService {
 public:
  CoordinateTransformService() = default;

  void publish(std::shared_ptr<const Homography> homography);
  void clear();

  bool isCalibrated() const;
  std::shared_ptr<const Homography> current() const;

  // 归一化图像坐标 -> 场地坐标（米）。
  Status imageToWorld(const cv::Point2d& image_point,
                      cv::Point2d* out_world) const;
  // 场地坐标 -> 归一化图像坐标，用于叠加绘制。
  Status worldToImage(const cv::Point2d& world_point,
                      cv::Point2d* out_image) const;
  // 批量 imageToWorld：整批使用同一矩阵，输出与输入一一对应、顺序不变。
  // 无法变换的点（地平线上或非有限值）输出 NaN，不丢弃。
  Status batchTransform(const std::vector<cv::Point2d>& image_points,
                        std::vector<cv::Point2d>* out_world) const;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const Homography> current_;
};

}  // namespace calibration
