#pragma once

#include <opencv2/core.hpp>
#include <string>

#include "calibration/court_model.h"
#include "calibration/status.h"

namespace calibration {

// 相机所在场地边：bottom 为近端底线外，top 为远端底线外。
enum class CameraEdge { kTop, kBottom, kLeft, kRight };

// 画面中线段的朝向。
enum class ImageOrientation { kHorizontal, kVertical, kDiagonal };

// 用户给出的粗略相机位姿。
struct CameraPositionGuess {
  CameraEdge edge = CameraEdge::kBottom;
  double distance = 0.0;  // 距场地边缘（米）
  double height = 0.0;    // 离地高度（米）
};

// 相机位置模型：只保存猜测值，供加权与方向一致性检查使用。
class CameraPositionModel {
 public:
  CameraPositionModel() = default;

  // distance、height 必须为正，否则返回 kInvalidInput 且不修改状态。
  Status set(CameraEdge edge, double distance, double height);
  Status set(const std::string& edge, double distance, double height);

  bool isSet() const { return is_set_; }
  const CameraPositionGuess& guess() const { return guess_; }

  // 相机三维位置估计：位于所在边中点外侧 distance 处，高 height。
  cv::Point3d estimatedPosition(const CourtModel& court) const;
  // 指向场地中心的俯角（度）。
  double viewingAngleDeg(const CourtModel& court) const;

  // 与相机主视轴平行的线权重 1.2，其余 1.0；未设置时均为 1.0。
  double lineWeight(LineAxis axis) const;
  // 该方向的场地线在画面中应呈现的朝向。
  ImageOrientation expectedOrientation(LineAxis axis) const;

  static constexpr double kAlignedLineWeight = 1.2;

 private:
  // 主视轴沿场长（相机在底线外）时为 true。
  bool looksAlongLength() const;

  CameraPositionGuess guess_;
  bool is_set_ = false;
};

bool ParseCameraEdge(const std::string& name, CameraEdge* out_edge);
const char* CameraEdgeName(CameraEdge edge);
const char* OrientationName(ImageOrientation orientation);

}  // namespace calibration
