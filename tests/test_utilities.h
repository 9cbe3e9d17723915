#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

#include "analysis/speed_tracker.h"
#include "calibration/court_model.h"
#include "calibration/homography_solver.h"
#include "calibration/line_store.h"

namespace calibration {
namespace testing {

constexpr double kNativeWidth = 1920.0;
constexpr double kNativeHeight = 1080.0;

// 合成的地面 -> 归一化图像单应：相机位于近端底线后方、居中，
// 中线在画面中保持竖直 (u = 0.5)。
inline cv::Matx33d GroundTruthWorldToImage() {
  return cv::Matx33d(0.12, 0.015, 0.134,
                     0.0, -0.05, 0.9,
                     0.0, 0.03, 1.0);
}

inline cv::Matx33d GroundTruthImageToWorld() {
  cv::Matx33d h = GroundTruthWorldToImage().inv(cv::DECOMP_LU);
  return h * (1.0 / h(2, 2));
}

inline std::shared_ptr<const Homography> GroundTruthHomography() {
  auto h = std::make_shared<Homography>();
  h->image_to_world = GroundTruthImageToWorld();
  h->world_to_image = GroundTruthWorldToImage();
  h->point_count = 6;
  return h;
}

// 场地点投影到归一化图像坐标。
inline cv::Point2d ProjectToImage(const cv::Point2d& world) {
  cv::Point2d image;
  ApplyHomography(GroundTruthWorldToImage(), world, &image);
  return image;
}

// 场地点投影到原始像素坐标。
inline cv::Point2d ProjectToPixels(const cv::Point2d& world,
                                   double width = kNativeWidth,
                                   double height = kNativeHeight) {
  const cv::Point2d image = ProjectToImage(world);
  return cv::Point2d(image.x * width, image.y * height);
}

struct DrawnLine {
  std::string id;
  cv::Point2d start;  // 像素
  cv::Point2d end;
};

// 按真值单应绘制指定场地线，offset 为附加的像素平移。
inline DrawnLine DrawCourtLine(const CourtModel& court, const std::string& id,
                               const cv::Point2d& offset = cv::Point2d(),
                               double width = kNativeWidth,
                               double height = kNativeHeight) {
  const CourtLine* line = court.findLine(id);
  DrawnLine drawn;
  drawn.id = id;
  if (!line) return drawn;
  drawn.start =
      ProjectToPixels(cv::Point2d(line->start.x, line->start.y), width, height) +
      offset;
  drawn.end =
      ProjectToPixels(cv::Point2d(line->end.x, line->end.y), width, height) +
      offset;
  return drawn;
}

// 羽毛球必需三线的完美对应。
inline std::vector<DrawnLine> PerfectBadmintonLines(
    const cv::Point2d& offset = cv::Point2d(), double width = kNativeWidth,
    double height = kNativeHeight) {
  const CourtModel court = GetCourtModel(Sport::kBadminton);
  std::vector<DrawnLine> lines;
  for (const auto& id : court.requiredLineIds()) {
    lines.push_back(DrawCourtLine(court, id, offset, width, height));
  }
  return lines;
}

inline LineCorrespondenceStore MakeStore(const std::vector<DrawnLine>& lines,
                                         double width = kNativeWidth,
                                         double height = kNativeHeight) {
  LineCorrespondenceStore store;
  for (const auto& line : lines) {
    store.addLine(line.id, line.start, line.end, width, height);
  }
  return store;
}

// 33 个 MediaPipe 关键点，仅脚部可见且位于 world 的投影处。
inline std::vector<analysis::PoseLandmark> FeetAt(const cv::Point2d& world,
                                                  double visibility = 0.9) {
  std::vector<analysis::PoseLandmark> landmarks(33);
  for (auto& lm : landmarks) lm.visibility = 0.0;
  const cv::Point2d image = ProjectToImage(world);
  const int feet[] = {analysis::kLeftAnkle, analysis::kRightAnkle,
                      analysis::kLeftFootIndex, analysis::kRightFootIndex};
  for (int index : feet) {
    landmarks[index].x = image.x;
    landmarks[index].y = image.y;
    landmarks[index].visibility = visibility;
  }
  return landmarks;
}

}  // namespace testing
}  // namespace calibration
