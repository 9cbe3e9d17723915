#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "calibration/status.h"

namespace calibration {

// 一条已确认的场地线对应：端点已按原始视频分辨率归一化到 0-1。
struct LineCorrespondence {
  std::string court_line_id;
  cv::Point2d start;
  cv::Point2d end;
  // 原始视频分辨率（非显示尺寸），用于换算像素误差与方向角。
  cv::Size2d native_size;
  bool confirmed = true;
  // 端点超出画面范围时置位，仅作提示，不裁剪。
  bool out_of_frame = false;

  // 归一化坐标还原为原始像素坐标。
  cv::Point2d startPixels() const;
  cv::Point2d endPixels() const;
};

// 对应关系存储：每个场地线 id 至多一条，重复添加即替换。
class LineCorrespondenceStore {
 public:
  LineCorrespondenceStore() = default;

  // 添加或替换一条线。坐标为原始视频像素。
  // 尺寸非正、坐标非有限值时返回 kInvalidInput 且不修改状态。
  Status addLine(const std::string& court_line_id, const cv::Point2d& pixel_start,
                 const cv::Point2d& pixel_end, double native_width,
                 double native_height, bool* out_of_frame = nullptr);
  // 移除指定 id，存在时返回 true。
  bool removeLine(const std::string& court_line_id);
  void reset();

  int count() const;
  // 至少三条线即可求解。
  bool isComplete() const;
  const LineCorrespondence* find(const std::string& court_line_id) const;
  // 按首次添加顺序返回。
  const std::vector<LineCorrespondence>& lines() const { return lines_; }

  static constexpr int kMinimumLines = 3;

 private:
  std::vector<LineCorrespondence> lines_;
};

}  // namespace calibration
