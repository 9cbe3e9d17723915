#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "calibration/status.h"

namespace calibration {

enum class Sport { kBadminton, kTennis };

// 场地线方向：横跨场宽（平行 x 轴）或沿场长（平行 y 轴）。
enum class LineAxis { kAcrossWidth, kAlongLength };

// 单条场地线：两端点为世界坐标（米），均位于 z=0 地面。
struct CourtLine {
  std::string id;
  cv::Point3d start;
  cv::Point3d end;
  LineAxis axis = LineAxis::kAcrossWidth;
  bool required = false;
};

// 场地模型。
// 世界坐标系：x 沿场宽 [0, width]，y 从近端底线沿场长 [0, length]，z 向上。
struct CourtModel {
  Sport sport = Sport::kBadminton;
  std::string name;
  double length = 0.0;
  double width = 0.0;
  double net_height = 0.0;
  std::vector<CourtLine> lines;

  // 按 id 查找场地线，找不到返回 nullptr。
  const CourtLine* findLine(const std::string& id) const;
  // 标定所需的最少线集合（按定义顺序）。
  std::vector<std::string> requiredLineIds() const;
  // 球网所在的 y 坐标。
  double netY() const { return length * 0.5; }
};

// 获取指定运动的标准场地模型。
CourtModel GetCourtModel(Sport sport);
// 按名称获取场地模型，未知运动返回 kInvalidInput。
Status GetCourtModel(const std::string& sport, CourtModel* out_model);

bool ParseSport(const std::string& name, Sport* out_sport);
const char* SportName(Sport sport);

}  // namespace calibration
