#pragma once

#include <string>

#include "calibration/calibration_session.h"

namespace report {

// 姿态序列处理统计，用于报告输出。
struct TrackStats {
  bool has_track = false;
  int total_frames = 0;
  int tracked_frames = 0;
  int skipped_frames = 0;
  double average_speed_mps = 0.0;
  double max_speed_mps = 0.0;
  double total_distance_m = 0.0;
  std::string most_visited_zone;
};

// 生成 Markdown 报告，便于审计与复盘。会话尚未标定时返回 false。
bool WriteMarkdownReport(const std::string& path,
                         const calibration::CalibrationSession& session,
                         const TrackStats& stats);

}  // namespace report
