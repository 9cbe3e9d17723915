#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "analysis/position_heatmap.h"
#include "analysis/speed_tracker.h"
#include "calibration/calibration_session.h"

namespace config {

// 全局应用配置。
// 用于：输出目录、求解/评估阈值、速度与热力图参数。
struct AppConfig {
  std::string output_dir = "outputs";
  std::string report_dir = "reports";
  std::string output = "court_calibration.yaml";
  std::string report = "court_calibration.md";
  calibration::SessionConfig session{};
  analysis::SpeedTrackerConfig speed{};
  analysis::HeatmapSettings heatmap{};
};

// 用户绘制的一条线，坐标为原始视频像素。
struct LineInput {
  std::string id;
  cv::Point2d start;
  cv::Point2d end;
};

// 一帧姿态数据。
struct FrameInput {
  int frame = 0;
  double time_sec = 0.0;
  std::vector<analysis::PoseLandmark> landmarks;
};

// 标定会话输入：场地、相机猜测、视频尺寸、已绘制的线与可选的姿态序列。
struct SessionInput {
  std::string sport = "badminton";
  bool has_camera = false;
  std::string camera_edge = "bottom";
  double camera_distance = 0.0;
  double camera_height = 0.0;
  cv::Size2d video_size;
  std::vector<LineInput> lines;
  std::vector<FrameInput> frames;
};

// 读取 YAML 配置文件，失败返回 false。
bool LoadConfig(const std::string& path, AppConfig* out_config);

// 读取会话文件。视频尺寸缺失、线或关键点格式错误时返回 false。
bool LoadSession(const std::string& path, SessionInput* out_session);

}  // namespace config
