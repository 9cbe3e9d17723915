#include "config/app_config.h"

#include <opencv2/core.hpp>

namespace config {

namespace {

// 读取标量字段，缺失时保留默认值。
template <typename T>
T ReadOr(const cv::FileNode& node, const char* key, T fallback) {
  const cv::FileNode field = node[key];
  if (field.empty()) return fallback;
  T value = fallback;
  field >> value;
  return value;
}

std::string GetString(const cv::FileNode& node, const char* key,
                      const std::string& fallback) {
  return ReadOr<std::string>(node, key, fallback);
}

int GetInt(const cv::FileNode& node, const char* key, int fallback) {
  return ReadOr<int>(node, key, fallback);
}

double GetDouble(const cv::FileNode& node, const char* key, double fallback) {
  return ReadOr<double>(node, key, fallback);
}

// FileStorage 没有布尔类型，0/1 存为 int。
bool GetBool(const cv::FileNode& node, const char* key, bool fallback) {
  return ReadOr<int>(node, key, fallback ? 1 : 0) != 0;
}

// 读取 [x, y] 形式的二维点。
bool GetPoint(const cv::FileNode& node, const char* key,
              cv::Point2d* out_point) {
  const cv::FileNode field = node[key];
  if (field.type() != cv::FileNode::SEQ || field.size() != 2) return false;
  std::vector<double> values;
  field >> values;
  if (values.size() != 2) return false;
  *out_point = cv::Point2d(values[0], values[1]);
  return true;
}

calibration::SolverConfig ReadSolverConfig(const cv::FileNode& node) {
  calibration::SolverConfig cfg;
  if (node.empty()) return cfg;
  cfg.max_condition_number =
      GetDouble(node, "max_condition_number", cfg.max_condition_number);
  cfg.min_spread_ratio =
      GetDouble(node, "min_spread_ratio", cfg.min_spread_ratio);
  cfg.min_line_length = GetDouble(node, "min_line_length", cfg.min_line_length);
  return cfg;
}

// 读取质量评估阈值配置。
calibration::EvaluatorConfig ReadEvaluatorConfig(const cv::FileNode& node) {
  calibration::EvaluatorConfig cfg;
  if (node.empty()) return cfg;
  cfg.excellent_below = GetDouble(node, "excellent_below", cfg.excellent_below);
  cfg.good_below = GetDouble(node, "good_below", cfg.good_below);
  cfg.fair_below = GetDouble(node, "fair_below", cfg.fair_below);
  cfg.acceptable_below =
      GetDouble(node, "acceptable_below", cfg.acceptable_below);
  cfg.horizontal_max_deg =
      GetDouble(node, "horizontal_max_deg", cfg.horizontal_max_deg);
  cfg.vertical_max_deg =
      GetDouble(node, "vertical_max_deg", cfg.vertical_max_deg);
  cfg.wrong_orientation_penalty = GetDouble(
      node, "wrong_orientation_penalty", cfg.wrong_orientation_penalty);
  cfg.diagonal_penalty =
      GetDouble(node, "diagonal_penalty", cfg.diagonal_penalty);
  cfg.alignment_error_scale_px = GetDouble(node, "alignment_error_scale_px",
                                           cfg.alignment_error_scale_px);
  cfg.max_condition_number =
      GetDouble(node, "max_condition_number", cfg.max_condition_number);
  cfg.min_alignment_score =
      GetDouble(node, "min_alignment_score", cfg.min_alignment_score);
  cfg.max_scale_variation =
      GetDouble(node, "max_scale_variation", cfg.max_scale_variation);
  cfg.round_trip_tolerance_px = GetDouble(node, "round_trip_tolerance_px",
                                          cfg.round_trip_tolerance_px);
  cfg.court_bounds_margin =
      GetDouble(node, "court_bounds_margin", cfg.court_bounds_margin);
  cfg.max_out_of_bounds_ratio = GetDouble(node, "max_out_of_bounds_ratio",
                                          cfg.max_out_of_bounds_ratio);

  // sports: 按运动名覆盖分级阈值，缺失的键沿用上面的默认值。
  cv::FileNode sports_node = node["sports"];
  if (sports_node.type() == cv::FileNode::MAP) {
    for (auto it = sports_node.begin(); it != sports_node.end(); ++it) {
      const cv::FileNode sport_node = *it;
      calibration::LabelThresholds t;
      t.excellent_below =
          GetDouble(sport_node, "excellent_below", cfg.excellent_below);
      t.good_below = GetDouble(sport_node, "good_below", cfg.good_below);
      t.fair_below = GetDouble(sport_node, "fair_below", cfg.fair_below);
      t.acceptable_below =
          GetDouble(sport_node, "acceptable_below", cfg.acceptable_below);
      cfg.sport_thresholds[sport_node.name()] = t;
    }
  }
  return cfg;
}

analysis::SpeedTrackerConfig ReadSpeedConfig(const cv::FileNode& node) {
  analysis::SpeedTrackerConfig cfg;
  if (node.empty()) return cfg;
  cfg.smoothing_window =
      GetInt(node, "smoothing_window", cfg.smoothing_window);
  cfg.min_visibility = GetDouble(node, "min_visibility", cfg.min_visibility);
  cfg.min_delta_time = GetDouble(node, "min_delta_time", cfg.min_delta_time);
  return cfg;
}

analysis::HeatmapSettings ReadHeatmapSettings(const cv::FileNode& node) {
  analysis::HeatmapSettings cfg;
  if (node.empty()) return cfg;
  cfg.cells_per_meter =
      GetDouble(node, "cells_per_meter", cfg.cells_per_meter);
  cfg.smoothing_radius =
      GetInt(node, "smoothing_radius", cfg.smoothing_radius);
  cfg.min_confidence = GetDouble(node, "min_confidence", cfg.min_confidence);
  cfg.sample_interval =
      GetDouble(node, "sample_interval", cfg.sample_interval);
  cfg.max_history = GetInt(node, "max_history", cfg.max_history);
  return cfg;
}

// 若路径未包含目录，则拼接全局目录。
std::string JoinDir(const std::string& dir, const std::string& file) {
  if (dir.empty() || file.find('\\') != std::string::npos ||
      file.find('/') != std::string::npos) {
    return file;
  }
  return dir + "/" + file;
}

bool ReadLine(const cv::FileNode& node, LineInput* out_line) {
  LineInput line;
  line.id = GetString(node, "id", "");
  if (line.id.empty()) return false;
  if (!GetPoint(node, "start", &line.start)) return false;
  if (!GetPoint(node, "end", &line.end)) return false;
  *out_line = line;
  return true;
}

// landmarks 为扁平序列：每个关键点依次为 x, y, visibility。
bool ReadFrame(const cv::FileNode& node, FrameInput* out_frame) {
  FrameInput frame;
  frame.frame = GetInt(node, "frame", 0);
  frame.time_sec = GetDouble(node, "time", 0.0);
  cv::FileNode landmarks_node = node["landmarks"];
  if (landmarks_node.type() != cv::FileNode::SEQ) return false;
  std::vector<double> values;
  landmarks_node >> values;
  if (values.size() % 3 != 0) return false;
  for (size_t i = 0; i < values.size(); i += 3) {
    analysis::PoseLandmark lm;
    lm.x = values[i];
    lm.y = values[i + 1];
    lm.visibility = values[i + 2];
    frame.landmarks.push_back(lm);
  }
  *out_frame = frame;
  return true;
}

}  // namespace

bool LoadConfig(const std::string& path, AppConfig* out_config) {
  if (!out_config) return false;
  AppConfig cfg;

  cv::FileStorage fs(path, cv::FileStorage::READ);
  if (!fs.isOpened()) return false;

  cv::FileNode app_node = fs["app"];
  cfg.output_dir = GetString(app_node, "output_dir", cfg.output_dir);
  cfg.report_dir = GetString(app_node, "report_dir", cfg.report_dir);
  cfg.output = GetString(app_node, "output", cfg.output);
  cfg.report = GetString(app_node, "report", cfg.report);
  cfg.session.auto_recalibrate =
      GetBool(app_node, "auto_recalibrate", cfg.session.auto_recalibrate);

  cfg.session.solver = ReadSolverConfig(fs["solver"]);
  cfg.session.evaluator = ReadEvaluatorConfig(fs["evaluator"]);
  cfg.speed = ReadSpeedConfig(fs["speed"]);
  cfg.heatmap = ReadHeatmapSettings(fs["heatmap"]);

  cfg.output = JoinDir(cfg.output_dir, cfg.output);
  cfg.report = JoinDir(cfg.report_dir, cfg.report);

  *out_config = cfg;
  return true;
}

bool LoadSession(const std::string& path, SessionInput* out_session) {
  if (!out_session) return false;
  SessionInput session;

  cv::FileStorage fs(path, cv::FileStorage::READ);
  if (!fs.isOpened()) return false;

  session.sport = GetString(fs.root(), "sport", session.sport);

  cv::FileNode video_node = fs["video"];
  session.video_size.width = GetDouble(video_node, "width", 0.0);
  session.video_size.height = GetDouble(video_node, "height", 0.0);
  if (session.video_size.width <= 0.0 || session.video_size.height <= 0.0) {
    return false;
  }

  cv::FileNode camera_node = fs["camera"];
  if (!camera_node.empty()) {
    session.has_camera = true;
    session.camera_edge = GetString(camera_node, "edge", session.camera_edge);
    session.camera_distance = GetDouble(camera_node, "distance", 0.0);
    session.camera_height = GetDouble(camera_node, "height", 0.0);
  }

  cv::FileNode lines_node = fs["lines"];
  if (lines_node.type() == cv::FileNode::SEQ) {
    for (auto it = lines_node.begin(); it != lines_node.end(); ++it) {
      LineInput line;
      if (!ReadLine(*it, &line)) return false;
      session.lines.push_back(line);
    }
  }

  cv::FileNode frames_node = fs["frames"];
  if (frames_node.type() == cv::FileNode::SEQ) {
    for (auto it = frames_node.begin(); it != frames_node.end(); ++it) {
      FrameInput frame;
      if (!ReadFrame(*it, &frame)) return false;
      session.frames.push_back(frame);
    }
  }

  *out_session = session;
  return true;
}

}  // namespace config
