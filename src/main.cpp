#include <opencv2/core.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/position_heatmap.h"
#include "analysis/speed_tracker.h"
#include "calibration/calibration_session.h"
#include "config/app_config.h"
#include "report/report_writer.h"

namespace {

struct Options {
  std::string session_path;
  std::string load_path;
  std::string config_path;
  std::string output;
  std::string report;
  std::string sport;
  std::string edge;
  double distance = 0.0;
  double height = 0.0;
  bool camera_override = false;
  bool show_help = false;
  bool invalid_args = false;
};

void PrintUsage() {
  std::cout << "Court Calibration Tool (OpenCV)\n"
            << "Usage:\n"
            << "  court_calibration --session <path> [options]\n"
            << "  court_calibration --load <path> [--session <path>] [options]\n\n"
            << "Options:\n"
            << "  --session <path>      Session YAML (video size, lines, pose track)\n"
            << "  --load <path>         Restore a saved calibration instead of solving\n"
            << "  --config <path>       YAML config file\n"
            << "  --output <path>       Output calibration YAML path\n"
            << "  --report <path>       Output Markdown report path\n"
            << "  --sport <badminton|tennis>\n"
            << "  --edge <top|bottom|left|right>\n"
            << "  --distance <m>        Camera distance from the court edge\n"
            << "  --height <m>          Camera height above the ground\n"
            << "  --help                Show this help\n";
}

bool ParseDouble(const std::string& text, double* out) {
  try {
    size_t used = 0;
    *out = std::stod(text, &used);
    return used == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

Options ParseArgs(int argc, char** argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](std::string* out) {
      if (i + 1 < argc) {
        *out = argv[++i];
        return true;
      }
      return false;
    };
    std::string value;
    if (arg == "--session") {
      if (next(&value)) opt.session_path = value;
      else opt.invalid_args = true;
    } else if (arg == "--load") {
      if (next(&value)) opt.load_path = value;
      else opt.invalid_args = true;
    } else if (arg == "--config") {
      if (next(&value)) opt.config_path = value;
      else opt.invalid_args = true;
    } else if (arg == "--output") {
      if (next(&value)) opt.output = value;
      else opt.invalid_args = true;
    } else if (arg == "--report") {
      if (next(&value)) opt.report = value;
      else opt.invalid_args = true;
    } else if (arg == "--sport") {
      if (next(&value)) opt.sport = value;
      else opt.invalid_args = true;
    } else if (arg == "--edge") {
      if (next(&value)) opt.edge = value;
      else opt.invalid_args = true;
      opt.camera_override = true;
    } else if (arg == "--distance") {
      if (!next(&value) || !ParseDouble(value, &opt.distance)) {
        opt.invalid_args = true;
      }
      opt.camera_override = true;
    } else if (arg == "--height") {
      if (!next(&value) || !ParseDouble(value, &opt.height)) {
        opt.invalid_args = true;
      }
      opt.camera_override = true;
    } else if (arg == "--help" || arg == "-h") {
      opt.show_help = true;
    } else {
      opt.invalid_args = true;
    }
  }
  return opt;
}

// 确保输出文件所在目录存在。
void EnsureParentDir(const std::string& path) {
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);
}

// 可见脚部关键点的平均可见度，作为位置样本的置信度。
double FootConfidence(const std::vector<analysis::PoseLandmark>& landmarks) {
  const int anchors[] = {analysis::kLeftAnkle, analysis::kRightAnkle,
                         analysis::kLeftFootIndex, analysis::kRightFootIndex};
  double sum = 0.0;
  int count = 0;
  for (int index : anchors) {
    if (index >= static_cast<int>(landmarks.size())) continue;
    sum += landmarks[index].visibility;
    ++count;
  }
  return count > 0 ? sum / count : 0.0;
}

void PrintError(const std::string& what, const calibration::Status& status) {
  std::cerr << what << " [" << calibration::ErrorCodeName(status.code)
            << "]: " << status.message << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  Options opt = ParseArgs(argc, argv);
  if (opt.show_help) {
    PrintUsage();
    return 0;
  }
  if (opt.invalid_args ||
      (opt.session_path.empty() && opt.load_path.empty())) {
    std::cerr << "Invalid arguments.\n";
    PrintUsage();
    return 1;
  }

  // 默认配置，若提供 --config 则使用配置文件。
  config::AppConfig app_cfg;
  if (!opt.config_path.empty()) {
    if (!config::LoadConfig(opt.config_path, &app_cfg)) {
      std::cerr << "Failed to load config: " << opt.config_path << "\n";
      return 1;
    }
  } else {
    app_cfg.output = app_cfg.output_dir + "/" + app_cfg.output;
    app_cfg.report = app_cfg.report_dir + "/" + app_cfg.report;
  }
  if (!opt.output.empty()) app_cfg.output = opt.output;
  if (!opt.report.empty()) app_cfg.report = opt.report;

  config::SessionInput input;
  if (!opt.session_path.empty() &&
      !config::LoadSession(opt.session_path, &input)) {
    std::cerr << "Failed to load session: " << opt.session_path << "\n";
    return 1;
  }
  if (!opt.sport.empty()) input.sport = opt.sport;
  if (opt.camera_override) {
    input.has_camera = true;
    if (!opt.edge.empty()) input.camera_edge = opt.edge;
    if (opt.distance > 0.0) input.camera_distance = opt.distance;
    if (opt.height > 0.0) input.camera_height = opt.height;
  }

  calibration::CalibrationSession session(app_cfg.session);
  calibration::Status status;
  calibration::CalibrationOutcome outcome;
  if (!opt.load_path.empty()) {
    status = session.loadYaml(opt.load_path);
    if (!status.ok()) {
      PrintError("Failed to load calibration", status);
      return 1;
    }
    std::cout << "Calibration restored: " << opt.load_path << std::endl;
    outcome = session.lastOutcome();
  } else {
    status = session.setCourtModel(input.sport);
    if (!status.ok()) {
      PrintError("Invalid sport", status);
      return 1;
    }
    if (input.has_camera) {
      status = session.setCameraPosition(input.camera_edge,
                                         input.camera_distance,
                                         input.camera_height);
      if (!status.ok()) {
        PrintError("Invalid camera position", status);
        return 1;
      }
    }

    // 逐条加入线对应；非法线只提示并跳过。
    for (const auto& line : input.lines) {
      bool out_of_frame = false;
      status = session.addLine(line.id, line.start, line.end,
                               input.video_size.width, input.video_size.height,
                               &out_of_frame);
      if (!status.ok()) {
        PrintError("Skipped line " + line.id, status);
        continue;
      }
      if (out_of_frame) {
        std::cerr << "Warning: line " << line.id
                  << " has endpoints outside the video frame.\n";
      }
    }
    for (const auto& id : session.missingRequiredLines()) {
      std::cout << "Missing recommended line: " << id << std::endl;
    }

    outcome = session.recalibrate();
    if (!outcome.status.ok()) {
      PrintError("Calibration failed", outcome.status);
      return 1;
    }
  }
  const calibration::CalibrationResult& result = outcome.result;
  std::cout << "Calibration quality: "
            << calibration::QualityLabelName(result.label) << " ("
            << result.accuracy_percent << "%)" << std::endl;
  std::cout << "Reprojection error: " << result.reprojection_error_px
            << " px (base " << result.base_error_px << ", penalty "
            << result.orientation_penalty << ")" << std::endl;
  if (result.has_example) {
    std::cout << "Example: image (" << result.example.image_point.x << ", "
              << result.example.image_point.y << ") -> court ("
              << result.example.world_point.x << ", "
              << result.example.world_point.y << ") m" << std::endl;
  }
  for (const auto& text : result.recommendations) {
    std::cout << "  * " << text << std::endl;
  }

  EnsureParentDir(app_cfg.output);
  if (session.saveYaml(app_cfg.output)) {
    std::cout << "Calibration saved: " << app_cfg.output << std::endl;
  } else {
    std::cerr << "Failed to save calibration: " << app_cfg.output << "\n";
  }

  // 姿态序列：速度与位置统计。
  report::TrackStats stats;
  if (!input.frames.empty()) {
    stats.has_track = true;
    analysis::SpeedTracker tracker(session.transforms(), app_cfg.speed);
    analysis::PositionHeatmap heatmap(session.courtModel(), app_cfg.heatmap);
    double speed_sum = 0.0;
    int speed_count = 0;
    for (const auto& frame : input.frames) {
      stats.total_frames++;
      status = tracker.update(frame.frame, frame.time_sec, frame.landmarks);
      if (!status.ok()) {
        stats.skipped_frames++;
        continue;
      }
      stats.tracked_frames++;
      const analysis::SpeedMetrics metrics = tracker.metrics();
      if (!metrics.samples.empty()) {
        speed_sum += metrics.current_speed_mps;
        speed_count++;
        stats.max_speed_mps =
            std::max(stats.max_speed_mps, metrics.current_speed_mps);
      }
      heatmap.addSample(metrics.court_position, frame.time_sec, frame.frame,
                        FootConfidence(frame.landmarks));
    }
    if (speed_count > 0) stats.average_speed_mps = speed_sum / speed_count;
    stats.total_distance_m = tracker.metrics().total_distance_m;
    stats.most_visited_zone = heatmap.mostVisitedZone();

    std::cout << "Tracked frames: " << stats.tracked_frames << "/"
              << stats.total_frames << std::endl;
    std::cout << "Average speed: " << analysis::MpsToKmh(stats.average_speed_mps)
              << " km/h (" << analysis::MpsToMph(stats.average_speed_mps)
              << " mph)" << std::endl;
    std::cout << "Max speed: " << analysis::MpsToKmh(stats.max_speed_mps)
              << " km/h (" << analysis::MpsToMph(stats.max_speed_mps)
              << " mph)" << std::endl;
    std::cout << "Distance covered: " << stats.total_distance_m << " m"
              << std::endl;
    if (!stats.most_visited_zone.empty()) {
      std::cout << "Most visited zone: " << stats.most_visited_zone
                << std::endl;
    }
  }

  EnsureParentDir(app_cfg.report);
  if (report::WriteMarkdownReport(app_cfg.report, session, stats)) {
    std::cout << "Report saved: " << app_cfg.report << std::endl;
  } else {
    std::cerr << "Failed to write report: " << app_cfg.report << "\n";
  }
  return 0;
}
