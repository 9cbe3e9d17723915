#include "report/report_writer.h"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

#include "analysis/speed_tracker.h"

namespace report {

namespace {

// 将矩阵格式化为多行文本，方便报告展示。
std::string MatToString(const cv::Matx33d& mat) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(6);
  for (int r = 0; r < 3; ++r) {
    oss << "[";
    for (int c = 0; c < 3; ++c) {
      oss << mat(r, c);
      if (c + 1 < 3) oss << ", ";
    }
    oss << "]";
    if (r + 1 < 3) oss << "\n";
  }
  return oss.str();
}

std::string PointToString(const cv::Point2d& p, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << "(" << p.x << ", "
      << p.y << ")";
  return oss.str();
}

}  // namespace

bool WriteMarkdownReport(const std::string& path,
                         const calibration::CalibrationSession& session,
                         const TrackStats& stats) {
  calibration::CalibrationSnapshot snap;
  if (!session.snapshot(&snap)) return false;

  std::ofstream out(path);
  if (!out.is_open()) return false;

  const std::shared_ptr<const calibration::Homography>& homography =
      snap.homography;
  const calibration::CalibrationResult& result = snap.result;
  const calibration::CourtModel& court = snap.court;
  const calibration::CameraPositionModel& camera = snap.camera;

  out << "# Court Calibration Report\n\n";
  out << "Court: **" << court.name << "** (" << court.width << " m x "
      << court.length << " m)\n\n";

  out << "## Summary\n";
  if (snap.stale) {
    out << "- Status: using previous calibration (inputs changed since the "
           "last successful solve)\n";
  }
  out << "- Quality: " << calibration::QualityLabelName(result.label) << "\n";
  out << "- Accuracy: " << result.accuracy_percent << "%\n";
  out << "- Reprojection error: " << result.reprojection_error_px << " px\n";
  out << "- Base error: " << result.base_error_px << " px\n";
  out << "- Orientation penalty: " << result.orientation_penalty << "\n";
  out << "- Condition number: " << result.condition_number << "\n";
  out << "- Scale variation: " << result.scale_variation << "\n";
  out << "- Round trip error: " << result.round_trip.error << " px ("
      << (result.round_trip.passed ? "pass" : "fail") << ")\n";
  out << "- Out of court bounds: " << result.court_bounds.error * 100.0
      << "% (" << (result.court_bounds.passed ? "pass" : "fail") << ")\n";
  out << "- Point pairs: " << homography->point_count << "\n";
  if (result.has_example) {
    out << "- Example: image " << PointToString(result.example.image_point, 3)
        << " -> court " << PointToString(result.example.world_point, 2)
        << " m, " << result.example.pixels_per_meter << " px/m\n";
  }
  out << "\n";

  out << "## Camera Position\n";
  if (camera.isSet()) {
    const cv::Point3d pos = camera.estimatedPosition(court);
    out << "- Edge: " << calibration::CameraEdgeName(camera.guess().edge)
        << "\n";
    out << "- Distance: " << camera.guess().distance << " m\n";
    out << "- Height: " << camera.guess().height << " m\n";
    out << "- Estimated position: (" << pos.x << ", " << pos.y << ", "
        << pos.z << ")\n";
    out << "- Viewing angle: " << camera.viewingAngleDeg(court) << " deg\n\n";
  } else {
    out << "- Not set (uniform line weights, no orientation check)\n\n";
  }

  out << "## Lines\n";
  out << "| Line | Start | End | Angle | Observed | Expected | Penalty |\n";
  out << "|---|---|---|---|---|---|---|\n";
  for (const auto& line : snap.lines) {
    out << "| " << line.court_line_id;
    if (line.out_of_frame) out << " (out of frame)";
    out << " | " << PointToString(line.startPixels(), 1) << " | "
        << PointToString(line.endPixels(), 1);
    bool checked = false;
    for (const auto& check : result.orientation_checks) {
      if (check.court_line_id != line.court_line_id) continue;
      out << " | " << std::fixed << std::setprecision(1) << check.angle_deg
          << std::defaultfloat << " | "
          << calibration::OrientationName(check.observed) << " | "
          << calibration::OrientationName(check.expected) << " | "
          << check.penalty << " |\n";
      checked = true;
      break;
    }
    if (!checked) out << " | - | - | - | - |\n";
  }
  out << "\n";

  if (snap.stale) {
    out << "Current lines awaiting a successful solve:";
    for (const auto& line : snap.current_lines) {
      out << " " << line.court_line_id;
    }
    out << "\n\n";
  }

  out << "## Recommendations\n";
  for (const auto& text : result.recommendations) {
    out << "- " << text << "\n";
  }
  out << "\n";

  if (stats.has_track) {
    out << "## Player Track\n";
    out << "- Total frames: " << stats.total_frames << "\n";
    out << "- Tracked frames: " << stats.tracked_frames << "\n";
    out << "- Skipped frames: " << stats.skipped_frames << "\n";
    out << "- Average speed: " << analysis::MpsToKmh(stats.average_speed_mps)
        << " km/h (" << analysis::MpsToMph(stats.average_speed_mps)
        << " mph)\n";
    out << "- Max speed: " << analysis::MpsToKmh(stats.max_speed_mps)
        << " km/h (" << analysis::MpsToMph(stats.max_speed_mps) << " mph)\n";
    out << "- Distance covered: " << stats.total_distance_m << " m\n";
    out << "- Most visited zone: "
        << (stats.most_visited_zone.empty() ? "-" : stats.most_visited_zone)
        << "\n\n";
  }

  out << "## Image To Court Homography\n";
  out << "```\n" << MatToString(homography->image_to_world) << "\n```\n\n";

  out << "## Court To Image Homography\n";
  out << "```\n" << MatToString(homography->world_to_image) << "\n```\n\n";

  out.close();
  return true;
}

}  // namespace report
