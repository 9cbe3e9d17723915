#include "calibration/quality_evaluator.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace calibration {

namespace {

// 比例一致性采样区域（归一化坐标）与水平偏移。
const cv::Point2d kScaleRegions[] = {
    {0.5, 0.5}, {0.25, 0.25}, {0.75, 0.25}, {0.25, 0.75}, {0.75, 0.75}};
constexpr double kScaleOffset = 0.025;

// 归一化坐标差按原始分辨率换算为像素距离。
double PixelDistance(const cv::Point2d& a, const cv::Point2d& b,
                     const cv::Size2d& native_size) {
  const double dx = (a.x - b.x) * native_size.width;
  const double dy = (a.y - b.y) * native_size.height;
  return std::sqrt(dx * dx + dy * dy);
}

// 单条线两端点的投影误差（像素），投影失败返回 false。
bool EndpointErrors(const Homography& homography,
                    const LineCorrespondence& line, const CourtLine& court_line,
                    double* start_error, double* end_error) {
  cv::Point2d projected_start, projected_end;
  if (!ApplyHomography(homography.world_to_image,
                       cv::Point2d(court_line.start.x, court_line.start.y),
                       &projected_start) ||
      !ApplyHomography(homography.world_to_image,
                       cv::Point2d(court_line.end.x, court_line.end.y),
                       &projected_end)) {
    return false;
  }
  *start_error = PixelDistance(projected_start, line.start, line.native_size);
  *end_error = PixelDistance(projected_end, line.end, line.native_size);
  return true;
}

LabelThresholds DefaultThresholds(const EvaluatorConfig& config) {
  LabelThresholds thresholds;
  thresholds.excellent_below = config.excellent_below;
  thresholds.good_below = config.good_below;
  thresholds.fair_below = config.fair_below;
  thresholds.acceptable_below = config.acceptable_below;
  return thresholds;
}

QualityLabel LabelFromThresholds(double error_px, const LabelThresholds& t) {
  if (error_px < t.excellent_below) return QualityLabel::kExcellent;
  if (error_px < t.good_below) return QualityLabel::kGood;
  if (error_px < t.fair_below) return QualityLabel::kFair;
  if (error_px < t.acceptable_below) return QualityLabel::kAcceptable;
  return QualityLabel::kPoor;
}

}  // namespace

QualityEvaluator::QualityEvaluator(const EvaluatorConfig& config)
    : config_(config) {}

double QualityEvaluator::reprojectionError(
    const Homography& homography, const std::vector<LineCorrespondence>& lines,
    const CourtModel& court) const {
  double total = 0.0;
  int points = 0;
  for (const auto& line : lines) {
    if (!line.confirmed) continue;
    const CourtLine* court_line = court.findLine(line.court_line_id);
    if (!court_line) continue;
    double start_error = 0.0, end_error = 0.0;
    if (!EndpointErrors(homography, line, *court_line, &start_error,
                        &end_error)) {
      return std::numeric_limits<double>::infinity();
    }
    total += start_error + end_error;
    points += 2;
  }
  if (points == 0) return std::numeric_limits<double>::infinity();
  return total / points;
}

std::vector<LineOrientationCheck> QualityEvaluator::checkOrientation(
    const std::vector<LineCorrespondence>& lines, const CourtModel& court,
    const CameraPositionModel& camera) const {
  std::vector<LineOrientationCheck> checks;
  for (const auto& line : lines) {
    if (!line.confirmed) continue;
    const CourtLine* court_line = court.findLine(line.court_line_id);
    if (!court_line) continue;

    // 方向角在原始像素空间计算，归一化坐标会扭曲宽高比。
    const cv::Point2d delta = line.endPixels() - line.startPixels();
    LineOrientationCheck check;
    check.court_line_id = line.court_line_id;
    check.angle_deg =
        std::atan2(std::abs(delta.y), std::abs(delta.x)) * 180.0 / CV_PI;
    check.observed = classifyOrientation(check.angle_deg);

    if (camera.isSet()) {
      check.expected = camera.expectedOrientation(court_line->axis);
      if (check.observed != check.expected) {
        check.penalty += config_.wrong_orientation_penalty;
      }
      if (check.observed == ImageOrientation::kDiagonal) {
        check.penalty += config_.diagonal_penalty;
      }
    } else {
      check.expected = check.observed;
    }
    checks.push_back(check);
  }
  return checks;
}

std::vector<double> QualityEvaluator::lineAlignmentScores(
    const Homography& homography, const std::vector<LineCorrespondence>& lines,
    const CourtModel& court) const {
  std::vector<double> scores;
  for (const auto& line : lines) {
    if (!line.confirmed) continue;
    const CourtLine* court_line = court.findLine(line.court_line_id);
    double start_error = 0.0, end_error = 0.0;
    if (!court_line || !EndpointErrors(homography, line, *court_line,
                                       &start_error, &end_error)) {
      scores.push_back(0.0);
      continue;
    }
    const double average = 0.5 * (start_error + end_error);
    scores.push_back(
        std::max(0.0, 1.0 - average / config_.alignment_error_scale_px));
  }
  return scores;
}

double QualityEvaluator::scaleVariation(const Homography& homography) const {
  std::vector<double> scales;
  for (const auto& region : kScaleRegions) {
    cv::Point2d w1, w2;
    if (!ApplyHomography(homography.image_to_world,
                         region - cv::Point2d(kScaleOffset, 0.0), &w1) ||
        !ApplyHomography(homography.image_to_world,
                         region + cv::Point2d(kScaleOffset, 0.0), &w2)) {
      continue;
    }
    scales.push_back(cv::norm(w2 - w1) / (2.0 * kScaleOffset));
  }
  if (scales.size() < 2) return 1.0;

  double mean = 0.0;
  for (double s : scales) mean += s;
  mean /= static_cast<double>(scales.size());
  if (mean <= 0.0) return 1.0;

  double variance = 0.0;
  for (double s : scales) variance += (s - mean) * (s - mean);
  variance /= static_cast<double>(scales.size());
  return std::sqrt(variance) / mean;
}

ValidationCheck QualityEvaluator::roundTripCheck(
    const Homography& homography, const cv::Size2d& native_size) const {
  ValidationCheck check;
  const std::vector<cv::Point2d> points = ValidationTestPoints(native_size);
  check.tested_points = static_cast<int>(points.size());
  double total = 0.0;
  for (const auto& image : points) {
    cv::Point2d world, back;
    if (!ApplyHomography(homography.image_to_world, image, &world) ||
        !ApplyHomography(homography.world_to_image, world, &back)) {
      continue;
    }
    const double error = PixelDistance(image, back, native_size);
    total += error;
    check.max_error = std::max(check.max_error, error);
    ++check.valid_points;
  }
  if (check.valid_points == 0) {
    check.error = std::numeric_limits<double>::infinity();
    return check;
  }
  const double tolerance = config_.round_trip_tolerance_px;
  check.error = total / check.valid_points;
  check.passed =
      check.error <= tolerance && check.max_error <= 2.0 * tolerance;
  check.confidence = std::max(0.0, 1.0 - check.error / tolerance);
  return check;
}

ValidationCheck QualityEvaluator::courtBoundsCheck(
    const Homography& homography, const CourtModel& court,
    const cv::Size2d& native_size) const {
  ValidationCheck check;
  const std::vector<cv::Point2d> points = ValidationTestPoints(native_size);
  check.tested_points = static_cast<int>(points.size());
  const double margin_x = config_.court_bounds_margin * court.width;
  const double margin_y = config_.court_bounds_margin * court.length;
  int out_of_bounds = 0;
  for (const auto& image : points) {
    cv::Point2d world;
    if (!ApplyHomography(homography.image_to_world, image, &world)) continue;
    ++check.valid_points;
    if (world.x < -margin_x || world.x > court.width + margin_x ||
        world.y < -margin_y || world.y > court.length + margin_y) {
      ++out_of_bounds;
    }
  }
  if (check.valid_points == 0) {
    check.error = 1.0;
    return check;
  }
  check.error = static_cast<double>(out_of_bounds) / check.valid_points;
  check.max_error = check.error;
  check.passed = check.error < config_.max_out_of_bounds_ratio;
  check.confidence = std::max(0.0, 1.0 - check.error);
  return check;
}

CalibrationResult QualityEvaluator::evaluate(
    const Homography& homography, const std::vector<LineCorrespondence>& lines,
    const CourtModel& court, const CameraPositionModel& camera) const {
  CalibrationResult result;
  result.base_error_px = reprojectionError(homography, lines, court);
  result.orientation_checks = checkOrientation(lines, court, camera);
  for (const auto& check : result.orientation_checks) {
    result.orientation_penalty += check.penalty;
  }
  // 方向惩罚叠加到数值残差之上，再按阈值分级。
  result.reprojection_error_px =
      result.base_error_px + result.orientation_penalty;
  result.label = labelForError(result.reprojection_error_px, court);
  result.accuracy_percent = AccuracyForLabel(result.label);

  result.line_alignment_scores = lineAlignmentScores(homography, lines, court);
  result.condition_number = homography.condition_number;
  result.scale_variation = scaleVariation(homography);
  if (!lines.empty()) {
    const cv::Size2d& native_size = lines.front().native_size;
    result.round_trip = roundTripCheck(homography, native_size);
    result.court_bounds = courtBoundsCheck(homography, court, native_size);
  }

  // 示例：画面中心点及其附近的像素/米比例。
  const cv::Point2d center(0.5, 0.5);
  cv::Point2d world_center, image_origin, image_step;
  if (!lines.empty() &&
      ApplyHomography(homography.image_to_world, center, &world_center) &&
      ApplyHomography(homography.world_to_image, world_center, &image_origin) &&
      ApplyHomography(homography.world_to_image,
                      world_center + cv::Point2d(1.0, 0.0), &image_step)) {
    result.has_example = true;
    result.example.image_point = center;
    result.example.world_point = world_center;
    result.example.pixels_per_meter =
        PixelDistance(image_step, image_origin, lines.front().native_size);
  }

  if (result.reprojection_error_px >= thresholdsFor(court).fair_below) {
    result.recommendations.push_back(
        "High reprojection error. Redraw the lines precisely on the court "
        "markings.");
  }
  if (result.orientation_penalty > 0.0) {
    result.recommendations.push_back(
        "Line orientations do not match the camera position. Check the "
        "selected camera edge and the line labels.");
  }
  if (result.condition_number > config_.max_condition_number) {
    result.recommendations.push_back(
        "Lines are poorly distributed. Draw lines that spread across the "
        "frame.");
  }
  if (!result.line_alignment_scores.empty()) {
    double sum = 0.0;
    for (double s : result.line_alignment_scores) sum += s;
    if (sum / result.line_alignment_scores.size() <
        config_.min_alignment_score) {
      result.recommendations.push_back(
          "Poor line alignment. Make sure each line follows the actual court "
          "line in the video.");
    }
  }
  if (result.scale_variation > config_.max_scale_variation) {
    result.recommendations.push_back(
        "High perspective distortion. Use lines that are more evenly "
        "distributed across the court.");
  }
  if (result.round_trip.tested_points > 0 && !result.round_trip.passed) {
    result.recommendations.push_back(
        "Image and court transforms disagree on a round trip. Recalibrate to "
        "rebuild both matrices.");
  }
  if (result.court_bounds.tested_points > 0 && !result.court_bounds.passed) {
    result.recommendations.push_back(
        "Many frame points map far outside the court. Check the camera "
        "position and that each line is labelled with the right court "
        "feature.");
  }
  if (result.recommendations.empty()) {
    result.recommendations.push_back(
        "Calibration quality is good. No specific improvements needed.");
  }
  return result;
}

ImageOrientation QualityEvaluator::classifyOrientation(double angle_deg) const {
  if (angle_deg <= config_.horizontal_max_deg) {
    return ImageOrientation::kHorizontal;
  }
  if (angle_deg >= 90.0 - config_.vertical_max_deg) {
    return ImageOrientation::kVertical;
  }
  return ImageOrientation::kDiagonal;
}

LabelThresholds QualityEvaluator::thresholdsFor(const CourtModel& court) const {
  auto it = config_.sport_thresholds.find(SportName(court.sport));
  if (it != config_.sport_thresholds.end()) return it->second;
  return DefaultThresholds(config_);
}

QualityLabel QualityEvaluator::labelForError(double error_px) const {
  return LabelFromThresholds(error_px, DefaultThresholds(config_));
}

QualityLabel QualityEvaluator::labelForError(double error_px,
                                             const CourtModel& court) const {
  return LabelFromThresholds(error_px, thresholdsFor(court));
}

double AccuracyForLabel(QualityLabel label) {
  switch (label) {
    case QualityLabel::kExcellent:
      return 95.0;
    case QualityLabel::kGood:
      return 85.0;
    case QualityLabel::kFair:
      return 75.0;
    case QualityLabel::kAcceptable:
      return 65.0;
    case QualityLabel::kPoor:
    default:
      return 50.0;
  }
}

const char* QualityLabelName(QualityLabel label) {
  switch (label) {
    case QualityLabel::kExcellent:
      return "Excellent";
    case QualityLabel::kGood:
      return "Good";
    case QualityLabel::kFair:
      return "Fair";
    case QualityLabel::kAcceptable:
      return "Acceptable";
    case QualityLabel::kPoor:
    default:
      return "Poor";
  }
}

std::vector<cv::Point2d> ValidationTestPoints(const cv::Size2d& native_size) {
  std::vector<cv::Point2d> points;
  const double steps[] = {0.1, 0.3, 0.5, 0.7, 0.9};
  for (double x : steps) {
    for (double y : steps) points.emplace_back(x, y);
  }
  points.emplace_back(0.5, 0.5);
  if (native_size.width <= 0.0 || native_size.height <= 0.0) return points;
  // 四角内缩短边的 5%。
  const double margin = 0.05 * std::min(native_size.width, native_size.height);
  const double mx = margin / native_size.width;
  const double my = margin / native_size.height;
  points.emplace_back(mx, my);
  points.emplace_back(1.0 - mx, my);
  points.emplace_back(mx, 1.0 - my);
  points.emplace_back(1.0 - mx, 1.0 - my);
  return points;
}

}  // namespace calibration
