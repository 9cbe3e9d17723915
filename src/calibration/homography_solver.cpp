#include "calibration/homography_solver.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace calibration {

namespace {

constexpr double kHomogeneousEpsilon = 1e-10;
constexpr double kSingularEpsilon = 1e-12;

// 点集散布程度：协方差矩阵最小/最大特征值之比，共线时为 0。
double SpreadRatio(const std::vector<cv::Point2d>& points) {
  if (points.size() < 2) return 0.0;
  cv::Point2d mean(0.0, 0.0);
  for (const auto& p : points) mean += p;
  mean *= 1.0 / static_cast<double>(points.size());

  double sxx = 0.0, sxy = 0.0, syy = 0.0;
  for (const auto& p : points) {
    const cv::Point2d d = p - mean;
    sxx += d.x * d.x;
    sxy += d.x * d.y;
    syy += d.y * d.y;
  }
  const double half_trace = 0.5 * (sxx + syy);
  const double det = sxx * syy - sxy * sxy;
  const double disc = std::sqrt(std::max(0.0, half_trace * half_trace - det));
  const double largest = half_trace + disc;
  const double smallest = std::max(0.0, half_trace - disc);
  if (largest <= 0.0) return 0.0;
  return smallest / largest;
}

// Hartley 归一化：平移到质心，缩放到平均距离 sqrt(2)。
cv::Matx33d NormalizingTransform(const std::vector<cv::Point2d>& points) {
  cv::Point2d mean(0.0, 0.0);
  for (const auto& p : points) mean += p;
  mean *= 1.0 / static_cast<double>(points.size());

  double mean_dist = 0.0;
  for (const auto& p : points) mean_dist += cv::norm(p - mean);
  mean_dist /= static_cast<double>(points.size());

  const double s = mean_dist > 0.0 ? std::sqrt(2.0) / mean_dist : 1.0;
  return cv::Matx33d(s, 0.0, -s * mean.x,
                     0.0, s, -s * mean.y,
                     0.0, 0.0, 1.0);
}

cv::Point2d Transform(const cv::Matx33d& t, const cv::Point2d& p) {
  return cv::Point2d(t(0, 0) * p.x + t(0, 1) * p.y + t(0, 2),
                     t(1, 0) * p.x + t(1, 1) * p.y + t(1, 2));
}

}  // namespace

bool ApplyHomography(const cv::Matx33d& h, const cv::Point2d& in,
                     cv::Point2d* out) {
  const double x = h(0, 0) * in.x + h(0, 1) * in.y + h(0, 2);
  const double y = h(1, 0) * in.x + h(1, 1) * in.y + h(1, 2);
  const double w = h(2, 0) * in.x + h(2, 1) * in.y + h(2, 2);
  if (std::abs(w) < kHomogeneousEpsilon) return false;
  if (out) *out = cv::Point2d(x / w, y / w);
  return true;
}

Status BuildPointPairs(const std::vector<LineCorrespondence>& lines,
                       const CourtModel& court,
                       const CameraPositionModel& camera,
                       std::vector<PointPair>* out_pairs) {
  if (!out_pairs) {
    return Status::Error(ErrorCode::kInvalidInput, "null output pairs");
  }
  std::vector<PointPair> pairs;
  pairs.reserve(lines.size() * 2);
  for (const auto& line : lines) {
    const CourtLine* court_line = court.findLine(line.court_line_id);
    if (!court_line) {
      return Status::Error(ErrorCode::kInvalidInput,
                           "unknown court line: " + line.court_line_id);
    }
    // 场地线位于 z=0 地面，直接取 (x, y)。
    const double weight = camera.lineWeight(court_line->axis);
    pairs.push_back(PointPair{
        line.start, cv::Point2d(court_line->start.x, court_line->start.y),
        weight});
    pairs.push_back(PointPair{
        line.end, cv::Point2d(court_line->end.x, court_line->end.y), weight});
  }
  *out_pairs = pairs;
  return Status::Ok();
}

Status EstimateHomography(const std::vector<LineCorrespondence>& lines,
                          const CourtModel& court,
                          const CameraPositionModel& camera,
                          const SolverConfig& config, Homography* out) {
  if (!out) return Status::Error(ErrorCode::kInvalidInput, "null output");

  int confirmed = 0;
  for (const auto& line : lines) {
    if (line.confirmed) ++confirmed;
  }
  if (confirmed < LineCorrespondenceStore::kMinimumLines) {
    return Status::Error(ErrorCode::kInsufficientData,
                         "at least 3 confirmed lines are required, got " +
                             std::to_string(confirmed));
  }

  std::vector<LineCorrespondence> usable;
  usable.reserve(lines.size());
  for (const auto& line : lines) {
    if (!line.confirmed) continue;
    // 过短的线无法确定方向。
    if (cv::norm(line.end - line.start) < config.min_line_length) {
      return Status::Error(ErrorCode::kIllConditioned,
                           "line too short: " + line.court_line_id);
    }
    usable.push_back(line);
  }

  std::vector<PointPair> pairs;
  Status status = BuildPointPairs(usable, court, camera, &pairs);
  if (!status.ok()) return status;

  std::vector<cv::Point2d> image_points, world_points;
  image_points.reserve(pairs.size());
  world_points.reserve(pairs.size());
  for (const auto& pair : pairs) {
    image_points.push_back(pair.image);
    world_points.push_back(pair.world);
  }
  if (SpreadRatio(image_points) < config.min_spread_ratio) {
    return Status::Error(ErrorCode::kIllConditioned,
                         "drawn lines are nearly collinear");
  }
  if (SpreadRatio(world_points) < config.min_spread_ratio) {
    return Status::Error(ErrorCode::kIllConditioned,
                         "court lines are nearly collinear");
  }

  const cv::Matx33d t_image = NormalizingTransform(image_points);
  const cv::Matx33d t_world = NormalizingTransform(world_points);

  // 每个点对贡献两行，按权重缩放。
  cv::Mat a(static_cast<int>(pairs.size()) * 2, 9, CV_64F);
  for (size_t i = 0; i < pairs.size(); ++i) {
    const cv::Point2d p = Transform(t_image, pairs[i].image);
    const cv::Point2d q = Transform(t_world, pairs[i].world);
    const double w = pairs[i].weight;
    double* r0 = a.ptr<double>(static_cast<int>(2 * i));
    double* r1 = a.ptr<double>(static_cast<int>(2 * i + 1));
    const double row0[9] = {p.x, p.y, 1.0, 0.0, 0.0, 0.0,
                            -q.x * p.x, -q.x * p.y, -q.x};
    const double row1[9] = {0.0, 0.0, 0.0, p.x, p.y, 1.0,
                            -q.y * p.x, -q.y * p.y, -q.y};
    for (int c = 0; c < 9; ++c) {
      r0[c] = w * row0[c];
      r1[c] = w * row1[c];
    }
  }

  cv::Mat singular_values, u, vt;
  cv::SVD::compute(a, singular_values, u, vt, cv::SVD::FULL_UV);

  const double largest = singular_values.at<double>(0);
  const double second_smallest = singular_values.at<double>(7);
  const double condition =
      second_smallest > 0.0 ? largest / second_smallest
                            : std::numeric_limits<double>::infinity();
  if (!(condition <= config.max_condition_number)) {
    return Status::Error(ErrorCode::kIllConditioned,
                         "correspondences are too close to degenerate");
  }

  // 最小奇异值对应的右奇异向量即为解。
  const double* h = vt.ptr<double>(8);
  const cv::Matx33d h_normalized(h[0], h[1], h[2],
                                 h[3], h[4], h[5],
                                 h[6], h[7], h[8]);
  const cv::Matx33d t_world_inv(1.0 / t_world(0, 0), 0.0,
                                -t_world(0, 2) / t_world(0, 0),
                                0.0, 1.0 / t_world(1, 1),
                                -t_world(1, 2) / t_world(1, 1),
                                0.0, 0.0, 1.0);
  cv::Matx33d image_to_world = t_world_inv * h_normalized * t_image;

  const double scale = image_to_world(2, 2);
  if (std::abs(scale) < kSingularEpsilon) {
    return Status::Error(ErrorCode::kIllConditioned,
                         "homography cannot be normalized");
  }
  image_to_world *= 1.0 / scale;

  if (std::abs(cv::determinant(image_to_world)) < kSingularEpsilon) {
    return Status::Error(ErrorCode::kIllConditioned, "homography is singular");
  }
  cv::Matx33d world_to_image = image_to_world.inv(cv::DECOMP_LU);
  if (std::abs(world_to_image(2, 2)) > kSingularEpsilon) {
    world_to_image *= 1.0 / world_to_image(2, 2);
  }

  out->image_to_world = image_to_world;
  out->world_to_image = world_to_image;
  out->condition_number = condition;
  out->point_count = static_cast<int>(pairs.size());
  return Status::Ok();
}

HomographySolver::HomographySolver(const SolverConfig& config)
    : config_(config) {}

SolveResult HomographySolver::solve(const std::vector<LineCorrespondence>& lines,
                                    const CourtModel& court,
                                    const CameraPositionModel& camera) {
  SolveResult result;
  auto homography = std::make_shared<Homography>();
  result.status = EstimateHomography(lines, court, camera, config_,
                                     homography.get());
  if (!result.status.ok()) {
    // 失败时保留上一次有效结果。
    result.homography = last_good_;
    result.stale = true;
    return result;
  }
  last_good_ = homography;
  result.homography = homography;
  return result;
}

void HomographySolver::reset() { last_good_.reset(); }

}  // namespace calibration
