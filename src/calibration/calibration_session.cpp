#include "calibration/calibration_session.h"

#include <cmath>
#include <memory>
#include <stdexcept>

namespace calibration {

namespace {

void WriteLines(cv::FileStorage& fs, const std::string& key,
                const std::vector<LineCorrespondence>& lines) {
  fs << key << "[";
  for (const auto& line : lines) {
    fs << "{";
    fs << "id" << line.court_line_id;
    fs << "start" << line.start;
    fs << "end" << line.end;
    fs << "native_width" << line.native_size.width;
    fs << "native_height" << line.native_size.height;
    fs << "out_of_frame" << (line.out_of_frame ? 1 : 0);
    fs << "}";
  }
  fs << "]";
}

bool ReadMatrix(const cv::FileNode& node, cv::Matx33d* out_matrix) {
  cv::Mat mat;
  node >> mat;
  if (mat.rows != 3 || mat.cols != 3 || mat.channels() != 1) return false;
  mat.convertTo(mat, CV_64F);
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      const double value = mat.at<double>(r, c);
      if (!std::isfinite(value)) return false;
      (*out_matrix)(r, c) = value;
    }
  }
  return true;
}

// 两个方向的矩阵互为逆（相差尺度）。
bool AreInverse(const cv::Matx33d& a, const cv::Matx33d& b) {
  const cv::Matx33d product = a * b;
  if (std::abs(product(2, 2)) < 1e-12) return false;
  const cv::Matx33d normalized = product * (1.0 / product(2, 2));
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      const double expected = r == c ? 1.0 : 0.0;
      if (std::abs(normalized(r, c) - expected) > 1e-6) return false;
    }
  }
  return true;
}

}  // namespace

CalibrationSession::CalibrationSession(const SessionConfig& config)
    : config_(config),
      evaluator_(config.evaluator),
      court_(GetCourtModel(Sport::kBadminton)) {}

Status CalibrationSession::setCourtModel(const std::string& sport) {
  CourtModel model;
  Status status = GetCourtModel(sport, &model);
  if (!status.ok()) return status;

  std::lock_guard<std::mutex> lock(mutex_);
  if (model.sport == court_.sport) return Status::Ok();
  // 已绘制的线属于旧场地，全部作废。
  court_ = model;
  store_.reset();
  clearCalibrationLocked();
  markChangedLocked();
  return Status::Ok();
}

Status CalibrationSession::setCameraPosition(CameraEdge edge, double distance,
                                             double height) {
  bool recalibrate_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Status status = camera_.set(edge, distance, height);
    if (!status.ok()) return status;
    markChangedLocked();
    recalibrate_now = shouldAutoRecalibrateLocked();
  }
  if (recalibrate_now) recalibrate();
  return Status::Ok();
}

Status CalibrationSession::setCameraPosition(const std::string& edge,
                                             double distance, double height) {
  CameraEdge parsed;
  if (!ParseCameraEdge(edge, &parsed)) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "unknown camera edge: " + edge);
  }
  return setCameraPosition(parsed, distance, height);
}

Status CalibrationSession::addLine(const std::string& court_line_id,
                                   const cv::Point2d& pixel_start,
                                   const cv::Point2d& pixel_end,
                                   double native_width, double native_height,
                                   bool* out_of_frame) {
  bool recalibrate_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!court_.findLine(court_line_id)) {
      return Status::Error(ErrorCode::kInvalidInput,
                           "unknown court line for " + court_.name + ": " +
                               court_line_id);
    }
    Status status = store_.addLine(court_line_id, pixel_start, pixel_end,
                                   native_width, native_height, out_of_frame);
    if (!status.ok()) return status;
    markChangedLocked();
    recalibrate_now = shouldAutoRecalibrateLocked();
  }
  if (recalibrate_now) recalibrate();
  return Status::Ok();
}

bool CalibrationSession::removeLine(const std::string& court_line_id) {
  bool recalibrate_now = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_.removeLine(court_line_id)) return false;
    markChangedLocked();
    recalibrate_now = shouldAutoRecalibrateLocked();
  }
  if (recalibrate_now) recalibrate();
  return true;
}

void CalibrationSession::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  store_.reset();
  clearCalibrationLocked();
  markChangedLocked();
}

CalibrationOutcome CalibrationSession::recalibrate() {
  while (true) {
    std::vector<LineCorrespondence> lines;
    CourtModel court;
    CameraPositionModel camera;
    std::uint64_t revision = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines = store_.lines();
      court = court_;
      camera = camera_;
      revision = revision_;
    }

    // 求解在锁外进行，只依赖快照。
    Homography homography;
    Status status = EstimateHomography(lines, court, camera, config_.solver,
                                       &homography);
    CalibrationResult result;
    if (status.ok()) {
      result = evaluator_.evaluate(homography, lines, court, camera);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // 求解期间输入已变化：丢弃本次结果，基于最新输入重新求解。
    if (revision != revision_) continue;

    CalibrationOutcome outcome;
    outcome.status = status;
    if (status.ok()) {
      auto published = std::make_shared<const Homography>(homography);
      transforms_.publish(published);
      result_ = result;
      has_result_ = true;
      solved_revision_ = revision;
      solved_lines_ = lines;
      solved_camera_ = camera;
      outcome.fresh = true;
    } else {
      outcome.using_previous = transforms_.isCalibrated();
    }
    outcome.has_result = has_result_;
    if (has_result_) outcome.result = result_;
    if (outcome.fresh && !transforms_.isCalibrated()) {
      throw std::logic_error("published calibration is missing");
    }
    last_outcome_ = outcome;
    return outcome;
  }
}

bool CalibrationSession::currentResult(CalibrationResult* out_result) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_result_) return false;
  if (out_result) *out_result = result_;
  return true;
}

CalibrationOutcome CalibrationSession::lastOutcome() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_outcome_;
}

std::vector<std::string> CalibrationSession::missingRequiredLines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> missing;
  for (const auto& id : court_.requiredLineIds()) {
    if (!store_.find(id)) missing.push_back(id);
  }
  return missing;
}

std::vector<LineCorrespondence> CalibrationSession::lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.lines();
}

CourtModel CalibrationSession::courtModel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return court_;
}

CameraPositionModel CalibrationSession::camera() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return camera_;
}

int CalibrationSession::lineCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_.count();
}

bool CalibrationSession::snapshot(CalibrationSnapshot* out_snapshot) const {
  std::lock_guard<std::mutex> lock(mutex_);
  // 矩阵在 mutex_ 内发布，此处读取与 result_ 属于同一次求解。
  std::shared_ptr<const Homography> homography = transforms_.current();
  if (!homography || !has_result_) return false;
  if (!out_snapshot) return true;
  out_snapshot->homography = homography;
  out_snapshot->result = result_;
  out_snapshot->court = court_;
  out_snapshot->camera = solved_camera_;
  out_snapshot->lines = solved_lines_;
  out_snapshot->current_lines = store_.lines();
  out_snapshot->stale = solved_revision_ != revision_;
  return true;
}

bool CalibrationSession::saveYaml(const std::string& path) const {
  CalibrationSnapshot snap;
  if (!snapshot(&snap)) return false;
  const CameraPositionModel& cam = snap.camera;
  const CalibrationResult& result = snap.result;

  cv::FileStorage fs(path, cv::FileStorage::WRITE);
  if (!fs.isOpened()) return false;

  fs << "sport" << SportName(snap.court.sport);
  fs << "stale" << (snap.stale ? 1 : 0);
  if (cam.isSet()) {
    fs << "camera" << "{";
    fs << "edge" << CameraEdgeName(cam.guess().edge);
    fs << "distance" << cam.guess().distance;
    fs << "height" << cam.guess().height;
    fs << "position" << cam.estimatedPosition(snap.court);
    fs << "viewing_angle_deg" << cam.viewingAngleDeg(snap.court);
    fs << "}";
  }
  // lines 为求得当前矩阵的线；过期时另存尚未成功求解的当前线。
  WriteLines(fs, "lines", snap.lines);
  if (snap.stale) WriteLines(fs, "pending_lines", snap.current_lines);
  fs << "image_to_world" << cv::Mat(snap.homography->image_to_world);
  fs << "world_to_image" << cv::Mat(snap.homography->world_to_image);
  fs << "condition_number" << snap.homography->condition_number;
  fs << "reprojection_error_px" << result.reprojection_error_px;
  fs << "base_error_px" << result.base_error_px;
  fs << "orientation_penalty" << result.orientation_penalty;
  fs << "round_trip_error_px" << result.round_trip.error;
  fs << "out_of_bounds_ratio" << result.court_bounds.error;
  fs << "accuracy_percent" << result.accuracy_percent;
  fs << "quality" << QualityLabelName(result.label);

  fs.release();
  return true;
}

Status CalibrationSession::loadYaml(const std::string& path) {
  CourtModel court;
  CameraPositionModel camera;
  LineCorrespondenceStore store;
  Homography homography;
  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      return Status::Error(ErrorCode::kInvalidInput,
                           "cannot open calibration: " + path);
    }

    std::string sport;
    fs["sport"] >> sport;
    Status status = GetCourtModel(sport, &court);
    if (!status.ok()) return status;

    const cv::FileNode camera_node = fs["camera"];
    if (!camera_node.empty()) {
      std::string edge;
      double distance = 0.0, height = 0.0;
      camera_node["edge"] >> edge;
      camera_node["distance"] >> distance;
      camera_node["height"] >> height;
      status = camera.set(edge, distance, height);
      if (!status.ok()) return status;
    }

    const cv::FileNode lines_node = fs["lines"];
    if (lines_node.type() != cv::FileNode::SEQ) {
      return Status::Error(ErrorCode::kInvalidInput,
                           "calibration has no lines: " + path);
    }
    for (auto it = lines_node.begin(); it != lines_node.end(); ++it) {
      const cv::FileNode line_node = *it;
      std::string id;
      cv::Point2d start, end;
      double width = 0.0, height = 0.0;
      const cv::FileNode start_node = line_node["start"];
      const cv::FileNode end_node = line_node["end"];
      if (start_node.type() != cv::FileNode::SEQ || start_node.size() != 2 ||
          end_node.type() != cv::FileNode::SEQ || end_node.size() != 2) {
        return Status::Error(ErrorCode::kInvalidInput,
                             "line endpoints must be [x, y]: " + path);
      }
      line_node["id"] >> id;
      line_node["start"] >> start;
      line_node["end"] >> end;
      line_node["native_width"] >> width;
      line_node["native_height"] >> height;
      if (!court.findLine(id)) {
        return Status::Error(ErrorCode::kInvalidInput,
                             "unknown court line for " + court.name + ": " +
                                 id);
      }
      status = store.addLine(id, cv::Point2d(start.x * width, start.y * height),
                             cv::Point2d(end.x * width, end.y * height), width,
                             height);
      if (!status.ok()) return status;
    }
    if (!store.isComplete()) {
      return Status::Error(ErrorCode::kInsufficientData,
                           "calibration needs at least 3 lines: " + path);
    }

    if (!ReadMatrix(fs["image_to_world"], &homography.image_to_world) ||
        !ReadMatrix(fs["world_to_image"], &homography.world_to_image)) {
      return Status::Error(ErrorCode::kInvalidInput,
                           "calibration matrices must be finite 3x3: " + path);
    }
    if (!AreInverse(homography.image_to_world, homography.world_to_image)) {
      return Status::Error(ErrorCode::kIllConditioned,
                           "calibration matrices are not inverses: " + path);
    }
    fs["condition_number"] >> homography.condition_number;
    homography.point_count = 2 * store.count();
  } catch (const cv::Exception& e) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "malformed calibration " + path + ": " + e.what());
  }

  const CalibrationResult result =
      evaluator_.evaluate(homography, store.lines(), court, camera);

  std::lock_guard<std::mutex> lock(mutex_);
  court_ = court;
  camera_ = camera;
  store_ = store;
  transforms_.publish(std::make_shared<const Homography>(homography));
  result_ = result;
  has_result_ = true;
  markChangedLocked();
  solved_revision_ = revision_;
  solved_lines_ = store_.lines();
  solved_camera_ = camera_;

  CalibrationOutcome outcome;
  outcome.fresh = true;
  outcome.has_result = true;
  outcome.result = result_;
  last_outcome_ = outcome;
  return Status::Ok();
}

void CalibrationSession::markChangedLocked() { ++revision_; }

void CalibrationSession::clearCalibrationLocked() {
  transforms_.clear();
  has_result_ = false;
  result_ = CalibrationResult();
  last_outcome_ = CalibrationOutcome();
  solved_lines_.clear();
  solved_camera_ = CameraPositionModel();
}

bool CalibrationSession::shouldAutoRecalibrateLocked() const {
  return config_.auto_recalibrate && store_.isComplete();
}

}  // namespace calibration
