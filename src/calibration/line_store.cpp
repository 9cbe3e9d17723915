#include "calibration/line_store.h"

#include <cmath>

namespace calibration {

namespace {

bool IsFinite(const cv::Point2d& p) {
  return std::isfinite(p.x) && std::isfinite(p.y);
}

bool InsideFrame(const cv::Point2d& p) {
  return p.x >= 0.0 && p.x <= 1.0 && p.y >= 0.0 && p.y <= 1.0;
}

}  // namespace

cv::Point2d LineCorrespondence::startPixels() const {
  return cv::Point2d(start.x * native_size.width, start.y * native_size.height);
}

cv::Point2d LineCorrespondence::endPixels() const {
  return cv::Point2d(end.x * native_size.width, end.y * native_size.height);
}

Status LineCorrespondenceStore::addLine(const std::string& court_line_id,
                                        const cv::Point2d& pixel_start,
                                        const cv::Point2d& pixel_end,
                                        double native_width,
                                        double native_height,
                                        bool* out_of_frame) {
  if (court_line_id.empty()) {
    return Status::Error(ErrorCode::kInvalidInput, "court line id is empty");
  }
  if (!std::isfinite(native_width) || !std::isfinite(native_height) ||
      native_width <= 0.0 || native_height <= 0.0) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "native video dimensions must be positive");
  }
  if (!IsFinite(pixel_start) || !IsFinite(pixel_end)) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "line endpoints must be finite numbers");
  }

  LineCorrespondence line;
  line.court_line_id = court_line_id;
  line.native_size = cv::Size2d(native_width, native_height);
  line.start = cv::Point2d(pixel_start.x / native_width,
                           pixel_start.y / native_height);
  line.end =
      cv::Point2d(pixel_end.x / native_width, pixel_end.y / native_height);
  // 画面外端点保留原值，裁剪会改变线的方向与长度。
  line.out_of_frame = !InsideFrame(line.start) || !InsideFrame(line.end);
  if (out_of_frame) *out_of_frame = line.out_of_frame;

  for (auto& existing : lines_) {
    if (existing.court_line_id == court_line_id) {
      existing = line;
      return Status::Ok();
    }
  }
  lines_.push_back(line);
  return Status::Ok();
}

bool LineCorrespondenceStore::removeLine(const std::string& court_line_id) {
  for (auto it = lines_.begin(); it != lines_.end(); ++it) {
    if (it->court_line_id == court_line_id) {
      lines_.erase(it);
      return true;
    }
  }
  return false;
}

void LineCorrespondenceStore::reset() { lines_.clear(); }

int LineCorrespondenceStore::count() const {
  return static_cast<int>(lines_.size());
}

bool LineCorrespondenceStore::isComplete() const {
  return count() >= kMinimumLines;
}

const LineCorrespondence* LineCorrespondenceStore::find(
    const std::string& court_line_id) const {
  for (const auto& line : lines_) {
    if (line.court_line_id == court_line_id) return &line;
  }
  return nullptr;
}

}  // namespace calibration
