#include "calibration/court_model.h"

namespace calibration {

namespace {

// 羽毛球场地尺寸（米）。
constexpr double kBadmintonLength = 13.4;
constexpr double kBadmintonWidth = 6.1;
constexpr double kBadmintonSinglesInset = 0.46;
constexpr double kBadmintonNetHeight = 1.524;
constexpr double kBadmintonShortServiceFromNet = 1.98;
constexpr double kBadmintonLongServiceInset = 0.76;

// 网球场地尺寸（米）。
constexpr double kTennisLength = 23.77;
constexpr double kTennisWidth = 10.97;
constexpr double kTennisSinglesInset = 1.37;
constexpr double kTennisNetHeight = 0.914;
constexpr double kTennisServiceFromNet = 6.40;

CourtLine AcrossLine(const std::string& id, double y, double x0, double x1,
                     bool required) {
  return CourtLine{id, cv::Point3d(x0, y, 0.0), cv::Point3d(x1, y, 0.0),
                   LineAxis::kAcrossWidth, required};
}

CourtLine AlongLine(const std::string& id, double x, double y0, double y1,
                    bool required) {
  return CourtLine{id, cv::Point3d(x, y0, 0.0), cv::Point3d(x, y1, 0.0),
                   LineAxis::kAlongLength, required};
}

CourtModel BuildBadminton() {
  CourtModel model;
  model.sport = Sport::kBadminton;
  model.name = "badminton";
  model.length = kBadmintonLength;
  model.width = kBadmintonWidth;
  model.net_height = kBadmintonNetHeight;

  const double net = model.netY();
  const double center_x = model.width * 0.5;
  const double short_near = net - kBadmintonShortServiceFromNet;
  const double short_far = net + kBadmintonShortServiceFromNet;
  const double long_near = kBadmintonLongServiceInset;
  const double long_far = model.length - kBadmintonLongServiceInset;

  // 近端半场：标定最少需要的三条线。
  model.lines.push_back(
      AcrossLine("service-long-doubles", long_near, 0.0, model.width, true));
  model.lines.push_back(AlongLine("center-line", center_x, short_near, 0.0, true));
  model.lines.push_back(
      AcrossLine("service-short", short_near, 0.0, model.width, true));

  model.lines.push_back(AcrossLine("baseline", 0.0, 0.0, model.width, false));
  model.lines.push_back(AcrossLine("service-long-doubles-far", long_far, 0.0,
                                   model.width, false));
  model.lines.push_back(
      AlongLine("center-line-far", center_x, short_far, model.length, false));
  model.lines.push_back(
      AcrossLine("service-short-far", short_far, 0.0, model.width, false));
  model.lines.push_back(
      AcrossLine("baseline-far", model.length, 0.0, model.width, false));

  model.lines.push_back(
      AlongLine("sideline-doubles-left", 0.0, 0.0, model.length, false));
  model.lines.push_back(AlongLine("sideline-doubles-right", model.width, 0.0,
                                  model.length, false));
  model.lines.push_back(AlongLine("sideline-singles-left",
                                  kBadmintonSinglesInset, 0.0, model.length,
                                  false));
  model.lines.push_back(AlongLine("sideline-singles-right",
                                  model.width - kBadmintonSinglesInset, 0.0,
                                  model.length, false));
  return model;
}

CourtModel BuildTennis() {
  CourtModel model;
  model.sport = Sport::kTennis;
  model.name = "tennis";
  model.length = kTennisLength;
  model.width = kTennisWidth;
  model.net_height = kTennisNetHeight;

  const double net = model.netY();
  const double center_x = model.width * 0.5;
  const double singles_left = kTennisSinglesInset;
  const double singles_right = model.width - kTennisSinglesInset;
  const double service_near = net - kTennisServiceFromNet;
  const double service_far = net + kTennisServiceFromNet;

  model.lines.push_back(AcrossLine("baseline", 0.0, 0.0, model.width, true));
  model.lines.push_back(
      AlongLine("center-service-line", center_x, service_near, net, true));
  model.lines.push_back(AcrossLine("service-line", service_near, singles_left,
                                   singles_right, true));

  model.lines.push_back(
      AcrossLine("baseline-far", model.length, 0.0, model.width, false));
  model.lines.push_back(
      AlongLine("center-service-line-far", center_x, net, service_far, false));
  model.lines.push_back(AcrossLine("service-line-far", service_far,
                                   singles_left, singles_right, false));

  model.lines.push_back(
      AlongLine("sideline-doubles-left", 0.0, 0.0, model.length, false));
  model.lines.push_back(AlongLine("sideline-doubles-right", model.width, 0.0,
                                  model.length, false));
  model.lines.push_back(AlongLine("sideline-singles-left", singles_left, 0.0,
                                  model.length, false));
  model.lines.push_back(AlongLine("sideline-singles-right", singles_right, 0.0,
                                  model.length, false));
  return model;
}

}  // namespace

const CourtLine* CourtModel::findLine(const std::string& id) const {
  for (const auto& line : lines) {
    if (line.id == id) return &line;
  }
  return nullptr;
}

std::vector<std::string> CourtModel::requiredLineIds() const {
  std::vector<std::string> ids;
  for (const auto& line : lines) {
    if (line.required) ids.push_back(line.id);
  }
  return ids;
}

CourtModel GetCourtModel(Sport sport) {
  switch (sport) {
    case Sport::kTennis:
      return BuildTennis();
    case Sport::kBadminton:
    default:
      return BuildBadminton();
  }
}

Status GetCourtModel(const std::string& sport, CourtModel* out_model) {
  if (!out_model) {
    return Status::Error(ErrorCode::kInvalidInput, "null output model");
  }
  Sport parsed;
  if (!ParseSport(sport, &parsed)) {
    return Status::Error(ErrorCode::kInvalidInput,
                         "unsupported sport: " + sport);
  }
  *out_model = GetCourtModel(parsed);
  return Status::Ok();
}

bool ParseSport(const std::string& name, Sport* out_sport) {
  if (!out_sport) return false;
  if (name == "badminton") {
    *out_sport = Sport::kBadminton;
    return true;
  }
  if (name == "tennis") {
    *out_sport = Sport::kTennis;
    return true;
  }
  return false;
}

const char* SportName(Sport sport) {
  return sport == Sport::kTennis ? "tennis" : "badminton";
}

}  // namespace calibration
