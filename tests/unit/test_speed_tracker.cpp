#define BOOST_TEST_MODULE SpeedTrackerTests
#include <boost/test/unit_test.hpp>

#include <cmath>

#include "analysis/speed_tracker.h"
#include "test_utilities.h"

using namespace analysis;
using namespace calibration;
using namespace calibration::testing;

BOOST_AUTO_TEST_SUITE(SpeedTrackerTests)

BOOST_AUTO_TEST_CASE(NotCalibrated_NoStateChange) {
  CoordinateTransformService transforms;
  SpeedTracker tracker(transforms);
  const Status status = tracker.update(0, 0.0, FeetAt({1.0, 2.0}));
  BOOST_CHECK(status.code == ErrorCode::kNotCalibrated);
  BOOST_CHECK(!tracker.metrics().valid);

  // 标定后首帧仍是第一帧，不会产生速度。
  transforms.publish(GroundTruthHomography());
  BOOST_REQUIRE(tracker.update(1, 0.1, FeetAt({1.0, 2.0})).ok());
  const SpeedMetrics m = tracker.metrics();
  BOOST_CHECK(m.valid);
  BOOST_CHECK(m.samples.empty());
  BOOST_CHECK_EQUAL(m.total_distance_m, 0.0);
}

BOOST_AUTO_TEST_CASE(Speed_FromGroundDisplacement) {
  CoordinateTransformService transforms;
  transforms.publish(GroundTruthHomography());
  SpeedTracker tracker(transforms);

  BOOST_REQUIRE(tracker.update(0, 0.0, FeetAt({1.0, 2.0})).ok());
  BOOST_REQUIRE(tracker.update(15, 0.5, FeetAt({1.0, 3.0})).ok());

  SpeedMetrics m = tracker.metrics();
  BOOST_REQUIRE(m.valid);
  BOOST_CHECK_CLOSE(m.current_speed_mps, 2.0, 1e-4);
  BOOST_CHECK_CLOSE(m.right_foot_speed_mps, 2.0, 1e-4);
  BOOST_CHECK_SMALL(m.velocity.x, 1e-5);
  BOOST_CHECK_CLOSE(m.velocity.y, 2.0, 1e-4);
  BOOST_CHECK_CLOSE(m.total_distance_m, 1.0, 1e-4);
  BOOST_CHECK_CLOSE(m.court_position.y, 3.0, 1e-4);
  BOOST_CHECK_EQUAL(m.frame, 15);

  // 静止一帧：当前速度为 0，窗口平均减半。
  BOOST_REQUIRE(tracker.update(30, 1.0, FeetAt({1.0, 3.0})).ok());
  m = tracker.metrics();
  BOOST_CHECK_SMALL(m.current_speed_mps, 1e-6);
  BOOST_CHECK_CLOSE(m.average_speed_mps, 1.0, 1e-4);
  BOOST_CHECK_EQUAL(m.samples.size(), 2u);
}

BOOST_AUTO_TEST_CASE(SmoothingWindow_Bounded) {
  CoordinateTransformService transforms;
  transforms.publish(GroundTruthHomography());
  SpeedTrackerConfig config;
  config.smoothing_window = 3;
  SpeedTracker tracker(transforms, config);

  for (int i = 0; i < 10; ++i) {
    BOOST_REQUIRE(tracker.update(i, 0.1 * i, FeetAt({1.0, 1.0 + 0.1 * i})).ok());
  }
  const SpeedMetrics m = tracker.metrics();
  BOOST_CHECK_EQUAL(m.samples.size(), 3u);
  BOOST_CHECK_EQUAL(m.samples.back().frame, 9);
  BOOST_CHECK_CLOSE(m.average_speed_mps, 1.0, 1e-3);
  BOOST_CHECK_CLOSE(m.total_distance_m, 0.9, 1e-3);
}

BOOST_AUTO_TEST_CASE(NoVisibleFeet_FrameSkipped) {
  CoordinateTransformService transforms;
  transforms.publish(GroundTruthHomography());
  SpeedTracker tracker(transforms);
  BOOST_REQUIRE(tracker.update(0, 0.0, FeetAt({1.0, 2.0})).ok());

  const Status status = tracker.update(1, 0.1, FeetAt({1.0, 4.0}, 0.2));
  BOOST_CHECK(status.code == ErrorCode::kInsufficientData);
  BOOST_CHECK(tracker.update(2, 0.2, {}).code == ErrorCode::kInsufficientData);
  const SpeedMetrics m = tracker.metrics();
  BOOST_CHECK_EQUAL(m.frame, 0);
  BOOST_CHECK(m.samples.empty());

  tracker.reset();
  BOOST_CHECK(!tracker.metrics().valid);
}

BOOST_AUTO_TEST_CASE(UnitConversions) {
  BOOST_CHECK_CLOSE(MpsToKmh(10.0), 36.0, 1e-9);
  BOOST_CHECK_CLOSE(MpsToMph(1.0), 2.23694, 1e-9);
  BOOST_CHECK_EQUAL(MpsToKmh(0.0), 0.0);
}

BOOST_AUTO_TEST_CASE(ProjectLandmarks_EstimatesHeights) {
  CoordinateTransformService transforms;
  std::vector<PoseLandmark> landmarks = FeetAt({2.0, 2.0});
  std::vector<cv::Point3d> points;
  BOOST_CHECK(ProjectLandmarksToCourt(transforms, landmarks, &points).code ==
              ErrorCode::kNotCalibrated);

  transforms.publish(GroundTruthHomography());
  const cv::Point2d image = ProjectToImage({2.0, 2.0});
  for (auto& lm : landmarks) {
    lm.x = image.x;
    lm.y = image.y;
  }
  BOOST_REQUIRE(ProjectLandmarksToCourt(transforms, landmarks, &points).ok());
  BOOST_REQUIRE_EQUAL(points.size(), 33u);
  BOOST_CHECK_CLOSE(points[0].z, 1.5, 1e-9);
  BOOST_CHECK_CLOSE(points[kRightShoulder].z, 1.5, 1e-9);
  BOOST_CHECK_CLOSE(points[kLeftHip].z, 0.9, 1e-9);
  BOOST_CHECK_CLOSE(points[15].z, 0.7, 1e-9);
  BOOST_CHECK_EQUAL(points[kLeftHeel].z, 0.0);
  BOOST_CHECK_EQUAL(points[kRightFootIndex].z, 0.0);
  BOOST_CHECK_CLOSE(points[kRightFootIndex].x, 2.0, 1e-4);

  landmarks[5].x = std::nan("");
  BOOST_REQUIRE(ProjectLandmarksToCourt(transforms, landmarks, &points).ok());
  BOOST_CHECK(std::isnan(points[5].z));
  BOOST_CHECK_CLOSE(points[6].z, 1.5, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
