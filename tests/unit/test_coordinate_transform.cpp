#define BOOST_TEST_MODULE CoordinateTransformTests
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

#include "calibration/coordinate_transform.h"
#include "test_utilities.h"

using namespace calibration;
using namespace calibration::testing;

BOOST_AUTO_TEST_SUITE(CoordinateTransformTests)

BOOST_AUTO_TEST_CASE(NotCalibrated_ReturnsTaggedError) {
  CoordinateTransformService service;
  BOOST_CHECK(!service.isCalibrated());
  cv::Point2d out;
  BOOST_CHECK(service.imageToWorld({0.5, 0.5}, &out).code ==
              ErrorCode::kNotCalibrated);
  BOOST_CHECK(service.worldToImage({1.0, 1.0}, &out).code ==
              ErrorCode::kNotCalibrated);
  std::vector<cv::Point2d> batch;
  BOOST_CHECK(service.batchTransform({{0.5, 0.5}}, &batch).code ==
              ErrorCode::kNotCalibrated);
}

BOOST_AUTO_TEST_CASE(RoundTrip_WithinTolerance) {
  CoordinateTransformService service;
  service.publish(GroundTruthHomography());
  BOOST_REQUIRE(service.isCalibrated());

  for (double u = 0.05; u < 1.0; u += 0.15) {
    for (double v = 0.55; v < 1.0; v += 0.1) {
      cv::Point2d world, image;
      BOOST_REQUIRE(service.imageToWorld({u, v}, &world).ok());
      BOOST_REQUIRE(service.worldToImage(world, &image).ok());
      BOOST_CHECK_SMALL(image.x - u, 1e-6);
      BOOST_CHECK_SMALL(image.y - v, 1e-6);
    }
  }
}

BOOST_AUTO_TEST_CASE(ImageToWorld_RecoversCourtPoint) {
  CoordinateTransformService service;
  service.publish(GroundTruthHomography());
  cv::Point2d world;
  BOOST_REQUIRE(
      service.imageToWorld(ProjectToImage({3.05, 0.76}), &world).ok());
  BOOST_CHECK_SMALL(world.x - 3.05, 1e-6);
  BOOST_CHECK_SMALL(world.y - 0.76, 1e-6);
}

BOOST_AUTO_TEST_CASE(HorizonAndNonFinite_InvalidInput) {
  CoordinateTransformService service;
  service.publish(GroundTruthHomography());
  // 真值单应的地平线：image -> world 第三行为 0 的图像点。
  const cv::Matx33d h = GroundTruthImageToWorld();
  const double u = 0.5;
  const double v = -(h(2, 0) * u + h(2, 2)) / h(2, 1);
  cv::Point2d out;
  BOOST_CHECK(service.imageToWorld({u, v}, &out).code ==
              ErrorCode::kInvalidInput);
  BOOST_CHECK(service
                  .imageToWorld(
                      {std::numeric_limits<double>::infinity(), 0.5}, &out)
                  .code == ErrorCode::kInvalidInput);
}

BOOST_AUTO_TEST_CASE(Batch_PreservesOrderAndMarksFailures) {
  CoordinateTransformService service;
  service.publish(GroundTruthHomography());
  const cv::Matx33d h = GroundTruthImageToWorld();
  const double horizon_v = -(h(2, 0) * 0.5 + h(2, 2)) / h(2, 1);

  const std::vector<cv::Point2d> input = {
      ProjectToImage({1.0, 1.0}), {0.5, horizon_v}, ProjectToImage({5.0, 3.0}),
      {std::numeric_limits<double>::quiet_NaN(), 0.2}};
  std::vector<cv::Point2d> output;
  BOOST_REQUIRE(service.batchTransform(input, &output).ok());
  BOOST_REQUIRE_EQUAL(output.size(), input.size());
  BOOST_CHECK_SMALL(output[0].x - 1.0, 1e-6);
  BOOST_CHECK(std::isnan(output[1].x) && std::isnan(output[1].y));
  BOOST_CHECK_SMALL(output[2].x - 5.0, 1e-6);
  BOOST_CHECK_SMALL(output[2].y - 3.0, 1e-6);
  BOOST_CHECK(std::isnan(output[3].x));
}

BOOST_AUTO_TEST_CASE(Publish_ReplacesWholeMatrix) {
  CoordinateTransformService service;
  auto first = GroundTruthHomography();
  service.publish(first);
  auto snapshot = service.current();

  auto second = std::make_shared<Homography>();
  second->image_to_world = cv::Matx33d::eye();
  second->world_to_image = cv::Matx33d::eye();
  service.publish(second);

  // 旧快照不受影响。
  BOOST_CHECK(snapshot == first);
  cv::Point2d world;
  BOOST_REQUIRE(service.imageToWorld({0.25, 0.75}, &world).ok());
  BOOST_CHECK_CLOSE(world.x, 0.25, 1e-9);

  service.clear();
  BOOST_CHECK(!service.isCalibrated());
}

BOOST_AUTO_TEST_CASE(ConcurrentReaders_SeeWholeMatrices) {
  CoordinateTransformService service;
  auto identity = std::make_shared<Homography>();
  auto doubled = std::make_shared<Homography>();
  doubled->image_to_world = cv::Matx33d(2, 0, 0, 0, 2, 0, 0, 0, 1);
  doubled->world_to_image = cv::Matx33d(0.5, 0, 0, 0, 0.5, 0, 0, 0, 1);
  service.publish(identity);

  std::atomic<bool> stop(false);
  std::atomic<int> torn(0);
  std::thread reader([&]() {
    while (!stop) {
      std::vector<cv::Point2d> out;
      if (!service.batchTransform({{0.1, 0.1}, {0.3, 0.3}}, &out).ok()) continue;
      // 同一批次内两点必须使用同一矩阵。
      const double r0 = out[0].x / 0.1;
      const double r1 = out[1].x / 0.3;
      if (std::abs(r0 - r1) > 1e-9) ++torn;
    }
  });
  for (int i = 0; i < 2000; ++i) {
    service.publish(i % 2 ? identity : doubled);
  }
  stop = true;
  reader.join();
  BOOST_CHECK_EQUAL(torn.load(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
