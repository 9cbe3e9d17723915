#define BOOST_TEST_MODULE PositionHeatmapTests
#include <boost/test/unit_test.hpp>

#include "analysis/position_heatmap.h"

using namespace analysis;
using calibration::GetCourtModel;
using calibration::Sport;

BOOST_AUTO_TEST_SUITE(PositionHeatmapTests)

BOOST_AUTO_TEST_CASE(ZoneName_RelativeToPlayerHalf) {
  PositionHeatmap heatmap(GetCourtModel(Sport::kBadminton));
  BOOST_CHECK_EQUAL(heatmap.zoneName({3.05, 1.0}), "back-center");
  BOOST_CHECK_EQUAL(heatmap.zoneName({3.05, 3.0}), "mid-center");
  BOOST_CHECK_EQUAL(heatmap.zoneName({0.5, 6.0}), "front-left");
  BOOST_CHECK_EQUAL(heatmap.zoneName({5.5, 6.0}), "front-right");
  // 远端半场左右镜像。
  BOOST_CHECK_EQUAL(heatmap.zoneName({0.5, 7.0}), "front-right");
  BOOST_CHECK_EQUAL(heatmap.zoneName({3.05, 12.9}), "back-center");
  BOOST_CHECK_EQUAL(heatmap.zoneName({-1.0, 2.0}), "out");
  BOOST_CHECK_EQUAL(heatmap.zoneName({3.0, 14.0}), "out");
}

BOOST_AUTO_TEST_CASE(AddSample_FiltersConfidenceAndInterval) {
  PositionHeatmap heatmap(GetCourtModel(Sport::kBadminton));
  BOOST_CHECK(!heatmap.addSample({1.0, 1.0}, 0.0, 0, 0.3));
  BOOST_CHECK(heatmap.addSample({1.0, 1.0}, 0.0, 0, 0.9));
  BOOST_CHECK(!heatmap.addSample({1.0, 2.0}, 0.01, 1, 0.9));
  BOOST_CHECK(heatmap.addSample({1.0, 2.0}, 0.1, 3, 0.9));
  BOOST_CHECK_EQUAL(heatmap.sampleCount(), 2);
  BOOST_CHECK_CLOSE(heatmap.totalDistance(), 1.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(TimeInZones_TracksMostVisited) {
  PositionHeatmap heatmap(GetCourtModel(Sport::kBadminton));
  BOOST_CHECK_EQUAL(heatmap.mostVisitedZone(), "");
  BOOST_CHECK_EQUAL(heatmap.timeInZones().size(), 9u);

  heatmap.addSample({3.05, 1.0}, 0.0, 0, 1.0);
  heatmap.addSample({3.05, 1.0}, 1.0, 30, 1.0);
  heatmap.addSample({0.5, 6.0}, 1.5, 45, 1.0);
  BOOST_CHECK_CLOSE(heatmap.timeInZones().at("back-center"), 1.0, 1e-9);
  BOOST_CHECK_CLOSE(heatmap.timeInZones().at("front-left"), 0.5, 1e-9);
  BOOST_CHECK_EQUAL(heatmap.mostVisitedZone(), "back-center");

  heatmap.clear();
  BOOST_CHECK_EQUAL(heatmap.sampleCount(), 0);
  BOOST_CHECK_EQUAL(heatmap.totalDistance(), 0.0);
  BOOST_CHECK_EQUAL(heatmap.mostVisitedZone(), "");
}

BOOST_AUTO_TEST_CASE(Generate_SmoothedAndNormalized) {
  PositionHeatmap heatmap(GetCourtModel(Sport::kBadminton));
  heatmap.addSample({3.05, 1.0}, 0.0, 0, 1.0);
  heatmap.addSample({-1.0, 2.0}, 1.0, 30, 1.0);

  const HeatmapData data = heatmap.generate();
  BOOST_CHECK_EQUAL(data.counts.rows, 54);
  BOOST_CHECK_EQUAL(data.counts.cols, 25);
  BOOST_CHECK_EQUAL(data.counts.type(), CV_32F);
  BOOST_CHECK_EQUAL(data.total_samples, 1);
  BOOST_CHECK_EQUAL(data.max_count, 1.0f);
  BOOST_CHECK_EQUAL(data.counts.at<float>(4, 12), 1.0f);
  BOOST_CHECK_CLOSE(data.cell_size_m, 0.25, 1e-9);

  BOOST_CHECK_CLOSE(data.intensity.at<float>(4, 12), 1.0f, 1e-4);
  const float neighbour = data.intensity.at<float>(4, 13);
  BOOST_CHECK(neighbour > 0.0f && neighbour < 1.0f);
  BOOST_CHECK_EQUAL(data.intensity.at<float>(10, 12), 0.0f);
}

BOOST_AUTO_TEST_CASE(Generate_EmptyIsZero) {
  HeatmapSettings settings;
  settings.smoothing_radius = 0;
  PositionHeatmap heatmap(GetCourtModel(Sport::kTennis), settings);
  const HeatmapData data = heatmap.generate();
  BOOST_CHECK_EQUAL(data.total_samples, 0);
  BOOST_CHECK_EQUAL(cv::countNonZero(data.intensity), 0);
}

BOOST_AUTO_TEST_SUITE_END()
