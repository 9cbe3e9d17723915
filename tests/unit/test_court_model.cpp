#define BOOST_TEST_MODULE CourtModelTests
#include <boost/test/unit_test.hpp>

#include <cmath>

#include "calibration/court_model.h"

using namespace calibration;

BOOST_AUTO_TEST_SUITE(CourtModelTests)

BOOST_AUTO_TEST_CASE(Badminton_Dimensions) {
  const CourtModel court = GetCourtModel(Sport::kBadminton);
  BOOST_CHECK_EQUAL(court.name, "badminton");
  BOOST_CHECK_CLOSE(court.length, 13.4, 1e-9);
  BOOST_CHECK_CLOSE(court.width, 6.1, 1e-9);
  BOOST_CHECK_CLOSE(court.net_height, 1.524, 1e-9);
  BOOST_CHECK_CLOSE(court.netY(), 6.7, 1e-9);
}

BOOST_AUTO_TEST_CASE(Badminton_RequiredLines) {
  const CourtModel court = GetCourtModel(Sport::kBadminton);
  const std::vector<std::string> required = court.requiredLineIds();
  BOOST_REQUIRE_EQUAL(required.size(), 3u);
  BOOST_CHECK_EQUAL(required[0], "service-long-doubles");
  BOOST_CHECK_EQUAL(required[1], "center-line");
  BOOST_CHECK_EQUAL(required[2], "service-short");

  const CourtLine* long_service = court.findLine("service-long-doubles");
  BOOST_REQUIRE(long_service);
  BOOST_CHECK_CLOSE(long_service->start.y, 0.76, 1e-9);
  BOOST_CHECK_CLOSE(long_service->end.x, 6.1, 1e-9);
  BOOST_CHECK(long_service->axis == LineAxis::kAcrossWidth);

  const CourtLine* short_service = court.findLine("service-short");
  BOOST_REQUIRE(short_service);
  BOOST_CHECK_CLOSE(short_service->start.y, 4.72, 1e-9);

  const CourtLine* center = court.findLine("center-line");
  BOOST_REQUIRE(center);
  BOOST_CHECK(center->axis == LineAxis::kAlongLength);
  BOOST_CHECK_CLOSE(center->start.x, 3.05, 1e-9);
  BOOST_CHECK_CLOSE(center->start.y, 4.72, 1e-9);
  BOOST_CHECK_SMALL(center->end.y, 1e-12);
}

BOOST_AUTO_TEST_CASE(AllLines_LieOnGround) {
  for (Sport sport : {Sport::kBadminton, Sport::kTennis}) {
    const CourtModel court = GetCourtModel(sport);
    BOOST_CHECK(!court.lines.empty());
    for (const auto& line : court.lines) {
      BOOST_CHECK_EQUAL(line.start.z, 0.0);
      BOOST_CHECK_EQUAL(line.end.z, 0.0);
      BOOST_CHECK(line.start.x >= 0.0 && line.start.x <= court.width);
      BOOST_CHECK(line.end.y >= 0.0 && line.end.y <= court.length);
      if (line.axis == LineAxis::kAcrossWidth) {
        BOOST_CHECK_EQUAL(line.start.y, line.end.y);
      } else {
        BOOST_CHECK_EQUAL(line.start.x, line.end.x);
      }
    }
  }
}

BOOST_AUTO_TEST_CASE(Tennis_Dimensions) {
  const CourtModel court = GetCourtModel(Sport::kTennis);
  BOOST_CHECK_CLOSE(court.length, 23.77, 1e-9);
  BOOST_CHECK_CLOSE(court.width, 10.97, 1e-9);
  BOOST_CHECK_EQUAL(court.requiredLineIds().size(), 3u);

  const CourtLine* service = court.findLine("service-line");
  BOOST_REQUIRE(service);
  BOOST_CHECK_CLOSE(service->start.y, 23.77 * 0.5 - 6.40, 1e-9);
  BOOST_CHECK_CLOSE(service->start.x, 1.37, 1e-9);
}

BOOST_AUTO_TEST_CASE(GetCourtModel_ByName) {
  CourtModel court;
  BOOST_CHECK(GetCourtModel("tennis", &court).ok());
  BOOST_CHECK(court.sport == Sport::kTennis);

  const Status status = GetCourtModel("squash", &court);
  BOOST_CHECK(status.code == ErrorCode::kInvalidInput);
  BOOST_CHECK(court.sport == Sport::kTennis);
}

BOOST_AUTO_TEST_CASE(FindLine_UnknownReturnsNull) {
  const CourtModel court = GetCourtModel(Sport::kBadminton);
  BOOST_CHECK(court.findLine("service-line") == nullptr);
  BOOST_CHECK(court.findLine("baseline") != nullptr);
}

BOOST_AUTO_TEST_CASE(SportNames_RoundTrip) {
  Sport sport;
  BOOST_CHECK(ParseSport(SportName(Sport::kTennis), &sport));
  BOOST_CHECK(sport == Sport::kTennis);
  BOOST_CHECK(!ParseSport("Badminton", &sport));
  BOOST_CHECK_EQUAL(std::string(ErrorCodeName(ErrorCode::kNotCalibrated)),
                    "not_calibrated");
}

BOOST_AUTO_TEST_SUITE_END()
