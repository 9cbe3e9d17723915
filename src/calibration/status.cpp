#include "calibration/status.h"

namespace calibration {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kInvalidInput:
      return "invalid_input";
    case ErrorCode::kInsufficientData:
      return "insufficient_data";
    case ErrorCode::kIllConditioned:
      return "ill_conditioned";
    case ErrorCode::kNotCalibrated:
      return "not_calibrated";
  }
  return "unknown";
}

}  // namespace calibration
