#pragma once

#include <string>

namespace calibration {

// 错误分类：输入非法 / 数据不足 / 病态 / 未标定。
enum class ErrorCode {
  kOk,
  kInvalidInput,
  kInsufficientData,
  kIllConditioned,
  kNotCalibrated,
};

// 操作结果：预期内的失败通过返回值传递，不抛异常。
struct Status {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  bool ok() const { return code == ErrorCode::kOk; }

  static Status Ok() { return Status{}; }
  static Status Error(ErrorCode code, const std::string& message) {
    return Status{code, message};
  }
};

// 错误码名称，用于日志与报告。
const char* ErrorCodeName(ErrorCode code);

}  // namespace calibration
