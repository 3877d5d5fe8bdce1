#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "poolkit/api/export.hpp"

namespace poolkit {
namespace api {

enum class StatusCode {
  kOk = 0,
  kInvalidArgument,
  kNotInitialized,
  kAlreadyInitialized,
  kNotFound,
  kWouldBlock,
  kIoError,
  kInternalError,
  kUnsupported
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kApi = 0x01,
  kLog = 0x10,
  kMemory = 0x30,
  kPool = 0x40,
  kJson = 0x60,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// Code layout: 0xMMSDDDDD
// - MM: module id
// - S: status code family (4 bits)
// - DDDDD: module-local detail id (20 bits)
POOLKIT_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                        std::uint32_t detail_id = 0);
POOLKIT_API const char* ErrorModuleName(ErrorModule module);
POOLKIT_API const char* StatusCodeName(StatusCode status_code);
POOLKIT_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
POOLKIT_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message)
      : code_(code), message_(std::move(message)),
        hex_code_(MakeErrorCode(ErrorModule::kCore, code_)) {}
  Status(StatusCode code, std::string message, ErrorModule module, std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code_, detail_id)) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // e.g. "kInvalidArgument(0x40100001): pools.<name> must be JSON object"
  std::string ToString() const {
    std::string out(StatusCodeName(code_));
    out += "(";
    out += hex_code_string();
    out += ")";
    if (!message_.empty()) {
      out += ": ";
      out += message_;
    }
    return out;
  }

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

// Value-or-status. T must be default constructible; the value is only
// meaningful when ok() is true.
template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), value_() {}
  Result(const T& value) : status_(Status::Ok()), value_(value) {}
  Result(T&& value) : status_(Status::Ok()), value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_;
};

}  // namespace api
}  // namespace poolkit
