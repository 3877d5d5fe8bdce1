#include "poolkit/api/status.hpp"

#include <cstdio>

namespace poolkit {
namespace api {

namespace {

inline std::uint32_t PackErrorCode(std::uint8_t module, std::uint8_t status, std::uint32_t detail) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status) & 0x0Fu) << 20) |
         (detail & 0x000FFFFFu);
}

#define POOLKIT_ECODE(module, status, detail) \
  PackErrorCode(static_cast<std::uint8_t>(module), static_cast<std::uint8_t>(status), detail)

static const ErrorCatalogEntry kErrorCatalog[] = {
    // Generic families (core module, detail id 0).
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kOk, 0x0000), "CORE_OK",
     "Operation succeeded"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kInvalidArgument, 0x0000),
     "CORE_INVALID_ARGUMENT", "Invalid argument"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kNotInitialized, 0x0000),
     "CORE_NOT_INITIALIZED", "Object not initialized"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kAlreadyInitialized, 0x0000),
     "CORE_ALREADY_INITIALIZED", "Object already initialized"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kNotFound, 0x0000), "CORE_NOT_FOUND",
     "Resource not found"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kWouldBlock, 0x0000), "CORE_WOULD_BLOCK",
     "Operation would block"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kIoError, 0x0000), "CORE_IO_ERROR",
     "I/O error"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kInternalError, 0x0000),
     "CORE_INTERNAL_ERROR", "Internal error"},
    {POOLKIT_ECODE(ErrorModule::kCore, StatusCode::kUnsupported, 0x0000), "CORE_UNSUPPORTED",
     "Operation unsupported"},

    // Module detail ids; keep appending here as a unified lookup table.
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInternalError, 0x0001),
     "POOL_STORAGE_GROW_FAILED", "Pool storage could not grow to accept a released value"},
    {POOLKIT_ECODE(ErrorModule::kPool, StatusCode::kInvalidArgument, 0x0001),
     "POOL_OPTIONS_INVALID", "Pool options section has an invalid shape or type"},
    {POOLKIT_ECODE(ErrorModule::kMemory, StatusCode::kInvalidArgument, 0x0001),
     "MEM_INVALID_ALIGNMENT", "Invalid memory alignment"},
    {POOLKIT_ECODE(ErrorModule::kMemory, StatusCode::kInternalError, 0x0001),
     "MEM_ALLOC_FAILED", "Backend allocation failed"},
    {POOLKIT_ECODE(ErrorModule::kMemory, StatusCode::kWouldBlock, 0x0001),
     "MEM_BACKEND_IN_USE", "Allocator backend still has live allocations"},
    {POOLKIT_ECODE(ErrorModule::kMemory, StatusCode::kUnsupported, 0x0001),
     "MEM_BACKEND_DISABLED", "Allocator backend is not enabled in this build"},
    {POOLKIT_ECODE(ErrorModule::kJson, StatusCode::kInvalidArgument, 0x0001),
     "JSON_PARSE_FAILED", "JSON parse failed"},
    {POOLKIT_ECODE(ErrorModule::kJson, StatusCode::kNotFound, 0x0001),
     "JSON_FILE_NOT_FOUND", "JSON file not found"},
    {POOLKIT_ECODE(ErrorModule::kJson, StatusCode::kIoError, 0x0001),
     "JSON_WRITE_FAILED", "JSON file write failed"},
    {POOLKIT_ECODE(ErrorModule::kLog, StatusCode::kInvalidArgument, 0x0001),
     "LOG_CONFIG_INVALID", "Logging section has an invalid value"},
    {POOLKIT_ECODE(ErrorModule::kLog, StatusCode::kNotInitialized, 0x0001),
     "LOG_NOT_INITIALIZED", "Logging has not been initialized"},
    {POOLKIT_ECODE(ErrorModule::kLog, StatusCode::kIoError, 0x0001),
     "LOG_DIR_CREATE_FAILED", "Log directory could not be created"},
};

#undef POOLKIT_ECODE

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return PackErrorCode(static_cast<std::uint8_t>(module),
                       static_cast<std::uint8_t>(status_code), detail_id);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kApi:
      return "api";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kMemory:
      return "memory";
    case ErrorModule::kPool:
      return "pool";
    case ErrorModule::kJson:
      return "json";
    default:
      return "unknown";
  }
}

const char* StatusCodeName(StatusCode status_code) {
  switch (status_code) {
    case StatusCode::kOk:
      return "kOk";
    case StatusCode::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCode::kNotInitialized:
      return "kNotInitialized";
    case StatusCode::kAlreadyInitialized:
      return "kAlreadyInitialized";
    case StatusCode::kNotFound:
      return "kNotFound";
    case StatusCode::kWouldBlock:
      return "kWouldBlock";
    case StatusCode::kIoError:
      return "kIoError";
    case StatusCode::kInternalError:
      return "kInternalError";
    case StatusCode::kUnsupported:
      return "kUnsupported";
    default:
      return "kUnknown";
  }
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  for (std::size_t i = 0; i < sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]); ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) {
      return &kErrorCatalog[i];
    }
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11] = {0};  // "0xFFFFFFFF"
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

}  // namespace api
}  // namespace poolkit
