#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"

namespace poolkit {
namespace json {

using Json = nlohmann::json;

class POOLKIT_API JsonCodec {
 public:
  // Parse JSON text into a DOM object.
  // Returns kInvalidArgument when text is not valid JSON.
  static api::Result<Json> Parse(const std::string& text);

  // Load and parse a JSON file from disk.
  // Returns kNotFound when file does not exist.
  static api::Result<Json> LoadFile(const std::string& path);

  // Serialize JSON to file.
  // Returns kIoError on write failures.
  static api::Status SaveFile(const std::string& path, const Json& value, int indent = 2);

  // Serialize JSON to UTF-8 string for logging/debugging.
  static std::string Dump(const Json& value, int indent = 2);

  // Look up an optional object section. *out is NULL when key is absent.
  // Returns kInvalidArgument (module given by caller) when the key exists but
  // is not an object.
  static api::Status FindSection(const Json& root, const char* key, api::ErrorModule module,
                                 const Json** out);
};

}  // namespace json
}  // namespace poolkit
