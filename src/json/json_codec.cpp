#include "poolkit/json/json_codec.hpp"

#include <fstream>
#include <sstream>

namespace poolkit {
namespace json {

#define PK_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kJson, 0x0001)

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const Json::exception& ex) {
    return api::Result<Json>(PK_STATUS(api::StatusCode::kInvalidArgument,
                                       std::string("json parse failed: ") + ex.what()));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(
        PK_STATUS(api::StatusCode::kNotFound, "json file not found: " + path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

api::Status JsonCodec::SaveFile(const std::string& path, const Json& value, int indent) {
  std::ofstream out(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return PK_STATUS(api::StatusCode::kIoError, "open json file for write failed: " + path);
  }
  try {
    out << value.dump(indent);
    out << "\n";
  } catch (const Json::exception& ex) {
    return PK_STATUS(api::StatusCode::kIoError, std::string("json write failed: ") + ex.what());
  }
  if (!out.good()) {
    return PK_STATUS(api::StatusCode::kIoError, "json write failed: " + path);
  }
  return api::Status::Ok();
}

std::string JsonCodec::Dump(const Json& value, int indent) {
  // Replace invalid UTF-8 rather than throwing; this is a diagnostics path.
  return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

api::Status JsonCodec::FindSection(const Json& root, const char* key, api::ErrorModule module,
                                   const Json** out) {
  *out = NULL;
  if (!root.is_object()) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                   "root JSON must be object", module, 0x0001);
  }
  Json::const_iterator it = root.find(key);
  if (it == root.end()) {
    return api::Status::Ok();
  }
  if (!it->is_object()) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument,
                                   std::string(key) + " must be JSON object", module, 0x0001);
  }
  *out = &(*it);
  return api::Status::Ok();
}

#undef PK_STATUS

}  // namespace json
}  // namespace poolkit
