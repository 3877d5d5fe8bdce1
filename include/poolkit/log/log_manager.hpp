#pragma once

#include <string>

#include "poolkit/api/export.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/json/json_codec.hpp"

namespace poolkit {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

struct LoggingOptions {
  // Directory for glog files and the formatted sink file. Created on demand.
  std::string log_dir;
  // Extra sink: "<ts> [L] message" lines in <log_dir>/app.log.
  bool simple_format = false;
  // Extra sink: one JSON object per line in <log_dir>/app.jsonl. Wins over simple_format.
  bool json_format = false;
  bool logtostderr = true;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  int min_log_level = 0;
  int stderr_threshold = 2;
  int verbosity = 0;
  bool install_failure_signal_handler = false;
};

// glog setup for poolkit processes. Options come from the "log" section of
// the shared JSON config file:
// {
//   "log": {
//     "log_dir": "logs", "json_format": true, "logtostderr": false,
//     "minloglevel": "info", "stderrthreshold": "error", "v": 1
//   }
// }
// All functions are thread safe.
class POOLKIT_API LogManager {
 public:
  // Initialize glog once per process. config_path may be empty (defaults).
  // Calling Init again while initialized returns kOk and changes nothing.
  static api::Status Init(const std::string& app_name, const std::string& config_path);

  // Re-apply options from config_path. On failure the previous options stay
  // in effect. Returns kNotInitialized before Init.
  static api::Status Reload(const std::string& config_path);

  static LoggingOptions CurrentOptions();

  static void Log(LogSeverity severity, const std::string& message);

  // Flush and detach sinks, then shut glog down. Repeated calls return kOk.
  static api::Status Shutdown();

  // Parse the "log" section of a config file. Empty path yields defaults.
  static api::Result<LoggingOptions> LoadFromFile(const std::string& path);

  // Parse a "log" section object.
  static api::Status ParseOptions(const json::Json& section, LoggingOptions* out);
};

}  // namespace log
}  // namespace poolkit
