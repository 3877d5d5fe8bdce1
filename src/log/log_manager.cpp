#include "poolkit/log/log_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

#if defined(_WIN32)
#include <direct.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif

#include <glog/logging.h>

namespace poolkit {
namespace log {

#define PK_STATUS(code, message) \
  api::Status::FromModule((code), (message), api::ErrorModule::kLog, 0x0001)

namespace {

std::mutex& GlobalMutex() {
  static std::mutex m;
  return m;
}

LoggingOptions& GlobalOptions() {
  static LoggingOptions opts;
  return opts;
}

std::unique_ptr<google::LogSink>& GlobalSink() {
  static std::unique_ptr<google::LogSink> sink;
  return sink;
}

bool& GlobalInitialized() {
  static bool initialized = false;
  return initialized;
}

bool& GlobalFailureHandlerInstalled() {
  static bool installed = false;
  return installed;
}

bool IsPathSeparator(char c) { return c == '/' || c == '\\'; }

std::string BaseName(const std::string& path) {
  std::size_t end = path.size();
  while (end > 0 && IsPathSeparator(path[end - 1])) --end;
  if (end == 0) return std::string();
  const std::size_t pos = path.find_last_of("/\\", end - 1);
  if (pos == std::string::npos) return path.substr(0, end);
  return path.substr(pos + 1, end - pos - 1);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  if (IsPathSeparator(left[left.size() - 1])) return left + right;
  return left + "/" + right;
}

bool DirectoryExists(const std::string& path) {
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
#endif
  return (info.st_mode & S_IFDIR) != 0;
}

int MakeDir(const std::string& path) {
#if defined(_WIN32)
  return _mkdir(path.c_str());
#else
  return mkdir(path.c_str(), 0755);
#endif
}

// mkdir -p.
bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (DirectoryExists(path)) return true;

  std::string current;
  std::size_t pos = 0;
  if (IsPathSeparator(path[0])) {
    current = "/";
    pos = 1;
  }
  while (pos <= path.size()) {
    const std::size_t next = path.find_first_of("/\\", pos);
    const std::string part =
        next == std::string::npos ? path.substr(pos) : path.substr(pos, next - pos);
    if (!part.empty()) {
      current = current.empty() ? part : JoinPath(current, part);
      if (!DirectoryExists(current)) {
        errno = 0;
        if (MakeDir(current) != 0 && errno != EEXIST) return false;
      }
    }
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return DirectoryExists(path);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Accepts a glog level name or its integer value.
bool ParseLevel(const json::Json& value, int* out) {
  if (value.is_number_integer()) {
    const int level = value.get<int>();
    if (level < google::GLOG_INFO || level > google::GLOG_FATAL) return false;
    *out = level;
    return true;
  }
  if (!value.is_string()) return false;
  const std::string v = ToLower(value.get<std::string>());
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else {
    return false;
  }
  return true;
}

api::Status ReadBool(const json::Json& section, const char* key, bool* out) {
  json::Json::const_iterator it = section.find(key);
  if (it == section.end()) return api::Status::Ok();
  if (!it->is_boolean()) {
    return PK_STATUS(api::StatusCode::kInvalidArgument,
                     std::string("log.") + key + " must be boolean");
  }
  *out = it->get<bool>();
  return api::Status::Ok();
}

api::Status ReadLevel(const json::Json& section, const char* key, int* out) {
  json::Json::const_iterator it = section.find(key);
  if (it == section.end()) return api::Status::Ok();
  if (!ParseLevel(*it, out)) {
    return PK_STATUS(api::StatusCode::kInvalidArgument,
                     std::string("log.") + key + " must be info|warning|error|fatal or 0..3");
  }
  return api::Status::Ok();
}

std::tm LocalTime(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm;
}

std::string TimestampPrefix() {
  using namespace std::chrono;
  const system_clock::time_point now = system_clock::now();
  const std::tm tm = LocalTime(system_clock::to_time_t(now));
  const long long us = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000LL;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d%02d%02d %02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, us);
  return std::string(buf);
}

char LevelChar(google::LogSeverity severity) {
  const char levels[] = {'I', 'W', 'E', 'F'};
  const int idx = std::min(std::max(static_cast<int>(severity), 0), 3);
  return levels[idx];
}

std::string JsonEscape(const std::string& input) {
  std::ostringstream out;
  for (std::string::const_iterator it = input.begin(); it != input.end(); ++it) {
    const unsigned char c = static_cast<unsigned char>(*it);
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
              << std::dec;
        } else {
          out << static_cast<char>(c);
        }
        break;
    }
  }
  return out.str();
}

// Writes every glog message to one file as a simple line or a JSON object.
class FormattedSink : public google::LogSink {
 public:
  enum class Mode { kSimple, kJson };

  FormattedSink(const std::string& file_path, Mode mode)
      : stream_(file_path.c_str(), std::ios::app), mode_(mode) {}

  bool is_open() const { return stream_.is_open(); }

  void send(google::LogSeverity severity, const char*, const char*, int, const std::tm*,
            const char* message, size_t message_len) override {
    std::string msg(message != NULL ? message : "", message != NULL ? message_len : 0);
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' || msg[msg.size() - 1] == '\r')) {
      msg.erase(msg.size() - 1);
    }
    std::ostringstream line;
    if (mode_ == Mode::kSimple) {
      line << TimestampPrefix() << " [" << LevelChar(severity) << "] " << msg;
    } else {
      line << "{\"ts\":\"" << TimestampPrefix() << "\",\"level\":\"" << LevelChar(severity)
           << "\",\"message\":\"" << JsonEscape(msg) << "\"}";
    }
    std::lock_guard<std::mutex> lock(stream_mu_);
    stream_ << line.str() << '\n';
    stream_.flush();
  }

 private:
  std::ofstream stream_;
  Mode mode_;
  std::mutex stream_mu_;
};

void DetachSinkLocked() {
  if (GlobalSink()) {
    google::RemoveLogSink(GlobalSink().get());
    GlobalSink().reset();
  }
}

// Caller holds GlobalMutex().
api::Status ApplyOptionsLocked(const LoggingOptions& options) {
  if (!options.log_dir.empty() && !CreateDirectories(options.log_dir)) {
    return api::Status::FromModule(api::StatusCode::kIoError,
                                   "cannot create log_dir: " + options.log_dir,
                                   api::ErrorModule::kLog, 0x0001);
  }

  std::unique_ptr<FormattedSink> sink;
  if (options.simple_format || options.json_format) {
    const std::string base = options.log_dir.empty() ? "." : options.log_dir;
    const bool use_json = options.json_format;
    sink.reset(new FormattedSink(JoinPath(base, use_json ? "app.jsonl" : "app.log"),
                                 use_json ? FormattedSink::Mode::kJson
                                          : FormattedSink::Mode::kSimple));
    if (!sink->is_open()) {
      return api::Status::FromModule(api::StatusCode::kIoError,
                                     "cannot open formatted log file under " + base,
                                     api::ErrorModule::kLog, 0x0001);
    }
  }

  FLAGS_log_dir = options.log_dir;
  FLAGS_logtostderr = options.logtostderr;
  FLAGS_alsologtostderr = options.alsologtostderr;
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !GlobalFailureHandlerInstalled()) {
    google::InstallFailureSignalHandler();
    GlobalFailureHandlerInstalled() = true;
  }

  // Rebuild the sink on every apply so reload can switch mode or path.
  DetachSinkLocked();
  if (sink) {
    GlobalSink().reset(sink.release());
    google::AddLogSink(GlobalSink().get());
  }

  GlobalOptions() = options;
  return api::Status::Ok();
}

}  // namespace

api::Status LogManager::ParseOptions(const json::Json& section, LoggingOptions* out) {
  if (out == NULL) {
    return api::Status::FromModule(api::StatusCode::kInvalidArgument, "out is null",
                                   api::ErrorModule::kLog);
  }
  if (!section.is_object()) {
    return PK_STATUS(api::StatusCode::kInvalidArgument, "log must be JSON object");
  }

  LoggingOptions options;
  json::Json::const_iterator dir = section.find("log_dir");
  if (dir != section.end()) {
    if (!dir->is_string()) {
      return PK_STATUS(api::StatusCode::kInvalidArgument, "log.log_dir must be string");
    }
    options.log_dir = dir->get<std::string>();
  }

  api::Status st = ReadBool(section, "simple_format", &options.simple_format);
  if (st.ok()) st = ReadBool(section, "json_format", &options.json_format);
  if (st.ok()) st = ReadBool(section, "logtostderr", &options.logtostderr);
  if (st.ok()) st = ReadBool(section, "alsologtostderr", &options.alsologtostderr);
  if (st.ok()) st = ReadBool(section, "colorlogtostderr", &options.colorlogtostderr);
  if (st.ok()) {
    st = ReadBool(section, "install_failure_signal_handler",
                  &options.install_failure_signal_handler);
  }
  if (st.ok()) st = ReadLevel(section, "minloglevel", &options.min_log_level);
  if (st.ok()) st = ReadLevel(section, "stderrthreshold", &options.stderr_threshold);
  if (!st.ok()) return st;

  json::Json::const_iterator v = section.find("v");
  if (v != section.end()) {
    if (!v->is_number_integer()) {
      return PK_STATUS(api::StatusCode::kInvalidArgument, "log.v must be integer");
    }
    options.verbosity = v->get<int>();
  }

  *out = options;
  return api::Status::Ok();
}

api::Result<LoggingOptions> LogManager::LoadFromFile(const std::string& path) {
  if (path.empty()) {
    return api::Result<LoggingOptions>(LoggingOptions());
  }
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(path);
  if (!loaded.ok()) {
    return api::Result<LoggingOptions>(loaded.status());
  }
  const json::Json* section = NULL;
  api::Status st =
      json::JsonCodec::FindSection(loaded.value(), "log", api::ErrorModule::kLog, &section);
  if (!st.ok()) {
    return api::Result<LoggingOptions>(st);
  }
  LoggingOptions options;
  if (section != NULL) {
    st = ParseOptions(*section, &options);
    if (!st.ok()) {
      return api::Result<LoggingOptions>(st);
    }
  }
  return api::Result<LoggingOptions>(options);
}

api::Status LogManager::Init(const std::string& app_name, const std::string& config_path) {
  api::Result<LoggingOptions> loaded = LoadFromFile(config_path);
  if (!loaded.ok()) return loaded.status();

  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (GlobalInitialized()) return api::Status::Ok();

  const std::string base = BaseName(app_name);
  const std::string program = base.empty() ? "poolkit" : base;
  google::InitGoogleLogging(program.c_str());

  api::Status st = ApplyOptionsLocked(loaded.value());
  if (!st.ok()) {
    DetachSinkLocked();
    google::ShutdownGoogleLogging();
    return st;
  }
  GlobalInitialized() = true;
  return api::Status::Ok();
}

api::Status LogManager::Reload(const std::string& config_path) {
  api::Result<LoggingOptions> loaded = LoadFromFile(config_path);

  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) {
    return api::Status::FromModule(api::StatusCode::kNotInitialized,
                                   "LogManager::Init has not been called",
                                   api::ErrorModule::kLog, 0x0001);
  }
  if (!loaded.ok()) return loaded.status();
  return ApplyOptionsLocked(loaded.value());
}

LoggingOptions LogManager::CurrentOptions() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalOptions();
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::min(std::max(static_cast<int>(severity), 0), 3);
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

api::Status LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) return api::Status::Ok();
  google::FlushLogFiles(google::GLOG_INFO);
  DetachSinkLocked();
  google::ShutdownGoogleLogging();
  GlobalOptions() = LoggingOptions();
  GlobalInitialized() = false;
  return api::Status::Ok();
}

#undef PK_STATUS

}  // namespace log
}  // namespace poolkit
