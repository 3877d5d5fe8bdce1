#include "poolkit/log/log_manager.hpp"
#include "poolkit/memory/object_pool.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#if defined(_WIN32)
#include <direct.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif

namespace {

using poolkit::api::StatusCode;
using poolkit::log::LogManager;
using poolkit::log::LogSeverity;
using poolkit::log::LoggingOptions;

std::string TempDirectory() {
#if defined(_WIN32)
  const char* temp = std::getenv("TEMP");
  if (temp && *temp) return temp;
  return ".";
#else
  const char* tmp = std::getenv("TMPDIR");
  if (tmp && *tmp) return tmp;
  return "/tmp";
#endif
}

std::string UniqueTestDir(const std::string& name) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return TempDirectory() + "/poolkit_log_" + name + "_" + std::to_string(now);
}

bool MakeDir(const std::string& path) {
#if defined(_WIN32)
  return _mkdir(path.c_str()) == 0;
#else
  return mkdir(path.c_str(), 0755) == 0;
#endif
}

void RemoveTree(const std::string& path) {
#if defined(_WIN32)
  const std::string cmd = "cmd /c if exist \"" + path + "\" rmdir /s /q \"" + path + "\" >nul 2>nul";
#else
  const std::string cmd = "rm -rf \"" + path + "\"";
#endif
  if (std::system(cmd.c_str()) != 0) {
    std::cerr << "failed to remove " << path << "\n";
  }
}

bool WriteTextFile(const std::string& path, const std::string& content) {
  std::ofstream out(path);
  if (!out.is_open()) return false;
  out << content;
  return out.good();
}

std::string ReadTextFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool TestReloadBeforeInitFails() {
  poolkit::api::Status st = LogManager::Reload("not_used.json");
  return !st.ok() && st.code() == StatusCode::kNotInitialized;
}

bool TestParseOptionsRejectsBadValues() {
  LoggingOptions options;
  poolkit::json::Json section = poolkit::json::Json::object();
  section["minloglevel"] = "loud";
  poolkit::api::Status st = LogManager::ParseOptions(section, &options);
  if (st.ok() || st.code() != StatusCode::kInvalidArgument) return false;

  section = poolkit::json::Json::object();
  section["json_format"] = "yes";
  if (LogManager::ParseOptions(section, &options).ok()) return false;

  section = poolkit::json::Json::object();
  section["stderrthreshold"] = "warning";
  section["minloglevel"] = 1;
  section["v"] = 3;
  if (!LogManager::ParseOptions(section, &options).ok()) return false;
  return options.stderr_threshold == 1 && options.min_log_level == 1 && options.verbosity == 3;
}

bool TestJsonSinkWritesFile() {
  const std::string root = UniqueTestDir("json_sink");
  const std::string logs_dir = root + "/logs";
  const std::string cfg = root + "/poolkit.json";
  if (!MakeDir(root)) return false;

  const std::string config = "{\"log\": {\"log_dir\": \"" + logs_dir +
                             "\", \"json_format\": true, \"logtostderr\": false,"
                             " \"install_failure_signal_handler\": false}}";
  if (!WriteTextFile(cfg, config)) return false;

  if (!LogManager::Init("log_manager_tests", cfg).ok()) return false;
  const LoggingOptions opts = LogManager::CurrentOptions();
  if (!opts.json_format || opts.logtostderr) {
    LogManager::Shutdown();
    return false;
  }

  LogManager::Log(LogSeverity::kInfo, "hello-json");
  LogManager::Log(LogSeverity::kError, "error-json");
  LogManager::Shutdown();

  const std::string body = ReadTextFile(logs_dir + "/app.jsonl");
  const bool ok = body.find("\"message\":\"hello-json\"") != std::string::npos &&
                  body.find("\"level\":\"E\"") != std::string::npos;

  RemoveTree(root);
  return ok;
}

bool TestReloadInvalidConfigKeepsOptions() {
  const std::string root = UniqueTestDir("reload_invalid");
  const std::string logs_dir = root + "/logs";
  const std::string good_cfg = root + "/good.json";
  const std::string bad_cfg = root + "/bad.json";
  if (!MakeDir(root)) return false;

  const std::string good = "{\"log\": {\"log_dir\": \"" + logs_dir +
                           "\", \"simple_format\": true, \"v\": 2}}";
  const std::string bad = "{\"log\": {\"v\": \"not_a_number\"}}";
  if (!WriteTextFile(good_cfg, good) || !WriteTextFile(bad_cfg, bad)) return false;

  if (!LogManager::Init("log_manager_tests", good_cfg).ok()) return false;
  const LoggingOptions before = LogManager::CurrentOptions();
  const poolkit::api::Status reload = LogManager::Reload(bad_cfg);
  const LoggingOptions after = LogManager::CurrentOptions();
  LogManager::Shutdown();

  RemoveTree(root);
  if (reload.ok()) return false;
  return before.verbosity == 2 && before.verbosity == after.verbosity &&
         before.simple_format == after.simple_format && before.log_dir == after.log_dir;
}

bool TestPoolDiagnosticsReachSink() {
  const std::string root = UniqueTestDir("pool_diag");
  const std::string cfg = root + "/poolkit.json";
  if (!MakeDir(root)) return false;

  const std::string config = "{\"log\": {\"log_dir\": \"" + root +
                             "\", \"simple_format\": true, \"logtostderr\": false, \"v\": 1}}";
  if (!WriteTextFile(cfg, config)) return false;
  if (!LogManager::Init("log_manager_tests", cfg).ok()) return false;

  poolkit::memory::ObjectPoolOptions options;
  options.name = "diag_pool";
  {
    poolkit::memory::ObjectPool<int> pool(options);
    for (int i = 0; i < 4; ++i) pool.Construct(i).Recycle();
    pool.Truncate(1);
  }
  LogManager::Shutdown();

  const std::string body = ReadTextFile(root + "/app.log");
  RemoveTree(root);
  return body.find("diag_pool") != std::string::npos &&
         body.find("[I]") != std::string::npos;
}

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"reload_before_init_fails", TestReloadBeforeInitFails},
      {"parse_options_rejects_bad_values", TestParseOptionsRejectsBadValues},
      {"json_sink_writes_file", TestJsonSinkWritesFile},
      {"reload_invalid_config_keeps_options", TestReloadInvalidConfigKeepsOptions},
      {"pool_diagnostics_reach_sink", TestPoolDiagnosticsReachSink},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
