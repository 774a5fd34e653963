#include "core/util/log.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace allot::util {
namespace {

constexpr const char* kLoggerName = "allot";
constexpr const char* kLogPattern = "[%H:%M:%S.%e] [%l] %v";

spdlog::level::level_enum level_from_name(std::string_view name) {
  const spdlog::level::level_enum level = spdlog::level::from_str(lowercase_copy(name));
  // from_str answers `off` for names it does not know.
  if (level == spdlog::level::off && lowercase_copy(name) != "off") {
    return spdlog::level::info;
  }
  return level;
}

}  // namespace

Result init_logging(const LogSettings& settings) {
  std::shared_ptr<spdlog::logger> log;
  try {
    if (settings.log_path.empty()) {
      log = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
      const std::filesystem::path path{settings.log_path};
      std::error_code ec;
      if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
          return Result::failure(ErrorCode::InvalidConfig, "Unable to create log directory: " + ec.message());
        }
      }
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
      log = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    }
  } catch (const spdlog::spdlog_ex& ex) {
    return Result::failure(ErrorCode::InvalidConfig, std::string{"Logger setup failed: "} + ex.what());
  }

  log->set_level(level_from_name(settings.level));
  log->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(log));
  spdlog::set_pattern(kLogPattern);

  spdlog::info("{} v{} ({}) logging at {}", kAppDisplayName, kAppVersion, kBuildRelease, settings.level);
  return Result::success("Logging initialized.");
}

}  // namespace allot::util
