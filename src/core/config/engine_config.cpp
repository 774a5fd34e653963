#include "core/config/engine_config.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace allot {

Result load_engine_config(std::string_view path, EngineConfig& out) {
  const auto values = util::read_key_value_file(path);
  if (!values.has_value()) {
    return Result::failure(ErrorCode::InvalidConfig, "Unable to read engine config: " + std::string{path});
  }

  EngineConfig parsed = out;
  for (const auto& [key, value] : *values) {
    if (key == "owner") {
      parsed.owner = Address{value};
    } else if (key == "engine_account") {
      parsed.engine_account = Address{value};
    } else if (key == "payment_recipient") {
      parsed.payment_recipient = Address{value};
    } else if (key == "max_batch_size") {
      const auto bound = util::parse_u64(value);
      if (!bound.has_value()) {
        return Result::failure(ErrorCode::InvalidConfig, "max_batch_size is not a number: " + value);
      }
      parsed.max_batch_size = static_cast<std::size_t>(*bound);
    } else if (key == "journal_path") {
      parsed.journal_path = value;
    } else if (key == "state_path") {
      parsed.state_path = value;
    } else if (key == "log_path") {
      parsed.logging.log_path = value;
    } else if (key == "log_level") {
      parsed.logging.level = util::lowercase_copy(value);
    }
  }

  const Result valid = validate_engine_config(parsed);
  if (!valid.ok) {
    return valid;
  }
  out = std::move(parsed);
  return Result::success("Engine config loaded.");
}

Result write_engine_config(std::string_view path, const EngineConfig& config) {
  if (path.empty()) {
    return Result::failure(ErrorCode::InvalidConfig, "Engine config write failed: empty path.");
  }

  std::error_code ec;
  const std::filesystem::path file_path{path};
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorCode::InvalidConfig, "Unable to create config directory: " + ec.message());
    }
  }

  std::ofstream out(file_path, std::ios::out | std::ios::trunc);
  if (!out) {
    return Result::failure(ErrorCode::InvalidConfig, "Unable to write engine config: " + file_path.string());
  }

  out << kConfigHeader << '\n';
  out << "owner=" << config.owner.value << '\n';
  out << "engine_account=" << config.engine_account.value << '\n';
  out << "payment_recipient=" << config.payment_recipient.value << '\n';
  out << "max_batch_size=" << config.max_batch_size << '\n';
  out << "journal_path=" << config.journal_path << '\n';
  out << "state_path=" << config.state_path << '\n';
  out << "log_path=" << config.logging.log_path << '\n';
  out << "log_level=" << config.logging.level << '\n';

  if (!out.good()) {
    return Result::failure(ErrorCode::InvalidConfig, "Failed writing engine config: " + file_path.string());
  }
  return Result::success("Engine config written.");
}

Result validate_engine_config(const EngineConfig& config) {
  if (config.owner.empty()) {
    return Result::failure(ErrorCode::InvalidConfig, "Engine config needs an owner address.");
  }
  if (config.engine_account.empty()) {
    return Result::failure(ErrorCode::InvalidConfig, "Engine config needs an engine account address.");
  }
  if (config.max_batch_size == 0 || config.max_batch_size > kMaxBatchSizeCeiling) {
    return Result::failure(ErrorCode::InvalidConfig,
                           "max_batch_size must be between 1 and " + std::to_string(kMaxBatchSizeCeiling) + ".");
  }
  return Result::success();
}

}  // namespace allot
