#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace allot {

// Engine config file: `key=value` lines, `#` comments.
//
//   owner=<address>            engine_account=<address>    payment_recipient=<address>
//   max_batch_size=<1..256>    journal_path=<path>         state_path=<path>
//   log_path=<path>            log_level=<trace|debug|info|warn|error|critical|off>
//
// Unknown keys are ignored; missing keys keep the defaults already in `out`.
Result load_engine_config(std::string_view path, EngineConfig& out);
Result write_engine_config(std::string_view path, const EngineConfig& config);

Result validate_engine_config(const EngineConfig& config);

}  // namespace allot
