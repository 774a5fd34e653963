#pragma once

#include "core/model/types.hpp"

namespace allot::util {

// Installs the process-wide spdlog logger. A non-empty `log_path` logs to that file,
// otherwise to stdout. Unknown level names fall back to `info`.
Result init_logging(const LogSettings& settings);

}  // namespace allot::util
