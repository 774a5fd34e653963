#pragma once

#include <cstddef>
#include <string_view>

#ifndef ALLOT_APP_VERSION
#define ALLOT_APP_VERSION "0.3.0"
#endif

#ifndef ALLOT_BUILD_RELEASE
#define ALLOT_BUILD_RELEASE "Sale Engine Phase 1"
#endif

namespace allot {

inline constexpr std::string_view kAppDisplayName = "allot::Allotment Sale Engine";
inline constexpr std::string_view kAppVersion = ALLOT_APP_VERSION;
inline constexpr std::string_view kBuildRelease = ALLOT_BUILD_RELEASE;

inline constexpr std::size_t kDefaultMaxBatchSize = 50;
inline constexpr std::size_t kMaxBatchSizeCeiling = 256;

inline constexpr std::string_view kJournalHeader = "# allot event journal v1";
inline constexpr std::string_view kStateHeader = "# allot sale state v1";
inline constexpr std::string_view kConfigHeader = "# allot engine config";

}  // namespace allot
