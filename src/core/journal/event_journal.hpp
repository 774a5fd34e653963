#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/util/canonical.hpp"

namespace allot {

std::string_view event_kind_name(EventKind kind);

// Append-only record of committed state changes for off-engine observers.
class EventJournal {
public:
  // An empty path keeps the journal in memory only. An existing file is reloaded.
  Result open(std::string_view path);

  // Builds, stores and (when file backed) persists one event. Returns its id. A
  // write failure is logged and counted; the in-memory entry is kept regardless.
  std::string emit(EventKind kind, const Address& actor, Timestamp unix_ts, util::FieldList fields);

  [[nodiscard]] const std::vector<EventEnvelope>& events() const { return events_; }
  [[nodiscard]] std::vector<EventEnvelope> events_of(EventKind kind) const;
  [[nodiscard]] std::size_t persist_failures() const { return persist_failures_; }
  [[nodiscard]] std::size_t skipped_lines() const { return skipped_lines_; }

private:
  Result persist(const EventEnvelope& event) const;

  std::string path_;
  std::vector<EventEnvelope> events_;
  std::size_t persist_failures_ = 0;
  std::size_t skipped_lines_ = 0;
};

}  // namespace allot
