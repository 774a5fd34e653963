#include "core/journal/event_journal.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/model/app_meta.hpp"
#include "core/util/hash.hpp"

namespace allot {
namespace {

constexpr std::array kAllKinds = {
    EventKind::SaleConfigured,     EventKind::PurchaseCompleted,   EventKind::SaleStatusChanged,
    EventKind::SaleParamsUpdated,  EventKind::AssetLedgerUpdated,  EventKind::PaymentRecipientUpdated,
    EventKind::PauseToggled,       EventKind::ItemsWithdrawn,      EventKind::NativeWithdrawn,
    EventKind::TokenWithdrawn,     EventKind::OwnershipTransferred, EventKind::ItemsReceived,
};

std::optional<EventKind> event_kind_from_name(std::string_view text) {
  for (const EventKind kind : kAllKinds) {
    if (event_kind_name(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string serialize_event_line(const EventEnvelope& event) {
  std::ostringstream out;
  out << event.event_id << '\t' << event_kind_name(event.kind) << '\t' << event.actor << '\t' << event.unix_ts
      << '\t' << util::to_hex(event.payload) << '\n';
  return out.str();
}

std::optional<EventEnvelope> parse_event_line(std::string_view line) {
  const auto fields = util::split_fields(line, '\t');
  if (fields.size() != 5U) {
    return std::nullopt;
  }

  const auto kind = event_kind_from_name(fields[1]);
  const auto unix_ts = util::parse_u64(fields[3]);
  const auto payload = util::from_hex(fields[4]);
  if (fields[0].empty() || !kind.has_value() || !unix_ts.has_value() || !payload.has_value()) {
    return std::nullopt;
  }

  return EventEnvelope{
      .event_id = std::string{fields[0]},
      .kind = *kind,
      .actor = std::string{fields[2]},
      .unix_ts = *unix_ts,
      .payload = *payload,
  };
}

}  // namespace

std::string_view event_kind_name(EventKind kind) {
  switch (kind) {
    case EventKind::SaleConfigured:
      return "SaleConfigured";
    case EventKind::PurchaseCompleted:
      return "PurchaseCompleted";
    case EventKind::SaleStatusChanged:
      return "SaleStatusChanged";
    case EventKind::SaleParamsUpdated:
      return "SaleParamsUpdated";
    case EventKind::AssetLedgerUpdated:
      return "AssetLedgerUpdated";
    case EventKind::PaymentRecipientUpdated:
      return "PaymentRecipientUpdated";
    case EventKind::PauseToggled:
      return "PauseToggled";
    case EventKind::ItemsWithdrawn:
      return "ItemsWithdrawn";
    case EventKind::NativeWithdrawn:
      return "NativeWithdrawn";
    case EventKind::TokenWithdrawn:
      return "TokenWithdrawn";
    case EventKind::OwnershipTransferred:
      return "OwnershipTransferred";
    case EventKind::ItemsReceived:
      return "ItemsReceived";
  }
  return "Unknown";
}

Result EventJournal::open(std::string_view path) {
  path_ = std::string{path};
  events_.clear();
  skipped_lines_ = 0;

  if (!util::ensure_sodium()) {
    return Result::failure(ErrorCode::StorageFailure, "libsodium initialization failed.");
  }
  if (path_.empty()) {
    return Result::success("Journal kept in memory.");
  }

  const std::filesystem::path file_path{path_};
  std::error_code ec;
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorCode::StorageFailure, "Unable to create journal directory: " + ec.message());
    }
  }

  std::ifstream in(file_path);
  if (!in) {
    std::ofstream out(file_path, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure(ErrorCode::StorageFailure, "Unable to create journal file: " + path_);
    }
    out << kJournalHeader << '\n';
    return Result::success("Journal created.");
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto event = parse_event_line(line);
    if (!event.has_value()) {
      ++skipped_lines_;
      continue;
    }
    events_.push_back(std::move(*event));
  }

  if (skipped_lines_ > 0) {
    spdlog::warn("journal {}: skipped {} unreadable lines", path_, skipped_lines_);
  }
  return Result::success("Journal reloaded with " + std::to_string(events_.size()) + " events.");
}

std::string EventJournal::emit(EventKind kind, const Address& actor, Timestamp unix_ts, util::FieldList fields) {
  fields.emplace_back("kind", std::string{event_kind_name(kind)});
  fields.emplace_back("actor", actor.value);
  fields.emplace_back("unix_ts", std::to_string(unix_ts));
  fields.emplace_back("sequence", std::to_string(events_.size()));

  std::string payload = util::canonical_join(std::move(fields));
  EventEnvelope event{
      .event_id = util::content_id(payload),
      .kind = kind,
      .actor = actor.value,
      .unix_ts = unix_ts,
      .payload = std::move(payload),
  };

  if (const Result written = persist(event); !written.ok) {
    ++persist_failures_;
    spdlog::error("journal write failed for {} event: {}", event_kind_name(kind), written.message);
  }

  events_.push_back(std::move(event));
  return events_.back().event_id;
}

std::vector<EventEnvelope> EventJournal::events_of(EventKind kind) const {
  std::vector<EventEnvelope> matching;
  std::ranges::copy_if(events_, std::back_inserter(matching), [kind](const EventEnvelope& event) {
    return event.kind == kind;
  });
  return matching;
}

Result EventJournal::persist(const EventEnvelope& event) const {
  if (path_.empty()) {
    return Result::success();
  }

  std::ofstream out(path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorCode::StorageFailure, "Failed to open journal file.");
  }

  out << serialize_event_line(event);
  if (!out.good()) {
    return Result::failure(ErrorCode::StorageFailure, "Failed to flush journal file.");
  }
  return Result::success();
}

}  // namespace allot
