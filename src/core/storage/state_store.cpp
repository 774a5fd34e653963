#include "core/storage/state_store.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace allot {
namespace {

std::optional<Quantity> parse_quantity(std::string_view text) {
  const auto value = util::parse_u64(text);
  if (!value.has_value() || *value > std::numeric_limits<Quantity>::max()) {
    return std::nullopt;
  }
  return static_cast<Quantity>(*value);
}

std::optional<Address> parse_address(std::string_view hex) {
  auto raw = util::from_hex(hex);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return Address{std::move(*raw)};
}

std::optional<std::pair<ItemId, SaleConfig>> parse_sale_line(const std::vector<std::string_view>& fields) {
  if (fields.size() != 11U) {
    return std::nullopt;
  }

  const auto item = util::parse_u64(fields[1]);
  const auto price = util::parse_u64(fields[2]);
  const auto start = util::parse_u64(fields[3]);
  const auto end = util::parse_u64(fields[4]);
  const auto max_supply = parse_quantity(fields[5]);
  const auto max_per_address = parse_quantity(fields[6]);
  const auto total_sold = parse_quantity(fields[7]);
  auto token = parse_address(fields[8]);
  const auto version = parse_quantity(fields[10]);
  if (!item || !price || !start || !end || !max_supply || !max_per_address || !total_sold || !token || !version ||
      (fields[9] != "0" && fields[9] != "1")) {
    return std::nullopt;
  }

  return std::pair{*item, SaleConfig{
                              .price = *price,
                              .start_time = *start,
                              .end_time = *end,
                              .max_supply = *max_supply,
                              .max_per_address = *max_per_address,
                              .total_sold = *total_sold,
                              .payment_token = std::move(*token),
                              .active = fields[9] == "1",
                              .sale_version = *version,
                          }};
}

}  // namespace

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

bool StateStore::exists() const {
  std::error_code ec;
  return !path_.empty() && std::filesystem::exists(path_, ec);
}

Result StateStore::save(const EngineControls& controls, const SaleRegistry& registry,
                        const PurchaseLedger& ledger) const {
  if (path_.empty()) {
    return Result::failure(ErrorCode::StorageFailure, "State snapshot path is empty.");
  }

  std::error_code ec;
  const std::filesystem::path file_path{path_};
  if (file_path.has_parent_path()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      return Result::failure(ErrorCode::StorageFailure, "Unable to create state directory: " + ec.message());
    }
  }

  // Written beside the target and renamed over it, so a crash never leaves half a snapshot.
  const std::filesystem::path staging{path_ + ".tmp"};
  {
    std::ofstream out(staging, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure(ErrorCode::StorageFailure, "Unable to write state snapshot: " + staging.string());
    }

    out << kStateHeader << '\n';
    out << "engine\t" << util::to_hex(controls.owner.value) << '\t' << util::to_hex(controls.payment_recipient.value)
        << '\t' << (controls.paused ? '1' : '0') << '\n';

    std::vector<ItemId> items;
    items.reserve(registry.configs().size());
    for (const auto& [item, config] : registry.configs()) {
      items.push_back(item);
    }
    std::ranges::sort(items);

    for (ItemId item : items) {
      const SaleConfig& c = registry.configs().at(item);
      out << "sale\t" << item << '\t' << c.price << '\t' << c.start_time << '\t' << c.end_time << '\t'
          << c.max_supply << '\t' << c.max_per_address << '\t' << c.total_sold << '\t'
          << util::to_hex(c.payment_token.value) << '\t' << (c.active ? '1' : '0') << '\t' << c.sale_version
          << '\n';
    }
    for (ItemId item : registry.active_items()) {
      out << "index\t" << item << '\n';
    }
    for (const auto& [key, count] : ledger.entries()) {
      out << "quota\t" << key.item << '\t' << key.sale_version << '\t' << util::to_hex(key.buyer.value) << '\t'
          << count << '\n';
    }

    if (!out.good()) {
      return Result::failure(ErrorCode::StorageFailure, "Failed flushing state snapshot.");
    }
  }

  std::filesystem::rename(staging, file_path, ec);
  if (ec) {
    return Result::failure(ErrorCode::StorageFailure, "Unable to replace state snapshot: " + ec.message());
  }
  return Result::success("State snapshot written.");
}

Result StateStore::load(std::optional<EngineControls>& controls, SaleRegistry& registry,
                        PurchaseLedger& ledger) const {
  std::ifstream in(path_);
  if (!in) {
    return Result::failure(ErrorCode::StorageFailure, "Unable to read state snapshot: " + path_);
  }

  std::optional<EngineControls> engine;
  std::unordered_map<ItemId, SaleConfig> configs;
  std::vector<ItemId> index_order;
  std::map<LedgerKey, Quantity> entries;

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto fields = util::split_fields(line, '\t');
    const std::string where = "State snapshot line " + std::to_string(line_number);
    if (fields.front() == "engine" && fields.size() == 4U) {
      auto owner = parse_address(fields[1]);
      auto recipient = parse_address(fields[2]);
      if (engine.has_value() || !owner || owner->empty() || !recipient || (fields[3] != "0" && fields[3] != "1")) {
        return Result::failure(ErrorCode::StorageFailure, where + ": bad or repeated engine record.");
      }
      engine = EngineControls{
          .owner = std::move(*owner),
          .payment_recipient = std::move(*recipient),
          .paused = fields[3] == "1",
      };
    } else if (fields.front() == "sale") {
      auto sale = parse_sale_line(fields);
      if (!sale.has_value() || !configs.emplace(sale->first, std::move(sale->second)).second) {
        return Result::failure(ErrorCode::StorageFailure, where + ": bad or repeated sale record.");
      }
    } else if (fields.front() == "index" && fields.size() == 2U) {
      const auto item = util::parse_u64(fields[1]);
      if (!item.has_value()) {
        return Result::failure(ErrorCode::StorageFailure, where + ": bad index record.");
      }
      index_order.push_back(*item);
    } else if (fields.front() == "quota" && fields.size() == 5U) {
      const auto item = util::parse_u64(fields[1]);
      const auto version = parse_quantity(fields[2]);
      auto buyer = parse_address(fields[3]);
      const auto count = parse_quantity(fields[4]);
      if (!item || !version || !buyer || !count) {
        return Result::failure(ErrorCode::StorageFailure, where + ": bad quota record.");
      }
      entries[LedgerKey{.item = *item, .sale_version = *version, .buyer = std::move(*buyer)}] = *count;
    } else {
      return Result::failure(ErrorCode::StorageFailure, where + ": unknown record.");
    }
  }

  for (const auto& [key, count] : entries) {
    const auto found = configs.find(key.item);
    if (found == configs.end() || key.sale_version > found->second.sale_version) {
      return Result::failure(ErrorCode::StorageFailure, "Quota record refers to an unknown sale version.");
    }
    const SaleConfig& config = found->second;
    if (key.sale_version == config.sale_version &&
        (count > config.total_sold || (config.max_per_address > 0 && count > config.max_per_address))) {
      return Result::failure(ErrorCode::StorageFailure, "Quota record exceeds its sale limits.");
    }
  }

  const Result restored = registry.restore(std::move(configs), index_order);
  if (!restored.ok) {
    return restored;
  }
  ledger.restore(std::move(entries));
  controls = std::move(engine);
  return Result::success("State snapshot loaded.");
}

}  // namespace allot
