#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/model/app_meta.hpp"

namespace allot {

using ItemId = std::uint64_t;
using Amount = std::uint64_t;
using Quantity = std::uint32_t;
using Timestamp = std::uint64_t;
using SaleVersion = std::uint32_t;

enum class ErrorCode {
  None,
  // input shape
  ZeroAmount,
  ArrayLengthMismatch,
  BatchTooLarge,
  DuplicateItem,
  // state
  SaleNotFound,
  SaleNotActive,
  SaleMustBeInactive,
  NotInitialized,
  Paused,
  // admission
  InsufficientPayment,
  InvalidPaymentCurrency,
  ExceedsMaxSupply,
  ExceedsMaxPerAddress,
  InsufficientInventory,
  InvalidTimeRange,
  // arithmetic
  ArithmeticOverflow,
  // authorization
  NotOwner,
  UnauthorizedCallback,
  ReentrantCall,
  // maintenance and host
  ActiveSaleInventoryRequired,
  InvalidAddress,
  TransferFailed,
  NothingToWithdraw,
  InvalidConfig,
  StorageFailure,
};

constexpr std::string_view error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::ZeroAmount:
      return "ZeroAmount";
    case ErrorCode::ArrayLengthMismatch:
      return "ArrayLengthMismatch";
    case ErrorCode::BatchTooLarge:
      return "BatchTooLarge";
    case ErrorCode::DuplicateItem:
      return "DuplicateItem";
    case ErrorCode::SaleNotFound:
      return "SaleNotFound";
    case ErrorCode::SaleNotActive:
      return "SaleNotActive";
    case ErrorCode::SaleMustBeInactive:
      return "SaleMustBeInactive";
    case ErrorCode::NotInitialized:
      return "NotInitialized";
    case ErrorCode::Paused:
      return "Paused";
    case ErrorCode::InsufficientPayment:
      return "InsufficientPayment";
    case ErrorCode::InvalidPaymentCurrency:
      return "InvalidPaymentCurrency";
    case ErrorCode::ExceedsMaxSupply:
      return "ExceedsMaxSupply";
    case ErrorCode::ExceedsMaxPerAddress:
      return "ExceedsMaxPerAddress";
    case ErrorCode::InsufficientInventory:
      return "InsufficientInventory";
    case ErrorCode::InvalidTimeRange:
      return "InvalidTimeRange";
    case ErrorCode::ArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorCode::NotOwner:
      return "NotOwner";
    case ErrorCode::UnauthorizedCallback:
      return "UnauthorizedCallback";
    case ErrorCode::ReentrantCall:
      return "ReentrantCall";
    case ErrorCode::ActiveSaleInventoryRequired:
      return "ActiveSaleInventoryRequired";
    case ErrorCode::InvalidAddress:
      return "InvalidAddress";
    case ErrorCode::TransferFailed:
      return "TransferFailed";
    case ErrorCode::NothingToWithdraw:
      return "NothingToWithdraw";
    case ErrorCode::InvalidConfig:
      return "InvalidConfig";
    case ErrorCode::StorageFailure:
      return "StorageFailure";
  }
  return "Unknown";
}

struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorCode code, std::string msg) {
    return {false, code, std::move(msg), {}};
  }
};

struct Address {
  std::string value;

  [[nodiscard]] bool empty() const { return value.empty(); }

  friend bool operator==(const Address&, const Address&) = default;
  friend auto operator<=>(const Address&, const Address&) = default;
};

// The empty address stands for the native currency when used as a payment token.
inline bool is_native_currency(const Address& payment_token) {
  return payment_token.empty();
}

struct CallContext {
  Address caller;
  Timestamp now = 0;
  Amount value = 0;
};

struct SaleConfig {
  Amount price = 0;
  Timestamp start_time = 0;
  Timestamp end_time = 0;
  Quantity max_supply = 0;
  Quantity max_per_address = 0;
  Quantity total_sold = 0;
  Address payment_token;
  bool active = false;
  SaleVersion sale_version = 0;

  [[nodiscard]] bool exists() const { return price != 0; }
  [[nodiscard]] Quantity remaining() const { return max_supply - total_sold; }
  [[nodiscard]] bool in_window(Timestamp now) const { return start_time <= now && now <= end_time; }
};

struct SaleDraft {
  ItemId item = 0;
  Amount price = 0;
  Timestamp start_time = 0;
  Timestamp end_time = 0;
  Quantity max_supply = 0;
  Quantity max_per_address = 0;
  Address payment_token;
  bool verify_inventory = false;
};

struct SaleSnapshot {
  ItemId item = 0;
  SaleConfig config;
  bool indexed = false;
};

struct ActiveSalePage {
  std::vector<ItemId> items;
  std::vector<SaleConfig> configs;
  std::size_t total = 0;
};

struct BuyerStatus {
  ItemId item = 0;
  Address buyer;
  SaleVersion sale_version = 0;
  Quantity purchased = 0;
  Quantity remaining = 0;
  bool eligible = false;
};

struct SupplySnapshot {
  ItemId item = 0;
  Quantity max_supply = 0;
  Quantity total_sold = 0;
  Quantity remaining = 0;
  std::uint64_t held = 0;
};

struct PurchaseLine {
  ItemId item = 0;
  Quantity quantity = 0;
  Amount cost = 0;
  Address payment_token;
  SaleVersion sale_version = 0;
};

struct BatchReceipt {
  Address buyer;
  std::vector<PurchaseLine> lines;
  Amount native_charged = 0;
  Amount native_refunded = 0;
  std::size_t token_pulls = 0;
  std::string event_id;
};

enum class EventKind {
  SaleConfigured,
  PurchaseCompleted,
  SaleStatusChanged,
  SaleParamsUpdated,
  AssetLedgerUpdated,
  PaymentRecipientUpdated,
  PauseToggled,
  ItemsWithdrawn,
  NativeWithdrawn,
  TokenWithdrawn,
  OwnershipTransferred,
  ItemsReceived,
};

struct EventEnvelope {
  std::string event_id;
  EventKind kind = EventKind::SaleConfigured;
  std::string actor;
  Timestamp unix_ts = 0;
  std::string payload;
};

struct LogSettings {
  std::string log_path;
  std::string level = "info";
};

struct EngineConfig {
  Address owner;
  Address engine_account;
  Address payment_recipient;
  std::size_t max_batch_size = kDefaultMaxBatchSize;
  std::string journal_path;
  std::string state_path;
  LogSettings logging{};
};

}  // namespace allot
