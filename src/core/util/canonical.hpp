#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace allot::util {

using FieldList = std::vector<std::pair<std::string, std::string>>;

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string to_hex(std::string_view bytes);
std::optional<std::string> from_hex(std::string_view hex);

std::optional<std::uint64_t> parse_u64(std::string_view text);
std::vector<std::string_view> split_fields(std::string_view line, char separator);

// Sorted `key=value` lines with `\n` and `\\` escaped; the hashing input for journal events.
std::string canonical_join(FieldList fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

// Reads a `key=value` file, skipping blank lines and `#` comments. nullopt when unreadable.
std::optional<std::unordered_map<std::string, std::string>> read_key_value_file(std::string_view path);

}  // namespace allot::util
