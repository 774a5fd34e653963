#include "core/util/canonical.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <ranges>
#include <utility>

namespace allot::util {
namespace {

int from_hex_digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::optional<std::string> from_hex(std::string_view hex) {
  if ((hex.size() % 2U) != 0U) {
    return std::nullopt;
  }

  std::string out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    const int hi = from_hex_digit(hex[i]);
    const int lo = from_hex_digit(hex[i + 1U]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4U) | lo));
  }
  return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string_view> split_fields(std::string_view line, char separator) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == separator) {
      fields.push_back(line.substr(start, i - start));
      start = i + 1U;
    }
  }
  return fields;
}

std::string canonical_join(FieldList fields) {
  std::ranges::sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      if (c == '\n') {
        payload.append("\\n");
      } else if (c == '\\') {
        payload.append("\\\\");
      } else {
        payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }

  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  for (std::string_view line : split_fields(payload, '\n')) {
    const auto split = line.find('=');
    if (line.empty() || split == std::string_view::npos) {
      continue;
    }

    std::string value;
    value.reserve(line.size() - split);
    bool escaping = false;
    for (char c : line.substr(split + 1U)) {
      if (escaping) {
        value.push_back(c == 'n' ? '\n' : c);
        escaping = false;
      } else if (c == '\\') {
        escaping = true;
      } else {
        value.push_back(c);
      }
    }
    parsed.emplace(std::string{line.substr(0, split)}, std::move(value));
  }

  return parsed;
}

std::optional<std::unordered_map<std::string, std::string>> read_key_value_file(std::string_view path) {
  std::ifstream in(std::string{path});
  if (!in) {
    return std::nullopt;
  }

  std::unordered_map<std::string, std::string> fields;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    fields[trim_copy(trimmed.substr(0, split))] = trim_copy(trimmed.substr(split + 1));
  }
  return fields;
}

}  // namespace allot::util
