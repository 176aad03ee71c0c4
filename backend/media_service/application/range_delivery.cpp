#include "range_delivery.hpp"
#include <algorithm>
#include <charconv>
#include <limits>

namespace media_service {

namespace {

constexpr std::string_view kBytesUnit = "bytes=";

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Decimal digits with an optional leading '+'. Whitespace, '-' and overflow
// make the token unparsable.
std::optional<std::uint64_t> parseUnsigned(std::string_view token) {
  if (token.starts_with('+')) {
    token.remove_prefix(1);
  }
  if (token.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc{} || ptr != token.data() + token.size()) {
    return std::nullopt;
  }
  return value;
}

// end = min(start + chunk_size, size) - 1, without wrapping on either side.
// An empty window (size == 0) maps to `size`, which validation rejects.
std::uint64_t defaultEnd(std::uint64_t start, std::uint64_t size, std::uint64_t chunk_size) {
  auto window_end = chunk_size > std::numeric_limits<std::uint64_t>::max() - start
                      ? size
                      : std::min(start + chunk_size, size);
  return window_end == 0 ? size : window_end - 1;
}

} // namespace

std::optional<ByteRange> parseRangeHeader(std::optional<std::string_view> header,
                                          std::uint64_t size,
                                          std::uint64_t chunk_size) {
  if (!header) {
    return std::nullopt;
  }

  auto value = trim(*header);
  if (!value.starts_with(kBytesUnit)) {
    return std::nullopt;
  }
  value.remove_prefix(kBytesUnit.size());

  // Multi-range requests are served as their first range.
  if (auto comma = value.find(','); comma != std::string_view::npos) {
    value = value.substr(0, comma);
  }

  if (value.starts_with('-')) {
    auto suffix = parseUnsigned(value.substr(1)).value_or(0);
    if (suffix == 0 || suffix > size) {
      return ByteRange{size, size};
    }
    return ByteRange{size - suffix, size - 1};
  }

  std::string_view start_token;
  std::string_view end_token;
  if (auto dash = value.find('-'); dash != std::string_view::npos) {
    start_token = value.substr(0, dash);
    end_token = value.substr(dash + 1);
  }

  auto start = parseUnsigned(start_token).value_or(0);
  auto end = parseUnsigned(end_token);
  return ByteRange{start, end ? *end : defaultEnd(start, size, chunk_size)};
}

DeliveryOutcome selectDelivery(const std::optional<ByteRange>& candidate, std::uint64_t size) {
  if (!candidate) {
    return {DeliveryKind::FullBody, {}};
  }
  if (candidate->end >= size || candidate->start > candidate->end) {
    return {DeliveryKind::NotSatisfiable, *candidate};
  }
  return {DeliveryKind::PartialBody, *candidate};
}

}
