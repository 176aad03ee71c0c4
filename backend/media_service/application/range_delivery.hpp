#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include "domain/video.hpp"

namespace media_service {

// Turns a raw Range header value into a candidate span over a resource of
// `size` bytes. Returns nullopt when no range was requested: header absent or
// not in the `bytes=` unit. Only the first range of a range-set is honoured.
// Unparsable numbers fall back to defaults instead of failing:
//   "bytes=S-E"  start/end as given, start defaults to 0
//   "bytes=S-"   end = min(S + chunk_size, size) - 1
//   "bytes=-N"   the last N bytes; N == 0 or N > size yields a candidate
//                that validation rejects
// The candidate is not checked against `size` here.
std::optional<ByteRange> parseRangeHeader(std::optional<std::string_view> header,
                                          std::uint64_t size,
                                          std::uint64_t chunk_size);

// Full body without a candidate, NotSatisfiable when the candidate ends at or
// past `size` (or is inverted), PartialBody otherwise.
DeliveryOutcome selectDelivery(const std::optional<ByteRange>& candidate, std::uint64_t size);

}
