#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

#include "application/range_delivery.hpp"

using namespace media_service;

namespace {

constexpr std::uint64_t kSize = 1000;
constexpr std::uint64_t kChunk = 65536;

std::optional<ByteRange> parse(std::string_view header, std::uint64_t size = kSize,
                               std::uint64_t chunk = kChunk) {
  return parseRangeHeader(header, size, chunk);
}

DeliveryOutcome decide(std::optional<std::string_view> header, std::uint64_t size = kSize,
                       std::uint64_t chunk = kChunk) {
  return selectDelivery(parseRangeHeader(header, size, chunk), size);
}

}  // namespace

TEST(RangeHeaderParser, AbsentHeaderRequestsNoRange) {
  EXPECT_FALSE(parseRangeHeader(std::nullopt, kSize, kChunk).has_value());
}

TEST(RangeHeaderParser, OtherUnitsFallBackToFullBody) {
  EXPECT_FALSE(parse("items=0-1").has_value());
  EXPECT_FALSE(parse("byte").has_value());
  EXPECT_FALSE(parse("").has_value());
  EXPECT_FALSE(parse("Bytes=0-1").has_value());
}

TEST(RangeHeaderParser, ExplicitRange) {
  auto range = parse("bytes=0-99");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->start, 0U);
  EXPECT_EQ(range->end, 99U);
  EXPECT_EQ(range->length(), 100U);
}

TEST(RangeHeaderParser, SuffixRange) {
  auto range = parse("bytes=-100");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(*range, (ByteRange{900, 999}));
}

TEST(RangeHeaderParser, SuffixCoveringWholeFile) {
  EXPECT_EQ(parse("bytes=-1000"), (ByteRange{0, 999}));
  EXPECT_EQ(parse("bytes=-1"), (ByteRange{999, 999}));
}

TEST(RangeHeaderParser, OpenEndedRangeUsesChunkWindow) {
  EXPECT_EQ(parse("bytes=950-"), (ByteRange{950, 999}));
  EXPECT_EQ(parse("bytes=100-", kSize, 10), (ByteRange{100, 109}));
  EXPECT_EQ(parse("bytes=0-", kSize, 1), (ByteRange{0, 0}));
}

TEST(RangeHeaderParser, UnparsableTokensFallBackToDefaults) {
  EXPECT_EQ(parse("bytes=abc-def", kSize, 10), (ByteRange{0, 9}));
  EXPECT_EQ(parse("bytes=20-xyz", kSize, 10), (ByteRange{20, 29}));
  EXPECT_EQ(parse("bytes=++5-9"), (ByteRange{0, 9}));
  EXPECT_EQ(parse("bytes=5-+", kSize, 10), (ByteRange{5, 14}));
  EXPECT_EQ(parse("bytes=", kSize, 10), (ByteRange{0, 9}));
  EXPECT_EQ(parse("bytes=42", kSize, 10), (ByteRange{0, 9}));
}

TEST(RangeHeaderParser, OnlyFirstRangeOfASetIsHonoured) {
  EXPECT_EQ(parse("bytes=0-9,20-29"), (ByteRange{0, 9}));
  EXPECT_EQ(parse("bytes=-5, 0-1"), (ByteRange{995, 999}));
}

TEST(RangeHeaderParser, LeadingPlusSignIsAccepted) {
  EXPECT_EQ(parse("bytes=+5-9"), (ByteRange{5, 9}));
  EXPECT_EQ(parse("bytes=5-+9"), (ByteRange{5, 9}));
  EXPECT_EQ(parse("bytes=-+5"), (ByteRange{995, 999}));
  EXPECT_EQ(decide("bytes=-+5").kind, DeliveryKind::PartialBody);
}

TEST(RangeHeaderParser, WhitespaceInsideTokensIsUnparsable) {
  EXPECT_EQ(parse("bytes= 10-19"), (ByteRange{0, 19}));
  EXPECT_EQ(parse("bytes=10- 19", kSize, 10), (ByteRange{10, 19}));
  EXPECT_EQ(parse("bytes=10 -19"), (ByteRange{0, 19}));
  EXPECT_EQ(parse("bytes=- 5"), (ByteRange{kSize, kSize}));
  // Whitespace around the whole field value is not part of the range.
  EXPECT_EQ(parse("  bytes=10-19 "), (ByteRange{10, 19}));
}

TEST(RangeHeaderParser, ChunkWindowDoesNotWrapAround) {
  constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
  auto range = parse("bytes=10-", kSize, kMax);
  EXPECT_EQ(range, (ByteRange{10, 999}));
}

TEST(ContentSelector, NoCandidateIsFullBody) {
  EXPECT_EQ(decide(std::nullopt).kind, DeliveryKind::FullBody);
  EXPECT_EQ(decide("pages=1-2").kind, DeliveryKind::FullBody);
}

TEST(ContentSelector, ValidRangeIsPartialBody) {
  auto outcome = decide("bytes=0-99");
  EXPECT_EQ(outcome.kind, DeliveryKind::PartialBody);
  EXPECT_EQ(outcome.range, (ByteRange{0, 99}));

  outcome = decide("bytes=999-999");
  EXPECT_EQ(outcome.kind, DeliveryKind::PartialBody);
  EXPECT_EQ(outcome.range.length(), 1U);
}

TEST(ContentSelector, EndAtOrPastSizeIsNotSatisfiable) {
  EXPECT_EQ(decide("bytes=0-1005").kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=0-1000").kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=0-999").kind, DeliveryKind::PartialBody);
}

TEST(ContentSelector, StartPastEndIsNotSatisfiable) {
  EXPECT_EQ(decide("bytes=500-100").kind, DeliveryKind::NotSatisfiable);
  // Default end lands before start when start is beyond the resource.
  EXPECT_EQ(decide("bytes=5000-").kind, DeliveryKind::NotSatisfiable);
}

TEST(ContentSelector, SuffixLongerThanResourceIsNotSatisfiable) {
  EXPECT_EQ(decide("bytes=-2000").kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=-1001").kind, DeliveryKind::NotSatisfiable);
}

TEST(ContentSelector, EmptySuffixIsNotSatisfiable) {
  EXPECT_EQ(decide("bytes=-0").kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=-").kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=-abc").kind, DeliveryKind::NotSatisfiable);
}

TEST(ContentSelector, AnyRangeOnEmptyResourceIsNotSatisfiable) {
  EXPECT_EQ(decide("bytes=0-", 0).kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=-1", 0).kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide("bytes=0-0", 0).kind, DeliveryKind::NotSatisfiable);
  EXPECT_EQ(decide(std::nullopt, 0).kind, DeliveryKind::FullBody);
}

TEST(ContentSelector, EveryInRangeSpanIsPartial) {
  constexpr std::uint64_t size = 17;
  for (std::uint64_t start = 0; start < size; ++start) {
    for (std::uint64_t end = start; end < size; ++end) {
      auto header = "bytes=" + std::to_string(start) + "-" + std::to_string(end);
      auto outcome = decide(header, size);
      ASSERT_EQ(outcome.kind, DeliveryKind::PartialBody) << header;
      EXPECT_EQ(outcome.range.length(), end - start + 1) << header;
    }
  }
}
