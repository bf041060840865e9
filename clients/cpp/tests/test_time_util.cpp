#include "minitest.hpp"
#include "time_util.hpp"

using namespace lsquota;

static long long epoch_ms(const char* iso) {
  auto tp = parse_iso8601(iso);
  if (!tp) throw mini::AssertionError(std::string("unparsed: ") + iso);
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp->time_since_epoch()).count();
}

TEST(time_parses_utc_and_offsets) {
  ASSERT_EQ(epoch_ms("1970-01-01T00:00:00Z"), 0LL);
  ASSERT_EQ(epoch_ms("1970-01-02T00:00:00Z"), 86400000LL);
  ASSERT_EQ(epoch_ms("2024-02-29T12:00:00Z"), 1709208000000LL);
  ASSERT_EQ(epoch_ms("2024-02-29T14:30:00+02:30"), 1709208000000LL);
  ASSERT_EQ(epoch_ms("2024-02-29T07:00:00-05:00"), 1709208000000LL);
  ASSERT_EQ(epoch_ms("2024-02-29 12:00:00Z"), 1709208000000LL);
}

TEST(time_parses_fractions) {
  ASSERT_EQ(epoch_ms("1970-01-01T00:00:01.5Z"), 1500LL);
  ASSERT_EQ(epoch_ms("1970-01-01T00:00:00.123456789Z"), 123LL);
}

TEST(time_rejects_malformed_text) {
  ASSERT_FALSE(parse_iso8601("").has_value());
  ASSERT_FALSE(parse_iso8601("tomorrow").has_value());
  ASSERT_FALSE(parse_iso8601("2024-02-29").has_value());
  ASSERT_FALSE(parse_iso8601("2024-02-29T12:00:00").has_value());   // no zone
  ASSERT_FALSE(parse_iso8601("2023-02-29T12:00:00Z").has_value());  // not a leap year
  ASSERT_FALSE(parse_iso8601("2024-13-01T12:00:00Z").has_value());
  ASSERT_FALSE(parse_iso8601("2024-01-01T24:00:00Z").has_value());
  ASSERT_FALSE(parse_iso8601("2024-01-01T12:00:00.Z").has_value());
  ASSERT_FALSE(parse_iso8601("2024-01-01T12:00:00Zjunk").has_value());
  ASSERT_FALSE(parse_iso8601("2024-01-01T12:00:00+0200").has_value());
}

TEST(time_formats_utc) {
  auto tp = *parse_iso8601("2026-10-19T08:15:00.25+02:00");
  ASSERT_EQ(format_iso8601(tp), std::string("2026-10-19T06:15:00.250000+00:00"));
  ASSERT_EQ(format_iso8601(*parse_iso8601("2000-01-01T00:00:00Z")), std::string("2000-01-01T00:00:00+00:00"));
  ASSERT_EQ(format_iso8601(*parse_iso8601("1969-12-31T23:59:59.5Z")), std::string("1969-12-31T23:59:59.500000+00:00"));
}

TEST(time_millis_truncate_toward_zero) {
  auto base = *parse_iso8601("2026-01-01T00:00:00Z");
  ASSERT_EQ(millis_between(base, base + std::chrono::microseconds(1999)), 1LL);
  ASSERT_EQ(millis_between(base, base - std::chrono::microseconds(1999)), -1LL);
}
