#include "jobforge/util/time.hpp"

#include "jobforge/util/conv.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>

namespace jobforge::util {

namespace {

[[nodiscard]] auto expect(std::string_view &s, char c) -> bool {
  if (s.empty() || s.front() != c) {
    return false;
  }
  s.remove_prefix(1);
  return true;
}

[[nodiscard]] auto consume_fixed(std::string_view &s, std::size_t digits)
    -> Result<int> {
  if (s.size() < digits) {
    return fail(Error::ParseError);
  }
  auto head = s.substr(0, digits);
  auto value = parse_int<int>(head);
  if (value) {
    s.remove_prefix(digits);
  }
  return value;
}

// Fraction digits after a '.' or ',' as nanoseconds; extra digits beyond
// nanosecond precision are dropped.
[[nodiscard]] auto consume_fraction(std::string_view &s)
    -> std::chrono::nanoseconds {
  std::int64_t nanos = 0;
  int scale = 0;
  while (!s.empty() && std::isdigit(static_cast<unsigned char>(s.front()))) {
    if (scale < 9) {
      nanos = nanos * 10 + (s.front() - '0');
      ++scale;
    }
    s.remove_prefix(1);
  }
  for (; scale < 9; ++scale) {
    nanos *= 10;
  }
  return std::chrono::nanoseconds{nanos};
}

} // namespace

auto parse_iso8601_instant(std::string_view text) -> Result<TimePoint> {
  using namespace std::chrono;
  auto s = text;

  auto y = consume_fixed(s, 4);
  if (!y || !expect(s, '-')) {
    return fail(Error::ParseError);
  }
  auto mo = consume_fixed(s, 2);
  if (!mo || !expect(s, '-')) {
    return fail(Error::ParseError);
  }
  auto d = consume_fixed(s, 2);
  if (!d) {
    return fail(Error::ParseError);
  }
  const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                           day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) {
    return fail(Error::ParseError);
  }

  if (!expect(s, 'T') && !expect(s, 't')) {
    return fail(Error::ParseError);
  }
  auto hh = consume_fixed(s, 2);
  if (!hh || !expect(s, ':')) {
    return fail(Error::ParseError);
  }
  auto mm = consume_fixed(s, 2);
  if (!mm || !expect(s, ':')) {
    return fail(Error::ParseError);
  }
  auto ss = consume_fixed(s, 2);
  if (!ss || *hh > 23 || *mm > 59 || *ss > 59) {
    return fail(Error::ParseError);
  }

  nanoseconds fraction{0};
  if (expect(s, '.') || expect(s, ',')) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) {
      return fail(Error::ParseError);
    }
    fraction = consume_fraction(s);
  }

  minutes offset{0};
  if (!s.empty()) {
    if (expect(s, 'Z') || expect(s, 'z')) {
      // UTC
    } else if (s.front() == '+' || s.front() == '-') {
      const int sign = s.front() == '-' ? -1 : 1;
      s.remove_prefix(1);
      auto oh = consume_fixed(s, 2);
      if (!oh) {
        return fail(Error::ParseError);
      }
      (void)expect(s, ':');
      auto om = consume_fixed(s, 2);
      if (!om || *oh > 23 || *om > 59) {
        return fail(Error::ParseError);
      }
      offset = sign * (hours{*oh} + minutes{*om});
    } else {
      return fail(Error::ParseError);
    }
  }
  if (!s.empty()) {
    return fail(Error::ParseError);
  }

  const auto local = sys_days{ymd} + hours{*hh} + minutes{*mm} + seconds{*ss};
  return ok(time_point_cast<system_clock::duration>(local - offset) +
            duration_cast<system_clock::duration>(fraction));
}

auto parse_iso8601_duration(std::string_view text)
    -> Result<std::chrono::milliseconds> {
  using namespace std::chrono;
  auto s = text;
  if (!expect(s, 'P') || s.empty()) {
    return fail(Error::ParseError);
  }

  // Designators in the order they may appear; each at most once.
  constexpr std::array<char, 4> kDateUnits{'Y', 'M', 'W', 'D'};
  constexpr std::array<char, 3> kTimeUnits{'H', 'M', 'S'};
  constexpr std::array<std::int64_t, 4> kDateMillis{
      365LL * 86'400'000, 30LL * 86'400'000, 7LL * 86'400'000, 86'400'000};
  constexpr std::array<std::int64_t, 3> kTimeMillis{3'600'000, 60'000, 1'000};

  std::int64_t total = 0;
  // Adds value * unit to total; false when either step would overflow.
  const auto accumulate = [&total](std::int64_t value, std::int64_t unit) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    if (value > kMax / unit || value * unit > kMax - total) {
      return false;
    }
    total += value * unit;
    return true;
  };
  bool in_time = false;
  bool any = false;
  bool any_time = false;
  std::size_t next_unit = 0;

  while (!s.empty()) {
    if (expect(s, 'T')) {
      if (in_time) {
        return fail(Error::ParseError);
      }
      in_time = true;
      next_unit = 0;
      continue;
    }

    auto value = consume_int<std::int64_t>(s);
    if (!value || *value < 0) {
      return fail(Error::ParseError);
    }
    nanoseconds fraction{0};
    if (expect(s, '.') || expect(s, ',')) {
      fraction = consume_fraction(s);
    }
    if (s.empty()) {
      return fail(Error::ParseError);
    }

    const char unit = s.front();
    s.remove_prefix(1);
    if (in_time) {
      std::size_t idx = next_unit;
      while (idx < kTimeUnits.size() && kTimeUnits[idx] != unit) {
        ++idx;
      }
      if (idx == kTimeUnits.size() ||
          (fraction.count() != 0 && unit != 'S')) {
        return fail(Error::ParseError);
      }
      if (!accumulate(*value, kTimeMillis[idx]) ||
          (unit == 'S' &&
           !accumulate(duration_cast<milliseconds>(fraction).count(), 1))) {
        return fail(Error::ParseError);
      }
      next_unit = idx + 1;
      any_time = true;
    } else {
      std::size_t idx = next_unit;
      while (idx < kDateUnits.size() && kDateUnits[idx] != unit) {
        ++idx;
      }
      if (idx == kDateUnits.size() || fraction.count() != 0) {
        return fail(Error::ParseError);
      }
      if (!accumulate(*value, kDateMillis[idx])) {
        return fail(Error::ParseError);
      }
      next_unit = idx + 1;
    }
    any = true;
  }

  if (!any || (in_time && !any_time)) {
    return fail(Error::ParseError);
  }
  return ok(milliseconds{total});
}

auto format_iso8601_duration(std::chrono::milliseconds d) -> std::string {
  using namespace std::chrono;
  if (d <= milliseconds::zero()) {
    return "PT0S";
  }
  const auto h = duration_cast<hours>(d);
  d -= h;
  const auto m = duration_cast<minutes>(d);
  d -= m;
  std::string out = "PT";
  if (h.count() != 0) {
    out += std::format("{}H", h.count());
  }
  if (m.count() != 0) {
    out += std::format("{}M", m.count());
  }
  if (d.count() != 0) {
    if (d.count() % 1000 == 0) {
      out += std::format("{}S", d.count() / 1000);
    } else {
      out += std::format("{}.{:03}S", d.count() / 1000, d.count() % 1000);
    }
  }
  return out;
}

} // namespace jobforge::util
