#include <tether/schema/primitives.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <string_view>

namespace tether::schema {

namespace {

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

const boost::posix_time::ptime& epoch() {
  static const auto kEpoch =
      boost::posix_time::ptime{boost::gregorian::date{1970, 1, 1}};
  return kEpoch;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<uuid_t> try_make_uuid(std::string_view text) {
  if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
    text.remove_prefix(1);
    text.remove_suffix(1);
  }
  auto digits = std::string{};
  digits.reserve(32);
  if (text.size() == 36) {
    for (std::size_t i = 0; i < text.size(); ++i) {
      const auto dash = i == 8 || i == 13 || i == 18 || i == 23;
      if (dash != (text[i] == '-')) {
        return std::nullopt;
      }
      if (!dash) {
        digits.push_back(text[i]);
      }
    }
  } else if (text.size() == 32) {
    digits.assign(text);
  } else {
    return std::nullopt;
  }

  auto decoded = try_from_hex(digits);
  if (!decoded || decoded->size() != 16) {
    return std::nullopt;
  }
  auto uuid = uuid_t{};
  std::copy(decoded->begin(), decoded->end(), uuid.begin());
  return uuid;
}

uuid_t make_uuid(const uuid_bytes_t& bytes) {
  auto uuid = uuid_t{};
  std::copy(std::begin(bytes), std::end(bytes), uuid.begin());
  return uuid;
}

uuid_bytes_t make_uuid_bytes(const uuid_t& uuid) {
  auto bytes = uuid_bytes_t{};
  std::copy(uuid.begin(), uuid.end(), std::begin(bytes));
  return bytes;
}

std::string to_string(const uuid_t& uuid) {
  return boost::uuids::to_string(uuid);
}

std::optional<timestamp_t> try_parse_timestamp(std::string_view text) {
  if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
    text.remove_suffix(1);
  }
  if (text.find('T') == std::string_view::npos) {
    return std::nullopt;
  }
  try {
    auto parsed =
        boost::posix_time::from_iso_extended_string(std::string{text});
    if (parsed.is_special()) {
      return std::nullopt;
    }
    return timestamp_t{
        std::chrono::microseconds{(parsed - epoch()).total_microseconds()}};
  } catch (const std::exception&) {
    // Boost reports malformed dates through several unrelated exception
    // types (bad_lexical_cast, bad_day_of_month, out_of_range).
    return std::nullopt;
  }
}

std::string format_timestamp(const timestamp_t& timestamp) {
  auto since_epoch = timestamp.time_since_epoch().count();
  auto value = epoch() + boost::posix_time::microseconds{since_epoch};
  return boost::posix_time::to_iso_extended_string(value) + "Z";
}

timestamp_milliseconds_t to_milliseconds(const timestamp_t& timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             timestamp.time_since_epoch())
      .count();
}

timestamp_t from_milliseconds(const timestamp_milliseconds_t milliseconds) {
  return timestamp_t{std::chrono::milliseconds{milliseconds}};
}

std::optional<timestamp_t> try_from_milliseconds(
    const timestamp_milliseconds_t milliseconds) {
  if (milliseconds > kMaxTimestampMilliseconds ||
      milliseconds < -kMaxTimestampMilliseconds) {
    return std::nullopt;
  }
  return from_milliseconds(milliseconds);
}

std::optional<timestamp_t> try_from_seconds(const double seconds) {
  const auto milliseconds = seconds * 1000.0;
  // Keeps llround defined; the exact bound is checked on the integer.
  if (!std::isfinite(milliseconds) || std::fabs(milliseconds) > 1e17) {
    return std::nullopt;
  }
  return try_from_milliseconds(std::llround(milliseconds));
}

timestamp_t truncate_to_milliseconds(const timestamp_t& timestamp) {
  return from_milliseconds(to_milliseconds(timestamp));
}

}  // namespace tether::schema
