#pragma once
#include <array>
#include <boost/uuid/uuid.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tether::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using uuid_t = boost::uuids::uuid;
using uuid_bytes_t = std::array<uint8_t, 16>;
using timestamp_t =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;
using timestamp_milliseconds_t = int64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Accepts the hyphenated 8-4-4-4-12 form, optionally braced, or 32 bare hex
/// digits.
std::optional<uuid_t> try_make_uuid(std::string_view text);
uuid_t make_uuid(const uuid_bytes_t& bytes);
uuid_bytes_t make_uuid_bytes(const uuid_t& uuid);
/// Lowercase hyphenated form.
std::string to_string(const uuid_t& uuid);

/// ISO-8601 extended form, e.g. 2024-01-01T00:00:00.123456, with an
/// optional trailing 'Z'. Times are UTC.
std::optional<timestamp_t> try_parse_timestamp(std::string_view text);
std::string format_timestamp(const timestamp_t& timestamp);

/// Truncates toward zero, the way the storage driver serializes timestamps.
timestamp_milliseconds_t to_milliseconds(const timestamp_t& timestamp);
/// Largest magnitude, in milliseconds, a timestamp_t can hold.
inline constexpr auto kMaxTimestampMilliseconds =
    timestamp_milliseconds_t{std::chrono::microseconds::max().count() / 1000};

timestamp_t from_milliseconds(timestamp_milliseconds_t milliseconds);
/// std::nullopt when outside +/- kMaxTimestampMilliseconds.
std::optional<timestamp_t> try_from_milliseconds(
    timestamp_milliseconds_t milliseconds);
/// Rounds to the nearest millisecond, the precision the driver stores.
/// std::nullopt for non-finite or out of range input.
std::optional<timestamp_t> try_from_seconds(double seconds);
timestamp_t truncate_to_milliseconds(const timestamp_t& timestamp);

}  // namespace tether::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
