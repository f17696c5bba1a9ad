#pragma once

#include "types.hpp"
#include <cmath>
#include <cstring>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace darnio {

namespace internal {

inline std::string ToHex(uint8_t byte) {
  std::string result{2, '\0'};
  result[0] = "0123456789ABCDEF"[(uint8_t(byte) >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[uint8_t(byte) & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using darnio::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline uint16_t ParseUint16(const std::byte* data) {
  return uint16_t(data[0]) | (uint16_t(data[1]) << 8);
}

inline uint32_t ParseUint32(const std::byte* data) {
  return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

inline uint64_t ParseUint64(const std::byte* data) {
  return uint64_t(data[0]) | (uint64_t(data[1]) << 8) | (uint64_t(data[2]) << 16) |
         (uint64_t(data[3]) << 24) | (uint64_t(data[4]) << 32) | (uint64_t(data[5]) << 40) |
         (uint64_t(data[6]) << 48) | (uint64_t(data[7]) << 56);
}

inline int32_t ParseInt32(const std::byte* data) {
  return int32_t(ParseUint32(data));
}

inline float ParseFloat(const std::byte* data) {
  const uint32_t bits = ParseUint32(data);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

inline double ParseDouble(const std::byte* data) {
  const uint64_t bits = ParseUint64(data);
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

inline std::optional<int64_t> ValueToInt64(const Value& value) {
  if (const auto* i = std::get_if<int64_t>(&value)) {
    return *i;
  }
  if (const auto* u = std::get_if<uint64_t>(&value)) {
    if (*u > uint64_t(std::numeric_limits<int64_t>::max())) {
      return std::nullopt;
    }
    return int64_t(*u);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    // Only whole numbers convert, e.g. JSON "39.0"
    if (std::isfinite(*d) && std::trunc(*d) == *d && std::fabs(*d) < 9.2e18) {
      return int64_t(*d);
    }
  }
  return std::nullopt;
}

inline std::optional<double> ValueToDouble(const Value& value) {
  if (const auto* i = std::get_if<int64_t>(&value)) {
    return double(*i);
  }
  if (const auto* u = std::get_if<uint64_t>(&value)) {
    return double(*u);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  return std::nullopt;
}

inline bool InWindow(Timestamp time, Timestamp startTime, const std::optional<Timestamp>& endTime) {
  return time >= startTime && (!endTime || time <= *endTime);
}

constexpr bool IsLeapYear(int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr int64_t DaysInMonth(int64_t year, unsigned month) {
  switch (month) {
    case 2:
      return IsLeapYear(year) ? 29 : 28;
    case 4:
    case 6:
    case 9:
    case 11:
      return 30;
    default:
      return 31;
  }
}

inline Status ReadIntegerField(const Record& record, std::string_view name, int64_t minValue,
                               int64_t maxValue, int64_t* output) {
  const auto value = record.integer(name);
  if (!value) {
    return Status{StatusCode::InvalidRecord,
                  StrCat("missing or non-integer field \"", name, "\"")};
  }
  if (*value < minValue || *value > maxValue) {
    return Status{StatusCode::InvalidRecord,
                  StrCat("field \"", name, "\" value ", *value, " outside [", minValue, ", ",
                         maxValue, "]")};
  }
  *output = *value;
  return StatusCode::Success;
}

/**
 * @brief Fills in `record->time` and `record->scan` from the decoded fields.
 * The timestamp comes from the time.yr/mo/dy/hr/mt/sc/us fields, or failing
 * that a numeric "time" field holding seconds since the epoch.
 */
inline Status ResolveRecordAttributes(Record* record) {
  if (record->field("time.yr") != nullptr) {
    int64_t yr = 0, mo = 0, dy = 0, hr = 0, mt = 0, sc = 0, us = 0;
    if (auto status = ReadIntegerField(*record, "time.yr", 1970, 9999, &yr); !status.ok()) {
      return status;
    }
    if (auto status = ReadIntegerField(*record, "time.mo", 1, 12, &mo); !status.ok()) {
      return status;
    }
    if (auto status = ReadIntegerField(*record, "time.dy", 1, DaysInMonth(yr, unsigned(mo)), &dy);
        !status.ok()) {
      return status;
    }
    if (auto status = ReadIntegerField(*record, "time.hr", 0, 23, &hr); !status.ok()) {
      return status;
    }
    if (auto status = ReadIntegerField(*record, "time.mt", 0, 59, &mt); !status.ok()) {
      return status;
    }
    if (auto status = ReadIntegerField(*record, "time.sc", 0, 59, &sc); !status.ok()) {
      return status;
    }
    if (record->field("time.us") != nullptr) {
      if (auto status = ReadIntegerField(*record, "time.us", 0, 999999, &us); !status.ok()) {
        return status;
      }
    }
    record->time = MakeTimestamp(yr, unsigned(mo), unsigned(dy), unsigned(hr), unsigned(mt),
                                 unsigned(sc), uint32_t(us));
  } else if (const auto seconds = record->number("time")) {
    if (!std::isfinite(*seconds) || *seconds < 0) {
      return Status{StatusCode::InvalidRecord, StrCat("invalid epoch time ", *seconds)};
    }
    record->time = Timestamp(std::llround(*seconds * 1e6)) * NanosPerMicro;
  } else {
    return Status{StatusCode::InvalidRecord, "record has no time fields"};
  }

  const auto scan = record->integer("scan");
  if (!scan) {
    return Status{StatusCode::InvalidRecord, "record has no integer \"scan\" field"};
  }
  record->scan = *scan;
  return StatusCode::Success;
}

}  // namespace internal

}  // namespace darnio
