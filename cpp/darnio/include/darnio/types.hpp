#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace darnio {

#define DARNIO_LIBRARY_VERSION "0.3.0"

/**
 * @brief Nanoseconds since the Unix epoch (UTC).
 */
using Timestamp = uint64_t;
using ByteOffset = uint64_t;
using ByteArray = std::vector<std::byte>;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char LibraryVersion[] = DARNIO_LIBRARY_VERSION;
constexpr uint64_t NanosPerMicro = 1000;
constexpr uint64_t NanosPerSecond = 1000000000;

/**
 * @brief Builds a Timestamp from UTC calendar fields. The fields are not range
 * checked; dates before 1970-01-01 are not representable.
 */
constexpr Timestamp MakeTimestamp(int64_t year, unsigned month, unsigned day, unsigned hour = 0,
                                  unsigned minute = 0, unsigned second = 0,
                                  uint32_t microsecond = 0) {
  // days_from_civil, proleptic Gregorian calendar
  const int64_t y = year - (month <= 2 ? 1 : 0);
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const uint64_t yoe = uint64_t(y - era * 400);
  const uint64_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const uint64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  const int64_t days = era * 146097 + int64_t(doe) - 719468;
  const uint64_t seconds = uint64_t(days) * 86400 + hour * 3600 + minute * 60 + second;
  return seconds * NanosPerSecond + uint64_t(microsecond) * NanosPerMicro;
}

/**
 * @brief The record encodings a DataReader can be constructed for.
 */
enum struct FormatKind {
  /**
   * @brief Packed little-endian binary DMAP records.
   */
  Dmap,
  /**
   * @brief Concatenated JSON objects, one record per object. An object may span
   * multiple lines.
   */
  Json,
};

/**
 * @brief Get the string representation of a FormatKind ("dmap", "json").
 */
constexpr std::string_view FormatKindString(FormatKind format) {
  switch (format) {
    case FormatKind::Dmap:
      return "dmap";
    case FormatKind::Json:
      return "json";
    default:
      return "unknown";
  }
}

/**
 * @brief Converts a format name ("dmap", "json") to the FormatKind enum.
 */
DARNIO_PUBLIC
std::optional<FormatKind> ParseFormatKind(std::string_view name);

/**
 * @brief DMAP field type codes. JSON records map onto the same set.
 */
enum struct DataType : uint8_t {
  Char = 1,
  Short = 2,
  Int = 3,
  Float = 4,
  Double = 8,
  String = 9,
  Long = 10,
  UChar = 16,
  UShort = 17,
  UInt = 18,
  ULong = 19,
};

constexpr std::string_view DataTypeString(DataType type) {
  switch (type) {
    case DataType::Char:
      return "char";
    case DataType::Short:
      return "short";
    case DataType::Int:
      return "int";
    case DataType::Float:
      return "float";
    case DataType::Double:
      return "double";
    case DataType::String:
      return "string";
    case DataType::Long:
      return "long";
    case DataType::UChar:
      return "uchar";
    case DataType::UShort:
      return "ushort";
    case DataType::UInt:
      return "uint";
    case DataType::ULong:
      return "ulong";
    default:
      return "unknown";
  }
}

/**
 * @brief A single decoded value. Signed integer types widen to int64_t,
 * unsigned to uint64_t, and floating point to double.
 */
using Value = std::variant<int64_t, uint64_t, double, std::string>;

/**
 * @brief A named record field: either a scalar (no dimensions, one value) or an
 * array with one extent per dimension.
 */
struct DARNIO_PUBLIC Field {
  DataType type = DataType::Long;
  std::vector<uint32_t> dimensions;
  std::vector<Value> values;

  Field() = default;
  Field(DataType type, Value value)
      : type(type)
      , values{std::move(value)} {}
  Field(DataType type, std::vector<uint32_t> dimensions, std::vector<Value> values)
      : type(type)
      , dimensions(std::move(dimensions))
      , values(std::move(values)) {}

  bool isScalar() const {
    return dimensions.empty();
  }
};

using FieldMap = std::map<std::string, Field, std::less<>>;

/**
 * @brief One decoded record. Every record carries a timestamp and the scan flag;
 * all other fields are kept as decoded.
 */
struct DARNIO_PUBLIC Record {
  Timestamp time = 0;
  /**
   * @brief 1 if this record is the first of a logical instrument scan.
   */
  int64_t scan = 0;
  FieldMap fields;

  bool isScanStart() const {
    return scan == 1;
  }

  /**
   * @brief Look up a field by name, returning nullptr if it is not present.
   */
  const Field* field(std::string_view name) const;
  /**
   * @brief Returns the value of an integer scalar field, or std::nullopt if the
   * field is missing, not a scalar, or not an integer that fits in int64_t.
   */
  std::optional<int64_t> integer(std::string_view name) const;
  /**
   * @brief Returns the value of any numeric scalar field as a double.
   */
  std::optional<double> number(std::string_view name) const;
  std::optional<std::string> string(std::string_view name) const;
};

/**
 * @brief Record timestamps mapped to the byte offsets their records start at,
 * plus the subset of records that begin a scan.
 */
class DARNIO_PUBLIC TimeIndex {
public:
  using OffsetMap = std::map<Timestamp, ByteOffset>;
  using Entry = std::pair<Timestamp, ByteOffset>;

  /**
   * @brief Adds a record. A record with an already indexed `time` replaces the
   * earlier entry, including its scan start status, and false is returned.
   */
  bool insert(Timestamp time, ByteOffset offset, bool scanStart);

  /**
   * @brief Every indexed record, keyed by timestamp.
   */
  const OffsetMap& records() const;
  /**
   * @brief Records that start a scan. Always a subset of `records()`.
   */
  const OffsetMap& scanStarts() const;

  /**
   * @brief Returns true if `offset` is the start of an indexed record.
   */
  bool contains(ByteOffset offset) const;

  std::optional<ByteOffset> offsetAt(Timestamp time) const;
  /**
   * @brief The earliest indexed record with a timestamp greater or equal to `time`.
   */
  std::optional<Entry> firstAtOrAfter(Timestamp time) const;
  /**
   * @brief The latest scan start with a timestamp less than or equal to `time`,
   * i.e. the start of the scan that a record at `time` belongs to.
   */
  std::optional<Entry> scanStartFor(Timestamp time) const;

  size_t size() const;
  bool empty() const;

private:
  OffsetMap records_;
  OffsetMap scanStarts_;
  std::unordered_set<ByteOffset> offsets_;
};

}  // namespace darnio

#ifdef DARNIO_IMPLEMENTATION
#  include "types.inl"
#endif
