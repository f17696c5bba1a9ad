#pragma once

#include <darnio/darnio.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

#include <unistd.h>

namespace fixtures {

using darnio::ByteArray;
using darnio::DataType;
using darnio::Value;

/**
 * @brief Calendar time of a test record, with the scan flag it carries.
 */
struct TestRecord {
  int yr, mo, dy, hr, mt, sc, us;
  int scan;
};

inline darnio::Timestamp TimeOf(const TestRecord& rec) {
  return darnio::MakeTimestamp(rec.yr, unsigned(rec.mo), unsigned(rec.dy), unsigned(rec.hr),
                               unsigned(rec.mt), unsigned(rec.sc), uint32_t(rec.us));
}

/**
 * @brief Serializes DMAP records field by field, mirroring the layout written
 * by the RST DataMap library.
 */
class DmapRecordBuilder {
public:
  DmapRecordBuilder& scalar(const std::string& name, DataType type, const Value& value) {
    appendString(scalars_, name);
    scalars_.push_back(std::byte(uint8_t(type)));
    appendValue(scalars_, type, value);
    ++scalarCount_;
    return *this;
  }

  DmapRecordBuilder& array(const std::string& name, DataType type,
                           const std::vector<int32_t>& dimensions,
                           const std::vector<Value>& values) {
    appendString(arrays_, name);
    arrays_.push_back(std::byte(uint8_t(type)));
    appendInt32(arrays_, int32_t(dimensions.size()));
    for (int32_t extent : dimensions) {
      appendInt32(arrays_, extent);
    }
    for (const auto& value : values) {
      appendValue(arrays_, type, value);
    }
    ++arrayCount_;
    return *this;
  }

  DmapRecordBuilder& time(const TestRecord& rec) {
    scalar("time.yr", DataType::Short, int64_t(rec.yr));
    scalar("time.mo", DataType::Short, int64_t(rec.mo));
    scalar("time.dy", DataType::Short, int64_t(rec.dy));
    scalar("time.hr", DataType::Short, int64_t(rec.hr));
    scalar("time.mt", DataType::Short, int64_t(rec.mt));
    scalar("time.sc", DataType::Short, int64_t(rec.sc));
    scalar("time.us", DataType::Int, int64_t(rec.us));
    return *this;
  }

  ByteArray build(int32_t code = darnio::DmapCodec::RecordCode) const {
    ByteArray output;
    appendInt32(output, code);
    appendInt32(output, int32_t(16 + scalars_.size() + arrays_.size()));
    appendInt32(output, scalarCount_);
    appendInt32(output, arrayCount_);
    output.insert(output.end(), scalars_.begin(), scalars_.end());
    output.insert(output.end(), arrays_.begin(), arrays_.end());
    return output;
  }

  static void appendInt32(ByteArray& output, int32_t value) {
    appendLittleEndian(output, uint64_t(uint32_t(value)), 4);
  }

private:
  ByteArray scalars_;
  ByteArray arrays_;
  int32_t scalarCount_ = 0;
  int32_t arrayCount_ = 0;

  static void appendLittleEndian(ByteArray& output, uint64_t bits, size_t width) {
    for (size_t i = 0; i < width; ++i) {
      output.push_back(std::byte((bits >> (8 * i)) & 0xFF));
    }
  }

  static void appendString(ByteArray& output, const std::string& str) {
    for (char c : str) {
      output.push_back(std::byte(c));
    }
    output.push_back(std::byte(0));
  }

  static void appendValue(ByteArray& output, DataType type, const Value& value) {
    switch (type) {
      case DataType::String:
        appendString(output, std::get<std::string>(value));
        return;
      case DataType::Float: {
        const float f = float(std::get<double>(value));
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        appendLittleEndian(output, bits, 4);
        return;
      }
      case DataType::Double: {
        const double d = std::get<double>(value);
        uint64_t bits;
        std::memcpy(&bits, &d, sizeof(bits));
        appendLittleEndian(output, bits, 8);
        return;
      }
      default:
        break;
    }
    const uint64_t bits = std::holds_alternative<int64_t>(value) ? uint64_t(std::get<int64_t>(value))
                                                                 : std::get<uint64_t>(value);
    switch (type) {
      case DataType::Char:
      case DataType::UChar:
        appendLittleEndian(output, bits, 1);
        break;
      case DataType::Short:
      case DataType::UShort:
        appendLittleEndian(output, bits, 2);
        break;
      case DataType::Int:
      case DataType::UInt:
        appendLittleEndian(output, bits, 4);
        break;
      default:
        appendLittleEndian(output, bits, 8);
        break;
    }
  }
};

/**
 * @brief A fitacf-like DMAP record carrying the given time and scan flag.
 */
inline ByteArray DmapRecord(const TestRecord& rec) {
  return DmapRecordBuilder{}
    .time(rec)
    .scalar("scan", DataType::Short, int64_t(rec.scan))
    .scalar("bmnum", DataType::Short, int64_t(7))
    .scalar("origin.command", DataType::String, std::string("make_fit"))
    .array("slist", DataType::Short, {3}, {int64_t(10), int64_t(11), int64_t(12)})
    .array("v", DataType::Float, {3}, {120.5, -43.25, 0.0})
    .build();
}

inline nlohmann::json JsonRecordObject(const TestRecord& rec) {
  return nlohmann::json{
    {"time.yr", rec.yr}, {"time.mo", rec.mo}, {"time.dy", rec.dy},
    {"time.hr", rec.hr}, {"time.mt", rec.mt}, {"time.sc", rec.sc},
    {"time.us", rec.us}, {"scan", rec.scan},  {"bmnum", 7},
    {"slist", {10, 11, 12}}, {"v", {120.5, -43.25, 0.0}},
  };
}

/**
 * @brief A JSON record, pretty-printed over several lines unless `compact`.
 */
inline std::string JsonRecord(const TestRecord& rec, bool compact = false) {
  return JsonRecordObject(rec).dump(compact ? -1 : 2) + "\n";
}

inline ByteArray Concat(const std::vector<ByteArray>& parts) {
  ByteArray output;
  for (const auto& part : parts) {
    output.insert(output.end(), part.begin(), part.end());
  }
  return output;
}

inline ByteArray ToBytes(const std::string& text) {
  const auto* begin = reinterpret_cast<const std::byte*>(text.data());
  return ByteArray(begin, begin + text.size());
}

/**
 * @brief Encodes `records` in the given format, one record each.
 */
inline ByteArray EncodeFile(darnio::FormatKind format, const std::vector<TestRecord>& records) {
  ByteArray output;
  for (const auto& rec : records) {
    const auto record =
      format == darnio::FormatKind::Dmap ? DmapRecord(rec) : ToBytes(JsonRecord(rec));
    output.insert(output.end(), record.begin(), record.end());
  }
  return output;
}

/**
 * @brief A uniquely named file under the system temp directory, removed when
 * the fixture goes out of scope.
 */
class TempFile {
public:
  explicit TempFile(const ByteArray& contents) {
    static int counter = 0;
    path_ = std::filesystem::temp_directory_path() /
            ("darnio_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::ofstream out(path_, std::ios::binary);
    out.write(reinterpret_cast<const char*>(contents.data()), std::streamsize(contents.size()));
  }
  ~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  std::string path() const {
    return path_.string();
  }

  void append(const ByteArray& contents) const {
    std::ofstream out(path_, std::ios::binary | std::ios::app);
    out.write(reinterpret_cast<const char*>(contents.data()), std::streamsize(contents.size()));
  }

private:
  std::filesystem::path path_;
};

}  // namespace fixtures
