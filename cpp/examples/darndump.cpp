#define DARNIO_IMPLEMENTATION
#include <darnio/darnio.hpp>

#include <fmt/core.h>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using darnio::ByteOffset;

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(msg, std::forward<T>(args)...);
}

std::string ToString(const darnio::Value& value) {
  if (const auto* str = std::get_if<std::string>(&value)) {
    return StrFormat("\"{}\"", *str);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return StrFormat("{}", *d);
  }
  if (const auto* u = std::get_if<uint64_t>(&value)) {
    return StrFormat("{}", *u);
  }
  return StrFormat("{}", std::get<int64_t>(value));
}

std::string ToString(const darnio::Field& field) {
  if (field.isScalar()) {
    return field.values.empty() ? "<empty>" : ToString(field.values.front());
  }
  std::stringstream ss;
  ss << darnio::DataTypeString(field.type) << "[";
  for (size_t i = 0; i < field.dimensions.size(); ++i) {
    ss << (i > 0 ? "x" : "") << field.dimensions[i];
  }
  ss << "]";
  if (field.values.size() > 4) {
    ss << " <" << field.values.size() << " values>";
    return ss.str();
  }
  ss << " {";
  for (size_t i = 0; i < field.values.size(); ++i) {
    ss << (i > 0 ? ", " : "") << ToString(field.values[i]);
  }
  ss << "}";
  return ss.str();
}

std::string ToString(const darnio::Record& record) {
  std::stringstream ss;
  ss << StrFormat("[Record] time={}, scan={}, fields={}", record.time, record.scan,
                  record.fields.size());
  for (const auto& [name, field] : record.fields) {
    if (name.rfind("time.", 0) == 0) {
      continue;
    }
    ss << "\n  " << name << ": " << ToString(field);
  }
  return ss.str();
}

std::string ToString(const darnio::TimeIndex::OffsetMap& map) {
  if (map.size() > 8) {
    return StrFormat("<{} entries>", map.size());
  }

  std::stringstream ss;
  ss << "[";
  for (const auto& [timestamp, offset] : map) {
    if (ss.tellp() > 1) {
      ss << ", ";
    }
    ss << "{" << timestamp << ", " << offset << "}";
  }
  ss << "]";
  return ss.str();
}

void DumpIndex(darnio::DataReader& reader) {
  auto onProblem = [](const darnio::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };
  if (auto status = reader.createIndex(onProblem); !status.ok()) {
    return;
  }
  fmt::print("[Index] records={}, scans={}\n", reader.recordIndex().size(),
             reader.scanStartIndex().size());
  fmt::print("  records: {}\n", ToString(reader.recordIndex()));
  fmt::print("  scan starts: {}\n", ToString(reader.scanStartIndex()));
}

// Exercises seek/tell/rewind against the index: jump to the last scan start,
// read one record, then rewind and confirm the cursor is back at 0.
void CheckPositioning(darnio::DataReader& reader) {
  if (reader.scanStartIndex().empty()) {
    return;
  }
  const auto [time, offset] = *reader.scanStartIndex().rbegin();
  ByteOffset position = 0;
  if (auto status = reader.offsetSeek(offset, false, &position); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }
  darnio::Record record;
  if (auto status = reader.read(&record); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }
  ByteOffset after = 0;
  if (auto status = reader.offsetTell(&after); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }
  fmt::print("[Seek] offset={} time={} read time={} next offset={}\n", position, time,
             record.time, after);

  const ByteOffset bogus = offset + 1;
  if (auto status = reader.offsetSeek(bogus, false, &position); !status.ok()) {
    fmt::print("[Seek] offset={} refused, position={}\n", bogus, position);
  }

  if (auto status = reader.rewind(); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return;
  }
  if (auto status = reader.offsetTell(&after); status.ok()) {
    fmt::print("[Rewind] position={}\n", after);
  }
}

void DumpRecords(darnio::DataReader& reader) {
  auto onProblem = [](const darnio::Status& problem) {
    std::cerr << "! " << problem.message << "\n";
  };
  for (const auto& record : reader.records(onProblem)) {
    std::cout << ToString(record) << "\n";
  }
}

int main(int argc, char* argv[]) {
  if (argc < 3 || argc > 5) {
    std::cerr << "darndump (darnio " << darnio::LibraryVersion << ")\n"
              << "Usage: " << argv[0]
              << " <dmap|json> <input> [start-epoch-seconds] [end-epoch-seconds]\n";
    return 1;
  }

  const auto format = darnio::ParseFormatKind(argv[1]);
  if (!format) {
    std::cerr << "Unknown format \"" << argv[1] << "\", expected dmap or json\n";
    return 1;
  }
  const darnio::Timestamp start =
    argc > 3 ? std::strtoull(argv[3], nullptr, 10) * darnio::NanosPerSecond : 0;
  std::optional<darnio::Timestamp> end;
  if (argc > 4) {
    end = std::strtoull(argv[4], nullptr, 10) * darnio::NanosPerSecond;
  }

  std::unique_ptr<darnio::DataReader> reader;
  auto status =
    darnio::DataReader::Create(darnio::ReaderOptions{start, end, *format, argv[2]}, &reader);
  if (status.ok()) {
    status = reader->open();
  }
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  DumpIndex(*reader);
  CheckPositioning(*reader);
  std::cout << "\nRecords:\n";
  DumpRecords(*reader);

  reader->close();
  return 0;
}
