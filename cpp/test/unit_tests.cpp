#define DARNIO_IMPLEMENTATION
#include <darnio/darnio.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "fixtures.hpp"

#include <memory>
#include <optional>
#include <vector>

#include <sys/stat.h>

using darnio::ByteOffset;
using darnio::DataReader;
using darnio::FormatKind;
using darnio::MakeTimestamp;
using darnio::ReaderOptions;
using darnio::StatusCode;
using darnio::Timestamp;
using fixtures::TestRecord;

void requireOk(const darnio::Status& status) {
  CAPTURE(status.code);
  CAPTURE(status.message);
  REQUIRE(status.ok());
}

static const Timestamp WindowStart = MakeTimestamp(2012, 11, 24, 4);
static const Timestamp WindowEnd = MakeTimestamp(2012, 11, 24, 5);

// One record before the window, five inside it (the last on its end
// boundary) and one after it
static const std::vector<TestRecord> DayRecords = {
  {2012, 11, 24, 3, 55, 0, 0, 1},       {2012, 11, 24, 4, 4, 39, 141000, 1},
  {2012, 11, 24, 4, 10, 0, 0, 0},       {2012, 11, 24, 4, 12, 0, 0, 0},
  {2012, 11, 24, 4, 20, 0, 0, 1},       {2012, 11, 24, 5, 0, 0, 0, 0},
  {2012, 11, 24, 5, 30, 0, 0, 1},
};

/**
 * @brief A DataReader opened over an in-memory copy of a file.
 */
struct OpenReader {
  darnio::ByteArray data;
  std::unique_ptr<darnio::BufferReader> source;
  std::unique_ptr<DataReader> reader;
};

static OpenReader OpenBuffer(FormatKind format, darnio::ByteArray data, Timestamp start,
                             std::optional<Timestamp> end) {
  OpenReader result;
  result.data = std::move(data);
  result.source = std::make_unique<darnio::BufferReader>(result.data.data(), result.data.size());
  requireOk(DataReader::Create(ReaderOptions{start, end, format}, &result.reader));
  requireOk(result.reader->open(*result.source));
  return result;
}

static OpenReader OpenDay(FormatKind format) {
  return OpenBuffer(format, fixtures::EncodeFile(format, DayRecords), WindowStart, WindowEnd);
}

static ByteOffset Tell(const DataReader& reader) {
  ByteOffset offset = 0;
  requireOk(reader.offsetTell(&offset));
  return offset;
}

static std::vector<Timestamp> ReadAll(DataReader& reader) {
  std::vector<Timestamp> times;
  darnio::Record record;
  while (true) {
    const auto status = reader.read(&record);
    if (status.endOfStream()) {
      break;
    }
    requireOk(status);
    times.push_back(record.time);
  }
  return times;
}

TEST_CASE("MakeTimestamp()", "[types]") {
  REQUIRE(MakeTimestamp(1970, 1, 1) == 0);
  REQUIRE(MakeTimestamp(2000, 2, 29) == 951782400000000000ULL);
  REQUIRE(MakeTimestamp(2012, 11, 24, 4, 4, 39, 141000) == 1353729879141000000ULL);
}

TEST_CASE("ReaderOptions::validate()", "[reader]") {
  SECTION("start after end") {
    ReaderOptions options{WindowEnd, WindowStart, FormatKind::Dmap};
    REQUIRE(options.validate().code == StatusCode::InvalidWindow);
  }

  SECTION("single instant window") {
    ReaderOptions options{WindowStart, WindowStart, FormatKind::Json};
    requireOk(options.validate());
  }

  SECTION("unbounded end") {
    ReaderOptions options{WindowEnd, std::nullopt, FormatKind::Dmap};
    requireOk(options.validate());
  }

  SECTION("unsupported format") {
    ReaderOptions options{WindowStart, WindowEnd, static_cast<FormatKind>(42)};
    REQUIRE(options.validate().code == StatusCode::UnsupportedFormat);
  }
}

TEST_CASE("DataReader::Create()", "[reader]") {
  SECTION("invalid window fails before any file access") {
    std::unique_ptr<DataReader> reader;
    ReaderOptions options{WindowEnd, WindowStart, FormatKind::Dmap, "/nonexistent/darnio.dmap"};
    const auto status = DataReader::Create(options, &reader);
    REQUIRE(status.code == StatusCode::InvalidWindow);
    REQUIRE(reader == nullptr);
  }

  SECTION("unsupported format") {
    std::unique_ptr<DataReader> reader;
    ReaderOptions options{WindowStart, WindowEnd, static_cast<FormatKind>(42)};
    REQUIRE(DataReader::Create(options, &reader).code == StatusCode::UnsupportedFormat);
    REQUIRE(reader == nullptr);
  }

  SECTION("codec is selected from the format") {
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(ReaderOptions{WindowStart, WindowEnd, FormatKind::Json}, &reader));
    REQUIRE(reader->codec().name() == "json");
    REQUIRE_FALSE(reader->isOpen());
  }

  SECTION("caller-supplied codec") {
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(ReaderOptions{WindowStart, WindowEnd, FormatKind::Json},
                                 std::make_unique<darnio::DmapCodec>(), &reader));
    REQUIRE(reader->codec().name() == "dmap");
  }
}

TEST_CASE("DataReader::open()", "[reader]") {
  const auto data = fixtures::EncodeFile(FormatKind::Dmap, DayRecords);

  SECTION("missing file") {
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(
      ReaderOptions{WindowStart, WindowEnd, FormatKind::Dmap, "/nonexistent/darnio.dmap"},
      &reader));
    const auto status = reader->open();
    REQUIRE(status.code == StatusCode::FileNotFound);
    REQUIRE_FALSE(reader->isOpen());
  }

  SECTION("no path configured") {
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(ReaderOptions{WindowStart, WindowEnd, FormatKind::Dmap}, &reader));
    REQUIRE(reader->open().code == StatusCode::OpenFailed);
  }

  SECTION("open twice") {
    fixtures::TempFile file{data};
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(
      ReaderOptions{WindowStart, WindowEnd, FormatKind::Dmap, file.path()}, &reader));
    requireOk(reader->open());
    REQUIRE(reader->open().code == StatusCode::AlreadyOpen);
    REQUIRE(reader->isOpen());
    REQUIRE(ReadAll(*reader).size() == 5);
  }

  SECTION("permission denied") {
    fixtures::TempFile file{data};
    REQUIRE(::chmod(file.path().c_str(), 0) == 0);
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(
      ReaderOptions{WindowStart, WindowEnd, FormatKind::Dmap, file.path()}, &reader));
    const auto status = reader->open();
    // root bypasses file permissions
    if (::geteuid() != 0) {
      REQUIRE(status.code == StatusCode::PermissionDenied);
      REQUIRE_FALSE(reader->isOpen());
    }
  }

  SECTION("reopen after close") {
    fixtures::TempFile file{data};
    std::unique_ptr<DataReader> reader;
    requireOk(DataReader::Create(
      ReaderOptions{WindowStart, WindowEnd, FormatKind::Dmap, file.path()}, &reader));
    requireOk(reader->open());
    requireOk(reader->createIndex());
    reader->close();
    reader->close();
    REQUIRE_FALSE(reader->isOpen());
    REQUIRE_FALSE(reader->index().has_value());
    requireOk(reader->open());
    REQUIRE(Tell(*reader) == 0);
  }
}

TEST_CASE("Records appended to an open file", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  const auto first = fixtures::EncodeFile(format, {DayRecords[1]});
  const auto second = fixtures::EncodeFile(format, {DayRecords[2]});
  const auto split = second.begin() + std::ptrdiff_t(second.size() / 2);

  fixtures::TempFile file{fixtures::Concat({first, darnio::ByteArray(second.begin(), split)})};
  std::unique_ptr<DataReader> reader;
  requireOk(DataReader::Create(ReaderOptions{WindowStart, WindowEnd, format, file.path()}, &reader));
  requireOk(reader->open());

  darnio::Record record;
  requireOk(reader->read(&record));
  REQUIRE(reader->read(&record).endOfStream());
  REQUIRE(Tell(*reader) == first.size());

  file.append(darnio::ByteArray(split, second.end()));
  requireOk(reader->read(&record));
  REQUIRE(record.time == fixtures::TimeOf(DayRecords[2]));
  REQUIRE(Tell(*reader) == first.size() + second.size());

  requireOk(reader->createIndex());
  REQUIRE(reader->recordIndex().size() == 2);
}

TEST_CASE("Operations before open()", "[reader]") {
  std::unique_ptr<DataReader> reader;
  requireOk(DataReader::Create(ReaderOptions{WindowStart, WindowEnd, FormatKind::Dmap}, &reader));

  darnio::Record record;
  ByteOffset offset = 0;
  REQUIRE(reader->read(&record).code == StatusCode::NotOpen);
  REQUIRE(reader->offsetTell(&offset).code == StatusCode::NotOpen);
  REQUIRE(reader->rewind().code == StatusCode::NotOpen);
  REQUIRE(reader->offsetSeek(0, true).code == StatusCode::NotOpen);
  REQUIRE(reader->timeSeek(WindowStart).code == StatusCode::NotOpen);

  std::vector<darnio::Status> problems;
  REQUIRE(reader->createIndex([&](const darnio::Status& s) {
                  problems.push_back(s);
                }).code == StatusCode::NotOpen);
  REQUIRE(problems.size() == 1);
  REQUIRE(reader->recordIndex().empty());
}

TEST_CASE("Window and index scenario", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);

  const std::vector<TestRecord> records = {
    {2012, 11, 24, 4, 4, 39, 141000, 1},
    {2012, 11, 24, 4, 10, 0, 0, 0},
    {2012, 11, 24, 5, 30, 0, 0, 1},
  };
  auto open = OpenBuffer(format, fixtures::EncodeFile(format, records), WindowStart, WindowEnd);
  auto& reader = *open.reader;

  requireOk(reader.createIndex());
  REQUIRE(reader.recordIndex().size() == 2);
  REQUIRE(reader.scanStartIndex().size() == 1);
  REQUIRE(reader.scanStartIndex().count(MakeTimestamp(2012, 11, 24, 4, 4, 39, 141000)) == 1);
  REQUIRE(reader.recordIndex().count(MakeTimestamp(2012, 11, 24, 5, 30)) == 0);

  darnio::Record record;
  requireOk(reader.read(&record));
  REQUIRE(record.time == MakeTimestamp(2012, 11, 24, 4, 4, 39, 141000));
  REQUIRE(record.isScanStart());
  requireOk(reader.read(&record));
  REQUIRE(record.time == MakeTimestamp(2012, 11, 24, 4, 10));
  REQUIRE(record.scan == 0);
  REQUIRE(reader.read(&record).endOfStream());
}

TEST_CASE("DataReader::createIndex()", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  auto open = OpenDay(format);
  auto& reader = *open.reader;

  SECTION("timestamps lie inside the window") {
    requireOk(reader.createIndex());
    REQUIRE(reader.recordIndex().size() == 5);
    for (const auto& [time, offset] : reader.recordIndex()) {
      REQUIRE(time >= WindowStart);
      REQUIRE(time <= WindowEnd);
    }
    REQUIRE(reader.recordIndex().count(WindowEnd) == 1);
  }

  SECTION("scan starts are a subset of the records") {
    requireOk(reader.createIndex());
    REQUIRE(reader.scanStartIndex().size() == 2);
    for (const auto& [time, offset] : reader.scanStartIndex()) {
      const auto it = reader.recordIndex().find(time);
      REQUIRE(it != reader.recordIndex().end());
      REQUIRE(it->second == offset);
    }
  }

  SECTION("idempotent and restores the position") {
    darnio::Record record;
    requireOk(reader.read(&record));
    const ByteOffset before = Tell(reader);
    REQUIRE(before > 0);

    requireOk(reader.createIndex());
    const auto first = *reader.index();
    REQUIRE(Tell(reader) == before);
    requireOk(reader.createIndex());
    REQUIRE(reader.index()->records() == first.records());
    REQUIRE(reader.index()->scanStarts() == first.scanStarts());
    REQUIRE(Tell(reader) == before);

    // Reading continues where it left off
    requireOk(reader.read(&record));
    REQUIRE(record.time == MakeTimestamp(2012, 11, 24, 4, 10));
  }

  SECTION("unbounded end time") {
    auto unbounded =
      OpenBuffer(format, fixtures::EncodeFile(format, DayRecords), WindowStart, std::nullopt);
    requireOk(unbounded.reader->createIndex());
    REQUIRE(unbounded.reader->recordIndex().size() == 6);
    REQUIRE(unbounded.reader->scanStartIndex().size() == 3);
  }
}

TEST_CASE("DataReader::offsetSeek()", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  auto open = OpenDay(format);
  auto& reader = *open.reader;

  SECTION("every indexed offset round-trips") {
    requireOk(reader.createIndex());
    for (const auto& [time, offset] : reader.recordIndex()) {
      ByteOffset position = 0;
      requireOk(reader.offsetSeek(offset, false, &position));
      REQUIRE(position == offset);
      darnio::Record record;
      requireOk(reader.read(&record));
      REQUIRE(record.time == time);
    }
  }

  SECTION("builds the index when there is none") {
    REQUIRE_FALSE(reader.index().has_value());
    // The end of the data is not a record start, but the scan still runs
    ByteOffset position = 0;
    REQUIRE(reader.offsetSeek(open.data.size(), false, &position).code ==
            StatusCode::SeekRefused);
    REQUIRE(reader.index().has_value());
    REQUIRE(reader.recordIndex().size() == 5);
    REQUIRE(position == 0);
  }

  SECTION("refuses offsets that are not indexed") {
    requireOk(reader.createIndex());
    const ByteOffset indexed = reader.recordIndex().begin()->second;
    requireOk(reader.offsetSeek(indexed));
    darnio::Record record;
    requireOk(reader.read(&record));
    const ByteOffset before = Tell(reader);

    ByteOffset position = 0;
    const auto status = reader.offsetSeek(indexed + 1, false, &position);
    REQUIRE(status.code == StatusCode::SeekRefused);
    REQUIRE(position == before);
    REQUIRE(Tell(reader) == before);
  }

  SECTION("the record before the window is not a seek target") {
    // Offset 0 holds the 03:55 record, which is outside the window
    requireOk(reader.offsetSeek(1, true));
    ByteOffset position = 1;
    REQUIRE(reader.offsetSeek(0, false, &position).code == StatusCode::SeekRefused);
    REQUIRE(position == 1);
  }

  SECTION("forced seeks skip the index check") {
    const ByteOffset end = open.data.size();
    ByteOffset position = 0;
    requireOk(reader.offsetSeek(end, true, &position));
    REQUIRE(position == end);
    REQUIRE_FALSE(reader.index().has_value());
    darnio::Record record;
    REQUIRE(reader.read(&record).endOfStream());

    requireOk(reader.offsetSeek(0, true, &position));
    REQUIRE(position == 0);
    requireOk(reader.read(&record));
    REQUIRE(record.time == MakeTimestamp(2012, 11, 24, 4, 4, 39, 141000));
  }

  SECTION("forced seeks past the end are rejected") {
    ByteOffset position = 99;
    REQUIRE(reader.offsetSeek(open.data.size() + 1, true, &position).code ==
            StatusCode::InvalidOffset);
    REQUIRE(position == 0);
  }
}

TEST_CASE("DataReader::rewind()", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  auto open = OpenDay(format);
  auto& reader = *open.reader;

  requireOk(reader.rewind());
  REQUIRE(Tell(reader) == 0);

  REQUIRE(ReadAll(reader).size() == 5);
  REQUIRE(Tell(reader) > 0);
  requireOk(reader.rewind());
  REQUIRE(Tell(reader) == 0);

  requireOk(reader.offsetSeek(open.data.size(), true));
  requireOk(reader.rewind());
  REQUIRE(Tell(reader) == 0);
  REQUIRE(ReadAll(reader).size() == 5);
}

TEST_CASE("DataReader::read()", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);

  SECTION("records outside the window are never returned") {
    auto open = OpenDay(format);
    const auto times = ReadAll(*open.reader);
    REQUIRE(times.size() == 5);
    REQUIRE(times.front() == MakeTimestamp(2012, 11, 24, 4, 4, 39, 141000));
    REQUIRE(times.back() == WindowEnd);
    for (Timestamp time : times) {
      REQUIRE(time >= WindowStart);
      REQUIRE(time <= WindowEnd);
    }
  }

  SECTION("end of stream leaves the cursor after the record that ended it") {
    auto open = OpenDay(format);
    auto& reader = *open.reader;
    REQUIRE(ReadAll(reader).size() == 5);
    // The 05:30 record was decoded and consumed
    REQUIRE(Tell(reader) == open.data.size());
    darnio::Record record;
    REQUIRE(reader.read(&record).endOfStream());
  }

  SECTION("empty file") {
    auto open = OpenBuffer(format, {}, WindowStart, WindowEnd);
    darnio::Record record;
    REQUIRE(open.reader->read(&record).endOfStream());
    requireOk(open.reader->createIndex());
    REQUIRE(open.reader->recordIndex().empty());
  }

  SECTION("fields are returned with the record") {
    auto open = OpenDay(format);
    darnio::Record record;
    requireOk(open.reader->read(&record));
    REQUIRE(record.integer("bmnum") == 7);
    const auto* slist = record.field("slist");
    REQUIRE(slist != nullptr);
    REQUIRE(slist->dimensions == std::vector<uint32_t>{3});
    REQUIRE(slist->values.size() == 3);
    REQUIRE(record.number("time.us") == Approx(141000));
  }
}

TEST_CASE("DataReader::timeSeek()", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  auto open = OpenDay(format);
  auto& reader = *open.reader;

  ByteOffset position = 0;
  requireOk(reader.timeSeek(MakeTimestamp(2012, 11, 24, 4, 11), &position));
  REQUIRE(reader.index().has_value());
  REQUIRE(position == reader.recordIndex().at(MakeTimestamp(2012, 11, 24, 4, 12)));
  darnio::Record record;
  requireOk(reader.read(&record));
  REQUIRE(record.time == MakeTimestamp(2012, 11, 24, 4, 12));

  const ByteOffset before = Tell(reader);
  REQUIRE(reader.timeSeek(MakeTimestamp(2012, 11, 24, 5, 0, 1), &position).code ==
          StatusCode::SeekRefused);
  REQUIRE(position == before);
}

TEST_CASE("DataReader::records()", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  auto open = OpenDay(format);

  std::vector<darnio::Status> problems;
  std::vector<Timestamp> times;
  std::vector<bool> scanStarts;
  for (const auto& record : open.reader->records([&](const darnio::Status& s) {
         problems.push_back(s);
       })) {
    times.push_back(record.time);
    scanStarts.push_back(record.isScanStart());
  }
  REQUIRE(problems.empty());
  REQUIRE(times.size() == 5);
  REQUIRE(scanStarts == std::vector<bool>{true, false, false, true, false});

  auto view = open.reader->records();
  REQUIRE(view.begin() == view.end());
}

TEST_CASE("TimeIndex", "[types]") {
  darnio::TimeIndex index;
  REQUIRE(index.insert(100, 0, true));
  REQUIRE(index.insert(200, 50, false));
  REQUIRE(index.insert(300, 90, true));

  SECTION("duplicate timestamps keep the last occurrence") {
    REQUIRE_FALSE(index.insert(200, 70, true));
    REQUIRE(index.offsetAt(200) == ByteOffset(70));
    REQUIRE(index.contains(70));
    REQUIRE_FALSE(index.contains(50));
    REQUIRE(index.scanStarts().at(200) == 70);
    REQUIRE(index.size() == 3);
  }

  SECTION("a replacing record that does not start a scan drops the scan start") {
    REQUIRE_FALSE(index.insert(300, 120, false));
    REQUIRE(index.offsetAt(300) == ByteOffset(120));
    REQUIRE(index.scanStarts().count(300) == 0);
    REQUIRE(index.scanStartFor(350)->first == 100);
    for (const auto& [time, offset] : index.scanStarts()) {
      REQUIRE(index.offsetAt(time) == offset);
    }
  }

  SECTION("lookups") {
    REQUIRE(index.contains(50));
    REQUIRE_FALSE(index.contains(51));
    REQUIRE(index.offsetAt(250) == std::nullopt);
    REQUIRE(index.firstAtOrAfter(150)->second == 50);
    REQUIRE(index.firstAtOrAfter(301) == std::nullopt);
    REQUIRE(index.scanStartFor(250)->first == 100);
    REQUIRE(index.scanStartFor(300)->first == 300);
    REQUIRE(index.scanStartFor(50) == std::nullopt);
    REQUIRE(index.size() == 3);
  }
}

TEST_CASE("Duplicate timestamps in a file", "[reader]") {
  const auto format = GENERATE(FormatKind::Dmap, FormatKind::Json);
  CAPTURE(format);
  const std::vector<TestRecord> records = {
    {2012, 11, 24, 4, 10, 0, 0, 0},
    {2012, 11, 24, 4, 10, 0, 0, 1},
    {2012, 11, 24, 4, 20, 0, 0, 1},
    {2012, 11, 24, 4, 20, 0, 0, 0},
  };
  const auto first = fixtures::EncodeFile(format, {records[0]});
  auto open = OpenBuffer(format, fixtures::EncodeFile(format, records), WindowStart, WindowEnd);
  auto& reader = *open.reader;
  requireOk(reader.createIndex());

  const Timestamp tenPast = MakeTimestamp(2012, 11, 24, 4, 10);
  const Timestamp twentyPast = MakeTimestamp(2012, 11, 24, 4, 20);
  REQUIRE(reader.recordIndex().size() == 2);
  REQUIRE(reader.recordIndex().at(tenPast) == first.size());
  REQUIRE(reader.scanStartIndex().size() == 1);
  REQUIRE(reader.scanStartIndex().at(tenPast) == first.size());
  REQUIRE(reader.scanStartIndex().count(twentyPast) == 0);

  // Only the later record of each pair is a seek target
  ByteOffset position = 0;
  REQUIRE(reader.offsetSeek(0, false, &position).code == StatusCode::SeekRefused);
  requireOk(reader.offsetSeek(first.size(), false, &position));
  darnio::Record record;
  requireOk(reader.read(&record));
  REQUIRE(record.isScanStart());

  // Every record is still read in file order
  requireOk(reader.rewind());
  REQUIRE(ReadAll(reader).size() == 4);
}
