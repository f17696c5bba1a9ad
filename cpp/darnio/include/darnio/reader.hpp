#pragma once

#include "codec.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace darnio {

/**
 * @brief Compression formats recognized by their magic number at the start of
 * a data file.
 */
enum struct Compression {
  None,
  Lz4,
  Zstd,
};

/**
 * @brief Inspects the leading bytes of a file for a zstd or LZ4 frame magic
 * number.
 */
DARNIO_PUBLIC
Compression DetectCompression(const std::byte* data, uint64_t size);

/**
 * @brief IReadable implementation wrapping a FILE* pointer created by fopen()
 * and a read buffer. `size()` re-reads the file length on every call, so
 * records appended to a live file after it was opened become readable.
 */
class DARNIO_PUBLIC FileReader final : public IReadable {
public:
  FileReader(std::FILE* file);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  std::FILE* file_;
  std::vector<std::byte> buffer_;
  mutable uint64_t size_;
  mutable uint64_t position_;
};

/**
 * @brief An abstract interface for readers serving a decoded image of a whole
 * compressed file.
 */
class DARNIO_PUBLIC ICompressedReader : public IReadable {
public:
  virtual ~ICompressedReader() override = default;

  /**
   * @brief Reset the reader state, clearing any internal buffers, and
   * decompress `data` in full. The decompressed size does not need to be known
   * ahead of time.
   *
   * @param data Compressed data to read from. It is not referenced after this
   *   call returns.
   * @param size Size of the compressed data in bytes.
   */
  virtual void reset(const std::byte* data, uint64_t size) = 0;
  /**
   * @brief Report the current status of decompression. A StatusCode other than
   * `StatusCode::Success` after `reset()` is called indicates the decompression
   * was not successful and the reader is in an invalid state.
   */
  virtual Status status() const = 0;
};

/**
 * @brief IReadable implementation over caller-owned memory. No internal
 * buffers are allocated.
 */
class DARNIO_PUBLIC BufferReader final : public IReadable {
public:
  BufferReader(const std::byte* data, uint64_t size);
  BufferReader(std::string_view data);

  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;

  BufferReader(const BufferReader&) = delete;
  BufferReader& operator=(const BufferReader&) = delete;
  BufferReader(BufferReader&&) = delete;
  BufferReader& operator=(BufferReader&&) = delete;

private:
  const std::byte* data_;
  uint64_t size_;
};

#ifndef DARNIO_COMPRESSION_NO_ZSTD
/**
 * @brief ICompressedReader implementation that decompresses Zstandard
 * (https://facebook.github.io/zstd/) files. Concatenated frames are decoded
 * back to back.
 */
class DARNIO_PUBLIC ZStdReader final : public ICompressedReader {
public:
  void reset(const std::byte* data, uint64_t size) override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;
  Status status() const override;

  /**
   * @brief Decompresses all Zstd frames in `data` into `output`.
   *
   * @param data The Zstd-compressed input.
   * @param compressedSize The size of the Zstd-compressed input.
   * @param output The output vector. This will be resized to fit the data, or
   * to 0 if the decompression encountered an error.
   * @return Status
   */
  static Status DecompressAll(const std::byte* data, uint64_t compressedSize, ByteArray* output);
  ZStdReader() = default;
  ZStdReader(const ZStdReader&) = delete;
  ZStdReader& operator=(const ZStdReader&) = delete;
  ZStdReader(ZStdReader&&) = delete;
  ZStdReader& operator=(ZStdReader&&) = delete;

private:
  Status status_;
  ByteArray uncompressedData_;
};
#endif

#ifndef DARNIO_COMPRESSION_NO_LZ4
/**
 * @brief ICompressedReader implementation that decompresses LZ4 frame
 * (https://lz4.github.io/lz4/) files.
 */
class DARNIO_PUBLIC LZ4Reader final : public ICompressedReader {
public:
  void reset(const std::byte* data, uint64_t size) override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;
  Status status() const override;

  /**
   * @brief Decompresses all LZ4 frames in `data` into `output`.
   *
   * @param data The LZ4-compressed input.
   * @param size The size of the LZ4-compressed input.
   * @param output The output vector. This will be resized to fit the data, or
   * to 0 if the decompression encountered an error.
   * @return Status
   */
  Status decompressAll(const std::byte* data, uint64_t size, ByteArray* output);
  LZ4Reader();
  LZ4Reader(const LZ4Reader&) = delete;
  LZ4Reader& operator=(const LZ4Reader&) = delete;
  LZ4Reader(LZ4Reader&&) = delete;
  LZ4Reader& operator=(LZ4Reader&&) = delete;
  ~LZ4Reader() override;

private:
  void* decompressionContext_ = nullptr;  // LZ4F_dctx*
  Status status_;
  ByteArray uncompressedData_;
};
#endif

struct RecordView;

/**
 * @brief Construction parameters for a DataReader.
 */
struct DARNIO_PUBLIC ReaderOptions {
public:
  /**
   * @brief Only records with timestamps greater or equal to startTime are visible.
   */
  Timestamp startTime = 0;
  /**
   * @brief Only records with timestamps less than or equal to endTime are
   * visible. std::nullopt leaves the window open-ended.
   */
  std::optional<Timestamp> endTime;
  /**
   * @brief Record encoding of the file. Fixed for the lifetime of the reader.
   */
  FormatKind format = FormatKind::Dmap;
  /**
   * @brief File opened by `DataReader::open()`.
   */
  std::optional<std::string> filePath;
  /**
   * @brief Transparently decompress files that begin with a zstd or LZ4 frame
   * magic number. Byte offsets then refer to the decompressed stream.
   */
  bool detectCompression = true;

  ReaderOptions(Timestamp start, std::optional<Timestamp> end, FormatKind format,
                std::optional<std::string> path = std::nullopt)
      : startTime(start)
      , endTime(end)
      , format(format)
      , filePath(std::move(path)) {}

  ReaderOptions() = default;

  /**
   * @brief validate the configuration.
   */
  Status validate() const;
};

/**
 * @brief Reads time-stamped records from a DMAP or JSON data file, restricted
 * to an inclusive [startTime, endTime] window, with random access through an
 * index of record timestamps to byte offsets.
 *
 * A DataReader is not thread safe. The file handle it opens is released by
 * `close()` or on destruction.
 */
class DARNIO_PUBLIC DataReader final {
public:
  /**
   * @brief Creates a reader for one of the built-in formats. The options are
   * validated before any file access.
   *
   * @return Status StatusCode::InvalidWindow if startTime is after endTime,
   *   StatusCode::UnsupportedFormat if `options.format` is not a known format.
   */
  static Status Create(const ReaderOptions& options, std::unique_ptr<DataReader>* reader);
  /**
   * @brief Creates a reader backed by a caller-supplied codec. `options.format`
   * is not consulted.
   */
  static Status Create(const ReaderOptions& options, std::unique_ptr<IRecordCodec> codec,
                       std::unique_ptr<DataReader>* reader);

  ~DataReader();

  DataReader(const DataReader&) = delete;
  DataReader& operator=(const DataReader&) = delete;
  DataReader(DataReader&&) = delete;
  DataReader& operator=(DataReader&&) = delete;

  /**
   * @brief Opens `filePath` read-only.
   *
   * @return Status StatusCode::Success on success. StatusCode::FileNotFound,
   *   StatusCode::PermissionDenied or StatusCode::OpenFailed if the file cannot
   *   be opened, StatusCode::AlreadyOpen if the reader is already open. If a
   *   non-success Status is returned the reader holds no file handle.
   */
  Status open();
  /**
   * @brief Reads from an already constructed IReadable implementation, which
   * must outlive the open reader.
   */
  Status open(IReadable& dataSource);

  /**
   * @brief Releases the file handle and drops the index. Safe to call when the
   * reader is not open.
   */
  void close();

  bool isOpen() const;

  /**
   * @brief Decodes records from the current position until one falls inside
   * the window.
   *
   * @return Status StatusCode::Success with `record` populated,
   *   StatusCode::EndOfStream once the data is exhausted or a record after
   *   endTime is reached, or the codec error for a malformed record. The cursor
   *   is left after the last decoded record.
   */
  Status read(Record* record);

  /**
   * @brief Scans the whole file from offset 0, indexing the offsets of every
   * record inside the window, then restores the current position. Replaces
   * any previous index. The cost is one full pass over the file.
   *
   * @param onProblem Called for each malformed record that is skipped.
   */
  Status createIndex(const ProblemCallback& onProblem = [](const Status&) {});

  /**
   * @brief Moves to `offset`. Unless `force` is set the offset must be the
   * start of an indexed record; if no index exists, `createIndex()` runs
   * first.
   *
   * @param position If not null, receives the position after the call. On a
   *   refused seek this is the unchanged current offset.
   * @return Status StatusCode::SeekRefused if `offset` is not indexed,
   *   StatusCode::InvalidOffset if it lies past the end of the data.
   */
  Status offsetSeek(ByteOffset offset, bool force = false, ByteOffset* position = nullptr);

  Status offsetTell(ByteOffset* offset) const;

  /**
   * @brief Moves back to the first record. `offsetTell()` reports 0 afterwards.
   */
  Status rewind();

  /**
   * @brief Moves to the first indexed record with a timestamp greater or equal
   * to `time`, building the index if needed.
   *
   * @return Status StatusCode::SeekRefused if no indexed record is at or after
   *   `time`.
   */
  Status timeSeek(Timestamp time, ByteOffset* position = nullptr);

  /**
   * @brief Returns an iterable view over the records remaining from the current
   * position, as returned by `read()`.
   *
   * @param onProblem Called with each error `read()` returns. Iteration skips
   *   a malformed record when the codec can move past it and stops otherwise.
   */
  RecordView records(const ProblemCallback& onProblem = [](const Status&) {});

  /**
   * @brief Returns the index built by the last successful `createIndex()`.
   */
  const std::optional<TimeIndex>& index() const;
  /**
   * @brief Shorthand for `index()->records()`, empty if no index exists.
   */
  const TimeIndex::OffsetMap& recordIndex() const;
  /**
   * @brief Shorthand for `index()->scanStarts()`, empty if no index exists.
   */
  const TimeIndex::OffsetMap& scanStartIndex() const;

  Timestamp startTime() const;
  const std::optional<Timestamp>& endTime() const;
  const ReaderOptions& options() const;
  const IRecordCodec& codec() const;
  /**
   * @brief Returns the IReadable backing this reader, or nullptr if not open.
   */
  IReadable* dataSource();

private:
  DataReader(const ReaderOptions& options, std::unique_ptr<IRecordCodec> codec);

  ReaderOptions options_;
  std::unique_ptr<IRecordCodec> codec_;
  IReadable* input_ = nullptr;
  std::FILE* file_ = nullptr;
  std::unique_ptr<FileReader> fileInput_;
  std::unique_ptr<ICompressedReader> decompressedInput_;
  std::optional<TimeIndex> index_;

  void bind_(IReadable& dataSource);
  Status openDecompressed_(IReadable& compressed, IReadable** source);
};

/**
 * @brief A single-pass iterable view of the records a DataReader returns.
 */
struct DARNIO_PUBLIC RecordView {
  struct DARNIO_PUBLIC Iterator {
    using iterator_category = std::input_iterator_tag;
    using difference_type = int64_t;
    using value_type = Record;
    using pointer = const Record*;
    using reference = const Record&;

    reference operator*() const;
    pointer operator->() const;
    Iterator& operator++();
    void operator++(int);
    DARNIO_PUBLIC friend bool operator==(const Iterator& a, const Iterator& b);
    DARNIO_PUBLIC friend bool operator!=(const Iterator& a, const Iterator& b);

  private:
    friend RecordView;

    Iterator() = default;
    Iterator(RecordView& view);

    void fetch_();

    RecordView* view_ = nullptr;
    std::optional<Record> current_;
  };

  RecordView(DataReader& reader, const ProblemCallback& onProblem);

  RecordView(const RecordView&) = delete;
  RecordView& operator=(const RecordView&) = delete;
  RecordView(RecordView&&) = default;
  RecordView& operator=(RecordView&&) = delete;

  Iterator begin();
  Iterator end();

private:
  DataReader& reader_;
  const ProblemCallback onProblem_;
};

}  // namespace darnio

#ifdef DARNIO_IMPLEMENTATION
#  include "reader.inl"
#endif
