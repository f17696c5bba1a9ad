#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace darnio {

/**
 * @brief An abstract interface for random access to the bytes of a data file.
 */
struct DARNIO_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Returns the size of the data in bytes.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief Called by codecs when they need to read a portion of the data.
   *
   * @param output A pointer to a pointer to the buffer to write to. This method
   *   is expected to either maintain an internal buffer, read data into it, and
   *   update this pointer to point at the internal buffer, or update this
   *   pointer to point directly at the source data if possible. The pointer and
   *   data must remain valid and unmodified until the next call to read().
   * @param offset The offset in bytes from the beginning of the data to read.
   * @param size The number of bytes to read.
   * @return uint64_t Number of bytes actually read. This may be less than the
   *   requested size if the end of the data is reached. If the read fails, this
   *   method should return 0.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
};

/**
 * @brief Format-specific decoding of one record at a time from a data source.
 * A codec owns the read cursor; every DataReader operation is expressed in
 * terms of these primitives.
 */
class DARNIO_PUBLIC IRecordCodec {
public:
  virtual ~IRecordCodec() = default;

  /**
   * @brief Short name of the encoding, e.g. "dmap".
   */
  virtual std::string_view name() const = 0;

  /**
   * @brief Bind to a data source and move the cursor to its first record.
   */
  virtual void reset(IReadable& dataSource) = 0;
  /**
   * @brief Drop the data source reference.
   */
  virtual void clear() = 0;

  /**
   * @brief Decode the record at the cursor and advance past it.
   *
   * @return Status StatusCode::Success, StatusCode::EndOfStream if no complete
   *   record remains, or StatusCode::InvalidRecord. After an InvalidRecord the
   *   cursor has moved past the bad record only if its extent could be
   *   determined.
   */
  virtual Status decodeNext(Record* record) = 0;

  virtual ByteOffset tell() const = 0;
  /**
   * @brief Move the cursor to `offset` without decoding. Offsets past the end
   * of the data are rejected with StatusCode::InvalidOffset.
   */
  virtual Status seek(ByteOffset offset) = 0;
  /**
   * @brief Move the cursor to the first record.
   */
  virtual Status rewind() = 0;
};

/**
 * @brief Decodes SuperDARN DMAP records: a little-endian header of record code,
 * total size, scalar count and array count, followed by self-describing scalar
 * and array fields.
 */
class DARNIO_PUBLIC DmapCodec final : public IRecordCodec {
public:
  static constexpr int32_t RecordCode = 0x00010001;
  static constexpr uint64_t HeaderLength = 16;

  std::string_view name() const override;
  void reset(IReadable& dataSource) override;
  void clear() override;
  Status decodeNext(Record* record) override;
  ByteOffset tell() const override;
  Status seek(ByteOffset offset) override;
  Status rewind() override;

  /**
   * @brief Parses the fields of one complete DMAP record (header included)
   * into `record->fields`. Does not resolve the time and scan attributes.
   */
  static Status ParseRecord(const std::byte* data, uint64_t size, Record* record);

private:
  IReadable* dataSource_ = nullptr;
  ByteOffset offset_ = 0;
};

/**
 * @brief Decodes records stored as concatenated JSON objects. An object may be
 * spread across several lines; lines are accumulated until they parse.
 */
class DARNIO_PUBLIC JsonCodec final : public IRecordCodec {
public:
  /**
   * @brief Bytes requested from the data source per read. Lines are split out
   * of the buffered chunk before the next one is requested.
   */
  static constexpr uint64_t ReadChunkSize = 64 * 1024;

  std::string_view name() const override;
  void reset(IReadable& dataSource) override;
  void clear() override;
  Status decodeNext(Record* record) override;
  ByteOffset tell() const override;
  Status seek(ByteOffset offset) override;
  Status rewind() override;

  /**
   * @brief Converts one JSON record text into `record->fields`. Does not
   * resolve the time and scan attributes.
   */
  static Status ParseRecord(std::string_view text, Record* record);

private:
  IReadable* dataSource_ = nullptr;
  ByteOffset offset_ = 0;
  // Copy of the data source bytes [chunkOffset_, chunkOffset_ + chunk_.size())
  std::string chunk_;
  ByteOffset chunkOffset_ = 0;

  bool fillChunk_(ByteOffset offset);
  bool readLine_(ByteOffset offset, std::string* line, ByteOffset* next);
};

/**
 * @brief Creates the codec for a built-in format, or nullptr for a value
 * outside the FormatKind enumerators.
 */
DARNIO_PUBLIC
std::unique_ptr<IRecordCodec> MakeCodec(FormatKind format);

}  // namespace darnio

#ifdef DARNIO_IMPLEMENTATION
#  include "codec.inl"
#endif
