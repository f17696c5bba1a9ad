#include "internal.hpp"
#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <memory>
#ifndef DARNIO_COMPRESSION_NO_LZ4
#  include <lz4frame.h>
#endif
#ifndef DARNIO_COMPRESSION_NO_ZSTD
#  include <zstd.h>
#  include <zstd_errors.h>
#endif

namespace darnio {

Compression DetectCompression(const std::byte* data, uint64_t size) {
  if (size < 4) {
    return Compression::None;
  }
  const uint32_t magic = internal::ParseUint32(data);
  if (magic == 0xFD2FB528) {
    return Compression::Zstd;
  }
  if (magic == 0x184D2204) {
    return Compression::Lz4;
  }
  return Compression::None;
}

// BufferReader ////////////////////////////////////////////////////////////////

BufferReader::BufferReader(const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size) {}

BufferReader::BufferReader(std::string_view data)
    : data_(reinterpret_cast<const std::byte*>(data.data()))
    , size_(data.size()) {}

uint64_t BufferReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!data_ || offset >= size_) {
    return 0;
  }

  const auto available = size_ - offset;
  *output = const_cast<std::byte*>(data_) + offset;
  return std::min(size, available);
}

uint64_t BufferReader::size() const {
  return size_;
}

// FileReader //////////////////////////////////////////////////////////////////

FileReader::FileReader(std::FILE* file)
    : file_(file)
    , size_(0)
    , position_(0) {
  assert(file_);
  size();
}

uint64_t FileReader::size() const {
  // Measuring moves the stream position; an unknown position forces the next
  // read to seek
  position_ = std::numeric_limits<uint64_t>::max();
  if (std::fseek(file_, 0, SEEK_END) == 0) {
    const long end = std::ftell(file_);
    if (end >= 0) {
      size_ = uint64_t(end);
      position_ = size_;
    }
  }
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    std::fseek(file_, (long)(offset), SEEK_SET);
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  *output = buffer_.data();

  position_ += bytesRead;
  return bytesRead;
}

#ifndef DARNIO_COMPRESSION_NO_LZ4
// LZ4Reader ///////////////////////////////////////////////////////////////////

LZ4Reader::LZ4Reader() {
  const LZ4F_errorCode_t err =
    LZ4F_createDecompressionContext((LZ4F_dctx**)&decompressionContext_, LZ4F_VERSION);
  if (LZ4F_isError(err)) {
    const auto msg =
      internal::StrCat("failed to create lz4 decompression context: ", LZ4F_getErrorName(err));
    status_ = Status{StatusCode::DecompressionFailed, msg};
    decompressionContext_ = nullptr;
  }
}

LZ4Reader::~LZ4Reader() {
  if (decompressionContext_) {
    LZ4F_freeDecompressionContext((LZ4F_dctx*)decompressionContext_);
  }
}

void LZ4Reader::reset(const std::byte* data, uint64_t size) {
  if (!decompressionContext_) {
    return;
  }
  status_ = decompressAll(data, size, &uncompressedData_);
}

uint64_t LZ4Reader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= uncompressedData_.size()) {
    return 0;
  }

  const auto available = uncompressedData_.size() - offset;
  *output = uncompressedData_.data() + offset;
  return std::min(size, available);
}

uint64_t LZ4Reader::size() const {
  return uncompressedData_.size();
}

Status LZ4Reader::status() const {
  return status_;
}

Status LZ4Reader::decompressAll(const std::byte* data, uint64_t size, ByteArray* output) {
  if (!decompressionContext_) {
    return status_;
  }
  auto* dctx = (LZ4F_dctx*)decompressionContext_;
  LZ4F_resetDecompressionContext(dctx);
  output->clear();

  // Files are decoded in 4 MiB output steps; the frame header rarely carries
  // a content size for streamed SuperDARN files
  constexpr size_t OutputStep = 4 * 1024 * 1024;
  uint64_t srcPos = 0;
  size_t hint = 1;
  bool outputFull = false;
  while (srcPos < size || outputFull) {
    const size_t written = output->size();
    output->resize(written + OutputStep);
    size_t dstSize = OutputStep;
    size_t srcSize = size_t(size - srcPos);
    hint = LZ4F_decompress(dctx, output->data() + written, &dstSize, data + srcPos, &srcSize,
                           nullptr);
    if (LZ4F_isError(hint)) {
      const auto msg = internal::StrCat("lz4 decompression of ", size,
                                        " bytes failed at input byte ", srcPos, " (",
                                        LZ4F_getErrorName(hint), ")");
      output->clear();
      return Status{StatusCode::DecompressionFailed, msg};
    }
    srcPos += srcSize;
    output->resize(written + dstSize);
    outputFull = dstSize == OutputStep;
    if (srcSize == 0 && dstSize == 0) {
      break;
    }
  }
  if (hint != 0) {
    const auto msg = internal::StrCat("lz4 decompression of ", size, " bytes incomplete: produced ",
                                      output->size(), " bytes, expect ", hint,
                                      " more input bytes");
    output->clear();
    return Status{StatusCode::DecompressionSizeMismatch, msg};
  }
  return StatusCode::Success;
}
#endif

#ifndef DARNIO_COMPRESSION_NO_ZSTD
// ZStdReader //////////////////////////////////////////////////////////////////

void ZStdReader::reset(const std::byte* data, uint64_t size) {
  status_ = DecompressAll(data, size, &uncompressedData_);
}

uint64_t ZStdReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= uncompressedData_.size()) {
    return 0;
  }

  const auto available = uncompressedData_.size() - offset;
  *output = uncompressedData_.data() + offset;
  return std::min(size, available);
}

uint64_t ZStdReader::size() const {
  return uncompressedData_.size();
}

Status ZStdReader::status() const {
  return status_;
}

Status ZStdReader::DecompressAll(const std::byte* data, uint64_t compressedSize,
                                 ByteArray* output) {
  output->clear();
  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx{ZSTD_createDCtx(), ZSTD_freeDCtx};
  if (!dctx) {
    return Status{StatusCode::DecompressionFailed, "failed to create zstd decompression context"};
  }

  // Reserve the declared size of the first frame when the writer recorded one
  const auto contentSize = ZSTD_getFrameContentSize(data, compressedSize);
  if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
    return Status{StatusCode::DecompressionFailed, "input is not a zstd frame"};
  }
  if (contentSize != ZSTD_CONTENTSIZE_UNKNOWN) {
    output->reserve(contentSize);
  }

  const size_t outputStep = ZSTD_DStreamOutSize();
  ZSTD_inBuffer input{data, size_t(compressedSize), 0};
  size_t ret = 0;
  bool outputFull = false;
  while (input.pos < input.size || outputFull) {
    const size_t written = output->size();
    output->resize(written + outputStep);
    ZSTD_outBuffer out{output->data() + written, outputStep, 0};
    ret = ZSTD_decompressStream(dctx.get(), &out, &input);
    if (ZSTD_isError(ret)) {
      const auto msg = internal::StrCat("zstd decompression of ", compressedSize,
                                        " bytes failed with error ", ZSTD_getErrorName(ret));
      output->clear();
      return Status{StatusCode::DecompressionFailed, msg};
    }
    output->resize(written + out.pos);
    outputFull = out.pos == out.size;
  }
  if (ret != 0) {
    const auto msg = internal::StrCat("zstd decompression of ", compressedSize,
                                      " bytes ended inside a frame after producing ",
                                      output->size(), " bytes");
    output->clear();
    return Status{StatusCode::DecompressionSizeMismatch, msg};
  }
  return StatusCode::Success;
}
#endif

// ReaderOptions ///////////////////////////////////////////////////////////////

Status ReaderOptions::validate() const {
  if (endTime && startTime > *endTime) {
    return Status{StatusCode::InvalidWindow,
                  internal::StrCat("start time ", startTime, " is after end time ", *endTime)};
  }
  if (format != FormatKind::Dmap && format != FormatKind::Json) {
    return Status{StatusCode::UnsupportedFormat,
                  internal::StrCat("unsupported format ", int(format),
                                   ", supported formats: dmap, json")};
  }
  return StatusCode::Success;
}

// DataReader //////////////////////////////////////////////////////////////////

Status DataReader::Create(const ReaderOptions& options, std::unique_ptr<DataReader>* reader) {
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }
  auto codec = MakeCodec(options.format);
  if (!codec) {
    return StatusCode::UnsupportedFormat;
  }
  reader->reset(new DataReader(options, std::move(codec)));
  return StatusCode::Success;
}

Status DataReader::Create(const ReaderOptions& options, std::unique_ptr<IRecordCodec> codec,
                          std::unique_ptr<DataReader>* reader) {
  if (options.endTime && options.startTime > *options.endTime) {
    return Status{StatusCode::InvalidWindow, internal::StrCat("start time ", options.startTime,
                                                              " is after end time ",
                                                              *options.endTime)};
  }
  if (!codec) {
    return Status{StatusCode::UnsupportedFormat, "no codec supplied"};
  }
  reader->reset(new DataReader(options, std::move(codec)));
  return StatusCode::Success;
}

DataReader::DataReader(const ReaderOptions& options, std::unique_ptr<IRecordCodec> codec)
    : options_(options)
    , codec_(std::move(codec)) {}

DataReader::~DataReader() {
  close();
}

Status DataReader::open() {
  if (input_) {
    return StatusCode::AlreadyOpen;
  }
  if (!options_.filePath) {
    return Status{StatusCode::OpenFailed, "no file path configured"};
  }

  const std::string& filename = *options_.filePath;
  errno = 0;
  file_ = std::fopen(filename.c_str(), "rb");
  if (!file_) {
    const int err = errno;
    const auto msg = internal::StrCat("failed to open \"", filename, "\": ", std::strerror(err));
    switch (err) {
      case ENOENT:
      case ENOTDIR:
        return Status{StatusCode::FileNotFound, msg};
      case EACCES:
      case EPERM:
        return Status{StatusCode::PermissionDenied, msg};
      default:
        return Status{StatusCode::OpenFailed, msg};
    }
  }

  fileInput_ = std::make_unique<FileReader>(file_);
  IReadable* source = fileInput_.get();
  if (options_.detectCompression) {
    if (auto status = openDecompressed_(*fileInput_, &source); !status.ok()) {
      close();
      return Status{status.code, internal::StrCat("\"", filename, "\": ", status.message)};
    }
  }
  bind_(*source);
  return StatusCode::Success;
}

Status DataReader::open(IReadable& dataSource) {
  if (input_) {
    return StatusCode::AlreadyOpen;
  }
  IReadable* source = &dataSource;
  if (options_.detectCompression) {
    if (auto status = openDecompressed_(dataSource, &source); !status.ok()) {
      close();
      return status;
    }
  }
  bind_(*source);
  return StatusCode::Success;
}

Status DataReader::openDecompressed_(IReadable& compressed, IReadable** source) {
  const uint64_t size = compressed.size();
  std::byte* data = nullptr;
  if (size < 4 || compressed.read(&data, 0, 4) != 4) {
    return StatusCode::Success;
  }

  switch (DetectCompression(data, 4)) {
    case Compression::None:
      return StatusCode::Success;
#ifndef DARNIO_COMPRESSION_NO_ZSTD
    case Compression::Zstd:
      decompressedInput_ = std::make_unique<ZStdReader>();
      break;
#endif
#ifndef DARNIO_COMPRESSION_NO_LZ4
    case Compression::Lz4:
      decompressedInput_ = std::make_unique<LZ4Reader>();
      break;
#endif
    default:
      return Status{StatusCode::UnsupportedFormat, "compression support not compiled in"};
  }

  const uint64_t bytesRead = compressed.read(&data, 0, size);
  if (bytesRead != size) {
    decompressedInput_.reset();
    return Status{StatusCode::ReadFailed, internal::StrCat("attempted to read ", size,
                                                           " compressed bytes but only read ",
                                                           bytesRead)};
  }
  decompressedInput_->reset(data, size);
  if (auto status = decompressedInput_->status(); !status.ok()) {
    decompressedInput_.reset();
    return status;
  }

  // The decompressed image is self-contained; the file is no longer needed
  if (file_) {
    fileInput_.reset();
    std::fclose(file_);
    file_ = nullptr;
  }
  *source = decompressedInput_.get();
  return StatusCode::Success;
}

void DataReader::bind_(IReadable& dataSource) {
  input_ = &dataSource;
  codec_->reset(dataSource);
  index_ = std::nullopt;
}

void DataReader::close() {
  codec_->clear();
  input_ = nullptr;
  fileInput_.reset();
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  decompressedInput_.reset();
  index_ = std::nullopt;
}

bool DataReader::isOpen() const {
  return input_ != nullptr;
}

Status DataReader::read(Record* record) {
  if (!input_) {
    return StatusCode::NotOpen;
  }
  while (true) {
    Record decoded;
    if (auto status = codec_->decodeNext(&decoded); !status.ok()) {
      return status;
    }
    if (options_.endTime && decoded.time > *options_.endTime) {
      return StatusCode::EndOfStream;
    }
    if (decoded.time >= options_.startTime) {
      *record = std::move(decoded);
      return StatusCode::Success;
    }
  }
}

Status DataReader::createIndex(const ProblemCallback& onProblem) {
  if (!input_) {
    const Status status{StatusCode::NotOpen};
    onProblem(status);
    return status;
  }

  const ByteOffset origin = codec_->tell();
  Status result = codec_->rewind();

  TimeIndex index;
  while (result.ok()) {
    const ByteOffset offset = codec_->tell();
    Record record;
    auto status = codec_->decodeNext(&record);
    if (status.endOfStream()) {
      break;
    }
    if (!status.ok()) {
      if (codec_->tell() == offset) {
        // The codec cannot find the next record
        result = status;
        break;
      }
      onProblem(status);
      continue;
    }
    if (internal::InWindow(record.time, options_.startTime, options_.endTime)) {
      index.insert(record.time, offset, record.isScanStart());
    }
  }

  if (auto status = offsetSeek(origin, true); !status.ok() && result.ok()) {
    result = status;
  }
  if (!result.ok()) {
    onProblem(result);
    return result;
  }

  index_ = std::move(index);
  return StatusCode::Success;
}

Status DataReader::offsetSeek(ByteOffset offset, bool force, ByteOffset* position) {
  if (!input_) {
    return StatusCode::NotOpen;
  }
  if (!force) {
    if (!index_) {
      if (auto status = createIndex(); !status.ok()) {
        if (position) {
          *position = codec_->tell();
        }
        return status;
      }
    }
    if (!index_->contains(offset)) {
      if (position) {
        *position = codec_->tell();
      }
      return Status{StatusCode::SeekRefused,
                    internal::StrCat("offset ", offset, " is not the start of an indexed record")};
    }
  }
  auto status = codec_->seek(offset);
  if (position) {
    *position = codec_->tell();
  }
  return status;
}

Status DataReader::offsetTell(ByteOffset* offset) const {
  if (!input_) {
    return StatusCode::NotOpen;
  }
  *offset = codec_->tell();
  return StatusCode::Success;
}

Status DataReader::rewind() {
  if (!input_) {
    return StatusCode::NotOpen;
  }
  return codec_->rewind();
}

Status DataReader::timeSeek(Timestamp time, ByteOffset* position) {
  if (!input_) {
    return StatusCode::NotOpen;
  }
  if (!index_) {
    if (auto status = createIndex(); !status.ok()) {
      return status;
    }
  }
  const auto entry = index_->firstAtOrAfter(time);
  if (!entry) {
    if (position) {
      *position = codec_->tell();
    }
    return Status{StatusCode::SeekRefused,
                  internal::StrCat("no indexed record at or after time ", time)};
  }
  return offsetSeek(entry->second, true, position);
}

RecordView DataReader::records(const ProblemCallback& onProblem) {
  if (!input_) {
    onProblem(StatusCode::NotOpen);
  }
  return RecordView{*this, onProblem};
}

const std::optional<TimeIndex>& DataReader::index() const {
  return index_;
}

const TimeIndex::OffsetMap& DataReader::recordIndex() const {
  static const TimeIndex::OffsetMap empty;
  return index_ ? index_->records() : empty;
}

const TimeIndex::OffsetMap& DataReader::scanStartIndex() const {
  static const TimeIndex::OffsetMap empty;
  return index_ ? index_->scanStarts() : empty;
}

Timestamp DataReader::startTime() const {
  return options_.startTime;
}

const std::optional<Timestamp>& DataReader::endTime() const {
  return options_.endTime;
}

const ReaderOptions& DataReader::options() const {
  return options_;
}

const IRecordCodec& DataReader::codec() const {
  return *codec_;
}

IReadable* DataReader::dataSource() {
  return input_;
}

// RecordView //////////////////////////////////////////////////////////////////

RecordView::RecordView(DataReader& reader, const ProblemCallback& onProblem)
    : reader_(reader)
    , onProblem_(onProblem) {}

RecordView::Iterator RecordView::begin() {
  return Iterator{*this};
}

RecordView::Iterator RecordView::end() {
  return Iterator{};
}

RecordView::Iterator::Iterator(RecordView& view)
    : view_(&view) {
  fetch_();
}

void RecordView::Iterator::fetch_() {
  current_ = std::nullopt;
  DataReader& reader = view_->reader_;
  if (!reader.isOpen()) {
    return;
  }
  while (true) {
    ByteOffset before = 0;
    if (auto status = reader.offsetTell(&before); !status.ok()) {
      view_->onProblem_(status);
      return;
    }
    Record record;
    const auto status = reader.read(&record);
    if (status.ok()) {
      current_ = std::move(record);
      return;
    }
    if (status.endOfStream()) {
      return;
    }
    view_->onProblem_(status);
    ByteOffset after = 0;
    if (!reader.offsetTell(&after).ok() || after == before) {
      return;
    }
  }
}

RecordView::Iterator::reference RecordView::Iterator::operator*() const {
  return *current_;
}

RecordView::Iterator::pointer RecordView::Iterator::operator->() const {
  return &*current_;
}

RecordView::Iterator& RecordView::Iterator::operator++() {
  fetch_();
  return *this;
}

void RecordView::Iterator::operator++(int) {
  ++*this;
}

bool operator==(const RecordView::Iterator& a, const RecordView::Iterator& b) {
  if (!a.current_ || !b.current_) {
    return a.current_.has_value() == b.current_.has_value();
  }
  return a.view_ == b.view_ && &*a.current_ == &*b.current_;
}

bool operator!=(const RecordView::Iterator& a, const RecordView::Iterator& b) {
  return !(a == b);
}

}  // namespace darnio
