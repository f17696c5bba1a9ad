#include "internal.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace darnio {

namespace internal {

inline bool IsKnownDataType(uint8_t code) {
  switch (DataType(code)) {
    case DataType::Char:
    case DataType::Short:
    case DataType::Int:
    case DataType::Float:
    case DataType::Double:
    case DataType::String:
    case DataType::Long:
    case DataType::UChar:
    case DataType::UShort:
    case DataType::UInt:
    case DataType::ULong:
      return true;
    default:
      return false;
  }
}

// Encoded size of one value. Strings are NUL-terminated, so at least one byte.
inline uint64_t DmapValueSize(DataType type) {
  switch (type) {
    case DataType::Char:
    case DataType::UChar:
    case DataType::String:
      return 1;
    case DataType::Short:
    case DataType::UShort:
      return 2;
    case DataType::Int:
    case DataType::UInt:
    case DataType::Float:
      return 4;
    case DataType::Double:
    case DataType::Long:
    case DataType::ULong:
    default:
      return 8;
  }
}

/**
 * @brief Bounds-checked sequential parser over one DMAP record.
 */
struct DmapParser {
  const std::byte* data;
  uint64_t size;
  uint64_t pos = 0;

  uint64_t remaining() const {
    return size - pos;
  }

  Status need(uint64_t bytes, std::string_view what) const {
    if (remaining() < bytes) {
      return Status{StatusCode::InvalidRecord, StrCat("truncated ", what, " at byte ", pos,
                                                      " of ", size, "-byte record")};
    }
    return StatusCode::Success;
  }

  Status readInt32(int32_t* output, std::string_view what) {
    if (auto status = need(4, what); !status.ok()) {
      return status;
    }
    *output = ParseInt32(data + pos);
    pos += 4;
    return StatusCode::Success;
  }

  Status readCString(std::string* output, std::string_view what) {
    const auto* begin = reinterpret_cast<const char*>(data + pos);
    const void* nul = std::memchr(begin, 0, remaining());
    if (nul == nullptr) {
      return Status{StatusCode::InvalidRecord, StrCat("unterminated ", what, " at byte ", pos)};
    }
    const auto length = uint64_t(static_cast<const char*>(nul) - begin);
    output->assign(begin, length);
    pos += length + 1;
    return StatusCode::Success;
  }

  Status readType(const std::string& name, DataType* type) {
    if (auto status = need(1, "type code"); !status.ok()) {
      return status;
    }
    const auto code = uint8_t(data[pos]);
    if (!IsKnownDataType(code)) {
      return Status{StatusCode::InvalidRecord,
                    StrCat("field \"", name, "\" has unsupported type code 0x", ToHex(code))};
    }
    *type = DataType(code);
    pos += 1;
    return StatusCode::Success;
  }

  Status readValue(DataType type, Value* output) {
    if (type == DataType::String) {
      std::string str;
      if (auto status = readCString(&str, "string value"); !status.ok()) {
        return status;
      }
      *output = std::move(str);
      return StatusCode::Success;
    }
    const uint64_t length = DmapValueSize(type);
    if (auto status = need(length, "value"); !status.ok()) {
      return status;
    }
    const std::byte* p = data + pos;
    switch (type) {
      case DataType::Char:
        *output = int64_t(int8_t(p[0]));
        break;
      case DataType::Short:
        *output = int64_t(int16_t(ParseUint16(p)));
        break;
      case DataType::Int:
        *output = int64_t(ParseInt32(p));
        break;
      case DataType::Long:
        *output = int64_t(ParseUint64(p));
        break;
      case DataType::UChar:
        *output = uint64_t(uint8_t(p[0]));
        break;
      case DataType::UShort:
        *output = uint64_t(ParseUint16(p));
        break;
      case DataType::UInt:
        *output = uint64_t(ParseUint32(p));
        break;
      case DataType::ULong:
        *output = ParseUint64(p);
        break;
      case DataType::Float:
        *output = double(ParseFloat(p));
        break;
      case DataType::Double:
        *output = ParseDouble(p);
        break;
      default:
        return Status{StatusCode::InvalidRecord, "unsupported type"};
    }
    pos += length;
    return StatusCode::Success;
  }
};

/**
 * @brief SAX handler that only records where parsing failed. Used to tell a
 * record that continues on the next line from one that is malformed.
 */
struct JsonErrorLocator {
  using json = nlohmann::json;

  std::size_t errorPosition = 0;

  bool null() {
    return true;
  }
  bool boolean(bool) {
    return true;
  }
  bool number_integer(json::number_integer_t) {
    return true;
  }
  bool number_unsigned(json::number_unsigned_t) {
    return true;
  }
  bool number_float(json::number_float_t, const json::string_t&) {
    return true;
  }
  bool string(json::string_t&) {
    return true;
  }
  bool binary(json::binary_t&) {
    return true;
  }
  bool start_object(std::size_t) {
    return true;
  }
  bool key(json::string_t&) {
    return true;
  }
  bool end_object() {
    return true;
  }
  bool start_array(std::size_t) {
    return true;
  }
  bool end_array() {
    return true;
  }
  bool parse_error(std::size_t position, const std::string&, const nlohmann::detail::exception&) {
    errorPosition = position;
    return false;
  }
};

enum struct JsonParseResult { Complete, Incomplete, Malformed };

inline JsonParseResult ParseJsonText(const std::string& text, nlohmann::json* output) {
  JsonErrorLocator locator;
  if (!nlohmann::json::sax_parse(text, &locator)) {
    // The lexer counts the end-of-input read, so running out of text reports a
    // position one past the last character.
    return locator.errorPosition > text.size() ? JsonParseResult::Incomplete
                                               : JsonParseResult::Malformed;
  }
  *output = nlohmann::json::parse(text, nullptr, false);
  return output->is_discarded() ? JsonParseResult::Malformed : JsonParseResult::Complete;
}

inline bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  });
}

inline Status JsonScalarToValue(const std::string& name, const nlohmann::json& value,
                                DataType* type, Value* output) {
  using value_t = nlohmann::json::value_t;
  switch (value.type()) {
    case value_t::number_unsigned: {
      const auto u = value.get<uint64_t>();
      if (u > uint64_t(std::numeric_limits<int64_t>::max())) {
        *type = DataType::ULong;
        *output = u;
      } else {
        *type = DataType::Long;
        *output = int64_t(u);
      }
      return StatusCode::Success;
    }
    case value_t::number_integer:
      *type = DataType::Long;
      *output = value.get<int64_t>();
      return StatusCode::Success;
    case value_t::number_float:
      *type = DataType::Double;
      *output = value.get<double>();
      return StatusCode::Success;
    case value_t::string:
      *type = DataType::String;
      *output = value.get<std::string>();
      return StatusCode::Success;
    case value_t::boolean:
      *type = DataType::Char;
      *output = int64_t(value.get<bool>() ? 1 : 0);
      return StatusCode::Success;
    default:
      return Status{StatusCode::InvalidRecord,
                    StrCat("field \"", name, "\" has unsupported JSON type ", value.type_name())};
  }
}

inline Status CollectJsonArray(const std::string& name, const nlohmann::json& node, size_t depth,
                               const std::vector<uint32_t>& dimensions,
                               std::vector<DataType>* types, std::vector<Value>* values) {
  if (depth < dimensions.size()) {
    if (!node.is_array() || node.size() != dimensions[depth]) {
      return Status{StatusCode::InvalidRecord,
                    StrCat("array field \"", name, "\" is not rectangular")};
    }
    for (const auto& child : node) {
      if (auto status = CollectJsonArray(name, child, depth + 1, dimensions, types, values);
          !status.ok()) {
        return status;
      }
    }
    return StatusCode::Success;
  }
  DataType type;
  Value value;
  if (node.is_array()) {
    return Status{StatusCode::InvalidRecord,
                  StrCat("array field \"", name, "\" is not rectangular")};
  }
  if (auto status = JsonScalarToValue(name, node, &type, &value); !status.ok()) {
    return status;
  }
  types->push_back(type);
  values->push_back(std::move(value));
  return StatusCode::Success;
}

/**
 * @brief Converts a (possibly nested) JSON array into a Field. Nested arrays
 * must be rectangular; their extents become the field dimensions.
 */
inline Status JsonArrayToField(const std::string& name, const nlohmann::json& array,
                               Field* field) {
  std::vector<uint32_t> dimensions;
  const nlohmann::json* node = &array;
  while (node->is_array()) {
    dimensions.push_back(uint32_t(node->size()));
    if (node->empty()) {
      break;
    }
    node = &node->front();
  }

  std::vector<DataType> types;
  std::vector<Value> values;
  if (auto status = CollectJsonArray(name, array, 0, dimensions, &types, &values);
      !status.ok()) {
    return status;
  }

  const auto has = [&](DataType t) {
    return std::find(types.begin(), types.end(), t) != types.end();
  };
  DataType type = DataType::Long;
  if (has(DataType::String)) {
    if (!std::all_of(types.begin(), types.end(), [](DataType t) {
          return t == DataType::String;
        })) {
      return Status{StatusCode::InvalidRecord,
                    StrCat("array field \"", name, "\" mixes strings and numbers")};
    }
    type = DataType::String;
  } else if (has(DataType::Double)) {
    type = DataType::Double;
    for (auto& value : values) {
      value = *ValueToDouble(value);
    }
  } else if (has(DataType::ULong)) {
    type = DataType::ULong;
    for (auto& value : values) {
      if (const auto* i = std::get_if<int64_t>(&value)) {
        if (*i < 0) {
          return Status{StatusCode::InvalidRecord,
                        StrCat("array field \"", name, "\" mixes negative and 64-bit unsigned")};
        }
        value = uint64_t(*i);
      }
    }
  } else if (!types.empty() && std::all_of(types.begin(), types.end(), [](DataType t) {
               return t == DataType::Char;
             })) {
    type = DataType::Char;
  }

  *field = Field{type, std::move(dimensions), std::move(values)};
  return StatusCode::Success;
}

inline Status JsonToFields(const nlohmann::json& object, FieldMap* fields) {
  if (!object.is_object()) {
    return Status{StatusCode::InvalidRecord,
                  StrCat("record is a JSON ", object.type_name(), ", expected an object")};
  }
  fields->clear();
  for (const auto& [name, value] : object.items()) {
    if (value.is_null()) {
      continue;
    }
    if (value.is_object()) {
      return Status{StatusCode::InvalidRecord,
                    StrCat("field \"", name, "\" is a nested object")};
    }
    Field field;
    if (value.is_array()) {
      if (auto status = JsonArrayToField(name, value, &field); !status.ok()) {
        return status;
      }
    } else {
      DataType type;
      Value scalar;
      if (auto status = JsonScalarToValue(name, value, &type, &scalar); !status.ok()) {
        return status;
      }
      field = Field{type, std::move(scalar)};
    }
    fields->insert_or_assign(name, std::move(field));
  }
  return StatusCode::Success;
}

}  // namespace internal

// DmapCodec ////////////////////////////////////////////////////////////////////

std::string_view DmapCodec::name() const {
  return FormatKindString(FormatKind::Dmap);
}

void DmapCodec::reset(IReadable& dataSource) {
  dataSource_ = &dataSource;
  offset_ = 0;
}

void DmapCodec::clear() {
  dataSource_ = nullptr;
  offset_ = 0;
}

Status DmapCodec::decodeNext(Record* record) {
  if (!dataSource_) {
    return StatusCode::NotOpen;
  }
  const uint64_t totalSize = dataSource_->size();
  if (offset_ >= totalSize || totalSize - offset_ < HeaderLength) {
    // Nothing left, or the header of a record still being appended
    return StatusCode::EndOfStream;
  }
  const uint64_t remaining = totalSize - offset_;

  std::byte* data = nullptr;
  if (dataSource_->read(&data, offset_, 8) != 8) {
    return Status{StatusCode::ReadFailed,
                  internal::StrCat("failed to read record header at offset ", offset_)};
  }
  const int32_t code = internal::ParseInt32(data);
  const int32_t recordSize = internal::ParseInt32(data + 4);
  if (code != RecordCode) {
    return Status{StatusCode::InvalidRecord,
                  internal::StrCat("invalid record code ", code, " at offset ", offset_)};
  }
  if (recordSize < int32_t(HeaderLength)) {
    return Status{StatusCode::InvalidRecord, internal::StrCat("invalid record size ", recordSize,
                                                              " at offset ", offset_)};
  }
  if (uint64_t(recordSize) > remaining) {
    return StatusCode::EndOfStream;
  }

  const uint64_t bytesRead = dataSource_->read(&data, offset_, uint64_t(recordSize));
  if (bytesRead != uint64_t(recordSize)) {
    return Status{StatusCode::ReadFailed,
                  internal::StrCat("attempted to read ", recordSize, " bytes at offset ", offset_,
                                   " but only read ", bytesRead, " bytes")};
  }

  const ByteOffset recordOffset = offset_;
  offset_ += uint64_t(recordSize);

  Record decoded;
  auto status = ParseRecord(data, uint64_t(recordSize), &decoded);
  if (status.ok()) {
    status = internal::ResolveRecordAttributes(&decoded);
  }
  if (!status.ok()) {
    return Status{status.code,
                  internal::StrCat("record at offset ", recordOffset, ": ", status.message)};
  }
  *record = std::move(decoded);
  return StatusCode::Success;
}

ByteOffset DmapCodec::tell() const {
  return offset_;
}

Status DmapCodec::seek(ByteOffset offset) {
  if (!dataSource_) {
    return StatusCode::NotOpen;
  }
  if (offset > dataSource_->size()) {
    return Status{StatusCode::InvalidOffset, internal::StrCat("offset ", offset, " is past the end (",
                                                              dataSource_->size(), " bytes)")};
  }
  offset_ = offset;
  return StatusCode::Success;
}

Status DmapCodec::rewind() {
  return seek(0);
}

Status DmapCodec::ParseRecord(const std::byte* data, uint64_t size, Record* record) {
  internal::DmapParser parser{data, size};
  int32_t code = 0;
  int32_t recordSize = 0;
  int32_t scalarCount = 0;
  int32_t arrayCount = 0;
  if (auto status = parser.readInt32(&code, "record code"); !status.ok()) {
    return status;
  }
  if (code != RecordCode) {
    return Status{StatusCode::InvalidRecord, internal::StrCat("invalid record code ", code)};
  }
  if (auto status = parser.readInt32(&recordSize, "record size"); !status.ok()) {
    return status;
  }
  if (recordSize < 0 || uint64_t(recordSize) != size) {
    return Status{StatusCode::InvalidRecord,
                  internal::StrCat("record size ", recordSize, " does not match ", size)};
  }
  if (auto status = parser.readInt32(&scalarCount, "scalar count"); !status.ok()) {
    return status;
  }
  if (auto status = parser.readInt32(&arrayCount, "array count"); !status.ok()) {
    return status;
  }
  if (scalarCount < 0 || arrayCount < 0) {
    return Status{StatusCode::InvalidRecord,
                  internal::StrCat("negative field count ", scalarCount, "/", arrayCount)};
  }

  record->fields.clear();
  for (int32_t i = 0; i < scalarCount; ++i) {
    std::string name;
    DataType type;
    Value value;
    if (auto status = parser.readCString(&name, "scalar name"); !status.ok()) {
      return status;
    }
    if (auto status = parser.readType(name, &type); !status.ok()) {
      return status;
    }
    if (auto status = parser.readValue(type, &value); !status.ok()) {
      return Status{status.code,
                    internal::StrCat("scalar \"", name, "\": ", status.message)};
    }
    record->fields.insert_or_assign(std::move(name), Field{type, std::move(value)});
  }

  for (int32_t i = 0; i < arrayCount; ++i) {
    std::string name;
    DataType type;
    int32_t dimensionCount = 0;
    if (auto status = parser.readCString(&name, "array name"); !status.ok()) {
      return status;
    }
    if (auto status = parser.readType(name, &type); !status.ok()) {
      return status;
    }
    if (auto status = parser.readInt32(&dimensionCount, "array dimension"); !status.ok()) {
      return status;
    }
    if (dimensionCount <= 0) {
      return Status{StatusCode::InvalidRecord, internal::StrCat("array \"", name, "\" has ",
                                                                dimensionCount, " dimensions")};
    }
    std::vector<uint32_t> dimensions;
    dimensions.reserve(size_t(dimensionCount));
    uint64_t count = 1;
    for (int32_t d = 0; d < dimensionCount; ++d) {
      int32_t extent = 0;
      if (auto status = parser.readInt32(&extent, "array extent"); !status.ok()) {
        return status;
      }
      if (extent < 0) {
        return Status{StatusCode::InvalidRecord,
                      internal::StrCat("array \"", name, "\" has negative extent ", extent)};
      }
      dimensions.push_back(uint32_t(extent));
      count *= uint64_t(extent);
      // Every element takes at least one byte, which also bounds the product
      if (count > size) {
        return Status{StatusCode::InvalidRecord,
                      internal::StrCat("array \"", name, "\" overruns the record")};
      }
    }
    if (count * internal::DmapValueSize(type) > parser.remaining()) {
      return Status{StatusCode::InvalidRecord,
                    internal::StrCat("array \"", name, "\" of ", count, " values overruns the record")};
    }
    std::vector<Value> values;
    values.reserve(size_t(count));
    for (uint64_t n = 0; n < count; ++n) {
      Value value;
      if (auto status = parser.readValue(type, &value); !status.ok()) {
        return Status{status.code,
                      internal::StrCat("array \"", name, "\": ", status.message)};
      }
      values.push_back(std::move(value));
    }
    record->fields.insert_or_assign(std::move(name),
                                    Field{type, std::move(dimensions), std::move(values)});
  }
  return StatusCode::Success;
}

// JsonCodec ////////////////////////////////////////////////////////////////////

std::string_view JsonCodec::name() const {
  return FormatKindString(FormatKind::Json);
}

void JsonCodec::reset(IReadable& dataSource) {
  dataSource_ = &dataSource;
  offset_ = 0;
  chunk_.clear();
  chunkOffset_ = 0;
}

void JsonCodec::clear() {
  dataSource_ = nullptr;
  offset_ = 0;
  chunk_.clear();
  chunkOffset_ = 0;
}

bool JsonCodec::fillChunk_(ByteOffset offset) {
  const uint64_t totalSize = dataSource_->size();
  if (offset >= totalSize) {
    return false;
  }
  std::byte* data = nullptr;
  const uint64_t toRead = std::min(ReadChunkSize, totalSize - offset);
  const uint64_t bytesRead = dataSource_->read(&data, offset, toRead);
  if (bytesRead == 0) {
    return false;
  }
  chunk_.assign(reinterpret_cast<const char*>(data), size_t(bytesRead));
  chunkOffset_ = offset;
  return true;
}

bool JsonCodec::readLine_(ByteOffset offset, std::string* line, ByteOffset* next) {
  line->clear();
  ByteOffset pos = offset;
  while (true) {
    // Data is only ever appended, so buffered bytes stay valid after a seek
    if (pos < chunkOffset_ || pos >= chunkOffset_ + chunk_.size()) {
      if (!fillChunk_(pos)) {
        break;
      }
    }
    const size_t begin = size_t(pos - chunkOffset_);
    const size_t newline = chunk_.find('\n', begin);
    if (newline != std::string::npos) {
      line->append(chunk_, begin, newline + 1 - begin);
      *next = chunkOffset_ + newline + 1;
      return true;
    }
    line->append(chunk_, begin, std::string::npos);
    pos = chunkOffset_ + chunk_.size();
  }
  *next = pos;
  return !line->empty();
}

Status JsonCodec::decodeNext(Record* record) {
  if (!dataSource_) {
    return StatusCode::NotOpen;
  }

  std::string text;
  std::string line;
  ByteOffset pos = offset_;
  ByteOffset next = offset_;
  while (readLine_(pos, &line, &next)) {
    text += line;
    pos = next;
    if (internal::IsBlank(text)) {
      continue;
    }

    nlohmann::json parsed;
    const auto result = internal::ParseJsonText(text, &parsed);
    if (result == internal::JsonParseResult::Incomplete) {
      continue;
    }

    const ByteOffset recordOffset = offset_;
    offset_ = pos;
    if (result == internal::JsonParseResult::Malformed) {
      return Status{StatusCode::InvalidRecord,
                    internal::StrCat("malformed JSON record at offset ", recordOffset)};
    }

    Record decoded;
    auto status = internal::JsonToFields(parsed, &decoded.fields);
    if (status.ok()) {
      status = internal::ResolveRecordAttributes(&decoded);
    }
    if (!status.ok()) {
      return Status{status.code,
                    internal::StrCat("record at offset ", recordOffset, ": ", status.message)};
    }
    *record = std::move(decoded);
    return StatusCode::Success;
  }

  // Only whitespace, or a record whose closing lines have not been written yet
  return StatusCode::EndOfStream;
}

ByteOffset JsonCodec::tell() const {
  return offset_;
}

Status JsonCodec::seek(ByteOffset offset) {
  if (!dataSource_) {
    return StatusCode::NotOpen;
  }
  if (offset > dataSource_->size()) {
    return Status{StatusCode::InvalidOffset, internal::StrCat("offset ", offset, " is past the end (",
                                                              dataSource_->size(), " bytes)")};
  }
  offset_ = offset;
  return StatusCode::Success;
}

Status JsonCodec::rewind() {
  return seek(0);
}

Status JsonCodec::ParseRecord(std::string_view text, Record* record) {
  nlohmann::json parsed;
  const auto result = internal::ParseJsonText(std::string(text), &parsed);
  if (result != internal::JsonParseResult::Complete) {
    return Status{StatusCode::InvalidRecord, result == internal::JsonParseResult::Incomplete
                                               ? "incomplete JSON record"
                                               : "malformed JSON record"};
  }
  return internal::JsonToFields(parsed, &record->fields);
}

std::unique_ptr<IRecordCodec> MakeCodec(FormatKind format) {
  switch (format) {
    case FormatKind::Dmap:
      return std::make_unique<DmapCodec>();
    case FormatKind::Json:
      return std::make_unique<JsonCodec>();
    default:
      return nullptr;
  }
}

}  // namespace darnio
