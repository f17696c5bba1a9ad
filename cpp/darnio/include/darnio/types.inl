#include "internal.hpp"

namespace darnio {

std::optional<FormatKind> ParseFormatKind(std::string_view name) {
  if (name == "dmap") {
    return FormatKind::Dmap;
  } else if (name == "json") {
    return FormatKind::Json;
  }
  return std::nullopt;
}

// Record ///////////////////////////////////////////////////////////////////////

const Field* Record::field(std::string_view name) const {
  const auto it = fields.find(name);
  return (it == fields.end()) ? nullptr : &it->second;
}

std::optional<int64_t> Record::integer(std::string_view name) const {
  const Field* f = field(name);
  if (!f || !f->isScalar() || f->values.empty()) {
    return std::nullopt;
  }
  return internal::ValueToInt64(f->values.front());
}

std::optional<double> Record::number(std::string_view name) const {
  const Field* f = field(name);
  if (!f || !f->isScalar() || f->values.empty()) {
    return std::nullopt;
  }
  return internal::ValueToDouble(f->values.front());
}

std::optional<std::string> Record::string(std::string_view name) const {
  const Field* f = field(name);
  if (!f || !f->isScalar() || f->values.empty()) {
    return std::nullopt;
  }
  if (const auto* str = std::get_if<std::string>(&f->values.front())) {
    return *str;
  }
  return std::nullopt;
}

// TimeIndex ////////////////////////////////////////////////////////////////////

bool TimeIndex::insert(Timestamp time, ByteOffset offset, bool scanStart) {
  const auto [it, inserted] = records_.try_emplace(time, offset);
  if (!inserted) {
    offsets_.erase(it->second);
    it->second = offset;
  }
  offsets_.insert(offset);
  if (scanStart) {
    scanStarts_.insert_or_assign(time, offset);
  } else {
    scanStarts_.erase(time);
  }
  return inserted;
}

const TimeIndex::OffsetMap& TimeIndex::records() const {
  return records_;
}

const TimeIndex::OffsetMap& TimeIndex::scanStarts() const {
  return scanStarts_;
}

bool TimeIndex::contains(ByteOffset offset) const {
  return offsets_.find(offset) != offsets_.end();
}

std::optional<ByteOffset> TimeIndex::offsetAt(Timestamp time) const {
  const auto it = records_.find(time);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<TimeIndex::Entry> TimeIndex::firstAtOrAfter(Timestamp time) const {
  const auto it = records_.lower_bound(time);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::optional<TimeIndex::Entry> TimeIndex::scanStartFor(Timestamp time) const {
  auto it = scanStarts_.upper_bound(time);
  if (it == scanStarts_.begin()) {
    return std::nullopt;
  }
  --it;
  return *it;
}

size_t TimeIndex::size() const {
  return records_.size();
}

bool TimeIndex::empty() const {
  return records_.empty();
}

}  // namespace darnio
