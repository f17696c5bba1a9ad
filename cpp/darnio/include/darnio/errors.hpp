#pragma once

#include <string>

namespace darnio {

/**
 * @brief Status codes for darnio readers and codecs.
 */
enum class StatusCode {
  Success = 0,
  EndOfStream,
  InvalidWindow,
  UnsupportedFormat,
  FileNotFound,
  PermissionDenied,
  OpenFailed,
  AlreadyOpen,
  NotOpen,
  SeekRefused,
  InvalidOffset,
  ReadFailed,
  InvalidRecord,
  DecompressionFailed,
  DecompressionSizeMismatch,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::EndOfStream:
        message = "end of stream";
        break;
      case StatusCode::InvalidWindow:
        message = "start time is after end time";
        break;
      case StatusCode::UnsupportedFormat:
        message = "unsupported format";
        break;
      case StatusCode::FileNotFound:
        message = "file not found";
        break;
      case StatusCode::PermissionDenied:
        message = "permission denied";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::AlreadyOpen:
        message = "already open";
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::SeekRefused:
        message = "offset is not an indexed record";
        break;
      case StatusCode::InvalidOffset:
        message = "invalid offset";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::InvalidRecord:
        message = "invalid record";
        break;
      case StatusCode::DecompressionFailed:
        message = "decompression failed";
        break;
      case StatusCode::DecompressionSizeMismatch:
        message = "decompression size mismatch";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }

  /**
   * @brief True for the end-of-stream sentinel returned by `read()` and codecs.
   * This is a normal terminal condition, not a failure.
   */
  bool endOfStream() const {
    return code == StatusCode::EndOfStream;
  }
};

}  // namespace darnio
