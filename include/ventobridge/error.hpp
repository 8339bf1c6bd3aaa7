/**
 * @file error.hpp
 * @brief Error record shared by every ventobridge layer.
 *
 * @details
 * Functions in this project do not throw across module boundaries. They return
 * `bool` and, on failure, fill an `Error` with a code and a short, stable
 * `reason` string (`bad_value:fan-speed(1..4)`, `bad_header`, `timeout`).
 * Codes let callers decide (retry, skip a poll cycle, drop a command); reasons
 * go straight into log lines so operators can grep for them.
 */
#ifndef VENTOBRIDGE_ERROR_HPP
#define VENTOBRIDGE_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace ventobridge {

enum class ErrorCode : uint8_t {
  Ok = 0,
  EncodingError,     ///< value does not fit the parameter (type, range, read-only)
  DecodeError,       ///< malformed or unexpected datagram from the unit
  DeviceUnreachable, ///< no usable reply after all attempts
  InvalidValue,      ///< caller-supplied value rejected before anything was sent
  IoError,           ///< socket / broker level failure
  ConfigError        ///< unusable startup configuration
};

/// Stable lower-case name for an error code, used in log lines.
const char* to_string(ErrorCode code);

struct Error {
  ErrorCode   code{ErrorCode::Ok};
  std::string reason;

  bool ok() const { return code == ErrorCode::Ok; }

  // Returns false so call sites can `return err.set(...)`.
  bool set(ErrorCode c, std::string why) {
    code = c;
    reason = std::move(why);
    return false;
  }

  void clear() {
    code = ErrorCode::Ok;
    reason.clear();
  }

  /// "decode_error:bad_header" style summary.
  std::string describe() const;
};

} // namespace ventobridge

#endif // VENTOBRIDGE_ERROR_HPP
