#include "ventobridge/error.hpp"

namespace ventobridge {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                return "ok";
    case ErrorCode::EncodingError:     return "encoding_error";
    case ErrorCode::DecodeError:       return "decode_error";
    case ErrorCode::DeviceUnreachable: return "device_unreachable";
    case ErrorCode::InvalidValue:      return "invalid_value";
    case ErrorCode::IoError:           return "io_error";
    case ErrorCode::ConfigError:       return "config_error";
  }
  return "unknown";
}

std::string Error::describe() const {
  if (reason.empty()) return to_string(code);
  return std::string(to_string(code)) + ":" + reason;
}

} // namespace ventobridge
