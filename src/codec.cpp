// -----------------------------------------------------------------------------
// codec.cpp — Implementation of the Vento "mobile" frame codec
//
// API & wire layout:
//   see include/ventobridge/codec.hpp
//
// Runnable usage:
//   see tests/test_codec.cpp
//
// NOTE: Everything here is pure byte shuffling. No I/O, no logging, no
// exceptions. Failure is always `false` plus a reason in Error.
// -----------------------------------------------------------------------------
#include "ventobridge/codec.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <utility>

namespace ventobridge {

// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Start a frame with the "mobile" header.
// Reserve a full status page so response encoding never reallocates.
// ---------------------------------------------------------------------------
static inline std::vector<uint8_t> header() {
  std::vector<uint8_t> b;
  b.reserve(STATUS_PAGE_LEN);
  b.insert(b.end(), FRAME_HEADER, FRAME_HEADER + HEADER_LEN);
  return b;
}

// Close a request frame with CR LF.
static inline void finalize(std::vector<uint8_t>& b) {
  b.insert(b.end(), FRAME_FOOTER, FRAME_FOOTER + FOOTER_LEN);
}

static inline bool has_header(const uint8_t* data, std::size_t len) {
  return len >= HEADER_LEN && std::memcmp(data, FRAME_HEADER, HEADER_LEN) == 0;
}

static inline std::string hex_byte(uint8_t b) {
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << unsigned(b);
  return os.str();
}

static inline std::string range_reason(const Parameter& p) {
  std::ostringstream os;
  os << "bad_value:" << p.name << "(" << unsigned(p.min) << ".." << unsigned(p.max) << ")";
  return os.str();
}

// ---------------------------------------------------------------------------
// Append one value in wire order. Caller has already validated it.
// Timers go out seconds first, hours last.
// ---------------------------------------------------------------------------
static void put_value(std::vector<uint8_t>& b, const Parameter& p, const Value& v) {
  switch (p.type) {
    case ValueType::Timer:
      b.push_back(v.timer.seconds);
      b.push_back(v.timer.minutes);
      b.push_back(v.timer.hours);
      break;
    case ValueType::Raw:
      b.insert(b.end(), v.raw.begin(), v.raw.end());
      break;
    default:
      b.push_back(static_cast<uint8_t>(v.number));
      break;
  }
}

// ---------------------------------------------------------------------------
// Read one value of width p.width starting at `at`. Caller guarantees bounds.
// ---------------------------------------------------------------------------
static Value take_value(const Parameter& p, const uint8_t* at) {
  switch (p.type) {
    case ValueType::Timer:
      return Value::duration(at[2], at[1], at[0]);
    case ValueType::Raw:
      return Value::bytes(std::vector<uint8_t>(at, at + p.width));
    default:
      return Value::numeric_for(p, at[0]);
  }
}

// ---------------------------------------------------------------------------
// Shape check used for anything the unit reports. Looser than check_value():
// integers are taken as reported, only codes with a fixed meaning are held to
// their range.
// ---------------------------------------------------------------------------
static bool plausible(const Parameter& p, const Value& v) {
  switch (p.type) {
    case ValueType::Boolean:
    case ValueType::Enumerated:
      return v.number >= p.min && v.number <= p.max;
    case ValueType::Timer:
      return v.timer.minutes < 60 && v.timer.seconds < 60;
    case ValueType::Raw:
      return v.raw.size() == p.width;
    case ValueType::Integer:
      return v.number <= 0xFF;
  }
  return false;
}

// ============================================================================
// Request / Response helpers
// ============================================================================

Request Request::read_all() {
  return Request{};
}

Request Request::write(const Parameter& p, const Value& v) {
  Request r;
  r.kind = Kind::Write;
  r.param = &p;
  r.value = v;
  return r;
}

Request Request::toggle(const Parameter& p) {
  Request r;
  r.kind = Kind::Toggle;
  r.param = &p;
  return r;
}

const Reading* ResponseFrame::find(uint8_t id) const {
  for (const auto& r : readings) {
    if (r.param && r.param->id == id) return &r;
  }
  return nullptr;
}

// ============================================================================
// check_value()
// ---------------------------------------------------------------------------
// Type first, then range. Timers and raw blocks are never written, so they
// only need the shape check.
// ============================================================================
bool check_value(const Parameter& p, const Value& v, Error& err) {
  if (v.type != p.type) {
    return err.set(ErrorCode::EncodingError,
                   std::string("type_mismatch:") + p.name + "(" + to_string(p.type) + ")");
  }

  switch (p.type) {
    case ValueType::Boolean:
    case ValueType::Integer:
    case ValueType::Enumerated:
      if (v.number < p.min || v.number > p.max)
        return err.set(ErrorCode::EncodingError, range_reason(p));
      return true;

    case ValueType::Timer:
    case ValueType::Raw:
      if (!plausible(p, v))
        return err.set(ErrorCode::EncodingError, std::string("bad_value:") + p.name);
      return true;
  }
  return err.set(ErrorCode::EncodingError, std::string("bad_type:") + p.name);
}

// ============================================================================
// encode_value() / decode_value()
// ============================================================================
bool encode_value(const Parameter& p, const Value& v, std::vector<uint8_t>& out, Error& err) {
  if (v.type != p.type || !plausible(p, v))
    return err.set(ErrorCode::EncodingError, std::string("bad_value:") + p.name);
  put_value(out, p, v);
  return true;
}

bool decode_value(const Parameter& p, const uint8_t* data, std::size_t len, Value& out, Error& err) {
  if (!data || len < p.width)
    return err.set(ErrorCode::DecodeError, std::string("truncated:") + p.name);
  Value v = take_value(p, data);
  if (!plausible(p, v))
    return err.set(ErrorCode::DecodeError, std::string("bad_value:") + p.name);
  out = std::move(v);
  return true;
}

// ============================================================================
// encode_request()
// ---------------------------------------------------------------------------
// PRE:   req.param is set for Write/Toggle.
// POLICY:
//   - Write needs a Direct parameter and a value that passes check_value().
//   - Toggle needs a Toggle parameter; its argument byte is always 0x00.
// OUT:   ten-byte frame in `out`.
// ============================================================================
bool encode_request(const Request& req, std::vector<uint8_t>& out, Error& err) {
  out.clear();

  uint8_t fn  = FN_READ_ALL;
  uint8_t arg = ARG_NONE;

  switch (req.kind) {
    case Request::Kind::ReadAll:
      break;

    case Request::Kind::Write: {
      if (!req.param) return err.set(ErrorCode::EncodingError, "missing_param");
      const Parameter& p = *req.param;
      if (p.write != WriteMode::Direct)
        return err.set(ErrorCode::EncodingError, std::string("not_writable:") + p.name);
      if (!check_value(p, req.value, err)) return false;
      fn  = p.id;
      arg = static_cast<uint8_t>(req.value.number);
      break;
    }

    case Request::Kind::Toggle: {
      if (!req.param) return err.set(ErrorCode::EncodingError, "missing_param");
      if (req.param->write != WriteMode::Toggle)
        return err.set(ErrorCode::EncodingError, std::string("not_toggle:") + req.param->name);
      fn = req.param->id;
      break;
    }
  }

  auto b = header();
  b.push_back(fn);
  b.push_back(arg);
  finalize(b);
  out.swap(b);
  return true;
}

// ============================================================================
// decode_request()
// ============================================================================
bool decode_request(const uint8_t* data, std::size_t len, Request& out, Error& err) {
  if (!data || len != REQUEST_LEN) return err.set(ErrorCode::DecodeError, "bad_length");
  if (!has_header(data, len))      return err.set(ErrorCode::DecodeError, "bad_header");
  if (std::memcmp(data + HEADER_LEN + 2, FRAME_FOOTER, FOOTER_LEN) != 0)
    return err.set(ErrorCode::DecodeError, "bad_footer");

  const uint8_t fn  = data[HEADER_LEN];
  const uint8_t arg = data[HEADER_LEN + 1];

  if (fn == FN_READ_ALL) {
    if (arg != ARG_NONE) return err.set(ErrorCode::DecodeError, "bad_argument");
    out = Request::read_all();
    return true;
  }

  const Parameter* p = find_parameter(fn);
  if (!p) return err.set(ErrorCode::DecodeError, "unknown_function:" + hex_byte(fn));

  switch (p->write) {
    case WriteMode::Toggle:
      out = Request::toggle(*p);
      return true;
    case WriteMode::Direct: {
      Value v = Value::numeric_for(*p, arg);
      Error verr;
      if (!check_value(*p, v, verr)) return err.set(ErrorCode::DecodeError, verr.reason);
      out = Request::write(*p, v);
      return true;
    }
    case WriteMode::ReadOnly:
      break;
  }
  return err.set(ErrorCode::DecodeError, std::string("read_only:") + p->name);
}

// ============================================================================
// encode_response()
// ============================================================================
bool encode_response(const ResponseFrame& frame, std::vector<uint8_t>& out, Error& err) {
  out.clear();
  auto b = header();
  for (const auto& r : frame.readings) {
    if (!r.param) return err.set(ErrorCode::EncodingError, "missing_param");
    b.push_back(r.param->id);
    if (!encode_value(*r.param, r.value, b, err)) return false;
  }
  out.swap(b);
  return true;
}

// ============================================================================
// decode_response()
// ---------------------------------------------------------------------------
// Walk id/value pairs after the header.
// PRE:   nothing; data may be garbage of any length.
// POLICY:
//   - Bounds are checked before every read.
//   - 0D 0A as the last two bytes, at a pair boundary, ends the frame. Anywhere
//     else 0x0D is the relay-sensor-status id.
//   - A frame with a header and no pairs is valid (empty snapshot).
//   - `out` is only touched once the whole frame has parsed.
// ============================================================================
bool decode_response(const uint8_t* data, std::size_t len, ResponseFrame& out, Error& err) {
  if (!data || len < HEADER_LEN) return err.set(ErrorCode::DecodeError, "short_frame");
  if (!has_header(data, len))    return err.set(ErrorCode::DecodeError, "bad_header");

  ResponseFrame frame;
  frame.readings.reserve(32);

  std::size_t pos = HEADER_LEN;
  while (pos < len) {
    const std::size_t left = len - pos;

    // terminator on a pair boundary
    if (left == FOOTER_LEN && std::memcmp(data + pos, FRAME_FOOTER, FOOTER_LEN) == 0) break;

    const Parameter* p = find_parameter(data[pos]);
    if (!p) return err.set(ErrorCode::DecodeError, "unknown_param:" + hex_byte(data[pos]));

    if (left - 1 < p->width)
      return err.set(ErrorCode::DecodeError, std::string("truncated:") + p->name);

    if (frame.find(p->id))
      return err.set(ErrorCode::DecodeError, std::string("duplicate:") + p->name);

    Value v;
    if (!decode_value(*p, data + pos + 1, left - 1, v, err)) return false;

    frame.readings.push_back(Reading{p, std::move(v)});
    pos += 1 + p->width;
  }

  out = std::move(frame);
  return true;
}

// ============================================================================
// decode_pretty()
// ---------------------------------------------------------------------------
// Lossy one-liner for logs. Numbers print as numbers, timers as H:MM:SS,
// raw blocks as hex.
// ============================================================================
std::string decode_pretty(const uint8_t* data, std::size_t len) {
  std::ostringstream os;
  ResponseFrame frame;
  Error err;

  if (!decode_response(data, len, frame, err)) {
    os << "frame=invalid reason=" << err.reason << " len=" << len;
    return os.str();
  }

  os << "frame=status";
  for (const auto& r : frame.readings) {
    os << " " << r.param->name << "=";
    switch (r.param->type) {
      case ValueType::Timer:
        os << unsigned(r.value.timer.hours) << ":"
           << std::setw(2) << std::setfill('0') << unsigned(r.value.timer.minutes) << ":"
           << std::setw(2) << std::setfill('0') << unsigned(r.value.timer.seconds)
           << std::setfill(' ');
        break;
      case ValueType::Raw:
        os << to_hex(r.value.raw.data(), r.value.raw.size());
        break;
      default:
        os << r.value.number;
        break;
    }
  }
  return os.str();
}

std::string to_hex(const uint8_t* data, std::size_t len) {
  static const char* DIGITS = "0123456789abcdef";
  std::string s;
  s.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    s.push_back(DIGITS[data[i] >> 4]);
    s.push_back(DIGITS[data[i] & 0x0F]);
  }
  return s;
}

} // namespace ventobridge
