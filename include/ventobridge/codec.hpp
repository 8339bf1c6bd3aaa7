/**
 * @page vb-codec Vento UDP Codec
 * @file codec.hpp
 * @brief Command frame builders and status frame decoding for the Vento "mobile" protocol.
 *
 * @details
 * PURPOSE
 * -------
 * The codec is the contract between the host and the ventilation unit. It
 * turns a request (read everything, write one parameter, toggle power) into
 * the exact bytes the unit expects, and turns the unit's reply back into a
 * list of typed readings. It knows nothing about sockets, retries or MQTT.
 *
 * WIRE SHAPE
 * ----------
 * Requests are always ten bytes:
 *
 *     6D 6F 62 69 6C 65 | FN | ARG | 0D 0A
 *     "m  o  b  i  l  e"
 *
 *   - read-all: FN = 0x01, ARG = 0x00
 *   - write:    FN = parameter id, ARG = value byte
 *   - toggle:   FN = parameter id, ARG = 0x00
 *
 * The unit answers every request with its status page:
 *
 *     6D 6F 62 69 6C 65 | id w-bytes | id w-bytes | ... [0D 0A]
 *
 * Pair widths come from the parameter registry (parameter.hpp). A full page is
 * 98 bytes. A trailing 0D 0A sitting exactly on a pair boundary is taken as a
 * frame terminator.
 *
 * There is no device address, password or checksum in this protocol
 * generation: the unit is identified by its network address, which the device
 * client checks on every reply.
 *
 * FAILURE MODEL
 * -------------
 * - Encoding refuses values outside the parameter's type or write range and
 *   writes to read-only parameters (`ErrorCode::EncodingError`).
 * - Decoding refuses short frames, foreign headers, unknown ids, truncated
 *   pairs, duplicate ids and out-of-range booleans/enumerations
 *   (`ErrorCode::DecodeError`). Every read is bounds-checked first; garbage
 *   never leads to an out-of-bounds access or a half-filled result.
 *
 * EXAMPLE FLOW
 * ------------
 * @code
 *   std::vector<uint8_t> req;
 *   Error err;
 *   encode_request(Request::write(*find_parameter("fan-speed"), Value::integer(3)), req, err);
 *   // req = 6D6F62696C65 04 03 0D0A
 *
 *   ResponseFrame frame;
 *   if (decode_response(reply.data(), reply.size(), frame, err)) {
 *     const Reading* r = frame.find(PARAM_FAN_SPEED);   // r->value.number == 3
 *   }
 * @endcode
 */
#ifndef VENTOBRIDGE_CODEC_HPP
#define VENTOBRIDGE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ventobridge/error.hpp"
#include "ventobridge/parameter.hpp"

namespace ventobridge {

// ============================ Frame constants ============================

constexpr uint8_t     FRAME_HEADER[6]  = {0x6D, 0x6F, 0x62, 0x69, 0x6C, 0x65}; // "mobile"
constexpr uint8_t     FRAME_FOOTER[2]  = {0x0D, 0x0A};
constexpr std::size_t HEADER_LEN       = sizeof(FRAME_HEADER);
constexpr std::size_t FOOTER_LEN       = sizeof(FRAME_FOOTER);
constexpr std::size_t REQUEST_LEN      = HEADER_LEN + 2 + FOOTER_LEN;
constexpr std::size_t STATUS_PAGE_LEN  = 98;   ///< full read-all reply
constexpr std::size_t MAX_DATAGRAM_LEN = 512;  ///< receive buffer size

enum : uint8_t {
  FN_READ_ALL  = 0x01,  ///< ask for the full status page
  ARG_NONE     = 0x00   ///< argument byte for read-all and toggle
};

// =============================== Request ===============================

/**
 * @brief One outbound command, built fresh per transaction.
 *
 * `param` is null for read-all. `value` is only meaningful for writes.
 */
struct Request {
  enum class Kind : uint8_t { ReadAll, Write, Toggle };

  Kind             kind{Kind::ReadAll};
  const Parameter* param{nullptr};
  Value            value{};

  static Request read_all();
  static Request write(const Parameter& p, const Value& v);
  static Request toggle(const Parameter& p);
};

// =============================== Response ===============================

struct Reading {
  const Parameter* param;
  Value            value;
};

/// Decoded status page, readings in wire order.
struct ResponseFrame {
  std::vector<Reading> readings;

  const Reading* find(uint8_t id) const;
  bool empty() const { return readings.empty(); }
};

// ============================== Operations ==============================

/**
 * @brief Check that `v` is a legal value for `p` (type and range).
 *
 * Used by the encoder for writes and by the topic mapper before a command
 * ever reaches the device client.
 *
 * @return false with `ErrorCode::EncodingError` and a reason such as
 *         `bad_value:fan-speed(1..4)` or `type_mismatch:power`.
 */
bool check_value(const Parameter& p, const Value& v, Error& err);

/**
 * @brief Append the wire bytes of one value (no id byte).
 *
 * Timers go out seconds, minutes, hours. Fails like check_value(), except
 * that integers are only held to one byte.
 */
bool encode_value(const Parameter& p, const Value& v, std::vector<uint8_t>& out, Error& err);

/// Read exactly `p.width` bytes into a value; `DecodeError` on a short buffer or implausible value.
bool decode_value(const Parameter& p, const uint8_t* data, std::size_t len, Value& out, Error& err);

/**
 * @brief Serialize a request into a ten-byte command frame.
 *
 * @param req  Request to encode.
 * @param out  Cleared, then filled with the frame on success.
 * @param err  Set to `EncodingError` on an invalid value, a write to a
 *             read-only parameter or a toggle on a non-toggle parameter.
 */
bool encode_request(const Request& req, std::vector<uint8_t>& out, Error& err);

/**
 * @brief Parse a command frame back into a request.
 *
 * The host never receives requests; this exists for loopback tests and
 * simulated units that have to understand what the bridge sent.
 */
bool decode_request(const uint8_t* data, std::size_t len, Request& out, Error& err);

/**
 * @brief Serialize readings into a status page (header + pairs, no footer).
 *
 * Mirror of decode_response(); lets tests and simulators answer like the unit.
 */
bool encode_response(const ResponseFrame& frame, std::vector<uint8_t>& out, Error& err);

/**
 * @brief Parse a status page into typed readings.
 *
 * @param data  Raw datagram bytes (may be null when len == 0).
 * @param len   Datagram length.
 * @param out   Cleared, then filled only on success.
 * @param err   `DecodeError` with reasons: `short_frame`, `bad_header`,
 *              `unknown_param:0xNN`, `truncated:<name>`, `duplicate:<name>`,
 *              `bad_value:<name>`.
 */
bool decode_response(const uint8_t* data, std::size_t len, ResponseFrame& out, Error& err);

inline bool decode_response(const std::vector<uint8_t>& f, ResponseFrame& out, Error& err) {
  return decode_response(f.data(), f.size(), out, err);
}

/**
 * @brief Render a datagram as one grep-friendly line for debug logs.
 *
 *   "frame=status power=1 fan-speed=2 humidity=41 ..."
 *   "frame=invalid reason=bad_header len=12"
 */
std::string decode_pretty(const uint8_t* data, std::size_t len);

/// Lower-case hex of a byte buffer ("6d6f62...").
std::string to_hex(const uint8_t* data, std::size_t len);

} // namespace ventobridge

#endif // VENTOBRIDGE_CODEC_HPP
