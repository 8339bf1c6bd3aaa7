/**
 * @page vb-parameters Vento Parameter Registry
 * @file parameter.hpp
 * @brief The unit's control/status points: ids, names, widths, types, ranges.
 *
 * @details
 * PURPOSE
 * -------
 * Every byte the unit sends after its "mobile" header is a parameter id
 * followed by a fixed number of value bytes. Nothing on the wire says how many;
 * the host has to know. This registry is that knowledge, written down once:
 *   - the protocol id (one byte),
 *   - the kebab-case name used for MQTT topics,
 *   - the value width on the wire,
 *   - the semantic type (on/off, number, enumerated code, timer, raw bytes),
 *   - the valid write range and how (or whether) the unit accepts writes.
 *
 * WRITE MODES
 * -----------
 * - ReadOnly: status only; the bridge never sends a write for it.
 * - Direct:   command frame carries [id, value].
 * - Toggle:   command frame carries [id, 0x00] and flips the current state.
 *             The device client reads first and only toggles on a mismatch.
 *
 * RANGES
 * ------
 * `min..max` bounds what the host will *write*. On decode, Boolean and
 * Enumerated values are held to their range (anything else is a garbled
 * frame); plain Integer readings are taken as reported.
 *
 * MAINTENANCE
 * -----------
 * Ids and widths are part of the wire contract. A wrong width shifts every
 * following pair, so add entries only from the unit's documentation.
 */
#ifndef VENTOBRIDGE_PARAMETER_HPP
#define VENTOBRIDGE_PARAMETER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ventobridge {

enum class ValueType : uint8_t {
  Boolean,     ///< 1 byte, 0 = off, 1 = on
  Integer,     ///< 1 byte, plain number
  Enumerated,  ///< 1 byte, code with optional labels
  Timer,       ///< 3 bytes on the wire: seconds, minutes, hours
  Raw          ///< opaque bytes, width taken from the registry
};

enum class WriteMode : uint8_t { ReadOnly, Direct, Toggle };

struct EnumLabel {
  uint8_t     code;
  const char* label;
};

struct Parameter {
  uint8_t          id;
  const char*      name;
  uint8_t          width;
  ValueType        type;
  uint8_t          min;
  uint8_t          max;
  WriteMode        write;
  const EnumLabel* labels;
  uint8_t          label_count;

  bool writable() const { return write != WriteMode::ReadOnly; }

  /// Label for an enumerated code, or nullptr.
  const char* label_for(uint8_t code) const;

  /// Code for a label (case-insensitive); false if unknown.
  bool code_for(const std::string& label, uint8_t& out) const;
};

/// Iterable view over the static registry.
struct ParameterList {
  const Parameter* data;
  std::size_t      count;

  const Parameter* begin() const { return data; }
  const Parameter* end() const { return data + count; }
  std::size_t size() const { return count; }
};

/// All known parameters, ordered by id.
ParameterList all_parameters();

/// Lookup by protocol id; nullptr if the id is not in the registry.
const Parameter* find_parameter(uint8_t id);

/// Lookup by kebab-case name; nullptr if unknown.
const Parameter* find_parameter(const std::string& name);

const char* to_string(ValueType t);

// Well-known ids the bridge refers to by name.
enum : uint8_t {
  PARAM_POWER        = 0x03,
  PARAM_FAN_SPEED    = 0x04,
  PARAM_MANUAL_SPEED = 0x05,
  PARAM_AIRFLOW      = 0x06,
  PARAM_HUMIDITY     = 0x08,
  PARAM_FILTER_ALARM = 0x12,
  PARAM_BOOST_MODE   = 0x14
};

// ============================== Values ===============================

struct TimerValue {
  uint8_t hours{0};
  uint8_t minutes{0};
  uint8_t seconds{0};

  bool operator==(const TimerValue& o) const {
    return hours == o.hours && minutes == o.minutes && seconds == o.seconds;
  }
};

/**
 * @brief A decoded parameter value.
 *
 * Only the member matching `type` is meaningful. Boolean, Integer and
 * Enumerated share `number`.
 */
struct Value {
  ValueType            type{ValueType::Integer};
  uint32_t             number{0};
  TimerValue           timer{};
  std::vector<uint8_t> raw;

  static Value boolean(bool on);
  static Value integer(uint8_t n);
  static Value enumerated(uint8_t code);
  static Value duration(uint8_t hours, uint8_t minutes, uint8_t seconds);
  static Value bytes(std::vector<uint8_t> b);

  /// Value of the parameter's own type carrying `n`.
  static Value numeric_for(const Parameter& p, uint8_t n);

  bool operator==(const Value& o) const;
  bool operator!=(const Value& o) const { return !(*this == o); }
};

} // namespace ventobridge

#endif // VENTOBRIDGE_PARAMETER_HPP
