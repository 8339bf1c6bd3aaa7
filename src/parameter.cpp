// -----------------------------------------------------------------------------
// parameter.cpp — the static registry and Value helpers
//
// API & table semantics: see include/ventobridge/parameter.hpp
// -----------------------------------------------------------------------------
#include "ventobridge/parameter.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace ventobridge {

// ---------- enumerated labels ----------

static const EnumLabel AIRFLOW_LABELS[] = {
  {0, "ventilation"},
  {1, "heat-recovery"},
  {2, "supply"},
};

static const EnumLabel OPERATION_MODE_LABELS[] = {
  {0, "regular"},
  {1, "night"},
  {2, "party"},
};

static const EnumLabel ALARM_LABELS[] = {
  {0, "none"},
  {1, "alarm"},
  {2, "warning"},
};

#define VB_LABELS(arr) arr, static_cast<uint8_t>(sizeof(arr) / sizeof(arr[0]))
#define VB_NO_LABELS   nullptr, 0

// ---------- registry ----------
// Widths sum to 92 bytes; with the 6-byte header that is the 98-byte status
// page the unit sends for a read-all.
static const Parameter PARAMETERS[] = {
  // id    name                       w  type                   min  max  write
  {0x03, "power",                     1, ValueType::Boolean,    0,   1,   WriteMode::Toggle,   VB_NO_LABELS},
  {0x04, "fan-speed",                 1, ValueType::Integer,    1,   4,   WriteMode::Direct,   VB_NO_LABELS},
  {0x05, "manual-speed",              1, ValueType::Integer,    0,   255, WriteMode::Direct,   VB_NO_LABELS},
  {0x06, "airflow",                   1, ValueType::Enumerated, 0,   2,   WriteMode::Direct,   VB_LABELS(AIRFLOW_LABELS)},
  {0x08, "humidity",                  1, ValueType::Integer,    0,   100, WriteMode::ReadOnly, VB_NO_LABELS},
  {0x09, "operation-mode",            1, ValueType::Enumerated, 0,   2,   WriteMode::Direct,   VB_LABELS(OPERATION_MODE_LABELS)},
  {0x0B, "humidity-threshold",        1, ValueType::Integer,    40,  80,  WriteMode::Direct,   VB_NO_LABELS},
  {0x0C, "alarm",                     1, ValueType::Enumerated, 0,   2,   WriteMode::ReadOnly, VB_LABELS(ALARM_LABELS)},
  {0x0D, "relay-sensor-status",       1, ValueType::Boolean,    0,   1,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x0E, "mode-countdown",            3, ValueType::Timer,      0,   0,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x0F, "night-mode-timer",          3, ValueType::Timer,      0,   0,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x10, "party-mode-timer",          3, ValueType::Timer,      0,   0,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x11, "deactivation-timer",        3, ValueType::Timer,      0,   0,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x12, "filter-alarm",              1, ValueType::Boolean,    0,   1,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x13, "humidity-sensor-status",    1, ValueType::Boolean,    0,   1,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x14, "boost-mode",                1, ValueType::Boolean,    0,   1,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x15, "humidity-sensor",           1, ValueType::Boolean,    0,   1,   WriteMode::Direct,   VB_NO_LABELS},
  {0x16, "relay-sensor",              1, ValueType::Boolean,    0,   1,   WriteMode::Direct,   VB_NO_LABELS},
  {0x17, "analog-sensor",             1, ValueType::Boolean,    0,   1,   WriteMode::Direct,   VB_NO_LABELS},
  {0x19, "analog-sensor-threshold",   1, ValueType::Integer,    5,   100, WriteMode::Direct,   VB_NO_LABELS},
  {0x1A, "analog-sensor-status",      1, ValueType::Boolean,    0,   1,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x1B, "slave-search",              32, ValueType::Raw,       0,   0,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x1C, "slave-search-response",     4, ValueType::Raw,        0,   0,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x1F, "cloud-activation",          1, ValueType::Boolean,    0,   1,   WriteMode::ReadOnly, VB_NO_LABELS},
  {0x25, "analog-sensor-level",       1, ValueType::Integer,    0,   100, WriteMode::ReadOnly, VB_NO_LABELS},
};

#undef VB_LABELS
#undef VB_NO_LABELS

static constexpr std::size_t PARAMETER_COUNT = sizeof(PARAMETERS) / sizeof(PARAMETERS[0]);

// Cast to unsigned char first so std::tolower is well-defined.
static bool iequals(const char* a, const std::string& b) {
  const std::size_t n = std::strlen(a);
  if (n != b.size()) return false;
  for (std::size_t i = 0; i < n; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

// ---------- Parameter ----------

const char* Parameter::label_for(uint8_t code) const {
  for (uint8_t i = 0; i < label_count; ++i) {
    if (labels[i].code == code) return labels[i].label;
  }
  return nullptr;
}

bool Parameter::code_for(const std::string& label, uint8_t& out) const {
  for (uint8_t i = 0; i < label_count; ++i) {
    if (iequals(labels[i].label, label)) { out = labels[i].code; return true; }
  }
  return false;
}

// ---------- registry lookups ----------

ParameterList all_parameters() {
  return ParameterList{PARAMETERS, PARAMETER_COUNT};
}

const Parameter* find_parameter(uint8_t id) {
  for (const auto& p : PARAMETERS) {
    if (p.id == id) return &p;
  }
  return nullptr;
}

const Parameter* find_parameter(const std::string& name) {
  for (const auto& p : PARAMETERS) {
    if (name == p.name) return &p;
  }
  return nullptr;
}

const char* to_string(ValueType t) {
  switch (t) {
    case ValueType::Boolean:    return "boolean";
    case ValueType::Integer:    return "integer";
    case ValueType::Enumerated: return "enumerated";
    case ValueType::Timer:      return "timer";
    case ValueType::Raw:        return "raw";
  }
  return "unknown";
}

// ---------- Value ----------

Value Value::boolean(bool on) {
  Value v;
  v.type = ValueType::Boolean;
  v.number = on ? 1 : 0;
  return v;
}

Value Value::integer(uint8_t n) {
  Value v;
  v.type = ValueType::Integer;
  v.number = n;
  return v;
}

Value Value::enumerated(uint8_t code) {
  Value v;
  v.type = ValueType::Enumerated;
  v.number = code;
  return v;
}

Value Value::duration(uint8_t hours, uint8_t minutes, uint8_t seconds) {
  Value v;
  v.type = ValueType::Timer;
  v.timer.hours = hours;
  v.timer.minutes = minutes;
  v.timer.seconds = seconds;
  return v;
}

Value Value::bytes(std::vector<uint8_t> b) {
  Value v;
  v.type = ValueType::Raw;
  v.raw = std::move(b);
  return v;
}

Value Value::numeric_for(const Parameter& p, uint8_t n) {
  Value v;
  v.type = p.type;
  v.number = n;
  return v;
}

bool Value::operator==(const Value& o) const {
  if (type != o.type) return false;
  switch (type) {
    case ValueType::Timer: return timer == o.timer;
    case ValueType::Raw:   return raw == o.raw;
    default:               return number == o.number;
  }
}

} // namespace ventobridge
