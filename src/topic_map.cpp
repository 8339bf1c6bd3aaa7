// -----------------------------------------------------------------------------
// topic_map.cpp — topic table and payload text conversion
//
// API & payload table: see include/ventobridge/topic_map.hpp
// -----------------------------------------------------------------------------
#include "ventobridge/topic_map.hpp"
#include "ventobridge/codec.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace ventobridge {

// ---------- helpers ----------

static std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Plain decimal, no sign, no spaces, must fit `limit`.
static bool parse_uint(const std::string& s, uint32_t limit, uint32_t& out) {
  if (s.empty() || s.size() > 10) return false;
  uint64_t n = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    n = n * 10 + static_cast<uint64_t>(c - '0');
  }
  if (n > limit) return false;
  out = static_cast<uint32_t>(n);
  return true;
}

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

static bool bad(const Parameter& p, const std::string& text, Error& err) {
  return err.set(ErrorCode::InvalidValue,
                 std::string("bad_payload:") + p.name + "(\"" + text + "\")");
}

// ---------- TopicMap ----------

TopicMap::TopicMap(const std::string& base) : base_(base) {
  while (!base_.empty() && base_.back() == '/') base_.pop_back();
  if (base_.empty()) base_ = DEFAULT_BASE_TOPIC;

  for (const auto& p : all_parameters()) {
    if (!p.writable()) continue;
    commands_.push_back(command_topic(p));
    by_command_.emplace(commands_.back(), &p);
  }
}

std::string TopicMap::command_topic(const Parameter& p) const {
  return base_ + "/" + p.name + "/set";
}

std::string TopicMap::state_topic(const Parameter& p) const {
  return base_ + "/" + p.name + "/state";
}

const Parameter* TopicMap::parameter_for_command_topic(const std::string& topic) const {
  auto it = by_command_.find(topic);
  return it == by_command_.end() ? nullptr : it->second;
}

// -----------------------------------------------------------------------------
// decode_payload() — text from a /set topic into a typed value.
// POLICY:
//   - Trim first; an empty payload is always rejected.
//   - Numbers must fit one byte; ranges are left to check_value().
// -----------------------------------------------------------------------------
bool decode_payload(const Parameter& p, const std::string& text, Value& out, Error& err) {
  const std::string t = trim(text);
  if (t.empty()) return bad(p, text, err);

  switch (p.type) {
    case ValueType::Boolean: {
      const std::string l = lower(t);
      if (l == "on" || l == "1" || l == "true")   { out = Value::boolean(true);  return true; }
      if (l == "off" || l == "0" || l == "false") { out = Value::boolean(false); return true; }
      return bad(p, text, err);
    }

    case ValueType::Integer: {
      uint32_t n = 0;
      if (!parse_uint(t, 0xFF, n)) return bad(p, text, err);
      out = Value::integer(static_cast<uint8_t>(n));
      return true;
    }

    case ValueType::Enumerated: {
      uint32_t n = 0;
      uint8_t code = 0;
      if (parse_uint(t, 0xFF, n))   code = static_cast<uint8_t>(n);
      else if (!p.code_for(t, code)) return bad(p, text, err);
      out = Value::enumerated(code);
      return true;
    }

    case ValueType::Timer: {
      unsigned h = 0, m = 0, s = 0;
      char tail = 0;
      if (std::sscanf(t.c_str(), "%u:%u:%u%c", &h, &m, &s, &tail) != 3) return bad(p, text, err);
      if (h > 0xFF || m > 59 || s > 59) return bad(p, text, err);
      out = Value::duration(static_cast<uint8_t>(h), static_cast<uint8_t>(m), static_cast<uint8_t>(s));
      return true;
    }

    case ValueType::Raw: {
      if (t.size() % 2 != 0) return bad(p, text, err);
      std::vector<uint8_t> b;
      b.reserve(t.size() / 2);
      for (std::size_t i = 0; i < t.size(); i += 2) {
        const int hi = hex_nibble(t[i]), lo = hex_nibble(t[i + 1]);
        if (hi < 0 || lo < 0) return bad(p, text, err);
        b.push_back(static_cast<uint8_t>((hi << 4) | lo));
      }
      out = Value::bytes(std::move(b));
      return true;
    }
  }
  return bad(p, text, err);
}

std::string encode_payload(const Parameter& p, const Value& v) {
  switch (p.type) {
    case ValueType::Boolean:
      return v.number ? "ON" : "OFF";
    case ValueType::Timer: {
      char buf[16];
      std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u",
                    unsigned(v.timer.hours), unsigned(v.timer.minutes), unsigned(v.timer.seconds));
      return buf;
    }
    case ValueType::Raw:
      return to_hex(v.raw.data(), v.raw.size());
    default:
      return std::to_string(v.number);
  }
}

} // namespace ventobridge
