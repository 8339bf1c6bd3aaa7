/**
 * @page vb-topic-map Topic Mapper
 * @file topic_map.hpp
 * @brief MQTT topic strings <-> registry parameters, payload text <-> values.
 *
 * @details
 * TOPICS
 * ------
 * Built once from the base prefix (default `blauberg-vento`):
 *
 *     <base>/<name>/set     every writable parameter (commands in)
 *     <base>/<name>/state   every parameter (values out)
 *     <base>/status         JSON snapshot of the last poll
 *     <base>/service        Online | TimeOut | Service Down
 *
 * Names are unique in the registry, so no two parameters share a topic.
 *
 * PAYLOADS
 * --------
 * | type       | published        | accepted on /set                         |
 * |------------|------------------|------------------------------------------|
 * | Boolean    | `ON` / `OFF`     | ON, OFF, 1, 0, true, false (any case)     |
 * | Integer    | decimal          | decimal                                  |
 * | Enumerated | decimal code     | decimal code or label (`heat-recovery`)  |
 * | Timer      | `HH:MM:SS`       | `HH:MM:SS`                               |
 * | Raw        | lower-case hex   | hex                                      |
 *
 * Surrounding whitespace is trimmed before parsing. Range checks are the
 * codec's job (check_value); the mapper only rejects text that is not a
 * value of the right shape.
 */
#ifndef VENTOBRIDGE_TOPIC_MAP_HPP
#define VENTOBRIDGE_TOPIC_MAP_HPP

#include <string>
#include <unordered_map>
#include <vector>

#include "ventobridge/error.hpp"
#include "ventobridge/parameter.hpp"

namespace ventobridge {

constexpr const char* DEFAULT_BASE_TOPIC = "blauberg-vento";

constexpr const char* SERVICE_ONLINE  = "Online";
constexpr const char* SERVICE_TIMEOUT = "TimeOut";
constexpr const char* SERVICE_DOWN    = "Service Down";

class TopicMap {
public:
  /// Trailing slashes on `base` are dropped; an empty base falls back to the default.
  explicit TopicMap(const std::string& base = DEFAULT_BASE_TOPIC);

  const std::string& base() const { return base_; }

  std::string command_topic(const Parameter& p) const;
  std::string state_topic(const Parameter& p) const;
  std::string status_topic() const  { return base_ + "/status"; }
  std::string service_topic() const { return base_ + "/service"; }

  /// Parameter whose command topic is `topic`; nullptr for anything else.
  const Parameter* parameter_for_command_topic(const std::string& topic) const;

  /// Every command topic, in registry order. What the bridge subscribes to.
  const std::vector<std::string>& command_topics() const { return commands_; }

private:
  std::string                                         base_;
  std::vector<std::string>                            commands_;
  std::unordered_map<std::string, const Parameter*>   by_command_;
};

/**
 * @brief Parse payload text into a value of `p`'s type.
 * @return false with `InvalidValue` and a reason like `bad_payload:power("maybe")`.
 */
bool decode_payload(const Parameter& p, const std::string& text, Value& out, Error& err);

/// Render a value the way it is published on the state topic.
std::string encode_payload(const Parameter& p, const Value& v);

} // namespace ventobridge

#endif // VENTOBRIDGE_TOPIC_MAP_HPP
