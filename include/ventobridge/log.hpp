/**
 * @file log.hpp
 * @brief Line logger: timestamp, level, then a `key=value` body.
 *
 * @details
 * Every record is one line, shaped like the CLI status lines:
 *
 *     2026-10-19T18:01:02Z [ERROR] status=error event=poll reason=device_unreachable:timeout
 *
 * Output goes to stderr unless a file was opened with open_file(). Safe to call
 * from the MQTT network thread and the bridge loop at the same time.
 */
#ifndef VENTOBRIDGE_LOG_HPP
#define VENTOBRIDGE_LOG_HPP

#include <string>

namespace ventobridge::log {

enum class Level : int { Debug = 10, Info = 20, Warn = 30, Error = 40 };

void  set_level(Level lvl);
Level level();
bool  enabled(Level lvl);

/// Append records to `path` instead of stderr. Returns false if it cannot be opened.
bool open_file(const std::string& path);

/// Back to stderr; closes any open log file.
void close_file();

void write(Level lvl, const std::string& line);

inline void debug(const std::string& line) { write(Level::Debug, line); }
inline void info (const std::string& line) { write(Level::Info,  line); }
inline void warn (const std::string& line) { write(Level::Warn,  line); }
inline void error(const std::string& line) { write(Level::Error, line); }

} // namespace ventobridge::log

#endif // VENTOBRIDGE_LOG_HPP
