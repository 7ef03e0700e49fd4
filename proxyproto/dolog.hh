/*
 * This file is part of PowerDNS or dnsdist.
 * Copyright -- PowerDNS.COM B.V. and its contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * In addition, for the avoidance of any doubt, permission is granted to
 * link this program with OpenSSL and to (re)distribute the binaries
 * produced as the result of such linking.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <syslog.h>

/* Rapid easy to use logging to console & syslog.

   Usage:
          vinfolog("Got a proxy protocol header from %s", remote);
          infolog("Loaded configuration from %s", path);
          warnlog("Header of %d bytes is too large", size); // yes, %d
          errlog("Unable to parse %s: %s", path, e.what());

   Will log to stdout, and to syslog with LOG_INFO, LOG_WARNING, LOG_ERR
   respectively if enabled. If verbose=false, vinfolog is a noop.
   More generically, dolog(someiostream, "Hello %s", stream) will log to someiostream

   This will happily print a string to %d! Doesn't do further format processing.
*/
template <typename O>
inline void dolog(O& outputStream, const char* str)
{
  outputStream << str;
}

template <typename O, typename T, typename... Args>
void dolog(O& outputStream, const char* formatStr, T value, const Args&... args)
{
  while (*formatStr) {
    if (*formatStr == '%') {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      if (*(formatStr + 1) == '%') {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        ++formatStr;
      }
      else {
        outputStream << value;
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        formatStr += 2;
        dolog(outputStream, formatStr, args...);
        return;
      }
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    outputStream << *formatStr++;
  }
}

namespace proxyproto::logging
{
class LoggingConfiguration
{
public:
  static void setSyslog(bool value = true)
  {
    s_syslog = value;
  }
  static void setStructuredLogging(bool value = true, std::string levelPrefix = "")
  {
    s_structuredLogging = value;
    if (value) {
      s_structuredLevelPrefix = levelPrefix.empty() ? "prio" : std::move(levelPrefix);
    }
  }
  static void setLogTimestamps(bool value = true)
  {
    s_logTimestamps = value;
  }
  static bool getSyslog()
  {
    return s_syslog;
  }
  static bool getLogTimestamps()
  {
    return s_logTimestamps;
  }
  static bool getStructuredLogging()
  {
    return s_structuredLogging;
  }
  static const std::string& getStructuredLoggingLevelPrefix()
  {
    return s_structuredLevelPrefix;
  }

private:
  static std::string s_structuredLevelPrefix;
  static bool s_structuredLogging;
  static bool s_logTimestamps;
  static bool s_syslog;
};

extern void logTime(std::ostream& stream);

inline const char* syslogLevelToStr(int level)
{
  static constexpr std::array levelStrs{
    "Emergency",
    "Alert",
    "Critical",
    "Error",
    "Warning",
    "Notice",
    "Info",
    "Debug"};
  return levelStrs.at(level);
}
}

template <typename... Args>
void genlog(std::ostream& stream, int level, const char* formatStr, const Args&... args)
{
  using proxyproto::logging::LoggingConfiguration;
  std::ostringstream str;
  dolog(str, formatStr, args...);

  auto output = str.str();

  if (LoggingConfiguration::getSyslog()) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg): syslog is what it is
    syslog(level, "%s", output.c_str());
  }

  if (LoggingConfiguration::getLogTimestamps()) {
    proxyproto::logging::logTime(stream);
  }

  if (LoggingConfiguration::getStructuredLogging()) {
    stream << LoggingConfiguration::getStructuredLoggingLevelPrefix() << "=\"" << proxyproto::logging::syslogLevelToStr(level) << "\" ";
    stream << "msg=" << std::quoted(output) << std::endl;
  }
  else {
    stream << output << std::endl;
  }
}

template <typename... Args>
void verboselog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_DEBUG, formatStr, args...);
}

#include "proxyproto-configuration.hh"

#define vinfolog                                                             \
  if (proxyproto::configuration::getCurrentRuntimeConfiguration().d_verbose) \
  verboselog

template <typename... Args>
void infolog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_INFO, formatStr, args...);
}

template <typename... Args>
void warnlog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_WARNING, formatStr, args...);
}

template <typename... Args>
void errlog(const char* formatStr, const Args&... args)
{
  genlog(std::cout, LOG_ERR, formatStr, args...);
}
