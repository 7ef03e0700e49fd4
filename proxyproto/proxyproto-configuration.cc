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
#include <mutex>
#include <optional>
#include <set>

#include <yaml-cpp/yaml.h>

#include "dolog.hh"
#include "proxyproto-configuration.hh"

namespace proxyproto::configuration
{
static std::mutex s_configurationLock;
static RuntimeConfiguration s_currentRuntimeConfiguration;

RuntimeConfiguration getCurrentRuntimeConfiguration()
{
  auto lock = std::scoped_lock(s_configurationLock);
  return s_currentRuntimeConfiguration;
}

void updateRuntimeConfiguration(const std::function<void(RuntimeConfiguration&)>& mutator)
{
  auto lock = std::scoped_lock(s_configurationLock);
  /* work on a copy so that a throwing mutator leaves the current configuration alone */
  auto updated = s_currentRuntimeConfiguration;
  mutator(updated);
  s_currentRuntimeConfiguration = updated;
}

namespace
{
struct LoggingSettings
{
  std::optional<bool> d_syslog;
  std::optional<bool> d_timestamps;
  std::optional<bool> d_structured;
};

template <typename T>
bool readValue(const YAML::Node& config, const std::string& key, std::optional<T>& value)
{
  if (!config[key]) {
    return true;
  }
  try {
    value = config[key].as<T>();
    return true;
  }
  catch (const YAML::Exception& e) {
    errlog("Unable to read '%s' value: %s", key, e.what());
    return false;
  }
}
}

static bool applyConfiguration(const YAML::Node& config)
{
  if (config.IsNull()) {
    return true;
  }
  if (!config.IsMap()) {
    errlog("The configuration should be a map of settings");
    return false;
  }

  static const std::set<std::string> knownKeys{"maximum-size", "accept-v1", "accept-v2", "verify-checksum", "verbose", "syslog", "log-timestamps", "structured-logging"};
  bool retval = true;
  for (const auto& entry : config) {
    if (!entry.first.IsScalar()) {
      errlog("Configuration settings should be named by a string");
      retval = false;
      continue;
    }
    auto key = entry.first.Scalar();
    if (knownKeys.count(key) == 0) {
      errlog("Unknown configuration setting '%s'", key);
      retval = false;
    }
  }

  std::optional<size_t> maximumSize;
  std::optional<bool> acceptV1;
  std::optional<bool> acceptV2;
  std::optional<bool> verifyChecksum;
  std::optional<bool> verbose;
  LoggingSettings logging;

  retval = readValue(config, "maximum-size", maximumSize) && retval;
  retval = readValue(config, "accept-v1", acceptV1) && retval;
  retval = readValue(config, "accept-v2", acceptV2) && retval;
  retval = readValue(config, "verify-checksum", verifyChecksum) && retval;
  retval = readValue(config, "verbose", verbose) && retval;
  retval = readValue(config, "syslog", logging.d_syslog) && retval;
  retval = readValue(config, "log-timestamps", logging.d_timestamps) && retval;
  retval = readValue(config, "structured-logging", logging.d_structured) && retval;

  if (maximumSize && *maximumSize == 0) {
    errlog("The 'maximum-size' value has to be larger than 0");
    retval = false;
  }
  if (acceptV1 && acceptV2 && !*acceptV1 && !*acceptV2) {
    warnlog("Both versions of the proxy protocol are refused, every header will be rejected");
  }

  if (!retval) {
    return false;
  }

  updateRuntimeConfiguration([&](RuntimeConfiguration& runtime) {
    if (maximumSize) {
      runtime.d_proxyProtocolMaximumSize = *maximumSize;
    }
    if (acceptV1) {
      runtime.d_acceptV1 = *acceptV1;
    }
    if (acceptV2) {
      runtime.d_acceptV2 = *acceptV2;
    }
    if (verifyChecksum) {
      runtime.d_verifyChecksum = *verifyChecksum;
    }
    if (verbose) {
      runtime.d_verbose = *verbose;
    }
  });

  if (logging.d_syslog) {
    logging::LoggingConfiguration::setSyslog(*logging.d_syslog);
  }
  if (logging.d_timestamps) {
    logging::LoggingConfiguration::setLogTimestamps(*logging.d_timestamps);
  }
  if (logging.d_structured) {
    logging::LoggingConfiguration::setStructuredLogging(*logging.d_structured);
  }

  return true;
}

bool loadConfigurationFromYAML(const std::string& path)
{
  infolog("Loading configuration file from %s", path);
  YAML::Node config;
  try {
    config = YAML::LoadFile(path);
  }
  catch (const YAML::Exception& e) {
    errlog("Unable to load configuration file '%s': %s", path, e.what());
    return false;
  }
  return applyConfiguration(config);
}

bool loadConfigurationFromYAMLString(const std::string& content)
{
  YAML::Node config;
  try {
    config = YAML::Load(content);
  }
  catch (const YAML::Exception& e) {
    errlog("Unable to parse configuration: %s", e.what());
    return false;
  }
  return applyConfiguration(config);
}
}
