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

#include <functional>
#include <string>

namespace proxyproto::configuration
{
/* this part of the configuration can be updated at runtime */
struct RuntimeConfiguration
{
  /* headers larger than this, in bytes, are refused */
  size_t d_proxyProtocolMaximumSize{512};
  bool d_acceptV1{true};
  bool d_acceptV2{true};
  /* refuse v2 headers carrying a CRC32C value that does not match */
  bool d_verifyChecksum{true};
  bool d_verbose{false};
};

/* a copy of the configuration at the time of the call */
RuntimeConfiguration getCurrentRuntimeConfiguration();
void updateRuntimeConfiguration(const std::function<void(RuntimeConfiguration&)>& mutator);

/* Read a YAML document and apply it to the runtime and logging configuration.
   All values are checked before anything is applied: if one of them is
   invalid the errors are logged, nothing changes and false is returned. */
bool loadConfigurationFromYAML(const std::string& path);
bool loadConfigurationFromYAMLString(const std::string& content);
}
