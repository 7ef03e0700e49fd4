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
#include <limits>
#include <stdexcept>

#include "proxy-protocol.hh"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
  using namespace proxyproto;

  if (size > std::numeric_limits<uint16_t>::max() + s_proxyProtocolMinimumHeaderSize) {
    return 0;
  }

  const views::UnsignedCharView buffer(data, size);
  const auto result = parseProxyHeader(buffer);
  /* parsing has no state, the same input has to give the same result */
  if (parseProxyHeader(buffer) != result) {
    throw std::runtime_error("Parsing the same input twice gave different results");
  }

  if (!result.isComplete()) {
    if (result.isPartial() && result.getMissing() == 0) {
      throw std::runtime_error("Partial outcome without any missing byte");
    }
    return 0;
  }

  if (result.getConsumed() > size) {
    throw std::runtime_error("Consumed more bytes than available");
  }

  if (const auto* version2 = std::get_if<Version2Header>(&result.getHeader())) {
    (void)version2->getSSL();
    (void)version2->verifyChecksum();

    /* the values fitted in the parsed header, so they fit in the rebuilt one */
    Version2Builder builder(version2->getCommand(), version2->getProtocol(), version2->getAddresses());
    for (const auto& value : version2->getValues()) {
      builder.writeTlv(value);
    }
    if (builder.getHeader() != *version2) {
      throw std::logic_error("Rebuilding a parsed header gave a different header");
    }
  }
  else {
    const auto& version1 = std::get<Version1Header>(result.getHeader());
    if (!version1.isUnknown() && Version1Header(version1.getAddresses()).getAddresses() != version1.getAddresses()) {
      throw std::logic_error("Rebuilding a parsed v1 header gave different addresses");
    }
  }

  return 0;
}
