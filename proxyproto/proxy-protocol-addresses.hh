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
#include <ostream>
#include <string>
#include <sys/un.h>

#include "iputils.hh"

namespace proxyproto
{
/* matches the values of the high nibble of the v2 family/protocol byte */
enum class AddressFamily : uint8_t
{
  Unspecified = 0x00,
  IPv4 = 0x01,
  IPv6 = 0x02,
  Unix = 0x03
};

static const size_t s_unixAddressSize = 108;
using UnixAddress = std::array<uint8_t, s_unixAddressSize>;

const char* addressFamilyToString(AddressFamily family);

/* A source and destination pair, of the same family. Ports are only
   meaningful for IPv4 and IPv6. */
class ProxyAddresses
{
public:
  ProxyAddresses() = default;
  /* throws a ProxyProtocolException (InvalidAddressForFamily) if the families differ */
  ProxyAddresses(const ComboAddress& source, const ComboAddress& destination);
  ProxyAddresses(const UnixAddress& source, const UnixAddress& destination);

  /* infers the family from the socket addresses (AF_INET, AF_INET6, AF_UNIX) */
  static ProxyAddresses fromSockaddrs(const struct sockaddr* source, socklen_t sourceLen, const struct sockaddr* destination, socklen_t destinationLen);
  static UnixAddress makeUnixAddress(const std::string& path);

  [[nodiscard]] AddressFamily getFamily() const
  {
    return d_family;
  }
  [[nodiscard]] bool isUnspecified() const
  {
    return d_family == AddressFamily::Unspecified;
  }
  [[nodiscard]] bool isInet() const
  {
    return d_family == AddressFamily::IPv4 || d_family == AddressFamily::IPv6;
  }

  /* only valid for IPv4 and IPv6 */
  [[nodiscard]] const ComboAddress& getSource() const;
  [[nodiscard]] const ComboAddress& getDestination() const;
  /* only valid for Unix */
  [[nodiscard]] const UnixAddress& getUnixSource() const;
  [[nodiscard]] const UnixAddress& getUnixDestination() const;

  /* size of the address block in a v2 header: 0, 12, 36 or 216 */
  [[nodiscard]] size_t getBlockSize() const
  {
    return getBlockSize(d_family);
  }
  static size_t getBlockSize(AddressFamily family);

  [[nodiscard]] std::string toString() const;

  bool operator==(const ProxyAddresses& rhs) const;
  bool operator!=(const ProxyAddresses& rhs) const
  {
    return !(*this == rhs);
  }

private:
  ComboAddress d_source;
  ComboAddress d_destination;
  UnixAddress d_unixSource{};
  UnixAddress d_unixDestination{};
  AddressFamily d_family{AddressFamily::Unspecified};
};

std::ostream& operator<<(std::ostream& ostr, const ProxyAddresses& addresses);
}
