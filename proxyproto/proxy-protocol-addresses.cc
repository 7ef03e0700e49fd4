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
#include "proxy-protocol-addresses.hh"
#include "proxy-protocol-errors.hh"

#include <algorithm>
#include <cstddef>

namespace proxyproto
{
const char* addressFamilyToString(AddressFamily family)
{
  switch (family) {
  case AddressFamily::Unspecified:
    return "UNSPEC";
  case AddressFamily::IPv4:
    return "INET";
  case AddressFamily::IPv6:
    return "INET6";
  case AddressFamily::Unix:
    return "UNIX";
  }
  return "invalid";
}

ProxyAddresses::ProxyAddresses(const ComboAddress& source, const ComboAddress& destination) :
  d_source(source), d_destination(destination)
{
  if (source.sin4.sin_family != destination.sin4.sin_family) {
    throw ProxyProtocolException(ErrorKind::InvalidAddressForFamily, "The PROXY destination and source addresses must be of the same family");
  }
  if (source.isIPv4()) {
    d_family = AddressFamily::IPv4;
  }
  else if (source.isIPv6()) {
    d_family = AddressFamily::IPv6;
  }
  else {
    throw ProxyProtocolException(ErrorKind::InvalidAddressForFamily, "Unsupported address family " + std::to_string(source.sin4.sin_family) + " for a PROXY address");
  }
}

ProxyAddresses::ProxyAddresses(const UnixAddress& source, const UnixAddress& destination) :
  d_unixSource(source), d_unixDestination(destination), d_family(AddressFamily::Unix)
{
}

ProxyAddresses ProxyAddresses::fromSockaddrs(const struct sockaddr* source, socklen_t sourceLen, const struct sockaddr* destination, socklen_t destinationLen)
{
  if (source->sa_family != destination->sa_family) {
    throw ProxyProtocolException(ErrorKind::InvalidAddressForFamily, "The PROXY destination and source addresses must be of the same family");
  }

  if (source->sa_family == AF_UNIX) {
    UnixAddress unixSource{};
    UnixAddress unixDestination{};
    const auto pathOffset = offsetof(struct sockaddr_un, sun_path);
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (sourceLen > pathOffset) {
      memcpy(unixSource.data(), reinterpret_cast<const uint8_t*>(source) + pathOffset, std::min(static_cast<size_t>(sourceLen) - pathOffset, unixSource.size()));
    }
    if (destinationLen > pathOffset) {
      memcpy(unixDestination.data(), reinterpret_cast<const uint8_t*>(destination) + pathOffset, std::min(static_cast<size_t>(destinationLen) - pathOffset, unixDestination.size()));
    }
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return {unixSource, unixDestination};
  }

  if (source->sa_family != AF_INET && source->sa_family != AF_INET6) {
    throw ProxyProtocolException(ErrorKind::InvalidAddressForFamily, "Unsupported address family " + std::to_string(source->sa_family) + " for a PROXY address");
  }

  try {
    return {ComboAddress(source, sourceLen), ComboAddress(destination, destinationLen)};
  }
  catch (const ProxyProtocolException&) {
    throw;
  }
  catch (const std::runtime_error& e) {
    throw ProxyProtocolException(ErrorKind::InvalidAddressForFamily, e.what());
  }
}

UnixAddress ProxyAddresses::makeUnixAddress(const std::string& path)
{
  UnixAddress address{};
  if (path.size() > address.size()) {
    throw ProxyProtocolException(ErrorKind::MalformedAddress, "A UNIX socket path is limited to " + std::to_string(address.size()) + " bytes, got " + std::to_string(path.size()));
  }
  memcpy(address.data(), path.data(), path.size());
  return address;
}

size_t ProxyAddresses::getBlockSize(AddressFamily family)
{
  switch (family) {
  case AddressFamily::Unspecified:
    return 0;
  case AddressFamily::IPv4:
    return (4 * 2) + (2 * 2);
  case AddressFamily::IPv6:
    return (16 * 2) + (2 * 2);
  case AddressFamily::Unix:
    return s_unixAddressSize * 2;
  }
  return 0;
}

const ComboAddress& ProxyAddresses::getSource() const
{
  if (!isInet()) {
    throw std::runtime_error(std::string("Trying to get the IP source of a PROXY address of family ") + addressFamilyToString(d_family));
  }
  return d_source;
}

const ComboAddress& ProxyAddresses::getDestination() const
{
  if (!isInet()) {
    throw std::runtime_error(std::string("Trying to get the IP destination of a PROXY address of family ") + addressFamilyToString(d_family));
  }
  return d_destination;
}

const UnixAddress& ProxyAddresses::getUnixSource() const
{
  if (d_family != AddressFamily::Unix) {
    throw std::runtime_error(std::string("Trying to get the UNIX source of a PROXY address of family ") + addressFamilyToString(d_family));
  }
  return d_unixSource;
}

const UnixAddress& ProxyAddresses::getUnixDestination() const
{
  if (d_family != AddressFamily::Unix) {
    throw std::runtime_error(std::string("Trying to get the UNIX destination of a PROXY address of family ") + addressFamilyToString(d_family));
  }
  return d_unixDestination;
}

static std::string unixAddressToString(const UnixAddress& address)
{
  /* abstract sockets start with a NUL byte, keep them printable */
  const auto* begin = address.data();
  const auto* end = address.data() + address.size(); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (!address.empty() && address.at(0) == 0) {
    ++begin; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    end = std::find(begin, end, 0);
    return "@" + std::string(begin, end);
  }
  end = std::find(begin, end, 0);
  return std::string(begin, end);
}

std::string ProxyAddresses::toString() const
{
  switch (d_family) {
  case AddressFamily::IPv4:
  case AddressFamily::IPv6:
    return d_source.toStringWithPort() + " -> " + d_destination.toStringWithPort();
  case AddressFamily::Unix:
    return unixAddressToString(d_unixSource) + " -> " + unixAddressToString(d_unixDestination);
  case AddressFamily::Unspecified:
    break;
  }
  return "unspecified";
}

bool ProxyAddresses::operator==(const ProxyAddresses& rhs) const
{
  if (d_family != rhs.d_family) {
    return false;
  }
  switch (d_family) {
  case AddressFamily::IPv4:
  case AddressFamily::IPv6:
    return d_source == rhs.d_source && d_destination == rhs.d_destination;
  case AddressFamily::Unix:
    return d_unixSource == rhs.d_unixSource && d_unixDestination == rhs.d_unixDestination;
  case AddressFamily::Unspecified:
    break;
  }
  return true;
}

std::ostream& operator<<(std::ostream& ostr, const ProxyAddresses& addresses)
{
  return ostr << addresses.toString();
}
}
