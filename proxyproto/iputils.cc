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
#include "iputils.hh"

#include <array>
#include <stdexcept>

static bool isDecimalDigit(char chr)
{
  return chr >= '0' && chr <= '9';
}

static bool isHexDigit(char chr)
{
  return isDecimalDigit(chr) || (chr >= 'a' && chr <= 'f') || (chr >= 'A' && chr <= 'F');
}

/* parses a decimal number of at most 'maxDigits' digits, refusing leading zeros */
static std::optional<uint32_t> parseStrictDecimal(std::string_view str, size_t maxDigits)
{
  if (str.empty() || str.size() > maxDigits) {
    return std::nullopt;
  }
  if (str.size() > 1 && str.at(0) == '0') {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (const auto chr : str) {
    if (!isDecimalDigit(chr)) {
      return std::nullopt;
    }
    value = (value * 10) + static_cast<uint32_t>(chr - '0');
  }
  return value;
}

std::optional<uint16_t> parseStrictPort(std::string_view str)
{
  auto value = parseStrictDecimal(str, 5);
  if (!value || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

int makeStrictIPv4sockaddr(std::string_view str, struct sockaddr_in* ret)
{
  std::array<uint8_t, 4> octets{};
  size_t octet = 0;
  size_t start = 0;
  size_t end = 0;

  while (octet < octets.size()) {
    end = str.find('.', start);
    if (end == std::string_view::npos) {
      end = str.size();
    }
    auto value = parseStrictDecimal(str.substr(start, end - start), 3);
    if (!value || *value > 255) {
      return -1;
    }
    octets.at(octet++) = static_cast<uint8_t>(*value);
    if (end == str.size()) {
      break;
    }
    start = end + 1;
  }

  /* exactly four components, nothing after the last one */
  if (octet != octets.size() || end != str.size()) {
    return -1;
  }

  memcpy(&ret->sin_addr.s_addr, octets.data(), octets.size());
  ret->sin_family = AF_INET;
  return 0;
}

int makeStrictIPv6sockaddr(std::string_view str, struct sockaddr_in6* ret)
{
  if (str.empty() || str.size() >= INET6_ADDRSTRLEN) {
    return -1;
  }

  for (const auto chr : str) {
    if (!isHexDigit(chr) && chr != ':' && chr != '.') {
      return -1;
    }
  }

  /* an embedded IPv4 suffix ("::ffff:192.0.2.1") follows the IPv4 rules */
  if (str.find('.') != std::string_view::npos) {
    auto lastColon = str.rfind(':');
    if (lastColon == std::string_view::npos) {
      return -1;
    }
    struct sockaddr_in embedded{};
    if (makeStrictIPv4sockaddr(str.substr(lastColon + 1), &embedded) != 0) {
      return -1;
    }
  }

  std::array<char, INET6_ADDRSTRLEN> buffer{};
  memcpy(buffer.data(), str.data(), str.size());
  struct in6_addr addr{};
  if (inet_pton(AF_INET6, buffer.data(), &addr) != 1) {
    return -1;
  }

  ret->sin6_family = AF_INET6;
  ret->sin6_addr = addr;
  ret->sin6_scope_id = 0;
  ret->sin6_flowinfo = 0;
  return 0;
}

void ComboAddress::setSockaddr(const struct sockaddr* socketAddress, socklen_t salen)
{
  if (salen > sizeof(struct sockaddr_in6) || (socketAddress->sa_family != AF_INET && socketAddress->sa_family != AF_INET6)) {
    throw std::runtime_error("ComboAddress can't handle other than sockaddr_in or sockaddr_in6");
  }
  if ((socketAddress->sa_family == AF_INET && salen < sizeof(struct sockaddr_in)) || (socketAddress->sa_family == AF_INET6 && salen < sizeof(struct sockaddr_in6))) {
    throw std::runtime_error("ComboAddress was handed a truncated socket address of size " + std::to_string(salen));
  }
  memset(&sin6, 0, sizeof(sin6));
  memcpy(this, socketAddress, salen);
}

ComboAddress::ComboAddress(const std::string& str, uint16_t port)
{
  memset(&sin6, 0, sizeof(sin6));
  std::string_view address(str);
  std::optional<uint16_t> parsedPort{std::nullopt};
  bool ipv6 = false;

  if (!address.empty() && address.at(0) == '[') { // [::]:53 style address
    auto pos = address.find(']');
    if (pos == std::string_view::npos) {
      throw std::runtime_error("Unable to convert presentation address '" + str + "'");
    }
    if (pos + 1 != address.size()) {
      if (address.at(pos + 1) != ':' || !(parsedPort = parseStrictPort(address.substr(pos + 2)))) {
        throw std::runtime_error("Unable to convert presentation address '" + str + "'");
      }
    }
    address = address.substr(1, pos - 1);
    ipv6 = true;
  }
  else if (auto pos = address.find(':'); pos != std::string_view::npos && address.find(':', pos + 1) == std::string_view::npos) {
    /* exactly one colon, IPv4 with a port */
    if (!(parsedPort = parseStrictPort(address.substr(pos + 1)))) {
      throw std::runtime_error("Unable to convert presentation address '" + str + "'");
    }
    address = address.substr(0, pos);
  }
  else if (pos != std::string_view::npos) {
    ipv6 = true;
  }

  if (ipv6) {
    if (makeStrictIPv6sockaddr(address, &sin6) != 0) {
      throw std::runtime_error("Unable to convert presentation address '" + str + "'");
    }
  }
  else if (makeStrictIPv4sockaddr(address, &sin4) != 0) {
    throw std::runtime_error("Unable to convert presentation address '" + str + "'");
  }

  setPort(parsedPort ? *parsedPort : port);
}

std::string ComboAddress::toString() const
{
  std::array<char, INET6_ADDRSTRLEN> host{};
  const char* ret = nullptr;
  if (sin4.sin_family == AF_INET) {
    ret = inet_ntop(AF_INET, &sin4.sin_addr, host.data(), host.size());
  }
  else if (sin4.sin_family == AF_INET6) {
    ret = inet_ntop(AF_INET6, &sin6.sin6_addr, host.data(), host.size());
  }
  if (ret == nullptr) {
    return "invalid";
  }
  return host.data();
}

std::string ComboAddress::toStringWithPort() const
{
  if (sin4.sin_family == AF_INET) {
    return toString() + ":" + std::to_string(getPort());
  }
  return "[" + toString() + "]:" + std::to_string(getPort());
}

std::ostream& operator<<(std::ostream& ostr, const ComboAddress& address)
{
  return ostr << address.toStringWithPort();
}

ComboAddress makeComboAddressFromRaw(uint8_t version, const char* raw, size_t len)
{
  ComboAddress address;

  if (version == 4) {
    address.sin4.sin_family = AF_INET;
    if (len != sizeof(address.sin4.sin_addr.s_addr)) {
      throw std::runtime_error("invalid raw address length for an IPv4 address: " + std::to_string(len));
    }
    memcpy(&address.sin4.sin_addr.s_addr, raw, sizeof(address.sin4.sin_addr.s_addr));
  }
  else if (version == 6) {
    address.sin6.sin6_family = AF_INET6;
    if (len != sizeof(address.sin6.sin6_addr.s6_addr)) {
      throw std::runtime_error("invalid raw address length for an IPv6 address: " + std::to_string(len));
    }
    memcpy(&address.sin6.sin6_addr.s6_addr, raw, sizeof(address.sin6.sin6_addr.s6_addr));
  }
  else {
    throw std::runtime_error("invalid address family " + std::to_string(version));
  }

  return address;
}
