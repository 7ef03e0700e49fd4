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

#include <string>

#include "proxy-protocol-addresses.hh"
#include "proxy-protocol-errors.hh"
#include "views.hh"

namespace proxyproto
{
/* 107 bytes, CRLF included: "PROXY UNKNOWN ffff:f...f:ffff ffff:f...f:ffff 65535 65535\r\n" */
static const size_t s_proxyProtocolV1MaximumSize = 107;
static const std::string_view s_proxyProtocolV1Prefix{"PROXY "};
/* "PROXY UNKNOWN\r\n" */
static const size_t s_proxyProtocolV1MinimumSize = 15;

/* Text (v1) header. Keeps the exact text it was built from or parsed from. */
class Version1Header
{
public:
  /* IPv4 and IPv6 addresses are formatted as TCP4/TCP6, anything else as UNKNOWN */
  explicit Version1Header(const ProxyAddresses& addresses);

  /* the wire form, CRLF included */
  [[nodiscard]] const std::string& toString() const
  {
    return d_text;
  }
  [[nodiscard]] const ProxyAddresses& getAddresses() const
  {
    return d_addresses;
  }
  [[nodiscard]] bool isUnknown() const
  {
    return d_addresses.isUnspecified();
  }

  bool operator==(const Version1Header& rhs) const
  {
    return d_addresses == rhs.d_addresses && d_text == rhs.d_text;
  }
  bool operator!=(const Version1Header& rhs) const
  {
    return !(*this == rhs);
  }

private:
  friend ParseOutcome<Version1Header> parseVersion1Header(views::UnsignedCharView buffer);

  Version1Header(std::string text, ProxyAddresses addresses) :
    d_text(std::move(text)), d_addresses(std::move(addresses))
  {
  }

  std::string d_text;
  ProxyAddresses d_addresses;
};

std::ostream& operator<<(std::ostream& ostr, const Version1Header& header);

ParseOutcome<Version1Header> parseVersion1Header(views::UnsignedCharView buffer);

template <typename Container>
ParseOutcome<Version1Header> parseVersion1Header(const Container& buffer)
{
  return parseVersion1Header(views::UnsignedCharView(buffer.data(), buffer.size()));
}
}
