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

#include <sys/types.h>
#include <variant>

#include "proxy-protocol-v1.hh"
#include "proxy-protocol-v2.hh"

namespace proxyproto
{
using HeaderResult = std::variant<Version1Header, Version2Header>;
using PartialResult = ParseOutcome<HeaderResult>;

/* Sniffs the version from the first bytes and parses a header of either
   version. Nothing is kept between calls: after a partial outcome, call
   again with the same start and more bytes. */
PartialResult parseProxyHeader(views::UnsignedCharView buffer);

template <typename Container>
PartialResult parseProxyHeader(const Container& buffer)
{
  return parseProxyHeader(views::UnsignedCharView(buffer.data(), buffer.size()));
}

/* returns: number of bytes consumed (positive) after successful parse
         or number of bytes missing (negative)
         or unfixable parse error (0)*/
ssize_t isProxyHeaderComplete(views::UnsignedCharView buffer);

template <typename Container>
ssize_t isProxyHeaderComplete(const Container& buffer)
{
  return isProxyHeaderComplete(views::UnsignedCharView(buffer.data(), buffer.size()));
}

/* 1 or 2 */
uint8_t getVersion(const HeaderResult& header);
const ProxyAddresses& getAddresses(const HeaderResult& header);

std::ostream& operator<<(std::ostream& ostr, const HeaderResult& header);

/* v2 health check header, without any address */
std::string makeLocalProxyHeader();
/* v2 PROXY header over TCP (stream) or UDP (datagram) */
std::string makeProxyHeader(bool tcp, const ComboAddress& source, const ComboAddress& destination, const std::vector<Tlv>& values);
}
