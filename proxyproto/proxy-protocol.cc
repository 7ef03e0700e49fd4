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
#include "proxy-protocol.hh"

namespace proxyproto
{
template <typename T>
static PartialResult toPartialResult(const ParseOutcome<T>& outcome)
{
  if (!outcome.isComplete()) {
    return PartialResult::forward(outcome);
  }
  return PartialResult::complete(HeaderResult(outcome.getHeader()), outcome.getConsumed());
}

PartialResult parseProxyHeader(views::UnsignedCharView buffer)
{
  if (buffer.empty()) {
    /* the shortest possible header is a v1 UNKNOWN one */
    return PartialResult::partial(s_proxyProtocolV1MinimumSize);
  }

  if (buffer.prefixMatches(s_proxyProtocolV2Signature)) {
    return toPartialResult(parseVersion2Header(buffer));
  }

  if (buffer.prefixMatches(s_proxyProtocolV1Prefix)) {
    return toPartialResult(parseVersion1Header(buffer));
  }

  return PartialResult::invalid(ErrorKind::InvalidSignature);
}

ssize_t isProxyHeaderComplete(views::UnsignedCharView buffer)
{
  const auto outcome = parseProxyHeader(buffer);
  switch (outcome.getStatus()) {
  case PartialResult::Status::Complete:
    return static_cast<ssize_t>(outcome.getConsumed());
  case PartialResult::Status::Partial:
    return -static_cast<ssize_t>(outcome.getMissing());
  case PartialResult::Status::Invalid:
    break;
  }
  return 0;
}

uint8_t getVersion(const HeaderResult& header)
{
  return std::holds_alternative<Version1Header>(header) ? 1 : 2;
}

const ProxyAddresses& getAddresses(const HeaderResult& header)
{
  if (const auto* version1 = std::get_if<Version1Header>(&header)) {
    return version1->getAddresses();
  }
  return std::get<Version2Header>(header).getAddresses();
}

std::ostream& operator<<(std::ostream& ostr, const HeaderResult& header)
{
  std::visit([&ostr](const auto& value) { ostr << value; }, header);
  return ostr;
}

std::string makeLocalProxyHeader()
{
  return Version2Builder(Command::Local, Protocol::Unspecified, ProxyAddresses()).build();
}

std::string makeProxyHeader(bool tcp, const ComboAddress& source, const ComboAddress& destination, const std::vector<Tlv>& values)
{
  Version2Builder builder(Command::Proxy, tcp ? Protocol::Stream : Protocol::Datagram, source, destination);
  for (const auto& value : values) {
    builder.writeTlv(value);
  }
  return builder.build();
}
}
