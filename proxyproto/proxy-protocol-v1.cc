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
#include "proxy-protocol-v1.hh"

#include <algorithm>
#include <array>
#include <optional>

namespace proxyproto
{
static const std::string_view s_tcp4{"TCP4"};
static const std::string_view s_tcp6{"TCP6"};
static const std::string_view s_unknown{"UNKNOWN"};
static const std::string_view s_crlf{"\r\n"};

static std::string makeVersion1Text(const ProxyAddresses& addresses)
{
  std::string text(s_proxyProtocolV1Prefix);
  if (!addresses.isInet()) {
    text.append(s_unknown);
    text.append(s_crlf);
    return text;
  }

  const auto& source = addresses.getSource();
  const auto& destination = addresses.getDestination();
  text.append(source.isIPv4() ? s_tcp4 : s_tcp6);
  text.append(" " + source.toString() + " " + destination.toString() + " " + std::to_string(source.getPort()) + " " + std::to_string(destination.getPort()));
  text.append(s_crlf);
  return text;
}

Version1Header::Version1Header(const ProxyAddresses& addresses) :
  d_text(makeVersion1Text(addresses)), d_addresses(addresses.isInet() ? addresses : ProxyAddresses())
{
}

std::ostream& operator<<(std::ostream& ostr, const Version1Header& header)
{
  return ostr << "PROXYv1(" << header.getAddresses() << ")";
}

/* splits 'line' on single spaces into exactly 'tokens.size()' non-empty tokens */
template <size_t N>
static bool splitTokens(std::string_view line, std::array<std::string_view, N>& tokens)
{
  size_t start = 0;
  for (size_t idx = 0; idx < N; idx++) {
    auto end = line.find(' ', start);
    if (end == std::string_view::npos) {
      if (idx != N - 1) {
        return false;
      }
      end = line.size();
    }
    else if (idx == N - 1) {
      /* extra tokens */
      return false;
    }
    tokens.at(idx) = line.substr(start, end - start);
    if (tokens.at(idx).empty()) {
      return false;
    }
    start = end + 1;
  }
  return true;
}

/* "src-ip dst-ip src-port dst-port" */
static std::optional<ErrorKind> parseInetAddresses(std::string_view line, bool ipv6, ProxyAddresses& addresses)
{
  std::array<std::string_view, 4> tokens;
  if (!splitTokens(line, tokens)) {
    return ErrorKind::MalformedHeader;
  }

  ComboAddress source;
  ComboAddress destination;
  if (ipv6) {
    if (makeStrictIPv6sockaddr(tokens.at(0), &source.sin6) != 0 || makeStrictIPv6sockaddr(tokens.at(1), &destination.sin6) != 0) {
      return ErrorKind::MalformedAddress;
    }
  }
  else {
    if (makeStrictIPv4sockaddr(tokens.at(0), &source.sin4) != 0 || makeStrictIPv4sockaddr(tokens.at(1), &destination.sin4) != 0) {
      return ErrorKind::MalformedAddress;
    }
  }

  auto sourcePort = parseStrictPort(tokens.at(2));
  auto destinationPort = parseStrictPort(tokens.at(3));
  if (!sourcePort || !destinationPort) {
    return ErrorKind::MalformedPort;
  }
  source.setPort(*sourcePort);
  destination.setPort(*destinationPort);

  addresses = ProxyAddresses(source, destination);
  return std::nullopt;
}

ParseOutcome<Version1Header> parseVersion1Header(views::UnsignedCharView buffer)
{
  if (!buffer.prefixMatches(s_proxyProtocolV1Prefix)) {
    return ParseOutcome<Version1Header>::invalid(ErrorKind::InvalidSignature);
  }

  const auto data = buffer.toStringView();
  /* the CR has to be at most at that offset for the header to fit */
  const size_t lastCRPos = s_proxyProtocolV1MaximumSize - s_crlf.size();
  size_t crPos = std::string_view::npos;

  for (size_t idx = 0; idx < data.size() && idx <= lastCRPos; idx++) {
    if (data.at(idx) == '\n') {
      return ParseOutcome<Version1Header>::invalid(ErrorKind::MalformedHeader);
    }
    if (data.at(idx) == '\r') {
      if (idx + 1 == data.size()) {
        return ParseOutcome<Version1Header>::partial(1);
      }
      if (data.at(idx + 1) != '\n') {
        return ParseOutcome<Version1Header>::invalid(ErrorKind::MalformedHeader);
      }
      crPos = idx;
      break;
    }
  }

  if (crPos == std::string_view::npos) {
    if (data.size() > lastCRPos) {
      return ParseOutcome<Version1Header>::invalid(ErrorKind::HeaderTooLong);
    }
    return ParseOutcome<Version1Header>::partial(std::max(s_crlf.size(), s_proxyProtocolV1MinimumSize - std::min(data.size(), s_proxyProtocolV1MinimumSize)));
  }

  std::string text(data.substr(0, crPos + s_crlf.size()));
  const auto line = data.substr(s_proxyProtocolV1Prefix.size(), crPos - s_proxyProtocolV1Prefix.size());
  const auto protoEnd = line.find(' ');
  const auto proto = line.substr(0, protoEnd);
  const auto rest = protoEnd == std::string_view::npos ? std::string_view() : line.substr(protoEnd + 1);

  if (proto == s_unknown) {
    /* whatever follows UNKNOWN is ignored */
    const auto consumed = text.size();
    return ParseOutcome<Version1Header>::complete(Version1Header(std::move(text), ProxyAddresses()), consumed);
  }
  if (proto == s_tcp4 || proto == s_tcp6) {
    if (protoEnd == std::string_view::npos) {
      return ParseOutcome<Version1Header>::invalid(ErrorKind::MalformedHeader);
    }
    ProxyAddresses addresses;
    if (auto error = parseInetAddresses(rest, proto == s_tcp6, addresses)) {
      return ParseOutcome<Version1Header>::invalid(*error);
    }
    const auto consumed = text.size();
    return ParseOutcome<Version1Header>::complete(Version1Header(std::move(text), std::move(addresses)), consumed);
  }

  return ParseOutcome<Version1Header>::invalid(ErrorKind::InvalidProtocol);
}
}
