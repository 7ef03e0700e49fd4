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
#include "proxy-protocol-handler.hh"
#include "proxy-protocol-metrics.hh"
#include "dolog.hh"

namespace proxyproto
{
static PartialResult rejectHeader(ErrorKind error)
{
  ++metrics::g_stats.proxyProtocolInvalid;
  return PartialResult::invalid(error);
}

PartialResult handleProxyProtocol(const ComboAddress& remote, PacketBuffer& buffer)
{
  const auto config = configuration::getCurrentRuntimeConfiguration();
  auto result = parseProxyHeader(buffer);

  if (result.isPartial()) {
    const size_t expected = buffer.size() + result.getMissing();
    if (expected > config.d_proxyProtocolMaximumSize) {
      vinfolog("Proxy protocol header from %s will be at least %d bytes, larger than the maximum size (%d), dropping", remote.toStringWithPort(), expected, config.d_proxyProtocolMaximumSize);
      ++metrics::g_stats.oversizedHeaders;
      return rejectHeader(ErrorKind::HeaderTooLong);
    }
    ++metrics::g_stats.partialReads;
    return result;
  }

  if (result.isInvalid()) {
    vinfolog("Ignoring invalid proxy protocol header (%s, %d bytes) from %s", errorKindToString(result.getError()), buffer.size(), remote.toStringWithPort());
    ++metrics::g_stats.proxyProtocolInvalid;
    return result;
  }

  const auto used = result.getConsumed();
  if (used > config.d_proxyProtocolMaximumSize) {
    vinfolog("Proxy protocol header from %s is %d bytes, larger than the maximum size (%d), dropping", remote.toStringWithPort(), used, config.d_proxyProtocolMaximumSize);
    ++metrics::g_stats.oversizedHeaders;
    return rejectHeader(ErrorKind::HeaderTooLong);
  }

  const auto& header = result.getHeader();
  const auto version = getVersion(header);
  if ((version == 1 && !config.d_acceptV1) || (version == 2 && !config.d_acceptV2)) {
    vinfolog("Dropping proxy protocol v%d header from %s, that version is not accepted", static_cast<int>(version), remote.toStringWithPort());
    ++metrics::g_stats.versionRejected;
    return rejectHeader(ErrorKind::VersionNotAccepted);
  }

  if (const auto* version2 = std::get_if<Version2Header>(&header)) {
    if (config.d_verifyChecksum) {
      auto valid = version2->verifyChecksum();
      if (valid && !*valid) {
        vinfolog("Dropping proxy protocol header from %s with an invalid checksum", remote.toStringWithPort());
        ++metrics::g_stats.checksumFailures;
        return rejectHeader(ErrorKind::ChecksumMismatch);
      }
    }
    if (version2->isLocal()) {
      ++metrics::g_stats.localCommands;
    }
    ++metrics::g_stats.v2Headers;
  }
  else {
    ++metrics::g_stats.v1Headers;
  }
  ++metrics::g_stats.headersParsed;

  vinfolog("Got a proxy protocol v%d header from %s: %s", static_cast<int>(version), remote.toStringWithPort(), getAddresses(header));
  buffer.erase(buffer.begin(), buffer.begin() + static_cast<PacketBuffer::difference_type>(used));
  return result;
}
}
