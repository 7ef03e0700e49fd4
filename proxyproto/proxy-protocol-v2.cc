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
#include "proxy-protocol-v2.hh"

#include <limits>

namespace proxyproto
{
static const size_t s_versionCommandOffset = 12;
static const size_t s_familyProtocolOffset = 13;
static const size_t s_lengthOffset = 14;

const char* commandToString(Command command)
{
  switch (command) {
  case Command::Local:
    return "LOCAL";
  case Command::Proxy:
    return "PROXY";
  }
  return "invalid";
}

const char* protocolToString(Protocol protocol)
{
  switch (protocol) {
  case Protocol::Unspecified:
    return "UNSPEC";
  case Protocol::Stream:
    return "STREAM";
  case Protocol::Datagram:
    return "DGRAM";
  }
  return "invalid";
}

Version2Header::Version2Header(Command command, Protocol protocol, ProxyAddresses addresses, std::vector<Tlv> values) :
  d_values(std::move(values)), d_addresses(std::move(addresses)), d_command(command), d_protocol(protocol)
{
}

std::optional<std::string> Version2Header::getFirstValue(uint8_t type) const
{
  for (const auto& value : d_values) {
    if (value.type == type) {
      return value.content;
    }
  }
  return std::nullopt;
}

std::optional<SSLTlv> Version2Header::getSSL() const
{
  auto content = getFirstValue(TlvType::SSL);
  if (!content) {
    return std::nullopt;
  }
  SSLTlv ssl;
  if (!parseSSLTlv(views::UnsignedCharView(content->data(), content->size()), ssl)) {
    return std::nullopt;
  }
  return ssl;
}

std::optional<bool> Version2Header::verifyChecksum() const
{
  if (d_raw.size() <= d_valuesOffset) {
    return std::nullopt;
  }

  TlvReader reader(views::UnsignedCharView(d_raw.data(), d_raw.size()).subview(d_valuesOffset));
  uint8_t type{0};
  views::UnsignedCharView value;
  for (;;) {
    const auto recordPos = reader.getPosition();
    if (reader.next(type, value) != TlvReader::Status::Record) {
      return std::nullopt;
    }
    if (type != static_cast<uint8_t>(TlvType::CRC32C)) {
      continue;
    }
    if (value.size() != s_crc32cSize) {
      return false;
    }

    const uint32_t expected = value.getUInt32(0);
    /* the checksum is computed with its own field set to zero */
    std::string zeroed(d_raw);
    zeroed.replace(d_valuesOffset + recordPos + s_tlvHeaderSize, s_crc32cSize, s_crc32cSize, '\0');
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return computeCRC32C(reinterpret_cast<const uint8_t*>(zeroed.data()), zeroed.size()) == expected;
  }
}

std::ostream& operator<<(std::ostream& ostr, const Version2Header& header)
{
  return ostr << "PROXYv2(" << commandToString(header.getCommand()) << ", " << protocolToString(header.getProtocol()) << ", " << header.getAddresses() << ", " << header.getValues().size() << " value(s))";
}

static ProxyAddresses decodeAddressBlock(AddressFamily family, views::UnsignedCharView block)
{
  switch (family) {
  case AddressFamily::IPv4:
  case AddressFamily::IPv6: {
    const uint8_t version = family == AddressFamily::IPv4 ? 4 : 6;
    const size_t addrSize = family == AddressFamily::IPv4 ? sizeof(ComboAddress::sin4.sin_addr.s_addr) : sizeof(ComboAddress::sin6.sin6_addr.s6_addr);
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    auto source = makeComboAddressFromRaw(version, reinterpret_cast<const char*>(block.data()), addrSize);
    auto destination = makeComboAddressFromRaw(version, reinterpret_cast<const char*>(block.subview(addrSize).data()), addrSize);
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
    source.setPort(block.getUInt16(addrSize * 2));
    destination.setPort(block.getUInt16((addrSize * 2) + sizeof(uint16_t)));
    return {source, destination};
  }
  case AddressFamily::Unix: {
    UnixAddress source{};
    UnixAddress destination{};
    memcpy(source.data(), block.data(), source.size());
    memcpy(destination.data(), block.subview(source.size()).data(), destination.size());
    return {source, destination};
  }
  case AddressFamily::Unspecified:
    break;
  }
  return {};
}

ParseOutcome<Version2Header> parseVersion2Header(views::UnsignedCharView buffer)
{
  using Outcome = ParseOutcome<Version2Header>;

  if (!buffer.prefixMatches(s_proxyProtocolV2Signature)) {
    return Outcome::invalid(ErrorKind::InvalidSignature);
  }

  /* reject as soon as a byte is known to be wrong, there is no point in waiting for more */
  Command command{Command::Local};
  if (buffer.size() > s_versionCommandOffset) {
    const uint8_t versionCommand = buffer.at(s_versionCommandOffset);
    if ((versionCommand & 0xF0) != s_proxyProtocolV2Version) {
      return Outcome::invalid(ErrorKind::UnsupportedVersion);
    }
    const uint8_t commandValue = versionCommand & 0x0F;
    if (commandValue > static_cast<uint8_t>(Command::Proxy)) {
      return Outcome::invalid(ErrorKind::InvalidCommand);
    }
    command = static_cast<Command>(commandValue);
  }

  AddressFamily family{AddressFamily::Unspecified};
  Protocol protocol{Protocol::Unspecified};
  if (buffer.size() > s_familyProtocolOffset) {
    const uint8_t familyProtocol = buffer.at(s_familyProtocolOffset);
    const uint8_t familyValue = familyProtocol >> 4;
    const uint8_t protocolValue = familyProtocol & 0x0F;
    if (familyValue > static_cast<uint8_t>(AddressFamily::Unix)) {
      return Outcome::invalid(ErrorKind::InvalidAddressFamily);
    }
    if (protocolValue > static_cast<uint8_t>(Protocol::Datagram)) {
      return Outcome::invalid(ErrorKind::InvalidProtocol);
    }
    family = static_cast<AddressFamily>(familyValue);
    protocol = static_cast<Protocol>(protocolValue);
  }

  if (buffer.size() < s_proxyProtocolMinimumHeaderSize) {
    return Outcome::partial(s_proxyProtocolMinimumHeaderSize - buffer.size());
  }

  const uint16_t contentLen = buffer.getUInt16(s_lengthOffset);
  const size_t blockSize = ProxyAddresses::getBlockSize(family);
  if (contentLen < blockSize) {
    return Outcome::invalid(ErrorKind::MalformedAddress);
  }

  const size_t total = s_proxyProtocolMinimumHeaderSize + contentLen;
  if (buffer.size() < total) {
    return Outcome::partial(total - buffer.size());
  }

  const auto raw = buffer.subview(0, total);
  auto addresses = decodeAddressBlock(family, raw.subview(s_proxyProtocolMinimumHeaderSize, blockSize));
  const size_t valuesOffset = s_proxyProtocolMinimumHeaderSize + blockSize;
  std::vector<Tlv> values;
  if (!parseTlvChain(raw.subview(valuesOffset), values)) {
    return Outcome::invalid(ErrorKind::TruncatedTlv);
  }

  Version2Header header(command, protocol, std::move(addresses), std::move(values));
  header.d_raw = raw.toString();
  header.d_valuesOffset = valuesOffset;
  return Outcome::complete(std::move(header), total);
}

static size_t getMaximumValuesSize(const ProxyAddresses& addresses)
{
  return std::numeric_limits<uint16_t>::max() - addresses.getBlockSize();
}

Version2Builder::Version2Builder(Command command, Protocol protocol, ProxyAddresses addresses) :
  d_addresses(std::move(addresses)), d_command(command), d_protocol(protocol)
{
}

static Command commandFromVersionCommand(uint8_t versionCommand)
{
  if ((versionCommand & 0xF0) != s_proxyProtocolV2Version) {
    throw ProxyProtocolException(ErrorKind::UnsupportedVersion, "Only version 2 of the binary PROXY protocol can be built, got a version/command byte of " + std::to_string(versionCommand));
  }
  const uint8_t command = versionCommand & 0x0F;
  if (command > static_cast<uint8_t>(Command::Proxy)) {
    throw ProxyProtocolException(ErrorKind::InvalidCommand, "Invalid PROXY protocol command " + std::to_string(command));
  }
  return static_cast<Command>(command);
}

Version2Builder::Version2Builder(uint8_t versionCommand, Protocol protocol, ProxyAddresses addresses) :
  Version2Builder(commandFromVersionCommand(versionCommand), protocol, std::move(addresses))
{
}

Version2Builder::Version2Builder(Command command, Protocol protocol, const ComboAddress& source, const ComboAddress& destination) :
  Version2Builder(command, protocol, ProxyAddresses(source, destination))
{
}

Version2Builder& Version2Builder::writeTlv(uint8_t type, std::string_view content)
{
  if (content.size() > std::numeric_limits<uint16_t>::max()) {
    throw ProxyProtocolException(ErrorKind::TlvTooLarge, "The size of proxy protocol values is limited to " + std::to_string(std::numeric_limits<uint16_t>::max()) + ", trying to add a value of size " + std::to_string(content.size()));
  }

  const size_t newSize = d_valuesSize + s_tlvHeaderSize + content.size();
  if (newSize > getMaximumValuesSize(d_addresses)) {
    throw ProxyProtocolException(ErrorKind::TooManyTlvBytes, "The total size of proxy protocol values is limited to " + std::to_string(getMaximumValuesSize(d_addresses)) + " for this address family, adding this value would bring it to " + std::to_string(newSize));
  }

  d_values.emplace_back(type, std::string(content));
  d_valuesSize = newSize;
  return *this;
}

Version2Builder& Version2Builder::writeUniqueID(std::string_view uniqueID)
{
  if (uniqueID.size() > s_maximumUniqueIDSize) {
    throw ProxyProtocolException(ErrorKind::TlvTooLarge, "The size of a unique ID is limited to " + std::to_string(s_maximumUniqueIDSize) + ", trying to add one of size " + std::to_string(uniqueID.size()));
  }
  return writeTlv(TlvType::UniqueID, uniqueID);
}

Version2Builder& Version2Builder::writeSSL(const SSLTlv& ssl)
{
  return writeTlv(TlvType::SSL, makeSSLTlvContent(ssl));
}

Version2Builder& Version2Builder::addChecksum()
{
  if (d_checksumIndex) {
    return *this;
  }
  writeTlv(TlvType::CRC32C, std::string(s_crc32cSize, '\0'));
  d_checksumIndex = d_values.size() - 1;
  return *this;
}

static void appendAddressBlock(std::string& out, const ProxyAddresses& addresses)
{
  switch (addresses.getFamily()) {
  case AddressFamily::IPv4:
  case AddressFamily::IPv6: {
    const auto& source = addresses.getSource();
    const auto& destination = addresses.getDestination();
    const uint16_t sourcePort = source.getNetworkOrderPort();
    const uint16_t destinationPort = destination.getNetworkOrderPort();
    out.append(source.toByteString());
    out.append(destination.toByteString());
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    out.append(reinterpret_cast<const char*>(&sourcePort), sizeof(sourcePort));
    out.append(reinterpret_cast<const char*>(&destinationPort), sizeof(destinationPort));
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
    break;
  }
  case AddressFamily::Unix: {
    const auto& source = addresses.getUnixSource();
    const auto& destination = addresses.getUnixDestination();
    out.append(source.begin(), source.end());
    out.append(destination.begin(), destination.end());
    break;
  }
  case AddressFamily::Unspecified:
    break;
  }
}

std::string Version2Builder::build() const
{
  const auto contentLen = static_cast<uint16_t>(d_addresses.getBlockSize() + d_valuesSize);
  const uint8_t versionCommand = s_proxyProtocolV2Version | static_cast<uint8_t>(d_command);
  const uint8_t familyProtocol = static_cast<uint8_t>(static_cast<uint8_t>(d_addresses.getFamily()) << 4) | static_cast<uint8_t>(d_protocol);

  std::string out;
  out.reserve(s_proxyProtocolMinimumHeaderSize + contentLen);
  out.append(s_proxyProtocolV2Signature);
  out.push_back(static_cast<char>(versionCommand));
  out.push_back(static_cast<char>(familyProtocol));
  out.push_back(static_cast<char>(contentLen >> 8));
  out.push_back(static_cast<char>(contentLen & 0xff));

  appendAddressBlock(out, d_addresses);

  size_t checksumPos = 0;
  for (size_t idx = 0; idx < d_values.size(); idx++) {
    if (d_checksumIndex && *d_checksumIndex == idx) {
      checksumPos = out.size() + s_tlvHeaderSize;
    }
    appendTlv(out, d_values.at(idx).type, d_values.at(idx).content);
  }

  if (d_checksumIndex) {
    /* the checksum field is still zeroed at this point */
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const uint32_t crc = computeCRC32C(reinterpret_cast<const uint8_t*>(out.data()), out.size());
    out.at(checksumPos) = static_cast<char>((crc >> 24) & 0xff);
    out.at(checksumPos + 1) = static_cast<char>((crc >> 16) & 0xff);
    out.at(checksumPos + 2) = static_cast<char>((crc >> 8) & 0xff);
    out.at(checksumPos + 3) = static_cast<char>(crc & 0xff);
  }

  return out;
}

Version2Header Version2Builder::getHeader() const
{
  /* going through the parser gives us the wire form and the final checksum value */
  auto raw = build();
  auto outcome = parseVersion2Header(raw);
  return outcome.getHeader();
}
}
