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

#include <optional>
#include <string>
#include <vector>

#include "proxy-protocol-addresses.hh"
#include "proxy-protocol-errors.hh"
#include "proxy-protocol-tlv.hh"
#include "views.hh"

namespace proxyproto
{
static const std::string_view s_proxyProtocolV2Signature{"\x0D\x0A\x0D\x0A\x00\x0D\x0A\x51\x55\x49\x54\x0A", 12};
/* signature, version/command, family/protocol, length */
static const size_t s_proxyProtocolMinimumHeaderSize = 16;
static const uint8_t s_proxyProtocolV2Version = 0x20;

enum class Command : uint8_t
{
  Local = 0x00,
  Proxy = 0x01
};

enum class Protocol : uint8_t
{
  Unspecified = 0x00,
  Stream = 0x01,
  Datagram = 0x02
};

const char* commandToString(Command command);
const char* protocolToString(Protocol protocol);

/* Binary (v2) header. A parsed header owns a copy of the bytes it was decoded from. */
class Version2Header
{
public:
  Version2Header(Command command, Protocol protocol, ProxyAddresses addresses, std::vector<Tlv> values = {});

  [[nodiscard]] Command getCommand() const
  {
    return d_command;
  }
  [[nodiscard]] bool isLocal() const
  {
    return d_command == Command::Local;
  }
  [[nodiscard]] Protocol getProtocol() const
  {
    return d_protocol;
  }
  [[nodiscard]] const ProxyAddresses& getAddresses() const
  {
    return d_addresses;
  }
  [[nodiscard]] const std::vector<Tlv>& getValues() const
  {
    return d_values;
  }
  /* the wire form, empty unless the header was parsed or built */
  [[nodiscard]] const std::string& getRaw() const
  {
    return d_raw;
  }

  [[nodiscard]] std::optional<std::string> getFirstValue(uint8_t type) const;
  [[nodiscard]] std::optional<std::string> getFirstValue(TlvType type) const
  {
    return getFirstValue(static_cast<uint8_t>(type));
  }
  /* nullopt if there is no SSL value, or if it cannot be decoded */
  [[nodiscard]] std::optional<SSLTlv> getSSL() const;

  /* nullopt if there is no CRC32C value, otherwise whether the checksum
     of the wire form matches it */
  [[nodiscard]] std::optional<bool> verifyChecksum() const;

  bool operator==(const Version2Header& rhs) const
  {
    return d_command == rhs.d_command && d_protocol == rhs.d_protocol && d_addresses == rhs.d_addresses && d_values == rhs.d_values;
  }
  bool operator!=(const Version2Header& rhs) const
  {
    return !(*this == rhs);
  }

private:
  friend ParseOutcome<Version2Header> parseVersion2Header(views::UnsignedCharView buffer);

  std::vector<Tlv> d_values;
  ProxyAddresses d_addresses;
  std::string d_raw;
  /* offset of the TLV chain in d_raw */
  size_t d_valuesOffset{0};
  Command d_command;
  Protocol d_protocol;
};

std::ostream& operator<<(std::ostream& ostr, const Version2Header& header);

ParseOutcome<Version2Header> parseVersion2Header(views::UnsignedCharView buffer);

template <typename Container>
ParseOutcome<Version2Header> parseVersion2Header(const Container& buffer)
{
  return parseVersion2Header(views::UnsignedCharView(buffer.data(), buffer.size()));
}

/* Accumulates TLVs, checking every limit when a value is added, then
   seals the whole header with build(). */
class Version2Builder
{
public:
  /* 'versionCommand' is the raw byte: the version has to be 2, the command Local or Proxy */
  Version2Builder(uint8_t versionCommand, Protocol protocol, ProxyAddresses addresses);
  Version2Builder(Command command, Protocol protocol, ProxyAddresses addresses);
  /* throws InvalidAddressForFamily if the families differ */
  Version2Builder(Command command, Protocol protocol, const ComboAddress& source, const ComboAddress& destination);

  /* throws TlvTooLarge if the value does not fit in 16 bits, TooManyTlvBytes
     if the header length would not fit anymore */
  Version2Builder& writeTlv(uint8_t type, std::string_view content);
  Version2Builder& writeTlv(TlvType type, std::string_view content)
  {
    return writeTlv(static_cast<uint8_t>(type), content);
  }
  Version2Builder& writeTlv(const Tlv& value)
  {
    return writeTlv(value.type, value.content);
  }

  Version2Builder& writeALPN(std::string_view alpn)
  {
    return writeTlv(TlvType::ALPN, alpn);
  }
  Version2Builder& writeAuthority(std::string_view authority)
  {
    return writeTlv(TlvType::Authority, authority);
  }
  /* the unique ID is limited to 128 bytes */
  Version2Builder& writeUniqueID(std::string_view uniqueID);
  Version2Builder& writeNetworkNamespace(std::string_view name)
  {
    return writeTlv(TlvType::NetworkNamespace, name);
  }
  Version2Builder& writeSSL(const SSLTlv& ssl);
  /* adds a CRC32C value, computed over the whole header when it is built */
  Version2Builder& addChecksum();

  [[nodiscard]] size_t getValuesSize() const
  {
    return d_valuesSize;
  }

  [[nodiscard]] std::string build() const;
  [[nodiscard]] Version2Header getHeader() const;

private:
  ProxyAddresses d_addresses;
  std::vector<Tlv> d_values;
  size_t d_valuesSize{0};
  /* index of the CRC32C value in d_values */
  std::optional<size_t> d_checksumIndex{std::nullopt};
  Command d_command;
  Protocol d_protocol;
};
}
