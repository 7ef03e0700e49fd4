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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "views.hh"

namespace proxyproto
{
/* Registered TLV types. Anything else is kept as an opaque value. */
enum class TlvType : uint8_t
{
  ALPN = 0x01,
  Authority = 0x02,
  CRC32C = 0x03,
  NoOp = 0x04,
  UniqueID = 0x05,
  SSL = 0x20,
  SSLVersion = 0x21,
  SSLCommonName = 0x22,
  SSLCipher = 0x23,
  SSLSignatureAlgorithm = 0x24,
  SSLKeyAlgorithm = 0x25,
  NetworkNamespace = 0x30,
};

/* bits of the 'client' field of the SSL TLV */
enum SSLClientFlags : uint8_t
{
  SSLClientSSL = 0x01,
  SSLClientCertificateConnection = 0x02,
  SSLClientCertificateSession = 0x04,
};

static const size_t s_tlvHeaderSize = sizeof(uint8_t) + sizeof(uint16_t);
static const size_t s_sslTlvFixedSize = sizeof(uint8_t) + sizeof(uint32_t);
static const size_t s_crc32cSize = sizeof(uint32_t);
static const size_t s_maximumUniqueIDSize = 128;

struct Tlv
{
  Tlv() = default;
  Tlv(uint8_t type_, std::string content_) :
    content(std::move(content_)), type(type_)
  {
  }
  Tlv(TlvType type_, std::string content_) :
    content(std::move(content_)), type(static_cast<uint8_t>(type_))
  {
  }

  bool operator==(const Tlv& rhs) const
  {
    return type == rhs.type && content == rhs.content;
  }
  bool operator!=(const Tlv& rhs) const
  {
    return !(*this == rhs);
  }

  [[nodiscard]] bool isType(TlvType expected) const
  {
    return type == static_cast<uint8_t>(expected);
  }

  std::string content;
  uint8_t type{0};
};

std::ostream& operator<<(std::ostream& ostr, const Tlv& value);

/* Lazy, restartable cursor over a chain of TLV records. The chain is
   bounded by the enclosing header, so a record that does not fit is a
   corruption, never a request for more data. */
class TlvReader
{
public:
  enum class Status : uint8_t
  {
    Record,
    End,
    Truncated
  };

  explicit TlvReader(views::UnsignedCharView chain) :
    d_chain(chain)
  {
  }

  /* On Record, 'type' and 'value' describe the record just read and the
     cursor is past it. After Truncated the cursor does not move anymore. */
  Status next(uint8_t& type, views::UnsignedCharView& value);

  void rewind()
  {
    d_pos = 0;
    d_truncated = false;
  }

  [[nodiscard]] size_t getPosition() const
  {
    return d_pos;
  }

private:
  views::UnsignedCharView d_chain;
  size_t d_pos{0};
  bool d_truncated{false};
};

/* decodes a whole chain, appending to 'values'. Returns false if a record overruns the chain */
bool parseTlvChain(views::UnsignedCharView chain, std::vector<Tlv>& values);

/* appends the wire form of 'value' to 'out', throws TlvTooLarge for a content larger than 65535 bytes */
void appendTlv(std::string& out, uint8_t type, const std::string_view& content);

/* The SSL TLV carries a client bitmask, the certificate verification result
   and a chain of sub-TLVs (version, common name, cipher, ...) */
struct SSLTlv
{
  bool operator==(const SSLTlv& rhs) const
  {
    return client == rhs.client && verify == rhs.verify && values == rhs.values;
  }
  bool operator!=(const SSLTlv& rhs) const
  {
    return !(*this == rhs);
  }

  [[nodiscard]] bool connectedWithSSL() const
  {
    return (client & SSLClientSSL) != 0;
  }
  /* a zero verify result means the client presented a certificate that was successfully verified */
  [[nodiscard]] bool certificateVerified() const
  {
    return verify == 0;
  }

  [[nodiscard]] std::optional<std::string> getValue(TlvType type) const;
  [[nodiscard]] std::optional<std::string> getVersion() const
  {
    return getValue(TlvType::SSLVersion);
  }
  [[nodiscard]] std::optional<std::string> getCommonName() const
  {
    return getValue(TlvType::SSLCommonName);
  }
  [[nodiscard]] std::optional<std::string> getCipher() const
  {
    return getValue(TlvType::SSLCipher);
  }
  [[nodiscard]] std::optional<std::string> getSignatureAlgorithm() const
  {
    return getValue(TlvType::SSLSignatureAlgorithm);
  }
  [[nodiscard]] std::optional<std::string> getKeyAlgorithm() const
  {
    return getValue(TlvType::SSLKeyAlgorithm);
  }

  std::vector<Tlv> values;
  uint32_t verify{0};
  uint8_t client{0};
};

/* Decodes the content of an SSL TLV. Sub-TLVs are kept as they are, even
   when they are themselves of type SSL: only one level is ever expanded.
   Returns false if the content is too short or a sub-TLV overruns it. */
bool parseSSLTlv(views::UnsignedCharView content, SSLTlv& out);
/* throws TlvTooLarge if a sub-TLV does not fit */
std::string makeSSLTlvContent(const SSLTlv& ssl);

/* CRC32c (Castagnoli), as used by the CRC32C TLV */
uint32_t computeCRC32C(const uint8_t* data, size_t size);
}
