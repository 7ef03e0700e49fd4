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
#include "proxy-protocol-tlv.hh"
#include "proxy-protocol-errors.hh"

#include <boost/crc.hpp>
#include <iomanip>
#include <limits>

namespace proxyproto
{
std::ostream& operator<<(std::ostream& ostr, const Tlv& value)
{
  return ostr << "TLV(type=0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned int>(value.type) << std::dec << ", length=" << value.content.size() << ")";
}

TlvReader::Status TlvReader::next(uint8_t& type, views::UnsignedCharView& value)
{
  if (d_truncated) {
    return Status::Truncated;
  }

  const size_t remaining = d_chain.size() - d_pos;
  if (remaining == 0) {
    return Status::End;
  }

  if (remaining < s_tlvHeaderSize) {
    /* a few stray bytes, not even enough for a record header */
    d_truncated = true;
    return Status::Truncated;
  }

  const uint16_t len = d_chain.getUInt16(d_pos + 1);
  if (len > (remaining - s_tlvHeaderSize)) {
    d_truncated = true;
    return Status::Truncated;
  }

  type = d_chain.at(d_pos);
  value = d_chain.subview(d_pos + s_tlvHeaderSize, len);
  d_pos += s_tlvHeaderSize + len;
  return Status::Record;
}

bool parseTlvChain(views::UnsignedCharView chain, std::vector<Tlv>& values)
{
  TlvReader reader(chain);
  uint8_t type{0};
  views::UnsignedCharView value;

  for (;;) {
    switch (reader.next(type, value)) {
    case TlvReader::Status::Record:
      values.emplace_back(type, value.toString());
      break;
    case TlvReader::Status::End:
      return true;
    case TlvReader::Status::Truncated:
      return false;
    }
  }
}

void appendTlv(std::string& out, uint8_t type, const std::string_view& content)
{
  if (content.size() > std::numeric_limits<uint16_t>::max()) {
    throw ProxyProtocolException(ErrorKind::TlvTooLarge, "The size of proxy protocol values is limited to " + std::to_string(std::numeric_limits<uint16_t>::max()) + ", trying to add a value of size " + std::to_string(content.size()));
  }

  const auto len = static_cast<uint16_t>(content.size());
  out.reserve(out.size() + s_tlvHeaderSize + len);
  out.push_back(static_cast<char>(type));
  out.push_back(static_cast<char>(len >> 8));
  out.push_back(static_cast<char>(len & 0xff));
  out.append(content.data(), content.size());
}

std::optional<std::string> SSLTlv::getValue(TlvType type) const
{
  for (const auto& value : values) {
    if (value.isType(type)) {
      return value.content;
    }
  }
  return std::nullopt;
}

bool parseSSLTlv(views::UnsignedCharView content, SSLTlv& out)
{
  if (content.size() < s_sslTlvFixedSize) {
    return false;
  }

  SSLTlv ssl;
  ssl.client = content.at(0);
  ssl.verify = content.getUInt32(sizeof(uint8_t));

  if (!parseTlvChain(content.subview(s_sslTlvFixedSize), ssl.values)) {
    return false;
  }

  out = std::move(ssl);
  return true;
}

std::string makeSSLTlvContent(const SSLTlv& ssl)
{
  std::string content;
  content.reserve(s_sslTlvFixedSize);
  content.push_back(static_cast<char>(ssl.client));
  content.push_back(static_cast<char>((ssl.verify >> 24) & 0xff));
  content.push_back(static_cast<char>((ssl.verify >> 16) & 0xff));
  content.push_back(static_cast<char>((ssl.verify >> 8) & 0xff));
  content.push_back(static_cast<char>(ssl.verify & 0xff));

  for (const auto& value : ssl.values) {
    appendTlv(content, value.type, value.content);
  }

  return content;
}

uint32_t computeCRC32C(const uint8_t* data, size_t size)
{
  boost::crc_optimal<32, 0x1EDC6F41, 0xFFFFFFFF, 0xFFFFFFFF, true, true> crc;
  crc.process_bytes(data, size);
  return crc.checksum();
}
}
