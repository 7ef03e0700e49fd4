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
#include "proxy-protocol-errors.hh"

namespace proxyproto
{
const char* errorKindToString(ErrorKind kind)
{
  switch (kind) {
  case ErrorKind::Incomplete:
    return "Incomplete";
  case ErrorKind::InvalidSignature:
    return "InvalidSignature";
  case ErrorKind::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorKind::InvalidCommand:
    return "InvalidCommand";
  case ErrorKind::InvalidAddressFamily:
    return "InvalidAddressFamily";
  case ErrorKind::InvalidProtocol:
    return "InvalidProtocol";
  case ErrorKind::MalformedHeader:
    return "MalformedHeader";
  case ErrorKind::MalformedAddress:
    return "MalformedAddress";
  case ErrorKind::MalformedPort:
    return "MalformedPort";
  case ErrorKind::HeaderTooLong:
    return "HeaderTooLong";
  case ErrorKind::TruncatedTlv:
    return "TruncatedTlv";
  case ErrorKind::TlvTooLarge:
    return "TlvTooLarge";
  case ErrorKind::TooManyTlvBytes:
    return "TooManyTlvBytes";
  case ErrorKind::InvalidAddressForFamily:
    return "InvalidAddressForFamily";
  case ErrorKind::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorKind::VersionNotAccepted:
    return "VersionNotAccepted";
  }
  return "Unknown";
}
}
