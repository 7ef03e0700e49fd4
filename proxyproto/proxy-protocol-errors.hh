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
#include <stdexcept>
#include <string>

namespace proxyproto
{
enum class ErrorKind : uint8_t
{
  Incomplete,
  InvalidSignature,
  UnsupportedVersion,
  InvalidCommand,
  InvalidAddressFamily,
  InvalidProtocol,
  MalformedHeader,
  MalformedAddress,
  MalformedPort,
  HeaderTooLong,
  TruncatedTlv,
  TlvTooLarge,
  TooManyTlvBytes,
  InvalidAddressForFamily,
  ChecksumMismatch,
  VersionNotAccepted,
};

const char* errorKindToString(ErrorKind kind);

//! Thrown by the builders when a value would violate the wire format
class ProxyProtocolException : public std::runtime_error
{
public:
  ProxyProtocolException(ErrorKind kind, const std::string& reason) :
    std::runtime_error(reason), d_kind(kind)
  {
  }

  [[nodiscard]] ErrorKind getKind() const noexcept
  {
    return d_kind;
  }

private:
  ErrorKind d_kind;
};

/* Outcome of a parse attempt over the bytes received so far:
   - Complete: a header was decoded, getConsumed() bytes belong to it
   - Partial: not enough bytes to decide, retry from the same offset once
     at least getMissing() more bytes are available
   - Invalid: no amount of additional data will make this a valid header */
template <typename T>
class ParseOutcome
{
public:
  enum class Status : uint8_t
  {
    Complete,
    Partial,
    Invalid
  };

  static ParseOutcome complete(T header, size_t consumed)
  {
    ParseOutcome result(Status::Complete);
    result.d_header = std::move(header);
    result.d_consumed = consumed;
    return result;
  }

  static ParseOutcome partial(size_t missing)
  {
    ParseOutcome result(Status::Partial);
    result.d_missing = missing;
    result.d_error = ErrorKind::Incomplete;
    return result;
  }

  static ParseOutcome invalid(ErrorKind error)
  {
    ParseOutcome result(Status::Invalid);
    result.d_error = error;
    return result;
  }

  /* re-wraps a non-complete outcome of another header type */
  template <typename U>
  static ParseOutcome forward(const ParseOutcome<U>& other)
  {
    if (other.isPartial()) {
      return partial(other.getMissing());
    }
    if (other.isInvalid()) {
      return invalid(other.getError());
    }
    throw std::logic_error("Only a partial or invalid outcome can be forwarded");
  }

  [[nodiscard]] Status getStatus() const noexcept
  {
    return d_status;
  }

  [[nodiscard]] bool isComplete() const noexcept
  {
    return d_status == Status::Complete;
  }

  [[nodiscard]] bool isPartial() const noexcept
  {
    return d_status == Status::Partial;
  }

  [[nodiscard]] bool isInvalid() const noexcept
  {
    return d_status == Status::Invalid;
  }

  [[nodiscard]] const T& getHeader() const
  {
    if (!d_header) {
      throw std::runtime_error(std::string("Trying to access the header of a parse outcome that is not complete (") + errorKindToString(d_error) + ")");
    }
    return *d_header;
  }

  [[nodiscard]] size_t getConsumed() const noexcept
  {
    return d_consumed;
  }

  [[nodiscard]] size_t getMissing() const noexcept
  {
    return d_missing;
  }

  /* Incomplete for both complete and partial outcomes */
  [[nodiscard]] ErrorKind getError() const noexcept
  {
    return d_error;
  }

  bool operator==(const ParseOutcome& rhs) const
  {
    return d_status == rhs.d_status && d_consumed == rhs.d_consumed && d_missing == rhs.d_missing && d_error == rhs.d_error && d_header == rhs.d_header;
  }

  bool operator!=(const ParseOutcome& rhs) const
  {
    return !(*this == rhs);
  }

private:
  explicit ParseOutcome(Status status) :
    d_status(status)
  {
  }

  std::optional<T> d_header{std::nullopt};
  size_t d_consumed{0};
  size_t d_missing{0};
  ErrorKind d_error{ErrorKind::Incomplete};
  Status d_status;
};
}
