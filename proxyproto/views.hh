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

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using PacketBuffer = std::vector<uint8_t>;

namespace proxyproto::views
{

/* A non-owning view over raw bytes, whatever container they live in */
class UnsignedCharView
{
public:
  UnsignedCharView() = default;

  UnsignedCharView(const char* data_, size_t size_) :
    view(data_, size_)
  {
  }
  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast): No unsigned char view in C++17
  UnsignedCharView(const unsigned char* data_, size_t size_) :
    view(reinterpret_cast<const char*>(data_), size_)
  {
  }
  using size_type = std::string_view::size_type;

  [[nodiscard]] const unsigned char& at(size_type pos) const
  {
    return reinterpret_cast<const unsigned char&>(view.at(pos));
  }

  [[nodiscard]] const unsigned char& operator[](size_type pos) const
  {
    return reinterpret_cast<const unsigned char&>(view[pos]);
  }

  [[nodiscard]] const unsigned char* data() const
  {
    return reinterpret_cast<const unsigned char*>(view.data());
  }
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast): No unsigned char view in C++17

  [[nodiscard]] size_t size() const
  {
    return view.size();
  }

  [[nodiscard]] bool empty() const
  {
    return view.empty();
  }

  [[nodiscard]] UnsignedCharView subview(size_type pos, size_type count = std::string_view::npos) const
  {
    if (pos > view.size()) {
      throw std::out_of_range("Trying to create a sub-view starting past the end of a view of size " + std::to_string(view.size()));
    }
    auto sub = view.substr(pos, count);
    return {sub.data(), sub.size()};
  }

  /* the first min(size(), prefix.size()) bytes are equal */
  [[nodiscard]] bool prefixMatches(std::string_view prefix) const
  {
    const auto len = std::min(view.size(), prefix.size());
    return view.compare(0, len, prefix.substr(0, len)) == 0;
  }

  [[nodiscard]] std::string_view toStringView() const
  {
    return view;
  }

  [[nodiscard]] std::string toString() const
  {
    return std::string(view);
  }

  [[nodiscard]] uint16_t getUInt16(size_type pos) const
  {
    return static_cast<uint16_t>((static_cast<uint16_t>(at(pos)) << 8) | static_cast<uint16_t>(at(pos + 1)));
  }

  [[nodiscard]] uint32_t getUInt32(size_type pos) const
  {
    return (static_cast<uint32_t>(at(pos)) << 24) | (static_cast<uint32_t>(at(pos + 1)) << 16) | (static_cast<uint32_t>(at(pos + 2)) << 8) | static_cast<uint32_t>(at(pos + 3));
  }

private:
  std::string_view view;
};

}
