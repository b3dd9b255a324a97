/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * bootd is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * bootd is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with bootd.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file protocol.cpp
 * @brief This file defines the TFTP packet codec.
 */
#include "boot/tftp/protocol.hpp"

#include <algorithm>
#include <cctype>
namespace boot::tftp {
/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/**
 * @brief Reads a NUL-terminated field from the front of buf.
 * @returns The field, or std::nullopt if no terminator was found.
 */
static inline auto
to_view(std::span<const std::byte> buf) noexcept -> std::optional<std::string_view>
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *str = reinterpret_cast<const char *>(buf.data());
  const auto len = strnlen(str, buf.size());
  if (len == buf.size())
    return std::nullopt;

  return std::string_view(str, len);
}

auto to_mode(std::string_view mode) noexcept -> std::uint8_t
{
  constexpr auto BUFSIZE = sizeof("binary");

  if (mode.size() >= BUFSIZE)
    return 0;

  auto buf = std::array<char, BUFSIZE>{};
  std::transform(mode.begin(), mode.end(), buf.begin(),
                 [](unsigned char chr) { return std::tolower(chr); });

  const auto lower = std::string_view(buf.data(), mode.size());
  if (lower == "octet" || lower == "binary")
    return messages::OCTET;

  return 0;
}

auto decode_opcode(std::span<const std::byte> buf) noexcept
    -> std::optional<std::uint16_t>
{
  if (buf.size() < messages::OPCODE_LEN)
    return std::nullopt;

  return detail::load_u16(buf.data());
}

auto decode_request(std::span<const std::byte> buf) noexcept
    -> std::optional<messages::request>
{
  if (decode_opcode(buf) != messages::RRQ)
    return std::nullopt;

  auto rest = buf.subspan(messages::OPCODE_LEN);
  auto filename = to_view(rest);
  if (!filename)
    return std::nullopt;

  // The mode runs to the next NUL or to the end of the datagram.
  rest = rest.subspan(filename->size() + 1);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *mode = reinterpret_cast<const char *>(rest.data());
  return messages::request{.filename = *filename,
                           .mode = {mode, strnlen(mode, rest.size())}};
}

auto decode_ack(std::span<const std::byte> buf) noexcept
    -> std::optional<messages::ack>
{
  if (buf.size() < messages::HEADER_LEN)
    return std::nullopt;

  return messages::ack{
      .opc = detail::load_u16(buf.data()),
      .block_num = detail::load_u16(buf.subspan(messages::OPCODE_LEN).data())};
}

auto decode_data(std::span<const std::byte> buf,
                 std::span<const std::byte> &payload) noexcept
    -> std::optional<messages::data>
{
  auto header = decode_ack(buf);
  if (!header || header->opc != messages::DATA ||
      buf.size() > messages::DATAMSG_MAXLEN)
  {
    return std::nullopt;
  }

  payload = buf.subspan(messages::HEADER_LEN);
  return header;
}

auto decode_error(std::span<const std::byte> buf) noexcept
    -> std::optional<messages::error>
{
  auto header = decode_ack(buf);
  if (!header || header->opc != messages::ERROR)
    return std::nullopt;

  auto message = to_view(buf.subspan(messages::HEADER_LEN));
  if (!message)
    return std::nullopt;

  return messages::error{.error = header->block_num, .message = *message};
}

auto encode_request(std::string_view filename,
                    std::string_view mode) -> std::vector<char>
{
  auto buf = std::vector<char>(messages::OPCODE_LEN);
  buf.reserve(messages::OPCODE_LEN + filename.size() + mode.size() + 2);
  detail::store_u16(buf.data(), messages::RRQ);

  buf.insert(buf.end(), filename.begin(), filename.end());
  buf.push_back('\0');
  buf.insert(buf.end(), mode.begin(), mode.end());
  buf.push_back('\0');
  return buf;
}

auto encode_data(std::vector<char> &buffer, std::uint16_t block_num,
                 std::span<const char> payload) -> void
{
  const auto len = std::min(payload.size(), messages::DATALEN);

  buffer.reserve(messages::DATAMSG_MAXLEN);
  buffer.resize(messages::HEADER_LEN + len);
  detail::store_u16(buffer.data(), messages::DATA);
  detail::store_u16(buffer.data() + messages::OPCODE_LEN, block_num);
  std::copy_n(payload.begin(), len, buffer.begin() + messages::HEADER_LEN);
}
} // namespace boot::tftp
