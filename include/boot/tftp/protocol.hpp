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
 * @file protocol.hpp
 * @brief This file declares the read-only TFTP wire protocol.
 */
#pragma once
#ifndef BOOT_TFTP_PROTOCOL_HPP
#define BOOT_TFTP_PROTOCOL_HPP
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
/** @brief TFTP engine. */
namespace boot::tftp {
// NOLINTBEGIN(performance-enum-size)
/** @brief TFTP message layouts and protocol constants. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * These are the valid TFTP operation codes as defined in RFC 1350.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR };

  /**
   * @brief Supported transfer modes.
   * "octet" and "binary" both select OCTET. Nothing else is served.
   */
  enum mode_t : std::uint8_t { OCTET = 1 };

  /**
   * @brief Error codes.
   * The first block are the RFC 1350 codes this server emits.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND = 1,
    ACCESS_VIOLATION = 2,
    ILLEGAL_OPERATION = 4,
    // Errors below this point are ALIASES to NOT_DEFINED on the wire.
    UNSUPPORTED_MODE = 8,
    MALFORMED_REQUEST,
    INVALID_PACKET,
    SERVER_ERROR,
    SERVER_BUSY,
    // Errors below this point are never sent to the peer.
    TIMED_OUT,
    SHORT_ACK,
    UNEXPECTED_ACK
  };

  /** @brief A decoded read request. Views into the received datagram. */
  struct request {
    /** @brief The requested filename. */
    std::string_view filename;
    /** @brief The requested transfer mode. */
    std::string_view mode;
  };

  /** @brief A decoded DATA or ACK header. */
  struct data {
    /** @brief Operation code (DATA or ACK). */
    std::uint16_t opc;
    /** @brief Block number (starts at 1). */
    std::uint16_t block_num;
  };

  /** @brief ACK packets carry the same header as DATA packets. */
  using ack = data;

  /** @brief A decoded ERROR packet. */
  struct error {
    /** @brief The error code. */
    std::uint16_t error;
    /** @brief The error message. */
    std::string_view message;
  };

  /** @brief Size of the opcode field. */
  static constexpr auto OPCODE_LEN = sizeof(std::uint16_t);
  /** @brief Size of a DATA or ACK header. */
  static constexpr auto HEADER_LEN = 2 * sizeof(std::uint16_t);
  /** @brief The maximum data payload size in bytes (512 bytes per RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The maximum total size of a DATA message (header + payload). */
  static constexpr auto DATAMSG_MAXLEN = HEADER_LEN + DATALEN;
};
// NOLINTEND(performance-enum-size)

/** @brief Big-endian field access. */
namespace detail {
/** @brief Reads a network order 16-bit field. */
constexpr auto load_u16(const std::byte *ptr) noexcept -> std::uint16_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return static_cast<std::uint16_t>((std::to_integer<unsigned>(ptr[0]) << 8U) |
                                    std::to_integer<unsigned>(ptr[1]));
}

/** @brief Writes a 16-bit field in network order. */
constexpr auto store_u16(char *ptr, std::uint16_t value) noexcept -> void
{
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  ptr[0] = static_cast<char>(value >> 8U);
  ptr[1] = static_cast<char>(value & 0xFFU);
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}
} // namespace detail

/** @brief Prebuilt ERROR packets. */
struct errors {
  // NOLINTBEGIN
  /**
   * @brief Constructs an ERROR packet from an error number and a string.
   * @tparam N The length of the string (including the null byte).
   * @param error The error code as it appears on the wire.
   * @param str The error message.
   * @returns A byte array holding the packet in network byte order.
   */
  template <std::size_t N>
  static constexpr auto msg(const std::uint16_t error,
                            const char (&str)[N]) noexcept
  {
    auto buf = std::array<char, messages::HEADER_LEN + N>();
    detail::store_u16(buf.data(), messages::ERROR);
    detail::store_u16(buf.data() + messages::OPCODE_LEN, error);

    auto it = buf.begin() + messages::HEADER_LEN;
    for (auto ch : str)
    {
      *it++ = ch;
    }

    return buf;
  }
  // NOLINTEND

  /**
   * @brief Converts an error to the code sent on the wire.
   * @param error An error from messages::error_t.
   * @returns The RFC 1350 error code.
   */
  static constexpr auto wire_code(std::uint16_t error) noexcept -> std::uint16_t
  {
    using enum messages::error_t;
    switch (error)
    {
      case FILE_NOT_FOUND:
      case ACCESS_VIOLATION:
      case ILLEGAL_OPERATION:
        return error;

      default:
        return NOT_DEFINED;
    }
  }

  /**
   * @brief Converts an error to a string for logging.
   * @param error The error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case FILE_NOT_FOUND:
        return "File not found.";

      case ACCESS_VIOLATION:
        return "Access violation.";

      case ILLEGAL_OPERATION:
        return "Illegal TFTP operation.";

      case UNSUPPORTED_MODE:
        return "Only octet mode supported.";

      case MALFORMED_REQUEST:
        return "Malformed RRQ.";

      case INVALID_PACKET:
        return "Invalid packet.";

      case SERVER_ERROR:
        return "Server error.";

      case SERVER_BUSY:
        return "Server busy.";

      case TIMED_OUT:
        return "Timed out waiting for ACK.";

      case SHORT_ACK:
        return "Short ACK received.";

      case UNEXPECTED_ACK:
        return "Unexpected ACK.";

      default:
        return "Not defined.";
    }
  }

  /** @brief ERROR(1, "File not found"). */
  static auto file_not_found() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(FILE_NOT_FOUND, "File not found");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief ERROR(2, "Access violation"). */
  static auto access_violation() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(ACCESS_VIOLATION, "Access violation");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief ERROR(4, "Illegal TFTP operation").
   *
   * Sent for every opcode other than RRQ that reaches the listener,
   * including write requests.
   */
  static auto illegal_operation() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf =
        msg(ILLEGAL_OPERATION, "Illegal TFTP operation");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief ERROR(0, "Only octet mode supported"). */
  static auto unsupported_mode() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Only octet mode supported");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief ERROR(0, "Malformed RRQ"). */
  static auto malformed_request() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Malformed RRQ");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief ERROR(0, "Invalid packet"), for datagrams without an opcode. */
  static auto invalid_packet() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Invalid packet");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief ERROR(0, "Server error"). */
  static auto server_error() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Server error");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief ERROR(0, "Server busy"), sent when the session table is full. */
  static auto server_busy() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Server busy");
    return static_cast<const decltype(buf) &>(buf);
  }
};

/**
 * @brief Maps a mode string to a supported transfer mode.
 * @param mode The mode field of an RRQ, compared case-insensitively.
 * @returns messages::OCTET for "octet" or "binary", 0 otherwise.
 */
auto to_mode(std::string_view mode) noexcept -> std::uint8_t;

/**
 * @brief Reads the opcode of a datagram.
 * @param buf The datagram.
 * @returns The opcode, or std::nullopt if buf is shorter than 2 bytes.
 */
auto decode_opcode(std::span<const std::byte> buf) noexcept
    -> std::optional<std::uint16_t>;

/**
 * @brief Decodes an RRQ.
 * @details Fails if the opcode is missing or the filename is not
 * NUL-terminated. The mode runs to the next NUL or the end of the datagram.
 * @param buf The datagram. The returned views point into it.
 * @returns The request, or std::nullopt if the packet is malformed.
 */
auto decode_request(std::span<const std::byte> buf) noexcept
    -> std::optional<messages::request>;

/**
 * @brief Decodes an ACK header.
 * @param buf The datagram. Bytes past the header are ignored.
 * @returns The header, or std::nullopt if buf is shorter than 4 bytes.
 */
auto decode_ack(std::span<const std::byte> buf) noexcept
    -> std::optional<messages::ack>;

/**
 * @brief Decodes a DATA packet.
 * @param buf The datagram.
 * @param[out] payload Set to the payload bytes on success.
 * @returns The header, or std::nullopt if the packet is not DATA.
 */
auto decode_data(std::span<const std::byte> buf,
                 std::span<const std::byte> &payload) noexcept
    -> std::optional<messages::data>;

/**
 * @brief Decodes an ERROR packet.
 * @param buf The datagram. The message view points into it.
 * @returns The error, or std::nullopt if the packet is not a terminated ERROR.
 */
auto decode_error(std::span<const std::byte> buf) noexcept
    -> std::optional<messages::error>;

/**
 * @brief Encodes an RRQ.
 * @param filename The file to request.
 * @param mode The transfer mode.
 * @returns The datagram.
 */
auto encode_request(std::string_view filename,
                    std::string_view mode) -> std::vector<char>;

/**
 * @brief Encodes a DATA packet into buffer, replacing its contents.
 * @param[out] buffer The destination buffer.
 * @param block_num The block number.
 * @param payload At most messages::DATALEN bytes of file data.
 */
auto encode_data(std::vector<char> &buffer, std::uint16_t block_num,
                 std::span<const char> payload) -> void;

/**
 * @brief Encodes an ACK.
 * @param block_num The block number to acknowledge.
 * @returns The datagram.
 */
constexpr auto encode_ack(std::uint16_t block_num) noexcept
    -> std::array<char, messages::HEADER_LEN>
{
  auto buf = std::array<char, messages::HEADER_LEN>{};
  detail::store_u16(buf.data(), messages::ACK);
  detail::store_u16(buf.data() + messages::OPCODE_LEN, block_num);
  return buf;
}
} // namespace boot::tftp
#endif // BOOT_TFTP_PROTOCOL_HPP
