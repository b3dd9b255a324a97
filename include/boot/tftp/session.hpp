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
 * @file session.hpp
 * @brief This file declares a TFTP transfer session.
 */
#pragma once
#ifndef BOOT_TFTP_SESSION_HPP
#define BOOT_TFTP_SESSION_HPP
#include <net/timers/timers.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
namespace boot::tftp {

/** @brief A TFTP session holds the state of one read transfer. */
struct session {
  /** @brief The session timer. */
  using timer_id = net::timers::timer_id;
  /** @brief The invalid timer value. */
  static constexpr auto INVALID_TIMER = net::timers::INVALID_TIMER;
  /** @brief The native socket type. */
  using socket_type = io::socket::native_socket_type;
  /** @brief The invalid socket constant. */
  static constexpr auto INVALID_SOCKET = io::socket::INVALID_SOCKET;
  /**
   * @brief How long to wait for the ACK of a DATA block.
   * Expiry aborts the transfer. Nothing is retransmitted.
   */
  static constexpr auto TIMEOUT = std::chrono::milliseconds(5000);

  /**
   * @brief Session life cycle.
   *
   * VALIDATING -> TRANSFERRING -> COMPLETED, or ABORTED from either of the
   * first two.
   */
  enum status_t : std::uint8_t { VALIDATING, TRANSFERRING, COMPLETED, ABORTED };

  /** @brief The session state. */
  struct state_t {
    /** @brief The resolved file being served. */
    std::filesystem::path target;
    /** @brief The DATA packet most recently sent. */
    std::vector<char> buffer;
    /** @brief The open file. */
    std::shared_ptr<std::fstream> file;
    /** @brief The ACK timer. */
    timer_id timer{INVALID_TIMER};
    /** @brief The session socket, distinct from the listener socket. */
    socket_type socket{INVALID_SOCKET};
    /** @brief The block number of the DATA packet in buffer. */
    std::uint16_t block_num = 0;
    /** @brief Where the session is in its life cycle. */
    status_t status = VALIDATING;
  };

  /** @brief The session state. */
  state_t state;
};

} // namespace boot::tftp
#endif // BOOT_TFTP_SESSION_HPP
