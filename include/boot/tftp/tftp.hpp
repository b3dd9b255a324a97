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
 * @file tftp.hpp
 * @brief This file declares the TFTP session transitions.
 */
#pragma once
#ifndef BOOT_TFTP_HPP
#define BOOT_TFTP_HPP
#include "protocol.hpp"
#include "session.hpp"

#include <map>

#include <netinet/in.h>
/** @namespace For top-level tftp services. */
namespace boot::tftp {
/** @brief The TFTP sessions container. */
using sessions_t =
    std::multimap<io::socket::socket_address<sockaddr_in6>, session>;
/** @brief The TFTP sessions iterator. */
using iterator_t = sessions_t::iterator;

/**
 * @brief Validates a read request and prepares the first DATA block.
 * @details On success the session is TRANSFERRING, its file is open and its
 * buffer holds DATA block 1. On failure the session is ABORTED and no file
 * is left open.
 * @param req The decoded request.
 * @param root The served root directory.
 * @param siter An iterator pointing to the session.
 * @returns 0 if successful, a non-zero messages::error_t otherwise.
 */
auto handle_request(const messages::request &req,
                    const std::filesystem::path &root,
                    iterator_t siter) -> std::uint16_t;

/**
 * @brief Processes a datagram received on the session socket.
 * @details A matching ACK for the final (short) block completes the session.
 * A matching ACK for a full block prepares the next one. Anything else is a
 * transport error and aborts the session.
 * @param msg The datagram.
 * @param siter An iterator pointing to the session.
 * @returns 0 if successful, a non-zero messages::error_t otherwise.
 */
auto handle_ack(std::span<const std::byte> msg,
                iterator_t siter) -> std::uint16_t;
} // namespace boot::tftp
#endif // BOOT_TFTP_HPP
