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
 * @file tftp_server.hpp
 * @brief This file declares the TFTP server and its listener.
 */
#pragma once
#ifndef BOOT_TFTP_SERVER_HPP
#define BOOT_TFTP_SERVER_HPP
#include "boot/service.hpp"
#include "tftp.hpp"

#include <net/cppnet.hpp>

#include <mutex>
/** @namespace For top-level tftp services. */
namespace boot::tftp {
/** @brief TFTP max buffer allocation. */
static constexpr auto BUFSIZE = 516UL;
/** @brief The service type to use. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/**
 * @brief A read-only TFTP server.
 *
 * Requests arrive on the listener socket. Each accepted RRQ is served from a
 * session socket of its own, so every transfer comes from a fresh ephemeral
 * port. All sessions share the event loop of the listener.
 */
class server : public udp_base<server> {
public:
  /** @brief The base class. */
  using Base = udp_base<server>;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;
  /** @brief Default limit on concurrent sessions. */
  static constexpr std::size_t MAX_SESSIONS = 64;

  /** @brief Server options. */
  struct options {
    /** @brief The root directory served, as returned by root_directory(). */
    std::filesystem::path root;
    /** @brief Requests beyond this many live sessions are refused. */
    std::size_t max_sessions = MAX_SESSIONS;
  };

  /**
   * @brief Constructs a TFTP server on the socket address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   * @param opts The server options.
   */
  template <typename T>
  server(socket_address<T> address, options opts) noexcept
      : Base(address), opts_{std::move(opts)}
  {}

  /**
   * @brief Routes a datagram to the listener or to its session.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

private:
  /** @brief Server options. */
  options opts_;
  /** @brief The TFTP sessions. */
  sessions_t sessions_;
  /** @brief The listener socket, known once the first request arrives. */
  std::optional<socket_dialog> listener_;

  /**
   * @brief Services a datagram received on the listener socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The listener socket.
   * @param address The normalized peer address.
   * @param buf The datagram.
   */
  auto request(async_context &ctx, const socket_dialog &socket,
               const io::socket::socket_address<sockaddr_in6> &address,
               std::span<const std::byte> buf) -> void;

  /**
   * @brief Services a datagram received on a session socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The session socket.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The datagram.
   * @param siter An iterator pointing to the session.
   */
  auto ack(async_context &ctx, const socket_dialog &socket,
           const std::shared_ptr<read_context> &rctx,
           std::span<const std::byte> buf, iterator_t siter) -> void;

  /**
   * @brief Sends an ERROR packet from the listener socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The listener socket.
   * @param address The peer address.
   * @param error A messages::error_t. Transport errors are not sent.
   */
  static auto error(async_context &ctx, const socket_dialog &socket,
                    const io::socket::socket_address<sockaddr_in6> &address,
                    std::uint16_t error) -> void;

  /**
   * @brief Sends the current DATA block and arms the ACK timer.
   * @param ctx The asynchronous context of the message.
   * @param socket The session socket.
   * @param siter An iterator pointing to the session.
   */
  auto send_data(async_context &ctx, const socket_dialog &socket,
                 iterator_t siter) -> void;

  /**
   * @brief Tears down the session and closes its socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The session socket.
   * @param siter An iterator pointing to the session to clean up.
   */
  auto cleanup(async_context &ctx, const socket_dialog &socket,
               iterator_t siter) -> void;

  /**
   * @brief Removes a session that never opened a socket.
   * @param ctx The asynchronous context of the message.
   * @param siter An iterator pointing to the session to remove.
   */
  auto erase(async_context &ctx, iterator_t siter) -> void;
};

/**
 * @brief Runs a TFTP server on a thread of its own.
 *
 * start() and stop() are idempotent. stop() tears down in-flight transfers
 * together with the event loop.
 */
class listener : public service {
public:
  /** @brief The server thread type. */
  using server_thread = net::service::context_thread<server>;

  /**
   * @brief Constructs a stopped listener.
   * @param root The root directory to serve.
   * @param max_sessions The limit on concurrent sessions.
   */
  explicit listener(const std::filesystem::path &root,
                    std::size_t max_sessions = server::MAX_SESSIONS);
  listener(const listener &) = delete;
  listener(listener &&) = delete;
  auto operator=(const listener &) -> listener & = delete;
  auto operator=(listener &&) -> listener & = delete;
  ~listener() override;

  /**
   * @brief Binds the listener socket and starts the server thread.
   * @param host A numeric address or host name to bind.
   * @param port The UDP port. 0 selects an ephemeral port, and a new one is
   * selected if the first is taken before the server binds it.
   * @returns The bound port.
   * @throws std::runtime_error if host can't be resolved or the server fails
   * to start, std::system_error if an ephemeral port can't be bound.
   */
  auto start(std::string_view host, std::uint16_t port) -> std::uint16_t override;
  /** @brief Stops the server thread. A no-op when not started. */
  auto stop() -> void override;
  /** @brief The bound port while running. */
  [[nodiscard]] auto port() const -> std::optional<std::uint16_t> override;

private:
  mutable std::mutex mtx_;
  server::options opts_;
  std::unique_ptr<server_thread> thread_;
  std::optional<std::uint16_t> port_;

  template <typename T>
  auto start_thread(io::socket::socket_address<T> address,
                    std::uint16_t port) -> void;
};
} // namespace boot::tftp
#endif // BOOT_TFTP_SERVER_HPP
