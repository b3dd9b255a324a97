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
 * @file tftp_server.cpp
 * @brief This file defines the TFTP server and its listener.
 */
#include "boot/tftp/tftp_server.hpp"
#include "boot/filesystem.hpp"

#include <net/timers/timers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstring>
#include <format>
#include <system_error>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
namespace boot::tftp {
/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;
/** @brief Socket address type. */
template <typename T> using socket_address = ::io::socket::socket_address<T>;

/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/** @brief Converts the socket address to a string inside buf. */
[[nodiscard]] static inline auto
to_str(std::span<char> buf,
       socket_address<sockaddr_in6> addr) noexcept -> std::string_view
{
  assert(buf.size() >= INET6_ADDRSTRLEN + ADDR_BUFLEN &&
         "Buffer must be large enough to print an IPv6 address and a port "
         "number.");

  using namespace io::socket;
  using std::to_chars;

  std::memset(buf.data(), 0, buf.size());
  unsigned short port = 0;
  std::size_t len = 0;

  if (addr->sin6_family == AF_INET)
  {
    const auto *addr_v4 =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(addr));
    inet_ntop(addr_v4->sin_family, &addr_v4->sin_addr, buf.data(), buf.size());
    port = ntohs(addr_v4->sin_port);
    len = strnlen(buf.data(), buf.size());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(addr->sin6_family, &addr->sin6_addr, buf.data() + 1,
              buf.size() - 1);
    port = ntohs(addr->sin6_port);
    len = strnlen(buf.data(), buf.size());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  to_chars(buf.data() + len, buf.data() + buf.size(), port);

  return {buf.data()};
}

#ifndef BOOT_TFTP_SERVER_STATIC_TEST
auto server::error(async_context &ctx, const socket_dialog &socket,
                   const socket_address<sockaddr_in6> &address,
                   std::uint16_t error) -> void
{
  using namespace stdexec;
  using enum messages::error_t;

  auto msg = socket_message{.address = {address}};
  switch (error)
  {
    case FILE_NOT_FOUND:
      msg.buffers = errors::file_not_found();
      break;

    case ACCESS_VIOLATION:
      msg.buffers = errors::access_violation();
      break;

    case ILLEGAL_OPERATION:
      msg.buffers = errors::illegal_operation();
      break;

    case UNSUPPORTED_MODE:
      msg.buffers = errors::unsupported_mode();
      break;

    case MALFORMED_REQUEST:
      msg.buffers = errors::malformed_request();
      break;

    case INVALID_PACKET:
      msg.buffers = errors::invalid_packet();
      break;

    case SERVER_BUSY:
      msg.buffers = errors::server_busy();
      break;

    case SERVER_ERROR:
      msg.buffers = errors::server_error();
      break;

    // Transport errors abort silently.
    default:
      break;
  }

  if (msg.buffers)
  {
    sender auto sendmsg = io::sendmsg(socket, msg, 0) |
                          then([](auto &&len) {}) |
                          upon_error([](auto &&error) {}); // GCOVR_EXCL_LINE
    ctx.scope.spawn(std::move(sendmsg));
  }
}

auto server::send_data(async_context &ctx, const socket_dialog &socket,
                       iterator_t siter) -> void
{
  using namespace stdexec;
  auto &[key, session] = *siter;
  auto &state = session.state;

  sender auto sendmsg =
      io::sendmsg(socket,
                  socket_message{.address = {key}, .buffers = state.buffer},
                  0) |
      then([](auto &&) {}) | upon_error([](auto &&) {});
  ctx.scope.spawn(std::move(sendmsg));

  state.timer = ctx.timers.remove(state.timer);
  state.timer = ctx.timers.add(session::TIMEOUT, [&, siter, socket](auto) {
    auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
    spdlog::warn("RRQ:{}:{}", to_str(addrbuf, siter->first),
                 errors::errstr(messages::TIMED_OUT));

    siter->second.state.status = session::ABORTED;
    cleanup(ctx, socket, siter);
  });
}

auto server::erase(async_context &ctx, iterator_t siter) -> void
{
  auto &state = siter->second.state;

  state.timer = ctx.timers.remove(state.timer);
  state.file.reset();
  sessions_.erase(siter);
}

auto server::cleanup(async_context &ctx, const socket_dialog &socket,
                     iterator_t siter) -> void
{
  // Shutdown the read-side of the socket.
  // This removes the socket from the underlying event-loop if
  // we have reached here due to a timeout.
  io::shutdown(socket, SHUT_RD);
  erase(ctx, siter);
}

auto server::ack(async_context &ctx, const socket_dialog &socket,
                 const std::shared_ptr<read_context> &rctx,
                 std::span<const std::byte> buf, iterator_t siter) -> void
{
  using enum messages::error_t;
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto &state = session.state;
  const auto address = key;
  auto addrstr = to_str(addrbuf, address);

  try
  {
    if (auto err = handle_ack(buf, siter))
    {
      if (err == SERVER_ERROR)
      {
        spdlog::error("RRQ:{}:{}", addrstr, errors::errstr(err));
        error(ctx, *listener_, address, err);
      }
      else
      {
        spdlog::warn("RRQ:{}:{}", addrstr, errors::errstr(err));
      }

      return cleanup(ctx, socket, siter);
    }

    if (state.status == session::COMPLETED)
    {
      spdlog::info("RRQ:{}:Completed {}.", addrstr, state.target.c_str());
      return cleanup(ctx, socket, siter);
    }

    send_data(ctx, socket, siter);
  }
  catch (const std::exception &exc)
  {
    spdlog::error("RRQ:{}:{}", addrstr, exc.what());
    error(ctx, *listener_, address, SERVER_ERROR);
    return cleanup(ctx, socket, siter);
  }

  reader(ctx, socket, rctx);
}

auto server::request(async_context &ctx, const socket_dialog &socket,
                     const socket_address<sockaddr_in6> &address,
                     std::span<const std::byte> buf) -> void
{
  using enum messages::error_t;
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
  auto addrstr = to_str(addrbuf, address);

  auto opcode = decode_opcode(buf);
  if (!opcode)
  {
    spdlog::error("TFTP:{}:{}", addrstr, errors::errstr(INVALID_PACKET));
    return error(ctx, socket, address, INVALID_PACKET);
  }

  if (*opcode != messages::RRQ)
  {
    spdlog::error("TFTP:{}:{} Opcode {}.", addrstr,
                  errors::errstr(ILLEGAL_OPERATION), *opcode);
    return error(ctx, socket, address, ILLEGAL_OPERATION);
  }

  auto req = decode_request(buf);
  if (!req)
  {
    spdlog::error("RRQ:{}:{}", addrstr, errors::errstr(MALFORMED_REQUEST));
    return error(ctx, socket, address, MALFORMED_REQUEST);
  }

  if (sessions_.size() >= opts_.max_sessions)
  {
    spdlog::warn("RRQ:{}:{}", addrstr, errors::errstr(SERVER_BUSY));
    return error(ctx, socket, address, SERVER_BUSY);
  }

  spdlog::info("RRQ:{}:New RRQ for {} ({}).", addrstr, req->filename,
               req->mode);

  auto siter = sessions_.emplace(address, session());
  auto session_socket = std::optional<socket_dialog>();
  try
  {
    if (auto err = handle_request(*req, opts_.root, siter))
    {
      spdlog::error("RRQ:{}:{}", addrstr, errors::errstr(err));
      error(ctx, socket, address, err);
      return erase(ctx, siter);
    }

    // Bind the TFTP session to a socket of its own.
    session_socket.emplace(
        ctx.poller.emplace(address->sin6_family, SOCK_DGRAM, 0));
    siter->second.state.socket =
        static_cast<session::socket_type>(*session_socket->socket);

    send_data(ctx, *session_socket, siter);
    reader(ctx, *session_socket, std::make_shared<read_context>());
  }
  catch (const std::exception &exc)
  {
    spdlog::error("RRQ:{}:{}", addrstr, exc.what());
    error(ctx, socket, address, SERVER_ERROR);

    if (session_socket)
      return cleanup(ctx, *session_socket, siter);

    erase(ctx, siter);
  }
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  using namespace io::socket;
  if (!rctx)
    return;

  auto address = *rctx->msg.address;
  if (address->sin6_family == AF_INET)
  {
    address = socket_address(
        reinterpret_cast<sockaddr_in *>(std::ranges::data(address)));
  }

  const auto sockfd = static_cast<session::socket_type>(*socket.socket);
  auto [siter, last] = sessions_.equal_range(address);
  for (; siter != last; ++siter)
  {
    auto &[key, session] = *siter;
    if (session.state.socket == sockfd)
      return ack(ctx, socket, rctx, buf, siter);
  }

  // Another peer found a session socket.
  if (std::ranges::any_of(sessions_, [&](const auto &entry) {
        return entry.second.state.socket == sockfd;
      }))
  {
    auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
    spdlog::debug("TFTP:{}:Ignored datagram on a session socket.",
                  to_str(addrbuf, address));
    return reader(ctx, socket, rctx);
  }

  if (!listener_)
    listener_.emplace(socket);

  request(ctx, socket, address, buf);
  reader(ctx, socket, rctx);
}

/** @brief Ephemeral port selections tried before start() gives up. */
static constexpr int EPHEMERAL_ATTEMPTS = 3;

/**
 * @brief Finds the port the kernel assigns to addr.
 * @details A throwaway socket is bound to addr and its local address read
 * back. The socket is closed before returning.
 */
static auto ephemeral_port(const sockaddr *addr,
                           socklen_t len) -> std::uint16_t
{
  auto sock = io::socket::socket_handle(addr->sa_family, SOCK_DGRAM, 0);
  auto sockfd = static_cast<io::socket::native_socket_type>(sock);
  if (::bind(sockfd, addr, len))
    throw std::system_error(errno, std::system_category(), "bind");

  auto bound = sockaddr_storage{};
  auto bound_len = static_cast<socklen_t>(sizeof(bound));
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  if (::getsockname(sockfd, reinterpret_cast<sockaddr *>(&bound), &bound_len))
    throw std::system_error(errno, std::system_category(), "getsockname");

  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
  if (bound.ss_family == AF_INET6)
    return ntohs(reinterpret_cast<sockaddr_in6 *>(&bound)->sin6_port);

  return ntohs(reinterpret_cast<sockaddr_in *>(&bound)->sin_port);
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
}

listener::listener(const std::filesystem::path &root,
                   std::size_t max_sessions)
    : opts_{.root = filesystem::root_directory(root),
            .max_sessions = max_sessions}
{}

listener::~listener()
{
  try
  {
    stop();
  }
  catch (const std::exception &exc)
  {
    spdlog::error("TFTP server failed to stop: {}", exc.what());
  }
}

template <typename T>
auto listener::start_thread(socket_address<T> address,
                            std::uint16_t port) -> void
{
  using enum net::service::async_context::context_states;

  thread_ = std::make_unique<server_thread>();
  thread_->start(address, opts_);
  thread_->state.wait(PENDING);
  if (thread_->state != STARTED)
  {
    thread_.reset();
    throw std::runtime_error(
        std::format("TFTP server failed to start on UDP port {}.", port));
  }
}

auto listener::start(std::string_view host,
                     std::uint16_t port) -> std::uint16_t
{
  auto lock = std::lock_guard{mtx_};
  if (port_)
    return *port_;

  auto hints = addrinfo{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_flags = AI_PASSIVE;

  const auto node = std::string(host);
  addrinfo *result = nullptr;
  if (auto err = getaddrinfo(node.empty() ? nullptr : node.c_str(), nullptr,
                             &hints, &result))
  {
    throw std::runtime_error(
        std::format("Unable to resolve {}: {}", node, gai_strerror(err)));
  }
  auto addresses = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>(
      result, &freeaddrinfo);

  // Another socket can take an ephemeral port between selection and bind,
  // so selection is retried.
  const bool ephemeral = port == 0;
  auto launch = [&](auto *addr, in_port_t &addr_port) {
    for (int attempt = 1;; ++attempt)
    {
      if (ephemeral)
      {
        addr_port = 0;
        port = ephemeral_port(result->ai_addr, result->ai_addrlen);
      }

      addr_port = htons(port);
      try
      {
        start_thread(socket_address(addr), port);
        return;
      }
      catch (const std::runtime_error &exc)
      {
        if (!ephemeral || attempt == EPHEMERAL_ATTEMPTS)
          throw;

        spdlog::warn("{} Selecting another port.", exc.what());
      }
    }
  };

  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
  if (result->ai_family == AF_INET6)
  {
    auto *addr = reinterpret_cast<sockaddr_in6 *>(result->ai_addr);
    launch(addr, addr->sin6_port);
  }
  else
  {
    auto *addr = reinterpret_cast<sockaddr_in *>(result->ai_addr);
    launch(addr, addr->sin_port);
  }
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)

  spdlog::info("TFTP server serving {} on {}:{}.", opts_.root.c_str(), node,
               port);
  port_ = port;
  return port;
}

auto listener::stop() -> void
{
  using enum net::service::async_context::context_states;

  auto lock = std::lock_guard{mtx_};
  if (!thread_)
    return;

  thread_->signal(thread_->terminate);
  thread_->state.wait(STARTED);
  thread_.reset();

  spdlog::info("TFTP server on port {} stopped.", port_.value_or(0));
  port_.reset();
}

auto listener::port() const -> std::optional<std::uint16_t>
{
  auto lock = std::lock_guard{mtx_};
  return port_;
}
#endif // BOOT_TFTP_SERVER_STATIC_TEST
} // namespace boot::tftp
