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
// NOLINTBEGIN
#pragma once
#ifndef BOOT_TEST_SERVER_FIXTURE_HPP
#define BOOT_TEST_SERVER_FIXTURE_HPP
#include "boot/tftp/protocol.hpp"
#include "boot/tftp/tftp_server.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>

using namespace boot::tftp;

static inline auto test_counter = std::atomic<std::uint16_t>();
class TftpServerTests : public ::testing::Test {
protected:
  auto SetUp() -> void override
  {
    root = (std::filesystem::temp_directory_path() / "bootd.server.")
               .concat(std::format("{:05d}", test_counter++));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    server_ = std::make_unique<listener>(root);
    port = server_->start("127.0.0.1", 0);
    ASSERT_NE(port, 0);

    addr_v4->sin_family = AF_INET;
    addr_v4->sin_port = htons(port);
    addr_v4->sin_addr.s_addr = inet_addr("127.0.0.1");

    ack.resize(messages::HEADER_LEN);
  }

  auto TearDown() -> void override
  {
    server_->stop();
    server_.reset();
    std::filesystem::remove_all(root);
  }

  // Helper to create a file under the root
  auto create_test_file(const std::string &name, std::size_t size,
                        char fill = 'A') -> std::filesystem::path
  {
    const auto path = root / name;
    std::ofstream(path, std::ios::binary) << std::string(size, fill);
    return path;
  }

  auto set_block(std::uint16_t block_num) -> void
  {
    const auto msg = encode_ack(block_num);
    std::ranges::copy(msg, ack.begin());
  }

  // Waits for a datagram on sock.
  static auto readable(const io::socket::socket_handle &sock,
                       std::chrono::milliseconds timeout) -> bool
  {
    auto pfd = pollfd{
        .fd = static_cast<io::socket::native_socket_type>(sock),
        .events = POLLIN,
        .revents = 0};
    return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
  }

  static auto block_of(const std::vector<char> &buf) -> std::uint16_t
  {
    return boot::tftp::detail::load_u16(
        std::as_bytes(std::span(buf)).subspan(messages::OPCODE_LEN).data());
  }

  io::socket::socket_address<sockaddr_in> addr_v4;
  std::unique_ptr<listener> server_;
  std::filesystem::path root;
  std::uint16_t port = 0;
  std::vector<char> ack;
};
#endif // BOOT_TEST_SERVER_FIXTURE_HPP
// NOLINTEND
