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
#ifndef BOOT_TFTP_SERVER_STATIC_TEST
#define BOOT_TFTP_SERVER_STATIC_TEST
#include "../src/tftp/tftp_server.cpp"

#include <gtest/gtest.h>

#include <array>

using namespace boot::tftp;

TEST(TftpServerStaticTests, TestToStr)
{
  auto buf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
  auto addr_v6 = socket_address<sockaddr_in6>{};
  addr_v6->sin6_family = AF_INET6;
  addr_v6->sin6_addr = in6addr_loopback;
  addr_v6->sin6_port = htons(8080);

  const auto *addr = reinterpret_cast<sockaddr *>(std::ranges::data(addr_v6));

  auto addrstr = to_str(buf, addr);
  EXPECT_EQ(addrstr, "[::1]:8080");

  auto addr_v4 = socket_address<sockaddr_in>{};
  addr_v4->sin_family = AF_INET;
  addr_v4->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr_v4->sin_port = htons(69);

  addr = reinterpret_cast<sockaddr *>(std::ranges::data(addr_v4));

  ASSERT_EQ(addr->sa_family, AF_INET);

  addrstr = to_str(buf, addr);
  EXPECT_EQ(addrstr, "127.0.0.1:69");
}

TEST(TftpServerStaticTests, TestToStrHighPort)
{
  auto buf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
  auto addr_v6 = socket_address<sockaddr_in6>{};
  addr_v6->sin6_family = AF_INET6;
  inet_pton(AF_INET6, "fe80::1:2", &addr_v6->sin6_addr);
  addr_v6->sin6_port = htons(65535);

  const auto *addr = reinterpret_cast<sockaddr *>(std::ranges::data(addr_v6));

  EXPECT_EQ(to_str(buf, addr), "[fe80::1:2]:65535");
}

#undef BOOT_TFTP_SERVER_STATIC_TEST
#endif
// NOLINTEND
