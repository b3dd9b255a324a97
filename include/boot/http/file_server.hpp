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
 * @file file_server.hpp
 * @brief This file declares the static file HTTP(S) server.
 */
#pragma once
#ifndef BOOT_HTTP_FILE_SERVER_HPP
#define BOOT_HTTP_FILE_SERVER_HPP
#include "boot/service.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
/** @brief HTTP(S) file serving. */
namespace boot::http {
/**
 * @brief Serves a directory tree over HTTP, or HTTPS when given a
 * certificate.
 *
 * GET and HEAD are supported. Directories are answered with their index page
 * or a generated listing. Nothing outside the root is ever served.
 */
class file_server : public service {
public:
  /** @brief PEM files for HTTPS. Both are required to start. */
  struct certificate {
    /** @brief The certificate chain. */
    std::optional<std::filesystem::path> certfile;
    /** @brief The private key. */
    std::optional<std::filesystem::path> keyfile;
  };

  /**
   * @brief Constructs a stopped server.
   * @param root The directory to serve.
   * @param tls Serve HTTPS with this certificate if present.
   */
  explicit file_server(const std::filesystem::path &root,
                       std::optional<certificate> tls = std::nullopt);
  file_server(const file_server &) = delete;
  file_server(file_server &&) = delete;
  auto operator=(const file_server &) -> file_server & = delete;
  auto operator=(file_server &&) -> file_server & = delete;
  ~file_server() override;

  /**
   * @brief Binds the listening socket and starts the I/O thread.
   * @param host A numeric address or host name to bind.
   * @param port The TCP port. 0 selects an ephemeral port.
   * @returns The bound port.
   * @throws boot::configuration_error if HTTPS lacks a certificate or key.
   * @throws boost::system::system_error if the address can't be bound or the
   * certificate can't be loaded.
   */
  auto start(std::string_view host, std::uint16_t port) -> std::uint16_t override;
  /** @brief Stops the I/O thread and closes every connection. */
  auto stop() -> void override;
  /** @brief The bound port while running. */
  [[nodiscard]] auto port() const -> std::optional<std::uint16_t> override;
  /** @brief Whether this server speaks HTTPS. */
  [[nodiscard]] auto secure() const noexcept -> bool { return tls_.has_value(); }

private:
  struct context;

  std::filesystem::path root_;
  std::optional<certificate> tls_;
  mutable std::mutex mtx_;
  std::unique_ptr<context> ctx_;
  std::optional<std::uint16_t> port_;
};
} // namespace boot::http
#endif // BOOT_HTTP_FILE_SERVER_HPP
