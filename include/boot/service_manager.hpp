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
 * @file service_manager.hpp
 * @brief This file declares the manager that runs every boot service.
 */
#pragma once
#ifndef BOOT_SERVICE_MANAGER_HPP
#define BOOT_SERVICE_MANAGER_HPP
#include "service.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
namespace boot {
/** @brief Settings for every service. */
struct config {
  /** @brief The directory served over every transport. */
  std::filesystem::path root_dir = ".";
  /** @brief The address every service binds. */
  std::string host = "0.0.0.0";
  /** @brief HTTP port. */
  std::uint16_t http_port = 8080;
  /** @brief Whether to run the TFTP listener. */
  bool enable_tftp = true;
  /** @brief TFTP port. */
  std::uint16_t tftp_port = 69;
  /** @brief Whether to run the HTTPS server. */
  bool enable_https = false;
  /** @brief HTTPS port. */
  std::uint16_t https_port = 8443;
  /** @brief PEM certificate chain for HTTPS. */
  std::optional<std::filesystem::path> ssl_certfile;
  /** @brief PEM private key for HTTPS. */
  std::optional<std::filesystem::path> ssl_keyfile;
  /** @brief Limit on concurrent TFTP transfers. */
  std::size_t max_sessions = 64;
};

/**
 * @brief Starts, stops and reports on the HTTP, HTTPS and TFTP services as
 * one unit.
 */
class service_manager {
public:
  /** @brief Makes a service from the configuration. */
  using factory = std::function<std::unique_ptr<service>(const config &)>;

  /** @brief The service factories. Empty members use the built-in service. */
  struct factories {
    /** @brief Makes the HTTP server. */
    factory http;
    /** @brief Makes the HTTPS server. */
    factory https;
    /** @brief Makes the TFTP listener. */
    factory tftp;
  };

  service_manager();
  /** @param make Replaces the built-in services. */
  explicit service_manager(factories make);
  service_manager(const service_manager &) = delete;
  service_manager(service_manager &&) = delete;
  auto operator=(const service_manager &) -> service_manager & = delete;
  auto operator=(service_manager &&) -> service_manager & = delete;
  ~service_manager();

  /**
   * @brief Starts HTTP, then HTTPS if enabled, then TFTP if enabled.
   * @details Services that are already running are left alone. A failure
   * propagates and leaves the services started before it running, so the
   * caller should call stop().
   * @param conf The configuration.
   * @throws boot::configuration_error for an unrunnable configuration, or
   * whatever a service throws while binding.
   */
  auto start(const config &conf) -> void;

  /**
   * @brief Stops every running service.
   * @details A failure to stop one service is logged and does not keep the
   * others from stopping.
   */
  auto stop() noexcept -> void;

  /** @brief The HTTP port while running. */
  [[nodiscard]] auto http_port() const -> std::optional<std::uint16_t>;
  /** @brief The HTTPS port while running. */
  [[nodiscard]] auto https_port() const -> std::optional<std::uint16_t>;
  /** @brief The TFTP port while running. */
  [[nodiscard]] auto tftp_port() const -> std::optional<std::uint16_t>;

private:
  factories make_;
  std::unique_ptr<service> http_;
  std::unique_ptr<service> https_;
  std::unique_ptr<service> tftp_;
};
} // namespace boot
#endif // BOOT_SERVICE_MANAGER_HPP
