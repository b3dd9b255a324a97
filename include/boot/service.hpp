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
 * @file service.hpp
 * @brief This file declares the interface shared by the network services.
 */
#pragma once
#ifndef BOOT_SERVICE_HPP
#define BOOT_SERVICE_HPP
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
/** @brief Network boot artifact server. */
namespace boot {
/** @brief Raised for a configuration that can't be run. */
class configuration_error : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/** @brief A network service with a start/stop life cycle. */
class service {
public:
  service() = default;
  service(const service &) = delete;
  service(service &&) = delete;
  auto operator=(const service &) -> service & = delete;
  auto operator=(service &&) -> service & = delete;
  virtual ~service() = default;

  /**
   * @brief Starts the service. A no-op returning the bound port if running.
   * @param host The address to bind.
   * @param port The port to bind. 0 selects an ephemeral port.
   * @returns The bound port.
   */
  virtual auto start(std::string_view host, std::uint16_t port) -> std::uint16_t = 0;

  /** @brief Stops the service. A no-op if not running. */
  virtual auto stop() -> void = 0;

  /** @brief The bound port, present only while running. */
  [[nodiscard]] virtual auto port() const -> std::optional<std::uint16_t> = 0;
};
} // namespace boot
#endif // BOOT_SERVICE_HPP
