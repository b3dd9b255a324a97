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
 * @file service_manager.cpp
 * @brief This file defines the manager that runs every boot service.
 */
#include "boot/service_manager.hpp"
#include "boot/http/file_server.hpp"
#include "boot/tftp/tftp_server.hpp"

#include <spdlog/spdlog.h>
namespace boot {
/** @brief Stops svc, logging rather than propagating a failure. */
static auto stop_service(std::unique_ptr<service> &svc,
                         std::string_view name) noexcept -> void
{
  if (!svc)
    return;

  try
  {
    svc->stop();
  }
  catch (const std::exception &exc)
  {
    spdlog::error("Error stopping the {} server: {}", name, exc.what());
  }
  catch (...)
  {
    spdlog::error("Error stopping the {} server: unknown exception.", name);
  }

  svc.reset();
}

/** @brief Starts the service built by make unless it is already running. */
static auto start_service(std::unique_ptr<service> &svc,
                          const service_manager::factory &make,
                          const config &conf,
                          std::uint16_t port) -> void
{
  if (!svc)
    svc = make(conf);

  svc->start(conf.host, port);
}

service_manager::service_manager() : service_manager(factories{}) {}

service_manager::service_manager(factories make) : make_{std::move(make)}
{
  if (!make_.http)
  {
    make_.http = [](const config &conf) -> std::unique_ptr<service> {
      return std::make_unique<http::file_server>(conf.root_dir);
    };
  }

  if (!make_.https)
  {
    make_.https = [](const config &conf) -> std::unique_ptr<service> {
      return std::make_unique<http::file_server>(
          conf.root_dir, http::file_server::certificate{
                             .certfile = conf.ssl_certfile,
                             .keyfile = conf.ssl_keyfile});
    };
  }

  if (!make_.tftp)
  {
    make_.tftp = [](const config &conf) -> std::unique_ptr<service> {
      return std::make_unique<tftp::listener>(conf.root_dir,
                                              conf.max_sessions);
    };
  }
}

service_manager::~service_manager() { stop(); }

auto service_manager::start(const config &conf) -> void
{
  start_service(http_, make_.http, conf, conf.http_port);

  if (conf.enable_https)
    start_service(https_, make_.https, conf, conf.https_port);

  if (conf.enable_tftp)
    start_service(tftp_, make_.tftp, conf, conf.tftp_port);
}

auto service_manager::stop() noexcept -> void
{
  stop_service(https_, "HTTPS");
  stop_service(http_, "HTTP");
  stop_service(tftp_, "TFTP");
}

auto service_manager::http_port() const -> std::optional<std::uint16_t>
{
  return http_ ? http_->port() : std::nullopt;
}

auto service_manager::https_port() const -> std::optional<std::uint16_t>
{
  return https_ ? https_->port() : std::nullopt;
}

auto service_manager::tftp_port() const -> std::optional<std::uint16_t>
{
  return tftp_ ? tftp_->port() : std::nullopt;
}
} // namespace boot
