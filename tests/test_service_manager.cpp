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
#include "boot/service_manager.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

using namespace boot;

struct journal {
  std::vector<std::string> events;
  int created = 0;
  int destroyed = 0;

  auto count(const std::string &event) const -> std::ptrdiff_t
  {
    return std::ranges::count(events, event);
  }
};

// Thrown by a service that fails outside the std::exception hierarchy.
struct stop_failure {};

// Records its life cycle.
class fake_service : public service {
public:
  enum failure : std::uint8_t { NONE, STD_EXCEPTION, OTHER };

  fake_service(std::string name, journal &log, bool fail_start = false,
               failure fail_stop = NONE)
      : name_{std::move(name)}, log_{log}, fail_start_{fail_start},
        fail_stop_{fail_stop}
  {
    ++log_.created;
  }

  ~fake_service() override { ++log_.destroyed; }

  auto start(std::string_view host, std::uint16_t port) -> std::uint16_t override
  {
    if (port_)
      return *port_;

    log_.events.push_back(std::format("start {} {}:{}", name_, host, port));
    if (fail_start_)
      throw configuration_error(std::format("{} can't start.", name_));

    port_ = port ? port : 1;
    return *port_;
  }

  auto stop() -> void override
  {
    if (!port_)
      return;

    log_.events.push_back(std::format("stop {}", name_));
    port_.reset();
    if (fail_stop_ == STD_EXCEPTION)
      throw std::runtime_error(std::format("{} can't stop.", name_));

    if (fail_stop_ == OTHER)
      throw stop_failure{};
  }

  [[nodiscard]] auto port() const -> std::optional<std::uint16_t> override
  {
    return port_;
  }

private:
  std::string name_;
  journal &log_;
  bool fail_start_;
  failure fail_stop_;
  std::optional<std::uint16_t> port_;
};

class ServiceManagerTests : public ::testing::Test {
protected:
  journal log;
  bool fail_https_start = false;
  fake_service::failure fail_http_stop = fake_service::NONE;
  config conf;

  auto SetUp() -> void override
  {
    conf.host = "127.0.0.1";
    conf.http_port = 8080;
    conf.https_port = 8443;
    conf.tftp_port = 6969;
  }

  auto make_factories() -> service_manager::factories
  {
    return {
        .http = [this](const config &) -> std::unique_ptr<service> {
          return std::make_unique<fake_service>("HTTP", log, false,
                                                fail_http_stop);
        },
        .https = [this](const config &) -> std::unique_ptr<service> {
          return std::make_unique<fake_service>("HTTPS", log,
                                                fail_https_start);
        },
        .tftp = [this](const config &) -> std::unique_ptr<service> {
          return std::make_unique<fake_service>("TFTP", log);
        },
    };
  }
};

TEST_F(ServiceManagerTests, StartsEveryEnabledService)
{
  conf.enable_https = true;
  auto manager = service_manager(make_factories());

  manager.start(conf);

  EXPECT_EQ(log.events, (std::vector<std::string>{
                            "start HTTP 127.0.0.1:8080",
                            "start HTTPS 127.0.0.1:8443",
                            "start TFTP 127.0.0.1:6969",
                        }));
  EXPECT_EQ(manager.http_port(), 8080);
  EXPECT_EQ(manager.https_port(), 8443);
  EXPECT_EQ(manager.tftp_port(), 6969);
}

TEST_F(ServiceManagerTests, DisabledServicesAreNotCreated)
{
  conf.enable_tftp = false;
  auto manager = service_manager(make_factories());

  manager.start(conf);

  EXPECT_EQ(log.created, 1);
  EXPECT_EQ(manager.http_port(), 8080);
  EXPECT_FALSE(manager.https_port());
  EXPECT_FALSE(manager.tftp_port());
}

TEST_F(ServiceManagerTests, StopsInReverseOrder)
{
  conf.enable_https = true;
  auto manager = service_manager(make_factories());
  manager.start(conf);
  log.events.clear();

  manager.stop();

  EXPECT_EQ(log.events, (std::vector<std::string>{
                            "stop HTTPS",
                            "stop HTTP",
                            "stop TFTP",
                        }));
  EXPECT_FALSE(manager.http_port());
  EXPECT_FALSE(manager.https_port());
  EXPECT_FALSE(manager.tftp_port());
}

TEST_F(ServiceManagerTests, HttpsFailureLeavesHttpRunning)
{
  conf.enable_https = true;
  fail_https_start = true;
  auto manager = service_manager(make_factories());

  EXPECT_THROW(manager.start(conf), configuration_error);

  EXPECT_EQ(manager.http_port(), 8080);
  EXPECT_FALSE(manager.https_port());
  EXPECT_FALSE(manager.tftp_port());
  EXPECT_EQ(log.count("start TFTP 127.0.0.1:6969"), 0);

  manager.stop();
  EXPECT_FALSE(manager.http_port());
  EXPECT_EQ(log.count("stop HTTP"), 1);
}

TEST_F(ServiceManagerTests, StopFailureDoesNotStopTheRest)
{
  conf.enable_https = true;
  fail_http_stop = fake_service::STD_EXCEPTION;
  auto manager = service_manager(make_factories());
  manager.start(conf);

  manager.stop();

  EXPECT_EQ(log.count("stop HTTPS"), 1);
  EXPECT_EQ(log.count("stop HTTP"), 1);
  EXPECT_EQ(log.count("stop TFTP"), 1);
  EXPECT_FALSE(manager.http_port());
  EXPECT_FALSE(manager.tftp_port());
}

TEST_F(ServiceManagerTests, NonStandardStopFailureIsContained)
{
  conf.enable_https = true;
  fail_http_stop = fake_service::OTHER;
  auto manager = service_manager(make_factories());
  manager.start(conf);

  EXPECT_NO_THROW(manager.stop());

  EXPECT_EQ(log.count("stop HTTPS"), 1);
  EXPECT_EQ(log.count("stop HTTP"), 1);
  EXPECT_EQ(log.count("stop TFTP"), 1);
  EXPECT_EQ(log.destroyed, 3);
  EXPECT_FALSE(manager.http_port());
  EXPECT_FALSE(manager.https_port());
  EXPECT_FALSE(manager.tftp_port());
}

TEST_F(ServiceManagerTests, FailedServicesAreReleased)
{
  fail_http_stop = fake_service::STD_EXCEPTION;
  auto manager = service_manager(make_factories());
  manager.start(conf);

  manager.stop();
  EXPECT_EQ(log.destroyed, 2);

  manager.start(conf);
  EXPECT_EQ(log.created, 4);
  EXPECT_EQ(manager.http_port(), 8080);
}

TEST_F(ServiceManagerTests, StartIsIdempotent)
{
  auto manager = service_manager(make_factories());

  manager.start(conf);
  manager.start(conf);

  EXPECT_EQ(log.created, 2);
  EXPECT_EQ(log.count("start HTTP 127.0.0.1:8080"), 1);
  EXPECT_EQ(log.count("start TFTP 127.0.0.1:6969"), 1);
}

TEST_F(ServiceManagerTests, StopIsIdempotent)
{
  auto manager = service_manager(make_factories());
  manager.start(conf);

  manager.stop();
  manager.stop();

  EXPECT_EQ(log.count("stop HTTP"), 1);
  EXPECT_EQ(log.count("stop TFTP"), 1);
}

TEST_F(ServiceManagerTests, RestartAfterStop)
{
  auto manager = service_manager(make_factories());
  manager.start(conf);
  manager.stop();

  manager.start(conf);

  EXPECT_EQ(log.created, 4);
  EXPECT_EQ(manager.http_port(), 8080);
  EXPECT_EQ(manager.tftp_port(), 6969);
}

TEST_F(ServiceManagerTests, DestructorStopsServices)
{
  {
    auto manager = service_manager(make_factories());
    manager.start(conf);
  }

  EXPECT_EQ(log.count("stop HTTP"), 1);
  EXPECT_EQ(log.count("stop TFTP"), 1);
}

TEST(ServiceManagerBuiltinTests, HttpsWithoutCertificate)
{
  auto conf = config{};
  conf.root_dir = std::filesystem::temp_directory_path();
  conf.host = "127.0.0.1";
  conf.http_port = 0;
  conf.enable_tftp = false;
  conf.enable_https = true;
  conf.https_port = 0;

  auto manager = service_manager();
  EXPECT_THROW(manager.start(conf), configuration_error);

  ASSERT_TRUE(manager.http_port());
  EXPECT_NE(*manager.http_port(), 0);
  EXPECT_FALSE(manager.https_port());

  manager.stop();
  EXPECT_FALSE(manager.http_port());
}
// NOLINTEND
