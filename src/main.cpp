#include "boot/detail/argument_parser.hpp"
#include "boot/service_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>

#include <pthread.h>

/** @brief Exit status for command line errors. */
static constexpr int EXIT_USAGE = 2;
static constexpr char const *const usage =
    "usage: {} [-r <ROOT_DIR>] [--host <HOST>] [--http-port <PORT>]\n"
    "          [--tftp-port <PORT>] [--no-tftp] [--enable-https]\n"
    "          [--https-port <PORT>] [--ssl-certfile <PEM>]\n"
    "          [--ssl-keyfile <PEM>] [--max-sessions <N>] [-l <LEVEL>]\n"
    "\n"
    "Options:\n"
    "-h, --help                    print this help.\n"
    "-r, --root-dir=<ROOT_DIR>     directory to serve (default: .).\n"
    "--host=<HOST>                 address to bind (default: 0.0.0.0).\n"
    "--http-port=<PORT>            HTTP port, 0 for any (default: 8080).\n"
    "--tftp-port=<PORT>            TFTP port, 0 for any (default: 69).\n"
    "--no-tftp                     do not run the TFTP server.\n"
    "--enable-https                also serve HTTPS.\n"
    "--https-port=<PORT>           HTTPS port, 0 for any (default: 8443).\n"
    "--ssl-certfile=<PEM>          HTTPS certificate chain.\n"
    "--ssl-keyfile=<PEM>           HTTPS private key.\n"
    "--max-sessions=<N>            concurrent TFTP transfers (default: 64).\n"
    "-l, --log-level=<LEVEL>       set the log-level (critical, error, "
    "warn, info, debug)\n";

static auto signal_mask() -> sigset_t *
{
  static auto set = sigset_t{};
  static sigset_t *setp = nullptr;
  static auto mtx = std::mutex{};

  if (auto lock = std::lock_guard{mtx}; !setp)
  {
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    setp = &set;
  }
  return setp;
}

static auto set_loglevel(std::string_view value) -> int
{
  using std::tolower;
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(),
                         [](unsigned char chr) { return tolower(chr); });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
  {
    spdlog::set_level(spdlog_level);
    return 0;
  }

  std::cerr << std::format("Unrecognized log level: {}\n", value)
            << "Valid log levels are: ";

  int count = 0;
  for (const auto &level_str : spdlog::level::level_string_views)
  {
    if (count++ > 0)
      std::cerr << ", ";

    std::cerr << std::string(level_str.begin(), level_str.end());
  }
  std::cerr << "\n";
  return -1;
}

template <typename T>
static auto parse_number(std::string_view value, T &out) -> bool
{
  auto [ptr, err] = std::from_chars(value.cbegin(), value.cend(), out);
  return err == std::errc{} && ptr == value.cend();
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv,
                int &status) -> std::optional<boot::config>
{
  using namespace boot::detail;

  auto conf = boot::config();
  auto progname = std::filesystem::path(*argv).filename();

  auto error = [&]() -> std::optional<boot::config> {
    std::cerr << std::format(usage, progname.c_str());
    status = EXIT_USAGE;
    return std::nullopt;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (flag.empty())
    {
      std::cerr << std::format("Unexpected argument: {}\n", value);
      return error();
    }

    if (flag == "-h" || flag == "--help")
    {
      std::cout << std::format(usage, progname.c_str());
      status = EXIT_SUCCESS;
      return std::nullopt;
    }

    if (flag == "--no-tftp" || flag == "--enable-https")
    {
      if (!value.empty())
      {
        std::cerr << std::format("{} takes no value.\n", flag);
        return error();
      }

      if (flag == "--no-tftp")
        conf.enable_tftp = false;
      else
        conf.enable_https = true;

      continue;
    }

    if (value.empty())
    {
      std::cerr << std::format("Missing value for {}\n", flag);
      return error();
    }

    if (flag == "-r" || flag == "--root-dir")
    {
      conf.root_dir = value;
    }
    else if (flag == "--host")
    {
      conf.host = value;
    }
    else if (flag == "-l" || flag == "--log-level")
    {
      if (set_loglevel(value))
        return error();
    }
    else if (flag == "--http-port" || flag == "--tftp-port" ||
             flag == "--https-port")
    {
      auto &port = (flag == "--http-port")   ? conf.http_port
                   : (flag == "--tftp-port") ? conf.tftp_port
                                             : conf.https_port;
      if (!parse_number(value, port))
      {
        std::cerr << std::format("Invalid port number: {}\n", value);
        return error();
      }
    }
    else if (flag == "--ssl-certfile")
    {
      conf.ssl_certfile = value;
    }
    else if (flag == "--ssl-keyfile")
    {
      conf.ssl_keyfile = value;
    }
    else if (flag == "--max-sessions")
    {
      if (!parse_number(value, conf.max_sessions) || conf.max_sessions == 0)
      {
        std::cerr << std::format("Invalid session limit: {}\n", value);
        return error();
      }
    }
    else
    {
      std::cerr << std::format("Unknown flag: {}\n", flag);
      return error();
    }
  }

  auto err = std::error_code();
  if (!std::filesystem::is_directory(conf.root_dir, err))
  {
    std::cerr << std::format("Root directory {} does not exist.\n",
                             conf.root_dir.c_str());
    status = EXIT_USAGE;
    return std::nullopt;
  }

  if (conf.enable_https && (!conf.ssl_certfile || !conf.ssl_keyfile))
  {
    std::cerr << "--enable-https requires --ssl-certfile and --ssl-keyfile.\n";
    status = EXIT_USAGE;
    return std::nullopt;
  }

  return {conf};
}

auto main(int argc, char *argv[]) -> int
{
  auto status = EXIT_SUCCESS;
  auto conf = parse_args(argc, argv, status);
  if (!conf)
    return status;

  // Service threads inherit the mask, leaving the signals to sigwait below.
  const auto *sigmask = signal_mask();
  pthread_sigmask(SIG_BLOCK, sigmask, nullptr);

  auto manager = boot::service_manager();
  try
  {
    manager.start(*conf);
  }
  catch (const std::exception &exc)
  {
    spdlog::critical("Unable to start: {}", exc.what());
    manager.stop();
    return EXIT_FAILURE;
  }

  auto format_port = [](std::optional<std::uint16_t> port) {
    return port ? std::to_string(*port) : std::string("off");
  };
  spdlog::info("Serving {} (HTTP: {}, HTTPS: {}, TFTP: {}).",
               conf->root_dir.c_str(), format_port(manager.http_port()),
               format_port(manager.https_port()),
               format_port(manager.tftp_port()));

  auto signo = 0;
  sigwait(sigmask, &signo);
  spdlog::info("Received signal {}, shutting down.", signo);

  manager.stop();
  return EXIT_SUCCESS;
}
