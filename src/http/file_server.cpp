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
 * @file file_server.cpp
 * @brief This file defines the static file HTTP(S) server.
 */
#include "boot/http/file_server.hpp"
#include "boot/filesystem.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <format>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
namespace boot::http {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
namespace web = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/** @brief Value of the Server header. */
static constexpr auto SERVER_NAME = "bootd";
/** @brief Idle and I/O timeout for a connection. */
static constexpr auto TIMEOUT = std::chrono::seconds(30);

/** @brief Decodes %XX escapes. Malformed escapes are kept verbatim. */
static auto percent_decode(std::string_view str) -> std::string
{
  auto out = std::string();
  out.reserve(str.size());

  for (std::size_t i = 0; i < str.size(); ++i)
  {
    if (str[i] == '%' && i + 2 < str.size() &&
        std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(str[i + 2])))
    {
      unsigned value = 0;
      std::from_chars(str.data() + i + 1, str.data() + i + 3, value, 16);
      out.push_back(static_cast<char>(value));
      i += 2;
      continue;
    }

    out.push_back(str[i]);
  }

  return out;
}

/** @brief Escapes everything but unreserved characters and '/'. */
static auto percent_encode(std::string_view str) -> std::string
{
  constexpr auto HEX = std::string_view("0123456789ABCDEF");
  auto out = std::string();
  out.reserve(str.size());

  for (const auto chr : str)
  {
    auto byte = static_cast<unsigned char>(chr);
    if (std::isalnum(byte) || chr == '-' || chr == '.' || chr == '_' ||
        chr == '~' || chr == '/')
    {
      out.push_back(chr);
      continue;
    }

    out.push_back('%');
    out.push_back(HEX[byte >> 4U]);
    out.push_back(HEX[byte & 0xFU]);
  }

  return out;
}

/** @brief Escapes text for inclusion in HTML. */
static auto html_escape(std::string_view str) -> std::string
{
  auto out = std::string();
  out.reserve(str.size());

  for (const auto chr : str)
  {
    switch (chr)
    {
      case '&':
        out += "&amp;";
        break;

      case '<':
        out += "&lt;";
        break;

      case '>':
        out += "&gt;";
        break;

      case '"':
        out += "&quot;";
        break;

      case '\'':
        out += "&#x27;";
        break;

      default:
        out.push_back(chr);
    }
  }

  return out;
}

/** @brief The decoded path of a request target, without query or fragment. */
static auto url_path(std::string_view target) -> std::string
{
  return percent_decode(target.substr(0, target.find_first_of("?#")));
}

/** @brief Guesses a content type from the file extension. */
static auto mime_type(const std::filesystem::path &path) -> std::string_view
{
  static constexpr auto types = std::to_array<
      std::pair<std::string_view, std::string_view>>({
      {".htm", "text/html"},
      {".html", "text/html"},
      {".css", "text/css"},
      {".txt", "text/plain"},
      {".cfg", "text/plain"},
      {".ipxe", "text/plain"},
      {".js", "text/javascript"},
      {".json", "application/json"},
      {".xml", "application/xml"},
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".gif", "image/gif"},
      {".svg", "image/svg+xml"},
      {".ico", "image/vnd.microsoft.icon"},
      {".iso", "application/x-iso9660-image"},
      {".gz", "application/gzip"},
      {".xz", "application/x-xz"},
      {".tar", "application/x-tar"},
      {".zip", "application/zip"},
  });

  auto ext = path.extension().string();
  std::ranges::transform(ext, ext.begin(),
                         [](unsigned char chr) { return std::tolower(chr); });

  const auto found = std::ranges::find(types, std::string_view(ext),
                                        &std::pair<std::string_view,
                                                   std::string_view>::first);
  if (found == types.end())
    return "application/octet-stream";

  return found->second;
}

/**
 * @brief Renders an HTML index of a directory.
 * @param dir The directory to list.
 * @param path The decoded URL path of the directory.
 * @returns The page, or std::nullopt if the directory can't be read.
 */
static auto directory_listing(const std::filesystem::path &dir,
                              std::string_view path)
    -> std::optional<std::string>
{
  struct entry {
    std::string name;
    std::string display;
    std::string link;
  };

  auto err = std::error_code();
  auto iter = std::filesystem::directory_iterator(dir, err);
  if (err)
    return std::nullopt;

  auto entries = std::vector<entry>();
  for (const auto &dirent : iter)
  {
    auto name = dirent.path().filename().string();
    auto display = name;
    auto link = name;

    if (dirent.is_directory(err))
    {
      display += '/';
      link += '/';
    }
    if (dirent.is_symlink(err))
      display += '@';

    entries.push_back({std::move(name), std::move(display), std::move(link)});
  }

  std::ranges::sort(entries, [](const entry &lhs, const entry &rhs) {
    return std::ranges::lexicographical_compare(
        lhs.name, rhs.name, [](unsigned char left, unsigned char right) {
          return std::tolower(left) < std::tolower(right);
        });
  });

  const auto title = html_escape(path);
  auto page = std::format("<!DOCTYPE HTML>\n"
                          "<html lang=\"en\">\n"
                          "<head>\n"
                          "<meta charset=\"utf-8\">\n"
                          "<title>Directory listing for {0}</title>\n"
                          "</head>\n"
                          "<body>\n"
                          "<h1>Directory listing for {0}</h1>\n"
                          "<hr>\n"
                          "<ul>\n",
                          title);

  for (const auto &[name, display, link] : entries)
  {
    page += std::format("<li><a href=\"{}\">{}</a></li>\n",
                        html_escape(percent_encode(link)),
                        html_escape(display));
  }

  page += "</ul>\n<hr>\n</body>\n</html>\n";
  return page;
}

#ifndef BOOT_FILE_SERVER_STATIC_TEST
/**
 * @brief One client connection.
 * @tparam Stream beast::tcp_stream, or an ssl_stream over one.
 */
template <typename Stream>
class connection : public std::enable_shared_from_this<connection<Stream>> {
public:
  /** @brief Whether the stream is TLS. */
  static constexpr bool SECURE = !std::is_same_v<Stream, beast::tcp_stream>;

  /**
   * @brief Constructs a connection.
   * @param root The served root directory.
   * @param peer The peer address for the access log.
   * @param args Forwarded to the stream.
   */
  template <typename... Args>
  explicit connection(std::filesystem::path root, std::string peer,
                      Args &&...args)
      : root_{std::move(root)}, peer_{std::move(peer)},
        stream_(std::forward<Args>(args)...)
  {}

  auto run() -> void
  {
    if constexpr (SECURE)
    {
      beast::get_lowest_layer(stream_).expires_after(TIMEOUT);
      stream_.async_handshake(
          ssl::stream_base::server,
          beast::bind_front_handler(&connection::on_handshake,
                                    this->shared_from_this()));
    }
    else
    {
      do_read();
    }
  }

private:
  static constexpr std::string_view SCHEME = SECURE ? "HTTPS" : "HTTP";

  std::filesystem::path root_;
  std::string peer_;
  Stream stream_;
  beast::flat_buffer buffer_;
  web::request<web::string_body> req_;
  std::shared_ptr<void> res_;

  auto on_handshake(beast::error_code error) -> void
  {
    if (error)
    {
      spdlog::debug("{}:{}:{}", SCHEME, peer_, error.message());
      return;
    }

    do_read();
  }

  auto do_read() -> void
  {
    req_ = {};
    beast::get_lowest_layer(stream_).expires_after(TIMEOUT);
    web::async_read(stream_, buffer_, req_,
                    beast::bind_front_handler(&connection::on_read,
                                              this->shared_from_this()));
  }

  auto on_read(beast::error_code error, std::size_t) -> void
  {
    if (error == web::error::end_of_stream)
      return do_close();

    if (error)
    {
      spdlog::debug("{}:{}:{}", SCHEME, peer_, error.message());
      return;
    }

    handle_request();
  }

  auto on_write(bool close, beast::error_code error, std::size_t) -> void
  {
    if (error)
    {
      spdlog::debug("{}:{}:{}", SCHEME, peer_, error.message());
      return;
    }

    if (close)
      return do_close();

    res_ = nullptr;
    do_read();
  }

  auto do_close() -> void
  {
    if constexpr (SECURE)
    {
      beast::get_lowest_layer(stream_).expires_after(TIMEOUT);
      stream_.async_shutdown(beast::bind_front_handler(
          &connection::on_shutdown, this->shared_from_this()));
    }
    else
    {
      auto error = beast::error_code();
      stream_.socket().shutdown(tcp::socket::shutdown_send, error);
    }
  }

  auto on_shutdown(beast::error_code) -> void {}

  template <typename Body> auto send(web::response<Body> &&msg) -> void
  {
    const auto method = req_.method_string();
    const auto target = req_.target();
    spdlog::info("{}:{}:\"{} {}\" {}", SCHEME, peer_,
                 std::string_view(method.data(), method.size()),
                 std::string_view(target.data(), target.size()),
                 msg.result_int());

    auto res = std::make_shared<web::response<Body>>(std::move(msg));
    res_ = res;
    web::async_write(stream_, *res,
                     beast::bind_front_handler(&connection::on_write,
                                               this->shared_from_this(),
                                               res->need_eof()));
  }

  template <typename Body>
  auto prepare(web::response<Body> &res,
               std::string_view content_type) const -> void
  {
    res.set(web::field::server, SERVER_NAME);
    res.set(web::field::content_type, std::string(content_type));
    res.keep_alive(req_.keep_alive());
  }

  /** @brief Sends an in-memory body, or just its headers for HEAD. */
  auto send_text(web::status status, std::string_view content_type,
                 std::string body) -> void
  {
    if (req_.method() == web::verb::head)
    {
      auto res = web::response<web::empty_body>{status, req_.version()};
      prepare(res, content_type);
      res.content_length(body.size());
      return send(std::move(res));
    }

    auto res = web::response<web::string_body>{status, req_.version()};
    prepare(res, content_type);
    res.body() = std::move(body);
    res.prepare_payload();
    send(std::move(res));
  }

  auto send_error(web::status status) -> void
  {
    const auto reason = web::obsolete_reason(status);
    send_text(status, "text/html; charset=utf-8",
              std::format("<!DOCTYPE HTML>\n"
                          "<html lang=\"en\">\n"
                          "<head><title>{0} {1}</title></head>\n"
                          "<body><h1>{0} {1}</h1></body>\n"
                          "</html>\n",
                          static_cast<unsigned>(status),
                          std::string_view(reason.data(), reason.size())));
  }

  auto send_file(const std::filesystem::path &file) -> void
  {
    auto error = beast::error_code();
    auto body = web::file_body::value_type();
    body.open(file.c_str(), beast::file_mode::scan, error);
    if (error)
      return send_error(web::status::not_found);

    const auto size = body.size();
    if (req_.method() == web::verb::head)
    {
      auto res = web::response<web::empty_body>{web::status::ok, req_.version()};
      prepare(res, mime_type(file));
      res.content_length(size);
      return send(std::move(res));
    }

    auto res = web::response<web::file_body>{
        std::piecewise_construct, std::make_tuple(std::move(body)),
        std::make_tuple(web::status::ok, req_.version())};
    prepare(res, mime_type(file));
    res.content_length(size);
    send(std::move(res));
  }

  auto handle_request() -> void
  {
    if (req_.method() != web::verb::get && req_.method() != web::verb::head)
      return send_error(web::status::method_not_allowed);

    const auto raw = std::string_view(req_.target().data(),
                                      req_.target().size());
    const auto path = url_path(raw);

    auto err = std::error_code();
    auto resolved = filesystem::resolve(root_, path, err);
    if (err)
      return send_error(web::status::not_found);

    if (std::filesystem::is_directory(resolved, err))
    {
      if (path.empty() || path.back() != '/')
      {
        const auto split = std::min(raw.find('?'), raw.size());
        auto location = std::string(raw.substr(0, split));
        location += '/';
        location += raw.substr(split);

        auto res = web::response<web::string_body>{
            web::status::moved_permanently, req_.version()};
        prepare(res, "text/html; charset=utf-8");
        res.set(web::field::location, location);
        res.prepare_payload();
        return send(std::move(res));
      }

      for (const auto *index : {"index.html", "index.htm"})
      {
        if (std::filesystem::is_regular_file(resolved / index, err))
          return send_file(resolved / index);
      }

      auto page = directory_listing(resolved, path);
      if (!page)
        return send_error(web::status::not_found);

      return send_text(web::status::ok, "text/html; charset=utf-8",
                       std::move(*page));
    }

    if (!std::filesystem::is_regular_file(resolved, err))
      return send_error(web::status::not_found);

    send_file(resolved);
  }
};

/** @brief The running state of a file server. */
struct file_server::context {
  std::filesystem::path root;
  std::string_view scheme = "HTTP";
  std::optional<ssl::context> tls;
  asio::io_context ioc{1};
  tcp::acceptor acceptor{ioc};
  std::thread thread;

  auto accept() -> void
  {
    acceptor.async_accept([this](beast::error_code error, tcp::socket socket) {
      if (error == asio::error::operation_aborted)
        return;

      if (error)
      {
        spdlog::warn("{}:accept:{}", scheme, error.message());
        return accept();
      }

      auto endpoint = socket.remote_endpoint(error);
      auto peer = std::format("{}:{}", endpoint.address().to_string(),
                              endpoint.port());

      if (tls)
      {
        using stream_type = beast::ssl_stream<beast::tcp_stream>;
        std::make_shared<connection<stream_type>>(root, std::move(peer),
                                                  std::move(socket), *tls)
            ->run();
      }
      else
      {
        std::make_shared<connection<beast::tcp_stream>>(
            root, std::move(peer), std::move(socket))
            ->run();
      }

      accept();
    });
  }

  auto run() -> void
  {
    for (;;)
    {
      try
      {
        ioc.run();
        return;
      }
      catch (const std::exception &exc)
      {
        spdlog::error("{}:{}", scheme, exc.what());
      }
    }
  }
};

file_server::file_server(const std::filesystem::path &root,
                         std::optional<certificate> tls)
    : root_{filesystem::root_directory(root)}, tls_{std::move(tls)}
{}

file_server::~file_server()
{
  try
  {
    stop();
  }
  catch (const std::exception &exc)
  {
    spdlog::error("{} server failed to stop: {}", secure() ? "HTTPS" : "HTTP",
                  exc.what());
  }
}

auto file_server::start(std::string_view host,
                        std::uint16_t port) -> std::uint16_t
{
  auto lock = std::lock_guard{mtx_};
  if (port_)
    return *port_;

  auto ctx = std::make_unique<context>();
  ctx->root = root_;
  if (tls_)
  {
    if (!tls_->certfile || !tls_->keyfile)
    {
      throw configuration_error(
          "Both a certificate file and a key file are required for HTTPS.");
    }

    ctx->scheme = "HTTPS";
    auto &tls = ctx->tls.emplace(ssl::context::tls_server);
    tls.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                    ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                    ssl::context::no_tlsv1_1 | ssl::context::single_dh_use);
    tls.use_certificate_chain_file(tls_->certfile->string());
    tls.use_private_key_file(tls_->keyfile->string(), ssl::context::pem);
  }

  const auto node = host.empty() ? std::string("0.0.0.0") : std::string(host);
  auto resolver = tcp::resolver(ctx->ioc);
  auto endpoints =
      resolver.resolve(node, std::to_string(port), tcp::resolver::passive);
  const auto endpoint = endpoints.begin()->endpoint();

  auto &acceptor = ctx->acceptor;
  acceptor.open(endpoint.protocol());
  acceptor.set_option(asio::socket_base::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen(asio::socket_base::max_listen_connections);
  const auto bound = acceptor.local_endpoint().port();

  ctx->accept();
  ctx->thread = std::thread([&server = *ctx] { server.run(); });

  spdlog::info("{} server serving {} on {}:{}.", ctx->scheme, root_.c_str(),
               node, bound);
  ctx_ = std::move(ctx);
  port_ = bound;
  return bound;
}

auto file_server::stop() -> void
{
  auto lock = std::lock_guard{mtx_};
  if (!ctx_)
    return;

  ctx_->ioc.stop();
  if (ctx_->thread.joinable())
    ctx_->thread.join();

  spdlog::info("{} server on port {} stopped.", ctx_->scheme,
               port_.value_or(0));
  ctx_.reset();
  port_.reset();
}

auto file_server::port() const -> std::optional<std::uint16_t>
{
  auto lock = std::lock_guard{mtx_};
  return port_;
}
#endif // BOOT_FILE_SERVER_STATIC_TEST
} // namespace boot::http
