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
#include "boot/http/file_server.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
namespace web = boost::beast::http;
using tcp = boost::asio::ip::tcp;

using namespace boot::http;

static inline auto test_counter = std::atomic<std::uint16_t>();

using response = web::response<web::string_body>;

template <typename Stream>
static auto exchange(Stream &stream, web::verb method,
                     const std::string &target) -> response
{
  auto req = web::request<web::string_body>{method, target, 11};
  req.set(web::field::host, "127.0.0.1");
  req.set(web::field::user_agent, "bootd-test");
  web::write(stream, req);

  auto buffer = beast::flat_buffer();
  auto parser = web::response_parser<web::string_body>();
  parser.skip(method == web::verb::head);
  web::read(stream, buffer, parser);
  return parser.release();
}

static auto fetch(std::uint16_t port, web::verb method,
                  const std::string &target) -> response
{
  auto ioc = asio::io_context();
  auto stream = beast::tcp_stream(ioc);
  stream.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));

  auto res = exchange(stream, method, target);

  auto error = beast::error_code();
  stream.socket().shutdown(tcp::socket::shutdown_both, error);
  return res;
}

static auto fetch_tls(std::uint16_t port, web::verb method,
                      const std::string &target) -> response
{
  auto ioc = asio::io_context();
  auto tls = ssl::context(ssl::context::tls_client);
  tls.set_verify_mode(ssl::verify_none);

  auto stream = beast::ssl_stream<beast::tcp_stream>(ioc, tls);
  beast::get_lowest_layer(stream).connect(
      tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  stream.handshake(ssl::stream_base::client);

  auto res = exchange(stream, method, target);

  auto error = beast::error_code();
  stream.shutdown(error);
  return res;
}

static auto field(const response &res, web::field name) -> std::string
{
  const auto value = res[name];
  return {value.data(), value.size()};
}

// Writes a self-signed localhost certificate and its key.
static auto make_certificate(const std::filesystem::path &certfile,
                             const std::filesystem::path &keyfile) -> void
{
  auto pkey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>(
      EVP_RSA_gen(2048), &EVP_PKEY_free);
  ASSERT_TRUE(pkey);

  auto x509 =
      std::unique_ptr<X509, decltype(&X509_free)>(X509_new(), &X509_free);
  ASSERT_TRUE(x509);

  ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
  X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(x509.get()), 3600);
  X509_set_pubkey(x509.get(), pkey.get());

  auto *name = X509_get_subject_name(x509.get());
  X509_NAME_add_entry_by_txt(
      name, "CN", MBSTRING_ASC,
      reinterpret_cast<const unsigned char *>("localhost"), -1, -1, 0);
  X509_set_issuer_name(x509.get(), name);
  ASSERT_GT(X509_sign(x509.get(), pkey.get(), EVP_sha256()), 0);

  auto close = [](std::FILE *file) { std::fclose(file); };
  {
    auto file = std::unique_ptr<std::FILE, decltype(close)>(
        std::fopen(certfile.c_str(), "w"), close);
    ASSERT_TRUE(file);
    ASSERT_EQ(PEM_write_X509(file.get(), x509.get()), 1);
  }
  {
    auto file = std::unique_ptr<std::FILE, decltype(close)>(
        std::fopen(keyfile.c_str(), "w"), close);
    ASSERT_TRUE(file);
    ASSERT_EQ(PEM_write_PrivateKey(file.get(), pkey.get(), nullptr, nullptr,
                                   0, nullptr, nullptr),
              1);
  }
}

class FileServerTests : public ::testing::Test {
protected:
  auto SetUp() -> void override
  {
    root = (std::filesystem::temp_directory_path() / "bootd.http.")
               .concat(std::format("{:05d}", test_counter++));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "images");
    std::filesystem::create_directories(root / "docs");

    write(root / "boot.ipxe", "#!ipxe\nchain http://boot/menu\n");
    write(root / "images" / "vmlinuz", std::string(3000, 'K'));
    write(root / "docs" / "index.html", "<p>docs</p>");
    write(root / "a b.txt", "spaced");

    server_ = std::make_unique<file_server>(root);
    port = server_->start("127.0.0.1", 0);
    ASSERT_NE(port, 0);
  }

  auto TearDown() -> void override
  {
    server_->stop();
    server_.reset();
    std::filesystem::remove_all(root);
  }

  static auto write(const std::filesystem::path &path,
                    const std::string &content) -> void
  {
    std::ofstream(path, std::ios::binary) << content;
  }

  std::filesystem::path root;
  std::unique_ptr<file_server> server_;
  std::uint16_t port = 0;
};

TEST_F(FileServerTests, TestGetFile)
{
  auto res = fetch(port, web::verb::get, "/boot.ipxe");

  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(res.body(), "#!ipxe\nchain http://boot/menu\n");
  EXPECT_EQ(field(res, web::field::content_type), "text/plain");
  EXPECT_EQ(field(res, web::field::server), "bootd");
}

TEST_F(FileServerTests, TestGetBinaryFile)
{
  auto res = fetch(port, web::verb::get, "/images/vmlinuz");

  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(res.body(), std::string(3000, 'K'));
  EXPECT_EQ(field(res, web::field::content_type), "application/octet-stream");
}

TEST_F(FileServerTests, TestHeadFile)
{
  auto res = fetch(port, web::verb::head, "/images/vmlinuz");

  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(field(res, web::field::content_length), "3000");
  EXPECT_TRUE(res.body().empty());
}

TEST_F(FileServerTests, TestPercentEncodedName)
{
  auto res = fetch(port, web::verb::get, "/a%20b.txt?download=1");

  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(res.body(), "spaced");
}

TEST_F(FileServerTests, TestNotFound)
{
  auto res = fetch(port, web::verb::get, "/missing.bin");

  EXPECT_EQ(res.result_int(), 404);
  EXPECT_NE(res.body().find("404 Not Found"), std::string::npos);
}

TEST_F(FileServerTests, TestTraversalIsNotFound)
{
  write(root.parent_path() / "bootd.http.secret", "secret");

  EXPECT_EQ(fetch(port, web::verb::get, "/../bootd.http.secret").result_int(),
            404);
  EXPECT_EQ(
      fetch(port, web::verb::get, "/%2e%2e/bootd.http.secret").result_int(),
      404);
  EXPECT_EQ(fetch(port, web::verb::get, "/images/../../bootd.http.secret")
                .result_int(),
            404);

  std::filesystem::remove(root.parent_path() / "bootd.http.secret");
}

TEST_F(FileServerTests, TestDirectoryListing)
{
  auto res = fetch(port, web::verb::get, "/");

  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(field(res, web::field::content_type), "text/html; charset=utf-8");
  EXPECT_NE(res.body().find("Directory listing for /"), std::string::npos);
  EXPECT_NE(res.body().find("<a href=\"images/\">images/</a>"),
            std::string::npos);
  EXPECT_NE(res.body().find("<a href=\"a%20b.txt\">a b.txt</a>"),
            std::string::npos);
}

TEST_F(FileServerTests, TestIndexPage)
{
  auto res = fetch(port, web::verb::get, "/docs/");

  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(res.body(), "<p>docs</p>");
  EXPECT_EQ(field(res, web::field::content_type), "text/html");
}

TEST_F(FileServerTests, TestDirectoryRedirect)
{
  auto res = fetch(port, web::verb::get, "/images?sort=name");

  EXPECT_EQ(res.result_int(), 301);
  EXPECT_EQ(field(res, web::field::location), "/images/?sort=name");
}

TEST_F(FileServerTests, TestMethodNotAllowed)
{
  EXPECT_EQ(fetch(port, web::verb::post, "/boot.ipxe").result_int(), 405);
  EXPECT_EQ(fetch(port, web::verb::put, "/boot.ipxe").result_int(), 405);
}

TEST_F(FileServerTests, TestKeepAlive)
{
  auto ioc = asio::io_context();
  auto stream = beast::tcp_stream(ioc);
  stream.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));

  EXPECT_EQ(exchange(stream, web::verb::get, "/boot.ipxe").result_int(), 200);
  EXPECT_EQ(exchange(stream, web::verb::get, "/missing").result_int(), 404);
  EXPECT_EQ(exchange(stream, web::verb::get, "/docs/").result_int(), 200);
}

TEST_F(FileServerTests, TestStartIsIdempotent)
{
  EXPECT_EQ(server_->start("127.0.0.1", 0), port);
  EXPECT_EQ(server_->port(), port);
  EXPECT_FALSE(server_->secure());
}

TEST_F(FileServerTests, TestStopAndRestart)
{
  server_->stop();
  server_->stop();
  EXPECT_FALSE(server_->port());

  port = server_->start("127.0.0.1", 0);
  EXPECT_EQ(fetch(port, web::verb::get, "/boot.ipxe").result_int(), 200);
}

TEST_F(FileServerTests, TestHttps)
{
  const auto certfile = root.parent_path() / (root.filename().string() + ".crt");
  const auto keyfile = root.parent_path() / (root.filename().string() + ".key");
  make_certificate(certfile, keyfile);

  auto https = file_server(
      root, file_server::certificate{.certfile = certfile, .keyfile = keyfile});
  EXPECT_TRUE(https.secure());

  const auto tls_port = https.start("127.0.0.1", 0);
  auto res = fetch_tls(tls_port, web::verb::get, "/boot.ipxe");
  EXPECT_EQ(res.result_int(), 200);
  EXPECT_EQ(res.body(), "#!ipxe\nchain http://boot/menu\n");

  EXPECT_EQ(fetch_tls(tls_port, web::verb::get, "/missing").result_int(), 404);
  https.stop();

  std::filesystem::remove(certfile);
  std::filesystem::remove(keyfile);
}

TEST_F(FileServerTests, TestHttpsRequiresKey)
{
  auto https = file_server(
      root, file_server::certificate{.certfile = root / "cert.pem"});

  EXPECT_THROW(https.start("127.0.0.1", 0), boot::configuration_error);
  EXPECT_FALSE(https.port());
}

TEST_F(FileServerTests, TestHttpsUnreadableCertificate)
{
  auto https =
      file_server(root, file_server::certificate{.certfile = root / "none.pem",
                                                 .keyfile = root / "none.key"});

  EXPECT_THROW(https.start("127.0.0.1", 0), boost::system::system_error);
  EXPECT_FALSE(https.port());
}

TEST_F(FileServerTests, TestAddressInUse)
{
  auto other = file_server(root);

  EXPECT_THROW(other.start("127.0.0.1", port), boost::system::system_error);
  EXPECT_FALSE(other.port());
}
// NOLINTEND
