#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <cstdint>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <reelfetch/http/http-url.hxx>
#include <reelfetch/http/http-types.hxx>
#include <reelfetch/http/http-response.hxx>

#include <reelfetch/version.hxx>

namespace reelfetch
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options/configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using headers_type  = basic_http_headers<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds (0 = no timeout). Also bounds the
    // TLS handshake.
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds (0 = no timeout). Re-armed before every
    // read so for downloads it acts as an idle timeout.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Whether to verify SSL certificates.
    //
    bool verify_ssl = true;

    // SSL certificate file path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("reelfetch/" REELFETCH_VERSION_STR);

    bool follow_redirects = true;
  };

  // HTTP client session context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Every operation opens its own connection so that any number of them can
  // be in flight on the same client concurrently.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using headers_type  = typename traits_type::headers_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    // Progress callback: (bytes_transferred, total_bytes). The total is 0 if
    // the server did not declare the length.
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    using time_point = std::chrono::steady_clock::time_point;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a GET request and buffer the whole response. Redirects are
    // followed. Non-success statuses are returned, not thrown.
    //
    asio::awaitable<response_type>
    get (const string_type& url, const headers_type& headers = {});

    // Stream the resource into the file, following redirects.
    //
    // Throw http_status_error if the final status is not 2xx, in which case
    // the file is never opened. The file is truncated if it exists. If the
    // deadline passes at any point (connect and handshake included), fail
    // with beast::error::timeout just like for the idle timeout. Return the
    // number of bytes written.
    //
    asio::awaitable<std::uint64_t>
    download (const string_type& url,
              const headers_type& headers,
              const std::filesystem::path& file,
              progress_callback progress = nullptr,
              time_point deadline = time_point::max ());

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    get_impl (const string_type& url,
              const headers_type& headers,
              std::uint8_t redirect_count);

    asio::awaitable<std::uint64_t>
    download_impl (const string_type& url,
                   const headers_type& headers,
                   const std::filesystem::path& file,
                   const progress_callback& progress,
                   time_point deadline,
                   std::uint8_t redirect_count);

    // Connect to the URL's host (performing the TLS handshake for https) and
    // run the exchange function on the resulting stream. Neither the connect
    // nor the handshake may run past the deadline.
    //
    template <typename R, typename F>
    asio::awaitable<R>
    exchange (const url_parts& url, time_point deadline, F f);

    // Return the headers to send to the redirect target. The caller's fields
    // may carry credentials so they only follow redirects within the same
    // origin.
    //
    static headers_type
    redirect_headers (const url_parts& from,
                      const url_parts& to,
                      const headers_type& headers);

    // Build the request head: our defaults first, then the caller's fields
    // which replace them on name clash.
    //
    beast::http::request<beast::http::empty_body>
    make_request (const url_parts&, const headers_type&) const;

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <reelfetch/http/http-client.ixx>
#include <reelfetch/http/http-client.txx>
