#include <chrono>
#include <limits>
#include <fstream>
#include <stdexcept>

#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace reelfetch
{
  // Arm the stream's timer, or disarm it if the timeout is 0.
  //
  template <typename L>
  inline void
  http_expire (L& l, std::uint32_t ms)
  {
    if (ms != 0)
      l.expires_after (std::chrono::milliseconds (ms));
    else
      l.expires_never ();
  }

  // As above but never past the deadline. If the deadline has already
  // passed, fail right away the same way the stream timer would.
  //
  template <typename L>
  inline void
  http_expire (L& l,
               std::uint32_t ms,
               std::chrono::steady_clock::time_point deadline)
  {
    using namespace std::chrono;

    if (deadline == steady_clock::time_point::max ())
    {
      http_expire (l, ms);
      return;
    }

    auto now (steady_clock::now ());

    if (now >= deadline)
      throw beast::system_error (
        beast::error_code (beast::error::timeout));

    auto t (ms != 0 ? now + milliseconds (ms) : deadline);
    l.expires_at (t < deadline ? t : deadline);
  }

  template <typename T>
  template <typename R, typename F>
  asio::awaitable<R> basic_http_client<T>::
  exchange (const url_parts& u, time_point deadline, F f)
  {
    using tcp = asio::ip::tcp;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (u.host,
                                             u.port,
                                             asio::use_awaitable));

    if (u.secure ())
    {
      beast::ssl_stream<beast::tcp_stream> s (ctx, session_->ssl_context ());

      // Set the SNI hostname, otherwise many servers (Cloudflare and the
      // like) will reject the handshake. Beast doesn't wrap this so we go
      // down to the OpenSSL C API.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      if (tr.verify_ssl)
        s.set_verify_callback (ssl::host_name_verification (u.host));

      auto& layer (beast::get_lowest_layer (s));

      // The connect timeout covers the handshake as well.
      //
      http_expire (layer, tr.connect_timeout, deadline);
      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      R r (co_await f (s));

      // Don't wait for the SSL shutdown: many servers never send
      // close_notify and we would block until the timeout.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
    else
    {
      beast::tcp_stream s (ctx);

      http_expire (s, tr.connect_timeout, deadline);
      co_await s.async_connect (addrs, asio::use_awaitable);

      R r (co_await f (s));

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get_impl (const string_type& url,
            const headers_type& headers,
            std::uint8_t redirect_count)
  {
    namespace http = beast::http;

    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    url_parts u (parse_url (url));
    auto req (make_request (u, headers));

    response_type r (
      co_await exchange<response_type> (
        u,
        time_point::max (),
        [&tr, &req] (auto& s) -> asio::awaitable<response_type>
        {
          auto& layer (beast::get_lowest_layer (s));

          http_expire (layer, tr.request_timeout);
          co_await http::async_write (s, req, asio::use_awaitable);

          beast::flat_buffer b;
          http::response_parser<http::string_body> p;
          p.body_limit (std::numeric_limits<std::uint64_t>::max ());

          co_await http::async_read (s, b, p, asio::use_awaitable);

          auto m (p.release ());

          response_type res;
          res.status = m.result_int ();
          res.reason = string_type (m.reason ());

          for (const auto& h: m)
            res.headers.add (string_type (h.name_string ()),
                             string_type (h.value ()));

          res.body = std::move (m.body ());
          co_return res;
        }));

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto l = r.location ())
      {
        string_type n (resolve_location (u, *l));
        headers_type hs (redirect_headers (u, parse_url (n), headers));

        co_return co_await get_impl (n, hs, redirect_count + 1);
      }
    }

    co_return r;
  }

  // Streaming download.
  //
  // Unlike get() which buffers the whole response in memory, here the body
  // goes through a fixed buffer straight into the file. The file is only
  // opened once we know the server is going to send us the resource.
  //
  template <typename T>
  asio::awaitable<std::uint64_t>
  basic_http_client<T>::
  download_impl (const string_type& url,
                 const headers_type& headers,
                 const std::filesystem::path& file,
                 const progress_callback& progress,
                 time_point deadline,
                 std::uint8_t redirect_count)
  {
    namespace http = beast::http;
    using parser_type = http::response_parser<http::buffer_body>;

    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    url_parts u (parse_url (url));
    auto req (make_request (u, headers));

    // Either the number of bytes written or the place to go next.
    //
    struct step
    {
      std::uint64_t bytes {0};
      std::optional<string_type> location;
    };

    step r (
      co_await exchange<step> (
        u,
        deadline,
        [&] (auto& s) -> asio::awaitable<step>
        {
          auto& layer (beast::get_lowest_layer (s));

          http_expire (layer, tr.request_timeout, deadline);
          co_await http::async_write (s, req, asio::use_awaitable);

          beast::flat_buffer b;
          parser_type p;
          p.body_limit (std::numeric_limits<std::uint64_t>::max ());

          http_expire (layer, tr.request_timeout, deadline);
          co_await http::async_read_header (s, b, p, asio::use_awaitable);

          unsigned int st (p.get ().result_int ());

          if (tr.follow_redirects && st >= 300 && st < 400)
          {
            auto l (p.get ()[http::field::location]);
            if (!l.empty ())
              co_return step {0, resolve_location (u, string_type (l))};
          }

          if (st < 200 || st >= 300)
            throw http_status_error (st);

          std::ofstream ofs (file, std::ios::binary | std::ios::trunc);
          if (!ofs)
            throw std::runtime_error ("unable to open " + file.string () +
                                      " for writing");

          std::uint64_t tot (p.content_length () ? *p.content_length () : 0);
          std::uint64_t off (0);

          char dbuf[8192];

          while (!p.is_done ())
          {
            p.get ().body ().data = dbuf;
            p.get ().body ().size = sizeof (dbuf);

            // Reset the timeout before every read so that it only fires if
            // the data stops flowing, not because the file is large. Unless,
            // that is, the overall deadline comes first.
            //
            http_expire (layer, tr.request_timeout, deadline);

            beast::error_code ec;
            co_await http::async_read_some (
              s, b, p, asio::redirect_error (asio::use_awaitable, ec));

            // The parser reports need_buffer once our buffer is full, which
            // is exactly what we want.
            //
            if (ec == http::error::need_buffer)
              ec = {};

            if (ec)
              throw beast::system_error (ec);

            // Note that the number of bytes consumed from the stream includes
            // the chunked encoding framing so we work out the payload size
            // from what is left of the buffer.
            //
            std::size_t n (sizeof (dbuf) - p.get ().body ().size);

            if (n > 0)
            {
              ofs.write (dbuf, static_cast<std::streamsize> (n));
              if (!ofs)
                throw std::runtime_error ("unable to write " +
                                          file.string ());

              off += n;

              if (progress)
                progress (off, tot);
            }
          }

          ofs.close ();
          if (!ofs)
            throw std::runtime_error ("unable to close " + file.string ());

          co_return step {off, std::nullopt};
        }));

    if (r.location)
    {
      headers_type hs (redirect_headers (u, parse_url (*r.location), headers));

      co_return co_await download_impl (*r.location,
                                        hs,
                                        file,
                                        progress,
                                        deadline,
                                        redirect_count + 1);
    }

    co_return r.bytes;
  }
}
