#include <openssl/err.h>
#include <openssl/ssl.h>

namespace reelfetch
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url, const headers_type& headers)
  {
    co_return co_await get_impl (url, headers, 0);
  }

  template <typename T>
  inline asio::awaitable<std::uint64_t>
  basic_http_client<T>::
  download (const string_type& url,
            const headers_type& headers,
            const std::filesystem::path& file,
            progress_callback progress,
            time_point deadline)
  {
    co_return co_await download_impl (url,
                                      headers,
                                      file,
                                      progress,
                                      deadline,
                                      0);
  }

  template <typename T>
  inline beast::http::request<beast::http::empty_body>
  basic_http_client<T>::
  make_request (const url_parts& u, const headers_type& hs) const
  {
    namespace http = beast::http;

    const auto& tr (session_->traits ());

    // Note that the Host header must come from the URL we are actually
    // talking to, which after a redirect need not be the original one.
    //
    http::request<http::empty_body> r (http::verb::get, u.target, 11);
    r.set (http::field::host, u.authority ());
    r.set (http::field::user_agent, tr.user_agent);

    for (const auto& h: hs)
    {
      if (!http_field_name_equal (h.name, string_type ("Host")))
        r.set (h.name, h.value);
    }

    return r;
  }

  template <typename T>
  inline typename basic_http_client<T>::headers_type basic_http_client<T>::
  redirect_headers (const url_parts& from,
                    const url_parts& to,
                    const headers_type& hs)
  {
    return same_origin (from, to) ? hs : headers_type ();
  }
}
