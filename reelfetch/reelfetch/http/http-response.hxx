#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <reelfetch/http/http-types.hxx>

namespace reelfetch
{
  // Buffered HTTP response.
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    unsigned int status {0};
    string_type  reason;
    headers_type headers;
    string_type  body;

    basic_http_response () = default;

    basic_http_response (unsigned int s, string_type b)
      : status (s), body (std::move (b)) {}

    bool
    is_success () const noexcept
    {
      return status >= 200 && status < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status >= 300 && status < 400;
    }

    std::optional<string_type>
    location () const
    {
      return headers.get (string_type ("Location"));
    }

    // Return the Content-Length value if present and valid.
    //
    std::optional<std::uint64_t>
    content_length () const;
  };

  using http_response = basic_http_response<std::string>;
}

#include <reelfetch/http/http-response.ixx>
