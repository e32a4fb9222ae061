#include <charconv>

namespace reelfetch
{
  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  content_length () const
  {
    auto v (headers.get (string_type ("Content-Length")));

    if (!v)
      return std::nullopt;

    // Note that we use std::from_chars for locale-independent parsing.
    //
    std::uint64_t n (0);
    auto r (std::from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec == std::errc () && r.ptr == v->data () + v->size ())
      return n;

    return std::nullopt;
  }
}
