#include <cctype>
#include <algorithm>

namespace reelfetch
{
  template <typename S>
  inline bool
  http_field_name_equal (const S& x, const S& y)
  {
    if (x.size () != y.size ())
      return false;

    for (std::size_t i (0); i < x.size (); ++i)
    {
      if (std::tolower (static_cast<unsigned char> (x[i])) !=
          std::tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type name, string_type value)
  {
    remove (name);
    fields.push_back (field_type (std::move (name), std::move (value)));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type name, string_type value)
  {
    fields.push_back (field_type (std::move (name), std::move (value)));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  merge (const basic_http_headers& o)
  {
    for (const field_type& f: o.fields)
      set (f.name, f.value);
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& name) const
  {
    auto i (std::find_if (fields.begin (), fields.end (),
                          [&name] (const field_type& f)
                          {
                            return http_field_name_equal (f.name, name);
                          }));

    return i != fields.end () ? std::optional<string_type> (i->value)
                              : std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& name)
  {
    fields.erase (
      std::remove_if (fields.begin (), fields.end (),
                      [&name] (const field_type& f)
                      {
                        return http_field_name_equal (f.name, name);
                      }),
      fields.end ());
  }
}
