#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <initializer_list>
#include <stdexcept>

namespace reelfetch
{
  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection.
  //
  // Field names are compared case-insensitively. The insertion order is
  // preserved, which is also the order in which fields are sent.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    basic_http_headers (std::initializer_list<field_type> f)
      : fields (f) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Set every field of the other collection, replacing ours.
    //
    void
    merge (const basic_http_headers&);

    // Get a header field value. Return nullopt if not found.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x, const basic_http_headers<S>& y)
  {
    return x.fields == y.fields;
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // Parse a "Name: value" header specification as given on the command
  // line. Throw std::invalid_argument if there is no name.
  //
  http_field
  parse_http_field (const std::string&);

  // Return the standard reason phrase for the status code or empty string
  // if the code is unknown.
  //
  std::string
  http_reason (unsigned int status);

  // Thrown when the server responds with a status that does not let the
  // operation proceed. The message has the "HTTP <code> (<reason>)" form.
  //
  class http_status_error: public std::runtime_error
  {
  public:
    explicit
    http_status_error (unsigned int status);

    unsigned int
    status () const noexcept
    {
      return status_;
    }

  private:
    unsigned int status_;
  };
}

#include <reelfetch/http/http-types.ixx>
