#pragma once

#include <string>
#include <ostream>

namespace reelfetch
{
  // URL components.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    secure () const
    {
      return scheme == "https";
    }

    // Return the scheme://host[:port] prefix, omitting the port if it is the
    // scheme default.
    //
    std::string
    origin () const;

    // Return host[:port] as sent in the Host header, again omitting the
    // default port.
    //
    std::string
    authority () const;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const url_parts& u)
  {
    return os << u.origin () << u.target;
  }

  // Parse a scheme://host[:port][/target] URL. The scheme defaults to http
  // and the target to "/".
  //
  // This is deliberately simple: IPv6 literals and user info are not
  // supported. Throw std::invalid_argument if the host is empty or the
  // scheme is anything other than http or https.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL it was received for.
  // Absolute URLs are returned as is, absolute paths are resolved against
  // the origin, and anything else against the directory of the target.
  //
  std::string
  resolve_location (const url_parts& base, const std::string& location);

  // Return true if both URLs have the same scheme, host, and port. Host
  // names are compared ignoring case.
  //
  bool
  same_origin (const url_parts&, const url_parts&);

  // Return true if the string looks like an http:// or https:// URL.
  //
  bool
  http_url (const std::string&);
}
