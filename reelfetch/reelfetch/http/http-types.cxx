#include <reelfetch/http/http-types.hxx>

#include <boost/beast/http/status.hpp>

using namespace std;

namespace reelfetch
{
  namespace http = boost::beast::http;

  static string
  trim (const string& s)
  {
    size_t b (s.find_first_not_of (" \t"));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (" \t"));
    return s.substr (b, e - b + 1);
  }

  http_field
  parse_http_field (const string& s)
  {
    size_t p (s.find (':'));
    string n (trim (s.substr (0, p)));

    if (p == string::npos || n.empty ())
      throw invalid_argument ("invalid header '" + s + "': expected "
                              "'<name>: <value>'");

    return http_field (move (n), trim (s.substr (p + 1)));
  }

  string
  http_reason (unsigned int s)
  {
    // Beast maps unknown codes to unknown and returns the "<unknown-status>"
    // placeholder for it, which we don't want to show.
    //
    if (http::int_to_status (s) == http::status::unknown)
      return string ();

    return string (http::obsolete_reason (http::int_to_status (s)));
  }

  static string
  status_message (unsigned int s)
  {
    string r ("HTTP " + std::to_string (s));
    string p (http_reason (s));

    if (!p.empty ())
      r += " (" + p + ')';

    return r;
  }

  http_status_error::
  http_status_error (unsigned int s)
    : runtime_error (status_message (s)), status_ (s)
  {
  }
}
