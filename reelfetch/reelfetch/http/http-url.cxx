#include <reelfetch/http/http-url.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace reelfetch
{
  string url_parts::
  origin () const
  {
    return scheme + "://" + authority ();
  }

  string url_parts::
  authority () const
  {
    string r (host);

    if (!((scheme == "https" && port == "443") ||
          (scheme == "http"  && port == "80")))
      r += ':' + port;

    return r;
  }

  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return s;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Scheme.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = lower (url.substr (0, p));
      pos = p + 3;

      if (r.scheme != "http" && r.scheme != "https")
        throw invalid_argument ("unsupported URL scheme in '" + url + "'");
    }
    else
      r.scheme = "http";

    // Authority ends at the first slash, query, or the end of the string.
    //
    size_t end (url.find_first_of ("/?", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.secure () ? "443" : "80";
    }

    if (r.host.empty () || r.port.empty ())
      throw invalid_argument ("invalid URL '" + url + "'");

    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_location (const url_parts& b, const string& l)
  {
    if (l.find ("://") != string::npos)
      return l;

    if (!l.empty () && l[0] == '/')
    {
      // Protocol-relative (//host/path).
      //
      if (l.size () > 1 && l[1] == '/')
        return b.scheme + ':' + l;

      return b.origin () + l;
    }

    string d (b.target.substr (0, b.target.find ('?')));
    d.erase (d.rfind ('/') + 1);

    return b.origin () + d + l;
  }

  bool
  same_origin (const url_parts& x, const url_parts& y)
  {
    return x.scheme == y.scheme &&
           x.port == y.port &&
           lower (x.host) == lower (y.host);
  }

  bool
  http_url (const string& s)
  {
    return s.compare (0, 7, "http://") == 0 ||
           s.compare (0, 8, "https://") == 0;
  }
}
