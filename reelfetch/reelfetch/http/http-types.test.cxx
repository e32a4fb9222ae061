#include <reelfetch/http/http-types.hxx>
#include <reelfetch/http/http-url.hxx>

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace reelfetch;

static void
test_headers ()
{
  http_headers h {{"Accept", "*/*"}, {"X-Token", "a"}};

  assert (h.get ("accept") == "*/*");
  assert (h.contains ("X-TOKEN"));
  assert (!h.get ("Range"));

  // Set replaces regardless of case and keeps the rest in order.
  //
  h.set ("x-token", "b");
  assert (h.size () == 2);
  assert (h.fields[0].name == "Accept");
  assert (h.fields[1].name == "x-token" && h.fields[1].value == "b");

  h.add ("Cookie", "1");
  h.add ("cookie", "2");
  assert (h.size () == 4);

  h.merge (http_headers {{"COOKIE", "3"}, {"User-Agent", "x"}});
  assert (h.size () == 4);
  assert (h.get ("cookie") == "3");
  assert (h.get ("user-agent") == "x");

  h.remove ("Accept");
  assert (!h.contains ("accept"));
}

static void
test_field ()
{
  http_field f (parse_http_field ("Authorization:  Bearer t "));
  assert (f.name == "Authorization" && f.value == "Bearer t");

  f = parse_http_field ("X-Empty:");
  assert (f.name == "X-Empty" && f.value.empty ());

  f = parse_http_field ("X-Url: http://h:80/p");
  assert (f.value == "http://h:80/p");

  for (const char* s: {"no colon", ": value", "  : v"})
  {
    try
    {
      parse_http_field (s);
      assert (false);
    }
    catch (const invalid_argument&)
    {
    }
  }
}

static void
test_status ()
{
  assert (http_status_error (404).what () == string ("HTTP 404 (Not Found)"));
  assert (http_status_error (503).status () == 503);
  assert (http_status_error (599).what () == string ("HTTP 599"));
  assert (http_reason (200) == "OK");
  assert (http_reason (799).empty ());
}

static void
test_url ()
{
  url_parts u (parse_url ("https://media.example.com/a/b?x=1"));
  assert (u.secure ());
  assert (u.host == "media.example.com" && u.port == "443");
  assert (u.target == "/a/b?x=1");
  assert (u.origin () == "https://media.example.com");

  u = parse_url ("127.0.0.1:8080");
  assert (u.scheme == "http" && u.port == "8080" && u.target == "/");
  assert (u.origin () == "http://127.0.0.1:8080");

  u = parse_url ("http://h?q");
  assert (u.target == "/?q");

  u = parse_url ("HTTPS://h:8443/x");
  assert (u.scheme == "https" && u.authority () == "h:8443");
  assert (parse_url ("http://h/").authority () == "h");
  assert (parse_url ("https://h:443/").authority () == "h");

  for (const char* s: {"http:///path", "ftp://h/file", "file://h/x"})
  {
    try
    {
      parse_url (s);
      assert (false);
    }
    catch (const invalid_argument&)
    {
    }
  }

  auto same ([] (const char* x, const char* y)
  {
    return same_origin (parse_url (x), parse_url (y));
  });

  assert (same ("http://H:81/a", "http://h:81/b"));
  assert (same ("http://h/a", "http://h:80/b"));
  assert (!same ("http://h/a", "https://h/a"));
  assert (!same ("http://h:81/", "http://h:82/"));
  assert (!same ("http://h/", "http://cdn/"));

  url_parts b (parse_url ("http://h:81/dir/file?x"));
  assert (resolve_location (b, "https://o/p") == "https://o/p");
  assert (resolve_location (b, "//o/p") == "http://o/p");
  assert (resolve_location (b, "/p") == "http://h:81/p");
  assert (resolve_location (b, "other") == "http://h:81/dir/other");

  assert (http_url ("http://h") && http_url ("https://h"));
  assert (!http_url ("catalog.json") && !http_url ("ftp://h"));
}

int
main ()
{
  test_headers ();
  test_field ();
  test_status ();
  test_url ();
}
