#include <reelfetch/metadata/metadata-catalog.hxx>
#include <reelfetch/http/http-server.test.hxx>

#include <cassert>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace reelfetch;
using namespace reelfetch::test;

namespace stdfs = std::filesystem;

static const char* const document (R"({
  "server": "https://media.example.com/",
  "headers": {"X-Api-User": "jane"},
  "assets": [
    {
      "id": "av-1", "parent": "SHOT010", "name": "comp", "version": 3,
      "type": "Comp",
      "components": [
        {"id": "c-1", "name": "ftrackreview-mp4", "file_type": "mp4",
         "size": 5242880, "url": "https://cdn.example.com/c-1"},
        {"id": "c-2", "name": "main", "file_type": ".mov",
         "size": 104857600},
        {"id": "c-3", "name": "thumbnail", "file_type": "jpg", "size": 2048},
        {"id": "c-4", "name": "plate", "file_type": "exr",
         "canonical": false}
      ]
    },
    {
      "id": "av-2", "parent": "SHOT020", "name": "render", "version": 1,
      "components": [
        {"id": "c-5", "name": "ftrackreview-mp4-1080", "file_type": "mp4",
         "canonical": true}
      ]
    }
  ]
})");

template <typename T>
static T
await (asio::io_context& ioc, asio::awaitable<T> a)
{
  optional<T> r;
  exception_ptr ep;

  asio::co_spawn (ioc,
                  move (a),
                  [&r, &ep, &ioc] (exception_ptr x, T v)
                  {
                    if (x)
                      ep = x;
                    else
                      r = move (v);

                    ioc.stop ();
                  });

  ioc.restart ();
  ioc.run ();

  if (ep)
    rethrow_exception (ep);

  return move (*r);
}

static void
test_parse ()
{
  json_metadata_source s (document);

  assert (s.server () == "https://media.example.com");
  assert (s.headers ().get ("x-api-user") == "jane");

  const vector<logical_asset>& as (s.assets ());
  assert (as.size () == 2);
  assert (as[0].id == "av-1" && as[0].parent == "SHOT010");
  assert (as[0].name == "comp" && as[0].version == 3 && as[0].type == "Comp");
  assert (as[1].type.empty ());

  const vector<candidate>& cs (s.candidates ("av-1"));
  assert (cs.size () == 4);
  assert (cs[0].asset_id == "av-1" && cs[0].size == 5242880);

  // Canonical inferred from the name and extension unless stated.
  //
  assert (!cs[0].canonical);   // Encode name.
  assert (cs[1].canonical);    // Motion extension.
  assert (!cs[2].canonical);   // Still image.
  assert (!cs[3].canonical);   // Explicit.
  assert (s.candidates ("av-2")[0].canonical);

  assert (cs[3].size == 0);
  assert (s.candidates ("av-9").empty ());
}

static void
test_locator ()
{
  json_metadata_source s (document);

  optional<download_locator> l (s.locator ("c-1"));
  assert (l && l->url == "https://cdn.example.com/c-1");
  assert (l->headers.get ("X-Api-User") == "jane");

  l = s.locator ("c-2");
  assert (l && l->url == "https://media.example.com/component/c-2/download");
  assert (l->headers.contains ("x-api-user"));

  assert (!s.locator ("c-9"));

  // Without a server only explicit URLs resolve.
  //
  json_metadata_source n (R"({"assets": [{"id": "a", "components": [
    {"id": "x", "url": "http://h/x"}, {"id": "y"}]}]})");

  assert (n.locator ("x") && n.locator ("x")->url == "http://h/x");
  assert (!n.locator ("y"));
}

static void
test_malformed ()
{
  auto fails = [] (const string& d)
  {
    try
    {
      json_metadata_source s (d);
    }
    catch (const runtime_error& e)
    {
      return string (e.what ()).find ("failed to parse catalog") == 0;
    }
    return false;
  };

  assert (fails (""));
  assert (fails ("{"));
  assert (fails ("[]"));
  assert (fails ("{}"));
  assert (fails (R"({"assets": {}})"));
  assert (fails (R"({"assets": [{"name": "no id"}]})"));
  assert (fails (R"({"assets": [{"id": "a", "version": -1}]})"));
  assert (fails (R"({"assets": [{"id": "a", "version": "3"}]})"));
  assert (fails (R"({"assets": [{"id": "a"}, {"id": "a"}]})"));
  assert (fails (R"({"assets": [{"id": "a", "components": [{"id": "c"}]},
                                {"id": "b", "components": [{"id": "c"}]}]})"));
  assert (fails (R"({"headers": {"X": 1}, "assets": []})"));

  assert (!fails (R"({"assets": []})"));
}

static void
test_source ()
{
  asio::io_context ioc;
  json_metadata_source s (document);

  vector<logical_asset> as (await (ioc, s.fetch_assets ()));
  assert (as.size () == 2);

  vector<candidate> cs (await (ioc, s.fetch_candidates ("av-2")));
  assert (cs.size () == 1 && cs[0].id == "c-5");

  optional<download_locator> l (
    await (ioc, s.resolve_download_locator ("c-3")));
  assert (l && l->url == "https://media.example.com/component/c-3/download");

  assert (!await (ioc, s.resolve_download_locator ("nope")));
}

static void
test_load ()
{
  asio::io_context ioc;

  // From a file.
  //
  stdfs::path f (stdfs::temp_directory_path () /
              ("reelfetch-catalog-" +
               std::to_string (
                 chrono::steady_clock::now ().time_since_epoch ().count ()) +
               ".json"));
  {
    ofstream ofs (f);
    ofs << document;
  }

  unique_ptr<json_metadata_source> s (
    await (ioc, load_catalog (ioc, f.string ())));
  assert (s->assets ().size () == 2);

  stdfs::remove (f);

  try
  {
    await (ioc, load_catalog (ioc, f.string ()));
    assert (false);
  }
  catch (const runtime_error& e)
  {
    assert (string (e.what ()).find ("unable to open catalog") == 0);
  }

  // Over HTTP with the headers.
  //
  http_server srv (ioc);
  srv.route ("/catalog.json", {200, document});

  s = await (ioc,
             load_catalog (ioc,
                           srv.url ("/catalog.json"),
                           http_headers {{"Authorization", "Bearer t"}}));
  assert (s->candidates ("av-1").size () == 4);

  optional<http_headers> hs (srv.headers ("/catalog.json"));
  assert (hs && hs->get ("authorization") == "Bearer t");

  try
  {
    await (ioc, load_catalog (ioc, srv.url ("/missing.json")));
    assert (false);
  }
  catch (const http_status_error& e)
  {
    assert (e.status () == 404);
  }
}

static void
test_filters ()
{
  vector<logical_asset> as {
    {"1", "SHOT010", "comp",   2, "Comp"},
    {"2", "SHOT010", "comp",   5, "Comp"},
    {"3", "shot010", "review", 1, "Review"},
    {"4", "SHOT020", "plate",  9, "Plate"},
    {"5", "SHOT020", "render", 2, "render"},
    {"6", "SHOT020", "render", 4, "Render"},
    {"7", "SEQ_A",   "notes",  3, ""},
    {"8", "SEQ_A",   "notes",  7, ""},
    {"9", "SHOT010", "review", 4, "Review"}};

  vector<logical_asset> l (latest_per_parent (as));

  // Parents are distinguished exactly and kept in first appearance order.
  //
  assert (l.size () == 4);
  assert (l[0].id == "9");  // Review beats Comp.
  assert (l[1].id == "3");
  assert (l[2].id == "6");  // Render regardless of case, beats Plate.
  assert (l[3].id == "8");  // Anything, highest version.

  assert (latest_per_parent ({}).empty ());

  vector<logical_asset> m (match_parent (as, "ShOt01"));
  assert (m.size () == 4);
  assert (m[0].id == "1" && m[2].id == "3" && m[3].id == "9");

  assert (match_parent (as, "").size () == as.size ());
  assert (match_parent (as, "shot030").empty ());
}

int
main ()
{
  test_parse ();
  test_locator ();
  test_malformed ();
  test_source ();
  test_load ();
  test_filters ();
}
