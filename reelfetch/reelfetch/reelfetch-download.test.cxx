#include <reelfetch/reelfetch-download.hxx>
#include <reelfetch/metadata/metadata-catalog.hxx>
#include <reelfetch/http/http-server.test.hxx>

#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace reelfetch;
using namespace reelfetch::test;

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

static fs::path
scratch (const string& n)
{
  fs::path r (fs::temp_directory_path () /
              ("reelfetch-download-" + n + '-' +
               std::to_string (
                 chrono::steady_clock::now ().time_since_epoch ().count ())));
  fs::remove_all (r);
  return r;
}

// Three shots: one whose encode downloads fine, one whose encode is missing
// on the server but has a thumbnail, and one without any components.
//
static string
document (const string& server)
{
  return R"({
  "server": ")" + server + R"(",
  "headers": {"X-Api-User": "jane"},
  "assets": [
    {"id": "av-1", "parent": "SHOT010", "name": "comp", "version": 3,
     "components": [
       {"id": "c-1", "name": "ftrackreview-mp4", "file_type": "mp4",
        "size": 50},
       {"id": "c-2", "name": "main", "file_type": "mov", "size": 500}]},
    {"id": "av-2", "parent": "SHOT020", "name": "comp", "version": 1,
     "components": [
       {"id": "c-3", "name": "ftrackreview-mp4", "file_type": "mp4",
        "size": 40},
       {"id": "c-4", "name": "thumbnail", "file_type": "jpg", "size": 10}]},
    {"id": "av-3", "parent": "SHOT030", "name": "notes", "version": 1,
     "components": []}
  ]
})";
}

static void
test_workflow ()
{
  asio::io_context ioc;
  http_server srv (ioc);

  srv.route ("/component/c-1/download", {200, string (50, 'a')});
  srv.route ("/component/c-4/download", {200, string (10, 't')});

  json_metadata_source src (document (srv.url ("")));

  orchestrator_options o;
  o.concurrency = 2;
  o.headers.set ("X-Run", "1");
  download_orchestrator orc (ioc, src, o);

  fs::path d (scratch ("workflow"));

  download_plan p (
    await (ioc, orc.plan (src.assets (), media_preference::encoded, d)));

  assert (p.directory == d);
  assert (p.items.size () == 2);
  assert (p.items[0].item.id == "c-1");
  assert (p.items[0].type == representation_type::encoded_low);
  assert (p.items[0].task.filename == "SHOT010_comp_v003_encoded_720p.mp4");
  assert (p.items[0].task.directory == d);
  assert (p.items[1].task.candidate_id == "c-3");

  assert (p.unplanned.size () == 1);
  assert (p.unplanned[0].asset.id == "av-3");
  assert (p.unplanned[0].reason ==
          "no suitable component for preference: encoded");
  assert (!p.unplanned[0].candidate_id);

  batch_report r (await (ioc, orc.run (p)));

  assert (r.attempted == 2 && r.succeeded == 1 && r.failed == 1);
  assert (fs::file_size (d / p.items[0].task.filename) == 50);
  assert (r.outcomes[1].status && *r.outcomes[1].status == 404);

  // Both the catalog and the extra headers went out.
  //
  optional<http_headers> hs (srv.headers ("/component/c-1/download"));
  assert (hs);
  assert (hs->get ("x-api-user") == "jane");
  assert (hs->get ("x-run") == "1");

  vector<fallback_item> items (await (ioc, orc.collect_failures (p, r)));

  assert (items.size () == 2);
  assert (items[0].asset.id == "av-3" && items[0].candidates.empty ());
  assert (items[1].asset.id == "av-2");
  assert (items[1].failed_candidate_id == "c-3");
  assert (items[1].candidates.size () == 2);
  assert (items[1].reason.find ("404") != string::npos);

  preset_operator op (fallback_mode::automatic);
  fallback_report fr (await (ioc, orc.handle_fallback (items, op, d)));

  assert (fr.results.size () == 2);
  assert (fr.results[0].status == fallback_status::unavailable);
  assert (fr.results[1].status == fallback_status::recovered);
  assert (fr.results[1].chosen->item.id == "c-4");
  assert (fr.results[1].result->path ==
          d / "SHOT020_comp_v001_other.jpg");
  assert (fs::file_size (fr.results[1].result->path) == 10);

  hs = srv.headers ("/component/c-4/download");
  assert (hs && hs->get ("x-run") == "1");

  // Nothing in flight once everything is done.
  //
  assert (orc.snapshot_progress ().empty ());
  assert (orc.registry ().empty ());

  fs::remove_all (d);
}

static void
test_prefer_original ()
{
  asio::io_context ioc;
  http_server srv (ioc);
  json_metadata_source src (document (srv.url ("")));
  download_orchestrator orc (ioc, src);

  fs::path d (scratch ("original"));

  download_plan p (
    await (ioc, orc.plan (src.assets (), media_preference::original, d)));

  // Without an original the largest of the rest is taken.
  //
  assert (p.items.size () == 2);
  assert (p.items[0].item.id == "c-2");
  assert (p.items[0].task.filename == "SHOT010_comp_v003_original.mov");
  assert (p.items[1].item.id == "c-3");
  assert (p.unplanned.size () == 1);
  assert (p.unplanned[0].reason ==
          "no suitable component for preference: original");

  // Planning does not touch the network or the disk.
  //
  assert (srv.requests () == 0);
  assert (!fs::exists (d));
}

static void
test_directory ()
{
  fs::path b (scratch ("directory"));

  fs::path d (prepare_download_directory (b, false));
  assert (d == b);
  assert (fs::is_directory (d));
  assert (fs::is_empty (d));

  // Idempotent.
  //
  assert (prepare_download_directory (b, false) == b);

  fs::path t (prepare_download_directory (b, true));
  assert (t.parent_path () == b);
  assert (fs::is_directory (t));

  string n (t.filename ().string ());
  assert (n.size () == 19 + 14);
  assert (n.substr (19) == "_mediaDownload");
  assert (n[4] == '-' && n[10] == 'T' && n[13] == '-');
  assert (fs::is_empty (t));

  // A file in the way.
  //
  fs::path f (b / "file");
  {
    ofstream ofs (f);
    ofs << "x";
  }

  try
  {
    prepare_download_directory (f, false);
    assert (false);
  }
  catch (const runtime_error&)
  {
  }

  fs::remove_all (b);
}

int
main ()
{
  test_workflow ();
  test_prefer_original ();
  test_directory ();
}
