#include <set>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <variant>
#include <iostream>
#include <optional>
#include <filesystem>

#ifdef _WIN32
#  include <io.h>
#  include <stdio.h>
#else
#  include <unistd.h>
#endif

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

#include <reelfetch/http/http-types.hxx>
#include <reelfetch/media/media-types.hxx>
#include <reelfetch/metadata/metadata-catalog.hxx>
#include <reelfetch/reelfetch-download.hxx>
#include <reelfetch/reelfetch-options.hxx>
#include <reelfetch/reelfetch-progress.hxx>
#include <reelfetch/reelfetch-prompt.hxx>

#include <reelfetch/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

using namespace boost::asio::experimental::awaitable_operators;

namespace reelfetch
{
  static bool
  stdout_terminal ()
  {
#ifdef _WIN32
    return _isatty (_fileno (stdout)) != 0;
#else
    return isatty (STDOUT_FILENO) != 0;
#endif
  }

  // Narrow down the catalog assets according to the options. The filters
  // apply in the order --asset, --match, --latest.
  //
  static vector<logical_asset>
  select_assets (const vector<logical_asset>& as, const options& opt)
  {
    vector<logical_asset> r;

    if (opt.asset_specified ())
    {
      set<string> ids (opt.asset ().begin (), opt.asset ().end ());

      for (const logical_asset& a: as)
      {
        if (ids.erase (a.id) != 0)
          r.push_back (a);
      }

      for (const string& id: ids)
        cerr << "warning: asset " << id << " not in catalog" << endl;
    }
    else
      r = as;

    if (opt.match_specified ())
      r = match_parent (r, opt.match ());

    if (opt.latest ())
      r = latest_per_parent (r);

    return r;
  }

  static void
  print_fallback (const fallback_report& r)
  {
    for (const fallback_result& x: r.results)
    {
      ostream& o (x.status == fallback_status::recovered ? cout : cerr);

      if (x.status != fallback_status::recovered)
        o << "warning: ";

      o << x.asset << ": " << x.status;

      if (x.chosen)
        o << " with " << x.chosen->item.name << " (" << x.chosen->type << ')';

      if (x.result)
        o << " -> " << x.result->path.string ();
      else if (!x.reason.empty ())
        o << ": " << x.reason;

      o << endl;
    }
  }

  // Run the whole thing returning the exit code.
  //
  static asio::awaitable<int>
  run (asio::io_context& ioc, const options& opt)
  {
    // Parse everything up front so that a typo doesn't surface after the
    // downloads.
    //
    media_preference pref (to_media_preference (opt.prefer ()));
    optional<fallback_mode> fm (to_fallback_mode (opt.fallback ()));

    http_headers hs;
    for (const string& h: opt.header ())
    {
      http_field f (parse_http_field (h));
      hs.add (move (f.name), move (f.value));
    }

    http_client_traits<> ct;
    ct.connect_timeout = opt.connect_timeout ();
    ct.request_timeout = opt.idle_timeout ();

    unique_ptr<json_metadata_source> src (
      co_await load_catalog (ioc, opt.catalog (), hs, ct));

    vector<logical_asset> as (select_assets (src->assets (), opt));

    if (as.empty ())
    {
      cerr << "warning: no assets to download" << endl;
      co_return 0;
    }

    fs::path dir (prepare_download_directory (opt.output (),
                                              opt.timestamped ()));

    orchestrator_options oo;
    oo.concurrency = opt.jobs ();
    oo.transfer.connect_timeout = opt.connect_timeout ();
    oo.transfer.idle_timeout = opt.idle_timeout ();
    oo.transfer.transfer_timeout = chrono::seconds (opt.transfer_timeout ());
    oo.headers = hs;

    download_orchestrator orc (ioc, *src, move (oo));

    bool live (!opt.no_progress () && stdout_terminal ());

    auto rep (make_shared<progress_reporter> (orc.registry (),
                                              cout,
                                              live,
                                              opt.verbose ()));
    orc.registry ().subscribe (rep);
    orc.set_observer (rep.get ());

    download_plan p (co_await orc.plan (as, pref, dir));

    for (const unplanned_item& u: p.unplanned)
      cerr << "warning: " << u.asset << ": " << u.reason << endl;

    cout << "downloading " << p.items.size () << " of " << as.size ()
         << " asset(s) into " << dir.string () << endl;

    rep->expect (p.items.size ());

    batch_report br;

    if (live)
    {
      // The reporter polls until the batch is done and is then cancelled.
      //
      variant<batch_report, monostate> v (
        co_await (orc.run (p) || rep->run ()));

      br = move (get<0> (v));
    }
    else
      br = co_await orc.run (p);

    rep->finish ();

    for (const batch_outcome* o: br.failures ())
      cerr << "error: " << o->task.filename << ": " << o->reason << endl;

    vector<fallback_item> items (co_await orc.collect_failures (p, br));

    size_t recovered (0);

    if (!items.empty ())
    {
      unique_ptr<fallback_operator> op;

      if (fm)
        op = make_unique<preset_operator> (*fm);
      else
        op = make_unique<console_operator> (cin, cout);

      // No live display here: the operator may be answering questions.
      //
      fallback_report fr (co_await orc.handle_fallback (items, *op, dir));
      rep->finish ();

      print_fallback (fr);
      recovered = fr.count (fallback_status::recovered);
    }

    size_t missing (items.size () - recovered);

    cout << br.succeeded << " downloaded, " << recovered << " recovered, "
         << missing << " not downloaded ("
         << format_bytes (rep->bytes ()) << ')' << endl;

    co_return missing == 0 ? 0 : 1;
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace reelfetch;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "reelfetch " << REELFETCH_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: reelfetch --catalog <loc> [options]" << "\n"
        << "options:"                                   << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (!opt.catalog_specified () || opt.catalog ().empty ())
    {
      cerr << "error: catalog expected" << "\n"
           << "  info: specify it with --catalog" << endl;
      return 1;
    }

    if (opt.jobs () == 0)
    {
      cerr << "error: number of jobs must be at least 1" << endl;
      return 1;
    }

    asio::io_context ioc;
    int exit_code (1);

    asio::co_spawn (
      ioc,
      reelfetch::run (ioc, opt),
      [&exit_code, &ioc] (exception_ptr ex, int r)
      {
        exit_code = r;
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
