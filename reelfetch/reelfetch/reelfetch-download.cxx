#include <reelfetch/reelfetch-download.hxx>

#include <ctime>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include <stdexcept>
#include <system_error>

#include <reelfetch/media/media-selection.hxx>
#include <reelfetch/fallback/fallback-coordinator.hxx>

using namespace std;

namespace reelfetch
{
  // Metadata source that adds the extra headers to every locator so that
  // the primary and fallback downloads are made the same way.
  //
  class download_orchestrator::source: public metadata_source
  {
  public:
    source (metadata_source& s, const http_headers& h)
      : base_ (s), headers_ (h) {}

    asio::awaitable<vector<logical_asset>>
    fetch_assets () override
    {
      co_return co_await base_.fetch_assets ();
    }

    asio::awaitable<vector<candidate>>
    fetch_candidates (const string& id) override
    {
      co_return co_await base_.fetch_candidates (id);
    }

    asio::awaitable<optional<download_locator>>
    resolve_download_locator (const string& id) override
    {
      optional<download_locator> r (
        co_await base_.resolve_download_locator (id));

      if (r)
        r->headers.merge (headers_);

      co_return r;
    }

  private:
    metadata_source& base_;
    const http_headers& headers_;
  };

  vector<download_task> download_plan::
  tasks () const
  {
    vector<download_task> r;
    r.reserve (items.size ());

    for (const planned_item& i: items)
      r.push_back (i.task);

    return r;
  }

  download_orchestrator::
  download_orchestrator (asio::io_context& ioc,
                         metadata_source& s,
                         orchestrator_options o)
    : options_ (move (o)),
      source_ (make_unique<source> (s, options_.headers)),
      engine_ (ioc, registry_, options_.transfer),
      scheduler_ (engine_, options_.concurrency)
  {
  }

  download_orchestrator::
  ~download_orchestrator ()
  {
  }

  asio::awaitable<vector<candidate>> download_orchestrator::
  fetch_candidates (const logical_asset& a, string& error)
  {
    vector<candidate> r;

    try
    {
      r = co_await source_->fetch_candidates (a.id);
    }
    catch (const exception& e)
    {
      error = string ("unable to fetch components: ") + e.what ();
    }

    co_return r;
  }

  asio::awaitable<download_plan> download_orchestrator::
  plan (const vector<logical_asset>& as, media_preference p, fs::path d)
  {
    download_plan r;
    r.directory = move (d);

    for (const logical_asset& a: as)
    {
      string e;
      vector<candidate> cs (co_await fetch_candidates (a, e));

      if (!e.empty ())
      {
        r.unplanned.push_back (unplanned_item {a, move (e), nullopt});
        continue;
      }

      optional<selection> s (select_primary (cs, p, options_.catalog));

      if (!s)
      {
        r.unplanned.push_back (
          unplanned_item {
            a, "no suitable component for preference: " + to_string (p),
            nullopt});
        continue;
      }

      optional<download_locator> l;

      try
      {
        l = co_await source_->resolve_download_locator (s->item.id);
      }
      catch (const exception& x)
      {
        e = string ("unable to resolve download location: ") + x.what ();
      }

      if (!l)
      {
        if (e.empty ())
          e = "no download location for component " + s->item.id;

        r.unplanned.push_back (unplanned_item {a, move (e), s->item.id});
        continue;
      }

      planned_item i;
      i.asset = a;
      i.task.url = move (l->url);
      i.task.headers = move (l->headers);
      i.task.directory = r.directory;
      i.task.filename = generate_filename (a, s->item, s->type);
      i.task.candidate_id = s->item.id;
      i.item = move (s->item);
      i.type = s->type;

      r.items.push_back (move (i));
    }

    co_return r;
  }

  asio::awaitable<batch_report> download_orchestrator::
  run (const download_plan& p)
  {
    co_return co_await scheduler_.run_batch (p.tasks ());
  }

  asio::awaitable<vector<fallback_item>> download_orchestrator::
  collect_failures (const download_plan& p, const batch_report& br)
  {
    vector<fallback_item> r;

    for (const unplanned_item& u: p.unplanned)
    {
      fallback_item i;
      i.asset = u.asset;
      i.reason = u.reason;
      i.failed_candidate_id = u.candidate_id;

      // If fetching fails again the item simply has nothing to offer.
      //
      string e;
      i.candidates = co_await fetch_candidates (u.asset, e);

      r.push_back (move (i));
    }

    // Outcomes are in task order which is the planned item order.
    //
    for (size_t n (0); n != br.outcomes.size () && n != p.items.size (); ++n)
    {
      const batch_outcome& o (br.outcomes[n]);

      if (o.success)
        continue;

      const planned_item& pi (p.items[n]);

      fallback_item i;
      i.asset = pi.asset;
      i.reason = o.reason;
      i.failed_candidate_id = pi.item.id;

      string e;
      i.candidates = co_await fetch_candidates (pi.asset, e);

      r.push_back (move (i));
    }

    co_return r;
  }

  asio::awaitable<fallback_report> download_orchestrator::
  handle_fallback (const vector<fallback_item>& items,
                   fallback_operator& op,
                   const fs::path& d)
  {
    fallback_coordinator c (engine_, *source_, d, options_.catalog);
    co_return co_await c.handle_fallback (items, op);
  }

  fs::path
  prepare_download_directory (const fs::path& base, bool timestamped)
  {
    fs::path r (base);

    if (timestamped)
    {
      time_t t (chrono::system_clock::to_time_t (chrono::system_clock::now ()));

      tm lt {};
#ifdef _WIN32
      bool ok (localtime_s (&lt, &t) == 0);
#else
      bool ok (localtime_r (&t, &lt) != nullptr);
#endif
      if (!ok)
        throw runtime_error ("unable to obtain local time");

      ostringstream os;
      os << put_time (&lt, "%Y-%m-%dT%H-%M-%S") << "_mediaDownload";
      r /= os.str ();
    }

    error_code ec;
    fs::create_directories (r, ec);

    if (ec)
      throw runtime_error ("unable to create directory " + r.string () +
                           ": " + ec.message ());

    if (!fs::is_directory (r))
      throw runtime_error (r.string () + " is not a directory");

    // Make sure we can actually write there before starting any downloads.
    //
    fs::path probe (r / ".reelfetch-probe");
    {
      ofstream ofs (probe, ios::binary | ios::trunc);

      if (!ofs || !(ofs << "probe") || !ofs.flush ())
        throw runtime_error ("directory " + r.string () +
                             " is not writable");
    }

    fs::remove (probe, ec);
    return r;
  }
}
