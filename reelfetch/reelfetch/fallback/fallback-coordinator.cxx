#include <reelfetch/fallback/fallback-coordinator.hxx>

#include <utility>
#include <exception>

using namespace std;

namespace reelfetch
{
  fallback_coordinator::
  fallback_coordinator (transfer_engine& e,
                        metadata_source& s,
                        fs::path o,
                        representation_catalog c)
    : engine_ (e),
      source_ (s),
      output_ (move (o)),
      catalog_ (move (c))
  {
  }

  vector<fallback_choice> fallback_coordinator::
  choices (const fallback_item& it) const
  {
    vector<fallback_choice> r;

    for (const candidate& c: it.candidates)
    {
      if (it.failed_candidate_id && c.id == *it.failed_candidate_id)
        continue;

      r.push_back (fallback_choice {c, catalog_.classify (c)});
    }

    return r;
  }

  asio::awaitable<fallback_report> fallback_coordinator::
  handle_fallback (const vector<fallback_item>& items, fallback_operator& op)
  {
    fallback_report r;

    if (items.empty ())
      co_return r;

    r.mode = op.choose_mode (items);

    for (const fallback_item& it: items)
    {
      fallback_result x;
      x.asset = it.asset;

      if (r.mode == fallback_mode::skip)
      {
        x.status = fallback_status::skipped;
        x.reason = "skipped: " + it.reason;
        r.results.push_back (move (x));
        continue;
      }

      vector<fallback_choice> cs (choices (it));

      if (cs.empty ())
      {
        x.status = fallback_status::unavailable;
        x.reason = "no alternative component available";
        r.results.push_back (move (x));
        continue;
      }

      optional<fallback_choice> ch;

      if (r.mode == fallback_mode::automatic)
      {
        vector<candidate> rem;
        rem.reserve (cs.size ());
        for (const fallback_choice& c: cs)
          rem.push_back (c.item);

        if (optional<selection> s = select_fallback (rem, {}, catalog_))
          ch = fallback_choice {move (s->item), s->type};
      }
      else
      {
        optional<size_t> i (op.choose_candidate (it, cs));

        if (!i || *i >= cs.size ())
        {
          x.status = fallback_status::skipped;
          x.reason = "skipped by operator";
          r.results.push_back (move (x));
          continue;
        }

        ch = cs[*i];
      }

      if (!ch)
      {
        x.status = fallback_status::unavailable;
        x.reason = "no alternative component available";
        r.results.push_back (move (x));
        continue;
      }

      // Sequential on purpose: there are normally few of these and the
      // operator may be watching each one.
      //
      r.results.push_back (co_await retry (it, move (*ch)));
    }

    co_return r;
  }

  asio::awaitable<fallback_result> fallback_coordinator::
  retry (const fallback_item& it, fallback_choice ch)
  {
    fallback_result x;
    x.asset = it.asset;
    x.chosen = ch;

    optional<download_locator> l;
    string err;

    try
    {
      l = co_await source_.resolve_download_locator (ch.item.id);
    }
    catch (const exception& e)
    {
      err = e.what ();
    }

    if (!l)
    {
      x.status = fallback_status::unavailable;
      x.reason = err.empty ()
        ? "no download location for component " + ch.item.id
        : "unable to resolve download location: " + err;
      co_return x;
    }

    download_task t;
    t.url = move (l->url);
    t.headers = move (l->headers);
    t.directory = output_;
    t.filename = generate_filename (it.asset, ch.item, ch.type);
    t.candidate_id = ch.item.id;

    try
    {
      x.result = co_await engine_.transfer (t);
      x.status = fallback_status::recovered;
    }
    catch (const transfer_error& e)
    {
      x.status = fallback_status::failed;
      x.reason = e.what ();
    }
    catch (const exception& e)
    {
      x.status = fallback_status::failed;
      x.reason = string ("unexpected error: ") + e.what ();
    }

    co_return x;
  }
}
