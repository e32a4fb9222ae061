#include <reelfetch/batch/batch-scheduler.hxx>

#include <set>
#include <chrono>
#include <stdexcept>

#include <boost/asio/experimental/parallel_group.hpp>

using namespace std;

namespace reelfetch
{
  batch_scheduler::
  batch_scheduler (transfer_engine& e, size_t c)
    : engine_ (e), concurrency_ (c)
  {
  }

  asio::awaitable<batch_report> batch_scheduler::
  run_batch (const vector<download_task>& ts)
  {
    co_return co_await run_batch (ts, concurrency_);
  }

  vector<vector<size_t>> batch_scheduler::
  partition (const vector<download_task>& ts, size_t limit)
  {
    vector<vector<size_t>> r;

    vector<size_t> g;
    set<string> keys;

    for (size_t i (0); i != ts.size (); ++i)
    {
      const download_task& t (ts[i]);
      string d (t.id ());

      bool dup (keys.count (d) != 0 ||
                (!t.candidate_id.empty () &&
                 keys.count ("candidate:" + t.candidate_id) != 0));

      if (g.size () == limit || dup)
      {
        r.push_back (move (g));
        g.clear ();
        keys.clear ();
      }

      g.push_back (i);
      keys.insert (move (d));

      if (!t.candidate_id.empty ())
        keys.insert ("candidate:" + t.candidate_id);
    }

    if (!g.empty ())
      r.push_back (move (g));

    return r;
  }

  asio::awaitable<batch_outcome> batch_scheduler::
  attempt (const download_task& t)
  {
    batch_outcome o;
    o.task = t;

    try
    {
      transfer_result r (co_await engine_.transfer (t));

      o.success = true;
      o.path = move (r.path);
      o.size = r.bytes;
    }
    catch (const transfer_error& e)
    {
      o.reason = e.what ();
      o.kind = to_failure_kind (e.kind ());
      o.status = e.status ();
    }
    catch (const exception& e)
    {
      o.reason = string ("unexpected error: ") + e.what ();
      o.kind = failure_kind::unexpected;
    }

    co_return o;
  }

  asio::awaitable<batch_report> batch_scheduler::
  run_batch (const vector<download_task>& ts, size_t limit)
  {
    using namespace asio::experimental;
    using chrono::steady_clock;
    using chrono::milliseconds;
    using chrono::duration_cast;

    // Validate everything up front: a half-started batch is worse than
    // none.
    //
    if (limit == 0)
      throw invalid_argument ("concurrency limit must be at least 1");

    for (size_t i (0); i != ts.size (); ++i)
    {
      const download_task& t (ts[i]);

      if (t.url.empty ())
        throw invalid_argument ("task " + std::to_string (i) +
                                " has no source locator");

      if (t.directory.empty () || t.filename.empty ())
        throw invalid_argument ("task " + std::to_string (i) +
                                " has no destination");
    }

    auto ex (co_await asio::this_coro::executor);
    auto start (steady_clock::now ());

    batch_report r;
    r.outcomes.resize (ts.size ());
    r.attempted = ts.size ();

    vector<vector<size_t>> gs (partition (ts, limit));

    for (size_t gi (0); gi != gs.size (); ++gi)
    {
      const vector<size_t>& g (gs[gi]);
      auto gstart (steady_clock::now ());

      using op_type =
        decltype (asio::co_spawn (ex, attempt (ts[0]), asio::deferred));

      vector<op_type> ops;
      ops.reserve (g.size ());

      for (size_t i: g)
        ops.push_back (asio::co_spawn (ex, attempt (ts[i]), asio::deferred));

      // Note that the results come back in launch order (the completion
      // order is in ord) so index k corresponds to g[k].
      //
      auto [ord, exs, vs] =
        co_await make_parallel_group (move (ops)).async_wait (
          wait_for_all (), asio::use_awaitable);

      batch_group_stats s;
      s.index = gi;
      s.count = gs.size ();
      s.size = g.size ();

      for (size_t k (0); k != g.size (); ++k)
      {
        batch_outcome& o (r.outcomes[g[k]]);

        // attempt() handles all the standard exceptions so this would be
        // something truly exotic.
        //
        if (exs[k])
        {
          o.task = ts[g[k]];
          o.reason = "unexpected error: unknown exception";
          o.kind = failure_kind::unexpected;
        }
        else
          o = move (vs[k]);

        if (o.success)
          ++s.succeeded;
        else
          ++s.failed;
      }

      s.elapsed = duration_cast<milliseconds> (steady_clock::now () - gstart);

      r.succeeded += s.succeeded;
      r.failed += s.failed;
      r.groups.push_back (s);

      if (observer_ != nullptr)
        observer_->group_completed (s);
    }

    r.elapsed = duration_cast<milliseconds> (steady_clock::now () - start);

    if (observer_ != nullptr)
      observer_->batch_completed (r);

    co_return r;
  }
}
