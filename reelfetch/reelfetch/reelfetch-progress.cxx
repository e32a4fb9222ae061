#include <reelfetch/reelfetch-progress.hxx>

#include <cmath>
#include <utility>
#include <iomanip>
#include <sstream>
#include <algorithm>

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

using namespace std;

namespace reelfetch
{
  using namespace ftxui;

  progress_reporter::
  progress_reporter (progress_registry& r, ostream& os, bool l, bool v)
    : registry_ (r), os_ (os), live_ (l), verbose_ (v)
  {
  }

  void progress_reporter::
  expect (size_t n)
  {
    lock_guard<mutex> l (mutex_);
    expected_ = n;
  }

  size_t progress_reporter::
  completed () const
  {
    lock_guard<mutex> l (mutex_);
    return completed_;
  }

  size_t progress_reporter::
  failed () const
  {
    lock_guard<mutex> l (mutex_);
    return failed_;
  }

  uint64_t progress_reporter::
  bytes () const
  {
    lock_guard<mutex> l (mutex_);
    return bytes_;
  }

  void progress_reporter::
  log (string s)
  {
    lock_guard<mutex> l (mutex_);
    log_.push_back (move (s));
  }

  void progress_reporter::
  flush_log ()
  {
    vector<string> ls;
    {
      lock_guard<mutex> l (mutex_);
      ls.swap (log_);
    }

    // Clear the rest of each line in case the frame we are writing over was
    // wider.
    //
    for (const string& s: ls)
      os_ << s << (live_ ? "\x1B[K\n" : "\n");
  }

  asio::awaitable<void> progress_reporter::
  run (chrono::milliseconds i)
  {
    asio::steady_timer t (co_await asio::this_coro::executor);

    for (;;)
    {
      draw ();

      t.expires_after (i);
      co_await t.async_wait (asio::use_awaitable);
    }
  }

  void progress_reporter::
  draw ()
  {
    if (!live_)
    {
      flush_log ();
      os_ << flush;
      return;
    }

    Element doc (render (registry_.snapshot ()));

    Screen s (Screen::Create (Dimension::Full (), Dimension::Fit (doc)));
    Render (s, doc);

    os_ << reset_;
    flush_log ();
    os_ << s.ToString () << flush;

    reset_ = s.ResetPosition (true /* clear */);
  }

  void progress_reporter::
  finish ()
  {
    draw ();

    if (live_)
    {
      os_ << endl;
      reset_.clear ();
    }
  }

  Element progress_reporter::
  render (const vector<transfer_progress>& ps) const
  {
    Elements es;
    es.reserve (ps.size ());

    for (const transfer_progress& p: ps)
      es.push_back (render_transfer (p));

    size_t e, c, f;
    uint64_t b;
    {
      lock_guard<mutex> l (mutex_);
      e = expected_;
      c = completed_;
      f = failed_;
      b = bytes_;
    }

    // [done/expected] with the failures counted as done.
    //
    ostringstream l;
    l << '[' << setw (2) << (c + f) << '/' << setw (2) << max (e, c + f)
      << "] " << ps.size () << " active";

    ostringstream r;
    r << c << " downloaded, " << f << " failed | " << format_bytes (b);

    Element sum (hbox ({text (l.str ()), filler (), text (r.str ())}));

    if (f != 0)
      sum = sum | color (Color::Red);

    return vbox ({
      vbox (move (es)),
      separator (),
      sum | bold
    });
  }

  void progress_reporter::
  progress_changed (const transfer_progress& p)
  {
    if (!terminal (p.status))
      return;

    bool ok (p.status == transfer_status::completed);
    {
      lock_guard<mutex> l (mutex_);

      if (ok)
      {
        ++completed_;
        bytes_ += p.bytes_transferred;
      }
      else
        ++failed_;
    }

    if (verbose_)
    {
      if (ok)
        log ("downloaded " + p.filename + " (" +
             format_bytes (p.bytes_transferred) + ')');
      else
        log ("failed " + p.filename);
    }
  }

  void progress_reporter::
  group_completed (const batch_group_stats& s)
  {
    if (!verbose_)
      return;

    ostringstream o;
    o << "group " << (s.index + 1) << '/' << s.count << ": "
      << s.succeeded << " succeeded, " << s.failed << " failed in "
      << format_duration (s.elapsed);

    log (o.str ());
  }

  void progress_reporter::
  batch_completed (const batch_report& r)
  {
    if (!verbose_)
      return;

    ostringstream o;
    o << "batch: " << r.attempted << " attempted, " << r.succeeded
      << " succeeded, " << r.failed << " failed in "
      << format_duration (r.elapsed);

    log (o.str ());
  }

  Element
  render_transfer (const transfer_progress& p, int w)
  {
    optional<double> pct (p.percentage ());

    // Fixed widths to keep the columns from jittering as the numbers change.
    //
    ostringstream r;

    if (pct)
      r << right << setw (5) << fixed << setprecision (1) << *pct << '%';
    else
      r << "    --";

    r << ' ' << format_bar (pct ? optional<double> (*pct / 100) : nullopt, w)
      << " | " << setw (10) << format_bytes (p.bytes_transferred);

    if (p.total_bytes != 0)
      r << " / " << setw (10) << format_bytes (p.total_bytes);

    Element st (text (r.str ()));

    if (p.status == transfer_status::pending)
      st = st | dim;

    return hbox ({
      text (p.filename),
      filler (),
      st
    });
  }

  string
  format_bytes (uint64_t b)
  {
    // Binary prefixes since these are file sizes.
    //
    static const char* u[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    static const size_t n (sizeof (u) / sizeof (*u));

    double v (static_cast<double> (b));
    size_t i (0);

    while (v >= 1024.0 && i < n - 1)
    {
      v /= 1024.0;
      ++i;
    }

    ostringstream o;

    if (i == 0)
      o << b << ' ' << u[0];
    else
      o << fixed << setprecision (1) << v << ' ' << u[i];

    return o.str ();
  }

  string
  format_bar (optional<double> r, int w)
  {
    string o;
    o.reserve (static_cast<size_t> (w) + 2);
    o += '[';

    if (!r)
    {
      for (int i (0); i < w; ++i)
        o += (i == w / 2 ? '>' : ' ');
    }
    else
    {
      int f (static_cast<int> (round (clamp (*r, 0.0, 1.0) * w)));

      // Arrow: '===>   '
      //
      for (int i (0); i < w; ++i)
      {
        if      (i <  f - 1) o += '=';
        else if (i == f - 1) o += '>';
        else                 o += ' ';
      }
    }

    o += ']';
    return o;
  }

  string
  format_duration (chrono::milliseconds d)
  {
    long long ms (d.count ());
    ostringstream o;

    if (ms < 1000)
      o << ms << "ms";
    else if (ms < 60000)
      o << fixed << setprecision (1) << ms / 1000.0 << 's';
    else
    {
      long long s (ms / 1000);
      o << s / 60 << "m " << setw (2) << setfill ('0') << s % 60 << 's';
    }

    return o.str ();
  }
}
