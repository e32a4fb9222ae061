#include <reelfetch/reelfetch-progress.hxx>

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

#include <memory>
#include <cassert>
#include <sstream>
#include <iostream>

using namespace std;
using namespace reelfetch;

static string
render_line (const transfer_progress& p, int width)
{
  ftxui::Element e (render_transfer (p, 10));
  ftxui::Screen s (ftxui::Screen::Create (ftxui::Dimension::Fixed (width),
                                          ftxui::Dimension::Fixed (1)));
  ftxui::Render (s, e);
  return s.ToString ();
}

static void
test_format ()
{
  assert (format_bytes (0) == "0 B");
  assert (format_bytes (1023) == "1023 B");
  assert (format_bytes (1024) == "1.0 KiB");
  assert (format_bytes (1536) == "1.5 KiB");
  assert (format_bytes (5242880) == "5.0 MiB");

  assert (format_bar (0.0, 4) == "[    ]");
  assert (format_bar (0.5, 4) == "[=>  ]");
  assert (format_bar (1.0, 4) == "[===>]");
  assert (format_bar (7.0, 4) == "[===>]");
  assert (format_bar (nullopt, 4) == "[  > ]");

  using ms = chrono::milliseconds;
  assert (format_duration (ms (250)) == "250ms");
  assert (format_duration (ms (1500)) == "1.5s");
  assert (format_duration (ms (125000)) == "2m 05s");
}

static void
test_render ()
{
  transfer_progress p;
  p.task_id = "out/a.mov";
  p.filename = "a.mov";
  p.bytes_transferred = 512;
  p.total_bytes = 1024;
  p.status = transfer_status::downloading;

  string l (render_line (p, 80));
  assert (l.find ("a.mov") != string::npos);
  assert (l.find ("50.0%") != string::npos);
  assert (l.find ("512 B") != string::npos);
  assert (l.find ("1.0 KiB") != string::npos);

  // Unknown total: no percentage is made up.
  //
  p.total_bytes = 0;
  l = render_line (p, 80);
  assert (l.find ('%') == string::npos);
  assert (l.find ("--") != string::npos);
  assert (l.find ("[     >    ]") != string::npos);
}

// Not live: only the log lines come out.
//
static void
test_counts ()
{
  progress_registry reg;
  ostringstream os;
  auto rep (make_shared<progress_reporter> (reg, os, false, true));
  reg.subscribe (rep);
  rep->expect (3);

  reg.start ("d/a", "a");
  reg.start ("d/b", "b");
  reg.update ("d/a", {2048, 2048, transfer_status::downloading});
  reg.update ("d/a", {nullopt, nullopt, transfer_status::completed});
  reg.update ("d/b", {nullopt, nullopt, transfer_status::failed});

  assert (rep->completed () == 1);
  assert (rep->failed () == 1);
  assert (rep->bytes () == 2048);

  batch_group_stats g;
  g.index = 0;
  g.count = 2;
  g.size = 2;
  g.succeeded = 1;
  g.failed = 1;
  g.elapsed = chrono::milliseconds (40);
  rep->group_completed (g);

  rep->draw ();

  string o (os.str ());
  assert (o.find ("downloaded a (2.0 KiB)\n") != string::npos);
  assert (o.find ("failed b\n") != string::npos);
  assert (o.find ("group 1/2: 1 succeeded, 1 failed in 40ms\n") !=
          string::npos);
  assert (o.find ('\x1B') == string::npos);

  // Flushed once.
  //
  rep->draw ();
  assert (os.str () == o);

  // Quiet unless verbose.
  //
  ostringstream qs;
  progress_reporter q (reg, qs, false, false);
  q.group_completed (g);
  q.log ("explicit");
  q.finish ();
  assert (qs.str () == "explicit\n");
}

// Live: the frame is redrawn in place.
//
static void
test_live ()
{
  progress_registry reg;
  ostringstream os;
  progress_reporter rep (reg, os, true, false);
  rep.expect (1);

  reg.start ("d/clip.mp4", "clip.mp4");
  reg.update ("d/clip.mp4", {100, 400, transfer_status::downloading});

  rep.draw ();
  string f (os.str ());
  assert (f.find ("clip.mp4") != string::npos);
  assert (f.find ("25.0%") != string::npos);
  assert (f.find ("0 downloaded, 0 failed") != string::npos);

  rep.log ("note");
  rep.draw ();

  // The second frame starts by moving back over the first one and the log
  // line goes above it.
  //
  string s (os.str ().substr (f.size ()));
  assert (s.find ('\x1B') == 0 || s.find ('\r') == 0);
  assert (s.find ("note") < s.find ("clip.mp4"));
}

int
main ()
{
  test_format ();
  test_render ();
  test_counts ();
  test_live ();
}
