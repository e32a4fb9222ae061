#pragma once

#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <optional>

#include <boost/asio.hpp>

#include <ftxui/dom/elements.hpp>

#include <reelfetch/progress/progress-types.hxx>
#include <reelfetch/progress/progress-registry.hxx>
#include <reelfetch/batch/batch-types.hxx>

namespace reelfetch
{
  namespace asio = boost::asio;

  // Terminal progress reporter.
  //
  // Renders the registry snapshot with FTXUI, redrawing it in place on every
  // poll, with a summary line underneath. Observes the registry to count the
  // finished transfers and the scheduler to report per-group statistics.
  //
  // If not live, nothing is drawn and only the log lines are written out,
  // which is what we want when the output is not a terminal.
  //
  class progress_reporter: public progress_observer,
                           public batch_observer
  {
  public:
    static constexpr int default_bar_width = 20;

    progress_reporter (progress_registry&,
                       std::ostream&,
                       bool live,
                       bool verbose);

    progress_reporter (const progress_reporter&) = delete;
    progress_reporter& operator= (const progress_reporter&) = delete;

    // Set the number of transfers expected (shown in the summary).
    //
    void
    expect (std::size_t n);

    // Poll and draw until cancelled. Meant to be raced against the work it
    // reports on.
    //
    asio::awaitable<void>
    run (std::chrono::milliseconds interval = std::chrono::milliseconds (100));

    // Draw the current state once, flushing any pending log lines first.
    //
    void
    draw ();

    // Draw the final state and leave it on the screen so that subsequent
    // output goes underneath.
    //
    void
    finish ();

    // Queue a log line to be written above the progress display.
    //
    void
    log (std::string);

    std::size_t
    completed () const;

    std::size_t
    failed () const;

    std::uint64_t
    bytes () const;

    // progress_observer
    //
    void
    progress_changed (const transfer_progress&) override;

    // batch_observer
    //
    void
    group_completed (const batch_group_stats&) override;

    void
    batch_completed (const batch_report&) override;

  private:
    ftxui::Element
    render (const std::vector<transfer_progress>&) const;

    void
    flush_log ();

  private:
    progress_registry& registry_;
    std::ostream& os_;
    bool live_;
    bool verbose_;

    mutable std::mutex mutex_;
    std::vector<std::string> log_;
    std::size_t expected_ {0};
    std::size_t completed_ {0};
    std::size_t failed_ {0};
    std::uint64_t bytes_ {0};

    std::string reset_;   // Moves the cursor back over the last frame.
  };

  // Render a single transfer line.
  //
  ftxui::Element
  render_transfer (const transfer_progress&,
                   int bar_width = progress_reporter::default_bar_width);

  // Formatting helpers.
  //

  std::string
  format_bytes (std::uint64_t);

  // Format a textual bar. A ratio in [0, 1] draws the filled part, nullopt
  // draws the indeterminate marker in the middle.
  //
  std::string
  format_bar (std::optional<double> ratio, int width);

  std::string
  format_duration (std::chrono::milliseconds);
}
