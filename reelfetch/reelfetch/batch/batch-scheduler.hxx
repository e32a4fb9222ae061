#pragma once

#include <vector>
#include <cstddef>

#include <boost/asio.hpp>

#include <reelfetch/batch/batch-types.hxx>
#include <reelfetch/transfer/transfer-engine.hxx>

namespace reelfetch
{
  namespace asio = boost::asio;

  // Bounded-concurrency batch scheduler.
  //
  // Tasks are partitioned into consecutive groups of at most the concurrency
  // limit. Groups run one after another; the transfers within a group run
  // concurrently and the group is only done once all of them are, so a
  // failure never cancels its siblings. A group is closed early rather than
  // have the same candidate (or destination) in flight twice.
  //
  class batch_scheduler
  {
  public:
    static constexpr std::size_t default_concurrency = 4;

    explicit
    batch_scheduler (transfer_engine&,
                     std::size_t concurrency = default_concurrency);

    batch_scheduler (const batch_scheduler&) = delete;
    batch_scheduler& operator= (const batch_scheduler&) = delete;

    // Set the observer (not owned, can be NULL).
    //
    void
    set_observer (batch_observer* o) noexcept
    {
      observer_ = o;
    }

    std::size_t
    concurrency () const noexcept
    {
      return concurrency_;
    }

    // Run the tasks returning one outcome per task in input order.
    //
    // Per-task failures end up in the outcomes and never propagate. Throw
    // std::invalid_argument if the limit is 0 or a task has no source or
    // destination, before anything is started.
    //
    asio::awaitable<batch_report>
    run_batch (const std::vector<download_task>&);

    asio::awaitable<batch_report>
    run_batch (const std::vector<download_task>&, std::size_t limit);

    // Return the groups as lists of task indexes.
    //
    static std::vector<std::vector<std::size_t>>
    partition (const std::vector<download_task>&, std::size_t limit);

  private:
    asio::awaitable<batch_outcome>
    attempt (const download_task&);

  private:
    transfer_engine& engine_;
    std::size_t concurrency_;
    batch_observer* observer_ = nullptr;
  };
}
