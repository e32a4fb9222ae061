#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <optional>

#include <reelfetch/transfer/transfer-types.hxx>

namespace reelfetch
{
  // Failure kind enumeration.
  //
  enum class failure_kind
  {
    http_status, // Non-2xx response
    io_failure,  // Network or filesystem failure
    timeout,     // Deadline exceeded
    unexpected   // Anything that is not a transfer failure
  };

  inline failure_kind
  to_failure_kind (transfer_error_kind k)
  {
    switch (k)
    {
    case transfer_error_kind::http_status: return failure_kind::http_status;
    case transfer_error_kind::io_failure:  return failure_kind::io_failure;
    case transfer_error_kind::timeout:     return failure_kind::timeout;
    }
    return failure_kind::unexpected;
  }

  inline std::ostream&
  operator<< (std::ostream& os, failure_kind k)
  {
    switch (k)
    {
    case failure_kind::http_status: return os << "http_status";
    case failure_kind::io_failure:  return os << "io_failure";
    case failure_kind::timeout:     return os << "timeout";
    case failure_kind::unexpected:  return os << "unexpected";
    }
    return os;
  }

  // Outcome of one task in a batch.
  //
  struct batch_outcome
  {
    download_task task;
    bool success {false};

    // Set on success.
    //
    fs::path path;
    std::uint64_t size {0};

    // Set on failure.
    //
    std::string reason;
    failure_kind kind {failure_kind::unexpected};
    std::optional<unsigned int> status;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const batch_outcome& o)
  {
    os << o.task.filename << ": ";

    if (o.success)
      return os << "downloaded " << o.size << " bytes";

    return os << "failed: " << o.reason;
  }

  // Counters for one group.
  //
  struct batch_group_stats
  {
    std::size_t index {0};  // Zero-based.
    std::size_t count {0};  // Total number of groups.
    std::size_t size {0};   // Tasks in this group.
    std::size_t succeeded {0};
    std::size_t failed {0};
    std::chrono::milliseconds elapsed {0};
  };

  // Aggregate batch report. Outcomes are in the input task order.
  //
  struct batch_report
  {
    std::vector<batch_outcome> outcomes;
    std::vector<batch_group_stats> groups;

    std::size_t attempted {0};
    std::size_t succeeded {0};
    std::size_t failed {0};
    std::chrono::milliseconds elapsed {0};

    std::vector<const batch_outcome*>
    failures () const
    {
      std::vector<const batch_outcome*> r;
      for (const batch_outcome& o: outcomes)
        if (!o.success)
          r.push_back (&o);
      return r;
    }
  };

  // Batch observer interface.
  //
  // Called on the executor running the batch.
  //
  class batch_observer
  {
  public:
    virtual
    ~batch_observer () = default;

    virtual void
    group_completed (const batch_group_stats&) {}

    virtual void
    batch_completed (const batch_report&) {}
  };
}
