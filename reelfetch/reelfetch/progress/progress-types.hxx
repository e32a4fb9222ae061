#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <optional>

namespace reelfetch
{
  // Transfer status enumeration.
  //
  enum class transfer_status
  {
    pending,     // Registered, not yet requesting
    downloading, // Request sent, receiving data
    completed,   // Successfully completed
    failed       // Failed with error
  };

  inline std::ostream&
  operator<< (std::ostream& os, transfer_status s)
  {
    switch (s)
    {
    case transfer_status::pending:     return os << "pending";
    case transfer_status::downloading: return os << "downloading";
    case transfer_status::completed:   return os << "completed";
    case transfer_status::failed:      return os << "failed";
    }
    return os;
  }

  inline bool
  terminal (transfer_status s) noexcept
  {
    return s == transfer_status::completed || s == transfer_status::failed;
  }

  // Progress of a single in-flight transfer.
  //
  struct transfer_progress
  {
    std::string task_id;
    std::string filename;
    std::uint64_t bytes_transferred {0};
    std::uint64_t total_bytes {0};  // 0 if unknown.
    transfer_status status {transfer_status::pending};

    // Return the completion percentage (0-100) or nullopt if the total is
    // unknown. We never guess.
    //
    std::optional<double>
    percentage () const noexcept
    {
      if (total_bytes == 0)
        return std::nullopt;

      return bytes_transferred * 100.0 / total_bytes;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const transfer_progress& p)
  {
    os << p.filename << ": " << p.status << ' ' << p.bytes_transferred;

    if (p.total_bytes != 0)
      os << '/' << p.total_bytes;

    return os;
  }

  // Partial update of a progress record. Absent fields are left unchanged.
  //
  struct progress_update
  {
    std::optional<std::uint64_t> bytes_transferred;
    std::optional<std::uint64_t> total_bytes;
    std::optional<transfer_status> status;
  };
}
