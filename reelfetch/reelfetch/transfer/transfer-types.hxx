#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

#include <reelfetch/http/http-types.hxx>

namespace reelfetch
{
  namespace fs = std::filesystem;

  // Single source to destination transfer request.
  //
  struct download_task
  {
    std::string url;
    http_headers headers;     // Merged into the request.
    fs::path directory;
    std::string filename;
    std::string candidate_id; // Candidate the task was built from.

    // Return the task identity, the destination path as a string.
    //
    std::string
    id () const
    {
      return (directory / filename).string ();
    }

    fs::path
    path () const
    {
      return directory / filename;
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_task& t)
  {
    return os << t.url << " -> " << t.path ().string ();
  }

  // Transfer error kind enumeration.
  //
  enum class transfer_error_kind
  {
    http_status, // Server responded with a non-2xx status
    io_failure,  // Network or filesystem failure
    timeout      // Connect, idle, or overall deadline exceeded
  };

  inline std::ostream&
  operator<< (std::ostream& os, transfer_error_kind k)
  {
    switch (k)
    {
    case transfer_error_kind::http_status: return os << "http_status";
    case transfer_error_kind::io_failure:  return os << "io_failure";
    case transfer_error_kind::timeout:     return os << "timeout";
    }
    return os;
  }

  // Structured transfer failure.
  //
  class transfer_error: public std::runtime_error
  {
  public:
    transfer_error (transfer_error_kind, const std::string& what);

    // Create an http_status error with the "HTTP <code> (<reason>)" message.
    //
    explicit
    transfer_error (const http_status_error&);

    transfer_error_kind
    kind () const noexcept
    {
      return kind_;
    }

    // HTTP status for the http_status kind.
    //
    std::optional<unsigned int>
    status () const noexcept
    {
      return status_;
    }

  private:
    transfer_error_kind kind_;
    std::optional<unsigned int> status_;
  };

  // Result of a successful transfer.
  //
  struct transfer_result
  {
    fs::path path;
    std::uint64_t bytes {0};
  };
}
