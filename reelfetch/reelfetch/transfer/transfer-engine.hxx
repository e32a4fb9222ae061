#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <cstdint>

#include <boost/asio.hpp>

#include <reelfetch/http/http-client.hxx>
#include <reelfetch/progress/progress-registry.hxx>
#include <reelfetch/transfer/transfer-types.hxx>

namespace reelfetch
{
  namespace asio = boost::asio;

  // Transfer engine options.
  //
  struct transfer_options
  {
    // Connect (and TLS handshake) timeout in milliseconds, 0 for none.
    //
    std::uint32_t connect_timeout {30000};

    // Maximum time without receiving any data in milliseconds, 0 for none.
    //
    std::uint32_t idle_timeout {60000};

    // Overall limit on a single transfer, 0 for none.
    //
    std::chrono::seconds transfer_timeout {0};

    bool verify_ssl {true};
    std::string ssl_cert_file;
  };

  // Streaming file transfer engine.
  //
  // Each transfer streams one remote resource into its destination through a
  // fixed-size buffer, reporting byte-level progress into the registry. The
  // data first goes into a temporary file beside the destination which is
  // renamed into place on success and removed on failure, so a failed
  // transfer never leaves partial output behind (nor clobbers an existing
  // file).
  //
  // There are no retries here: a failure is reported once and the caller
  // decides what to do next.
  //
  class transfer_engine
  {
  public:
    transfer_engine (asio::io_context&,
                     progress_registry&,
                     const transfer_options& = transfer_options ());

    transfer_engine (const transfer_engine&) = delete;
    transfer_engine& operator= (const transfer_engine&) = delete;

    // Perform the transfer. Throw transfer_error on failure. The registry
    // record for the task exists only while this is running.
    //
    asio::awaitable<transfer_result>
    transfer (const download_task&);

    progress_registry&
    registry () noexcept
    {
      return registry_;
    }

    const transfer_options&
    options () const noexcept
    {
      return options_;
    }

    // Return the temporary path the data is received into.
    //
    static fs::path
    partial_path (const download_task&);

  private:
    progress_registry& registry_;
    transfer_options options_;
    std::unique_ptr<http_client> http_;
  };
}
