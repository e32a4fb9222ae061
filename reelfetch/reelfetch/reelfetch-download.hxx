#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <filesystem>

#include <boost/asio.hpp>

#include <reelfetch/http/http-types.hxx>
#include <reelfetch/media/media-types.hxx>
#include <reelfetch/media/media-catalog.hxx>
#include <reelfetch/metadata/metadata-source.hxx>
#include <reelfetch/progress/progress-registry.hxx>
#include <reelfetch/transfer/transfer-engine.hxx>
#include <reelfetch/batch/batch-scheduler.hxx>
#include <reelfetch/fallback/fallback-types.hxx>

namespace reelfetch
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  struct orchestrator_options
  {
    std::size_t concurrency {batch_scheduler::default_concurrency};
    transfer_options transfer;
    representation_catalog catalog;

    // Extra request headers sent with every download, overriding those that
    // come with the locator.
    //
    http_headers headers;
  };

  // Asset for which a download was planned.
  //
  struct planned_item
  {
    logical_asset asset;
    candidate item;
    representation_type type {representation_type::other};
    download_task task;
  };

  // Asset for which nothing could be planned.
  //
  struct unplanned_item
  {
    logical_asset asset;
    std::string reason;

    // Selected candidate if it was the locator that could not be resolved.
    //
    std::optional<std::string> candidate_id;
  };

  struct download_plan
  {
    fs::path directory;
    std::vector<planned_item> items;
    std::vector<unplanned_item> unplanned;

    std::vector<download_task>
    tasks () const;
  };

  // Download orchestrator.
  //
  // Ties the pieces together for a run: plans one download per asset, runs
  // the batch, and then collects whatever did not work out for the fallback
  // workflow. Owns the progress registry and everything that reports into
  // it.
  //
  class download_orchestrator
  {
  public:
    download_orchestrator (asio::io_context&,
                           metadata_source&,
                           orchestrator_options = orchestrator_options ());

    ~download_orchestrator ();

    download_orchestrator (const download_orchestrator&) = delete;
    download_orchestrator& operator= (const download_orchestrator&) = delete;

    // Select the primary candidate of each asset and turn it into a task
    // with the destination in the directory specified.
    //
    asio::awaitable<download_plan>
    plan (const std::vector<logical_asset>&, media_preference, fs::path);

    asio::awaitable<batch_report>
    run (const download_plan&);

    // Return the assets that ended up without a download, unplanned ones
    // first, with their candidates fetched anew.
    //
    asio::awaitable<std::vector<fallback_item>>
    collect_failures (const download_plan&, const batch_report&);

    // Run the fallback workflow writing into the directory specified.
    //
    asio::awaitable<fallback_report>
    handle_fallback (const std::vector<fallback_item>&,
                     fallback_operator&,
                     const fs::path&);

    std::vector<transfer_progress>
    snapshot_progress () const
    {
      return registry_.snapshot ();
    }

    // Set the batch observer (not owned, can be NULL).
    //
    void
    set_observer (batch_observer* o) noexcept
    {
      scheduler_.set_observer (o);
    }

    progress_registry&
    registry () noexcept
    {
      return registry_;
    }

    const orchestrator_options&
    options () const noexcept
    {
      return options_;
    }

  private:
    asio::awaitable<std::vector<candidate>>
    fetch_candidates (const logical_asset&, std::string& error);

  private:
    class source;

    orchestrator_options options_;
    std::unique_ptr<source> source_;

    progress_registry registry_;
    transfer_engine engine_;
    batch_scheduler scheduler_;
  };

  // Prepare the output directory creating it if necessary.
  //
  // If timestamped is true, then create and return a subdirectory named
  // <YYYY-MM-DDTHH-MM-SS>_mediaDownload (local time). Throw runtime_error
  // if the directory cannot be created or written to.
  //
  fs::path
  prepare_download_directory (const fs::path& base, bool timestamped);
}
