#pragma once

#include <vector>
#include <filesystem>

#include <boost/asio.hpp>

#include <reelfetch/media/media-catalog.hxx>
#include <reelfetch/media/media-selection.hxx>
#include <reelfetch/metadata/metadata-source.hxx>
#include <reelfetch/transfer/transfer-engine.hxx>
#include <reelfetch/fallback/fallback-types.hxx>

namespace reelfetch
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Fallback coordinator.
  //
  // Given the items whose preferred representation could not be obtained,
  // asks the operator for the mode and then re-selects and retries each item
  // in turn through the transfer engine. The candidate that already failed
  // is never offered again and there is exactly one round: a substitute that
  // fails too is reported as such.
  //
  class fallback_coordinator
  {
  public:
    fallback_coordinator (transfer_engine&,
                          metadata_source&,
                          fs::path output_directory,
                          representation_catalog = representation_catalog ());

    fallback_coordinator (const fallback_coordinator&) = delete;
    fallback_coordinator& operator= (const fallback_coordinator&) = delete;

    asio::awaitable<fallback_report>
    handle_fallback (const std::vector<fallback_item>&, fallback_operator&);

    // Return the candidates of the item that are still worth trying, with
    // their types, in the original order.
    //
    std::vector<fallback_choice>
    choices (const fallback_item&) const;

  private:
    asio::awaitable<fallback_result>
    retry (const fallback_item&, fallback_choice);

  private:
    transfer_engine& engine_;
    metadata_source& source_;
    fs::path output_;
    representation_catalog catalog_;
  };
}
