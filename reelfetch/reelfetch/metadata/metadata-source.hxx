#pragma once

#include <string>
#include <vector>
#include <optional>

#include <boost/asio/awaitable.hpp>

#include <reelfetch/http/http-types.hxx>
#include <reelfetch/media/media-types.hxx>

namespace reelfetch
{
  namespace asio = boost::asio;

  // Where to download a candidate from.
  //
  struct download_locator
  {
    std::string url;
    http_headers headers; // Merged into the download request.
  };

  // Asset metadata source.
  //
  // This is the boundary to whatever system tracks the assets. Candidate
  // lists returned are snapshots: they are never updated in place.
  //
  class metadata_source
  {
  public:
    virtual
    ~metadata_source () = default;

    virtual asio::awaitable<std::vector<logical_asset>>
    fetch_assets () = 0;

    virtual asio::awaitable<std::vector<candidate>>
    fetch_candidates (const std::string& asset_id) = 0;

    // Return nullopt if the candidate has no viable download option.
    //
    virtual asio::awaitable<std::optional<download_locator>>
    resolve_download_locator (const std::string& candidate_id) = 0;
  };
}
