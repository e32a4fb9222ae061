#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <boost/json.hpp>
#include <boost/asio.hpp>

#include <reelfetch/http/http-types.hxx>
#include <reelfetch/http/http-client.hxx>
#include <reelfetch/media/media-types.hxx>
#include <reelfetch/media/media-catalog.hxx>
#include <reelfetch/metadata/metadata-source.hxx>

namespace reelfetch
{
  namespace json = boost::json;
  namespace asio = boost::asio;

  // Metadata source backed by a JSON catalog document.
  //
  // The document lists the assets together with their components:
  //
  // {
  //   "server":  "https://media.example.com",
  //   "headers": {"X-Api-User": "jane"},
  //   "assets":  [{"id": "av-1", "parent": "SHOT010", "name": "comp",
  //                "version": 3, "type": "Comp",
  //                "components": [{"id": "c-1", "name": "main",
  //                                "file_type": ".mov", "size": 1024,
  //                                "canonical": true, "url": "..."}]}]
  // }
  //
  // A component is downloaded from its url if it has one and otherwise from
  // <server>/component/<id>/download. The catalog-wide headers go with every
  // download. If a component does not say whether it is canonical, it is
  // taken to be so if its name is not an encode name and it carries a media
  // extension.
  //
  class json_metadata_source: public metadata_source
  {
  public:
    // Throw runtime_error if the document is malformed.
    //
    explicit
    json_metadata_source (const std::string& document,
                          representation_catalog = representation_catalog ());

    explicit
    json_metadata_source (const json::value&,
                          representation_catalog = representation_catalog ());

    asio::awaitable<std::vector<logical_asset>>
    fetch_assets () override;

    asio::awaitable<std::vector<candidate>>
    fetch_candidates (const std::string& asset_id) override;

    asio::awaitable<std::optional<download_locator>>
    resolve_download_locator (const std::string& candidate_id) override;

    // Synchronous access to the parsed catalog.
    //
    const std::vector<logical_asset>&
    assets () const noexcept
    {
      return assets_;
    }

    const std::vector<candidate>&
    candidates (const std::string& asset_id) const;

    std::optional<download_locator>
    locator (const std::string& candidate_id) const;

    const std::string&
    server () const noexcept
    {
      return server_;
    }

    const http_headers&
    headers () const noexcept
    {
      return headers_;
    }

  private:
    void
    parse (const json::value&);

    void
    parse_asset (const json::object&);

    candidate
    parse_component (const json::object&, const std::string& asset_id);

  private:
    representation_catalog catalog_;

    std::string server_;   // Without the trailing slash.
    http_headers headers_;

    std::vector<logical_asset> assets_;
    std::map<std::string, std::vector<candidate>> candidates_; // By asset.
    std::map<std::string, std::string> urls_;                  // By component.
  };

  // Return true if the extension (normalized) is one of the motion or
  // frame sequence formats a canonical source comes in.
  //
  bool
  media_extension (const std::string&);

  // Load the catalog from a local file or, if the location is an http:// or
  // https:// URL, fetch it with the headers specified.
  //
  asio::awaitable<std::unique_ptr<json_metadata_source>>
  load_catalog (asio::io_context&,
                const std::string& location,
                const http_headers& = http_headers (),
                const http_client_traits<>& = http_client_traits<> ());

  // Asset filters. Both preserve the catalog order.
  //

  // Return the assets whose parent name contains the pattern, ignoring case.
  // An empty pattern matches everything.
  //
  std::vector<logical_asset>
  match_parent (const std::vector<logical_asset>&, const std::string& pattern);

  // Return one asset per parent: among the parent's assets the type Review
  // is preferred, then Comp, Render, Movie, Video, Media, and then anything.
  // Within the preferred type the highest version wins.
  //
  std::vector<logical_asset>
  latest_per_parent (const std::vector<logical_asset>&);
}
