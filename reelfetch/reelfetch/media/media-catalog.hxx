#pragma once

#include <map>
#include <string>
#include <vector>

#include <reelfetch/media/media-types.hxx>

namespace reelfetch
{
  // Candidates grouped by representation type. Each bucket keeps the order
  // in which candidates were seen.
  //
  using representation_groups =
    std::map<representation_type, std::vector<candidate>>;

  // Representation catalog.
  //
  // Classifies candidates by their name and canonical flag. The name tokens
  // that identify review encodes are configurable and matched
  // case-insensitively against the whole candidate name.
  //
  class representation_catalog
  {
  public:
    // Default encode tokens.
    //
    static const char* const default_high_token; // "ftrackreview-mp4-1080"
    static const char* const default_low_token;  // "ftrackreview-mp4"

    representation_catalog ();

    representation_catalog (std::vector<std::string> high_tokens,
                            std::vector<std::string> low_tokens);

    // Classify a single candidate. The first matching rule wins: high encode
    // token, low encode token, canonical flag, and finally other.
    //
    representation_type
    classify (const candidate&) const;

    representation_groups
    group_by_type (const std::vector<candidate>&) const;

    // Return true if the name matches any of the encode tokens.
    //
    bool
    encode_name (const std::string&) const;

    const std::vector<std::string>&
    high_tokens () const noexcept
    {
      return high_;
    }

    const std::vector<std::string>&
    low_tokens () const noexcept
    {
      return low_;
    }

  private:
    std::vector<std::string> high_;
    std::vector<std::string> low_;
  };
}
