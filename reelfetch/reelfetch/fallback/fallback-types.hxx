#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <optional>

#include <reelfetch/media/media-types.hxx>
#include <reelfetch/transfer/transfer-types.hxx>

namespace reelfetch
{
  // Fallback mode enumeration.
  //
  enum class fallback_mode
  {
    automatic, // Priority-based substitution
    manual,    // Operator picks per item
    skip       // Leave the failures alone
  };

  inline std::ostream&
  operator<< (std::ostream& os, fallback_mode m)
  {
    switch (m)
    {
    case fallback_mode::automatic: return os << "automatic";
    case fallback_mode::manual:    return os << "manual";
    case fallback_mode::skip:      return os << "skip";
    }
    return os;
  }

  // Item that needs a substitute representation.
  //
  struct fallback_item
  {
    logical_asset asset;
    std::vector<candidate> candidates;   // Freshly fetched.
    std::string reason;                  // Why the primary didn't work out.

    // Candidate whose transfer failed, absent if none could be selected in
    // the first place.
    //
    std::optional<std::string> failed_candidate_id;
  };

  // Candidate offered to the operator in the manual mode.
  //
  struct fallback_choice
  {
    candidate item;
    representation_type type;
  };

  // Fallback result status enumeration.
  //
  enum class fallback_status
  {
    recovered,   // Substitute downloaded
    failed,      // Substitute transfer failed
    skipped,     // Operator chose not to proceed
    unavailable  // Nothing left to try
  };

  inline std::ostream&
  operator<< (std::ostream& os, fallback_status s)
  {
    switch (s)
    {
    case fallback_status::recovered:   return os << "recovered";
    case fallback_status::failed:      return os << "failed";
    case fallback_status::skipped:     return os << "skipped";
    case fallback_status::unavailable: return os << "unavailable";
    }
    return os;
  }

  struct fallback_result
  {
    logical_asset asset;
    fallback_status status {fallback_status::unavailable};
    std::optional<fallback_choice> chosen;
    std::optional<transfer_result> result; // Set if recovered.
    std::string reason;
  };

  struct fallback_report
  {
    fallback_mode mode {fallback_mode::skip};
    std::vector<fallback_result> results;  // In item order.

    std::size_t
    count (fallback_status s) const
    {
      std::size_t r (0);
      for (const fallback_result& x: results)
        if (x.status == s)
          ++r;
      return r;
    }
  };

  // Fallback operator interface.
  //
  // The party deciding what to do about failures: normally a person at the
  // terminal, but also a preset policy.
  //
  class fallback_operator
  {
  public:
    virtual
    ~fallback_operator () = default;

    // Pick the mode once for all the items.
    //
    virtual fallback_mode
    choose_mode (const std::vector<fallback_item>&) = 0;

    // Pick one of the choices by index or return nullopt to skip the item.
    // Only called in the manual mode and only with a non-empty list.
    //
    virtual std::optional<std::size_t>
    choose_candidate (const fallback_item&,
                      const std::vector<fallback_choice>&) = 0;
  };

  // Operator with a fixed answer for the mode. In the manual mode it always
  // takes the first choice offered.
  //
  class preset_operator: public fallback_operator
  {
  public:
    explicit
    preset_operator (fallback_mode m): mode_ (m) {}

    fallback_mode
    choose_mode (const std::vector<fallback_item>&) override
    {
      return mode_;
    }

    std::optional<std::size_t>
    choose_candidate (const fallback_item&,
                      const std::vector<fallback_choice>&) override
    {
      return 0;
    }

  private:
    fallback_mode mode_;
  };
}
