#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>

namespace reelfetch
{
  // Representation type enumeration.
  //
  // Derived from a candidate by the catalog rules, never stored alongside
  // it.
  //
  enum class representation_type
  {
    encoded_low,  // Standard review encode
    encoded_high, // High-resolution review encode
    original,     // Canonical source file
    other         // Anything else (thumbnails, sidecars, etc)
  };

  std::string
  to_string (representation_type);

  inline std::ostream&
  operator<< (std::ostream& os, representation_type t)
  {
    return os << to_string (t);
  }

  // Media preference enumeration.
  //
  enum class media_preference
  {
    original,
    encoded
  };

  std::string
  to_string (media_preference);

  // Parse "original" or "encoded" (case-insensitive). Throw
  // std::invalid_argument on anything else.
  //
  media_preference
  to_media_preference (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& os, media_preference p)
  {
    return os << to_string (p);
  }

  // Downloadable file representing a logical asset at a particular quality or
  // format.
  //
  struct candidate
  {
    std::string id;
    std::string name;
    std::string file_type;   // Declared extension, may carry a leading dot.
    std::uint64_t size {0};  // Declared size, 0 if unknown.
    std::string asset_id;    // Owning asset.
    bool canonical {false};  // Marked as the canonical source.

    candidate () = default;

    candidate (std::string i,
               std::string n,
               std::string t,
               std::uint64_t s,
               std::string a = "",
               bool c = false)
      : id (std::move (i)),
        name (std::move (n)),
        file_type (std::move (t)),
        size (s),
        asset_id (std::move (a)),
        canonical (c)
    {
    }

    // Return the normalized extension: lowercased, without the leading dot.
    // If the declared type is empty, fall back to the extension of the name.
    // Return empty string if neither has one.
    //
    std::string
    extension () const;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const candidate& c)
  {
    os << c.name;
    if (!c.file_type.empty ())
      os << " [" << c.file_type << ']';
    return os << " (" << c.id << ')';
  }

  // Versioned work item owning zero or more candidates.
  //
  struct logical_asset
  {
    std::string id;
    std::string parent;         // Parent entity name (shot, sequence).
    std::string name;           // Asset name.
    std::uint32_t version {0};
    std::string type;           // Asset type name, may be empty.

    logical_asset () = default;

    logical_asset (std::string i,
                   std::string p,
                   std::string n,
                   std::uint32_t v,
                   std::string t = "")
      : id (std::move (i)),
        parent (std::move (p)),
        name (std::move (n)),
        version (v),
        type (std::move (t))
    {
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const logical_asset& a)
  {
    return os << a.parent << '/' << a.name << " v" << a.version;
  }
}
