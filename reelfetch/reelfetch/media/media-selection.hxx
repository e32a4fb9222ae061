#pragma once

#include <string>
#include <vector>
#include <optional>

#include <reelfetch/media/media-types.hxx>
#include <reelfetch/media/media-catalog.hxx>

namespace reelfetch
{
  // Selected candidate together with the type it was classified as.
  //
  struct selection
  {
    candidate item;
    representation_type type {representation_type::other};
  };

  // Select the primary candidate according to the preference.
  //
  // With the original preference the canonical candidate is returned if
  // there is one, otherwise the largest of the rest. With the encoded
  // preference the low encode is tried first, then the high encode, then the
  // original. Within a bucket the largest declared size wins, ties going to
  // the candidate seen first.
  //
  // Return nullopt if nothing qualifies.
  //
  std::optional<selection>
  select_primary (const std::vector<candidate>&,
                  media_preference,
                  const representation_catalog& = representation_catalog ());

  // Select a substitute after the primary could not be obtained.
  //
  // Types are tried in the fixed order low encode, high encode, other,
  // original, skipping any in the exclude list. Among other candidates a
  // still image is preferred over anything else.
  //
  std::optional<selection>
  select_fallback (const std::vector<candidate>&,
                   const std::vector<representation_type>& exclude = {},
                   const representation_catalog& = representation_catalog ());

  // Return true if the extension (normalized, see candidate::extension())
  // denotes a still image format.
  //
  bool
  still_image_extension (const std::string&);

  // Generate the destination filename for a candidate:
  //
  // <parent>_<asset>_v<NNN>_<label>[.<ext>]
  //
  // Characters that are invalid in filenames on common platforms are
  // replaced with '_'.
  //
  std::string
  generate_filename (const logical_asset&,
                     const candidate&,
                     representation_type);

  // Return the filename label for the representation type.
  //
  const char*
  filename_label (representation_type);
}
