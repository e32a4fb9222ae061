#include <reelfetch/media/media-selection.hxx>

#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <algorithm>

using namespace std;

namespace reelfetch
{
  // Return the largest candidate in the range, first seen on ties.
  //
  template <typename I, typename P>
  static I
  largest (I b, I e, P pred)
  {
    I r (e);

    for (I i (b); i != e; ++i)
    {
      if (!pred (*i))
        continue;

      if (r == e || i->size > r->size)
        r = i;
    }

    return r;
  }

  static optional<selection>
  largest_of (const representation_groups& gs, representation_type t)
  {
    auto i (gs.find (t));
    if (i == gs.end () || i->second.empty ())
      return nullopt;

    const vector<candidate>& cs (i->second);
    auto r (largest (cs.begin (), cs.end (),
                     [] (const candidate&) {return true;}));

    return selection {*r, t};
  }

  optional<selection>
  select_primary (const vector<candidate>& cs,
                  media_preference p,
                  const representation_catalog& cat)
  {
    using rt = representation_type;

    if (cs.empty ())
      return nullopt;

    representation_groups gs (cat.group_by_type (cs));

    if (p == media_preference::original)
    {
      if (auto r = largest_of (gs, rt::original))
        return r;

      // No original, so take the largest of whatever else there is. The
      // input order decides between equal sizes, not the bucket order.
      //
      auto i (largest (cs.begin (), cs.end (),
                       [&cat] (const candidate& c)
                       {
                         return cat.classify (c) != rt::original;
                       }));

      if (i == cs.end ())
        return nullopt;

      return selection {*i, cat.classify (*i)};
    }

    for (rt t: {rt::encoded_low, rt::encoded_high, rt::original})
    {
      if (auto r = largest_of (gs, t))
        return r;
    }

    return nullopt;
  }

  bool
  still_image_extension (const string& e)
  {
    static const array<const char*, 7> exts {
      "jpg", "jpeg", "png", "tiff", "tif", "exr", "dpx"};

    return find (exts.begin (), exts.end (), e) != exts.end ();
  }

  optional<selection>
  select_fallback (const vector<candidate>& cs,
                   const vector<representation_type>& ex,
                   const representation_catalog& cat)
  {
    using rt = representation_type;

    representation_groups gs (cat.group_by_type (cs));

    for (rt t: {rt::encoded_low, rt::encoded_high, rt::other, rt::original})
    {
      if (find (ex.begin (), ex.end (), t) != ex.end ())
        continue;

      auto i (gs.find (t));
      if (i == gs.end () || i->second.empty ())
        continue;

      const vector<candidate>& b (i->second);

      if (t == rt::other)
      {
        // Still images first. They are usually the only thing in this
        // bucket worth showing in place of a movie.
        //
        auto j (largest (b.begin (), b.end (),
                         [] (const candidate& c)
                         {
                           return still_image_extension (c.extension ());
                         }));

        if (j != b.end ())
          return selection {*j, t};
      }

      if (auto r = largest_of (gs, t))
        return r;
    }

    return nullopt;
  }

  const char*
  filename_label (representation_type t)
  {
    switch (t)
    {
    case representation_type::encoded_high: return "encoded_1080p";
    case representation_type::encoded_low:  return "encoded_720p";
    case representation_type::original:     return "original";
    case representation_type::other:        return "other";
    }
    return "other";
  }

  string
  generate_filename (const logical_asset& a,
                     const candidate& c,
                     representation_type t)
  {
    ostringstream o;
    o << a.parent << '_' << a.name << "_v"
      << setw (3) << setfill ('0') << a.version
      << '_' << filename_label (t);

    string e (c.extension ());
    if (!e.empty ())
      o << '.' << e;

    string r (o.str ());

    // Replace characters that Windows (and some network filesystems)
    // reject.
    //
    replace_if (r.begin (), r.end (),
                [] (char ch)
                {
                  return string_view ("<>:\"/\\|?*").find (ch) !=
                         string_view::npos;
                },
                '_');

    return r;
  }
}
