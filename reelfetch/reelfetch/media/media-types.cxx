#include <reelfetch/media/media-types.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace reelfetch
{
  string
  to_string (representation_type t)
  {
    switch (t)
    {
    case representation_type::encoded_low:  return "encoded_low";
    case representation_type::encoded_high: return "encoded_high";
    case representation_type::original:     return "original";
    case representation_type::other:        return "other";
    }
    return "other";
  }

  string
  to_string (media_preference p)
  {
    switch (p)
    {
    case media_preference::original: return "original";
    case media_preference::encoded:  return "encoded";
    }
    return "encoded";
  }

  media_preference
  to_media_preference (const string& s)
  {
    string l;
    l.reserve (s.size ());
    for (char c: s)
      l += static_cast<char> (tolower (static_cast<unsigned char> (c)));

    if (l == "original")
      return media_preference::original;

    if (l == "encoded")
      return media_preference::encoded;

    throw invalid_argument ("invalid media preference '" + s + "'");
  }

  string candidate::
  extension () const
  {
    string r;

    if (!file_type.empty ())
    {
      r = file_type[0] == '.' ? file_type.substr (1) : file_type;
    }
    else
    {
      // Take whatever follows the last dot in the name, unless the dot is
      // the first character (hidden file, no extension).
      //
      size_t p (name.rfind ('.'));
      if (p != string::npos && p != 0 && p + 1 < name.size ())
        r = name.substr (p + 1);
    }

    for (char& c: r)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return r;
  }
}
