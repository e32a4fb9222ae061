#include <reelfetch/media/media-catalog.hxx>

#include <cctype>
#include <algorithm>

using namespace std;

namespace reelfetch
{
  const char* const representation_catalog::default_high_token (
    "ftrackreview-mp4-1080");

  const char* const representation_catalog::default_low_token (
    "ftrackreview-mp4");

  static string
  lower (const string& s)
  {
    string r (s);
    for (char& c: r)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return r;
  }

  // Store the tokens lowercased so that classification only needs to lower
  // the candidate name once.
  //
  static vector<string>
  lower (vector<string> v)
  {
    for (string& s: v)
      s = lower (s);
    return v;
  }

  representation_catalog::
  representation_catalog ()
    : high_ {default_high_token},
      low_ {default_low_token}
  {
  }

  representation_catalog::
  representation_catalog (vector<string> h, vector<string> l)
    : high_ (lower (move (h))),
      low_ (lower (move (l)))
  {
  }

  representation_type representation_catalog::
  classify (const candidate& c) const
  {
    string n (lower (c.name));

    auto match = [&n] (const vector<string>& ts)
    {
      return find (ts.begin (), ts.end (), n) != ts.end ();
    };

    // Note that the high token check must come first: with the default
    // tokens the low one is a prefix of the high one and, were the matching
    // ever relaxed to prefixes, the order would still be right.
    //
    if (match (high_))
      return representation_type::encoded_high;

    if (match (low_))
      return representation_type::encoded_low;

    if (c.canonical)
      return representation_type::original;

    return representation_type::other;
  }

  representation_groups representation_catalog::
  group_by_type (const vector<candidate>& cs) const
  {
    representation_groups r;

    for (const candidate& c: cs)
      r[classify (c)].push_back (c);

    return r;
  }

  bool representation_catalog::
  encode_name (const string& s) const
  {
    string n (lower (s));

    return find (high_.begin (), high_.end (), n) != high_.end () ||
           find (low_.begin (), low_.end (), n) != low_.end ();
  }
}
