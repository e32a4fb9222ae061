#include <reelfetch/reelfetch-prompt.hxx>

#include <cctype>
#include <ios>
#include <stdexcept>

#include <reelfetch/reelfetch-progress.hxx>

using namespace std;

namespace reelfetch
{
  static string
  trim_lower (const string& s)
  {
    string r;
    for (char c: s)
    {
      if (!isspace (static_cast<unsigned char> (c)))
        r += static_cast<char> (tolower (static_cast<unsigned char> (c)));
    }
    return r;
  }

  console_operator::
  console_operator (istream& is, ostream& os)
    : is_ (is), os_ (os)
  {
  }

  string console_operator::
  ask (const string& prompt)
  {
    string a;

    os_ << prompt << ' ' << flush;

    // Note: getline() sets the failbit if it fails to extract anything, and
    // the eofbit if it hits EOF before the delimiter.
    //
    getline (is_, a);

    bool f (is_.fail ());
    bool e (is_.eof ());

    // Force a newline out so the next output doesn't end up on the prompt
    // line.
    //
    if (f || e)
      os_ << endl;

    if (f)
      throw ios_base::failure ("unable to read answer from stdin");

    return trim_lower (a);
  }

  fallback_mode console_operator::
  choose_mode (const vector<fallback_item>& items)
  {
    os_ << items.size () << " item(s) could not be downloaded:" << endl;

    for (const fallback_item& i: items)
      os_ << "  " << i.asset << ": " << i.reason << endl;

    for (;;)
    {
      string a (ask ("try alternatives [a]utomatically, [m]anually, or "
                     "[s]kip?"));

      if (a == "a" || a == "auto" || a == "automatic")
        return fallback_mode::automatic;

      if (a == "m" || a == "manual")
        return fallback_mode::manual;

      if (a == "s" || a == "skip")
        return fallback_mode::skip;
    }
  }

  optional<size_t> console_operator::
  choose_candidate (const fallback_item& it, const vector<fallback_choice>& cs)
  {
    os_ << it.asset << " (" << it.reason << "):" << endl;

    for (size_t i (0); i != cs.size (); ++i)
    {
      const fallback_choice& c (cs[i]);

      os_ << "  " << (i + 1) << ") " << c.item.name;

      string e (c.item.extension ());
      if (!e.empty ())
        os_ << " [" << e << ']';

      os_ << ' ' << c.type;

      if (c.item.size != 0)
        os_ << ", " << format_bytes (c.item.size);

      os_ << endl;
    }

    for (;;)
    {
      string a (ask ("select 1-" + std::to_string (cs.size ()) +
                     " or [s]kip:"));

      if (a == "s" || a == "skip")
        return nullopt;

      if (a.empty () || a.size () > 9)
        continue;

      bool digits (true);
      for (char c: a)
        if (!isdigit (static_cast<unsigned char> (c)))
          digits = false;

      if (!digits)
        continue;

      size_t n (stoul (a));

      if (n >= 1 && n <= cs.size ())
        return n - 1;
    }
  }

  optional<fallback_mode>
  to_fallback_mode (const string& s)
  {
    string v (trim_lower (s));

    if (v == "ask")
      return nullopt;

    if (v == "auto" || v == "automatic")
      return fallback_mode::automatic;

    if (v == "manual")
      return fallback_mode::manual;

    if (v == "skip")
      return fallback_mode::skip;

    throw invalid_argument ("invalid fallback mode '" + s + '\'');
  }
}
