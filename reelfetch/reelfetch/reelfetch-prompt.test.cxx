#include <reelfetch/reelfetch-prompt.hxx>

#include <ios>
#include <cassert>
#include <sstream>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace reelfetch;

static fallback_item
item ()
{
  fallback_item r;
  r.asset = logical_asset ("a1", "SHOT010", "comp", 3);
  r.candidates = {candidate ("c1", "ftrackreview-mp4", "mp4", 2048, "a1"),
                  candidate ("c2", "frame", "exr", 0, "a1")};
  r.reason = "HTTP 404 (Not Found)";
  return r;
}

static vector<fallback_choice>
choices ()
{
  fallback_item i (item ());
  return {{i.candidates[0], representation_type::encoded_low},
          {i.candidates[1], representation_type::other}};
}

static void
test_mode ()
{
  auto mode = [] (const string& in)
  {
    istringstream is (in);
    ostringstream os;
    console_operator op (is, os);
    fallback_mode m (op.choose_mode ({item ()}));

    assert (os.str ().find ("SHOT010/comp v3: HTTP 404 (Not Found)") !=
            string::npos);
    return m;
  };

  assert (mode ("a\n") == fallback_mode::automatic);
  assert (mode ("  Manual \n") == fallback_mode::manual);
  assert (mode ("x\n\nS\n") == fallback_mode::skip);

  // Answer without the trailing newline still counts.
  //
  assert (mode ("m") == fallback_mode::manual);

  // Closed input is an error, not a default.
  //
  try
  {
    mode ("maybe\n");
    assert (false);
  }
  catch (const ios_base::failure&)
  {
  }
}

static void
test_candidate ()
{
  auto pick = [] (const string& in, string* out = nullptr)
  {
    istringstream is (in);
    ostringstream os;
    console_operator op (is, os);
    optional<size_t> r (op.choose_candidate (item (), choices ()));

    if (out != nullptr)
      *out = os.str ();

    return r;
  };

  string o;
  assert (pick ("2\n", &o) == 1);
  assert (o.find ("1) ftrackreview-mp4 [mp4] encoded_low, 2.0 KiB") !=
          string::npos);
  assert (o.find ("2) frame [exr] other\n") != string::npos);

  assert (pick ("1\n") == 0);
  assert (pick ("skip\n") == nullopt);
  assert (pick ("0\n3\n-1\n1x\n99999999999999\n2\n") == 1);
}

static void
test_parse ()
{
  assert (to_fallback_mode ("ask") == nullopt);
  assert (to_fallback_mode ("auto") == fallback_mode::automatic);
  assert (to_fallback_mode ("MANUAL") == fallback_mode::manual);
  assert (to_fallback_mode ("skip") == fallback_mode::skip);

  try
  {
    to_fallback_mode ("retry");
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

int
main ()
{
  test_mode ();
  test_candidate ();
  test_parse ();
}
