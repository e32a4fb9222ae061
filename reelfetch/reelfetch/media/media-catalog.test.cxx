#include <reelfetch/media/media-catalog.hxx>

#include <cassert>
#include <iostream>
#include <sstream>

using namespace std;
using namespace reelfetch;

using rt = representation_type;

// Check the default token rules.
//
static void
test_classify ()
{
  representation_catalog c;

  assert (c.classify ({"1", "ftrackreview-mp4-1080", "mp4", 10}) ==
          rt::encoded_high);
  assert (c.classify ({"2", "ftrackreview-mp4", "mp4", 10}) ==
          rt::encoded_low);
  assert (c.classify ({"3", "main", ".mov", 10, "", true}) ==
          rt::original);
  assert (c.classify ({"4", "thumbnail", "jpg", 10}) == rt::other);

  // Name comparison is case-insensitive but still exact. A name that merely
  // contains a token is not an encode.
  //
  assert (c.classify ({"5", "FTrackReview-MP4", "mp4", 10}) ==
          rt::encoded_low);
  assert (c.classify ({"6", "ftrackreview-mp4-720", "mp4", 10}) ==
          rt::other);

  // Encode tokens win over the canonical flag.
  //
  assert (c.classify ({"7", "ftrackreview-mp4", "mp4", 10, "", true}) ==
          rt::encoded_low);
}

// Custom tokens replace the defaults.
//
static void
test_tokens ()
{
  representation_catalog c ({"Proxy-HD"}, {"proxy-sd", "proxy"});

  assert (c.classify ({"1", "proxy-hd", "mp4", 1}) == rt::encoded_high);
  assert (c.classify ({"2", "PROXY", "mp4", 1}) == rt::encoded_low);
  assert (c.classify ({"3", "ftrackreview-mp4", "mp4", 1}) == rt::other);

  assert (c.encode_name ("Proxy-SD"));
  assert (!c.encode_name ("main"));
}

static void
test_group ()
{
  representation_catalog c;

  vector<candidate> cs {
    {"a", "thumbnail", "jpg", 1},
    {"b", "ftrackreview-mp4", "mp4", 2},
    {"c", "main", "mov", 3, "", true},
    {"d", "sidecar", "txt", 4},
    {"e", "ftrackreview-mp4", "mp4", 5}};

  representation_groups g (c.group_by_type (cs));

  assert (g.size () == 3);
  assert (g.count (rt::encoded_high) == 0);

  // First-seen order is preserved within a bucket.
  //
  assert (g[rt::other].size () == 2);
  assert (g[rt::other][0].id == "a");
  assert (g[rt::other][1].id == "d");

  assert (g[rt::encoded_low].size () == 2);
  assert (g[rt::encoded_low][0].id == "b");
  assert (g[rt::encoded_low][1].id == "e");

  assert (g[rt::original].size () == 1);

  assert (c.group_by_type ({}).empty ());
}

static void
test_extension ()
{
  assert (candidate ("1", "x", ".MOV", 0).extension () == "mov");
  assert (candidate ("1", "x", "exr", 0).extension () == "exr");
  assert (candidate ("1", "plate.DPX", "", 0).extension () == "dpx");
  assert (candidate ("1", "plate", "", 0).extension () == "");
  assert (candidate ("1", ".hidden", "", 0).extension () == "");
}

static void
test_print ()
{
  ostringstream o;
  o << rt::encoded_high << ' ' << media_preference::original;
  assert (o.str () == "encoded_high original");

  assert (to_media_preference ("Encoded") == media_preference::encoded);

  bool thrown (false);
  try
  {
    to_media_preference ("best");
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);
}

int
main ()
{
  test_classify ();
  test_tokens ();
  test_group ();
  test_extension ();
  test_print ();
}
