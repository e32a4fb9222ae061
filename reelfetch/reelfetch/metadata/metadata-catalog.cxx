#include <reelfetch/metadata/metadata-catalog.hxx>

#include <cctype>
#include <limits>
#include <fstream>
#include <utility>
#include <iterator>
#include <stdexcept>

#include <boost/json/parse.hpp>

#include <reelfetch/http/http-url.hxx>
#include <reelfetch/http/http-response.hxx>

using namespace std;

namespace reelfetch
{
  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return s;
  }

  // Return the string member or empty string if there is none.
  //
  static string
  string_member (const json::object& o, const char* n)
  {
    const json::value* v (o.if_contains (n));
    return v != nullptr && !v->is_null () ? json::value_to<string> (*v)
                                          : string ();
  }

  // Return the non-negative integer member or 0 if there is none.
  //
  static uint64_t
  number_member (const json::object& o, const char* n)
  {
    const json::value* v (o.if_contains (n));

    if (v == nullptr || v->is_null ())
      return 0;

    if (v->is_uint64 ())
      return v->as_uint64 ();

    if (v->is_int64 ())
    {
      int64_t i (v->as_int64 ());

      if (i < 0)
        throw invalid_argument (string ("negative ") + n);

      return static_cast<uint64_t> (i);
    }

    throw invalid_argument (string (n) + " must be an integer");
  }

  static runtime_error
  parse_error (const exception& e)
  {
    return runtime_error (string ("failed to parse catalog: ") + e.what ());
  }

  bool
  media_extension (const string& e)
  {
    static const char* const es[] = {
      "mov", "mp4", "avi", "mkv", "mxf", "r3d", "dpx", "exr"};

    for (const char* x: es)
      if (e == x)
        return true;

    return false;
  }

  json_metadata_source::
  json_metadata_source (const string& d, representation_catalog c)
    : catalog_ (move (c))
  {
    json::value jv;

    try
    {
      jv = json::parse (d);
    }
    catch (const exception& e)
    {
      throw parse_error (e);
    }

    parse (jv);
  }

  json_metadata_source::
  json_metadata_source (const json::value& jv, representation_catalog c)
    : catalog_ (move (c))
  {
    parse (jv);
  }

  void json_metadata_source::
  parse (const json::value& jv)
  {
    try
    {
      if (!jv.is_object ())
        throw invalid_argument ("catalog JSON must be an object");

      const json::object& o (jv.as_object ());

      server_ = string_member (o, "server");
      while (!server_.empty () && server_.back () == '/')
        server_.pop_back ();

      if (const json::value* v = o.if_contains ("headers"))
      {
        for (const auto& kv: v->as_object ())
          headers_.set (string (kv.key ()),
                        json::value_to<string> (kv.value ()));
      }

      const json::value* as (o.if_contains ("assets"));

      if (as == nullptr)
        throw invalid_argument ("missing assets array");

      for (const json::value& a: as->as_array ())
      {
        if (!a.is_object ())
          throw invalid_argument ("asset entry must be an object");

        parse_asset (a.as_object ());
      }
    }
    catch (const exception& e)
    {
      throw parse_error (e);
    }
  }

  void json_metadata_source::
  parse_asset (const json::object& o)
  {
    logical_asset a;
    a.id = json::value_to<string> (o.at ("id"));

    if (a.id.empty ())
      throw invalid_argument ("empty asset id");

    if (candidates_.find (a.id) != candidates_.end ())
      throw invalid_argument ("duplicate asset id '" + a.id + '\'');

    a.parent = string_member (o, "parent");
    a.name = string_member (o, "name");
    a.type = string_member (o, "type");

    uint64_t n (number_member (o, "version"));
    if (n > numeric_limits<uint32_t>::max ())
      throw invalid_argument ("version of asset '" + a.id + "' out of range");
    a.version = static_cast<uint32_t> (n);

    vector<candidate> cs;

    if (const json::value* v = o.if_contains ("components"))
    {
      for (const json::value& c: v->as_array ())
      {
        if (!c.is_object ())
          throw invalid_argument ("component entry must be an object");

        cs.push_back (parse_component (c.as_object (), a.id));
      }
    }

    candidates_.emplace (a.id, move (cs));
    assets_.push_back (move (a));
  }

  candidate json_metadata_source::
  parse_component (const json::object& o, const string& asset)
  {
    candidate c;
    c.id = json::value_to<string> (o.at ("id"));

    if (c.id.empty ())
      throw invalid_argument ("empty component id in asset '" + asset + '\'');

    if (urls_.find (c.id) != urls_.end ())
      throw invalid_argument ("duplicate component id '" + c.id + '\'');

    c.name = string_member (o, "name");
    c.file_type = string_member (o, "file_type");
    c.size = number_member (o, "size");
    c.asset_id = asset;

    if (const json::value* v = o.if_contains ("canonical"))
      c.canonical = v->as_bool ();
    else
      c.canonical = !catalog_.encode_name (c.name) &&
                    media_extension (c.extension ());

    urls_.emplace (c.id, string_member (o, "url"));
    return c;
  }

  const vector<candidate>& json_metadata_source::
  candidates (const string& id) const
  {
    static const vector<candidate> empty;

    auto i (candidates_.find (id));
    return i != candidates_.end () ? i->second : empty;
  }

  optional<download_locator> json_metadata_source::
  locator (const string& id) const
  {
    auto i (urls_.find (id));

    if (i == urls_.end ())
      return nullopt;

    download_locator r;

    if (!i->second.empty ())
      r.url = i->second;
    else if (!server_.empty ())
      r.url = server_ + "/component/" + id + "/download";
    else
      return nullopt;

    r.headers = headers_;
    return r;
  }

  asio::awaitable<vector<logical_asset>> json_metadata_source::
  fetch_assets ()
  {
    co_return assets_;
  }

  asio::awaitable<vector<candidate>> json_metadata_source::
  fetch_candidates (const string& id)
  {
    co_return candidates (id);
  }

  asio::awaitable<optional<download_locator>> json_metadata_source::
  resolve_download_locator (const string& id)
  {
    co_return locator (id);
  }

  asio::awaitable<unique_ptr<json_metadata_source>>
  load_catalog (asio::io_context& ioc,
                const string& l,
                const http_headers& hs,
                const http_client_traits<>& t)
  {
    string d;

    if (http_url (l))
    {
      http_client c (ioc, t);
      http_response r (co_await c.get (l, hs));

      if (!r.is_success ())
        throw http_status_error (r.status);

      d = move (r.body);
    }
    else
    {
      ifstream ifs (l, ios::binary);

      if (!ifs)
        throw runtime_error ("unable to open catalog " + l);

      d.assign (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());

      if (ifs.bad ())
        throw runtime_error ("unable to read catalog " + l);
    }

    co_return make_unique<json_metadata_source> (d);
  }

  vector<logical_asset>
  match_parent (const vector<logical_asset>& as, const string& pattern)
  {
    string p (lower (pattern));
    vector<logical_asset> r;

    for (const logical_asset& a: as)
      if (lower (a.parent).find (p) != string::npos)
        r.push_back (a);

    return r;
  }

  // Return the rank of the asset type, lower being preferred.
  //
  static size_t
  type_rank (const string& t)
  {
    static const char* const ts[] = {
      "review", "comp", "render", "movie", "video", "media"};

    string l (lower (t));

    size_t i (0);
    for (; i != sizeof (ts) / sizeof (ts[0]); ++i)
      if (l == ts[i])
        break;

    return i;
  }

  vector<logical_asset>
  latest_per_parent (const vector<logical_asset>& as)
  {
    // Parents in the order of first appearance, each with its best asset so
    // far.
    //
    vector<size_t> best;
    map<string, size_t> index; // Parent to position in best.

    for (size_t i (0); i != as.size (); ++i)
    {
      const logical_asset& a (as[i]);
      auto p (index.find (a.parent));

      if (p == index.end ())
      {
        index.emplace (a.parent, best.size ());
        best.push_back (i);
        continue;
      }

      const logical_asset& b (as[best[p->second]]);
      size_t ar (type_rank (a.type)), br (type_rank (b.type));

      if (ar < br || (ar == br && a.version > b.version))
        best[p->second] = i;
    }

    vector<logical_asset> r;
    r.reserve (best.size ());

    for (size_t i: best)
      r.push_back (as[i]);

    return r;
  }
}
