#include <reelfetch/transfer/transfer-types.hxx>

using namespace std;

namespace reelfetch
{
  transfer_error::
  transfer_error (transfer_error_kind k, const string& w)
    : runtime_error (w), kind_ (k)
  {
  }

  transfer_error::
  transfer_error (const http_status_error& e)
    : runtime_error (e.what ()),
      kind_ (transfer_error_kind::http_status),
      status_ (e.status ())
  {
  }
}
