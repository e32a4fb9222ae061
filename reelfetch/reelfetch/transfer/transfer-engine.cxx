#include <reelfetch/transfer/transfer-engine.hxx>

#include <exception>
#include <system_error>

using namespace std;

namespace reelfetch
{
  static http_client_traits<>
  client_traits (const transfer_options& o)
  {
    http_client_traits<> r;
    r.connect_timeout = o.connect_timeout;
    r.request_timeout = o.idle_timeout;
    r.verify_ssl = o.verify_ssl;
    r.ssl_cert_file = o.ssl_cert_file;
    return r;
  }

  transfer_engine::
  transfer_engine (asio::io_context& ioc,
                   progress_registry& r,
                   const transfer_options& o)
    : registry_ (r),
      options_ (o),
      http_ (make_unique<http_client> (ioc, client_traits (o)))
  {
  }

  fs::path transfer_engine::
  partial_path (const download_task& t)
  {
    return t.directory / (t.filename + ".part");
  }

  // Map a network or stream error to the transfer error taxonomy.
  //
  static transfer_error
  network_error (const boost::system::system_error& e)
  {
    const boost::system::error_code& ec (e.code ());

    if (ec == beast::error::timeout || ec == asio::error::timed_out)
      return transfer_error (transfer_error_kind::timeout,
                             "timed out: " + ec.message ());

    return transfer_error (transfer_error_kind::io_failure,
                           string ("I/O failure: ") + e.what ());
  }

  asio::awaitable<transfer_result> transfer_engine::
  transfer (const download_task& t)
  {
    using ts = transfer_status;
    using tek = transfer_error_kind;

    string id (t.id ());
    fs::path p (t.path ());
    fs::path tmp (partial_path (t));

    registry_.start (id, t.filename);

    // Note that we cannot co_await (nor do anything substantial) in a
    // handler so we just capture the failure and handle it below.
    //
    exception_ptr ep;
    uint64_t n (0);

    try
    {
      error_code ec;
      fs::create_directories (t.directory, ec);

      if (ec)
        throw transfer_error (tek::io_failure,
                              "I/O failure: unable to create " +
                              t.directory.string () + ": " + ec.message ());

      registry_.update (id, {nullopt, nullopt, ts::downloading});

      auto deadline (options_.transfer_timeout.count () != 0
                     ? chrono::steady_clock::now () + options_.transfer_timeout
                     : chrono::steady_clock::time_point::max ());

      n = co_await http_->download (
        t.url,
        t.headers,
        tmp,
        [this, &id] (uint64_t b, uint64_t tot)
        {
          registry_.update (id, {b, tot, nullopt});
        },
        deadline);

      fs::rename (tmp, p, ec);

      if (ec)
        throw transfer_error (tek::io_failure,
                              "I/O failure: unable to move " +
                              tmp.string () + " to " + p.string () + ": " +
                              ec.message ());
    }
    catch (const transfer_error&)
    {
      ep = current_exception ();
    }
    catch (const http_status_error& e)
    {
      ep = make_exception_ptr (transfer_error (e));
    }
    catch (const boost::system::system_error& e)
    {
      ep = make_exception_ptr (network_error (e));
    }
    catch (const invalid_argument&)
    {
      // Malformed locator. This is the caller's bug, not a transfer failure,
      // so let it through as is.
      //
      ep = current_exception ();
    }
    catch (const runtime_error& e)
    {
      ep = make_exception_ptr (
        transfer_error (tek::io_failure, string ("I/O failure: ") + e.what ()));
    }
    catch (const exception&)
    {
      ep = current_exception ();
    }

    if (ep)
    {
      error_code ec;
      fs::remove (tmp, ec);

      registry_.update (id, {nullopt, nullopt, ts::failed});
      registry_.remove (id);

      rethrow_exception (ep);
    }

    registry_.update (id, {n, nullopt, ts::completed});
    registry_.remove (id);

    co_return transfer_result {move (p), n};
  }
}
