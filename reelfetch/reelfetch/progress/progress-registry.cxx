#include <reelfetch/progress/progress-registry.hxx>

#include <algorithm>

using namespace std;

namespace reelfetch
{
  void progress_registry::
  start (const string& id, const string& fn)
  {
    transfer_progress p;
    p.task_id = id;
    p.filename = fn;
    p.status = transfer_status::pending;

    {
      lock_guard<mutex> l (mutex_);
      entries_[id] = entry {sequence_++, p};
    }

    notify (p);
  }

  void progress_registry::
  update (const string& id, const progress_update& u)
  {
    transfer_progress p;

    {
      lock_guard<mutex> l (mutex_);

      auto i (entries_.find (id));
      if (i == entries_.end ())
        return;

      transfer_progress& e (i->second.progress);

      if (u.bytes_transferred && *u.bytes_transferred > e.bytes_transferred)
        e.bytes_transferred = *u.bytes_transferred;

      if (u.total_bytes)
        e.total_bytes = *u.total_bytes;

      if (u.status)
        e.status = *u.status;

      p = e;
    }

    notify (p);
  }

  void progress_registry::
  remove (const string& id)
  {
    lock_guard<mutex> l (mutex_);
    entries_.erase (id);
  }

  vector<transfer_progress> progress_registry::
  snapshot () const
  {
    vector<const entry*> es;
    vector<transfer_progress> r;

    lock_guard<mutex> l (mutex_);

    es.reserve (entries_.size ());
    for (const auto& e: entries_)
      es.push_back (&e.second);

    sort (es.begin (), es.end (),
          [] (const entry* x, const entry* y)
          {
            return x->sequence < y->sequence;
          });

    r.reserve (es.size ());
    for (const entry* e: es)
      r.push_back (e->progress);

    return r;
  }

  optional<transfer_progress> progress_registry::
  find (const string& id) const
  {
    lock_guard<mutex> l (mutex_);

    auto i (entries_.find (id));
    if (i == entries_.end ())
      return nullopt;

    return i->second.progress;
  }

  size_t progress_registry::
  size () const
  {
    lock_guard<mutex> l (mutex_);
    return entries_.size ();
  }

  void progress_registry::
  subscribe (shared_ptr<progress_observer> o)
  {
    lock_guard<mutex> l (mutex_);
    observers_.push_back (move (o));
  }

  void progress_registry::
  unsubscribe (const shared_ptr<progress_observer>& o)
  {
    lock_guard<mutex> l (mutex_);

    observers_.erase (
      remove_if (observers_.begin (), observers_.end (),
                 [&o] (const weak_ptr<progress_observer>& w)
                 {
                   shared_ptr<progress_observer> s (w.lock ());
                   return s == nullptr || s == o;
                 }),
      observers_.end ());
  }

  void progress_registry::
  notify (const transfer_progress& p)
  {
    // Collect live observers under the lock, call them without it.
    //
    vector<shared_ptr<progress_observer>> os;
    {
      lock_guard<mutex> l (mutex_);

      if (observers_.empty ())
        return;

      os.reserve (observers_.size ());
      for (auto i (observers_.begin ()); i != observers_.end (); )
      {
        if (shared_ptr<progress_observer> s = i->lock ())
        {
          os.push_back (move (s));
          ++i;
        }
        else
          i = observers_.erase (i);
      }
    }

    for (const auto& o: os)
      o->progress_changed (p);
  }
}
