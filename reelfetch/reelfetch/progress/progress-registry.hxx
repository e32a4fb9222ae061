#pragma once

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <reelfetch/progress/progress-types.hxx>

namespace reelfetch
{
  // Progress observer interface.
  //
  // Called with a copy of every record that changed, terminal ones included.
  // Calls are made outside of the registry lock from whichever thread made
  // the change, so an observer may call back into the registry.
  //
  class progress_observer
  {
  public:
    virtual
    ~progress_observer () = default;

    virtual void
    progress_changed (const transfer_progress&) = 0;
  };

  // Table of in-flight transfers keyed by task identity.
  //
  // A record is created by start(), mutated by its owning transfer through
  // update(), and removed once the transfer reaches a terminal state. All
  // operations are thread-safe.
  //
  class progress_registry
  {
  public:
    progress_registry () = default;

    progress_registry (const progress_registry&) = delete;
    progress_registry& operator= (const progress_registry&) = delete;

    // Register a transfer in the pending state, replacing any stale record
    // with the same id.
    //
    void
    start (const std::string& task_id, const std::string& filename);

    // Merge the update into the record. Unknown ids are ignored. The byte
    // count never goes backwards: a smaller value is dropped.
    //
    void
    update (const std::string& task_id, const progress_update&);

    void
    remove (const std::string& task_id);

    // Return a consistent copy of all records in the order they were
    // started.
    //
    std::vector<transfer_progress>
    snapshot () const;

    std::optional<transfer_progress>
    find (const std::string& task_id) const;

    std::size_t
    size () const;

    bool
    empty () const
    {
      return size () == 0;
    }

    // Observers are held weakly. An expired one is dropped on the next
    // notification.
    //
    void
    subscribe (std::shared_ptr<progress_observer>);

    void
    unsubscribe (const std::shared_ptr<progress_observer>&);

  private:
    void
    notify (const transfer_progress&);

  private:
    struct entry
    {
      std::uint64_t sequence;
      transfer_progress progress;
    };

    mutable std::mutex mutex_;
    std::map<std::string, entry> entries_;
    std::uint64_t sequence_ {0};
    std::vector<std::weak_ptr<progress_observer>> observers_;
  };
}
