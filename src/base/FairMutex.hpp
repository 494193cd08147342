#ifndef __TT_FAIR_MUTEX__
#define __TT_FAIR_MUTEX__

#include "Headers.hpp"

namespace tt {
/**
 * @brief A ticket lock that owns the value it guards.
 *
 * Every `lock()` call takes a ticket and waits until its number is served, so
 * a session thread that relocks in a tight loop cannot starve the UI thread
 * (and vice versa).  The value is reachable only through a `Guard`.
 */
template <typename T>
class FairMutex {
 public:
  /** @brief RAII access to the guarded value; releases the ticket on scope
   * exit. */
  class Guard {
   public:
    explicit Guard(FairMutex<T> *_owner) : owner(_owner) {}
    Guard(Guard &&other) : owner(other.owner) { other.owner = nullptr; }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    ~Guard() {
      if (owner) {
        owner->release();
      }
    }

    T &operator*() { return owner->value; }
    T *operator->() { return &owner->value; }

   private:
    FairMutex<T> *owner;
  };

  template <typename... Args>
  explicit FairMutex(Args &&... args)
      : value(std::forward<Args>(args)...), nextTicket(0), nowServing(0) {}

  FairMutex(const FairMutex &) = delete;
  FairMutex &operator=(const FairMutex &) = delete;

  /** @brief Blocks until every earlier caller has released the lock. */
  Guard lock() {
    unique_lock<mutex> lk(ticketMutex);
    uint64_t ticket = nextTicket++;
    served.wait(lk, [this, ticket] { return nowServing == ticket; });
    return Guard(this);
  }

  /** @brief Number of callers currently holding or waiting for the lock. */
  uint64_t contention() {
    lock_guard<mutex> lk(ticketMutex);
    return nextTicket - nowServing;
  }

 private:
  void release() {
    {
      lock_guard<mutex> lk(ticketMutex);
      nowServing++;
    }
    served.notify_all();
  }

  T value;
  mutex ticketMutex;
  condition_variable served;
  uint64_t nextTicket;
  uint64_t nowServing;
};
}  // namespace tt

#endif  // __TT_FAIR_MUTEX__
