/*
The OpenTRV project licenses this file to you
under the Apache Licence, Version 2.0 (the "Licence");
you may not use this file except in compliance
with the Licence. You may obtain a copy of the Licence at

http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the Licence is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied. See the Licence for the
specific language governing permissions and limitations
under the Licence.

Author(s) / Copyright (s): Damon Hart-Davis 2017--2018
*/

/*
 Concurrency support for the occupancy engine.

 Small lock-free helpers around std::atomic,
 an atomically-replaceable read-only snapshot,
 and a cancellation token with an optional deadline
 for long-running background work.
 */

#ifndef OTAREAOCC_CONCURRENCY_H
#define OTAREAOCC_CONCURRENCY_H

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <memory>


namespace OTAREAOCC
{


// Atomic type used for simple lock-free shared values.
template <typename T> using OTAtomic_t = std::atomic<T>;
typedef OTAtomic_t<uint8_t> Atomic_UInt8T;

// Helper method: safely decrements Atomic_UInt8T arg if not zero, ie does not wrap around.
// Does nothing if already zero.
// May do nothing if interleaved with other activity.
// Does not loop or spin or block.
inline void safeDecIfNZWeak(Atomic_UInt8T &v)
  {
  uint8_t o = v.load();
  if(0 == o) { return; }
  const uint8_t om1 = o - 1U;
  v.compare_exchange_strong(o, om1);
  }

// Helper method: safely increments Atomic_UInt8T arg if not maximum value, ie does not wrap around.
// Does nothing if already maximum (0xff).
// May do nothing if interleaved with other activity.
inline void safeIncIfNotFFWeak(Atomic_UInt8T &v)
  {
  uint8_t o = v.load();
  if(0xff == o) { return; }
  const uint8_t op1 = o + 1U;
  v.compare_exchange_strong(o, op1);
  }


// Holds a shared read-only T that can be replaced wholesale.
// A reader sees either the whole old or the whole new value, never a mix,
// and may keep using what it loaded after a replacement.
// Thread-safe for concurrent load()/store().
template <class T>
class AtomicSnapshot final
  {
  private:
    std::shared_ptr<const T> p;

  public:
    AtomicSnapshot() { }
    explicit AtomicSnapshot(std::shared_ptr<const T> initial) : p(std::move(initial)) { }
    AtomicSnapshot(const AtomicSnapshot &) = delete;
    AtomicSnapshot &operator=(const AtomicSnapshot &) = delete;

    // Current value; may be NULL if nothing stored yet.
    std::shared_ptr<const T> load() const { return(std::atomic_load(&p)); }

    // Replace the current value.
    void store(std::shared_ptr<const T> newValue) { std::atomic_store(&p, std::move(newValue)); }
  };


// Co-operative cancellation for long-running background work.
// The worker polls shouldStop() at safe points;
// another thread may cancel() at any time.
// An optional deadline is fixed at construction from a monotonic clock.
class CancellationToken final
  {
  private:
    typedef std::chrono::steady_clock clock_t;
    OTAtomic_t<bool> cancelled;
    const bool hasDeadline;
    const clock_t::time_point deadline;

  public:
    // If timeout_ms is 0 there is no deadline.
    explicit CancellationToken(const uint32_t timeout_ms = 0)
      : cancelled(false), hasDeadline(0 != timeout_ms),
        deadline(clock_t::now() + std::chrono::milliseconds(timeout_ms)) { }
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    // Request that the work stop as soon as possible.
    void cancel() { cancelled.store(true); }
    // True once cancel() has been called.
    bool isCancelled() const { return(cancelled.load()); }
    // True if there is a deadline and it has passed.
    bool isExpired() const { return(hasDeadline && (clock_t::now() >= deadline)); }
    // True if the work should be abandoned for either reason.
    bool shouldStop() const { return(isCancelled() || isExpired()); }
  };


}

#endif
