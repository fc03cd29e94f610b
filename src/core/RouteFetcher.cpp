#include "core/RouteFetcher.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <system_error>
#include <thread>

namespace {
// Joins every started worker on scope exit, exceptional paths included.
struct ThreadJoiner {
  std::vector<std::thread> &threads;
  ~ThreadJoiner() {
    for (auto &th : threads)
      if (th.joinable())
        th.join();
  }
};
} // namespace

static std::string leg_name(const Segment &s) {
  return "leg " + std::to_string(s.index) + " (" + s.origin.name + " -> " +
         s.destination.name + ")";
}

long long RouteFetcher::backoff_delay_ms(int attempt) const {
  long long wait = P.backoff_ms;
  for (int i = 1; i < attempt && wait < P.max_backoff_ms; ++i)
    wait *= 2;
  return std::min<long long>(wait, P.max_backoff_ms);
}

FetchSlot RouteFetcher::fetch_one(const Segment &segment) const {
  FetchSlot slot;
  slot.failure.segment = segment;

  const int max_attempts = 1 + P.max_retries;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    slot.failure.attempts = attempt;
    try {
      slot.route = provider_.route(segment);
      slot.ok = true;
      return slot;
    } catch (const NoRouteFound &e) {
      slot.failure.kind = FailureKind::NoRouteFound;
      slot.failure.reason = e.what();
      std::cerr << "[fetch] " << leg_name(segment)
                << " has no route: " << e.what() << "\n";
      return slot;
    } catch (const RoutingUnavailable &e) {
      slot.failure.kind = FailureKind::RoutingUnavailable;
      slot.failure.reason = e.what();
    } catch (const std::exception &e) {
      // anything else from the provider is treated as a transient failure
      slot.failure.kind = FailureKind::RoutingUnavailable;
      slot.failure.reason = e.what();
    }

    if (attempt < max_attempts) {
      const long long wait_ms = backoff_delay_ms(attempt);
      std::cerr << "[fetch] " << leg_name(segment) << " attempt " << attempt
                << " failed: " << slot.failure.reason << ", retrying in "
                << wait_ms << "ms\n";
      if (wait_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }
  }
  std::cerr << "[fetch] " << leg_name(segment) << " gave up after "
            << slot.failure.attempts << " attempts: " << slot.failure.reason
            << "\n";
  return slot;
}

FetchOutcome RouteFetcher::fetch_all(const std::vector<Segment> &segments) const {
  std::vector<FetchSlot> slots(segments.size());

  // Avoid launching lots of threads for tiny batches.
  const int threads =
      std::min<int>(P.max_concurrency, static_cast<int>(segments.size()));
  if (threads <= 1) {
    for (std::size_t i = 0; i < segments.size(); ++i)
      slots[i] = fetch_one(segments[i]);
  } else {
    std::atomic<std::size_t> next{0};
    auto work = [&]() {
      for (;;) {
        const std::size_t i = next.fetch_add(1);
        if (i >= segments.size())
          break;
        slots[i] = fetch_one(segments[i]);
      }
    };

    // the calling thread is one of the workers
    std::vector<std::thread> pool;
    ThreadJoiner joiner{pool};
    pool.reserve(static_cast<std::size_t>(threads - 1));
    for (int t = 1; t < threads; ++t) {
      try {
        pool.emplace_back(work);
      } catch (const std::system_error &e) {
        std::cerr << "[fetch] started " << pool.size() + 1 << "/" << threads
                  << " workers: " << e.what() << "\n";
        break;
      }
    }
    work();
  }

  FetchOutcome out;
  for (auto &slot : slots) {
    if (slot.ok)
      out.routes.push_back(std::move(slot.route));
    else
      out.failures.push_back(std::move(slot.failure));
  }
  return out;
}
