#ifndef BACKOFF_HPP
#define BACKOFF_HPP

#include <algorithm>
#include <chrono>
#include <thread>

namespace Utils {

struct BackoffPolicy {
  std::chrono::milliseconds initial_delay{100};
  std::chrono::milliseconds max_delay{2000};
  double multiplier = 2.0;
};

/**
 * Repeatedly invokes `attempt` until it yields an engaged optional or the
 * deadline passes. The delay between attempts grows geometrically up to
 * `max_delay` and is clipped so that no sleep crosses the deadline.
 * @return the first engaged result, or an empty optional on expiry
 */
template <typename Attempt>
auto poll_with_backoff(Attempt &&attempt,
                       std::chrono::steady_clock::time_point deadline,
                       const BackoffPolicy &policy = BackoffPolicy{})
    -> decltype(attempt()) {
  auto delay = policy.initial_delay;
  while (true) {
    auto result = attempt();
    if (result)
      return result;

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return {};

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(delay, remaining));

    auto next = std::chrono::milliseconds(
        static_cast<long long>(delay.count() * policy.multiplier));
    delay = std::min(std::max(next, policy.initial_delay), policy.max_delay);
  }
}

} // namespace Utils

#endif // BACKOFF_HPP
