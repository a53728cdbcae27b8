#ifndef EXECUTION_CONFIG_HPP
#define EXECUTION_CONFIG_HPP

namespace BeanTrader {
namespace Config {

struct ExecutionConfig {
    // Backoff after a rate-limited chunk
    long long initial_backoff_ms = 30 * 1000;
    long long max_backoff_ms = 5 * 60 * 1000;

    // Proactive throttling when close to the call budget
    int throttle_margin = 5;                  // Calls below the budget that trigger the pause
    long long throttle_delay_ms = 1000;

    // Pacing between consecutive chunks of one order
    long long inter_chunk_delay_ms = 50;
};

} // namespace Config
} // namespace BeanTrader

#endif // EXECUTION_CONFIG_HPP
