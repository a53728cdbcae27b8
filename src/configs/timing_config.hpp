// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace BeanTrader {
namespace Config {

struct TimingConfig {
    int cycle_interval_sec = 10 * 60;        // Target period between cycle starts
    long long min_cycle_sleep_ms = 100;      // Floor for the sleep after a slow cycle
};

} // namespace Config
} // namespace BeanTrader

#endif // TIMING_CONFIG_HPP
