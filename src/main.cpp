#include "api/exchange_client.hpp"
#include "api/http_transport.hpp"
#include "api/rate_tracker.hpp"
#include "configs/config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/startup_logs.hpp"
#include "storage/csv_history_store.hpp"
#include "system/trading_loop.hpp"
#include "trader/execution/trade_executor.hpp"
#include "trader/market_state/market_history.hpp"
#include "trader/market_state/market_state_cache.hpp"
#include "trader/strategy/strategy_factory.hpp"
#include "trader/trading_cycle.hpp"
#include "utils/clock.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

using namespace BeanTrader;

// =============================================================================
// SHUTDOWN SIGNAL - SIGINT/SIGTERM CLEAR THE TRADING LOOP'S RUNNING FLAG
// =============================================================================
class ShutdownSignal {
public:
    // Registers the handlers; running must outlive the process's signal handling
    static void install(std::atomic<bool>& running) {
        running_flag_pointer().store(&running);
        std::signal(SIGINT, &ShutdownSignal::handle);
        std::signal(SIGTERM, &ShutdownSignal::handle);
    }

    // 0 until a shutdown signal has arrived
    static int received_signal() {
        return last_signal().load();
    }

private:
    // Only lock-free atomic stores happen inside the handler
    static void handle(int signal_number) {
        last_signal().store(signal_number);
        std::atomic<bool>* running = running_flag_pointer().load();
        if (running != nullptr) {
            running->store(false);
        }
    }

    static std::atomic<std::atomic<bool>*>& running_flag_pointer() {
        static std::atomic<std::atomic<bool>*> instance{nullptr};
        return instance;
    }

    static std::atomic<int>& last_signal() {
        static std::atomic<int> instance{0};
        return instance;
    }
};

// Command-line argument, then BEAN_TRADER_CONFIG, then the default location
static std::string resolve_config_path(int argc, char* argv[]) {
    if (argc > 1 && argv[1] != nullptr && argv[1][0] != '\0') {
        return argv[1];
    }
    const char* environment_path = std::getenv("BEAN_TRADER_CONFIG");
    if (environment_path != nullptr && environment_path[0] != '\0') {
        return environment_path;
    }
    return "config/runtime_config.csv";
}

static int run_trading_system(const Config::SystemConfig& config, std::atomic<bool>& running) {
    Logging::StartupLogs::log_application_header();
    Logging::StartupLogs::log_runtime_configuration(config);
    Logging::StartupLogs::log_strategy_configuration(config.strategy);

    SystemClock system_clock;
    API::CurlHttpTransport http_transport;
    API::RateTracker rate_tracker(system_clock);
    API::ExchangeClient exchange_client(config.api, http_transport, rate_tracker);

    Storage::CsvHistoryStore history_store(config.storage);
    Logging::StartupLogs::log_history_store_opened(history_store.get_history_file_path(),
                                                   history_store.snapshot_count(), history_store.trade_count());

    Core::MarketStateCache state_cache(exchange_client, system_clock);
    Core::MarketHistory market_history(history_store);
    std::unique_ptr<Core::DecisionStrategy> decision_strategy = Core::create_decision_strategy(config.strategy);

    Core::TradeExecutor trade_executor(
        Core::TradeExecutor::Dependencies{exchange_client, state_cache, history_store, rate_tracker, system_clock, &running},
        config.exchange, config.execution);

    Core::TradingCycle trading_cycle(
        Core::TradingCycle::Dependencies{state_cache, market_history, history_store, *decision_strategy, trade_executor, system_clock});

    System::TradingLoop trading_loop(trading_cycle, system_clock, config.timing, running);
    int exit_code = trading_loop.run();
    if (ShutdownSignal::received_signal() != 0) {
        Logging::log_message("Shutdown requested by signal " + std::to_string(ShutdownSignal::received_signal()), "");
    }

    Logging::StartupLogs::log_shutdown(trading_cycle.get_cycle_count(), exit_code);
    return exit_code;
}

int main(int argc, char* argv[]) {
    std::atomic<bool> running{true};
    ShutdownSignal::install(running);

    Config::SystemConfig config;
    const std::string config_path = resolve_config_path(argc, argv);
    if (Config::load_system_config(config, config_path) != 0) {
        return 1;
    }

    std::string config_error;
    if (!Config::validate_config(config, config_error)) {
        fprintf(stderr, "Config error: %s\n", config_error.c_str());
        return 1;
    }

    Logging::LoggingContext logging_context;
    int exit_code = 1;
    try {
        Logging::initialize_application_logging(logging_context, config.logging);
        exit_code = run_trading_system(config, running);
    } catch (const std::exception& exception_error) {
        Logging::log_message("Fatal error: " + std::string(exception_error.what()), "");
        exit_code = 1;
    }

    Logging::shutdown_application_logging(logging_context);
    Logging::clear_logging_context();
    return exit_code;
}
