#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "api/http_transport.hpp"
#include "api/market_api_interface.hpp"
#include "api/request_errors.hpp"
#include "storage/history_store.hpp"
#include "utils/clock.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace BeanTrader {
namespace Testing {

// Simulated time. Sleeping advances the clock instantly and is recorded.
class ManualClock : public Clock {
public:
    explicit ManualClock(long long start_milliseconds = 1700000000000LL) : current_milliseconds(start_milliseconds) {}

    long long now_milliseconds() const override { return current_milliseconds; }

    void sleep_for_milliseconds(long long duration_milliseconds) override {
        recorded_sleeps.push_back(duration_milliseconds);
        current_milliseconds += duration_milliseconds;
        if (on_sleep) {
            on_sleep(duration_milliseconds);
        }
    }

    void advance(long long duration_milliseconds) { current_milliseconds += duration_milliseconds; }

    long long total_slept() const {
        long long total = 0;
        for (long long sleep_ms : recorded_sleeps) total += sleep_ms;
        return total;
    }

    std::vector<long long> recorded_sleeps;
    std::function<void(long long)> on_sleep;

private:
    long long current_milliseconds;
};

enum class ScriptedOutcome { Success, RateLimited, RequestFailed, Fatal };

inline void raise_scripted_failure(ScriptedOutcome outcome, const std::string& operation) {
    switch (outcome) {
        case ScriptedOutcome::Success: return;
        case ScriptedOutcome::RateLimited: throw API::RateLimitError("rate limit exceeded for " + operation);
        case ScriptedOutcome::RequestFailed: throw API::RequestError("response 500 for " + operation);
        case ScriptedOutcome::Fatal: throw std::logic_error("fatal failure in " + operation);
    }
}

/**
 * In-memory exchange. Fetches return the current state; scripted outcomes are
 * consumed one per call, and successful submissions move beans and units.
 */
class FakeMarketApi : public API::MarketApiInterface {
public:
    long long price = 50;
    long long owned_units = 0;
    long long balance = 1000;

    int price_fetches = 0;
    int owned_fetches = 0;
    int balance_fetches = 0;
    std::vector<long long> buy_submissions;      // Successful buy chunk sizes
    std::vector<long long> sell_submissions;     // Successful sell chunk sizes
    int submit_attempts = 0;

    std::deque<ScriptedOutcome> submit_outcomes;
    std::deque<ScriptedOutcome> price_outcomes;
    std::deque<ScriptedOutcome> owned_outcomes;
    std::deque<ScriptedOutcome> balance_outcomes;

    // Applied to price after the next failed submission (simulates a market move during backoff)
    std::deque<long long> price_after_failed_submit;

    long long fetch_price() override {
        price_fetches++;
        raise_scripted_failure(next_outcome(price_outcomes), "fetch_price");
        return price;
    }

    long long fetch_owned_units() override {
        owned_fetches++;
        raise_scripted_failure(next_outcome(owned_outcomes), "fetch_owned_units");
        return owned_units;
    }

    long long fetch_balance() override {
        balance_fetches++;
        raise_scripted_failure(next_outcome(balance_outcomes), "fetch_balance");
        return balance;
    }

    void submit_buy(long long units) override {
        submit("buy", units);
        buy_submissions.push_back(units);
        owned_units += units;
        balance -= units * price;
    }

    void submit_sell(long long units) override {
        submit("sell", units);
        sell_submissions.push_back(units);
        owned_units -= units;
        balance += units * price;
    }

    int total_fetches() const { return price_fetches + owned_fetches + balance_fetches; }

private:
    static ScriptedOutcome next_outcome(std::deque<ScriptedOutcome>& outcomes) {
        if (outcomes.empty()) {
            return ScriptedOutcome::Success;
        }
        ScriptedOutcome outcome = outcomes.front();
        outcomes.pop_front();
        return outcome;
    }

    void submit(const std::string& operation, long long units) {
        submit_attempts++;
        ScriptedOutcome outcome = next_outcome(submit_outcomes);
        if (outcome != ScriptedOutcome::Success && !price_after_failed_submit.empty()) {
            price = price_after_failed_submit.front();
            price_after_failed_submit.pop_front();
        }
        raise_scripted_failure(outcome, operation + "/" + std::to_string(units));
    }
};

// Returns queued responses in order and records every request
class ScriptedHttpTransport : public API::HttpTransport {
public:
    std::deque<HttpResponse> responses;
    std::vector<HttpRequest> requests;
    bool fail_with_transport_error = false;

    void enqueue(long status_code, const std::string& body) {
        HttpResponse response;
        response.status_code = status_code;
        response.body = body;
        responses.push_back(response);
    }

    HttpResponse perform(const HttpRequest& request) override {
        requests.push_back(request);
        if (fail_with_transport_error) {
            throw HttpTransportError("Could not resolve host");
        }
        if (responses.empty()) {
            throw std::logic_error("no scripted response for " + request.url);
        }
        HttpResponse response = responses.front();
        responses.pop_front();
        return response;
    }
};

class InMemoryHistoryStore : public Storage::HistoryStoreInterface {
public:
    std::vector<Core::MarketSnapshot> snapshots;
    std::vector<Core::TradeRecord> trades;

    void append_snapshot(const Core::MarketSnapshot& snapshot) override {
        if (!snapshots.empty() && snapshot.timestamp < snapshots.back().timestamp) {
            throw std::runtime_error("snapshot timestamp moved backwards");
        }
        snapshots.push_back(snapshot);
    }

    std::optional<Core::MarketSnapshot> latest_snapshot() const override {
        if (snapshots.empty()) return std::nullopt;
        return snapshots.back();
    }

    std::vector<Core::MarketSnapshot> snapshots_between(long long start_timestamp, long long end_timestamp) const override {
        std::vector<Core::MarketSnapshot> selected;
        for (const Core::MarketSnapshot& snapshot : snapshots) {
            if (snapshot.timestamp >= start_timestamp && snapshot.timestamp <= end_timestamp) {
                selected.push_back(snapshot);
            }
        }
        return selected;
    }

    void append_trade(const Core::TradeRecord& trade) override { trades.push_back(trade); }

    std::vector<Core::TradeRecord> trades_between(long long start_timestamp, long long end_timestamp) const override {
        std::vector<Core::TradeRecord> selected;
        for (const Core::TradeRecord& trade : trades) {
            if (trade.timestamp >= start_timestamp && trade.timestamp <= end_timestamp) {
                selected.push_back(trade);
            }
        }
        return selected;
    }

    size_t snapshot_count() const override { return snapshots.size(); }
};

// Unique scratch directory removed on destruction
class TemporaryDirectory {
public:
    TemporaryDirectory() {
        static std::atomic<int> directory_counter{0};
        const ::testing::TestInfo* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string test_name = test_info != nullptr
            ? std::string(test_info->test_suite_name()) + "_" + test_info->name()
            : std::string("bean_trader");
        directory_path = std::filesystem::temp_directory_path() /
                         ("bean_trader_" + test_name + "_" + std::to_string(directory_counter++));
        std::filesystem::remove_all(directory_path);
        std::filesystem::create_directories(directory_path);
    }

    ~TemporaryDirectory() {
        std::error_code cleanup_error;
        std::filesystem::remove_all(directory_path, cleanup_error);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const { return directory_path; }

private:
    std::filesystem::path directory_path;
};

} // namespace Testing
} // namespace BeanTrader

#endif // TEST_SUPPORT_HPP
