#include <gtest/gtest.h>
#include "exchange/fill_source.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace fifo;
using namespace fifo::test;

namespace {

/**
 * Inner source that fails a configurable number of times before
 * answering, optionally sleeping or throwing instead.
 */
class FlakyFillSource : public FillSource {
public:
    std::atomic<int> failures_left{0};
    std::atomic<int> calls{0};
    std::atomic<int> sleep_ms{0};
    std::atomic<bool> throw_instead{false};
    std::atomic<bool> not_found{false};

    FillListResponse list_fills(const std::string& symbol, const TimeWindow&) override {
        calls++;
        pause();
        FillListResponse response;
        if (failures_left > 0) {
            failures_left--;
            if (throw_instead) throw std::runtime_error("socket closed");
            response.error = "HTTP 502";
            return response;
        }
        response.success = true;
        response.fills.push_back(fill_of(trade("B1", symbol, Side::BUY, "1", "100", 1)));
        return response;
    }

    SymbolListResponse list_symbols(const TimeWindow&) override {
        calls++;
        pause();
        SymbolListResponse response;
        if (failures_left > 0) {
            failures_left--;
            response.error = "HTTP 502";
            return response;
        }
        response.success = true;
        response.symbols = {"BTC"};
        return response;
    }

    FillLookupResponse get_fill(const std::string& order_id) override {
        calls++;
        pause();
        FillLookupResponse response;
        if (failures_left > 0) {
            failures_left--;
            response.error = "HTTP 502";
            return response;
        }
        response.success = true;
        if (not_found) {
            response.not_found = true;
        } else {
            response.fill = fill_of(trade(order_id, "BTC", Side::BUY, "1", "100", 1));
        }
        return response;
    }

    std::string name() const override { return "flaky"; }

private:
    void pause() {
        if (sleep_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms.load()));
        }
    }
};

ResilientFillSource::Config fast_config() {
    ResilientFillSource::Config config;
    config.max_requests = 100;
    config.rate_window_seconds = 1;
    config.call_timeout_ms = 1000;
    config.max_retries = 3;
    config.initial_backoff_ms = 1;
    config.max_backoff_ms = 5;
    return config;
}

} // namespace

// ============================================================================
// Normalization
// ============================================================================

TEST(NormalizeFillTest, MapsExchangeFields) {
    RawFill f;
    f.order_id = "X1";
    f.product_id = "BTC-USD";
    f.side = "SELL";
    f.size = dec("0.5");
    f.price = dec("42000");
    f.commission = dec("1.05");
    f.trade_time = 1234;

    auto r = normalize_fill(f, TradeSource::BACKFILL);
    EXPECT_EQ(r.order_id, "X1");
    EXPECT_EQ(r.symbol, "BTC-USD");
    EXPECT_EQ(r.side, Side::SELL);
    EXPECT_EQ(r.quantity, dec("0.5"));
    EXPECT_EQ(r.fee, dec("1.05"));
    EXPECT_EQ(r.exchange_time, 1234);
    EXPECT_EQ(r.source, TradeSource::BACKFILL);
}

TEST(NormalizeFillTest, RejectsMalformedFills) {
    RawFill f = fill_of(trade("X1", "BTC", Side::BUY, "1", "100", 1));

    auto bad_side = f;
    bad_side.side = "HOLD";
    EXPECT_THROW(normalize_fill(bad_side, TradeSource::NORMAL), std::invalid_argument);

    auto zero = f;
    zero.size = Decimal();
    EXPECT_THROW(normalize_fill(zero, TradeSource::NORMAL), std::invalid_argument);

    auto negative_fee = f;
    negative_fee.commission = dec("-0.1");
    EXPECT_THROW(normalize_fill(negative_fee, TradeSource::NORMAL), std::invalid_argument);

    auto no_id = f;
    no_id.order_id.clear();
    EXPECT_THROW(normalize_fill(no_id, TradeSource::NORMAL), std::invalid_argument);
}

// ============================================================================
// JSON file source
// ============================================================================

class JsonFileFillSourceTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = "/tmp/test_fills_" + generate_uuid() + ".json";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }
};

TEST_F(JsonFileFillSourceTest, AggregatesPartialFillsPerOrder) {
    write(R"([
        {"order_id": "X1", "product_id": "BTC", "side": "BUY", "size": "1",
         "price": "100", "commission": "0.1", "trade_time": "2024-03-01T12:00:05Z"},
        {"order_id": "X1", "product_id": "BTC", "side": "BUY", "size": "3",
         "price": "200", "commission": "0.2", "trade_time": "2024-03-01T12:00:01.5Z"},
        {"order_id": "X2", "product_id": "ETH", "side": "SELL", "size": "2",
         "price": "10", "trade_time": 1709294400000000}
    ])");
    JsonFileFillSource source(path_);

    auto response = source.get_fill("X1");
    ASSERT_TRUE(response.success) << response.error;
    ASSERT_TRUE(response.fill.has_value());
    EXPECT_EQ(response.fill->size, dec("4"));
    EXPECT_EQ(response.fill->price, dec("175"));
    EXPECT_EQ(response.fill->commission, dec("0.3"));
    EXPECT_EQ(response.fill->trade_time, 1709294401500000);

    auto missing_commission = source.get_fill("X2");
    ASSERT_TRUE(missing_commission.fill.has_value());
    EXPECT_EQ(missing_commission.fill->commission, Decimal());
}

TEST_F(JsonFileFillSourceTest, ListFiltersSymbolAndWindow) {
    write(R"([
        {"order_id": "A", "product_id": "BTC", "side": "BUY", "size": "1", "price": "1", "trade_time": 100},
        {"order_id": "B", "product_id": "BTC", "side": "BUY", "size": "1", "price": "1", "trade_time": 200},
        {"order_id": "C", "product_id": "ETH", "side": "BUY", "size": "1", "price": "1", "trade_time": 150}
    ])");
    JsonFileFillSource source(path_);

    auto response = source.list_fills("BTC", TimeWindow{50, 150});
    ASSERT_TRUE(response.success);
    ASSERT_EQ(response.fills.size(), 1);
    EXPECT_EQ(response.fills[0].order_id, "A");

    auto symbols = source.list_symbols(TimeWindow{50, 150});
    ASSERT_TRUE(symbols.success);
    EXPECT_EQ(symbols.symbols, (std::vector<std::string>{"BTC", "ETH"}));
    EXPECT_EQ(source.list_symbols(TimeWindow{160, 300}).symbols,
              std::vector<std::string>{"BTC"});
}

TEST_F(JsonFileFillSourceTest, UnknownOrderIsDefinitiveMiss) {
    write("[]");
    JsonFileFillSource source(path_);

    auto response = source.get_fill("NOPE");
    EXPECT_TRUE(response.success);
    EXPECT_TRUE(response.not_found);
}

TEST_F(JsonFileFillSourceTest, UnreadableFileIsUnavailable) {
    JsonFileFillSource source(path_);

    auto list = source.list_fills("BTC", TimeWindow{0, 1});
    EXPECT_FALSE(list.success);
    EXPECT_FALSE(list.error.empty());

    auto lookup = source.get_fill("X1");
    EXPECT_FALSE(lookup.success);
    EXPECT_FALSE(lookup.not_found);

    write("{\"not\": \"an array\"}");
    EXPECT_FALSE(source.list_fills("BTC", TimeWindow{0, 1}).success);
}

// ============================================================================
// Resilient decorator
// ============================================================================

TEST(ResilientFillSourceTest, RetriesTransientFailures) {
    auto inner = std::make_shared<FlakyFillSource>();
    inner->failures_left = 2;
    ResilientFillSource source(inner, fast_config());

    auto response = source.list_fills("BTC", TimeWindow{0, 10});

    EXPECT_TRUE(response.success);
    EXPECT_EQ(response.fills.size(), 1);
    EXPECT_EQ(inner->calls, 3);
    EXPECT_EQ(source.calls_attempted(), 3);
}

TEST(ResilientFillSourceTest, RetriesSymbolDiscovery) {
    auto inner = std::make_shared<FlakyFillSource>();
    inner->failures_left = 1;
    ResilientFillSource source(inner, fast_config());

    auto response = source.list_symbols(TimeWindow{0, 10});

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.symbols, std::vector<std::string>{"BTC"});
    EXPECT_EQ(inner->calls, 2);
}

TEST(ResilientFillSourceTest, RetriesThrowingSource) {
    auto inner = std::make_shared<FlakyFillSource>();
    inner->failures_left = 1;
    inner->throw_instead = true;
    ResilientFillSource source(inner, fast_config());

    EXPECT_TRUE(source.list_fills("BTC", TimeWindow{0, 10}).success);
    EXPECT_EQ(inner->calls, 2);
}

TEST(ResilientFillSourceTest, GivesUpAfterMaxRetries) {
    auto inner = std::make_shared<FlakyFillSource>();
    inner->failures_left = 100;
    auto config = fast_config();
    config.max_retries = 2;
    ResilientFillSource source(inner, config);

    auto response = source.get_fill("X1");

    EXPECT_FALSE(response.success);
    EXPECT_FALSE(response.not_found);
    EXPECT_EQ(inner->calls, 3);
    EXPECT_NE(response.error.find("source unavailable after 3 attempts"), std::string::npos);
    EXPECT_NE(response.error.find("HTTP 502"), std::string::npos);
}

TEST(ResilientFillSourceTest, NotFoundIsNeverRetried) {
    auto inner = std::make_shared<FlakyFillSource>();
    inner->not_found = true;
    ResilientFillSource source(inner, fast_config());

    auto response = source.get_fill("X1");

    EXPECT_TRUE(response.success);
    EXPECT_TRUE(response.not_found);
    EXPECT_EQ(inner->calls, 1);
}

TEST(ResilientFillSourceTest, SlowCallTimesOut) {
    auto inner = std::make_shared<FlakyFillSource>();
    inner->sleep_ms = 300;
    auto config = fast_config();
    config.call_timeout_ms = 50;
    config.max_retries = 0;
    ResilientFillSource source(inner, config);

    auto start = std::chrono::steady_clock::now();
    auto response = source.list_fills("BTC", TimeWindow{0, 10});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(response.success);
    EXPECT_NE(response.error.find("timed out"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}

TEST(ResilientFillSourceTest, RateLimitBoundsCalls) {
    auto inner = std::make_shared<FlakyFillSource>();
    auto config = fast_config();
    config.max_requests = 2;
    config.rate_window_seconds = 60;
    config.call_timeout_ms = 50;
    config.max_retries = 0;
    ResilientFillSource source(inner, config);

    EXPECT_TRUE(source.get_fill("X1").success);
    EXPECT_TRUE(source.get_fill("X2").success);

    auto limited = source.get_fill("X3");
    EXPECT_FALSE(limited.success);
    EXPECT_NE(limited.error.find("rate limited"), std::string::npos);
    EXPECT_EQ(inner->calls, 2);
}

TEST(ResilientFillSourceTest, RejectsInvalidConstruction) {
    EXPECT_THROW(ResilientFillSource(nullptr, fast_config()), std::invalid_argument);

    auto config = fast_config();
    config.max_retries = -1;
    EXPECT_THROW(ResilientFillSource(std::make_shared<FlakyFillSource>(), config),
                 std::invalid_argument);
}
