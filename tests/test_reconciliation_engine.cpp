#include <gtest/gtest.h>
#include "core/reconciliation_engine.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace fifo;
using namespace fifo::test;

namespace {

constexpr Micros T0 = 1700000000000000;   // 2023-11-14 22:13:20 UTC
constexpr Micros MIN = 60LL * 1000000LL;

const std::vector<ReconciliationTier> TIER1 = {ReconciliationTier::PRESENCE};
const std::vector<ReconciliationTier> BOTH = {ReconciliationTier::PRESENCE,
                                              ReconciliationTier::VALUE};

} // namespace

class ReconciliationEngineTest : public LedgerFixture {
protected:
    std::shared_ptr<FakeFillSource> exchange_;
    TimeWindow window_{T0, T0 + 60 * MIN};

    void SetUp() override {
        LedgerFixture::SetUp();
        exchange_ = std::make_shared<FakeFillSource>();
    }

    ReconciliationEngine engine(const std::string& tolerance = "0") {
        ReconciliationEngine::Config config;
        config.amount_tolerance = dec(tolerance);
        return ReconciliationEngine(*db_, exchange_, config);
    }

    // Same trade on both sides
    void both(const TradeRecord& r) {
        ASSERT_TRUE(db_->append(r));
        exchange_->add(r);
    }
};

// ============================================================================
// Presence (Tier 1)
// ============================================================================

TEST_F(ReconciliationEngineTest, IdenticalHistoriesAreConsistent) {
    both(trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN));
    both(trade("S1", "BTC", Side::SELL, "1", "110", T0 + 2 * MIN));
    both(trade("B2", "ETH", Side::BUY, "3", "10", T0 + 3 * MIN));

    Micros before = now_micros();
    auto outcome = engine().run("alpha", BOTH, {}, window_);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    ASSERT_TRUE(outcome.report.has_value());
    EXPECT_TRUE(outcome.report->is_consistent());
    EXPECT_EQ(outcome.report->local_trades, 3);
    EXPECT_EQ(outcome.report->external_trades, 3);
    EXPECT_GE(outcome.report->snapshot_cutoff, before);
    EXPECT_FALSE(outcome.report->report_id.empty());
    EXPECT_EQ(outcome.report->namespace_id, "alpha");

    // Empty scope expands to the ledger's and the exchange's symbols
    EXPECT_EQ(exchange_->symbol_calls, 1);
    EXPECT_EQ(exchange_->list_calls, 2);
}

TEST_F(ReconciliationEngineTest, AllScopeDiscoversExchangeOnlySymbols) {
    both(trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN));
    exchange_->add(trade("X123", "ETH", Side::BUY, "2", "10", T0 + 2 * MIN));

    auto outcome = engine().run("alpha", TIER1, {}, window_);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    const auto& report = *outcome.report;
    ASSERT_EQ(report.discrepancies.size(), 1);
    EXPECT_EQ(report.discrepancies[0].kind, DiscrepancyKind::MISSING_TRADE);
    EXPECT_EQ(report.discrepancies[0].symbol, "ETH");
    EXPECT_EQ(report.discrepancies[0].primary_order_id(), "X123");
    EXPECT_EQ(exchange_->list_calls, 2);
}

TEST_F(ReconciliationEngineTest, EmptyLedgerStillChecksExchange) {
    exchange_->add(trade("X123", "ETH", Side::SELL, "2", "10", T0 + 2 * MIN));

    auto outcome = engine().run("alpha", TIER1, {}, window_);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.report->count(DiscrepancyKind::MISSING_TRADE), 1);
    EXPECT_EQ(outcome.report->external_trades, 1);
    EXPECT_EQ(exchange_->list_calls, 1);
}

TEST_F(ReconciliationEngineTest, ExplicitScopeSkipsSymbolDiscovery) {
    both(trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN));
    exchange_->add(trade("X123", "ETH", Side::BUY, "2", "10", T0 + 2 * MIN));

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.report->is_consistent());
    EXPECT_EQ(exchange_->symbol_calls, 0);
}

TEST_F(ReconciliationEngineTest, ExchangeOnlyOrderIsMissingTrade) {
    both(trade("B1", "BTC", Side::BUY, "5", "100", T0 + MIN));
    exchange_->add(trade("X123", "BTC", Side::SELL, "2", "120", T0 + 5 * MIN, "0.1"));

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    const auto& report = *outcome.report;
    ASSERT_EQ(report.discrepancies.size(), 1);
    const auto& d = report.discrepancies[0];
    EXPECT_EQ(d.kind, DiscrepancyKind::MISSING_TRADE);
    EXPECT_EQ(d.symbol, "BTC");
    EXPECT_EQ(d.primary_order_id(), "X123");
    EXPECT_EQ(d.side, Side::SELL);
    EXPECT_EQ(d.external_value, dec("2"));

    // Reconciliation never writes to the ledger
    EXPECT_FALSE(db_->contains_order("X123"));
}

TEST_F(ReconciliationEngineTest, LedgerOnlyOrderIsExtraTrade) {
    both(trade("B1", "BTC", Side::BUY, "5", "100", T0 + MIN));
    ASSERT_TRUE(db_->append(trade("E1", "BTC", Side::BUY, "1", "99", T0 + 2 * MIN)));

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.report->discrepancies.size(), 1);
    const auto& d = outcome.report->discrepancies[0];
    EXPECT_EQ(d.kind, DiscrepancyKind::EXTRA_TRADE);
    EXPECT_EQ(d.primary_order_id(), "E1");
    EXPECT_EQ(d.local_value, dec("1"));
    EXPECT_TRUE(db_->contains_order("E1"));
}

TEST_F(ReconciliationEngineTest, DiscrepanciesAreSorted) {
    exchange_->add(trade("Z9", "ETH", Side::BUY, "1", "10", T0 + MIN));
    exchange_->add(trade("A1", "ETH", Side::BUY, "1", "10", T0 + MIN));
    exchange_->add(trade("M5", "BTC", Side::BUY, "1", "10", T0 + MIN));
    ASSERT_TRUE(db_->append(trade("E1", "BTC", Side::BUY, "1", "99", T0 + MIN)));

    auto outcome = engine().run("alpha", TIER1, {"BTC", "ETH"}, window_);

    ASSERT_TRUE(outcome.success);
    const auto& ds = outcome.report->discrepancies;
    ASSERT_EQ(ds.size(), 4);
    EXPECT_EQ(ds[0].primary_order_id(), "M5");
    EXPECT_EQ(ds[1].primary_order_id(), "E1");
    EXPECT_EQ(ds[2].primary_order_id(), "A1");
    EXPECT_EQ(ds[3].primary_order_id(), "Z9");
}

// ============================================================================
// Values (Tier 2)
// ============================================================================

TEST_F(ReconciliationEngineTest, ValueMismatchReportsDelta) {
    auto local = trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN, "0.1");
    auto remote = local;
    remote.fee = dec("0.15");
    remote.price = dec("100.5");
    ASSERT_TRUE(db_->append(local));
    exchange_->add(remote);

    auto outcome = engine().run("alpha", BOTH, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    const auto& ds = outcome.report->discrepancies;
    ASSERT_EQ(ds.size(), 2);
    EXPECT_EQ(ds[0].kind, DiscrepancyKind::AMOUNT_MISMATCH);
    EXPECT_EQ(ds[0].field, "fee");
    EXPECT_EQ(ds[0].local_value, dec("0.1"));
    EXPECT_EQ(ds[0].external_value, dec("0.15"));
    EXPECT_EQ(ds[0].delta, dec("0.05"));
    EXPECT_EQ(ds[1].field, "price");
    EXPECT_EQ(ds[1].delta, dec("0.5"));
}

TEST_F(ReconciliationEngineTest, ToleranceAbsorbsSmallDifferences) {
    auto local = trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN, "0.1");
    auto remote = local;
    remote.fee = dec("0.15");
    ASSERT_TRUE(db_->append(local));
    exchange_->add(remote);

    auto outcome = engine("0.05").run("alpha", BOTH, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.report->is_consistent());
}

TEST_F(ReconciliationEngineTest, SideMismatchIsReported) {
    auto local = trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN);
    auto remote = local;
    remote.side = Side::SELL;
    ASSERT_TRUE(db_->append(local));
    exchange_->add(remote);

    auto outcome = engine().run("alpha", BOTH, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.report->discrepancies.size(), 1);
    EXPECT_EQ(outcome.report->discrepancies[0].field, "side");
}

TEST_F(ReconciliationEngineTest, PresenceOnlyIgnoresValues) {
    auto local = trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN, "0.1");
    auto remote = local;
    remote.quantity = dec("2");
    ASSERT_TRUE(db_->append(local));
    exchange_->add(remote);

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.report->is_consistent());
    EXPECT_EQ(outcome.report->tiers, TIER1);
}

// ============================================================================
// Window edges
// ============================================================================

TEST_F(ReconciliationEngineTest, LocalCopyJustOutsideWindowIsNotMissing) {
    // Exchange reports the fill inside the window, the ledger a few
    // microseconds before it
    auto remote = trade("B1", "BTC", Side::BUY, "1", "100", T0 + 5);
    auto local = remote;
    local.exchange_time = T0 - 5;
    ASSERT_TRUE(db_->append(local));
    exchange_->add(remote);

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.report->is_consistent());
}

TEST_F(ReconciliationEngineTest, ExternalCopyJustOutsideWindowIsNotExtra) {
    auto local = trade("B1", "BTC", Side::BUY, "1", "100", T0 + 5);
    auto remote = local;
    remote.exchange_time = T0 - 5;
    ASSERT_TRUE(db_->append(local));
    exchange_->add(remote);

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    ASSERT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.report->is_consistent());
    EXPECT_EQ(exchange_->get_calls, 1);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ReconciliationEngineTest, SourceOutageProducesNoReport) {
    both(trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN));
    exchange_->unavailable = true;

    auto outcome = engine().run("alpha", BOTH, {"BTC"}, window_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::SOURCE_UNAVAILABLE);
    EXPECT_FALSE(outcome.report.has_value());
    EXPECT_NE(outcome.error_message.find("connection refused"), std::string::npos);
}

TEST_F(ReconciliationEngineTest, SymbolDiscoveryOutageProducesNoReport) {
    both(trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN));
    exchange_->unavailable = true;

    auto outcome = engine().run("alpha", TIER1, {}, window_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::SOURCE_UNAVAILABLE);
    EXPECT_FALSE(outcome.report.has_value());
    EXPECT_EQ(exchange_->list_calls, 0);
}

TEST_F(ReconciliationEngineTest, FailedEdgeLookupAbortsRun) {
    ASSERT_TRUE(db_->append(trade("E1", "BTC", Side::BUY, "1", "99", T0 + MIN)));
    exchange_->failing_lookups.insert("E1");

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::SOURCE_UNAVAILABLE);
    EXPECT_FALSE(outcome.report.has_value());
}

TEST_F(ReconciliationEngineTest, MalformedFillProducesNoReport) {
    auto bad = trade("B1", "BTC", Side::BUY, "1", "100", T0 + MIN);
    exchange_->add(bad);
    exchange_->fills.back().size = Decimal();

    auto outcome = engine().run("alpha", TIER1, {"BTC"}, window_);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::SOURCE_UNAVAILABLE);
}

TEST_F(ReconciliationEngineTest, RejectsInvalidRequest) {
    auto e = engine();

    EXPECT_THROW(e.run("alpha", {}, {"BTC"}, window_), std::invalid_argument);
    EXPECT_THROW(e.run("alpha", TIER1, {"BTC"}, TimeWindow{T0, T0 - 1}),
                 std::invalid_argument);

    EXPECT_EQ(exchange_->list_calls, 0);
    EXPECT_EQ(exchange_->symbol_calls, 0);
}

TEST_F(ReconciliationEngineTest, RequiresFillSource) {
    std::shared_ptr<FillSource> none;
    EXPECT_THROW({ ReconciliationEngine e(*db_, none); }, std::invalid_argument);
}
