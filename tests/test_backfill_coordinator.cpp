#include <gtest/gtest.h>
#include "core/backfill_coordinator.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace fifo;
using namespace fifo::test;

namespace {

Discrepancy missing(const std::string& symbol, const std::string& order_id) {
    Discrepancy d;
    d.kind = DiscrepancyKind::MISSING_TRADE;
    d.symbol = symbol;
    d.order_ids = {order_id};
    return d;
}

} // namespace

class BackfillCoordinatorTest : public LedgerFixture {
protected:
    std::shared_ptr<FakeFillSource> exchange_;
    ReconciliationReport report_;

    void SetUp() override {
        LedgerFixture::SetUp();
        exchange_ = std::make_shared<FakeFillSource>();
        report_.report_id = "report-1";
        report_.namespace_id = "alpha";
    }

    BackfillCoordinator coordinator() {
        return BackfillCoordinator(*db_, exchange_);
    }
};

TEST_F(BackfillCoordinatorTest, InsertsMissingTradesAsBackfill) {
    exchange_->add(trade("X123", "BTC", Side::SELL, "2", "120", 1000, "0.1"));
    report_.discrepancies = {missing("BTC", "X123")};

    auto result = coordinator().backfill(report_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.requested, 1);
    EXPECT_EQ(result.inserted, 1);
    EXPECT_EQ(result.inserted_order_ids, std::vector<std::string>{"X123"});
    EXPECT_EQ(result.affected_symbols, SymbolScope{"BTC"});

    auto stored = db_->find("X123", "BTC");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->source, TradeSource::BACKFILL);
    EXPECT_EQ(stored->quantity, dec("2"));
    EXPECT_EQ(stored->fee, dec("0.1"));
    EXPECT_EQ(stored->exchange_time, 1000);

    ASSERT_TRUE(result.allocation_request.has_value());
    EXPECT_EQ(result.allocation_request->namespace_id, "alpha");
    EXPECT_EQ(result.allocation_request->triggered_by, "backfill:report-1");
    EXPECT_TRUE(result.allocation_request->scope.empty());
}

TEST_F(BackfillCoordinatorTest, RerunIsIdempotent) {
    exchange_->add(trade("X123", "BTC", Side::SELL, "2", "120", 1000));
    report_.discrepancies = {missing("BTC", "X123")};

    auto c = coordinator();
    ASSERT_EQ(c.backfill(report_).inserted, 1);
    int lookups = exchange_->get_calls;

    auto again = c.backfill(report_);
    EXPECT_TRUE(again.success);
    EXPECT_EQ(again.inserted, 0);
    EXPECT_EQ(again.skipped, 1);
    EXPECT_FALSE(again.allocation_request.has_value());
    EXPECT_EQ(exchange_->get_calls, lookups);
    EXPECT_EQ(db_->count_records(), 1);
}

TEST_F(BackfillCoordinatorTest, IgnoresOtherDiscrepancyKindsAndDuplicates) {
    exchange_->add(trade("X1", "BTC", Side::BUY, "1", "100", 1000));

    Discrepancy extra;
    extra.kind = DiscrepancyKind::EXTRA_TRADE;
    extra.symbol = "BTC";
    extra.order_ids = {"E1"};
    report_.discrepancies = {missing("BTC", "X1"), extra, missing("BTC", "X1")};

    auto result = coordinator().backfill(report_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.requested, 1);
    EXPECT_EQ(result.inserted, 1);
    EXPECT_EQ(exchange_->get_calls, 1);
}

TEST_F(BackfillCoordinatorTest, NothingMissingIsNoOp) {
    auto result = coordinator().backfill(report_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.requested, 0);
    EXPECT_FALSE(result.allocation_request.has_value());
    EXPECT_EQ(exchange_->get_calls, 0);
}

TEST_F(BackfillCoordinatorTest, PartialFailureKeepsSuccessfulSubset) {
    exchange_->add(trade("X1", "BTC", Side::BUY, "1", "100", 1000));
    exchange_->add(trade("X2", "ETH", Side::BUY, "1", "100", 1000));
    exchange_->add(trade("X3", "ETH", Side::SELL, "1", "100", 2000));
    exchange_->failing_lookups.insert("X2");
    report_.discrepancies = {missing("BTC", "X1"), missing("ETH", "X2"), missing("ETH", "X3")};

    auto result = coordinator().backfill(report_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::PARTIAL_BACKFILL_FAILURE);
    EXPECT_EQ(result.inserted, 2);
    ASSERT_EQ(result.failed.size(), 1);
    EXPECT_EQ(result.failed[0].order_id, "X2");
    EXPECT_EQ(result.failed[0].reason, "HTTP 503");
    EXPECT_TRUE(db_->contains_order("X1"));
    EXPECT_TRUE(db_->contains_order("X3"));
    EXPECT_FALSE(db_->contains_order("X2"));

    // Committed rows still trigger a recomputation
    EXPECT_TRUE(result.allocation_request.has_value());

    // Retry after the outage picks up the rest
    exchange_->failing_lookups.clear();
    auto retry = coordinator().backfill(report_);
    EXPECT_TRUE(retry.success);
    EXPECT_EQ(retry.inserted, 1);
    EXPECT_EQ(retry.skipped, 2);
}

TEST_F(BackfillCoordinatorTest, VanishedFillIsReportedAsFailure) {
    report_.discrepancies = {missing("BTC", "GONE")};

    auto result = coordinator().backfill(report_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::PARTIAL_BACKFILL_FAILURE);
    ASSERT_EQ(result.failed.size(), 1);
    EXPECT_EQ(result.failed[0].reason, "not found on exchange");
    EXPECT_FALSE(result.allocation_request.has_value());
}

TEST_F(BackfillCoordinatorTest, RejectsFillForAnotherSymbol) {
    exchange_->add(trade("X1", "ETH", Side::BUY, "1", "100", 1000));
    report_.discrepancies = {missing("BTC", "X1")};

    auto result = coordinator().backfill(report_);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.failed.size(), 1);
    EXPECT_EQ(result.failed[0].symbol, "BTC");
    EXPECT_EQ(db_->count_records(), 0);
}

TEST_F(BackfillCoordinatorTest, RequestScopeUnionsCurrentScope) {
    exchange_->add(trade("X1", "SOL", Side::BUY, "1", "100", 1000));
    report_.discrepancies = {missing("SOL", "X1")};

    auto result = coordinator().backfill(report_, SymbolScope{"ETH", "BTC"});

    ASSERT_TRUE(result.allocation_request.has_value());
    EXPECT_EQ(result.allocation_request->scope, (SymbolScope{"BTC", "ETH", "SOL"}));
}

TEST_F(BackfillCoordinatorTest, AllSymbolScopeStaysAll) {
    exchange_->add(trade("X1", "SOL", Side::BUY, "1", "100", 1000));
    report_.discrepancies = {missing("SOL", "X1")};

    auto result = coordinator().backfill(report_, SymbolScope{});

    ASSERT_TRUE(result.allocation_request.has_value());
    EXPECT_TRUE(result.allocation_request->scope.empty());
}

TEST_F(BackfillCoordinatorTest, RequiresFillSource) {
    std::shared_ptr<FillSource> none;
    EXPECT_THROW({ BackfillCoordinator c(*db_, none); }, std::invalid_argument);
}
