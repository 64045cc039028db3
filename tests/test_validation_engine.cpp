#include <gtest/gtest.h>
#include "core/validation_engine.hpp"
#include "core/fifo_engine.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using namespace fifo;
using namespace fifo::test;

class ValidationEngineTest : public ::testing::Test {
protected:
    ValidationEngine validator_;
    AllocationVersion version_;

    void SetUp() override {
        version_.namespace_id = "test";
        version_.version_number = 1;
    }

    // Consistent zero-fee allocation
    static FifoAllocation alloc(int64_t sequence, const TradeRecord& buy, const TradeRecord& sell,
                                const std::string& qty) {
        FifoAllocation a;
        a.sequence = sequence;
        a.symbol = sell.symbol;
        a.sell_order_id = sell.order_id;
        a.buy_order_id = buy.order_id;
        a.quantity = dec(qty);
        a.buy_price = buy.price;
        a.sell_price = sell.price;
        a.cost_basis = a.buy_price * a.quantity;
        a.proceeds = a.sell_price * a.quantity;
        a.net_proceeds = a.proceeds;
        a.realized_pnl = a.net_proceeds - a.cost_basis;
        a.buy_time = buy.exchange_time;
        a.sell_time = sell.exchange_time;
        return a;
    }

    static UnmatchedResidue residue(int64_t sequence, const TradeRecord& sell, const std::string& qty) {
        UnmatchedResidue r;
        r.sequence = sequence;
        r.symbol = sell.symbol;
        r.sell_order_id = sell.order_id;
        r.quantity = dec(qty);
        r.sell_price = sell.price;
        r.proceeds = r.sell_price * r.quantity;
        r.net_proceeds = r.proceeds;
        r.sell_time = sell.exchange_time;
        return r;
    }

    static bool has_code(const ValidationResult& result, const std::string& code) {
        return std::any_of(result.issues.begin(), result.issues.end(),
                           [&](const ValidationIssue& i) { return i.code == code; });
    }
};

TEST_F(ValidationEngineTest, EngineOutputIsValid) {
    std::vector<TradeRecord> records = {
        trade("B1", "BTC", Side::BUY, "10", "100", 1, "1"),
        trade("B2", "BTC", Side::BUY, "5", "110", 2, "0.5"),
        trade("S1", "BTC", Side::SELL, "12", "120", 3, "0.7"),
        trade("S2", "BTC", Side::SELL, "3", "130", 4, "0.1"),
    };
    auto engine_result = FifoEngine().allocate(records);

    auto result = validator_.validate(version_, records, engine_result.allocations,
                                      engine_result.residues);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_FALSE(result.flagged_for_audit());
    EXPECT_EQ(result.total_buys, 2);
    EXPECT_EQ(result.total_sells, 2);
}

TEST_F(ValidationEngineTest, PartiallyConsumedLotIsValid) {
    std::vector<TradeRecord> records = {
        trade("B1", "BTC", Side::BUY, "10", "100", 1),
        trade("B2", "BTC", Side::BUY, "5", "110", 2),
        trade("S1", "BTC", Side::SELL, "12", "120", 3),
    };
    auto engine_result = FifoEngine().allocate(records);
    ASSERT_EQ(engine_result.allocations.size(), 2);
    ASSERT_TRUE(engine_result.residues.empty());

    auto result = validator_.validate(version_, records, engine_result.allocations,
                                      engine_result.residues);

    EXPECT_TRUE(result.is_valid) << result.summary();
    EXPECT_FALSE(has_code(result, "RESIDUE_WITH_OPEN_LOTS"));
    EXPECT_TRUE(result.issues.empty());

    // Strict mode has nothing to escalate either
    ValidationEngine strict(true);
    EXPECT_TRUE(strict.validate(version_, records, engine_result.allocations,
                                engine_result.residues).is_valid);
}

TEST_F(ValidationEngineTest, ResidueIsFlaggedButValid) {
    std::vector<TradeRecord> records = {
        trade("S1", "ETH", Side::SELL, "8", "100", 1),
    };
    auto engine_result = FifoEngine().allocate(records);

    auto result = validator_.validate(version_, records, engine_result.allocations,
                                      engine_result.residues);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.flagged_for_audit());
    EXPECT_EQ(result.warning_count(), 1);
    EXPECT_TRUE(has_code(result, "UNMATCHED_SELL_RESIDUE"));
}

TEST_F(ValidationEngineTest, StrictModeRejectsResidue) {
    ValidationEngine strict(true);
    std::vector<TradeRecord> records = {
        trade("S1", "ETH", Side::SELL, "8", "100", 1),
    };
    auto engine_result = FifoEngine().allocate(records);

    auto result = strict.validate(version_, records, engine_result.allocations,
                                  engine_result.residues);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.error_count(), 1);
}

TEST_F(ValidationEngineTest, DetectsOverAllocatedSell) {
    auto b1 = trade("B1", "BTC", Side::BUY, "10", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "4", "120", 2);

    auto result = validator_.validate(version_, {b1, s1}, {alloc(1, b1, s1, "6")}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "OVER_ALLOCATED_SELL"));
    EXPECT_TRUE(has_code(result, "ALLOCATION_EXCEEDS_PARENT"));
}

TEST_F(ValidationEngineTest, DetectsUnderAllocatedSell) {
    auto b1 = trade("B1", "BTC", Side::BUY, "10", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "4", "120", 2);

    auto result = validator_.validate(version_, {b1, s1}, {alloc(1, b1, s1, "3")}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "UNDER_ALLOCATED_SELL"));
}

TEST_F(ValidationEngineTest, DetectsOverConsumedBuy) {
    auto b1 = trade("B1", "BTC", Side::BUY, "5", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "4", "120", 2);
    auto s2 = trade("S2", "BTC", Side::SELL, "4", "120", 3);

    auto result = validator_.validate(version_, {b1, s1, s2},
                                      {alloc(1, b1, s1, "4"), alloc(2, b1, s2, "4")}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "BUY_OVERCONSUMED"));
}

TEST_F(ValidationEngineTest, DetectsFifoOrderViolation) {
    auto b1 = trade("B1", "BTC", Side::BUY, "5", "100", 1);
    auto b2 = trade("B2", "BTC", Side::BUY, "5", "110", 2);
    auto s1 = trade("S1", "BTC", Side::SELL, "5", "120", 3);

    // Later buy consumed while the earlier one is still open
    auto result = validator_.validate(version_, {b1, b2, s1}, {alloc(1, b2, s1, "5")}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "FIFO_ORDER_VIOLATION"));
}

TEST_F(ValidationEngineTest, DetectsResidueWhileLotsOpen) {
    auto b1 = trade("B1", "BTC", Side::BUY, "5", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "3", "120", 2);

    auto result = validator_.validate(version_, {b1, s1}, {}, {residue(1, s1, "3")});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "RESIDUE_WITH_OPEN_LOTS"));
}

TEST_F(ValidationEngineTest, DetectsBuyAfterSell) {
    auto b1 = trade("B1", "BTC", Side::BUY, "1", "100", 10);
    auto s1 = trade("S1", "BTC", Side::SELL, "1", "120", 5);

    auto result = validator_.validate(version_, {b1, s1}, {alloc(1, b1, s1, "1")}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "TEMPORAL_VIOLATION"));
}

TEST_F(ValidationEngineTest, DetectsDuplicateAndUnknownReferences) {
    auto b1 = trade("B1", "BTC", Side::BUY, "10", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "4", "120", 2);
    auto ghost = trade("GHOST", "BTC", Side::BUY, "10", "90", 0);

    auto result = validator_.validate(version_, {b1, s1},
                                      {alloc(1, b1, s1, "2"), alloc(2, b1, s1, "2"),
                                       alloc(3, ghost, s1, "1")}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "DUPLICATE_ALLOCATION"));
    EXPECT_TRUE(has_code(result, "UNKNOWN_REFERENCE"));
}

TEST_F(ValidationEngineTest, DetectsPnlArithmeticMismatch) {
    auto b1 = trade("B1", "BTC", Side::BUY, "1", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "1", "120", 2);
    auto a = alloc(1, b1, s1, "1");
    a.realized_pnl = dec("25");

    auto result = validator_.validate(version_, {b1, s1}, {a}, {});

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has_code(result, "PNL_MISMATCH"));
}

TEST_F(ValidationEngineTest, RecordsOutsideScopeAreIgnored) {
    version_.scope = {"BTC"};
    auto b1 = trade("B1", "BTC", Side::BUY, "1", "100", 1);
    auto s1 = trade("S1", "BTC", Side::SELL, "1", "120", 2);
    auto other = trade("S9", "ETH", Side::SELL, "3", "50", 3);

    auto result = validator_.validate(version_, {b1, s1, other}, {alloc(1, b1, s1, "1")}, {});

    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.total_sells, 1);
}
