// =============================================================================
// purchase_engine_test.cpp
// =============================================================================
// Tests for tokensale::PurchaseEngine: both entry points end to end against
// in-memory collaborators.
//
// Validates:
//   - The reference purchase scenarios: $1.00 and $1.50 stablecoin buys, cap
//     rejection, paused sale, not-yet-started sale, native payment via oracle
//   - Every rejection path and its error kind
//   - Atomic rollback: a failure after the payment was taken leaves every
//     balance, allowance and tokens_sold exactly as before
//   - Reentrancy: a collaborator calling back into the purchase path is
//     rejected and the outer purchase rolls back
//   - Cap invariant under concurrent buyers
//   - TokensBought is published once per successful purchase and never for a
//     failed one
// =============================================================================

#include "sale_test_support.hpp"

#include "tokensale/errors/sale_error.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace tokensale_test;
using tokensale::domain::Amount;
using tokensale::domain::DisbursementMethod;

class PurchaseEngineTest : public ::testing::Test {
 protected:
  SaleWorld world;
  std::vector<tokensale::TokensBoughtEvent> bought;
  // Purchases publish after releasing the guard, so buyers on different
  // threads can reach this subscriber at the same time.
  std::mutex bought_mutex;

  void SetUp() override {
    world.bus.subscribe<tokensale::TokensBoughtEvent>(
        [this](const tokensale::TokensBoughtEvent& e) {
          std::lock_guard lock(bought_mutex);
          bought.push_back(e);
        });
  }

  tokensale::TokensBoughtEvent buyA(const std::string& buyer,
                                    tokensale::domain::SaleIndex index,
                                    const Amount& amount) {
    return world.purchases.buyWithStable(buyer, index, kUsdc, amount, "ref");
  }
};

// -----------------------------------------------------------------------------
// 1. $1.00 sale, $100 allowance, buy 100 units.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, StablePurchaseAtOneDollar) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.fundStable(*world.usdc, kAlice, usd(100), usd(100));

  auto event = buyA(kAlice, index, asset(100));

  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), asset(100));
  EXPECT_EQ(world.usdc->balanceOf(kAdmin), Amount(100'000'000));
  EXPECT_EQ(world.usdc->balanceOf(kAlice), 0);
  EXPECT_EQ(world.registry.get(index).tokens_sold, asset(100));

  EXPECT_EQ(event.buyer, kAlice);
  EXPECT_EQ(event.sale_index, index);
  EXPECT_EQ(event.amount_bought, asset(100));
  EXPECT_EQ(event.price_in_usd, usd(1));
  EXPECT_EQ(event.usd_cost, Amount(100'000'000));
  EXPECT_EQ(event.native_sent, 0);
  EXPECT_EQ(event.pay_token, kUsdc);
  EXPECT_EQ(event.referral_code, "ref");
  EXPECT_NE(event.sequence_id, 0u);
  EXPECT_EQ(event.timestamp, kStartTime);

  ASSERT_EQ(bought.size(), 1u);
  EXPECT_EQ(bought[0].sequence_id, event.sequence_id);
}

// -----------------------------------------------------------------------------
// 2. $1.50 sale, allowance exactly $1.50, buy one unit: no rounding loss and
//    the allowance is fully consumed.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, StablePurchaseAtOneFiftyUsesExactAllowance) {
  auto index = world.createSale(params(kAsset, Amount(1'500'000)));
  world.fundStable(*world.usdc, kAlice, usd(10), Amount(1'500'000));

  auto event = buyA(kAlice, index, asset(1));

  EXPECT_EQ(event.usd_cost, Amount(1'500'000));
  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), asset(1));
  EXPECT_EQ(world.usdc->balanceOf(kAdmin), Amount(1'500'000));
  EXPECT_EQ(world.usdc->allowance(kAlice, kSale), 0);
}

// -----------------------------------------------------------------------------
// 3. Cap 100 * 10^16, attempt 101 * 10^16: CapacityExceeded, nothing moves.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, PurchaseBeyondCapIsRejected) {
  const Amount cap = Amount(100) * Amount(10'000'000'000'000'000ULL);
  auto index = world.createSale(params(kAsset, usd(1), cap));
  world.fundStable(*world.usdc, kAlice, usd(1000), usd(1000));

  const Amount attempt = Amount(101) * Amount(10'000'000'000'000'000ULL);
  EXPECT_THROW(buyA(kAlice, index, attempt),
               tokensale::CapacityExceededError);

  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), 0);
  EXPECT_EQ(world.usdc->balanceOf(kAlice), usd(1000));
  EXPECT_EQ(world.registry.get(index).tokens_sold, 0);
  EXPECT_TRUE(bought.empty());

  // Exactly the cap still fits.
  buyA(kAlice, index, cap);
  EXPECT_EQ(world.registry.get(index).tokens_sold, cap);
  // One more whole unit costs $1.00, so it reaches the cap check.
  EXPECT_THROW(buyA(kAlice, index, asset(1)),
               tokensale::CapacityExceededError);
}

// -----------------------------------------------------------------------------
// 4. Paused sale rejects both entry points regardless of funds.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, PausedSaleRejectsPurchases) {
  auto p = params(kAsset, usd(1));
  p.paused = true;
  auto index = world.createSale(p);
  world.fundStable(*world.usdc, kAlice, usd(1000), usd(1000));
  world.native->setBalance(kAlice, asset(10));

  EXPECT_THROW(buyA(kAlice, index, asset(1)), tokensale::StateError);
  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, asset(1), ""),
               tokensale::StateError);
  EXPECT_EQ(world.native->balanceOf(kAlice), asset(10));
}

// -----------------------------------------------------------------------------
// 5. Sale starting three days out: rejected now, accepted once the clock has
//    passed start_date.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, FutureSaleOpensWhenTimeAdvances) {
  auto p = params(kAsset, usd(1));
  p.start_date = kStartTime + 3 * kOneDay;
  auto index = world.createSale(p);
  world.fundStable(*world.usdc, kAlice, usd(10), usd(10));

  EXPECT_THROW(buyA(kAlice, index, asset(1)), tokensale::StateError);

  world.clock.advance_by(3 * kOneDay + 1);
  buyA(kAlice, index, asset(1));
  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), asset(1));
}

// -----------------------------------------------------------------------------
// 6. Ended sale (now >= end_date) rejects.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, EndedSaleRejects) {
  auto p = params(kAsset, usd(1));
  p.end_date = kStartTime;
  auto index = world.createSale(p);
  world.fundStable(*world.usdc, kAlice, usd(10), usd(10));

  EXPECT_THROW(buyA(kAlice, index, asset(1)), tokensale::StateError);
}

// -----------------------------------------------------------------------------
// 7. 0.1 native unit at rate R and price P buys
//    floor(floor(0.1e18 * R / 1e8) * 1e6 / P); the administrator receives
//    exactly 0.1 native unit.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, NativePurchaseUsesOracleRateWithChainedFloor) {
  const Amount price(1'500'000);
  auto index = world.createSale(params(kAsset, price));
  const Amount tenth = Amount(100'000'000'000'000'000ULL);
  world.native->setBalance(kAlice, asset(1));

  const Amount rate = Amount(2000) * Amount(100'000'000);
  const Amount expected = (tenth * rate / 100'000'000) * 1'000'000 / price;

  auto event = world.purchases.buyWithNative(kAlice, index, tenth, "tg");

  EXPECT_EQ(event.amount_bought, expected);
  EXPECT_EQ(expected, Amount("133333333333333333333"));
  EXPECT_EQ(event.native_sent, tenth);
  EXPECT_EQ(event.usd_cost, 0);
  EXPECT_TRUE(event.pay_token.empty());
  EXPECT_EQ(world.native->balanceOf(kAdmin), tenth);
  EXPECT_EQ(world.native->balanceOf(kSale), 0);
  EXPECT_EQ(world.native->balanceOf(kAlice), asset(1) - tenth);
  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), expected);
  EXPECT_EQ(world.registry.get(index).tokens_sold, expected);
}

// -----------------------------------------------------------------------------
// 8. Currency checks: unconfigured slot, foreign token.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, UnacceptedPayTokenIsValidationError) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.fundStable(*world.sale_asset, kAlice, asset(10), asset(10));

  EXPECT_THROW(world.purchases.buyWithStable(kAlice, index, kAsset, asset(1), ""),
               tokensale::ValidationError);
  EXPECT_THROW(world.purchases.buyWithStable(kAlice, index, "", asset(1), ""),
               tokensale::ValidationError);
}

TEST_F(PurchaseEngineTest, SecondStablecoinSlotIsAccepted) {
  auto index = world.createSale(params(kAsset, usd(2)));
  world.fundStable(*world.usdt, kBob, usd(10), usd(10));

  auto event =
      world.purchases.buyWithStable(kBob, index, kUsdt, asset(3), "");

  EXPECT_EQ(event.usd_cost, usd(6));
  EXPECT_EQ(world.usdt->balanceOf(kAdmin), usd(6));
}

// -----------------------------------------------------------------------------
// 9. Currency is checked before the sale is looked up.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, UnknownSaleIsNotFound) {
  EXPECT_THROW(buyA(kAlice, 42, asset(1)), tokensale::NotFoundError);
  EXPECT_THROW(
      world.purchases.buyWithStable(kAlice, 42, "nope", asset(1), ""),
      tokensale::ValidationError);
  EXPECT_THROW(world.purchases.buyWithNative(kAlice, 42, asset(1), ""),
               tokensale::NotFoundError);
}

// -----------------------------------------------------------------------------
// 10. Zero amount, and an amount whose cost truncates to zero.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, ZeroAndDustAmountsAreRejected) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.fundStable(*world.usdc, kAlice, usd(10), usd(10));

  EXPECT_THROW(buyA(kAlice, index, Amount(0)), tokensale::ValidationError);
  // 10^11 base units at $1.00 costs 10^11 * 10^6 / 10^18 = 0.1 micro-dollar.
  EXPECT_THROW(buyA(kAlice, index, Amount(100'000'000'000ULL)),
               tokensale::ValidationError);
  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, Amount(0), ""),
               tokensale::ValidationError);
}

// -----------------------------------------------------------------------------
// 11. Allowance below cost: InsufficientAllowance, no transfer.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, InsufficientAllowanceIsRejected) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.fundStable(*world.usdc, kAlice, usd(100), usd(99));

  EXPECT_THROW(buyA(kAlice, index, asset(100)),
               tokensale::InsufficientAllowanceError);
  EXPECT_EQ(world.usdc->balanceOf(kAlice), usd(100));
  EXPECT_EQ(world.usdc->allowance(kAlice, kSale), usd(99));
}

// -----------------------------------------------------------------------------
// 12. Allowance fine but balance short: the pull fails with TransferFailure.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, PaymentPullFailureIsTransferFailure) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.fundStable(*world.usdc, kAlice, usd(5), usd(100));

  EXPECT_THROW(buyA(kAlice, index, asset(10)),
               tokensale::TransferFailureError);
  EXPECT_EQ(world.usdc->balanceOf(kAlice), usd(5));
  EXPECT_EQ(world.registry.get(index).tokens_sold, 0);
}

// -----------------------------------------------------------------------------
// 13. Disbursement fails after payment was taken: everything is undone.
// Why: The holder of a TransferFrom sale never approved the sale system, so
//      the failure happens after the buyer's stablecoin already moved.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, DisbursementFailureRollsBackPayment) {
  world.sale_asset->setBalance(kTreasury, asset(500));
  auto index = world.createSale(
      params(kAsset, usd(1), 0, DisbursementMethod::TransferFrom, kTreasury));
  world.fundStable(*world.usdc, kAlice, usd(50), usd(50));

  EXPECT_THROW(buyA(kAlice, index, asset(10)),
               tokensale::TransferFailureError);

  EXPECT_EQ(world.usdc->balanceOf(kAlice), usd(50));
  EXPECT_EQ(world.usdc->balanceOf(kAdmin), 0);
  EXPECT_EQ(world.usdc->allowance(kAlice, kSale), usd(50));
  EXPECT_EQ(world.sale_asset->balanceOf(kTreasury), asset(500));
  EXPECT_EQ(world.registry.get(index).tokens_sold, 0);
  EXPECT_TRUE(bought.empty());

  // Once the holder approves, the same purchase goes through.
  world.sale_asset->approve(kTreasury, kSale, asset(10));
  buyA(kAlice, index, asset(10));
  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), asset(10));
  EXPECT_EQ(world.sale_asset->balanceOf(kTreasury), asset(490));
  EXPECT_EQ(world.sale_asset->allowance(kTreasury, kSale), 0);
}

// -----------------------------------------------------------------------------
// 14. Native payment rolled back when custody cannot cover the disbursement.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, NativePaymentRolledBackOnDisbursementFailure) {
  world.sale_asset->setBalance(kSale, 0);
  auto index = world.createSale(params(kAsset, usd(1)));
  world.native->setBalance(kAlice, asset(1));

  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, asset(1), ""),
               tokensale::TransferFailureError);

  EXPECT_EQ(world.native->balanceOf(kAlice), asset(1));
  EXPECT_EQ(world.native->balanceOf(kSale), 0);
  EXPECT_EQ(world.native->balanceOf(kAdmin), 0);
}

TEST_F(PurchaseEngineTest, NativePaymentWithoutFundsIsTransferFailure) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.native->setBalance(kAlice, Amount(5));

  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, asset(1), ""),
               tokensale::TransferFailureError);
  EXPECT_EQ(world.native->balanceOf(kAlice), Amount(5));
}

// -----------------------------------------------------------------------------
// 15. Mint sale: units are created for the buyer; supply grows.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, MintSaleCreatesUnits) {
  auto index = world.createSale(
      params(kMintAsset, usd(1), 0, DisbursementMethod::Mint));
  world.fundStable(*world.usdc, kAlice, usd(5), usd(5));

  buyA(kAlice, index, asset(5));

  EXPECT_EQ(world.mint_asset->balanceOf(kAlice), asset(5));
  EXPECT_EQ(world.mint_asset->totalSupply(), asset(5));
}

TEST_F(PurchaseEngineTest, MintWithoutRightsRollsBack) {
  auto index =
      world.createSale(params(kAsset, usd(1), 0, DisbursementMethod::Mint));
  world.fundStable(*world.usdc, kAlice, usd(5), usd(5));

  EXPECT_THROW(buyA(kAlice, index, asset(5)), tokensale::TransferFailureError);
  EXPECT_EQ(world.usdc->balanceOf(kAlice), usd(5));
  EXPECT_EQ(world.sale_asset->balanceOf(kAlice), 0);
}

// -----------------------------------------------------------------------------
// 16. Oracle failures: non-positive answer, unconfigured feed.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, NonPositiveOracleAnswerIsOracleError) {
  auto index = world.createSale(params(kAsset, usd(1)));
  world.native->setBalance(kAlice, asset(1));
  world.feed->setAnswer(0, kStartTime);

  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, asset(1), ""),
               tokensale::OracleError);

  world.feed->setAnswer(-5, kStartTime);
  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, asset(1), ""),
               tokensale::OracleError);
  EXPECT_EQ(world.native->balanceOf(kAlice), asset(1));
}

TEST_F(PurchaseEngineTest, ZeroPriceRejectsNativePurchase) {
  auto index = world.createSale(params(kAsset, Amount(0)));
  world.native->setBalance(kAlice, asset(1));

  EXPECT_THROW(world.purchases.buyWithNative(kAlice, index, asset(1), ""),
               tokensale::ValidationError);
}

// -----------------------------------------------------------------------------
// 17. A collaborator that calls back into the purchase path.
// Why: The nested call must fail fast instead of deadlocking or reading a
//      stale tokens_sold; its failure aborts the outer purchase, which then
//      rolls back the payment already taken.
// -----------------------------------------------------------------------------
namespace {

class ReenteringAsset final : public tokensale::IAssetToken {
 public:
  ReenteringAsset(std::shared_ptr<tokensale::InMemoryToken> inner,
                  tokensale::PurchaseEngine& engine)
      : inner_(std::move(inner)), engine_(engine) {}

  Amount balanceOf(const std::string& a) const override {
    return inner_->balanceOf(a);
  }
  Amount allowance(const std::string& o, const std::string& s) const override {
    return inner_->allowance(o, s);
  }
  unsigned decimals() const override { return inner_->decimals(); }

  bool transfer(const std::string& caller, const std::string& to,
                const Amount& amount) override {
    ++calls;
    engine_.buyWithStable(to, 0, kUsdc, amount, "nested");
    return inner_->transfer(caller, to, amount);
  }
  bool transferFrom(const std::string& spender, const std::string& from,
                    const std::string& to, const Amount& amount) override {
    return inner_->transferFrom(spender, from, to, amount);
  }
  bool approve(const std::string& o, const std::string& s,
               const Amount& amount) override {
    return inner_->approve(o, s, amount);
  }

  int calls{0};

 private:
  std::shared_ptr<tokensale::InMemoryToken> inner_;
  tokensale::PurchaseEngine& engine_;
};

}  // namespace

TEST_F(PurchaseEngineTest, ReentrantCallbackIsRejectedAndRolledBack) {
  auto inner = std::make_shared<tokensale::InMemoryToken>("EVIL");
  inner->setBalance(kSale, asset(100));
  auto evil = std::make_shared<ReenteringAsset>(inner, world.purchases);
  world.directory.registerToken("evil", evil);

  auto index = world.createSale(params("evil", usd(1)));
  world.fundStable(*world.usdc, kAlice, usd(20), usd(20));

  EXPECT_THROW(buyA(kAlice, index, asset(1)), tokensale::ReentrancyError);

  EXPECT_EQ(evil->calls, 1);
  EXPECT_EQ(world.usdc->balanceOf(kAlice), usd(20));
  EXPECT_EQ(world.usdc->balanceOf(kAdmin), 0);
  EXPECT_EQ(world.registry.get(index).tokens_sold, 0);
  EXPECT_FALSE(world.guard.isHeld());
  EXPECT_TRUE(bought.empty());
}

// -----------------------------------------------------------------------------
// 18. Concurrent buyers against a cap: tokens_sold never passes the cap and
//     equals the sum of successful purchases.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, ConcurrentBuyersNeverExceedCap) {
  constexpr int kThreads = 8;
  constexpr int kAttemptsPerThread = 20;
  auto index = world.createSale(params(kAsset, usd(1), asset(50)));

  for (int t = 0; t < kThreads; ++t) {
    const std::string buyer = "buyer-" + std::to_string(t);
    world.fundStable(*world.usdc, buyer, usd(1000), usd(1000));
  }

  std::atomic<int> successes{0};
  std::atomic<int> cap_failures{0};
  std::atomic<int> other_failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      const std::string buyer = "buyer-" + std::to_string(t);
      for (int i = 0; i < kAttemptsPerThread; ++i) {
        try {
          world.purchases.buyWithStable(buyer, index, kUsdc, asset(1), "");
          ++successes;
        } catch (const tokensale::CapacityExceededError&) {
          ++cap_failures;
        } catch (const tokensale::SaleError&) {
          ++other_failures;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(successes.load(), 50);
  EXPECT_EQ(cap_failures.load(), kThreads * kAttemptsPerThread - 50);
  EXPECT_EQ(other_failures.load(), 0);
  EXPECT_EQ(world.registry.get(index).tokens_sold, asset(50));
  EXPECT_EQ(world.usdc->balanceOf(kAdmin), usd(50));

  // Every successful purchase was published exactly once.
  std::lock_guard lock(bought_mutex);
  ASSERT_EQ(bought.size(), 50u);
  std::set<std::uint64_t> ids;
  for (const auto& e : bought) {
    ids.insert(e.sequence_id);
  }
  EXPECT_EQ(ids.size(), 50u);
}

// -----------------------------------------------------------------------------
// 19. tokens_sold is non-decreasing across a mix of successes and failures.
// -----------------------------------------------------------------------------
TEST_F(PurchaseEngineTest, TokensSoldNeverDecreases) {
  auto index = world.createSale(params(kAsset, usd(1), asset(10)));
  world.fundStable(*world.usdc, kAlice, usd(100), usd(100));

  Amount last = 0;
  const std::vector<std::uint64_t> attempts{3, 9, 2, 0, 5, 4, 1, 1};
  for (std::uint64_t units : attempts) {
    try {
      buyA(kAlice, index, asset(units));
    } catch (const tokensale::SaleError&) {
      // Rejected attempts leave tokens_sold as it was.
    }
    const Amount sold = world.registry.get(index).tokens_sold;
    EXPECT_GE(sold, last);
    EXPECT_LE(sold, asset(10));
    last = sold;
  }
  EXPECT_EQ(last, asset(10));
}
