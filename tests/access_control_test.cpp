// =============================================================================
// access_control_test.cpp
// =============================================================================
// Tests for tokensale::AccessControl.
//
// Validates:
//   - The initial owner is the only caller requireOwner() admits
//   - transferOwnership() hands the role over and queues the notification
//   - Rejected transfers leave the owner and the queue untouched
// =============================================================================

#include "tokensale/access/access_control.hpp"
#include "tokensale/concurrent/sequence_generator.hpp"
#include "tokensale/errors/sale_error.hpp"
#include "tokensale/events/event.hpp"
#include "tokensale/ledger/unit_of_work.hpp"
#include "tokensale/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <variant>

class AccessControlTest : public ::testing::Test {
 protected:
  tokensale::AccessControl access{"admin"};
  tokensale::SequenceGenerator sequence;
  tokensale::SimulationTimeProvider clock{42};
};

TEST(AccessControlConstruction, EmptyInitialOwnerIsRejected) {
  EXPECT_THROW(tokensale::AccessControl{""}, tokensale::ValidationError);
}

// -----------------------------------------------------------------------------
// 1. Only the owner passes requireOwner().
// -----------------------------------------------------------------------------
TEST_F(AccessControlTest, RequireOwnerAdmitsOnlyTheOwner) {
  EXPECT_EQ(access.owner(), "admin");
  EXPECT_TRUE(access.isOwner("admin"));
  EXPECT_FALSE(access.isOwner("mallory"));

  EXPECT_NO_THROW(access.requireOwner("admin", "setPrice"));
  EXPECT_THROW(access.requireOwner("mallory", "setPrice"),
               tokensale::AuthorizationError);
  EXPECT_THROW(access.requireOwner("", "setPrice"),
               tokensale::AuthorizationError);
}

// -----------------------------------------------------------------------------
// 2. Transfer moves the role and queues OwnershipTransferred.
// -----------------------------------------------------------------------------
TEST_F(AccessControlTest, TransferOwnershipMovesTheRole) {
  tokensale::UnitOfWork uow(sequence, clock);
  access.transferOwnership("admin", "treasury", uow);
  auto events = uow.commit();

  EXPECT_EQ(access.owner(), "treasury");
  EXPECT_THROW(access.requireOwner("admin", "setPrice"),
               tokensale::AuthorizationError);

  ASSERT_EQ(events.size(), 1u);
  const auto& e = std::get<tokensale::OwnershipTransferredEvent>(events[0]);
  EXPECT_EQ(e.previous_owner, "admin");
  EXPECT_EQ(e.new_owner, "treasury");
  EXPECT_EQ(e.timestamp, 42u);
}

// -----------------------------------------------------------------------------
// 3. Rejections: non-owner caller, empty new owner.
// -----------------------------------------------------------------------------
TEST_F(AccessControlTest, TransferOwnershipRejections) {
  tokensale::UnitOfWork uow(sequence, clock);
  EXPECT_THROW(access.transferOwnership("mallory", "mallory", uow),
               tokensale::AuthorizationError);
  EXPECT_THROW(access.transferOwnership("admin", "", uow),
               tokensale::ValidationError);
  EXPECT_EQ(access.owner(), "admin");
  EXPECT_TRUE(uow.commit().empty());
}
