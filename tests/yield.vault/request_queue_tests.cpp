#include <eosio/tester.hpp>

#include <cstring>

#include "test.mocks.hpp"

using namespace yieldfi_test;

static const time_point_sec NO_DEADLINE = time_point_sec::maximum();

EOSIO_TEST_BEGIN(deposit_request_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   auto req = f.request_deposit(BOB, 1000000);
   CHECK_EQUAL( req.id, 1u )
   CHECK_EQUAL( f.state.total_deposit_request, usdt(1000000) )
   CHECK_EQUAL( f.state.pending_deposit_count, 1u )
   //escrow is not part of total assets until settled
   CHECK_EQUAL( f.ledger.total_assets(), usdt(10000000) )

   CHECK_ASSERT( "[[40]]", ([&]() { f.queue.request_deposit(BOB, BOB, usdt(100), T0); }) )
   CHECK_ASSERT( "[[40]]", ([&]() { f.queue.claim_deposit(BOB, BOB, NO_DEADLINE, T0); }) )

   CHECK_EQUAL( f.queue.settle(T0), true )
   CHECK_EQUAL( f.queue.is_settled(request_kind::DEPOSIT, req), true )
   CHECK_EQUAL( f.state.total_claimable_deposit, shares(1000000) )
   CHECK_EQUAL( f.state.available, usdt(11000000) )
   CHECK_ASSERT( "[[40]]", ([&]() { f.queue.cancel_deposit(BOB); }) )

   CHECK_EQUAL( f.queue.claim_deposit(BOB, CAROL, NO_DEADLINE, T0), shares(1000000) )
   CHECK_EQUAL( f.share_book.balance_of(CAROL), shares(1000000) )
   CHECK_EQUAL( f.state.total_claimable_deposit, shares(0) )
   CHECK_EQUAL( f.state.total_supply, shares(11000000) )
   CHECK_EQUAL( f.events.claims, 1u )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(deposit_request_checks_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   CHECK_ASSERT( "[[42]]", ([&]() { f.queue.request_deposit(BOB, BOB, usdc(100), T0); }) )
   CHECK_ASSERT( "[[30]]", ([&]() { f.queue.request_deposit(BOB, BOB, usdt(0), T0); }) )
   CHECK_ASSERT( "[[32]]", ([&]() { f.queue.request_deposit(name(), BOB, usdt(100), T0); }) )

   f.state.paused = true;
   CHECK_ASSERT( "[[7]]", ([&]() { f.queue.request_deposit(BOB, BOB, usdt(100), T0); }) )
   f.state.paused = false;

   f.state.max_total_assets = usdt(10500000);
   f.request_deposit(BOB, 400000);
   //pending escrow counts against the cap
   CHECK_ASSERT( "[[31]]", ([&]() { f.queue.request_deposit(CAROL, CAROL, usdt(200000), T0); }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(deposit_request_controller_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   //bob cannot open a request in carol's name
   CHECK_ASSERT( "[[38]]", ([&]() { f.queue.request_deposit(CAROL, BOB, usdt(100000), T0); }) )
   CHECK_EQUAL( f.state.pending_deposit_count, 0u )

   f.share_book.operators.insert({CAROL, BOB});
   auto req = f.queue.request_deposit(CAROL, BOB, usdt(100000), T0);
   CHECK_EQUAL( req.controller, CAROL )
   CHECK_EQUAL( req.owner, BOB )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(cancel_deposit_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   f.request_deposit(BOB, 1000000);

   auto req = f.queue.cancel_deposit(BOB);
   CHECK_EQUAL( req.amount, usdt(1000000) )
   CHECK_EQUAL( req.owner, BOB )
   CHECK_EQUAL( f.state.total_deposit_request, usdt(0) )
   CHECK_EQUAL( f.state.pending_deposit_count, 0u )
   CHECK_EQUAL( f.events.cancels, 1u )
   CHECK_EQUAL( f.queue.settle(T0), false )
   CHECK_ASSERT( "[[40]]", ([&]() { f.queue.cancel_deposit(BOB); }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(pro_rata_claims_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   f.state.available += usdt(1000000);

   f.request_deposit(BOB, 1000000);
   f.request_deposit(CAROL, 3000000);
   f.queue.settle(T0);

   //400 at a 1.1 price, split by request size
   auto& batches = f.store.settlements[(uint8_t)request_kind::DEPOSIT];
   CHECK_EQUAL( f.state.total_claimable_deposit, shares(3636363) )
   CHECK_EQUAL( batches.size(), (size_t)1 )
   CHECK_EQUAL( batches.begin()->second.open_requests, 2u )
   CHECK_EQUAL( f.queue.claim_deposit(BOB, BOB, NO_DEADLINE, T0), shares(909090) )
   CHECK_EQUAL( batches.begin()->second.open_requests, 1u )
   CHECK_EQUAL( f.queue.claim_deposit(CAROL, CAROL, NO_DEADLINE, T0), shares(2727272) )
   //the batch goes with its last claim
   CHECK_EQUAL( batches.empty(), true )

   //the rounding leftover is burned once the batch is fully claimed
   CHECK_EQUAL( f.state.total_claimable_deposit, shares(0) )
   CHECK_EQUAL( f.state.total_supply, shares(10000000 + 909090 + 2727272) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(claim_deadline_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   f.request_deposit(BOB, 1000000);
   f.queue.settle(T0);

   auto expired = time_point_sec(T0.sec_since_epoch() - 1);
   CHECK_ASSERT( "[[39]]", ([&]() { f.queue.claim_deposit(BOB, BOB, expired, T0); }) )
   CHECK_ASSERT( "[[32]]", ([&]() { f.queue.claim_deposit(BOB, name(), NO_DEADLINE, T0); }) )
   CHECK_EQUAL( f.queue.claim_deposit(BOB, BOB, T0, T0), shares(1000000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(redeem_request_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   auto req = f.queue.request_redeem(ALICE, ALICE, shares(4000000), T0);
   CHECK_EQUAL( req.amount, shares(4000000) )
   //escrowed shares leave the owner but stay in supply
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(6000000) )
   CHECK_EQUAL( f.state.total_supply, shares(10000000) )
   CHECK_EQUAL( f.queue.pending_redemption_assets(), usdt(4000000) )

   CHECK_ASSERT( "[[40]]", ([&]() { f.queue.request_redeem(ALICE, ALICE, shares(100), T0); }) )
   CHECK_ASSERT( "[[38]]", ([&]() { f.queue.request_redeem(BOB, ALICE, shares(100), T0); }) )

   f.queue.cancel_redeem(ALICE);
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(10000000) )
   CHECK_EQUAL( f.state.total_redemption_request, shares(0) )

   //operators may request for the owner
   f.share_book.operators.insert({ALICE, BOB});
   f.queue.request_redeem(BOB, ALICE, shares(1000000), T0);
   f.queue.settle(T0);
   CHECK_EQUAL( f.state.claimable_redemption_assets, usdt(1000000) )
   CHECK_EQUAL( f.state.available, usdt(9000000) )
   CHECK_EQUAL( f.state.total_supply, shares(9000000) )
   CHECK_EQUAL( f.claim_redeem(BOB), usdt(1000000) )
   CHECK_EQUAL( f.state.claimable_redemption_assets, usdt(0) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(redeem_fee_test)
   vault_fixture f;
   f.state.fees = fees_t{ 0, 0, 0, 2 };
   f.deposit(ALICE, 10000000);
   f.queue.request_redeem(ALICE, ALICE, shares(1000000), T0);
   f.queue.settle(T0);

   //exit fee held back from the settled batch
   CHECK_EQUAL( f.state.claimable_redemption_assets, usdt(999800) )
   CHECK_EQUAL( f.state.claimable_asset_fees, usdt(200) )
   CHECK_EQUAL( f.claim_redeem(ALICE), usdt(999800) )
   CHECK_EQUAL( f.store.settlements[(uint8_t)request_kind::REDEEM].empty(), true )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(exempt_request_fee_test)
   //entry fee only on carol's half of the batch
   {
      vault_fixture f;
      f.no_fees();
      f.deposit(ALICE, 10000000);
      f.state.fees = fees_t{ 0, 0, 2, 0 };
      f.share_book.exempt.insert(BOB);

      CHECK_EQUAL( f.request_deposit(BOB, 1000000).exempt, true )
      f.request_deposit(CAROL, 1000000);
      CHECK_EQUAL( f.state.exempt_deposit_request, usdt(1000000) )
      f.queue.settle(T0);
      CHECK_EQUAL( f.state.claimable_asset_fees, usdt(200) )
      CHECK_EQUAL( f.queue.claim_deposit(BOB, BOB, NO_DEADLINE, T0), shares(1000000) )
      CHECK_EQUAL( f.queue.claim_deposit(CAROL, CAROL, NO_DEADLINE, T0), shares(999800) )
      CHECK_EQUAL( f.state.total_supply, shares(11999800) )
   }
   //exit fee only on alice's half
   {
      vault_fixture f;
      f.no_fees();
      f.deposit(ALICE, 10000000);
      f.state.fees = fees_t{ 0, 0, 0, 2 };
      f.ledger.transfer(ALICE, BOB, shares(2000000));
      f.share_book.exempt.insert(BOB);

      f.queue.request_redeem(ALICE, ALICE, shares(1000000), T0);
      f.queue.request_redeem(BOB, BOB, shares(1000000), T0);
      f.queue.settle(T0);
      CHECK_EQUAL( f.state.claimable_asset_fees, usdt(200) )
      CHECK_EQUAL( f.state.claimable_redemption_assets, usdt(1999800) )
      CHECK_EQUAL( f.claim_redeem(BOB), usdt(1000000) )
      CHECK_EQUAL( f.claim_redeem(ALICE), usdt(999800) )
      CHECK_EQUAL( f.state.claimable_redemption_assets, usdt(0) )
      CHECK_EQUAL( f.state.available, usdt(8000200) )
   }
   //a canceled exempt request leaves the exempt escrow
   {
      vault_fixture f;
      f.no_fees();
      f.deposit(ALICE, 10000000);
      f.share_book.exempt.insert(BOB);
      f.request_deposit(BOB, 1000000);
      f.queue.cancel_deposit(BOB);
      CHECK_EQUAL( f.state.exempt_deposit_request, usdt(0) )
   }
EOSIO_TEST_END

EOSIO_TEST_BEGIN(withdraw_request_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   f.balances.add(USDT, 1000000);
   f.state.available += usdt(1000000);

   //2 USDT at a 1.1 price, rounded up against the owner
   auto req = f.queue.request_withdraw(ALICE, ALICE, usdt(20000), T0);
   CHECK_EQUAL( req.amount, shares(18182) )
   CHECK_EQUAL( f.state.total_redemption_request, shares(18182) )

   CHECK_ASSERT( "[[4]]",  ([&]() { f.queue.request_withdraw(BOB, ALICE, usdc(100), T0); }) )
   CHECK_ASSERT( "[[30]]", ([&]() { f.queue.request_withdraw(BOB, ALICE, usdt(0), T0); }) )
   CHECK_ASSERT( "[[38]]", ([&]() { f.queue.request_withdraw(BOB, ALICE, usdt(100), T0); }) )

   f.queue.settle(T0);
   CHECK_EQUAL( f.claim_redeem(ALICE) >= usdt(20000), true )
EOSIO_TEST_END

// idle liquidity short of a redemption: the request waits for a liquidation
EOSIO_TEST_BEGIN(redemption_shortfall_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   f.two_inputs(5000, 4500);
   f.engine.invest(f.amounts(5000000, 4500000), {}, T0);
   CHECK_EQUAL( f.state.available, usdt(500000) )

   f.queue.request_redeem(ALICE, ALICE, shares(4000000), T0);
   CHECK_EQUAL( f.queue.settle(T0), false )
   CHECK_EQUAL( f.queue.redemption_shortfall(), usdt(3500000) )
   CHECK_ASSERT( "[[41]]", ([&]() { f.queue.claim_redeem(ALICE, ALICE, NO_DEADLINE, T0); }) )

   //pending redemptions are not investable
   CHECK_EQUAL( f.engine.investable(), usdt(0) )

   auto targets = f.engine.preview_liquidate(usdt(0));
   CHECK_EQUAL( targets[0], usdt(1842106) )
   CHECK_EQUAL( targets[1], usdt(1657895) )

   //the liquidation settles the waiting request
   f.engine.liquidate(targets, usdt(0), false, {}, T0);
   CHECK_EQUAL( f.state.claimable_redemption_assets, usdt(4000000) )
   CHECK_EQUAL( f.state.available, usdt(1) )
   CHECK_EQUAL( f.claim_redeem(ALICE), usdt(4000000) )
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(6000000) )
   CHECK_EQUAL( f.state.total_supply, shares(6000000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(missing_oracle_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   f.two_inputs(5000, 4500);

   f.prices.prices.erase("usdc"_n);
   CHECK_ASSERT( "[[43]]", ([&]() { f.queue.request_redeem(ALICE, ALICE, shares(100), T0); }) )
   f.prices.prices["usdc"_n] = 10000;
   f.prices.prices.erase("usdt"_n);
   CHECK_ASSERT( "[[43]]", ([&]() { f.queue.check_oracles(); }) )
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(deposit_request_test)
   EOSIO_TEST(deposit_request_checks_test)
   EOSIO_TEST(deposit_request_controller_test)
   EOSIO_TEST(cancel_deposit_test)
   EOSIO_TEST(pro_rata_claims_test)
   EOSIO_TEST(claim_deadline_test)
   EOSIO_TEST(redeem_request_test)
   EOSIO_TEST(redeem_fee_test)
   EOSIO_TEST(exempt_request_fee_test)
   EOSIO_TEST(withdraw_request_test)
   EOSIO_TEST(redemption_shortfall_test)
   EOSIO_TEST(missing_oracle_test)
   return has_failed();
}
