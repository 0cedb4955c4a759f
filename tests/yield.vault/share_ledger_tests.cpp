#include <eosio/tester.hpp>

#include <cstring>

#include "test.mocks.hpp"

using namespace yieldfi_test;

EOSIO_TEST_BEGIN(deposit_test)
   vault_fixture f;
   f.no_fees();

   //empty vault mints 1:1
   CHECK_EQUAL( f.deposit(ALICE, 10000000), shares(10000000) )
   CHECK_EQUAL( f.state.total_supply, shares(10000000) )
   CHECK_EQUAL( f.state.available, usdt(10000000) )
   CHECK_EQUAL( f.ledger.share_price(), usdt(10000) )
   CHECK_EQUAL( f.events.deposits, 1u )

   //yield lifts the price, later deposits get fewer shares
   f.balances.add(USDT, 1000000);
   f.state.available += usdt(1000000);
   CHECK_EQUAL( f.ledger.share_price(), usdt(11000) )
   CHECK_EQUAL( f.deposit(BOB, 1100000), shares(1000000) )
   CHECK_EQUAL( f.share_book.balance_of(BOB), shares(1000000) )
   CHECK_EQUAL( f.ledger.total_assets(), usdt(12100000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(entry_fee_test)
   vault_fixture f;

   //2 bps taken from the deposit, kept as claimable fees
   CHECK_EQUAL( f.deposit(ALICE, 10000000), shares(9998000) )
   CHECK_EQUAL( f.state.claimable_asset_fees, usdt(2000) )
   CHECK_EQUAL( f.state.available, usdt(10000000) )

   //exempt accounts pay no fee
   f.share_book.exempt.insert(BOB);
   auto before = f.state.total_supply;
   f.deposit(BOB, 1000000);
   CHECK_EQUAL( f.state.claimable_asset_fees, usdt(2000) )
   CHECK_EQUAL( f.ledger.preview_deposit(usdt(1000000), true), f.state.total_supply - before )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(deposit_limits_test)
   vault_fixture f;
   f.no_fees();
   f.ledger.set_max_total_assets(usdt(10000000));
   CHECK_EQUAL( f.events.last_max_total_assets, usdt(10000000) )

   f.deposit(ALICE, 9000000);
   CHECK_ASSERT( "[[31]]", ([&]() { f.ledger.deposit(BOB, usdt(1000001), BOB); }) )
   CHECK_ASSERT( "[[30]]", ([&]() { f.ledger.deposit(BOB, usdt(0), BOB); }) )
   CHECK_ASSERT( "[[38]]", ([&]() { f.ledger.deposit(BOB, usdt(100), VAULT); }) )
   CHECK_ASSERT( "[[4]]",  ([&]() { f.ledger.deposit(BOB, usdc(100), BOB); }) )

   //the cap does not bind exempt callers
   f.share_book.exempt.insert(BOB);
   f.deposit(BOB, 5000000);
   CHECK_EQUAL( f.ledger.total_assets(), usdt(14000000) )

   f.state.paused = true;
   CHECK_ASSERT( "[[7]]", ([&]() { f.ledger.deposit(ALICE, usdt(100), ALICE); }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(seed_test)
   vault_fixture f;
   f.no_fees();
   f.state.min_liquidity = usdt(1000000);

   CHECK_EQUAL( f.ledger.seeded(), false )
   CHECK_ASSERT( "[[37]]", ([&]() { f.ledger.deposit(ALICE, usdt(5000000), ALICE); }) )
   CHECK_ASSERT( "[[37]]", ([&]() { f.ledger.seed(ADMIN, usdt(500000), ADMIN); }) )

   f.balances.add(USDT, 1000000);
   CHECK_EQUAL( f.ledger.seed(ADMIN, usdt(1000000), ADMIN), shares(1000000) )
   CHECK_EQUAL( f.ledger.seeded(), true )
   CHECK_EQUAL( f.deposit(ALICE, 5000000), shares(5000000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(mint_test)
   vault_fixture f;

   //net 100 plus the 2 bps entry fee grossed up
   CHECK_EQUAL( f.ledger.preview_mint(shares(1000000), false), usdt(1000201) )
   auto gross = f.ledger.mint(ALICE, shares(1000000), ALICE, usdt(1010000));
   CHECK_EQUAL( gross, usdt(1000201) )
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(1000000) )
   CHECK_EQUAL( f.state.available, usdt(1000201) )
   CHECK_EQUAL( f.state.claimable_asset_fees, usdt(201) )

   CHECK_ASSERT( "[[30]]", ([&]() { f.ledger.mint(BOB, shares(1000000), BOB, usdt(1000000)); }) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(withdraw_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   CHECK_EQUAL( f.ledger.withdraw(ALICE, usdt(2000000), ALICE, ALICE), shares(2000000) )
   CHECK_EQUAL( f.state.available, usdt(8000000) )
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(8000000) )
   CHECK_EQUAL( f.events.withdrawals, 1u )

   CHECK_ASSERT( "[[31]]", ([&]() { f.ledger.withdraw(ALICE, usdt(8000001), ALICE, ALICE); }) )
   CHECK_ASSERT( "[[38]]", ([&]() { f.ledger.withdraw(BOB, usdt(100), BOB, ALICE); }) )

   //approved operators act for the owner
   f.share_book.operators.insert({ALICE, BOB});
   f.ledger.withdraw(BOB, usdt(1000000), BOB, ALICE);
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(7000000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(withdraw_liquidity_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   //90 of 100 deployed: shares cover 20 but only 10 is idle
   input_slot input;
   input.token     = USDT;
   input.weight    = 9000;
   input.position  = POS_USDT;
   input.invested  = usdt(9000000);
   f.inputs[0]     = input;
   f.state.available -= usdt(9000000);

   CHECK_EQUAL( f.ledger.total_assets(), usdt(10000000) )
   CHECK_EQUAL( f.ledger.max_withdraw(ALICE), usdt(1000000) )
   CHECK_EQUAL( f.ledger.max_redeem(ALICE), shares(1000000) )
   CHECK_EQUAL( f.ledger.max_redeem(BOB), shares(0) )
   CHECK_ASSERT( "[[41]]", ([&]() { f.ledger.withdraw(ALICE, usdt(2000000), ALICE, ALICE); }) )
   CHECK_ASSERT( "[[41]]", ([&]() { f.ledger.redeem(ALICE, shares(2000000), ALICE, ALICE); }) )

   //the redeemable maximum goes through
   CHECK_EQUAL( f.ledger.redeem(ALICE, f.ledger.max_redeem(ALICE), ALICE, ALICE), usdt(1000000) )
   CHECK_EQUAL( f.ledger.max_redeem(ALICE), shares(0) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(redeem_test)
   vault_fixture f;
   f.deposit(ALICE, 10000000);

   //exit fee rounds up, the holder gets the rest
   auto before = f.state.claimable_asset_fees;
   auto out = f.redeem(ALICE, 1000000);
   CHECK_EQUAL( out, usdt(999999) )
   CHECK_EQUAL( f.state.claimable_asset_fees - before + out, usdt(1000200) )
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(8998000) )

   //price never drops from a redemption
   CHECK_EQUAL( f.ledger.share_price() >= usdt(10002), true )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(safe_variants_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);
   auto now         = T0;
   auto expired     = time_point_sec(T0.sec_since_epoch() - 1);
   auto deadline    = time_point_sec(T0.sec_since_epoch() + 60);

   f.balances.add(USDT, 1000000);
   CHECK_EQUAL( f.ledger.safe_deposit(BOB, usdt(1000000), BOB, shares(1000000), deadline, now), shares(1000000) )

   CHECK_ASSERT( "[[39]]", ([&]() { f.ledger.safe_deposit(BOB, usdt(100), BOB, shares(0), expired, now); }) )
   CHECK_ASSERT( "[[30]]", ([&]() { f.ledger.safe_redeem(BOB, shares(1000000), BOB, BOB, usdt(1000001), deadline, now); }) )
   CHECK_ASSERT( "[[31]]", ([&]() { f.ledger.safe_withdraw(BOB, usdt(1000000), BOB, BOB, shares(999999), deadline, now); }) )
   CHECK_ASSERT( "[[39]]", ([&]() { f.ledger.safe_withdraw(BOB, usdt(100), BOB, BOB, shares(100), expired, now); }) )

   CHECK_EQUAL( f.ledger.safe_withdraw(BOB, usdt(500000), BOB, BOB, shares(500000), deadline, now), shares(500000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(share_transfer_test)
   vault_fixture f;
   f.no_fees();
   f.deposit(ALICE, 10000000);

   f.ledger.transfer(ALICE, BOB, shares(4000000));
   CHECK_EQUAL( f.share_book.balance_of(ALICE), shares(6000000) )
   CHECK_EQUAL( f.share_book.balance_of(BOB), shares(4000000) )
   CHECK_EQUAL( f.state.total_supply, shares(10000000) )

   CHECK_ASSERT( "[[31]]", ([&]() { f.ledger.transfer(BOB, CAROL, shares(4000001)); }) )
   CHECK_ASSERT( "[[5]]",  ([&]() { f.ledger.transfer(BOB, BOB, shares(1)); }) )
   CHECK_ASSERT( "[[32]]", ([&]() { f.ledger.transfer(BOB, name(), shares(1)); }) )
   CHECK_EQUAL( f.share_book.balance_of(BOB), shares(4000000) )
EOSIO_TEST_END

// conversions never hand back more than was put in
EOSIO_TEST_BEGIN(conversion_rounding_test)
   vault_fixture f;
   f.deposit(ALICE, 10000000);

   //yield accrued in steps moves the price off 1.0
   for (int64_t gain : { 0, 3, 1234567, 98765432 }) {
      f.balances.add(USDT, gain);
      f.state.available += usdt(gain);
      for (int64_t amount : { 1, 3, 9999, 1000000, 77777777 }) {
         for (bool exempt : { false, true }) {
            auto minted = f.ledger.preview_deposit(usdt(amount), exempt);
            CHECK_EQUAL( f.ledger.preview_redeem(minted, exempt) <= usdt(amount), true )
            CHECK_EQUAL( f.ledger.preview_withdraw(usdt(amount), exempt) >= minted, true )
            CHECK_EQUAL( f.ledger.preview_mint(minted, exempt) <= usdt(amount), true )
         }
      }
   }

   //an immediate exit never lowers the price for the rest
   auto price  = f.ledger.share_price();
   auto minted = f.deposit(BOB, 1000000);
   CHECK_EQUAL( f.redeem(BOB, minted.amount) <= usdt(1000000), true )
   CHECK_EQUAL( f.ledger.share_price() >= price, true )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(reentrancy_guard_test)
   vault_fixture f;
   {
      reentrancy_guard guard(f.state);
      CHECK_EQUAL( f.state.locked, true )
   }
   CHECK_EQUAL( f.state.locked, false )

   f.state.allocating = true;
   CHECK_ASSERT( "[[9]]", ([&]() { reentrancy_guard guard(f.state); }) )
   f.state.allocating = false;
   CHECK_ASSERT( "[[40]]", ([&]() { reentrancy_guard guard(f.state, true); }) )

   f.state.locked = true;
   CHECK_ASSERT( "[[9]]", ([&]() { reentrancy_guard guard(f.state); }) )
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(deposit_test)
   EOSIO_TEST(entry_fee_test)
   EOSIO_TEST(deposit_limits_test)
   EOSIO_TEST(seed_test)
   EOSIO_TEST(mint_test)
   EOSIO_TEST(withdraw_test)
   EOSIO_TEST(withdraw_liquidity_test)
   EOSIO_TEST(redeem_test)
   EOSIO_TEST(safe_variants_test)
   EOSIO_TEST(share_transfer_test)
   EOSIO_TEST(conversion_rounding_test)
   EOSIO_TEST(reentrancy_guard_test)
   return has_failed();
}
