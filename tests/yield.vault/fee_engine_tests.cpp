#include <eosio/tester.hpp>

#include <cstring>

#include "test.mocks.hpp"

using namespace yieldfi_test;

static time_point_sec after( uint32_t secs ) {
   return time_point_sec(T0.sec_since_epoch() + secs);
}

EOSIO_TEST_BEGIN(fee_math_test)
   //rounded up in favour of the pool
   CHECK_EQUAL( calc_fee(usdt(10000), 2), usdt(2) )
   CHECK_EQUAL( calc_fee(usdt(10001), 2), usdt(3) )
   CHECK_EQUAL( calc_fee(usdt(10000), 0), usdt(0) )
   CHECK_EQUAL( gross_up(usdt(9998), 2), usdt(10000) )
   CHECK_EQUAL( gross_up(usdt(1000000), 0), usdt(1000000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(set_fees_test)
   vault_fixture f;
   f.fees.set_fees(fees_t{ 2000, 100, 10, 10 });
   CHECK_EQUAL( f.state.fees.perf, 2000 )
   CHECK_EQUAL( f.events.fee_updates, 1u )

   CHECK_ASSERT( "[[31]]", ([&]() { f.fees.set_fees(fees_t{ 5001, 0, 0, 0 }); }) )
   CHECK_ASSERT( "[[31]]", ([&]() { f.fees.set_fees(fees_t{ 0, 501, 0, 0 }); }) )
   CHECK_ASSERT( "[[31]]", ([&]() { f.fees.set_fees(fees_t{ 0, 0, 201, 0 }); }) )
   CHECK_ASSERT( "[[31]]", ([&]() { f.fees.set_fees(fees_t{ 0, 0, 0, 201 }); }) )
   CHECK_EQUAL( f.state.fees.perf, 2000 )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(cooldown_test)
   vault_fixture f;
   f.state.fees = fees_t{ 1000, 0, 0, 0 };
   f.deposit(ALICE, 10000000);
   f.state.available += usdt(1000000);

   //within the cooldown nothing is minted and the checkpoint stays
   CHECK_EQUAL( f.fees.collect(after(DAY_SECONDS - 1)), shares(0) )
   CHECK_EQUAL( f.state.last_fee_collection, T0 )
   CHECK_EQUAL( f.share_book.balance_of(FEE_COLLECTOR), shares(0) )
   CHECK_EQUAL( f.fees.preview(after(DAY_SECONDS)).due, true )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(performance_fee_test)
   vault_fixture f;
   f.state.fees = fees_t{ 1000, 0, 0, 0 };
   f.deposit(ALICE, 10000000);

   //100 profit over the 1.0 watermark, 10% of it is due
   f.state.available += usdt(1000000);
   auto quote = f.fees.preview(after(DAY_SECONDS));
   CHECK_EQUAL( quote.perf, usdt(100000) )
   CHECK_EQUAL( quote.mgmt, usdt(0) )

   auto minted = f.fees.collect(after(DAY_SECONDS));
   CHECK_EQUAL( minted, shares(90909) )
   CHECK_EQUAL( f.share_book.balance_of(FEE_COLLECTOR), shares(90909) )
   CHECK_EQUAL( f.state.total_supply, shares(10090909) )
   CHECK_EQUAL( f.state.last_share_price, usdt(10901) )
   CHECK_EQUAL( f.state.last_fee_collection, after(DAY_SECONDS) )
   CHECK_EQUAL( f.events.last_perf, usdt(100000) )

   //no new profit, no new performance fee
   CHECK_EQUAL( f.fees.preview(after(2 * DAY_SECONDS)).perf, usdt(0) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(management_fee_test)
   vault_fixture f;
   f.state.fees = fees_t{ 0, 20, 0, 0 };
   f.deposit(ALICE, 10000000);

   //0.2% of 1000 over a year
   auto minted = f.fees.collect(after(YEAR_SECONDS));
   CHECK_EQUAL( f.events.last_mgmt, usdt(20000) )
   CHECK_EQUAL( minted, shares(20000) )
   CHECK_EQUAL( f.ledger.total_assets(), usdt(10000000) )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(entry_exit_fee_collection_test)
   vault_fixture f;
   f.state.fees = fees_t{ 0, 0, 2, 2 };
   f.deposit(ALICE, 10000000);
   CHECK_EQUAL( f.state.claimable_asset_fees, usdt(2000) )

   auto minted = f.fees.collect(after(DAY_SECONDS));
   CHECK_EQUAL( minted.amount > 0, true )
   CHECK_EQUAL( f.state.claimable_asset_fees, usdt(0) )
   CHECK_EQUAL( f.share_book.balance_of(FEE_COLLECTOR), minted )
EOSIO_TEST_END

EOSIO_TEST_BEGIN(missing_collector_test)
   vault_fixture f;
   f.state.fees = fees_t{ 1000, 0, 0, 0 };
   f.deposit(ALICE, 10000000);
   f.state.available += usdt(1000000);
   f.state.fee_collector = name();
   CHECK_ASSERT( "[[32]]", ([&]() { f.fees.collect(after(DAY_SECONDS)); }) )
EOSIO_TEST_END

int main(int argc, char** argv) {
   bool verbose = false;
   if( argc >= 2 && std::strcmp( argv[1], "-v" ) == 0 ) {
      verbose = true;
   }
   silence_output(!verbose);

   EOSIO_TEST(fee_math_test)
   EOSIO_TEST(set_fees_test)
   EOSIO_TEST(cooldown_test)
   EOSIO_TEST(performance_fee_test)
   EOSIO_TEST(management_fee_test)
   EOSIO_TEST(entry_exit_fee_collection_test)
   EOSIO_TEST(missing_collector_test)
   return has_failed();
}
