#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include <memory>
#include <string>

#include <yield.alloc/yield.alloc.db.hpp>
#include <yieldfi/errors.hpp>

namespace yieldfi {

using std::string;
using std::vector;

using namespace eosio;

class alloc_env;

/**
 * The `yield.alloc` contract holds a crate of one token and lends it to
 * registered strategies up to their debt ceiling.
 *
 * Funding the crate is a plain token transfer. Liquidations send an inline
 * `recall` to the strategy followed by `recallchk`, which measures what came
 * back in the same transaction.
 */
class [[eosio::contract("yield.alloc")]] yield_alloc : public contract {
   public:
      using contract::contract;

   yield_alloc(eosio::name receiver, eosio::name code, datastream<const char*> ds);
   ~yield_alloc();

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   ACTION init(const name& admin, const name& keeper, const extended_symbol& token);
   ACTION addstrategy(const name& strategy, const string& label, const asset& max_deposit);
   ACTION setstrategy(const name& strategy, const bool& whitelisted);
   ACTION setmaxdep(const name& strategy, const asset& max_deposit);
   ACTION setpanic(const name& strategy, const bool& panicked);
   ACTION retire(const name& strategy);
   ACTION withdraw(const name& to, const asset& amount);

   ACTION dispatch(const vector<asset>& amounts, const vector<name>& strategies);
   ACTION liquidate(const asset& amount, const asset& min_out, const name& strategy);
   ACTION panicliq(const asset& amount, const name& strategy);
   ACTION recallchk();

   ACTION updatedebt(const name& strategy, const asset& debt, const asset& assets_available);

   [[eosio::action, eosio::read_only]] vector<strategy_info> strategymap();

   ACTION notifywdraw(const name& to, const asset& amount);
   using notifywdraw_action   = action_wrapper<"notifywdraw"_n,  &yield_alloc::notifywdraw>;
   ACTION notifydebt(const asset& total_chain_debt);
   using notifydebt_action    = action_wrapper<"notifydebt"_n,   &yield_alloc::notifydebt>;
   ACTION notifyadded(const strategy_info& info);
   using notifyadded_action   = action_wrapper<"notifyadded"_n,  &yield_alloc::notifyadded>;
   ACTION notifymaxdep(const name& strategy, const asset& max_deposit);
   using notifymaxdep_action  = action_wrapper<"notifymaxdep"_n, &yield_alloc::notifymaxdep>;
   ACTION notifypos(const name& strategy, const asset& debt, const asset& assets_available);
   using notifypos_action     = action_wrapper<"notifypos"_n,    &yield_alloc::notifypos>;
   ACTION notifyupdate(const name& strategy, const bool& whitelisted, const bool& retired);
   using notifyupdate_action  = action_wrapper<"notifyupdate"_n, &yield_alloc::notifyupdate>;
   ACTION notifydepo(const name& strategy, const asset& amount);
   using notifydepo_action    = action_wrapper<"notifydepo"_n,   &yield_alloc::notifydepo>;
   ACTION notifyloss(const name& strategy, const asset& loss);
   using notifyloss_action    = action_wrapper<"notifyloss"_n,   &yield_alloc::notifyloss>;
   ACTION notifypanliq(const name& strategy, const asset& received);
   using notifypanliq_action  = action_wrapper<"notifypanliq"_n, &yield_alloc::notifypanliq>;
   ACTION notifypanic(const name& strategy, const bool& panicked);
   using notifypanic_action   = action_wrapper<"notifypanic"_n,  &yield_alloc::notifypanic>;

   using recallchk_action     = action_wrapper<"recallchk"_n,    &yield_alloc::recallchk>;

   private:
      void _check_admin();
      void _check_keeper();
      void _schedule_check();
      time_point_sec _now() const { return time_point_sec(current_time_point()); }

      alloc_env& _alloc();

      global_singleton              _global;
      global_t                      _gstate;
      std::unique_ptr<alloc_env>    _env;
      bool                          _read_only  = false;    //set by read-only actions, nothing is saved
};
} //namespace yieldfi
