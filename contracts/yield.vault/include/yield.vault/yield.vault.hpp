#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <memory>
#include <string>

#include <yield.vault/yield.vault.db.hpp>
#include <yieldfi/errors.hpp>

namespace yieldfi {

using std::string;
using std::vector;

using namespace eosio;

class vault_env;

/**
 * The `yield.vault` contract pools one asset, issues shares against it and
 * deploys the idle part across up to eight weighted inputs (position
 * contracts), swapping through `swap_contract` where an input is not the
 * vault asset.
 *
 * Users deposit by transferring the asset in:
 *    "deposit[:receiver[:min_shares[:deadline]]]"
 *    "mint:shares[:receiver[:deadline]]"      - excess assets are refunded
 *    "request[:controller]"                    - asynchronous deposit, the controller must have approved the sender
 *    "seed[:receiver]"                         - admin only, lifts the vault to min liquidity
 * or any other token, swapped into the asset first:
 *    "swapdeposit:min_shares[:receiver[:deadline[:swap_params]]]"
 *
 * Keepers invest/liquidate with per-slot targets; each leg runs as inline
 * `legstep` actions followed by `allocend`, all in one transaction.
 */
class [[eosio::contract("yield.vault")]] yield_vault : public contract {
   public:
      using contract::contract;

   yield_vault(eosio::name receiver, eosio::name code, datastream<const char*> ds);
   ~yield_vault();

   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //admin
   ACTION init(const name& admin, const name& keeper, const extended_symbol& asset_token, const symbol& share_sym,
               const name& fee_collector, const name& price_oracle_contract, const name& swap_contract,
               const asset& max_total_assets);
   ACTION setfees(const fees_t& fees);
   ACTION setfeecoll(const name& fee_collector);
   ACTION setmaxassets(const asset& max_total_assets);
   ACTION setminliq(const asset& min_liquidity);
   ACTION setcooldown(const uint32_t& profit_cooldown);
   ACTION setslippage(const uint16_t& max_slippage_bps, const uint8_t& mode);
   ACTION setdust(const asset& dust);
   ACTION setinputs(const vector<input_conf>& inputs);
   ACTION setweights(const vector<uint16_t>& weights);
   ACTION setexempt(const name& account, const bool& exempt);
   ACTION pause(const bool& paused);
   ACTION updateasset(const extended_symbol& token, const string& swap_params);
   ACTION assetcommit();
   ACTION emptystrat(const vector<string>& swap_params);
   ACTION reqrescue(const extended_symbol& token);
   ACTION rescue(const extended_symbol& token);

   //user
   ACTION setoperator(const name& owner, const name& op, const bool& approved);
   ACTION sharexfer(const name& from, const name& to, const asset& shares, const string& memo);
   ACTION withdraw(const name& caller, const asset& assets, const name& receiver, const name& owner);
   ACTION redeem(const name& caller, const asset& shares, const name& receiver, const name& owner);
   ACTION safewithdraw(const name& caller, const asset& assets, const name& receiver, const name& owner,
                       const asset& max_shares, const time_point_sec& deadline);
   ACTION saferedeem(const name& caller, const asset& shares, const name& receiver, const name& owner,
                     const asset& min_assets, const time_point_sec& deadline);
   ACTION reqredeem(const name& controller, const name& owner, const asset& shares);
   ACTION reqwithdraw(const name& controller, const name& owner, const asset& assets);
   ACTION swapcommit();
   ACTION canceldep(const name& controller);
   ACTION cancelredm(const name& controller);
   ACTION claimdep(const name& controller, const name& receiver, const time_point_sec& deadline);
   ACTION claimredm(const name& controller, const name& receiver, const time_point_sec& deadline);

   //keeper
   ACTION invest(const vector<asset>& amounts, const vector<string>& swap_params);
   ACTION liquidate(const vector<asset>& amounts, const asset& min_liquidity, const bool& panic,
                    const vector<string>& swap_params);
   ACTION legstep(const uint8_t& leg_index);
   ACTION allocend();
   ACTION settle();
   ACTION collectfees();
   ACTION sync();

   [[eosio::action, eosio::read_only]] asset            shareprice();
   [[eosio::action, eosio::read_only]] asset            totalassets();
   [[eosio::action, eosio::read_only]] asset            maxwithdraw(const name& owner);
   [[eosio::action, eosio::read_only]] asset            maxredeem(const name& owner);
   [[eosio::action, eosio::read_only]] vector<asset>    previewinv(const asset& amount);
   [[eosio::action, eosio::read_only]] vector<asset>    previewliq(const asset& amount);
   [[eosio::action, eosio::read_only]] int64_t          excess(const uint8_t& slot);

   ACTION notifydep(const name& caller, const name& receiver, const asset& assets, const asset& shares);
   using notifydep_action     = action_wrapper<"notifydep"_n,    &yield_vault::notifydep>;
   ACTION notifywdr(const name& caller, const name& receiver, const name& owner, const asset& assets, const asset& shares);
   using notifywdr_action     = action_wrapper<"notifywdr"_n,    &yield_vault::notifywdr>;
   ACTION notifyreq(const uint8_t& kind, const request_t& req);
   using notifyreq_action     = action_wrapper<"notifyreq"_n,    &yield_vault::notifyreq>;
   ACTION notifycancel(const uint8_t& kind, const request_t& req);
   using notifycancel_action  = action_wrapper<"notifycancel"_n, &yield_vault::notifycancel>;
   ACTION notifyclaim(const uint8_t& kind, const request_t& req, const name& receiver, const asset& out);
   using notifyclaim_action   = action_wrapper<"notifyclaim"_n,  &yield_vault::notifyclaim>;
   ACTION notifyprice(const asset& share_price, const asset& total_assets, const asset& total_supply);
   using notifyprice_action   = action_wrapper<"notifyprice"_n,  &yield_vault::notifyprice>;
   ACTION notifyfees(const asset& perf, const asset& mgmt, const asset& entry_exit, const asset& shares);
   using notifyfees_action    = action_wrapper<"notifyfees"_n,   &yield_vault::notifyfees>;
   ACTION notifyfeeset(const fees_t& fees);
   using notifyfeeset_action  = action_wrapper<"notifyfeeset"_n, &yield_vault::notifyfeeset>;
   ACTION notifymaxta(const asset& max_total_assets);
   using notifymaxta_action   = action_wrapper<"notifymaxta"_n,  &yield_vault::notifymaxta>;
   ACTION notifyalloc(const bool& investing, const uint8_t& slot, const asset& target, const asset& realized);
   using notifyalloc_action   = action_wrapper<"notifyalloc"_n,  &yield_vault::notifyalloc>;

   using legstep_action       = action_wrapper<"legstep"_n,      &yield_vault::legstep>;
   using allocend_action      = action_wrapper<"allocend"_n,     &yield_vault::allocend>;
   using assetcommit_action   = action_wrapper<"assetcommit"_n,  &yield_vault::assetcommit>;
   using swapcommit_action    = action_wrapper<"swapcommit"_n,   &yield_vault::swapcommit>;
   using collectfees_action   = action_wrapper<"collectfees"_n,  &yield_vault::collectfees>;

   private:
      void _on_deposit(const name& from, const asset& quant, const vector<string>& parts);
      void _on_mint(const name& from, const asset& quant, const vector<string>& parts);
      void _on_swap_deposit(const name& from, const extended_asset& quant, const vector<string>& parts);
      void _schedule(const alloc_plan& plan);
      bool _is_collaborator(const name& account) const;
      void _check_admin();
      void _check_keeper();
      time_point_sec _now() const { return time_point_sec(current_time_point()); }

      vault_env& _vault();

      global_singleton              _global;
      global_t                      _gstate;
      std::unique_ptr<vault_env>    _env;
      bool                          _read_only  = false;    //set by read-only actions, nothing is saved
};
} //namespace yieldfi
