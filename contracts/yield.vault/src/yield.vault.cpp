#include <yield.vault/yield.vault.hpp>
#include <yield.vault/vault.env.hpp>
#include <token/token.hpp>
#include <yieldfi/utils.hpp>

#include "safemath.hpp"

namespace yieldfi {

using namespace std;
using namespace wasm::safemath;
using yieldfi_token::active_perm;

yield_vault::yield_vault(eosio::name receiver, eosio::name code, datastream<const char*> ds):
   contract(receiver, code, ds),
   _global(get_self(), get_self().value)
{
   _gstate = _global.exists() ? _global.get() : global_t{};
}

yield_vault::~yield_vault() {
   if (_read_only) return;
   if (_env) _env->save_inputs();
   _global.set( _gstate, get_self() );
}

vault_env& yield_vault::_vault() {
   CHECKC( _gstate.initialized, err::RECORD_NOT_FOUND, "vault not initialized" )
   if (!_env) _env = std::make_unique<vault_env>(get_self(), _gstate);
   return *_env;
}

void yield_vault::_check_admin() {
   CHECKC( has_auth(_self) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operate" )
}

void yield_vault::_check_keeper() {
   CHECKC( has_auth(_self) || has_auth(_gstate.keeper) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operate" )
}

// swap proceeds and unstaked tokens during an allocation are read from balances
bool yield_vault::_is_collaborator(const name& account) const {
   if (account == _gstate.swap_contract) return true;
   input_t::tbl_t rows(_self, _self.value);
   for (auto itr = rows.begin(); itr != rows.end(); itr++) {
      if (itr->input.position == account) return true;
   }
   return false;
}

void yield_vault::init(const name& admin, const name& keeper, const extended_symbol& asset_token, const symbol& share_sym,
                       const name& fee_collector, const name& price_oracle_contract, const name& swap_contract,
                       const asset& max_total_assets) {
   require_auth( _self );
   CHECKC( !_gstate.initialized, err::RECORD_EXISTING, "vault already initialized" )
   CHECKC( is_account(admin) && is_account(keeper), err::PARAM_ERROR, "admin or keeper account invalid" )

   _gstate.admin                    = admin;
   _gstate.keeper                   = keeper;
   _gstate.price_oracle_contract    = price_oracle_contract;
   _gstate.swap_contract            = swap_contract;
   _gstate.exempt.insert(admin);
   init_vault_state( _gstate.vault, asset_token, share_sym, fee_collector, max_total_assets, _now() );
   _gstate.initialized              = true;
}

void yield_vault::setfees(const fees_t& fees) {
   _check_admin();
   _vault().fees().set_fees(fees);
}

void yield_vault::setfeecoll(const name& fee_collector) {
   _check_admin();
   CHECKC( is_account(fee_collector), err::ADDRESS_IS_ZERO, "fee collector account invalid" )
   _gstate.vault.fee_collector = fee_collector;
}

void yield_vault::setmaxassets(const asset& max_total_assets) {
   _check_admin();
   _vault().ledger().set_max_total_assets(max_total_assets);
}

void yield_vault::setminliq(const asset& min_liquidity) {
   _check_admin();
   CHECKC( min_liquidity.symbol == _gstate.vault.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )
   CHECKC( min_liquidity.amount >= 0, err::PARAM_ERROR, "negative min liquidity" )
   _gstate.vault.min_liquidity = min_liquidity;
}

void yield_vault::setcooldown(const uint32_t& profit_cooldown) {
   _check_admin();
   _gstate.vault.profit_cooldown = profit_cooldown;
}

void yield_vault::setslippage(const uint16_t& max_slippage_bps, const uint8_t& mode) {
   _check_admin();
   CHECKC( max_slippage_bps <= PCT_BOOST, err::PARAM_ERROR, "slippage over 100%" )
   CHECKC( mode <= (uint8_t)slippage_mode::PER_LEG, err::PARAM_ERROR, "unknown slippage mode" )
   _gstate.vault.max_slippage_bps   = max_slippage_bps;
   _gstate.vault.slippage           = mode;
}

void yield_vault::setdust(const asset& dust) {
   _check_admin();
   CHECKC( dust.symbol == _gstate.vault.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )
   CHECKC( dust.amount >= 0, err::PARAM_ERROR, "negative dust" )
   _gstate.vault.dust = dust;
}

void yield_vault::setinputs(const vector<input_conf>& inputs) {
   _check_admin();
   reentrancy_guard guard(_gstate.vault);
   _vault().engine().set_inputs(inputs);
}

void yield_vault::setweights(const vector<uint16_t>& weights) {
   _check_admin();
   reentrancy_guard guard(_gstate.vault);
   _vault().engine().set_weights(weights);
}

void yield_vault::setexempt(const name& account, const bool& exempt) {
   _check_admin();
   if (exempt)
      _gstate.exempt.insert(account);
   else
      _gstate.exempt.erase(account);
}

void yield_vault::pause(const bool& paused) {
   _check_admin();
   _gstate.vault.paused = paused;
}

/**
 * @brief switch the vault asset
 *
 * Idle assets are swapped into `token` here; assetcommit runs once the
 * swap has settled and re-denominates the books.
 */
void yield_vault::updateasset(const extended_symbol& token, const string& swap_params) {
   _check_admin();
   {
      reentrancy_guard guard(_gstate.vault);
      _vault().queue().settle(_now());
   }
   reentrancy_guard guard(_gstate.vault);
   _gstate.asset_update = _vault().engine().begin_asset_update(token, swap_params);
   assetcommit_action act{ _self, { {_self, active_perm} } };
   act.send();
}

void yield_vault::assetcommit() {
   require_auth( _self );
   reentrancy_guard guard(_gstate.vault, true);
   _vault().engine().commit_asset_update(_gstate.asset_update);
   _gstate.asset_update = asset_update_t{};
}

/**
 * @brief wind the vault down to withdrawals only
 *
 * Deposits are capped at zero and every input is liquidated; fees are
 * collected once the liquidation has committed.
 */
void yield_vault::emptystrat(const vector<string>& swap_params) {
   _check_admin();
   {
      reentrancy_guard guard(_gstate.vault);
      _vault().queue().settle(_now());
   }
   {
      reentrancy_guard guard(_gstate.vault);
      auto plan = _vault().engine().begin_empty(swap_params);
      if (plan) _schedule(*plan);
   }
   collectfees_action act{ _self, { {_self, active_perm} } };
   act.send();
}

void yield_vault::reqrescue(const extended_symbol& token) {
   require_auth( _gstate.admin );
   _vault().engine().request_rescue(token, _gstate.admin, _now());
}

void yield_vault::rescue(const extended_symbol& token) {
   require_auth( _gstate.admin );
   reentrancy_guard guard(_gstate.vault);
   auto receiver  = _gstate.vault.rescue.receiver;
   auto out       = _vault().engine().rescue(token, _now());
   TRANSFER( out.contract, receiver, out.quantity, "rescue" )
}

/**
 * @brief deposits and deposit requests, see the memo formats on the class
 */
void yield_vault::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;
   CHECKC( _gstate.initialized, err::RECORD_NOT_FOUND, "vault not initialized" )

   auto token_bank = get_first_receiver();
   if (_gstate.vault.allocating && _is_collaborator(from)) return;

   auto parts = split(memo, ":");
   if (parts[0] == "swapdeposit") {
      _on_swap_deposit(from, extended_asset(quant, token_bank), parts);
      return;
   }

   CHECKC( extended_symbol(quant.symbol, token_bank) == _gstate.vault.asset_token, err::WRONG_TOKEN,
           "not the vault asset: " + quant.to_string() )

   if (memo.empty() || parts[0] == "deposit") {
      _on_deposit(from, quant, parts);
      return;
   }
   if (parts[0] == "mint") {
      _on_mint(from, quant, parts);
      return;
   }
   //a controller other than `from` must have approved `from` as its operator
   if (parts[0] == "request") {
      CHECKC( parts.size() <= 2, err::MEMO_FORMAT_ERROR, "request memo format error" )
      auto controller = parts.size() == 2 ? name(parts[1]) : from;
      reentrancy_guard guard(_gstate.vault);
      _vault().queue().request_deposit(controller, from, quant, _now());
      return;
   }
   if (parts[0] == "seed") {
      CHECKC( from == _gstate.admin, err::NO_AUTH, "seed by admin only" )
      CHECKC( parts.size() <= 2, err::MEMO_FORMAT_ERROR, "seed memo format error" )
      auto receiver = parts.size() == 2 ? name(parts[1]) : from;
      reentrancy_guard guard(_gstate.vault);
      _vault().ledger().seed(from, quant, receiver);
      return;
   }
   CHECKC( false, err::MEMO_FORMAT_ERROR, "invalid memo format" )
}

//deposit[:receiver[:min_shares[:deadline]]]
void yield_vault::_on_deposit(const name& from, const asset& quant, const vector<string>& parts) {
   CHECKC( parts.size() <= 4, err::MEMO_FORMAT_ERROR, "deposit memo format error" )
   auto receiver = parts.size() >= 2 && !parts[1].empty() ? name(parts[1]) : from;

   reentrancy_guard guard(_gstate.vault);
   auto& ledger = _vault().ledger();
   if (parts.size() <= 2) {
      ledger.deposit(from, quant, receiver);
      return;
   }
   auto min_shares = to_uint64(parts[2]);
   CHECKC( min_shares != UINT64_MAX, err::MEMO_FORMAT_ERROR, "min shares format error" )
   auto deadline = time_point_sec::maximum();
   if (parts.size() == 4) {
      auto secs = to_uint64(parts[3]);
      CHECKC( secs <= UINT32_MAX, err::MEMO_FORMAT_ERROR, "deadline format error" )
      deadline = time_point_sec((uint32_t)secs);
   }
   ledger.safe_deposit(from, quant, receiver, asset((int64_t)min_shares, _gstate.vault.share_sym), deadline, _now());
}

//mint:shares[:receiver[:deadline]]
void yield_vault::_on_mint(const name& from, const asset& quant, const vector<string>& parts) {
   CHECKC( parts.size() >= 2 && parts.size() <= 4, err::MEMO_FORMAT_ERROR, "mint memo format error" )
   auto amount = to_uint64(parts[1]);
   CHECKC( amount != UINT64_MAX && amount <= (uint64_t)asset::max_amount, err::MEMO_FORMAT_ERROR, "shares format error" )
   auto receiver = parts.size() >= 3 && !parts[2].empty() ? name(parts[2]) : from;
   if (parts.size() == 4) {
      auto secs = to_uint64(parts[3]);
      CHECKC( secs <= UINT32_MAX, err::MEMO_FORMAT_ERROR, "deadline format error" )
      CHECKC( _now() <= time_point_sec((uint32_t)secs), err::TRANSACTION_EXPIRED, "deadline passed" )
   }

   reentrancy_guard guard(_gstate.vault);
   auto gross = _vault().ledger().mint(from, asset((int64_t)amount, _gstate.vault.share_sym), receiver, quant);
   if (gross < quant)
      TRANSFER( _gstate.vault.asset_token.get_contract(), from, quant - gross, "mint refund" )
}

//swapdeposit:min_shares[:receiver[:deadline[:swap_params]]], swap_params may hold ':'
void yield_vault::_on_swap_deposit(const name& from, const extended_asset& quant, const vector<string>& parts) {
   CHECKC( parts.size() >= 2, err::MEMO_FORMAT_ERROR, "swapdeposit memo format error" )
   auto min_shares = to_uint64(parts[1]);
   CHECKC( min_shares != UINT64_MAX && min_shares <= (uint64_t)asset::max_amount, err::MEMO_FORMAT_ERROR,
           "min shares format error" )
   auto receiver = parts.size() >= 3 && !parts[2].empty() ? name(parts[2]) : from;
   auto deadline = time_point_sec::maximum();
   if (parts.size() >= 4 && !parts[3].empty()) {
      auto secs = to_uint64(parts[3]);
      CHECKC( secs <= UINT32_MAX, err::MEMO_FORMAT_ERROR, "deadline format error" )
      deadline = time_point_sec((uint32_t)secs);
   }
   string params;
   for (size_t i = 4; i < parts.size(); i++) {
      if (i > 4) params += ":";
      params += parts[i];
   }

   reentrancy_guard guard(_gstate.vault);
   _gstate.swap_deposit = _vault().engine().begin_swap_deposit(from, quant, receiver,
         asset((int64_t)min_shares, _gstate.vault.share_sym), params, deadline, _now());
   swapcommit_action act{ _self, { {_self, active_perm} } };
   act.send();
}

void yield_vault::swapcommit() {
   require_auth( _self );
   reentrancy_guard guard(_gstate.vault, true);
   _vault().engine().commit_swap_deposit(_gstate.swap_deposit, _now());
   _gstate.swap_deposit = swap_deposit_t{};
}

void yield_vault::setoperator(const name& owner, const name& op, const bool& approved) {
   require_auth( owner );
   CHECKC( op != owner, err::PARAM_ERROR, "owner cannot be its own operator" )
   operator_t::tbl_t ops(_self, owner.value);
   auto itr = ops.find(op.value);
   if (!approved) {
      CHECKC( itr != ops.end(), err::RECORD_NOT_FOUND, "operator not found: " + op.to_string() )
      ops.erase(itr);
      return;
   }
   CHECKC( itr == ops.end(), err::RECORD_EXISTING, "operator exists: " + op.to_string() )
   ops.emplace(owner, [&]( auto& row ) {
      row.op            = op;
      row.approved_at   = _now();
   });
}

void yield_vault::sharexfer(const name& from, const name& to, const asset& shares, const string& memo) {
   require_auth( from );
   CHECKC( memo.size() <= 256, err::PARAM_ERROR, "memo has more than 256 bytes" )
   CHECKC( is_account(to), err::ADDRESS_IS_ZERO, "to account does not exist" )
   require_recipient( from );
   require_recipient( to );
   reentrancy_guard guard(_gstate.vault);
   _vault().ledger().transfer(from, to, shares);
}

void yield_vault::withdraw(const name& caller, const asset& assets, const name& receiver, const name& owner) {
   require_auth( caller );
   reentrancy_guard guard(_gstate.vault);
   _vault().ledger().withdraw(caller, assets, receiver, owner);
   TRANSFER( _gstate.vault.asset_token.get_contract(), receiver, assets, "withdraw" )
}

void yield_vault::redeem(const name& caller, const asset& shares, const name& receiver, const name& owner) {
   require_auth( caller );
   reentrancy_guard guard(_gstate.vault);
   auto assets = _vault().ledger().redeem(caller, shares, receiver, owner);
   TRANSFER( _gstate.vault.asset_token.get_contract(), receiver, assets, "redeem" )
}

void yield_vault::safewithdraw(const name& caller, const asset& assets, const name& receiver, const name& owner,
                               const asset& max_shares, const time_point_sec& deadline) {
   require_auth( caller );
   reentrancy_guard guard(_gstate.vault);
   _vault().ledger().safe_withdraw(caller, assets, receiver, owner, max_shares, deadline, _now());
   TRANSFER( _gstate.vault.asset_token.get_contract(), receiver, assets, "withdraw" )
}

void yield_vault::saferedeem(const name& caller, const asset& shares, const name& receiver, const name& owner,
                             const asset& min_assets, const time_point_sec& deadline) {
   require_auth( caller );
   reentrancy_guard guard(_gstate.vault);
   auto assets = _vault().ledger().safe_redeem(caller, shares, receiver, owner, min_assets, deadline, _now());
   TRANSFER( _gstate.vault.asset_token.get_contract(), receiver, assets, "redeem" )
}

void yield_vault::reqredeem(const name& controller, const name& owner, const asset& shares) {
   require_auth( controller );
   reentrancy_guard guard(_gstate.vault);
   _vault().queue().request_redeem(controller, owner, shares, _now());
}

void yield_vault::reqwithdraw(const name& controller, const name& owner, const asset& assets) {
   require_auth( controller );
   reentrancy_guard guard(_gstate.vault);
   _vault().queue().request_withdraw(controller, owner, assets, _now());
}

void yield_vault::canceldep(const name& controller) {
   require_auth( controller );
   reentrancy_guard guard(_gstate.vault);
   auto req = _vault().queue().cancel_deposit(controller);
   TRANSFER( req.token.get_contract(), req.owner, req.amount, "deposit request canceled" )
}

void yield_vault::cancelredm(const name& controller) {
   require_auth( controller );
   reentrancy_guard guard(_gstate.vault);
   _vault().queue().cancel_redeem(controller);
}

void yield_vault::claimdep(const name& controller, const name& receiver, const time_point_sec& deadline) {
   require_auth( controller );
   reentrancy_guard guard(_gstate.vault);
   _vault().queue().claim_deposit(controller, receiver, deadline, _now());
}

void yield_vault::claimredm(const name& controller, const name& receiver, const time_point_sec& deadline) {
   require_auth( controller );
   reentrancy_guard guard(_gstate.vault);
   auto assets = _vault().queue().claim_redeem(controller, receiver, deadline, _now());
   TRANSFER( _gstate.vault.asset_token.get_contract(), receiver, assets, "redeem request claimed" )
}

/**
 * @brief deploy idle assets into the inputs
 *
 * @param amounts  per-slot asset amounts, eight entries
 * @param swap_params  per-slot swap routing, empty or eight entries
 */
void yield_vault::invest(const vector<asset>& amounts, const vector<string>& swap_params) {
   _check_keeper();
   reentrancy_guard guard(_gstate.vault);
   auto plan = _vault().engine().begin_invest(amounts, swap_params, _now());
   _schedule(plan);
}

void yield_vault::liquidate(const vector<asset>& amounts, const asset& min_liquidity, const bool& panic,
                            const vector<string>& swap_params) {
   _check_keeper();
   {
      reentrancy_guard guard(_gstate.vault);
      _vault().queue().settle(_now());
   }
   reentrancy_guard guard(_gstate.vault);
   auto plan = _vault().engine().begin_liquidate(amounts, min_liquidity, panic, swap_params);
   _schedule(plan);
}

//every leg gets OPEN, ADVANCE and CLOSE as separate inline actions so each sees the previous one's transfers
void yield_vault::_schedule(const alloc_plan& plan) {
   inflight_singleton inflight(_self, _self.value);
   inflight.set(inflight_t{ plan }, _self);

   for (uint8_t i = 0; i < plan.legs.size(); i++) {
      for (uint8_t s = (uint8_t)leg_step::OPEN; s < (uint8_t)leg_step::DONE; s++) {
         legstep_action act{ _self, { {_self, active_perm} } };
         act.send( i );
      }
   }
   allocend_action act{ _self, { {_self, active_perm} } };
   act.send();
}

void yield_vault::legstep(const uint8_t& leg_index) {
   require_auth( _self );
   inflight_singleton inflight(_self, _self.value);
   CHECKC( inflight.exists(), err::WRONG_REQUEST, "no allocation in flight" )

   reentrancy_guard guard(_gstate.vault, true);
   auto state = inflight.get();
   _vault().engine().step(state.plan, leg_index);
   inflight.set(state, _self);
}

void yield_vault::allocend() {
   require_auth( _self );
   inflight_singleton inflight(_self, _self.value);
   CHECKC( inflight.exists(), err::WRONG_REQUEST, "no allocation in flight" )

   reentrancy_guard guard(_gstate.vault, true);
   auto state = inflight.get();
   _vault().engine().commit(state.plan, _now());
   inflight.remove();
}

void yield_vault::settle() {
   _check_keeper();
   reentrancy_guard guard(_gstate.vault);
   _vault().queue().settle(_now());
}

void yield_vault::collectfees() {
   _check_keeper();
   reentrancy_guard guard(_gstate.vault);
   _vault().fees().collect(_now());
}

void yield_vault::sync() {
   _check_keeper();
   reentrancy_guard guard(_gstate.vault);
   _vault().engine().sync();
}

asset yield_vault::shareprice() {
   _read_only = true;
   return _vault().ledger().share_price();
}

asset yield_vault::totalassets() {
   _read_only = true;
   return _vault().ledger().total_assets();
}

asset yield_vault::maxwithdraw(const name& owner) {
   _read_only = true;
   return _vault().ledger().max_withdraw(owner);
}

asset yield_vault::maxredeem(const name& owner) {
   _read_only = true;
   return _vault().ledger().max_redeem(owner);
}

vector<asset> yield_vault::previewinv(const asset& amount) {
   _read_only = true;
   return _vault().engine().preview_invest(amount);
}

vector<asset> yield_vault::previewliq(const asset& amount) {
   _read_only = true;
   return _vault().engine().preview_liquidate(amount);
}

int64_t yield_vault::excess(const uint8_t& slot) {
   _read_only = true;
   return _vault().engine().excess(slot);
}

void yield_vault::notifydep(const name& caller, const name& receiver, const asset& assets, const asset& shares) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_vault::notifywdr(const name& caller, const name& receiver, const name& owner, const asset& assets, const asset& shares) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_vault::notifyreq(const uint8_t& kind, const request_t& req) {
   require_auth(get_self());
   require_recipient(req.controller);
}

void yield_vault::notifycancel(const uint8_t& kind, const request_t& req) {
   require_auth(get_self());
   require_recipient(req.controller);
}

void yield_vault::notifyclaim(const uint8_t& kind, const request_t& req, const name& receiver, const asset& out) {
   require_auth(get_self());
   require_recipient(req.controller);
}

void yield_vault::notifyprice(const asset& share_price, const asset& total_assets, const asset& total_supply) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_vault::notifyfees(const asset& perf, const asset& mgmt, const asset& entry_exit, const asset& shares) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_vault::notifyfeeset(const fees_t& fees) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_vault::notifymaxta(const asset& max_total_assets) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_vault::notifyalloc(const bool& investing, const uint8_t& slot, const asset& target, const asset& realized) {
   require_auth(get_self());
   require_recipient(get_self());
}

} //namespace yieldfi
