#include <yield.alloc/yield.alloc.hpp>
#include <yield.alloc/alloc.env.hpp>
#include <token/token.hpp>

namespace yieldfi {

using namespace std;
using yieldfi_token::active_perm;

yield_alloc::yield_alloc(eosio::name receiver, eosio::name code, datastream<const char*> ds):
   contract(receiver, code, ds),
   _global(get_self(), get_self().value)
{
   _gstate = _global.exists() ? _global.get() : global_t{};
}

yield_alloc::~yield_alloc() {
   if (_read_only) return;
   _global.set( _gstate, get_self() );
}

alloc_env& yield_alloc::_alloc() {
   CHECKC( _gstate.initialized, err::RECORD_NOT_FOUND, "allocator not initialized" )
   if (!_env) _env = std::make_unique<alloc_env>(get_self(), _gstate.crate);
   return *_env;
}

void yield_alloc::_check_admin() {
   CHECKC( has_auth(_self) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operate" )
}

void yield_alloc::_check_keeper() {
   CHECKC( has_auth(_gstate.keeper) || has_auth(_gstate.admin), err::NO_AUTH, "no auth for operate" )
}

void yield_alloc::init(const name& admin, const name& keeper, const extended_symbol& token) {
   require_auth( _self );
   CHECKC( !_gstate.initialized, err::RECORD_EXISTING, "allocator already initialized" )
   CHECKC( is_account(admin) && is_account(keeper), err::PARAM_ERROR, "admin or keeper account invalid" )
   CHECKC( token.get_symbol().is_valid(), err::PARAM_ERROR, "invalid token" )

   _gstate.admin                    = admin;
   _gstate.keeper                   = keeper;
   _gstate.crate.token              = token;
   _gstate.crate.total_chain_debt   = asset(0, token.get_symbol());
   _gstate.initialized              = true;
}

/**
 * @brief crate funding and strategy repayments
 */
void yield_alloc::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;
   CHECKC( _gstate.initialized, err::RECORD_NOT_FOUND, "allocator not initialized" )
   CHECKC( extended_symbol(quant.symbol, get_first_receiver()) == _gstate.crate.token, err::WRONG_TOKEN,
           "not the crate token: " + quant.to_string() )
}

void yield_alloc::addstrategy(const name& strategy, const string& label, const asset& max_deposit) {
   _check_admin();
   CHECKC( is_account(strategy), err::ADDRESS_IS_ZERO, "strategy account does not exist" )
   _alloc().book().add_strategy(strategy, label, max_deposit, _now());
}

void yield_alloc::setstrategy(const name& strategy, const bool& whitelisted) {
   _check_admin();
   _alloc().book().set_strategy(strategy, whitelisted, _now());
}

void yield_alloc::setmaxdep(const name& strategy, const asset& max_deposit) {
   _check_admin();
   _alloc().book().set_max_deposit(strategy, max_deposit, _now());
}

void yield_alloc::setpanic(const name& strategy, const bool& panicked) {
   _check_admin();
   _alloc().book().set_panic(strategy, panicked, _now());
}

void yield_alloc::retire(const name& strategy) {
   _check_admin();
   _alloc().book().retire(strategy);
}

void yield_alloc::withdraw(const name& to, const asset& amount) {
   _check_admin();
   _alloc().book().withdraw(to, amount);
}

void yield_alloc::dispatch(const vector<asset>& amounts, const vector<name>& strategies) {
   _check_keeper();
   _alloc().book().dispatch(amounts, strategies, _now());
}

void yield_alloc::liquidate(const asset& amount, const asset& min_out, const name& strategy) {
   _check_keeper();
   _alloc().book().begin_recall(amount, min_out, strategy, false);
   _schedule_check();
}

void yield_alloc::panicliq(const asset& amount, const name& strategy) {
   _check_admin();
   _alloc().book().begin_recall(amount, asset(0, amount.symbol), strategy, true);
   _schedule_check();
}

//runs after the strategy's recall and its repayment transfer
void yield_alloc::_schedule_check() {
   recallchk_action act{ _self, { {_self, active_perm} } };
   act.send();
}

void yield_alloc::recallchk() {
   require_auth( _self );
   _alloc().book().settle_recall(_now());
}

void yield_alloc::updatedebt(const name& strategy, const asset& debt, const asset& assets_available) {
   require_auth( strategy );
   _alloc().book().update_debt(strategy, debt, assets_available, _now());
}

vector<strategy_info> yield_alloc::strategymap() {
   _read_only = true;
   return _alloc().book().strategy_map();
}

void yield_alloc::notifywdraw(const name& to, const asset& amount) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifydebt(const asset& total_chain_debt) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifyadded(const strategy_info& info) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifymaxdep(const name& strategy, const asset& max_deposit) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifypos(const name& strategy, const asset& debt, const asset& assets_available) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifyupdate(const name& strategy, const bool& whitelisted, const bool& retired) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifydepo(const name& strategy, const asset& amount) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifyloss(const name& strategy, const asset& loss) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifypanliq(const name& strategy, const asset& received) {
   require_auth(get_self());
   require_recipient(get_self());
}

void yield_alloc::notifypanic(const name& strategy, const bool& panicked) {
   require_auth(get_self());
   require_recipient(get_self());
}

} //namespace yieldfi
