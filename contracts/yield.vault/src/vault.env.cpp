#include <yield.vault/vault.env.hpp>
#include <yield.vault/yield.vault.hpp>
#include <position/position.hpp>
#include <token/token.hpp>
#include <yieldfi/errors.hpp>
#include <yieldfi/utils.hpp>

#include "safemath.hpp"

namespace yieldfi {

using namespace wasm::safemath;
using yieldfi_token::active_perm;

#define NOTIFY(action_type, ...) \
    {   yield_vault::action_type act{ _self, { {_self, active_perm} } };\
            act.send( __VA_ARGS__ );}

table_share_registry::table_share_registry( const name& self, const global_t& g ):
    _self(self), _g(g), _shares(self, self.value) {}

asset table_share_registry::balance_of( const name& owner ) const {
    auto itr = _shares.find(owner.value);
    if (itr == _shares.end()) return asset(0, _g.vault.share_sym);
    return itr->balance;
}

void table_share_registry::credit( const name& owner, const asset& shares ) {
    auto itr = _shares.find(owner.value);
    if (itr == _shares.end()) {
        _shares.emplace(_self, [&]( auto& row ) {
            row.owner   = owner;
            row.balance = shares;
        });
        return;
    }
    _shares.modify(itr, same_payer, [&]( auto& row ) {
        row.balance += shares;
    });
}

void table_share_registry::debit( const name& owner, const asset& shares ) {
    auto itr = _shares.find(owner.value);
    CHECKC( itr != _shares.end(),       err::RECORD_NOT_FOUND,  "no shares: " + owner.to_string() )
    CHECKC( itr->balance >= shares,     err::AMOUNT_TOO_HIGH,   "overdrawn share balance" )
    if (itr->balance == shares) {
        _shares.erase(itr);
        return;
    }
    _shares.modify(itr, same_payer, [&]( auto& row ) {
        row.balance -= shares;
    });
}

bool table_share_registry::is_operator( const name& owner, const name& op ) const {
    operator_t::tbl_t ops(_self, owner.value);
    return ops.find(op.value) != ops.end();
}

bool table_share_registry::is_exempt( const name& account ) const {
    return _g.exempt.count(account) > 0;
}

std::optional<request_t> table_request_store::find( request_kind kind, const name& controller ) const {
    request_row_t::tbl_t reqs(_self, (uint64_t)kind);
    auto itr = reqs.find(controller.value);
    if (itr == reqs.end()) return std::nullopt;
    return itr->req;
}

void table_request_store::put( request_kind kind, const request_t& req ) {
    request_row_t::tbl_t reqs(_self, (uint64_t)kind);
    auto itr = reqs.find(req.controller.value);
    if (itr == reqs.end()) {
        reqs.emplace(_self, [&]( auto& row ) { row.req = req; });
        return;
    }
    reqs.modify(itr, same_payer, [&]( auto& row ) { row.req = req; });
}

void table_request_store::erase( request_kind kind, const name& controller ) {
    request_row_t::tbl_t reqs(_self, (uint64_t)kind);
    auto itr = reqs.find(controller.value);
    CHECKC( itr != reqs.end(), err::RECORD_NOT_FOUND, "request not found: " + controller.to_string() )
    reqs.erase(itr);
}

std::optional<settlement_t> table_request_store::settlement_for( request_kind kind, uint64_t request_id ) const {
    settlement_row_t::tbl_t settlements(_self, (uint64_t)kind);
    auto itr = settlements.lower_bound(request_id);
    if (itr == settlements.end()) return std::nullopt;
    return itr->settlement;
}

void table_request_store::put_settlement( request_kind kind, const settlement_t& s ) {
    settlement_row_t::tbl_t settlements(_self, (uint64_t)kind);
    auto itr = settlements.find(s.last_request_id);
    if (itr == settlements.end()) {
        settlements.emplace(_self, [&]( auto& row ) { row.settlement = s; });
        return;
    }
    settlements.modify(itr, same_payer, [&]( auto& row ) { row.settlement = s; });
}

void table_request_store::erase_settlement( request_kind kind, uint64_t last_request_id ) {
    settlement_row_t::tbl_t settlements(_self, (uint64_t)kind);
    auto itr = settlements.find(last_request_id);
    CHECKC( itr != settlements.end(), err::RECORD_NOT_FOUND, "settlement not found: " + to_string(last_request_id) )
    settlements.erase(itr);
}

const price_global_t& oracle_price_source::_price_conf() const {
    if(!_global_prices_ptr) {
        CHECKC(_oracle.value != 0, err::SYSTEM_ERROR, "Invalid price_oracle_contract");
        _global_prices_tbl_ptr = std::make_unique<price_global_t::idx_t>(_oracle, _oracle.value);
        _global_prices_ptr = std::make_unique<price_global_t>(_global_prices_tbl_ptr->get_or_default());
    }
    return *_global_prices_ptr;
}

uint64_t oracle_price_source::_price( const symbol& sym ) const {
    const auto& prices = _price_conf().prices;
    auto itr = prices.find(lower_name(sym));
    CHECKC( itr != prices.end() && itr->second > 0, err::MISSING_ORACLE, "price not found: " + sym.code().to_string() )
    return itr->second;
}

bool oracle_price_source::has_feed( const extended_symbol& token ) const {
    const auto& prices = _price_conf().prices;
    auto itr = prices.find(lower_name(token.get_symbol()));
    return itr != prices.end() && itr->second > 0;
}

asset oracle_price_source::convert( const extended_asset& from, const extended_symbol& to ) const {
    const auto& from_sym    = from.quantity.symbol;
    const auto& to_sym      = to.get_symbol();
    if (from.get_extended_symbol() == to) return from.quantity;

    int128_t value = (int128_t)from.quantity.amount * _price(from_sym) * power10(to_sym.precision());
    int128_t scale = (int128_t)power10(from_sym.precision()) * _price(to_sym);
    return asset( to_int64(value / scale), to_sym );
}

void token_swapper::swap( const extended_asset& from, const extended_symbol& to, const string& params ) {
    CHECKC( _swap_contract.value != 0,  err::SYSTEM_ERROR,  "swap contract not set" )
    CHECKC( params.size() < 256,        err::PARAM_ERROR,   "swap params too long" )
    if (from.quantity.amount == 0) return;
    TRANSFER( from.contract, _swap_contract, from.quantity, params )
}

adapter_abi position_adapter::detect_abi( const name& position ) const {
    yieldfi_position::position::abi_info_t_singleton info(position, position.value);
    if (info.exists() && info.get().abi == yieldfi_position::STANDARD_ABI)
        return adapter_abi::STANDARD;
    return adapter_abi::LEGACY;
}

asset position_adapter::position_value( uint8_t slot, const input_slot& input ) const {
    const auto& sym = input.token.get_symbol();
    if (input.abi == (uint8_t)adapter_abi::LEGACY) {
        yieldfi_position::position::stakes_tbl stakes(input.position, input.position.value);
        auto itr = stakes.find(_self.value);
        if (itr == stakes.end()) return asset(0, sym);
        CHECKC( itr->staked.symbol == sym, err::SYMBOL_MISMATCH, "legacy position symbol mismatch" )
        return itr->staked;
    }
    yieldfi_position::position::positions_tbl positions(input.position, _self.value);
    auto itr = positions.find(sym.code().raw());
    if (itr == positions.end()) return asset(0, sym);
    return itr->balance;
}

void position_adapter::stake( uint8_t slot, const input_slot& input, const asset& amount ) {
    if (amount.amount == 0) return;
    TRANSFER( input.token.get_contract(), input.position, amount, yieldfi_position::STAKE_MEMO )
}

void position_adapter::unstake( uint8_t slot, const input_slot& input, const asset& amount ) {
    if (amount.amount == 0) return;
    if (input.abi == (uint8_t)adapter_abi::LEGACY) {
        yieldfi_position::position::withdraw_action act{ input.position, { {_self, active_perm} } };
        act.send( _self, amount );
        return;
    }
    yieldfi_position::position::unstake_action act{ input.position, { {_self, active_perm} } };
    act.send( _self, amount );
}

void position_adapter::stake_pair( uint8_t even_slot, const input_slot& in0, const asset& amount0,
                                   const input_slot& in1, const asset& amount1 ) {
    CHECKC( in0.position == in1.position, err::PARAM_ERROR, "pair legs on different positions" )
    if (amount0.amount > 0)
        TRANSFER( in0.token.get_contract(), in0.position, amount0, yieldfi_position::STAKE_PAIR_MEMO )
    if (amount1.amount > 0)
        TRANSFER( in1.token.get_contract(), in1.position, amount1, yieldfi_position::STAKE_PAIR_MEMO )
}

void position_adapter::unstake_pair( uint8_t even_slot, const input_slot& in0, const input_slot& in1,
                                     uint64_t ratio ) {
    CHECKC( ratio > 0 && ratio <= RATIO_PRECISION, err::PARAM_ERROR, "invalid pair ratio" )
    yieldfi_position::position::unstakepair_action act{ in0.position, { {_self, active_perm} } };
    act.send( _self, ratio );
}

std::pair<asset, asset> position_adapter::reserves( uint8_t even_slot, const input_slot& in0,
                                                    const input_slot& in1 ) const {
    yieldfi_position::position::pool_singleton pool(in0.position, in0.position.value);
    if (!pool.exists())
        return { asset(0, in0.token.get_symbol()), asset(0, in1.token.get_symbol()) };
    auto p = pool.get();
    return { p.reserve0, p.reserve1 };
}

asset token_balance_reader::balance_of( const extended_symbol& token ) const {
    return yieldfi_token::token::get_balance(token.get_contract(), _self, token.get_symbol());
}

void notify_events::on_deposit( const name& caller, const name& receiver, const asset& assets, const asset& shares ) {
    NOTIFY( notifydep_action, caller, receiver, assets, shares )
}

void notify_events::on_withdraw( const name& caller, const name& receiver, const name& owner,
                                 const asset& assets, const asset& shares ) {
    NOTIFY( notifywdr_action, caller, receiver, owner, assets, shares )
}

void notify_events::on_request( request_kind kind, const request_t& req ) {
    NOTIFY( notifyreq_action, (uint8_t)kind, req )
}

void notify_events::on_request_canceled( request_kind kind, const request_t& req ) {
    NOTIFY( notifycancel_action, (uint8_t)kind, req )
}

void notify_events::on_request_claimed( request_kind kind, const request_t& req, const name& receiver, const asset& out ) {
    NOTIFY( notifyclaim_action, (uint8_t)kind, req, receiver, out )
}

void notify_events::on_share_price( const asset& price, const asset& total_assets, const asset& total_supply ) {
    NOTIFY( notifyprice_action, price, total_assets, total_supply )
}

void notify_events::on_fees_collected( const asset& perf, const asset& mgmt, const asset& entry_exit,
                                       const asset& shares ) {
    NOTIFY( notifyfees_action, perf, mgmt, entry_exit, shares )
}

void notify_events::on_fees_updated( const fees_t& fees ) {
    NOTIFY( notifyfeeset_action, fees )
}

void notify_events::on_max_total_assets( const asset& max_total_assets ) {
    NOTIFY( notifymaxta_action, max_total_assets )
}

void notify_events::on_allocation( bool investing, uint8_t slot, const asset& target, const asset& realized ) {
    NOTIFY( notifyalloc_action, investing, slot, target, realized )
}

vault_env::vault_env( const name& self, global_t& g ):
    _self(self), _g(g),
    _shares(self, g), _requests(self), _prices(g.price_oracle_contract),
    _swaps(self, g.swap_contract), _adapter(self), _balances(self), _events(self),
    _ledger(g.vault, _inputs, _shares, _events, self),
    _fees(g.vault, _ledger, _events),
    _queue(g.vault, _ledger, _shares, _requests, _prices, _inputs, _events),
    _engine(g.vault, _inputs, _ledger, _queue, _adapter, _swaps, _prices, _balances, _events)
{
    input_t::tbl_t rows(_self, _self.value);
    for (auto itr = rows.begin(); itr != rows.end(); itr++) {
        CHECKC( itr->slot < MAX_INPUTS, err::SYSTEM_ERROR, "corrupted input slot" )
        _inputs[itr->slot] = itr->input;
    }
}

void vault_env::save_inputs() {
    input_t::tbl_t rows(_self, _self.value);
    for (uint64_t slot = 0; slot < MAX_INPUTS; slot++) {
        auto itr = rows.find(slot);
        const auto& input = _inputs[slot];
        if (!input) {
            if (itr != rows.end()) rows.erase(itr);
            continue;
        }
        if (itr == rows.end()) {
            rows.emplace(_self, [&]( auto& row ) {
                row.slot    = slot;
                row.input   = *input;
            });
        } else {
            rows.modify(itr, same_payer, [&]( auto& row ) {
                row.input   = *input;
            });
        }
    }
}

} //namespace yieldfi
