#include <yield.vault/allocation.engine.hpp>
#include <yieldfi/errors.hpp>

#include "safemath.hpp"

namespace yieldfi {

using namespace wasm::safemath;

allocation_engine::allocation_engine( vault_state& state, input_book& inputs, share_ledger& ledger, request_queue& queue,
                                      protocol_adapter& adapter, swapper& swaps, const price_source& prices,
                                      const balance_reader& balances, vault_events& events ):
    _state(state), _inputs(inputs), _ledger(ledger), _queue(queue), _adapter(adapter), _swaps(swaps),
    _prices(prices), _balances(balances), _events(events) {}

const input_slot& allocation_engine::_input( uint8_t slot ) const {
    CHECKC( slot < MAX_INPUTS && _inputs[slot], err::PARAM_ERROR, "input not configured: " + to_string(slot) )
    return *_inputs[slot];
}

bool allocation_engine::_is_asset( const input_slot& input ) const {
    return input.same_as(_state.asset_token);
}

bool allocation_engine::_is_pair_head( uint8_t slot ) const {
    return slot % 2 == 0 && slot + 1 < MAX_INPUTS && _inputs[slot] && _inputs[slot]->paired
        && _inputs[slot + 1] && _inputs[slot + 1]->paired;
}

bool allocation_engine::_is_pair_tail( uint8_t slot ) const {
    return slot % 2 == 1 && _is_pair_head(slot - 1);
}

bool allocation_engine::_per_leg() const {
    return _state.slippage == (uint8_t)slippage_mode::PER_LEG;
}

asset allocation_engine::_floor( const asset& amount, uint8_t legs ) const {
    uint64_t bps = (uint64_t)_state.max_slippage_bps * legs;
    if (bps > PCT_BOOST) bps = PCT_BOOST;
    return asset( mul_down64(amount.amount, PCT_BOOST - bps, PCT_BOOST), amount.symbol );
}

asset allocation_engine::to_input( const asset& assets, const input_slot& input ) const {
    if (_is_asset(input)) return assets;
    return _prices.convert(extended_asset(assets, _state.asset_token.get_contract()), input.token);
}

asset allocation_engine::to_asset( const asset& amount, const input_slot& input ) const {
    if (_is_asset(input)) return amount;
    return _prices.convert(extended_asset(amount, input.token.get_contract()), _state.asset_token);
}

uint32_t allocation_engine::total_weight() const {
    uint32_t total = 0;
    for (const auto& input : _inputs) {
        if (input) total += input->weight;
    }
    return total;
}

asset allocation_engine::allocatable() const {
    auto ta = _ledger.total_assets();
    return asset( mul_down64(ta.amount, total_weight(), PCT_BOOST), ta.symbol );
}

asset allocation_engine::investable() const {
    auto reserved = _queue.pending_redemption_assets();
    if (_state.available <= reserved) return asset(0, _state.available.symbol);
    return _state.available - reserved;
}

int64_t allocation_engine::excess( uint8_t slot ) const {
    const auto& input = _input(slot);
    auto sw = total_weight();
    if (sw == 0) return input.invested.amount;
    auto target = mul_down64(allocatable().amount, input.weight, sw);
    return input.invested.amount - target;
}

vector<asset> allocation_engine::preview_invest( const asset& amount ) const {
    const auto& sym = _state.asset_token.get_symbol();
    CHECKC( amount.symbol == sym, err::SYMBOL_MISMATCH, "asset symbol mismatch" )
    vector<asset> targets(MAX_INPUTS, asset(0, sym));
    auto sw = total_weight();
    if (sw == 0) return targets;

    auto invested   = _ledger.invested();
    auto budget     = amount;
    if (budget.amount <= 0) {
        budget = allocatable() - invested;
        if (budget.amount < 0) budget.amount = 0;
    }
    auto cap = investable();
    if (budget > cap) budget = cap;
    if (budget.amount == 0) return targets;

    auto goal = (invested + budget).amount;
    int64_t sum = 0;
    for (uint8_t i = 0; i < MAX_INPUTS; i++) {
        if (!_inputs[i]) continue;
        auto t = mul_down64(goal, _inputs[i]->weight, sw) - _inputs[i]->invested.amount;
        if (t > 0) {
            targets[i].amount = t;
            sum += t;
        }
    }
    //underweight inputs share the budget pro rata
    if (sum > budget.amount) {
        for (auto& t : targets) t.amount = mul_down64(t.amount, budget.amount, sum);
    }

    for (uint8_t i = 0; i < MAX_INPUTS; i++) {
        if (targets[i] < _state.dust) targets[i].amount = 0;
    }
    for (uint8_t i = 0; i < MAX_INPUTS; i += 2) {
        if (!_is_pair_head(i)) continue;
        if (targets[i].amount == 0 || targets[i + 1].amount == 0) {
            targets[i].amount       = 0;
            targets[i + 1].amount   = 0;
        }
    }
    return targets;
}

vector<asset> allocation_engine::preview_liquidate( const asset& amount ) const {
    const auto& sym = _state.asset_token.get_symbol();
    CHECKC( amount.symbol == sym, err::SYMBOL_MISMATCH, "asset symbol mismatch" )
    vector<asset> targets(MAX_INPUTS, asset(0, sym));

    auto invested   = _ledger.invested();
    auto needed     = amount;
    auto shortfall  = _queue.redemption_shortfall();
    if (needed < shortfall) needed = shortfall;
    if (needed > invested) needed = invested;
    if (needed.amount <= 0) return targets;

    auto sw     = total_weight();
    auto goal   = (invested - needed).amount;
    for (uint8_t i = 0; i < MAX_INPUTS; i++) {
        if (!_inputs[i]) continue;
        auto inv = _inputs[i]->invested.amount;
        auto t = sw == 0 ? mul_up64(inv, needed.amount, invested.amount)
                         : inv - mul_down64(goal, _inputs[i]->weight, sw);
        if (t > inv) t = inv;
        if (t > 0) targets[i].amount = t;
    }

    //pairs unwind from the even slot
    for (uint8_t i = 0; i < MAX_INPUTS; i += 2) {
        if (!_is_pair_head(i)) continue;
        targets[i]              += targets[i + 1];
        targets[i + 1].amount   = 0;
    }
    return targets;
}

void allocation_engine::_check_params( const vector<asset>& amounts, const vector<string>& params ) const {
    CHECKC( amounts.size() == MAX_INPUTS, err::INCORRECT_ARRAY_LENGTHS, "expected " + to_string(MAX_INPUTS) + " amounts" )
    CHECKC( params.empty() || params.size() == MAX_INPUTS, err::INCORRECT_ARRAY_LENGTHS,
            "expected " + to_string(MAX_INPUTS) + " swap params" )
    for (const auto& amount : amounts) {
        CHECKC( amount.symbol == _state.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )
        CHECKC( amount.amount >= 0, err::PARAM_ERROR, "negative amount" )
    }
}

void allocation_engine::_begin( alloc_plan& plan ) {
    CHECKC( !plan.legs.empty(), err::AMOUNT_TOO_LOW, "nothing to allocate" )
    plan.asset_balance_before = _balances.balance_of(_state.asset_token);

    for (auto& leg : plan.legs) {
        const auto& input = _input(leg.slot);
        leg.position_before = _adapter.position_value(leg.slot, input);
        leg.swapped         = asset(0, input.token.get_symbol());
        leg.realized        = asset(0, _state.asset_token.get_symbol());

        if (plan.investing) {
            leg.expected    = to_input(leg.target, input);
        } else if (_is_pair_head(leg.slot)) {
            const auto& tail    = _input(leg.slot + 1);
            auto invested       = input.invested + tail.invested;
            auto ratio          = mul_down64(leg.target.amount, RATIO_PRECISION, invested.amount);
            auto units0         = asset( mul_down64(leg.position_before.amount, ratio, RATIO_PRECISION), leg.position_before.symbol );
            auto pos1           = _adapter.position_value(leg.slot + 1, tail);
            auto units1         = asset( mul_down64(pos1.amount, ratio, RATIO_PRECISION), pos1.symbol );
            leg.expected        = to_asset(units0, input) + to_asset(units1, tail);
        } else {
            leg.expected        = asset( input.invested.amount == 0 ? 0 :
                                         mul_down64(leg.position_before.amount, leg.target.amount, input.invested.amount),
                                         leg.position_before.symbol );
        }
    }
    _state.allocating = true;
}

alloc_plan allocation_engine::begin_invest( const vector<asset>& amounts, const vector<string>& params,
                                            const time_point_sec& now ) {
    CHECKC( !_state.allocating, err::REENTRANT_CALL, "allocation in flight" )
    _check_params(amounts, params);
    _queue.settle(now);
    _queue.check_oracles();

    alloc_plan plan;
    plan.investing      = true;
    plan.min_liquidity  = asset(0, _state.asset_token.get_symbol());
    auto total          = asset(0, _state.asset_token.get_symbol());

    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        const auto& amount = amounts[slot];
        if (amount.amount == 0) continue;
        _input(slot);
        if (amount < _state.dust) continue;

        alloc_leg leg;
        leg.slot    = slot;
        leg.target  = amount;
        leg.params  = params.empty() ? string() : params[slot];
        plan.legs.push_back(leg);
        total += amount;
    }

    for (uint8_t slot = 0; slot < MAX_INPUTS; slot += 2) {
        if (!_is_pair_head(slot)) continue;
        bool head = false, tail = false;
        for (const auto& leg : plan.legs) {
            if (leg.slot == slot) head = true;
            if (leg.slot == slot + 1) tail = true;
        }
        CHECKC( head == tail, err::PARAM_ERROR, "paired inputs invest together: " + to_string(slot) )
    }

    CHECKC( total <= investable(), err::LIQUIDITY_TOO_LOW, "not enough liquidity: " + investable().to_string() )
    _begin(plan);
    return plan;
}

alloc_plan allocation_engine::begin_liquidate( const vector<asset>& amounts, const asset& min_liquidity, bool panic,
                                               const vector<string>& params ) {
    CHECKC( !_state.allocating, err::REENTRANT_CALL, "allocation in flight" )
    _check_params(amounts, params);
    CHECKC( min_liquidity.symbol == _state.asset_token.get_symbol(), err::SYMBOL_MISMATCH, "asset symbol mismatch" )

    alloc_plan plan;
    plan.investing      = false;
    plan.panic          = panic;
    plan.min_liquidity  = min_liquidity;

    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        auto amount = amounts[slot];
        if (amount.amount == 0) continue;
        const auto& input = _input(slot);
        CHECKC( !_is_pair_tail(slot), err::PARAM_ERROR, "pairs unwind from the even slot: " + to_string(slot) )

        auto invested = _is_pair_head(slot) ? input.invested + _input(slot + 1).invested : input.invested;
        if (amount > invested) {
            CHECKC( panic, err::AMOUNT_TOO_HIGH, "exceeds invested: " + invested.to_string() )
            amount = invested;
        }
        if (amount.amount == 0 || (!panic && amount < _state.dust)) continue;

        alloc_leg leg;
        leg.slot    = slot;
        leg.target  = amount;
        if (!params.empty()) {
            leg.params = params[slot];
            if (_is_pair_head(slot)) leg.pair_params = params[slot + 1];
        }
        plan.legs.push_back(leg);
    }

    _begin(plan);
    return plan;
}

alloc_leg& allocation_engine::_leg_of( alloc_plan& plan, uint8_t slot ) {
    for (auto& leg : plan.legs) {
        if (leg.slot == slot) return leg;
    }
    CHECKC( false, err::SYSTEM_ERROR, "no leg for slot " + to_string(slot) )
    return plan.legs.front();
}

void allocation_engine::step( alloc_plan& plan, uint8_t leg_index ) {
    CHECKC( _state.allocating,              err::WRONG_REQUEST, "no allocation in flight" )
    CHECKC( leg_index < plan.legs.size(),   err::PARAM_ERROR,   "leg out of range" )
    for (uint8_t i = 0; i < leg_index; i++) {
        CHECKC( plan.legs[i].step == (uint8_t)leg_step::DONE, err::SYSTEM_ERROR, "legs run in order" )
    }

    auto& leg = plan.legs[leg_index];
    switch ((leg_step)leg.step) {
        case leg_step::OPEN:
            plan.investing ? _invest_open(plan, leg) : _liquidate_open(plan, leg);
            break;
        case leg_step::ADVANCE:
            plan.investing ? _invest_advance(plan, leg) : _liquidate_advance(plan, leg);
            break;
        case leg_step::CLOSE:
            plan.investing ? _invest_close(plan, leg) : _liquidate_close(plan, leg);
            break;
        default:
            CHECKC( false, err::SYSTEM_ERROR, "leg already closed" )
    }
    leg.step++;
}

void allocation_engine::_invest_open( alloc_plan& plan, alloc_leg& leg ) {
    const auto& input = _input(leg.slot);
    leg.asset_before = _balances.balance_of(_state.asset_token);
    leg.input_before = _balances.balance_of(input.token);
    if (!_is_asset(input))
        _swaps.swap(extended_asset(leg.target, _state.asset_token.get_contract()), input.token, leg.params);
}

void allocation_engine::_invest_advance( alloc_plan& plan, alloc_leg& leg ) {
    const auto& input = _input(leg.slot);
    auto amount = leg.target;
    if (!_is_asset(input)) {
        auto received = _balances.balance_of(input.token) - leg.input_before;
        if (_per_leg())
            CHECKC( received >= _floor(leg.expected, 1), err::AMOUNT_TOO_LOW,
                    "swap slippage on input " + to_string(leg.slot) + ": " + received.to_string() )
        //stake the realised balance, including dust of earlier cycles
        amount = _balances.balance_of(input.token);
    }
    leg.swapped = amount;

    if (_is_pair_head(leg.slot)) return;    //staged until the odd slot arrives

    if (_is_pair_tail(leg.slot)) {
        auto& head          = _leg_of(plan, leg.slot - 1);
        const auto& in0     = _input(leg.slot - 1);
        auto amount0        = head.swapped;
        auto amount1        = leg.swapped;
        auto reserves       = _adapter.reserves(leg.slot - 1, in0, input);
        if (reserves.first.amount > 0 && reserves.second.amount > 0) {
            auto need1 = mul_down64(amount0.amount, reserves.second.amount, reserves.first.amount);
            if (need1 <= amount1.amount) {
                amount1.amount = need1;
            } else {
                amount0.amount = mul_down64(amount1.amount, reserves.first.amount, reserves.second.amount);
            }
        }
        head.swapped    = amount0;
        leg.swapped     = amount1;
        _adapter.stake_pair(leg.slot - 1, in0, amount0, input, amount1);
        return;
    }

    _adapter.stake(leg.slot, input, amount);
}

void allocation_engine::_invest_close( alloc_plan& plan, alloc_leg& leg ) {
    const auto& input = _input(leg.slot);
    if (_is_pair_head(leg.slot)) return;

    if (_is_pair_tail(leg.slot)) {
        auto& head          = _leg_of(plan, leg.slot - 1);
        const auto& in0     = _input(head.slot);
        auto delta0         = _adapter.position_value(head.slot, in0) - head.position_before;
        auto delta1         = _adapter.position_value(leg.slot, input) - leg.position_before;
        head.realized       = to_asset(delta0, in0);
        leg.realized        = to_asset(delta1, input);
        auto value          = head.realized + leg.realized;
        auto floor          = _per_leg() ? _floor(to_asset(head.swapped, in0) + to_asset(leg.swapped, input), 1)
                                         : _floor(head.target + leg.target, 2);
        CHECKC( value >= floor, err::AMOUNT_TOO_LOW,
                "stake slippage on pair " + to_string(head.slot) + ": " + value.to_string() )
        _events.on_allocation(true, head.slot, head.target, head.realized);
        _events.on_allocation(true, leg.slot, leg.target, leg.realized);
        return;
    }

    auto delta = _adapter.position_value(leg.slot, input) - leg.position_before;
    auto floor = _per_leg() ? _floor(leg.swapped, 1) : _floor(leg.expected, 2);
    CHECKC( delta >= floor, err::AMOUNT_TOO_LOW,
            "stake slippage on input " + to_string(leg.slot) + ": " + delta.to_string() )
    leg.realized = to_asset(delta, input);
    _events.on_allocation(true, leg.slot, leg.target, leg.realized);
}

void allocation_engine::_liquidate_open( alloc_plan& plan, alloc_leg& leg ) {
    const auto& input = _input(leg.slot);
    leg.asset_before = _balances.balance_of(_state.asset_token);
    leg.input_before = _balances.balance_of(input.token);

    if (_is_pair_head(leg.slot)) {
        const auto& tail    = _input(leg.slot + 1);
        leg.pair_before     = _balances.balance_of(tail.token);
        auto invested       = input.invested + tail.invested;
        auto ratio          = (uint64_t)mul_down64(leg.target.amount, RATIO_PRECISION, invested.amount);
        _adapter.unstake_pair(leg.slot, input, tail, ratio);
        return;
    }
    _adapter.unstake(leg.slot, input, leg.expected);
}

void allocation_engine::_liquidate_advance( alloc_plan& plan, alloc_leg& leg ) {
    const auto& input = _input(leg.slot);

    if (_is_pair_head(leg.slot)) {
        const auto& tail    = _input(leg.slot + 1);
        auto received0      = _balances.balance_of(input.token) - leg.input_before;
        auto received1      = _balances.balance_of(tail.token) - leg.pair_before;
        leg.swapped         = to_asset(received0, input) + to_asset(received1, tail);
        if (_per_leg() && !plan.panic)
            CHECKC( leg.swapped >= _floor(leg.expected, 1), err::AMOUNT_TOO_LOW,
                    "unstake slippage on pair " + to_string(leg.slot) + ": " + leg.swapped.to_string() )
        if (!_is_asset(input))
            _swaps.swap(extended_asset(_balances.balance_of(input.token), input.token.get_contract()),
                        _state.asset_token, leg.params);
        if (!_is_asset(tail))
            _swaps.swap(extended_asset(_balances.balance_of(tail.token), tail.token.get_contract()),
                        _state.asset_token, leg.pair_params);
        return;
    }

    leg.swapped = _balances.balance_of(input.token) - leg.input_before;
    if (_per_leg() && !plan.panic)
        CHECKC( leg.swapped >= _floor(leg.expected, 1), err::AMOUNT_TOO_LOW,
                "unstake slippage on input " + to_string(leg.slot) + ": " + leg.swapped.to_string() )
    if (!_is_asset(input))
        _swaps.swap(extended_asset(_balances.balance_of(input.token), input.token.get_contract()),
                    _state.asset_token, leg.params);
}

void allocation_engine::_liquidate_close( alloc_plan& plan, alloc_leg& leg ) {
    const auto& input = _input(leg.slot);
    leg.realized = _balances.balance_of(_state.asset_token) - leg.asset_before;

    if (!plan.panic) {
        asset floor;
        if (!_per_leg())
            floor = _floor(leg.target, 2);
        else if (_is_pair_head(leg.slot))
            floor = _floor(leg.swapped, 1);
        else
            floor = _floor(to_asset(leg.swapped, input), 1);
        CHECKC( leg.realized >= floor, err::AMOUNT_TOO_LOW,
                "liquidation slippage on input " + to_string(leg.slot) + ": " + leg.realized.to_string() )
    }
    _events.on_allocation(false, leg.slot, leg.target, leg.realized);
}

asset allocation_engine::commit( alloc_plan& plan, const time_point_sec& now ) {
    CHECKC( _state.allocating, err::WRONG_REQUEST, "no allocation in flight" )
    for (const auto& leg : plan.legs) {
        CHECKC( leg.step == (uint8_t)leg_step::DONE, err::SYSTEM_ERROR, "leg " + to_string(leg.slot) + " not closed" )
    }

    auto balance = _balances.balance_of(_state.asset_token);
    if (plan.investing) {
        auto spent = plan.asset_balance_before - balance;
        CHECKC( spent <= _state.available, err::INSUFFICIENT_FUNDS, "spent more than available: " + spent.to_string() )
        _state.available -= spent;
        for (const auto& leg : plan.legs) {
            _inputs[leg.slot]->invested += leg.realized;
        }
    } else {
        _state.available += balance - plan.asset_balance_before;
        for (const auto& leg : plan.legs) {
            auto& input = *_inputs[leg.slot];
            if (!_is_pair_head(leg.slot)) {
                input.invested -= leg.target < input.invested ? leg.target : input.invested;
                continue;
            }
            //a pair's book value shrinks pro rata on both legs
            auto& tail      = *_inputs[leg.slot + 1];
            auto invested   = input.invested + tail.invested;
            auto part0      = asset( mul_down64(leg.target.amount, input.invested.amount, invested.amount), leg.target.symbol );
            auto part1      = leg.target - part0;
            input.invested  -= part0 < input.invested ? part0 : input.invested;
            tail.invested   -= part1 < tail.invested ? part1 : tail.invested;
        }
        CHECKC( _state.available >= plan.min_liquidity, err::AMOUNT_TOO_LOW,
                "liquidity below minimum: " + _state.available.to_string() )
    }
    _state.allocating = false;

    if (!plan.investing) _queue.settle(now);
    _ledger.emit_share_price();
    return _state.available;
}

void allocation_engine::_run( alloc_plan& plan ) {
    for (uint8_t i = 0; i < plan.legs.size(); i++) {
        while (plan.legs[i].step != (uint8_t)leg_step::DONE) step(plan, i);
    }
}

void allocation_engine::invest( const vector<asset>& amounts, const vector<string>& params, const time_point_sec& now ) {
    auto plan = begin_invest(amounts, params, now);
    _run(plan);
    commit(plan, now);
}

asset allocation_engine::liquidate( const vector<asset>& amounts, const asset& min_liquidity, bool panic,
                                    const vector<string>& params, const time_point_sec& now ) {
    auto plan = begin_liquidate(amounts, min_liquidity, panic, params);
    _run(plan);
    return commit(plan, now);
}

std::optional<alloc_plan> allocation_engine::begin_empty( const vector<string>& params ) {
    CHECKC( !_state.allocating, err::REENTRANT_CALL, "allocation in flight" )
    const auto& sym = _state.asset_token.get_symbol();
    _ledger.set_max_total_assets(asset(0, sym));
    _state.min_liquidity = asset(0, sym);

    vector<asset> amounts(MAX_INPUTS, asset(0, sym));
    bool any = false;
    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        if (!_inputs[slot] || _is_pair_tail(slot)) continue;
        auto amount = _inputs[slot]->invested;
        if (_is_pair_head(slot)) amount += _inputs[slot + 1]->invested;
        if (amount.amount == 0 || amount < _state.dust) continue;
        amounts[slot] = amount;
        any = true;
    }
    if (!any) return std::nullopt;
    return begin_liquidate(amounts, asset(0, sym), false, params);
}

asset allocation_engine::empty( const vector<string>& params, const time_point_sec& now ) {
    auto plan = begin_empty(params);
    if (!plan) return _state.available;
    _run(*plan);
    return commit(*plan, now);
}

void allocation_engine::sync() {
    CHECKC( !_state.allocating, err::REENTRANT_CALL, "allocation in flight" )
    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        if (!_inputs[slot]) continue;
        auto value = _adapter.position_value(slot, *_inputs[slot]);
        _inputs[slot]->invested = to_asset(value, *_inputs[slot]);
    }
    _ledger.emit_share_price();
}

void allocation_engine::set_inputs( const vector<input_conf>& confs ) {
    CHECKC( !_state.allocating,             err::REENTRANT_CALL,    "allocation in flight" )
    CHECKC( confs.size() <= MAX_INPUTS,     err::PARAM_ERROR,       "at most " + to_string(MAX_INPUTS) + " inputs" )

    input_book book;
    uint32_t weights = 0;
    for (const auto& conf : confs) {
        CHECKC( conf.slot < MAX_INPUTS,             err::PARAM_ERROR,       "slot out of range: " + to_string(conf.slot) )
        CHECKC( !book[conf.slot],                   err::PARAM_ERROR,       "duplicate slot: " + to_string(conf.slot) )
        CHECKC( conf.token.get_symbol().is_valid(), err::PARAM_ERROR,       "invalid token" )
        CHECKC( conf.position != name(),            err::ADDRESS_IS_ZERO,   "position is empty" )

        input_slot input;
        input.token     = conf.token;
        input.weight    = conf.weight;
        input.position  = conf.position;
        input.paired    = conf.paired;
        input.invested  = asset(0, _state.asset_token.get_symbol());
        input.abi       = (uint8_t)_adapter.detect_abi(conf.position);

        const auto& prev = _inputs[conf.slot];
        if (prev && prev->token == input.token && prev->position == input.position)
            input.invested = prev->invested;

        weights += conf.weight;
        book[conf.slot] = input;
    }
    CHECKC( weights <= PCT_BOOST, err::PARAM_ERROR, "weights exceed 100%: " + to_string(weights) )

    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        const auto& prev = _inputs[slot];
        if (prev && prev->invested.amount > 0)
            CHECKC( book[slot] && book[slot]->invested == prev->invested, err::PARAM_ERROR,
                    "input still invested: " + to_string(slot) )
        if (!book[slot] || !book[slot]->paired) continue;
        auto peer = slot % 2 == 0 ? slot + 1 : slot - 1;
        CHECKC( peer < MAX_INPUTS && book[peer] && book[peer]->paired, err::PARAM_ERROR,
                "paired input needs its peer: " + to_string(slot) )
    }

    _inputs = book;
    _queue.check_oracles();
}

void allocation_engine::set_weights( const vector<uint16_t>& weights ) {
    CHECKC( !_state.allocating,             err::REENTRANT_CALL,            "allocation in flight" )
    CHECKC( weights.size() == MAX_INPUTS,   err::INCORRECT_ARRAY_LENGTHS,   "expected " + to_string(MAX_INPUTS) + " weights" )
    uint32_t total = 0;
    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        CHECKC( _inputs[slot] || weights[slot] == 0, err::PARAM_ERROR, "input not configured: " + to_string(slot) )
        total += weights[slot];
    }
    CHECKC( total <= PCT_BOOST, err::PARAM_ERROR, "weights exceed 100%: " + to_string(total) )
    for (uint8_t slot = 0; slot < MAX_INPUTS; slot++) {
        if (_inputs[slot]) _inputs[slot]->weight = weights[slot];
    }
}

asset_update_t allocation_engine::begin_asset_update( const extended_symbol& token, const string& params ) {
    CHECKC( !_state.allocating,                             err::REENTRANT_CALL,    "allocation in flight" )
    CHECKC( token != _state.asset_token,                    err::PARAM_ERROR,       "same asset" )
    CHECKC( token.get_symbol().precision() == _state.share_sym.precision(), err::SYMBOL_MISMATCH,
            "asset precision must match shares" )
    CHECKC( _ledger.invested().amount == 0,                 err::PARAM_ERROR,       "liquidate inputs first" )
    CHECKC( _state.claimable_redemption_assets.amount == 0, err::WRONG_REQUEST,     "redemptions awaiting claim" )
    CHECKC( _state.claimable_redeem_count == 0,             err::WRONG_REQUEST,     "redemptions awaiting claim" )

    asset_update_t update;
    update.token            = token;
    update.swapped          = _state.available;
    update.balance_before   = _balances.balance_of(token);
    _state.allocating       = true;
    if (update.swapped.amount > 0)
        _swaps.swap(extended_asset(update.swapped, _state.asset_token.get_contract()), token, params);
    return update;
}

void allocation_engine::commit_asset_update( const asset_update_t& update ) {
    CHECKC( _state.allocating, err::WRONG_REQUEST, "no asset update in flight" )
    const auto& sym     = update.token.get_symbol();
    auto received       = _balances.balance_of(update.token) - update.balance_before;
    CHECKC( received.amount >= 0, err::SYSTEM_ERROR, "negative swap proceeds" )

    auto fees = update.swapped.amount == 0 ? 0 :
                mul_down64(_state.claimable_asset_fees.amount, received.amount, update.swapped.amount);
    auto resymbol = [&]( const asset& a ) { return asset(a.amount, sym); };

    _state.asset_token                  = update.token;
    _state.available                    = received;
    _state.claimable_asset_fees         = asset(fees, sym);
    _state.max_total_assets             = resymbol(_state.max_total_assets);
    _state.min_liquidity                = resymbol(_state.min_liquidity);
    _state.dust                         = resymbol(_state.dust);
    _state.claimable_redemption_assets  = asset(0, sym);
    //pending deposit escrow stays in the old token until canceled
    if (_state.total_deposit_request.amount == 0) {
        _state.total_deposit_request    = asset(0, sym);
        _state.exempt_deposit_request   = asset(0, sym);
        _state.deposit_token            = update.token;
    }
    for (auto& input : _inputs) {
        if (input) input->invested = asset(0, sym);
    }
    _state.allocating                   = false;
    _state.last_share_price             = _ledger.share_price();
    _ledger.emit_share_price();
}

swap_deposit_t allocation_engine::begin_swap_deposit( const name& caller, const extended_asset& input, const name& receiver,
                                                      const asset& min_shares, const string& params,
                                                      const time_point_sec& deadline, const time_point_sec& now ) {
    CHECKC( !_state.allocating,                                 err::REENTRANT_CALL,        "allocation in flight" )
    CHECKC( !_state.paused,                                     err::PAUSED,                "vault paused" )
    CHECKC( now <= deadline,                                    err::TRANSACTION_EXPIRED,   "deadline passed" )
    CHECKC( input.get_extended_symbol() != _state.asset_token,  err::PARAM_ERROR,           "deposit the vault asset directly" )
    CHECKC( input.quantity.amount > 0,                          err::AMOUNT_TOO_LOW,        "amount must be positive" )
    CHECKC( min_shares.symbol == _state.share_sym,              err::SYMBOL_MISMATCH,       "share symbol mismatch" )
    CHECKC( receiver != name(),                                 err::ADDRESS_IS_ZERO,       "receiver is empty" )

    swap_deposit_t deposit;
    deposit.caller          = caller;
    deposit.receiver        = receiver;
    deposit.input           = input;
    deposit.min_shares      = min_shares;
    deposit.balance_before  = _balances.balance_of(_state.asset_token);
    deposit.deadline        = deadline;
    _state.allocating       = true;
    _swaps.swap(input, _state.asset_token, params);
    return deposit;
}

asset allocation_engine::commit_swap_deposit( const swap_deposit_t& deposit, const time_point_sec& now ) {
    CHECKC( _state.allocating, err::WRONG_REQUEST, "no swap deposit in flight" )
    auto received = _balances.balance_of(_state.asset_token) - deposit.balance_before;
    CHECKC( received.amount > 0, err::AMOUNT_TOO_LOW, "swap returned nothing" )
    _state.allocating = false;
    return _ledger.safe_deposit(deposit.caller, received, deposit.receiver, deposit.min_shares, deposit.deadline, now);
}

void allocation_engine::_check_rescuable( const extended_symbol& token ) const {
    CHECKC( token != _state.asset_token, err::PARAM_ERROR, "vault asset cannot be rescued" )
    CHECKC( _state.total_deposit_request.amount == 0 || token != _state.deposit_token, err::PARAM_ERROR,
            "token escrowed by deposit requests" )
    for (const auto& input : _inputs) {
        CHECKC( !input || !input->same_as(token), err::PARAM_ERROR, "input token cannot be rescued" )
    }
}

void allocation_engine::request_rescue( const extended_symbol& token, const name& receiver, const time_point_sec& now ) {
    CHECKC( receiver != name(), err::ADDRESS_IS_ZERO, "receiver is empty" )
    _check_rescuable(token);
    _state.rescue.token         = token;
    _state.rescue.receiver      = receiver;
    _state.rescue.requested_at  = now;
}

extended_asset allocation_engine::rescue( const extended_symbol& token, const time_point_sec& now ) {
    CHECKC( !_state.allocating, err::REENTRANT_CALL, "allocation in flight" )
    const auto& pending = _state.rescue;
    CHECKC( pending.receiver != name() && pending.token == token, err::RECORD_NOT_FOUND,
            "no rescue requested for " + token.get_symbol().code().to_string() )
    auto unlock = pending.requested_at.sec_since_epoch() + RESCUE_TIMELOCK;
    CHECKC( now.sec_since_epoch() >= unlock, err::WRONG_REQUEST, "rescue locked until " + to_string(unlock) )
    CHECKC( now.sec_since_epoch() < unlock + RESCUE_VALIDITY, err::TRANSACTION_EXPIRED, "rescue request expired" )
    //inputs may have changed since the request
    _check_rescuable(token);

    auto balance = _balances.balance_of(token);
    CHECKC( balance.amount > 0, err::AMOUNT_TOO_LOW, "nothing to rescue" )
    _state.rescue = rescue_t{};
    return extended_asset(balance, token.get_contract());
}

} //namespace yieldfi
