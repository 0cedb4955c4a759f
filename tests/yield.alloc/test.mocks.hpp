#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>

#include <map>
#include <string>
#include <vector>

#include <yield.alloc/strategy.book.hpp>
#include <yieldfi/errors.hpp>

namespace yieldfi_test {

using namespace eosio;
using namespace yieldfi;
using std::map;
using std::string;
using std::vector;

static const name               TREASURY        = "yieldfi.trs"_n;
static const name               ALPHA           = "strat.alpha"_n;
static const name               BETA            = "strat.beta"_n;
static const name               GAMMA           = "strat.gamma"_n;

static const symbol             USDT_SYM        = symbol("USDT", 4);
static const symbol             USDC_SYM        = symbol("USDC", 4);
static const extended_symbol    USDT            = extended_symbol(USDT_SYM, "amax.mtoken"_n);

static const time_point_sec     T0              = time_point_sec(1700000000);
static constexpr uint16_t       FULL_RETURN     = 10000;    //bps

inline asset usdt( int64_t amount ) { return asset(amount, USDT_SYM); }

struct mock_store : strategy_store {
    map<uint64_t, strategy_info> rows;

    std::optional<strategy_info> find( const name& strategy ) const override {
        auto itr = rows.find(strategy.value);
        if (itr == rows.end()) return std::nullopt;
        return itr->second;
    }
    void put( const strategy_info& info ) override { rows[info.strategy.value] = info; }
    void erase( const name& strategy ) override { rows.erase(strategy.value); }
    vector<strategy_info> all() const override {
        vector<strategy_info> infos;
        for (const auto& row : rows) infos.push_back(row.second);
        return infos;
    }
};

struct mock_crate : crate_balance {
    int64_t amount = 0;
    asset balance() const override { return usdt(amount); }
};

/**
 * Strategies hold what they were sent. A recall returns `return_bps` of the
 * requested amount, at once or on deliver() when `deferred` is set.
 */
struct mock_router : fund_router {
    mock_crate&             crate;
    map<name, int64_t>      held;
    map<name, int64_t>      paid;
    uint16_t                return_bps  = FULL_RETURN;
    bool                    deferred    = false;
    int64_t                 in_transit  = 0;
    uint32_t                sends       = 0;
    uint32_t                recalls     = 0;

    explicit mock_router( mock_crate& c ): crate(c) {}

    void send( const name& strategy, const asset& amount ) override {
        CHECKC( crate.amount >= amount.amount, err::INSUFFICIENT_FUNDS, "mock crate overdrawn" )
        sends++;
        crate.amount        -= amount.amount;
        held[strategy]      += amount.amount;
    }
    void recall( const name& strategy, const asset& amount, const asset& min_out ) override {
        recalls++;
        auto out = amount.amount * return_bps / FULL_RETURN;
        if (out > held[strategy]) out = held[strategy];
        held[strategy] -= out;
        in_transit += out;
        if (!deferred) deliver();
    }
    void pay( const name& to, const asset& amount ) override {
        crate.amount    -= amount.amount;
        paid[to]        += amount.amount;
    }

    void deliver() {
        crate.amount    += in_transit;
        in_transit      = 0;
    }
};

struct mock_alloc_events : alloc_events {
    uint32_t    withdrawals         = 0;
    uint32_t    added               = 0;
    uint32_t    deposits            = 0;
    uint32_t    positions           = 0;
    uint32_t    retired             = 0;
    uint32_t    losses              = 0;
    uint32_t    panic_liquidations  = 0;
    uint32_t    panics              = 0;
    asset       last_chain_debt;
    asset       last_loss;
    asset       last_max_deposit;
    bool        last_whitelisted    = false;

    void on_withdraw( const name& to, const asset& amount ) override { withdrawals++; }
    void on_chain_debt( const asset& total_chain_debt ) override { last_chain_debt = total_chain_debt; }
    void on_strategy_added( const strategy_info& info ) override { added++; }
    void on_max_deposit( const name& strategy, const asset& max_deposit ) override { last_max_deposit = max_deposit; }
    void on_position( const name& strategy, const asset& debt, const asset& assets_available ) override { positions++; }
    void on_strategy_update( const name& strategy, bool whitelisted, bool r ) override {
        last_whitelisted = whitelisted;
        if (r) retired++;
    }
    void on_deposit( const name& strategy, const asset& amount ) override { deposits++; }
    void on_losses( const name& strategy, const asset& loss ) override {
        losses++;
        last_loss = loss;
    }
    void on_panic_liquidate( const name& strategy, const asset& received ) override { panic_liquidations++; }
    void on_panic( const name& strategy, bool panicked ) override { panics++; }
};

// one crate holding 1000 USDT, alpha capped at 500 and beta at 300
struct alloc_fixture {
    alloc_state         state;
    mock_store          store;
    mock_crate          crate;
    mock_router         router{ crate };
    mock_alloc_events   events;
    strategy_book       book{ state, store, router, crate, events };

    alloc_fixture() {
        state.token             = USDT;
        state.total_chain_debt  = usdt(0);
        crate.amount            = 10000000;
        book.add_strategy(ALPHA, "alpha lending", usdt(5000000), T0);
        book.add_strategy(BETA, "beta amm", usdt(3000000), T0);
    }

    strategy_info info( const name& strategy ) const { return *store.find(strategy); }

    asset debt_sum() const {
        auto sum = usdt(0);
        for (const auto& row : store.rows) sum += row.second.debt;
        return sum;
    }
};

} //namespace yieldfi_test
