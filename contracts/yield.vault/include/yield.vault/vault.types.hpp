#pragma once

#include <eosio/asset.hpp>
#include <eosio/name.hpp>
#include <eosio/time.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace yieldfi {

using namespace std;
using namespace eosio;

static constexpr uint16_t   PCT_BOOST           = 10000;
static constexpr uint64_t   DAY_SECONDS         = 24 * 60 * 60;
static constexpr uint64_t   YEAR_SECONDS        = 24 * 60 * 60 * 365;
static constexpr uint8_t    MAX_INPUTS          = 8;
static constexpr int64_t    RATIO_PRECISION     = 100000;       // 10^5
static constexpr uint32_t   RESCUE_TIMELOCK     = 2 * DAY_SECONDS;
static constexpr uint32_t   RESCUE_VALIDITY     = 7 * DAY_SECONDS;

struct fees_t {
    uint16_t    perf        = 1000;     //10% of realised profit
    uint16_t    mgmt        = 20;       //0.2% per year
    uint16_t    entry       = 2;
    uint16_t    exit        = 2;

    EOSLIB_SERIALIZE( fees_t, (perf)(mgmt)(entry)(exit) )
};

static constexpr fees_t MAX_FEES = { 5000, 500, 200, 200 };

enum class slippage_mode: uint8_t {
    COMPOUNDED  = 0,    //one check per leg at 2x tolerance
    PER_LEG     = 1     //1x at the swap, 1x at the stake/unstake
};

enum class adapter_abi: uint8_t {
    STANDARD    = 0,
    LEGACY      = 1
};

enum class request_kind: uint8_t {
    DEPOSIT     = 1,
    REDEEM      = 2
};

/**
 * @brief vault-wide accounting, passed by reference to every core operation
 *
 * amounts in `asset_token` units unless noted; shares carry `share_sym`,
 * which has the asset's precision.
 */
struct rescue_t {
    extended_symbol     token;
    name                receiver;
    time_point_sec      requested_at;

    EOSLIB_SERIALIZE( rescue_t, (token)(receiver)(requested_at) )
};

struct vault_state {
    extended_symbol     asset_token;
    symbol              share_sym;

    asset               total_supply;                   //shares
    asset               available;                      //idle asset balance owned by the pool
    asset               max_total_assets;
    asset               min_liquidity;
    asset               dust;

    fees_t              fees;
    name                fee_collector;
    asset               claimable_asset_fees;           //entry/exit fees not yet minted
    asset               last_share_price;               //fee high-water mark
    time_point_sec      last_fee_collection;
    uint32_t            profit_cooldown             = DAY_SECONDS;

    uint16_t            max_slippage_bps            = 100;
    uint8_t             slippage                    = (uint8_t)slippage_mode::COMPOUNDED;

    asset               total_deposit_request;          //assets escrowed by pending deposit requests
    extended_symbol     deposit_token;                  //token of that escrow, the vault asset unless it changed since
    asset               total_redemption_request;       //shares escrowed by pending redeem requests
    asset               exempt_deposit_request;         //part of total_deposit_request owed by fee exempt owners
    asset               exempt_redemption_request;      //part of total_redemption_request owed by fee exempt owners
    asset               total_claimable_deposit;        //shares minted for settled deposit requests
    asset               total_claimable_redemption;     //shares burned for settled redeem requests
    asset               claimable_redemption_assets;    //assets reserved for settled redeem requests
    uint32_t            pending_deposit_count       = 0;
    uint32_t            pending_redeem_count        = 0;
    uint32_t            claimable_deposit_count     = 0;
    uint32_t            claimable_redeem_count      = 0;
    uint64_t            last_request_id             = 0;

    bool                locked                      = false;
    bool                allocating                  = false;
    bool                paused                      = false;

    rescue_t            rescue;                         //pending rescue, no receiver when none

    vault_state() {}

    EOSLIB_SERIALIZE( vault_state, (asset_token)(share_sym)(total_supply)(available)(max_total_assets)
                                   (min_liquidity)(dust)(fees)(fee_collector)(claimable_asset_fees)
                                   (last_share_price)(last_fee_collection)(profit_cooldown)
                                   (max_slippage_bps)(slippage)
                                   (total_deposit_request)(deposit_token)(total_redemption_request)
                                   (exempt_deposit_request)(exempt_redemption_request)
                                   (total_claimable_deposit)(total_claimable_redemption)
                                   (claimable_redemption_assets)(pending_deposit_count)
                                   (pending_redeem_count)(claimable_deposit_count)
                                   (claimable_redeem_count)(last_request_id)
                                   (locked)(allocating)(paused)(rescue) )
};

struct input_slot {
    extended_symbol     token;
    uint16_t            weight          = 0;            //bps of total assets
    name                position;                       //protocol adapter contract
    asset               invested;                       //asset units
    bool                paired          = false;        //even/odd AMM pair
    uint8_t             abi             = (uint8_t)adapter_abi::STANDARD;

    bool same_as(const extended_symbol& other) const { return token == other; }

    EOSLIB_SERIALIZE( input_slot, (token)(weight)(position)(invested)(paired)(abi) )
};

using input_book = std::array<std::optional<input_slot>, MAX_INPUTS>;

struct input_conf {
    uint8_t             slot            = 0;
    extended_symbol     token;
    uint16_t            weight          = 0;
    name                position;
    bool                paired          = false;

    EOSLIB_SERIALIZE( input_conf, (slot)(token)(weight)(position)(paired) )
};

struct request_t {
    uint64_t            id              = 0;
    name                controller;                     //operator, one pending request per kind
    name                owner;
    asset               amount;                         //assets for deposits, shares for redemptions
    extended_symbol     token;                          //vault asset when requested
    time_point_sec      requested_at;
    bool                exempt          = false;        //owner paid no entry/exit fee when requested

    EOSLIB_SERIALIZE( request_t, (id)(controller)(owner)(amount)(token)(requested_at)(exempt) )
};

struct settlement_t {
    uint64_t            last_request_id = 0;            //covers every request up to this id
    asset               share_price;
    asset               assets;                         //deposits: escrow net of fees, redemptions: gross value
    asset               shares;                         //deposits: minted, redemptions: burned
    uint16_t            fee             = 0;            //entry/exit bps charged to non exempt claims
    uint32_t            open_requests   = 0;            //unclaimed requests, the row goes with the last claim
    time_point_sec      settled_at;

    EOSLIB_SERIALIZE( settlement_t, (last_request_id)(share_price)(assets)(shares)(fee)(open_requests)(settled_at) )
};

struct alloc_leg {
    uint8_t             slot            = 0;
    asset               target;                         //asset units
    asset               expected;                       //input units expected from the swap/unstake, asset value for a pair exit
    asset               position_before;                //input units
    asset               input_before;                   //vault input token balance
    asset               pair_before;                    //vault balance of the odd slot token, pairs only
    asset               asset_before;                   //vault asset balance
    asset               swapped;                        //input units handed to / received from the position
    asset               realized;                       //asset value moved into/out of the position
    string              params;
    string              pair_params;                    //swap route of the odd slot token when a pair unwinds
    uint8_t             step            = 0;

    EOSLIB_SERIALIZE( alloc_leg, (slot)(target)(expected)(position_before)(input_before)(pair_before)(asset_before)
                                 (swapped)(realized)(params)(pair_params)(step) )
};

struct alloc_plan {
    bool                investing       = true;
    bool                panic           = false;
    asset               min_liquidity;
    asset               asset_balance_before;
    vector<alloc_leg>   legs;

    EOSLIB_SERIALIZE( alloc_plan, (investing)(panic)(min_liquidity)(asset_balance_before)(legs) )
};

struct asset_update_t {
    extended_symbol     token;
    asset               swapped;                        //old asset handed to the swapper
    asset               balance_before;                 //vault balance of the new token

    EOSLIB_SERIALIZE( asset_update_t, (token)(swapped)(balance_before) )
};

struct swap_deposit_t {
    name                caller;
    name                receiver;
    extended_asset      input;                          //token handed to the swapper
    asset               min_shares;
    asset               balance_before;                 //vault asset balance
    time_point_sec      deadline;

    EOSLIB_SERIALIZE( swap_deposit_t, (caller)(receiver)(input)(min_shares)(balance_before)(deadline) )
};

} //namespace yieldfi
