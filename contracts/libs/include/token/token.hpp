#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#define TRANSFER(bank, to, quantity, memo) \
    {	yieldfi_token::token::transfer_action act{ bank, { {_self, yieldfi_token::active_perm} } };\
            act.send( _self, to, quantity , memo );}

namespace yieldfi_token
{
    using std::string;
    using namespace eosio;

    static constexpr eosio::name active_perm    {"active"_n};

    /**
     * Interface of a standard amax.token style token contract: the transfer action
     * and the per-owner `accounts` table.
     */
    class [[eosio::contract( "amax.token" )]] token : public contract
    {
    public:
        using contract::contract;

        [[eosio::action]]
        void transfer( const name& from, const name& to, const asset& quantity, const string& memo );

        static asset get_balance( const name& token_contract_account, const name& owner, const symbol& sym )
        {
            accounts accountstable( token_contract_account, owner.value );
            auto ac = accountstable.find( sym.code().raw() );
            if (ac == accountstable.end()) return asset(0, sym);
            return ac->balance;
        }

        using transfer_action = eosio::action_wrapper<"transfer"_n, &token::transfer>;

    private:
        struct [[eosio::table, eosio::contract("amax.token")]] account
        {
            asset   balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }
        };

        typedef eosio::multi_index<"accounts"_n, account> accounts;
    };

} //namespace yieldfi_token
