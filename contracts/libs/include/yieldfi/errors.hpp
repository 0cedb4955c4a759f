#pragma once

#include <cstdint>
#include <string>
#include <eosio/check.hpp>

namespace yieldfi {

enum class err: uint8_t {
   NONE                    = 0,
   RECORD_NOT_FOUND        = 1,
   RECORD_EXISTING         = 2,
   SYMBOL_MISMATCH         = 4,
   PARAM_ERROR             = 5,
   MEMO_FORMAT_ERROR       = 6,
   PAUSED                  = 7,
   NO_AUTH                 = 8,
   REENTRANT_CALL          = 9,

   AMOUNT_TOO_LOW          = 30,
   AMOUNT_TOO_HIGH         = 31,
   ADDRESS_IS_ZERO         = 32,
   INCORRECT_ARRAY_LENGTHS = 33,
   MAX_DEPOSIT_REACHED     = 34,
   NOT_WHITELISTED         = 35,
   STRATEGY_PANICKED       = 36,
   LIQUIDITY_TOO_LOW       = 37,
   UNAUTHORIZED            = 38,
   TRANSACTION_EXPIRED     = 39,
   WRONG_REQUEST           = 40,
   INSUFFICIENT_FUNDS      = 41,
   WRONG_TOKEN             = 42,
   MISSING_ORACLE          = 43,
   CANT_UPDATE_CRATE       = 44,

   SYSTEM_ERROR            = 200
};

} //namespace yieldfi

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }
