#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <eosio/name.hpp>
#include <eosio/symbol.hpp>

namespace yieldfi {

using std::string;
using std::vector;

inline vector<string> split( const string& str, const string& delim ) {
   vector<string> parts;
   size_t start = 0;
   while (true) {
      auto pos = str.find(delim, start);
      if (pos == string::npos) {
         parts.push_back(str.substr(start));
         break;
      }
      parts.push_back(str.substr(start, pos - start));
      start = pos + delim.size();
   }
   return parts;
}

inline int64_t power10( uint8_t exp ) {
   int64_t ret = 1;
   while( exp > 0 ) {
      ret *= 10; --exp;
   }
   return ret;
}

// price.oracle keys prices by the lowercase symbol code
inline eosio::name lower_name( const eosio::symbol& sym ) {
   auto str = sym.code().to_string();
   std::transform(str.begin(), str.end(), str.begin(), ::tolower);
   return eosio::name(str);
}

inline uint64_t to_uint64( const string& str ) {
   uint64_t ret = 0;
   for (auto c : str) {
      if (c < '0' || c > '9') return UINT64_MAX;
      ret = ret * 10 + (c - '0');
   }
   return ret;
}

} //namespace yieldfi
