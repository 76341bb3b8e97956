#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

namespace token {

using eosio::asset;
using eosio::name;
using eosio::symbol;

/* row layout of `accounts` table in eosio.token compatible contracts */
struct account {
    asset balance;

    uint64_t primary_key() const { return balance.symbol.code().raw(); }

    EOSLIB_SERIALIZE(account, (balance))
};

using accounts = eosio::multi_index<"accounts"_n, account>;

/* returns zero asset if owner has no balance row for this symbol */
inline asset get_balance(name token_contract, name owner, symbol sym) {
    accounts table(token_contract, owner.value);
    const auto it = table.find(sym.code().raw());
    if (it == table.end()) {
        return asset(0, sym);
    }
    eosio::check(it->balance.symbol == sym, "symbol precision mismatch");
    return it->balance;
}

} // namespace token
