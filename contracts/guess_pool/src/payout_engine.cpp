#include <tuple>

#include <guess-pool-sdk/errors.hpp>
#include <guess-pool-sdk/token.hpp>

#include <guess_pool/payout_engine.hpp>

namespace guess_pool {

using pool_sdk::error_code;

void payout_engine::collect(name from, uint64_t amount, const std::string& memo) {
    if (amount == 0) {
        return;
    }

    const auto quantity = to_asset(amount);
    const auto balance = token::get_balance(_config.token_contract, from, _config.token_symbol);
    pool_sdk::check(balance >= quantity, error_code::transfer_failed);

    transfer(from, _self, amount, memo);
    _pending_in += amount;
}

void payout_engine::settle(uint64_t amount, name recipient, const std::string& memo) {
    if (amount == 0) {
        return;
    }

    const auto custody = token::get_balance(_config.token_contract, _self, _config.token_symbol);
    pool_sdk::check(custody.amount >= 0 && uint64_t(custody.amount) + _pending_in >= amount,
                    error_code::transfer_failed);

    transfer(_self, recipient, amount, memo);
}

void payout_engine::transfer(name from, name to, uint64_t amount, const std::string& memo) const {
    eosio::action({from, "active"_n},
                  _config.token_contract,
                  "transfer"_n,
                  std::make_tuple(from, to, to_asset(amount), memo))
        .send();
}

asset payout_engine::to_asset(uint64_t amount) const {
    pool_sdk::check(amount <= uint64_t(asset::max_amount), error_code::transfer_failed);
    return asset(int64_t(amount), _config.token_symbol);
}

} // namespace guess_pool
