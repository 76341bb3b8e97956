#pragma once

#include <string>

#include <eosio/asset.hpp>

#include <guess_pool/tables.hpp>

namespace guess_pool {

using eosio::asset;

/**
   Moves entry fees into custody and prizes out of it with inline token
   transfers. Transfers queued here execute after the calling action, so a
   failed check anywhere in that action drops them together with every
   table write.
*/
class payout_engine {
  public:
    payout_engine(name self, const config_row& config) : _self(self), _config(config) {}

    /* player -> custody, requires guesspool@eosio.code on player's active permission */
    void collect(name from, uint64_t amount, const std::string& memo);

    /* custody -> recipient */
    void settle(uint64_t amount, name recipient, const std::string& memo = "prize");

  private:
    void transfer(name from, name to, uint64_t amount, const std::string& memo) const;

    asset to_asset(uint64_t amount) const;

  private:
    name _self;
    config_row _config;
    uint64_t _pending_in{0u}; // collected in this action, not yet credited to custody
};

} // namespace guess_pool
