#pragma once

#include <optional>
#include <vector>

#include <eosio/eosio.hpp>

#include <guess-pool-sdk/errors.hpp>
#include <guess-pool-sdk/randomness.hpp>

#include <guess_pool/game_registry.hpp>
#include <guess_pool/guess_ledger.hpp>
#include <guess_pool/payout_engine.hpp>
#include <guess_pool/query_service.hpp>
#include <guess_pool/tables.hpp>

// abi generator hack
#ifndef NOABI
#define CONTRACT_ACTION(act_name) [[eosio::action(#act_name)]]
#else
#define CONTRACT_ACTION(act_name)
#endif

namespace guess_pool {

class [[eosio::contract("guesspool")]] guess_pool : public eosio::contract {
  public:
    guess_pool(name receiver, name code, eosio::datastream<const char*> ds)
        : contract(receiver, code, ds), registry(receiver), ledger(receiver), queries(registry, ledger) {}

    CONTRACT_ACTION(init)
    void init(name token_contract, symbol token_symbol);

    CONTRACT_ACTION(creategame)
    uint64_t create_game(name creator, uint64_t min_number, uint64_t max_number, uint64_t entry_fee);

    /* true if the guess won the pool */
    CONTRACT_ACTION(guess)
    bool guess(name player, uint64_t game_id, uint64_t number);

    /* win notification, sent inline by guess */
    CONTRACT_ACTION(gamewon)
    void game_won(uint64_t game_id, name winner, uint64_t prize);
    using game_won_action = eosio::action_wrapper<"gamewon"_n, &guess_pool::game_won>;

    // =============================================================
    // Read-only queries
    // =============================================================
    CONTRACT_ACTION(getgame)
    std::optional<game_row> get_game(uint64_t game_id);

    CONTRACT_ACTION(getwinner)
    std::optional<name> get_winner(uint64_t game_id);

    CONTRACT_ACTION(getcount)
    std::optional<uint64_t> get_guess_count(uint64_t game_id);

    CONTRACT_ACTION(getpool)
    std::optional<uint64_t> get_prize_pool(uint64_t game_id);

    CONTRACT_ACTION(gettotal)
    uint64_t get_total_games();

    CONTRACT_ACTION(isactive)
    bool is_game_active(uint64_t game_id);

    CONTRACT_ACTION(getguesses)
    std::vector<uint64_t> get_player_guesses(uint64_t game_id, name player);

    CONTRACT_ACTION(getlog)
    std::vector<guess_attempt> get_game_log(uint64_t game_id);

#ifdef IS_DEBUG
    CONTRACT_ACTION(pushseed)
    void push_seed(uint64_t seed);
#endif

  private:
    config_row get_config() const;

    service::RandomnessSource::Ptr get_randomness();

  private:
    game_registry registry;
    guess_ledger ledger;
    query_service queries;
};

} // namespace guess_pool
