#pragma once

#include <variant>
#include <vector>

#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

namespace guess_pool {

using eosio::name;
using eosio::symbol;

enum class game_status : uint8_t {
    active = 0, // <- create, -> won
    won,        // <- active, final
};

/* winner slot: undecided until the single active -> won transition */
struct undecided {
    EOSLIB_SERIALIZE(undecided, )
};
using winner_t = std::variant<undecided, name>;

/* global state variables */
struct [[eosio::table("global"), eosio::contract("guesspool")]] global_row {
    uint64_t games_seq{0u};
};
using global_singleton = eosio::singleton<"global"_n, global_row>;

/* custody token, set by init */
struct [[eosio::table("config"), eosio::contract("guesspool")]] config_row {
    name token_contract;
    symbol token_symbol;
};
using config_singleton = eosio::singleton<"config"_n, config_row>;

// clang-format off
struct [[eosio::table("game"), eosio::contract("guesspool")]] game_row {
    uint64_t id;
    name creator;
    uint64_t secret_number; // <- min_number <= secret_number <= max_number
    uint64_t min_number;
    uint64_t max_number;
    uint64_t entry_fee;     // <- raw units of config token, may be 0
    uint64_t prize_pool;    // <- grows while active, zeroed with the payout
    uint64_t guess_count;   // <- includes the winning guess
    winner_t winner;
    uint8_t status;
    uint32_t created_at;    // <- block slot at creation

    uint64_t primary_key() const { return id; }

    game_status get_status() const { return static_cast<game_status>(status); }
};
// clang-format on
using game_table = eosio::multi_index<"game"_n, game_row>;

/* scope: game id */
struct [[eosio::table("plguesses"), eosio::contract("guesspool")]] player_guesses_row {
    name player;
    std::vector<uint64_t> numbers;

    uint64_t primary_key() const { return player.value; }
};
using player_guesses_table = eosio::multi_index<"plguesses"_n, player_guesses_row>;

/* scope: game id, seq is dense and starts at 0 */
struct [[eosio::table("guesslog"), eosio::contract("guesspool")]] guess_log_row {
    uint64_t seq;
    name player;
    uint64_t number;
    uint32_t timestamp;

    uint64_t primary_key() const { return seq; }
};
using guess_log_table = eosio::multi_index<"guesslog"_n, guess_log_row>;

struct guess_attempt {
    name player;
    uint64_t number;
    uint32_t timestamp;

    EOSLIB_SERIALIZE(guess_attempt, (player)(number)(timestamp))
};

inline bool is_active(const game_row& game) {
    switch (game.get_status()) {
    case game_status::active:
        return true;
    case game_status::won:
        return false;
    }
    eosio::check(false, "invalid game status");
    return false;
}

#ifdef IS_DEBUG
/* debug table, seeds consumed by game creation in FIFO order */
struct [[eosio::table("debug"), eosio::contract("guesspool")]] debug_row {
    std::vector<uint64_t> pseudo_seeds;
};
using debug_singleton = eosio::singleton<"debug"_n, debug_row>;
#endif

} // namespace guess_pool
