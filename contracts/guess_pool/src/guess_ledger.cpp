#include <guess-pool-sdk/bounded.hpp>
#include <guess-pool-sdk/errors.hpp>

#include <guess_pool/guess_ledger.hpp>

namespace guess_pool {

using pool_sdk::error_code;

void guess_ledger::record(uint64_t game_id, name player, uint64_t number, uint32_t timestamp) {
    player_guesses_table player_guesses(_self, game_id);
    const auto it = player_guesses.find(player.value);

    if (it == player_guesses.end()) {
        player_guesses.emplace(_self, [&](auto& row) {
            row.player = player;
            pool_sdk::append_bounded(row.numbers, number, max_player_guesses);
        });
    } else {
        player_guesses.modify(it, _self, [&](auto& row) {
            pool_sdk::append_bounded(row.numbers, number, max_player_guesses);
        });
    }

    guess_log_table log(_self, game_id);
    // rows are never erased, so next key equals the log size
    const uint64_t seq = log.available_primary_key();
    pool_sdk::check(seq < max_game_guesses, error_code::too_many_guesses);

    log.emplace(_self, [&](auto& row) {
        row.seq = seq;
        row.player = player;
        row.number = number;
        row.timestamp = timestamp;
    });
}

std::vector<uint64_t> guess_ledger::player_guesses(uint64_t game_id, name player) const {
    player_guesses_table player_guesses(_self, game_id);
    const auto it = player_guesses.find(player.value);
    return it == player_guesses.end() ? std::vector<uint64_t>{} : it->numbers;
}

std::vector<guess_attempt> guess_ledger::game_log(uint64_t game_id) const {
    guess_log_table log(_self, game_id);

    std::vector<guess_attempt> result;
    for (const auto& row : log) {
        result.push_back(guess_attempt{row.player, row.number, row.timestamp});
    }
    return result;
}

} // namespace guess_pool
