#include <eosio/asset.hpp>
#include <eosio/system.hpp>

#include <guess-pool-sdk/errors.hpp>

#include <guess_pool/game_registry.hpp>

namespace guess_pool {

using pool_sdk::error_code;

game_registry::game_registry(name self)
    : _self(self), _games(self, self.value), _global(self, self.value) {}

uint64_t game_registry::create(name creator,
                               uint64_t min_number,
                               uint64_t max_number,
                               uint64_t entry_fee,
                               service::RandomnessSource& randomness) {
    pool_sdk::check(min_number <= max_number, error_code::invalid_params);
    pool_sdk::check(entry_fee <= uint64_t(eosio::asset::max_amount), error_code::invalid_params);

    auto global = _global.get_or_default();
    const uint64_t game_id = global.games_seq++;

    const uint32_t counter = eosio::current_block_time().slot;
    const uint64_t secret = service::derive_secret(randomness.seed(counter), min_number, max_number);

    _games.emplace(_self, [&](auto& row) {
        row.id = game_id;
        row.creator = creator;
        row.secret_number = secret;
        row.min_number = min_number;
        row.max_number = max_number;
        row.entry_fee = entry_fee;
        row.prize_pool = 0u;
        row.guess_count = 0u;
        row.winner = undecided{};
        row.status = static_cast<uint8_t>(game_status::active);
        row.created_at = counter;
    });

    _global.set(global, _self);

    return game_id;
}

std::optional<game_row> game_registry::find(uint64_t game_id) const {
    const auto it = _games.find(game_id);
    if (it == _games.end()) {
        return std::nullopt;
    }
    return *it;
}

const game_row& game_registry::get(uint64_t game_id) const {
    const auto it = _games.find(game_id);
    pool_sdk::check(it != _games.end(), error_code::game_not_found);
    return *it;
}

uint64_t game_registry::total() const {
    return _global.get_or_default().games_seq;
}

void game_registry::record_miss(const game_row& game) {
    eosio::check(game.prize_pool <= uint64_t(eosio::asset::max_amount) - game.entry_fee, "prize pool overflow");

    _games.modify(game, _self, [&](auto& row) {
        row.prize_pool += row.entry_fee;
        row.guess_count += 1;
    });
}

void game_registry::record_win(const game_row& game, name winner) {
    eosio::check(is_active(game), "invariant check failed: game should be active");

    _games.modify(game, _self, [&](auto& row) {
        row.prize_pool = 0u;
        row.guess_count += 1;
        row.winner = winner;
        row.status = static_cast<uint8_t>(game_status::won);
    });
}

} // namespace guess_pool
