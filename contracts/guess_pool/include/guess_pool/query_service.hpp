#pragma once

#include <optional>
#include <vector>

#include <guess-pool-sdk/errors.hpp>

#include <guess_pool/game_registry.hpp>
#include <guess_pool/guess_ledger.hpp>

namespace guess_pool {

/**
   Read-only projections over the registry and the ledger.

   Unknown game ids come back as an empty value from every accessor except
   is_active, which fails with game_not_found. An unknown game and a known
   game with no guesses by `player` are indistinguishable in player_guesses.
*/
class query_service {
  public:
    query_service(const game_registry& registry, const guess_ledger& ledger)
        : _registry(registry), _ledger(ledger) {}

    std::optional<game_row> game_info(uint64_t game_id) const { return _registry.find(game_id); }

    std::optional<name> winner(uint64_t game_id) const {
        const auto game = _registry.find(game_id);
        if (!game) {
            return std::nullopt;
        }
        if (const auto* decided = std::get_if<name>(&game->winner)) {
            return *decided;
        }
        return std::nullopt;
    }

    std::optional<uint64_t> guess_count(uint64_t game_id) const {
        const auto game = _registry.find(game_id);
        return game ? std::optional<uint64_t>{game->guess_count} : std::nullopt;
    }

    std::optional<uint64_t> prize_pool(uint64_t game_id) const {
        const auto game = _registry.find(game_id);
        return game ? std::optional<uint64_t>{game->prize_pool} : std::nullopt;
    }

    uint64_t total_games() const { return _registry.total(); }

    bool is_active(uint64_t game_id) const { return guess_pool::is_active(_registry.get(game_id)); }

    std::vector<uint64_t> player_guesses(uint64_t game_id, name player) const {
        return _ledger.player_guesses(game_id, player);
    }

    std::vector<guess_attempt> game_log(uint64_t game_id) const { return _ledger.game_log(game_id); }

  private:
    const game_registry& _registry;
    const guess_ledger& _ledger;
};

} // namespace guess_pool
