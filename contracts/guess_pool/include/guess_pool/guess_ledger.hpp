#pragma once

#include <vector>

#include <guess_pool/tables.hpp>

namespace guess_pool {

/**
   Owns the bounded guess histories: per (game, player) and per game.
   Both reject appends past capacity instead of evicting older entries.
*/
class guess_ledger {
  public:
    static constexpr size_t max_player_guesses = 10;
    static constexpr size_t max_game_guesses = 1000;

  public:
    explicit guess_ledger(name self) : _self(self) {}

    /* fails with too_many_guesses if either history is full */
    void record(uint64_t game_id, name player, uint64_t number, uint32_t timestamp);

    std::vector<uint64_t> player_guesses(uint64_t game_id, name player) const;

    std::vector<guess_attempt> game_log(uint64_t game_id) const;

  private:
    name _self;
};

} // namespace guess_pool
