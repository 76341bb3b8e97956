#pragma once

#include <optional>

#include <guess-pool-sdk/randomness.hpp>

#include <guess_pool/tables.hpp>

namespace guess_pool {

/**
   Owns the game id sequence and the game records.
   Records are created here and mutated only through record_miss/record_win,
   which the guess action calls after all checks have passed.
*/
class game_registry {
  public:
    explicit game_registry(name self);

    uint64_t create(name creator,
                    uint64_t min_number,
                    uint64_t max_number,
                    uint64_t entry_fee,
                    service::RandomnessSource& randomness);

    std::optional<game_row> find(uint64_t game_id) const;

    /* fails with game_not_found */
    const game_row& get(uint64_t game_id) const;

    uint64_t total() const;

    void record_miss(const game_row& game);
    void record_win(const game_row& game, name winner);

  private:
    name _self;
    game_table _games;
    global_singleton _global;
};

} // namespace guess_pool
