#pragma once

#include <cstdint>

#include <eosio/check.hpp>

namespace pool_sdk {

/* stable error codes, surfaced by the host as "assertion failure with error code: N" */
// clang-format off
enum class error_code : uint64_t {
    unauthorized      = 100, // reserved
    game_not_found    = 101,
    game_already_won  = 102,
    invalid_guess     = 103, // guess outside [min_number, max_number]
    transfer_failed   = 104,
    invalid_params    = 105, // min_number > max_number or fee out of asset range
    game_expired      = 106, // reserved
    already_guessed   = 107, // reserved
    too_many_guesses  = 108, // bounded history is full
};
// clang-format on

inline void check(bool pred, error_code code) {
    eosio::check(pred, static_cast<uint64_t>(code));
}

} // namespace pool_sdk
