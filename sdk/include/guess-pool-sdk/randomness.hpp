#pragma once

#include <array>
#include <memory>
#include <vector>

#include <eosio/crypto.hpp>
#include <eosio/eosio.hpp>
#include <eosio/transaction.hpp>
#include <intx/intx.hpp>

namespace service {
using eosio::checksum256;

// ===================================================================
// Utility functions for operations with seed values
// ===================================================================
inline intx::uint256 to_intx(const checksum256& hash) {
    auto parts = hash.get_array();
    return intx::uint256(
        intx::uint128(uint64_t(parts[0] >> 64), uint64_t(parts[0])),
        intx::uint128(uint64_t(parts[1] >> 64), uint64_t(parts[1]))
    );
}

/**
   Maps a seed onto [min_number, max_number]: min_number + seed mod range.
   Range is computed in 256 bits, so [0, UINT64_MAX] (range 2^64) is valid.
   Distribution is uniform up to modulo bias, which is negligible for 256-bit seeds.
*/
inline uint64_t derive_secret(const intx::uint256& seed, uint64_t min_number, uint64_t max_number) {
    eosio::check(min_number <= max_number, "invalid random range");

    const intx::uint256 range = intx::uint256(max_number - min_number) + intx::uint256(1);
    return min_number + uint64_t(seed % range);
}


// ===================================================================
// Seed sources
// ===================================================================

/* Generic seed source interface */
struct RandomnessSource {
    using Ptr = std::shared_ptr<RandomnessSource>;

    virtual ~RandomnessSource() {};
    virtual intx::uint256 seed(uint64_t counter) = 0;
};

/**
   Seed derived from public chain state: sha256 of the transaction's reference
   block (tapos num and prefix) xor the block counter.

   WARNING: every input is known before the creating transaction is final, so
   anyone can compute the secret before guessing. Production deployments need a
   committed or VRF-backed source behind the same interface.
*/
class ChainStateSource : public RandomnessSource {
  public:
    intx::uint256 seed(uint64_t counter) override {
        return to_intx(reference_block_hash()) ^ intx::uint256(counter);
    }

  private:
    static checksum256 reference_block_hash() {
        const std::array<uint32_t, 2> ref{
            uint32_t(eosio::tapos_block_num()),
            uint32_t(eosio::tapos_block_prefix()),
        };
        return eosio::sha256(reinterpret_cast<const char*>(ref.data()), sizeof(ref));
    }
};

/**
   Mocked implementation of seed source
   Uses only for testing purposes
*/
class PseudoSource : public RandomnessSource {
  public:
    explicit PseudoSource(const std::vector<uint64_t>& values) : _values(values) {
        eosio::check(!_values.empty(), "pseudo source requires values");
    }

    intx::uint256 seed(uint64_t) override {
        const uint64_t result = _values[_current];
        _current = (_current + 1) % _values.size();
        return intx::uint256(result);
    }

  private:
    std::vector<uint64_t> _values;
    size_t _current = 0;
};

} // namespace service
