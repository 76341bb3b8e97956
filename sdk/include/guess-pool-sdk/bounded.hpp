#pragma once

#include <vector>

#include <guess-pool-sdk/errors.hpp>

namespace pool_sdk {

/**
   Appends `value` to a fixed-capacity sequence.
   A full sequence is never truncated: the append fails with `too_many_guesses`
   and the enclosing action is reverted.
*/
template <typename T>
void append_bounded(std::vector<T>& seq, const T& value, size_t capacity) {
    check(seq.size() < capacity, error_code::too_many_guesses);
    seq.push_back(value);
}

} // namespace pool_sdk
