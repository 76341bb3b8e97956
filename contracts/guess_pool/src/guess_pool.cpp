#include <string>

#include <eosio/system.hpp>

#include <guess_pool/guess_pool.hpp>

namespace guess_pool {

using pool_sdk::error_code;

void guess_pool::init(name token_contract, symbol token_symbol) {
    require_auth(get_self());
    eosio::check(eosio::is_account(token_contract), "token contract account doesn't exists");
    eosio::check(token_symbol.is_valid(), "invalid token symbol");

    // games keep raw token units, so the token can't change under them
    config_singleton config(get_self(), get_self().value);
    eosio::check(!config.exists(), "contract is already initialized");

    config.set(config_row{token_contract, token_symbol}, get_self());
}

uint64_t guess_pool::create_game(name creator, uint64_t min_number, uint64_t max_number, uint64_t entry_fee) {
    require_auth(creator);
    get_config();

    auto randomness = get_randomness();
    const auto game_id = registry.create(creator, min_number, max_number, entry_fee, *randomness);

    eosio::print("game created: ", game_id, " range: [", min_number, ", ", max_number, "]\n");
    return game_id;
}

bool guess_pool::guess(name player, uint64_t game_id, uint64_t number) {
    require_auth(player);
    const auto config = get_config();

    const auto& game = registry.get(game_id);
    pool_sdk::check(is_active(game), error_code::game_already_won);
    pool_sdk::check(game.min_number <= number && number <= game.max_number, error_code::invalid_guess);

    payout_engine payouts(get_self(), config);
    payouts.collect(player, game.entry_fee, "entry fee, game " + std::to_string(game_id));

    ledger.record(game_id, player, number, eosio::current_block_time().slot);

    if (number != game.secret_number) {
        registry.record_miss(game);
        return false;
    }

    eosio::check(game.prize_pool <= uint64_t(eosio::asset::max_amount) - game.entry_fee, "prize pool overflow");
    const uint64_t final_pool = game.prize_pool + game.entry_fee;

    payouts.settle(final_pool, player, "prize, game " + std::to_string(game_id));
    registry.record_win(game, player);

    game_won_action(get_self(), {get_self(), "active"_n}).send(game_id, player, final_pool);

    eosio::print("game ", game_id, " won by ", player, ", prize: ", final_pool, "\n");
    return true;
}

void guess_pool::game_won(uint64_t /* game_id */, name winner, uint64_t /* prize */) {
    require_auth(get_self());
    require_recipient(winner);
}

std::optional<game_row> guess_pool::get_game(uint64_t game_id) { return queries.game_info(game_id); }

std::optional<name> guess_pool::get_winner(uint64_t game_id) { return queries.winner(game_id); }

std::optional<uint64_t> guess_pool::get_guess_count(uint64_t game_id) { return queries.guess_count(game_id); }

std::optional<uint64_t> guess_pool::get_prize_pool(uint64_t game_id) { return queries.prize_pool(game_id); }

uint64_t guess_pool::get_total_games() { return queries.total_games(); }

bool guess_pool::is_game_active(uint64_t game_id) { return queries.is_active(game_id); }

std::vector<uint64_t> guess_pool::get_player_guesses(uint64_t game_id, name player) {
    return queries.player_guesses(game_id, player);
}

std::vector<guess_attempt> guess_pool::get_game_log(uint64_t game_id) { return queries.game_log(game_id); }

config_row guess_pool::get_config() const {
    config_singleton config(get_self(), get_self().value);
    eosio::check(config.exists(), "contract isn't initialized");
    return config.get();
}

service::RandomnessSource::Ptr guess_pool::get_randomness() {
#ifdef IS_DEBUG
    debug_singleton debug(get_self(), get_self().value);
    auto debug_row = debug.get_or_default();
    if (!debug_row.pseudo_seeds.empty()) {
        const uint64_t seed = debug_row.pseudo_seeds.front();
        debug_row.pseudo_seeds.erase(debug_row.pseudo_seeds.begin());
        debug.set(debug_row, get_self());
        return std::make_shared<service::PseudoSource>(std::vector<uint64_t>{seed});
    }
#endif

    return std::make_shared<service::ChainStateSource>();
}

#ifdef IS_DEBUG
void guess_pool::push_seed(uint64_t seed) {
    require_auth(get_self());

    debug_singleton debug(get_self(), get_self().value);
    auto debug_row = debug.get_or_default();
    debug_row.pseudo_seeds.push_back(seed);
    debug.set(debug_row, get_self());
}
#endif

} // namespace guess_pool
