#pragma once

#include <pool_tester/pool_tester.hpp>

namespace testing::strategy {

/* per (game, player) history capacity of the contract */
static constexpr size_t max_player_guesses = 10;

struct round_params {
    uint64_t min_number;
    uint64_t max_number;
    uint64_t entry_fee;
    std::optional<uint64_t> seed;
};

/* state handed to a number picker before each guess */
struct turn {
    uint64_t game_id;
    name player;
    uint step;
    const round_params& params;
};

/* picks the next number for `turn.player`, nullopt abandons the round */
using picker_t = std::function<std::optional<uint64_t>(pool_tester&, const turn&)>;

enum class round_end {
    won,
    abandoned,
    capacity,
    step_limit,
};

struct round_report {
    uint64_t game_id;
    round_end end;
    uint steps;
    std::optional<name> winner;
    uint64_t prize;
};

/**
   Plays guessing rounds on a pool_tester.

   A round creates a game, then rotates through the players, asking the picker
   for a number on each turn. Players whose history is full are skipped. After
   every guess the executor checks the game against the state it had before:
   counter, pool, custody and player balance, winner, history and log.
   A round ends when someone wins, when the picker gives up, when every
   player is at capacity, or after `step_limit` guesses.
*/
class Executor {
  public:
    Executor(name creator, std::vector<name> players, picker_t&& picker)
        : _creator(creator), _players(std::move(players)), _picker(std::move(picker)) {}

    round_report play_round(pool_tester& tester, const round_params& params, uint step_limit) {
        const auto game_id =
            tester.new_game(_creator, params.min_number, params.max_number, params.entry_fee, params.seed);

        round_report report{game_id, round_end::step_limit, 0, std::nullopt, 0};
        size_t next_player = 0;

        while (report.steps != step_limit) {
            const auto player = pick_player(tester, game_id, next_player);
            if (!player.has_value()) {
                report.end = round_end::capacity;
                return report;
            }

            const auto number = _picker(tester, turn{game_id, *player, report.steps, params});
            if (!number.has_value()) {
                report.end = round_end::abandoned;
                return report;
            }

            ++report.steps;
            if (step(tester, game_id, *player, *number)) {
                report.end = round_end::won;
                report.winner = player;
                report.prize = tester.get_win_notifications().at(0).prize;
                return report;
            }
        }

        return report;
    }

    std::vector<round_report> play(pool_tester& tester,
                                   uint run_count,
                                   uint step_limit,
                                   const std::function<round_params(uint)>& params_for_run) {
        std::vector<round_report> reports;

        for (uint run = 0; run != run_count; ++run) {
            reports.push_back(play_round(tester, params_for_run(run), step_limit));

            if (run % 10 == 0) {
                BOOST_TEST_MESSAGE(run << " rounds played");
            }
        }

        return reports;
    }

  private:
    std::optional<name> pick_player(pool_tester& tester, uint64_t game_id, size_t& next_player) const {
        for (size_t tried = 0; tried != _players.size(); ++tried) {
            const auto& player = _players[next_player];
            next_player = (next_player + 1) % _players.size();

            if (tester.get_player_guesses(game_id, player).size() < max_player_guesses) {
                return player;
            }
        }
        return std::nullopt;
    }

    /* one guess plus the checks around it, returns true on win */
    static bool step(pool_tester& tester, uint64_t game_id, name player, uint64_t number) {
        const auto before = tester.get_game(game_id);
        const auto fee = before["entry_fee"].as<uint64_t>();
        const auto pool_before = before["prize_pool"].as<uint64_t>();
        const auto count_before = before["guess_count"].as<uint64_t>();
        const auto custody_before = tester.get_balance_amount(pool_tester::pool_name);
        const auto player_before = tester.get_balance_amount(player);
        const auto history_before = tester.get_player_guesses(game_id, player);

        BOOST_REQUIRE_EQUAL(before["status"].as<uint32_t>(), pool_tester::status_active);
        BOOST_REQUIRE_EQUAL(tester.guess(player, game_id, number), pool_tester::success());

        const auto after = tester.get_game(game_id);
        const bool won = number == before["secret_number"].as<uint64_t>();

        BOOST_REQUIRE_EQUAL(after["secret_number"].as<uint64_t>(), before["secret_number"].as<uint64_t>());
        BOOST_REQUIRE_EQUAL(after["guess_count"].as<uint64_t>(), count_before + 1);

        auto history = history_before;
        history.push_back(number);
        BOOST_REQUIRE(tester.get_player_guesses(game_id, player) == history);

        const auto log = tester.get_game_log(game_id);
        BOOST_REQUIRE_EQUAL(log.size(), count_before + 1);
        BOOST_REQUIRE_EQUAL(log.back()["player"].as<name>(), player);
        BOOST_REQUIRE_EQUAL(log.back()["number"].as<uint64_t>(), number);

        if (won) {
            const auto prize = pool_before + fee;

            BOOST_REQUIRE_EQUAL(after["status"].as<uint32_t>(), pool_tester::status_won);
            BOOST_REQUIRE_EQUAL(after["prize_pool"].as<uint64_t>(), 0);
            BOOST_REQUIRE(pool_tester::winner_of(after) == player);

            const auto& wins = tester.get_win_notifications();
            BOOST_REQUIRE_EQUAL(wins.size(), 1);
            BOOST_REQUIRE_EQUAL(wins[0].game_id, game_id);
            BOOST_REQUIRE_EQUAL(wins[0].winner, player);
            BOOST_REQUIRE_EQUAL(wins[0].prize, prize);

            BOOST_REQUIRE_EQUAL(tester.get_balance_amount(player), player_before - int64_t(fee) + int64_t(prize));
            BOOST_REQUIRE_EQUAL(tester.get_balance_amount(pool_tester::pool_name),
                                custody_before + int64_t(fee) - int64_t(prize));
        } else {
            BOOST_REQUIRE_EQUAL(after["status"].as<uint32_t>(), pool_tester::status_active);
            BOOST_REQUIRE_EQUAL(after["prize_pool"].as<uint64_t>(), pool_before + fee);
            BOOST_REQUIRE(pool_tester::winner_of(after) == std::nullopt);
            BOOST_REQUIRE(tester.get_win_notifications().empty());

            BOOST_REQUIRE_EQUAL(tester.get_balance_amount(player), player_before - int64_t(fee));
            BOOST_REQUIRE_EQUAL(tester.get_balance_amount(pool_tester::pool_name), custody_before + int64_t(fee));
        }

        return won;
    }

  private:
    name _creator;
    std::vector<name> _players;
    picker_t _picker;
};

} // namespace testing::strategy
