#pragma once

#include <boost/test/included/unit_test.hpp>
#include <boost/test/unit_test.hpp>

#include <eosio/chain/abi_serializer.hpp>
#include <eosio/chain/exceptions.hpp>
#include <eosio/chain/resource_limits.hpp>
#include <eosio/testing/tester.hpp>

#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <optional>
#include <stdlib.h>

#include "contracts.hpp"

#define BOOST_TEST_STATIC_LINK

#define REQUIRE_EQUAL_ITERABLES(left, right)                                                                           \
    {                                                                                                                  \
        auto l_itr = left.begin();                                                                                     \
        auto r_itr = right.begin();                                                                                    \
        for (; l_itr != left.end() && r_itr != right.end(); ++l_itr, ++r_itr) {                                        \
            BOOST_REQUIRE_EQUAL(*l_itr == *r_itr, true);                                                               \
        }                                                                                                              \
        BOOST_REQUIRE_EQUAL(l_itr == left.end(), true);                                                                \
        BOOST_REQUIRE_EQUAL(r_itr == right.end(), true);                                                               \
    }

#ifndef TESTER
#ifdef NON_VALIDATING_TEST
#define TESTER tester
#else
#define TESTER validating_tester
#endif
#endif

// just sugar
#define STRSYM(str) core_sym::from_string(str)

using namespace eosio::chain;
using namespace eosio::testing;
using namespace fc;

using mvo = fc::mutable_variant_object;

namespace testing {

/* decoded `gamewon` notification */
struct win_notification {
    uint64_t game_id;
    name winner;
    uint64_t prize;
};

class pool_tester : public TESTER {
  public:
    static const name pool_name;
    static const name token_name;

    /* game_row::status values */
    static constexpr uint32_t status_active = 0u;
    static constexpr uint32_t status_won = 1u;

    /* pool_sdk::error_code values */
    enum error : uint64_t {
        game_not_found = 101,
        game_already_won = 102,
        invalid_guess = 103,
        transfer_failed = 104,
        invalid_params = 105,
        too_many_guesses = 108,
    };

    static action_result pool_error(error code) {
        return "assertion failure with error code: " + std::to_string(static_cast<uint64_t>(code));
    }

  public:
    pool_tester() {
        produce_blocks(2);

        create_accounts({token_name, pool_name});

        produce_blocks(100);
        deploy_contract<contracts::system::token>(token_name);

        symbol core_symbol = symbol{CORE_SYM};
        create_currency(token_name, config::system_account_name, asset(100000000000000, core_symbol));
        issue(config::system_account_name, asset(1672708210000, core_symbol));

        deploy_contract<contracts::pool::guesspool>(pool_name);
        // custody pays prizes and sends notifications with inline actions
        grant_eosio_code(pool_name);

        produce_blocks(2);

        BOOST_REQUIRE_EQUAL(
            push_action(pool_name, N(init), pool_name, mvo()("token_contract", token_name)("token_symbol", CORE_SYM_STR)),
            success());
    }

    template <typename Contract> void deploy_contract(account_name account) {
        set_code(account, Contract::wasm());
        set_abi(account, Contract::abi().data());

        abi_def abi;
        abi_serializer abi_s;
        const auto& accnt = control->db().get<account_object, by_name>(account);
        abi_serializer::to_abi(accnt.abi, abi);
        abi_s.set_abi(abi, yield());
        abi_ser.insert({account, abi_s});
    }

    /* adds `account@eosio.code` to `account@active` */
    void grant_eosio_code(name account, std::optional<name> code = std::nullopt) {
        const name inline_code = code.value_or(account);
        set_authority(account,
                      config::active_name,
                      authority(1,
                                {key_weight{get_public_key(account, "active"), 1}},
                                {permission_level_weight{{inline_code, config::eosio_code_name}, 1}}),
                      config::owner_name);
    }

    action_result create_currency(const name& contract, const name& manager, const asset& maxsupply) {
        auto act = mutable_variant_object()("issuer", manager)("maximum_supply", maxsupply);

        return push_action(contract, N(create), contract, act);
    }

    action_result issue(const name& to, const asset& amount) {
        return push_action(token_name,
                           N(issue),
                           config::system_account_name,
                           mutable_variant_object()("to", to)("quantity", amount)("memo", ""));
    }

    action_result transfer(const name& from, const name& to, const asset& amount, const std::string& memo = "") {
        return push_action(token_name,
                           N(transfer),
                           from,
                           mutable_variant_object()("from", from)("to", to)("quantity", amount)("memo", memo));
    }

    action_result push_action(const action_name& contract,
                              const action_name& name,
                              const action_name& actor,
                              const variant_object& data) {
        return push_action(contract, name, permission_level{actor, config::active_name}, data);
    }

    action_result push_action(const action_name& contract,
                              const action_name& name,
                              const permission_level& auth,
                              const variant_object& data) {
        transaction_trace_ptr trace;
        const auto result = push_action(contract, name, auth, data, trace);
        if (result == success()) {
            handle_transaction_ptr(trace);
        }
        return result;
    }

    /* signs with auth key and exposes the trace */
    action_result push_action(const action_name& contract,
                              const action_name& name,
                              const permission_level& auth,
                              const variant_object& data,
                              transaction_trace_ptr& trace) {
        string action_type_name = abi_ser[contract].get_action_type(name);

        action act;
        act.account = contract;
        act.name = name;
        act.data = abi_ser[contract].variant_to_binary(action_type_name, data, yield());
        act.authorization.push_back(auth);

        signed_transaction trx;
        trx.actions.emplace_back(std::move(act));
        set_transaction_headers(trx);
        trx.sign(get_private_key(auth.actor, auth.permission.to_string()), control->get_chain_id());

        try {
            trace = push_transaction(trx);
        } catch (const fc::exception& ex) {
            edump((ex.to_detail_string()));
            return error(ex.top_message()); // top_message() is assumed by many
                                            // tests; otherwise they fail
        }
        produce_block();
        BOOST_REQUIRE_EQUAL(true, chain_has_transaction(trx.id()));
        return success();
    }

    // =============================================================
    // Game actions
    // =============================================================
    void create_player(name player_name, asset balance = STRSYM("1000.0000")) {
        create_account(player_name);
        // allow guesspool to collect entry fees from player
        grant_eosio_code(player_name, pool_name);

        if (balance.get_amount() > 0) {
            BOOST_REQUIRE_EQUAL(transfer(config::system_account_name, player_name, balance), success());
        }
    }

    action_result create_game(name creator, uint64_t min_number, uint64_t max_number, uint64_t entry_fee) {
        return push_action(pool_name,
                           N(creategame),
                           creator,
                           mvo()("creator", creator)("min_number", min_number)("max_number", max_number)(
                               "entry_fee", entry_fee));
    }

    /* creates game and returns its id, secret is forced when seed is given */
    uint64_t new_game(name creator,
                      uint64_t min_number,
                      uint64_t max_number,
                      uint64_t entry_fee,
                      std::optional<uint64_t> seed = std::nullopt) {
        if (seed.has_value()) {
            push_seed(*seed);
        }

        const auto game_id = get_total_games();
        BOOST_REQUIRE_EQUAL(create_game(creator, min_number, max_number, entry_fee), success());
        BOOST_REQUIRE_EQUAL(get_total_games(), game_id + 1);
        return game_id;
    }

    action_result guess(name player, uint64_t game_id, uint64_t number) {
        return push_action(
            pool_name, N(guess), player, mvo()("player", player)("game_id", game_id)("number", number));
    }

    /* guess which should succeed, returns true on win */
    bool guess_ok(name player, uint64_t game_id, uint64_t number) {
        BOOST_REQUIRE_EQUAL(guess(player, game_id, number), success());

        const auto game = get_game(game_id);
        if (game["status"].as<uint32_t>() == status_won) {
            BOOST_REQUIRE_EQUAL(winner_of(game).value(), player);
            return true;
        }
        return false;
    }

    void push_seed(uint64_t seed) {
        BOOST_REQUIRE_EQUAL(push_action(pool_name, N(pushseed), pool_name, mvo()("seed", seed)), success());
    }

    // =============================================================
    // Queries
    // =============================================================

    /* executes query action and decodes its return value */
    action_result query(const action_name& name, const variant_object& data, fc::variant& result) {
        transaction_trace_ptr trace;
        const auto status = push_action(pool_name, name, permission_level{pool_name, config::active_name}, data, trace);
        if (status != success()) {
            return status;
        }

        const auto& action_trace = trace->action_traces.front();
        const auto result_type = abi_ser[pool_name].get_action_result_type(name);
        result = abi_ser[pool_name].binary_to_variant(result_type, action_trace.return_value, yield());
        return success();
    }

    fc::variant query(const action_name& name, const variant_object& data = mvo()) {
        fc::variant result;
        BOOST_REQUIRE_EQUAL(query(name, data, result), success());
        return result;
    }

    fc::variant get_game(uint64_t game_id) { return query(N(getgame), mvo()("game_id", game_id)); }

    std::optional<uint64_t> get_prize_pool(uint64_t game_id) {
        return as_optional<uint64_t>(query(N(getpool), mvo()("game_id", game_id)));
    }

    std::optional<uint64_t> get_guess_count(uint64_t game_id) {
        return as_optional<uint64_t>(query(N(getcount), mvo()("game_id", game_id)));
    }

    std::optional<name> get_winner(uint64_t game_id) {
        return as_optional<name>(query(N(getwinner), mvo()("game_id", game_id)));
    }

    uint64_t get_total_games() { return query(N(gettotal)).as<uint64_t>(); }

    std::vector<uint64_t> get_player_guesses(uint64_t game_id, name player) {
        return query(N(getguesses), mvo()("game_id", game_id)("player", player)).as<std::vector<uint64_t>>();
    }

    fc::variants get_game_log(uint64_t game_id) {
        return query(N(getlog), mvo()("game_id", game_id)).get_array();
    }

    /* decodes winner variant: ["undecided", {}] or ["name", "account"] */
    static std::optional<name> winner_of(const fc::variant& game) {
        const auto& winner = game["winner"].get_array();
        if (winner.at(0).as_string() == "name") {
            return winner.at(1).as<name>();
        }
        return std::nullopt;
    }

    asset get_balance(name account) const { return get_currency_balance(token_name, symbol(CORE_SYM), account); }

    /* raw token units of core symbol */
    int64_t get_balance_amount(name account) const { return get_balance(account).get_amount(); }

    const std::vector<win_notification>& get_win_notifications() const { return _wins; }

  private:
    template <typename T> static std::optional<T> as_optional(const fc::variant& value) {
        return value.is_null() ? std::nullopt : std::optional<T>{value.as<T>()};
    }

    static abi_serializer::yield_function_t yield() {
        return abi_serializer::create_yield_function(abi_serializer_max_time);
    }

    void handle_transaction_ptr(const transaction_trace_ptr& transaction_trace) {
        _wins.clear();

        std::for_each(
            transaction_trace->action_traces.begin(),
            transaction_trace->action_traces.end(),
            [&](const auto& action_trace) {
                if (action_trace.receiver != pool_name || action_trace.act.name != N(gamewon))
                    return;

                const fc::variant event = abi_ser[pool_name].binary_to_variant(
                    "gamewon",
                    action_trace.act.data,
                    yield()
                );

                _wins.push_back(win_notification{
                    event["game_id"].as<uint64_t>(),
                    event["winner"].as<name>(),
                    event["prize"].as<uint64_t>(),
                });
            }
        );
    }

  public:
    std::map<account_name, abi_serializer> abi_ser;

  private:
    std::vector<win_notification> _wins;
};

const name pool_tester::pool_name = N(guesspool);
const name pool_tester::token_name = N(eosio.token);

} // namespace testing

void translate_fc_exception(const fc::exception& e) {
    std::cerr << "\033[33m" << e.to_detail_string() << "\033[0m" << std::endl;
    BOOST_TEST_FAIL("Caught Unexpected Exception");
}

boost::unit_test::test_suite* init_unit_test_suite(int argc, char* argv[]) {
#ifdef IS_DEBUG
    bool is_verbose = true;
#else
    bool is_verbose = false;
    // Turn off blockchain logging if no --verbose parameter is not added
    // To have verbose enabled, call "tests/unit_test -- --verbose"
    std::string verbose_arg = "--verbose";
    for (int i = 0; i < argc; i++) {
        if (verbose_arg == argv[i]) {
            is_verbose = true;
            break;
        }
    }
#endif

    fc::logger::get(DEFAULT_LOGGER).set_log_level(is_verbose ? fc::log_level::debug : fc::log_level::off);

    // Register fc::exception translator
    boost::unit_test::unit_test_monitor.template register_exception_translator<fc::exception>(&translate_fc_exception);

    const auto seed = time(NULL);
    std::srand(seed);

    std::cout << "Random number generator seeded to " << seed << std::endl;

    return nullptr;
}
