#include <catch2/catch_all.hpp>
#include <api/json/plx_json.h>
#include <processors/expr/plx_expr_evaluator.h>
#include <processors/expr/plx_expr_parser.h>
#include <processors/plx_errors.h>

using namespace plx::processors;
using namespace plx::processors::expr;

static plxv_map data_from_json(const plx_string& text) {
    plxv_map data;
    plx_json json(&data);
    REQUIRE(json.parse(text));
    return data;
}

static plx_variant eval_predicate(const plx_string& predicate, const plxv_map& data) {
    plx_expr_evaluator evaluator(data);
    return evaluator.evaluate(plx_expr_parser::parse_predicate(predicate));
}

static bool holds(const plx_string& predicate, const plxv_map& data) {
    return plx_expr_evaluator::truthy(eval_predicate(predicate, data));
}

SCENARIO("Formulas only accept arithmetic over sum(path) atoms") {
    THEN("Well formed formulas parse") {
        REQUIRE(plx_expr_parser::parse_formula("sum(team.players[].fouls)") != nullptr);
        REQUIRE(plx_expr_parser::parse_formula("sum(players[].oreb) + sum(players[].dreb)") != nullptr);
        REQUIRE(plx_expr_parser::parse_formula("(sum(a[].x) - 2) * 3 / -4") != nullptr);
        REQUIRE(plx_expr_parser::parse_formula("1.5") != nullptr);
    }

    THEN("Anything else is a syntax error") {
        REQUIRE_THROWS_AS(plx_expr_parser::parse_formula("sum(team.fouls)"), plx_expression_error);
        REQUIRE_THROWS_AS(plx_expr_parser::parse_formula("len(players[])"), plx_expression_error);
        REQUIRE_THROWS_AS(plx_expr_parser::parse_formula("players"), plx_expression_error);
        REQUIRE_THROWS_AS(plx_expr_parser::parse_formula("2 +"), plx_expression_error);
        REQUIRE_THROWS_AS(plx_expr_parser::parse_formula("sum(a[].x) == 3"), plx_expression_error);
        REQUIRE_THROWS_AS(plx_expr_parser::parse_formula(""), plx_expression_error);
    }

    THEN("Syntax errors carry the position and the input") {
        try {
            plx_expr_parser::parse_formula("1 + foo");
            FAIL("expected a syntax error");
        } catch (const plx_expression_error& e) {
            REQUIRE(e.get_message().contains("position 4"));
            REQUIRE(e.get_context() == "1 + foo");
        }
    }
}

SCENARIO("Formula evaluation sums fields across records") {
    GIVEN("Players with fouls stored as numbers and strings") {
        plxv_map data = data_from_json(R"({
            "team": {"players": [
                {"fouls": 2}, {"fouls": "1"}, {"fouls": 3}, {"fouls": 2.0}, {"name": "no fouls"}
            ]}
        })");

        WHEN("Summing the fouls") {
            plx_execution_log log;
            plx_expr_evaluator evaluator(data, &log);
            plx_variant total = evaluator.evaluate(plx_expr_parser::parse_formula("sum(team.players[].fouls)"));

            THEN("Strings are parsed and missing values count as zero with a warning") {
                REQUIRE(total.number_value() == 8.0);
                REQUIRE(log.get_warnings().size() == 1);
            }
        }

        WHEN("The path does not exist") {
            plx_execution_log log;
            plx_expr_evaluator evaluator(data, &log);
            plx_variant total = evaluator.evaluate(plx_expr_parser::parse_formula("sum(home.players[].fouls) + 1"));

            THEN("The atom is zero") {
                REQUIRE(total.number_value() == 1.0);
                REQUIRE_FALSE(log.get_warnings().empty());
            }
        }

        WHEN("Dividing by zero") {
            plx_expr_evaluator evaluator(data);
            node_ptr formula = plx_expr_parser::parse_formula("sum(team.players[].fouls) / 0");

            THEN("Evaluation fails") {
                REQUIRE_THROWS_AS(evaluator.evaluate(formula), plx_expression_error);
            }
        }
    }
}

SCENARIO("Predicates follow scripting semantics") {
    GIVEN("A game record") {
        plxv_map data = data_from_json(R"({
            "home_team": {"name": "Hawks", "final_score": 10, "period_scores": [2, 3, 5]},
            "away_team": {"name": "", "final_score": 7},
            "players": [{"name": "A", "fouls": 2, "active": true},
                        {"name": "B", "fouls": 1, "active": true},
                        {"name": "C", "fouls": 3, "active": false}]
        })");

        THEN("Membership tests keys, items and substrings") {
            REQUIRE(holds("'home_team' in data and 'away_team' in data", data));
            REQUIRE(holds("'referee' not in data", data));
            REQUIRE(holds("2 in [1, 2, 3]", data));
            REQUIRE(holds("'awk' in home_team.name", data));
        }

        THEN("get() falls back instead of failing") {
            REQUIRE(holds("data.get('referee', {}).get('name') == None", data));
            REQUIRE(holds("data.get('home_team', {}).get('name') == 'Hawks'", data));
            REQUIRE_FALSE(holds("data.get('home_team', {}).get('name') and data.get('away_team', {}).get('name')",
                                data));
        }

        THEN("Helpers work on lists and projections") {
            REQUIRE(holds("sum(data.get('home_team', {}).get('period_scores', [])) == home_team.final_score", data));
            REQUIRE(holds("sum(players[].fouls) == 6", data));
            REQUIRE(holds("len(players) == 3", data));
            REQUIRE(holds("max(players[].fouls) == 3 and min(players[].fouls) == 1", data));
            REQUIRE(holds("max(1, 5, 3) == 5", data));
            REQUIRE(holds("any(players[].active) and not all(players[].active)", data));
            REQUIRE(holds("abs(-3) == 3", data));
            REQUIRE(holds("players[-1].name == 'C'", data));
        }

        THEN("Comparisons chain") {
            REQUIRE(holds("0 < len(players) <= 3", data));
            REQUIRE_FALSE(holds("0 < len(players) < 3", data));
        }

        THEN("Arithmetic matches the usual numeric rules") {
            REQUIRE(holds("7 / 2 == 3.5", data));
            REQUIRE(holds("-7 % 3 == 2", data));
            REQUIRE(holds("round(2.5) == 2 and round(3.5) == 4", data));
            REQUIRE(holds("round(2.25, 1) == 2.2", data));
            REQUIRE(holds("True + 1 == 2", data));
        }

        THEN("and/or return one of their operands") {
            REQUIRE(eval_predicate("away_team.name or 'unknown'", data).string_value() == "unknown");
            REQUIRE(eval_predicate("home_team.name and 42", data).int_value() == 42);
        }

        THEN("Missing keys raise a missing field error") {
            REQUIRE_THROWS_AS(eval_predicate("home_team.coach == 'X'", data), plx_missing_field_error);
            REQUIRE_THROWS_AS(eval_predicate("referee", data), plx_missing_field_error);
            REQUIRE_THROWS_AS(eval_predicate("data['referee']", data), plx_missing_field_error);
        }

        THEN("Type errors raise expression errors") {
            REQUIRE_THROWS_AS(eval_predicate("home_team.name + 1", data), plx_expression_error);
            REQUIRE_THROWS_AS(eval_predicate("len(home_team.final_score)", data), plx_expression_error);
            REQUIRE_THROWS_AS(eval_predicate("players[7]", data), plx_expression_error);
        }
    }
}

SCENARIO("Integer arithmetic keeps going past the int range") {
    GIVEN("Values near the limits of a 64 bit integer") {
        plxv_map data = data_from_json(R"({
            "a": 9000000000000000000,
            "lowest": -9223372036854775808,
            "huge": 1e300
        })");

        THEN("Overflowing sums and products continue as floats") {
            REQUIRE(holds("a * 10 > 0", data));
            REQUIRE(holds("a + a > a", data));
            REQUIRE(holds("-a - a < 0", data));
            REQUIRE(holds("sum([a, a, a]) > a", data));
            REQUIRE(eval_predicate("a * 10", data).is_double());
            REQUIRE(eval_predicate("a + a", data).double_value() == Catch::Approx(1.8e19));
        }

        THEN("Results that fit stay integers") {
            plx_variant value = eval_predicate("a - a + 7", data);
            REQUIRE(value.is_int());
            REQUIRE(value.int_value() == 7);
        }

        THEN("Negating the lowest integer does not wrap") {
            REQUIRE(holds("abs(lowest) > 0", data));
            REQUIRE(holds("-lowest > 0", data));
            REQUIRE(holds("lowest % -1 == 0", data));
        }

        THEN("round() of a huge float stays a float") {
            REQUIRE(holds("round(huge) > 0", data));
            REQUIRE(eval_predicate("round(huge)", data).is_double());
            REQUIRE(eval_predicate("round(2.5)", data).is_int());
        }
    }
}

SCENARIO("Predicates cannot reach beyond the data and helpers") {
    plxv_map data;

    REQUIRE_THROWS_AS(plx_expr_parser::parse_predicate("__import__('os')"), plx_expression_error);
    REQUIRE_THROWS_AS(plx_expr_parser::parse_predicate("open('/etc/passwd')"), plx_expression_error);
    REQUIRE_THROWS_AS(plx_expr_parser::parse_predicate("data.keys()"), plx_expression_error);
    REQUIRE_THROWS_AS(plx_expr_parser::parse_predicate("lambda x: x"), plx_expression_error);
    REQUIRE_THROWS_AS(plx_expr_parser::parse_predicate("{'a': 1}"), plx_expression_error);
    REQUIRE_THROWS_AS(plx_expr_parser::parse_predicate("'unterminated"), plx_expression_error);
    REQUIRE_THROWS_AS(eval_predicate("sum", data), plx_missing_field_error);
}
