#include <catch2/catch_all.hpp>
#include <processors/plx_calculation_engine.h>
#include <processors/plx_path_writer.h>

using namespace plx::processors;
using Catch::Approx;

static plxv_vector list_of(std::initializer_list<plx_variant> items) {
    return plxv_vector(items);
}

SCENARIO("Calculations derive fields from extracted records") {
    GIVEN("A team with rebound and foul columns") {
        plxv_map tree;
        plx_path_writer::write(tree, "team.players[].name", list_of({"A", "B", "C"}));
        plx_path_writer::write(tree, "team.players[].fouls", list_of({2, 4, 3}));
        plx_path_writer::write(tree, "team.players[].oreb", list_of({"3", "5", "4"}));
        plx_path_writer::write(tree, "team.players[].dreb", list_of({4, 6, 5}));
        plx_execution_log log;

        THEN("sum adds up a field over the records") {
            plx_variant result;
            REQUIRE(plx_calculation_engine::evaluate("sum(team.players[].fouls)", tree, result, log));
            REQUIRE(result.is_int());
            REQUIRE(result.int_value() == 9);
        }

        THEN("Sums combine arithmetically and numeric strings count") {
            plx_variant result;
            REQUIRE(plx_calculation_engine::evaluate("sum(team.players[].oreb) + sum(team.players[].dreb)",
                                                     tree, result, log));
            REQUIRE(result.int_value() == 27);
        }

        THEN("Fractional results stay floating point") {
            plx_variant result;
            REQUIRE(plx_calculation_engine::evaluate("sum(team.players[].fouls) / 2", tree, result, log));
            REQUIRE(result.is_double());
            REQUIRE(result.double_value() == Approx(4.5));
        }

        THEN("A missing field is counted as zero with a warning") {
            plx_variant result;
            REQUIRE(plx_calculation_engine::evaluate("sum(team.players[].steals)", tree, result, log));
            REQUIRE(result.int_value() == 0);
            REQUIRE(log.get_warnings().size() == 3);
        }

        THEN("Division by zero is rejected and leaves the result alone") {
            plx_variant result = plx_variant("untouched");
            REQUIRE_FALSE(plx_calculation_engine::evaluate("sum(team.players[].fouls) / 0", tree, result, log));
            REQUIRE(result.string_value() == "untouched");
            REQUIRE(log.get_warnings().size() == 1);
        }

        THEN("Formulas outside the grammar are rejected") {
            plx_variant result;
            REQUIRE_FALSE(plx_calculation_engine::evaluate("__import__('os')", tree, result, log));
            REQUIRE_FALSE(plx_calculation_engine::evaluate("sum(team.players[].fouls", tree, result, log));
            REQUIRE(log.get_warnings().size() == 2);
        }

        WHEN("Applying a calculation") {
            plx_calculation calc;
            calc.field = "team.total_fouls";
            calc.formula = "sum(team.players[].fouls)";
            bool applied = plx_calculation_engine::apply(tree, calc, log);

            THEN("The result is written at the target path") {
                REQUIRE(applied);
                REQUIRE(tree["team"].map_value().at("total_fouls").int_value() == 9);
            }
        }

        WHEN("The target path runs into a scalar") {
            plx_calculation calc;
            calc.field = "team.players[].name.first";
            calc.formula = "1 + 1";
            bool applied = plx_calculation_engine::apply(tree, calc, log);

            THEN("Nothing is written and a warning is logged") {
                REQUIRE_FALSE(applied);
                REQUIRE(log.get_warnings().size() == 1);
            }
        }
    }
}
