#include <catch2/catch_all.hpp>
#include <processors/plx_executor.h>
#include <processors/plx_errors.h>
#include <api/json/plx_json.h>
#include "shared/plx_test_fixtures.h"
#include <filesystem>

using namespace plx::processors;

static const plxv_map& team_of(const plx_execution_result& result) {
    return result.data.at("team").map_value();
}

SCENARIO("Executing a processor over a layout") {
    GIVEN("The box score layout and processor") {
        plx_layout_document layout;
        build_box_score(layout);
        plx_processor processor;
        build_box_score_processor(processor);
        plx_executor executor(std::make_shared<plx_layout_json_sio>());

        WHEN("Executing") {
            plx_execution_result result = executor.execute(layout, processor);

            THEN("Player records are built from the table columns") {
                const plxv_vector& players = team_of(result).at("players").vector_value();
                REQUIRE(players.size() == 2);
                REQUIRE(players[0].map_value().at("name").string_value() == "John");
                REQUIRE(players[0].map_value().at("points").int_value() == 10);
                REQUIRE(players[0].map_value().at("fouls").string_value() == "2");
                REQUIRE(players[1].map_value().at("name").string_value() == "Mary");
                REQUIRE(players[1].map_value().at("points").int_value() == 8);
                REQUIRE(players[1].map_value().at("fouls").string_value() == "");
            }

            THEN("The anchor value lands next to the records") {
                REQUIRE(team_of(result).at("total_points").int_value() == 18);
            }

            THEN("The run is clean") {
                REQUIRE(result.validation.success);
                REQUIRE(result.validation.warnings.empty());
            }
        }

        WHEN("Executing twice") {
            plx_string first = plx_json::dump(executor.execute(layout, processor).to_map(), 2);
            plx_string second = plx_json::dump(executor.execute(layout, processor).to_map(), 2);

            THEN("Both runs give the same output") {
                REQUIRE(first == second);
            }
        }

        WHEN("Calculations and validations are declared") {
            processor.add_calculation("team.points_check", "sum(team.players[].points)");
            processor.add_validation("Points add up", "team.points_check == team.total_points");
            processor.add_validation("Everyone fouled", "all(team.players[].fouls)", "warning");
            plx_execution_result result = executor.execute(layout, processor);

            THEN("The calculation sees the extracted records") {
                REQUIRE(team_of(result).at("points_check").int_value() == 18);
            }

            THEN("Validation results are reported by severity") {
                REQUIRE(result.validation.success);
                REQUIRE(result.validation.errors.empty());
                REQUIRE(result.validation.warnings.size() == 1);
                REQUIRE(result.validation.warnings[0] == "Validation failed: Everyone fouled");
            }
        }

        WHEN("Steps degrade along the way") {
            processor.add_anchor("referee", "Referee", "contains", false);
            processor.add_extraction_op("game.referee", "anchor.referee");
            processor.add_calculation("team.ratio", "sum(team.players[].points) / 0");
            processor.add_validation("Has players", "len(team.players) == 2");
            plx_execution_result result = executor.execute(layout, processor);

            THEN("Their warnings follow the validation results") {
                REQUIRE(result.validation.success);
                REQUIRE(result.validation.warnings.size() == 3);
                REQUIRE(result.validation.warnings[0].contains("referee"));
                REQUIRE(result.validation.warnings[2].contains("sum(team.players[].points) / 0"));
            }

            THEN("The rest of the output is still produced") {
                REQUIRE(team_of(result).at("total_points").int_value() == 18);
                REQUIRE(result.data.count("game") == 0);
                REQUIRE(team_of(result).count("ratio") == 0);
            }
        }

        WHEN("A required anchor is missing") {
            processor.add_anchor("coach", "Head Coach");

            THEN("Execution stops naming the anchor") {
                REQUIRE_THROWS_AS(executor.execute(layout, processor), plx_missing_anchor_error);
                try {
                    executor.execute(layout, processor);
                } catch (const plx_missing_anchor_error& e) {
                    REQUIRE(e.get_anchor_name() == "coach");
                }
            }
        }

        WHEN("The result is serialized") {
            plxv_map map = executor.execute(layout, processor).to_map();

            THEN("It has a data and a validation part") {
                REQUIRE(map["data"].is_map());
                REQUIRE(map["validation"].map_value().at("success").bool_value());
            }
        }
    }
}

SCENARIO("Executing over a layout read through the provider") {
    GIVEN("A box score layout stored as JSON") {
        plx_layout_document layout;
        build_box_score(layout);
        auto provider = std::make_shared<plx_layout_json_sio>();
        std::string path = "/tmp/plx_executor_box_score.json";
        REQUIRE(provider->write(path, layout));

        plx_processor processor;
        build_box_score_processor(processor);
        plx_executor executor(provider);

        THEN("The stored layout gives the same output as the one in memory") {
            plx_string from_file = plx_json::dump(executor.execute_source(path, processor).to_map());
            plx_string in_memory = plx_json::dump(executor.execute(layout, processor).to_map());
            REQUIRE(from_file == in_memory);
        }

        THEN("An unreadable source is a layout error") {
            REQUIRE_THROWS_AS(executor.execute_source("/tmp/plx_no_such_layout.json", processor), plx_layout_error);
        }

        THEN("Without a provider nothing can be read") {
            plx_executor detached(nullptr);
            REQUIRE_THROWS_AS(detached.execute_source(path, processor), plx_layout_error);
        }

        std::filesystem::remove(path);
    }
}
