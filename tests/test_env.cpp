#include <catch2/catch_all.hpp>
#include <utils/plx_env.h>
#include <processors/plx_engine_config.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace plx::processors;
using Catch::Approx;

static void clear_plx_environment() {
    for (const char* key : {"PLX_ROW_TOLERANCE", "PLX_COLUMN_TOLERANCE", "PLX_PROXIMITY_THRESHOLD",
                            "PLX_VALUE_MAX_DISTANCE", "PLX_FINGERPRINT_BLOCKS", "PLX_VERBOSE"}) {
        unsetenv(key);
    }
}

SCENARIO("Engine tolerances come from the environment") {
    GIVEN("No overrides") {
        clear_plx_environment();
        plx_engine_config config = plx_engine_config::from_env();

        THEN("The defaults apply") {
            REQUIRE(config.row_tolerance == Approx(0.015));
            REQUIRE(config.column_tolerance == Approx(0.03));
            REQUIRE(config.proximity_threshold == Approx(0.1));
            REQUIRE(config.value_max_distance == Approx(0.5));
            REQUIRE(config.fingerprint_blocks == 50);
            REQUIRE_FALSE(config.verbose);
        }
    }

    GIVEN("Overrides in the environment") {
        clear_plx_environment();
        setenv("PLX_ROW_TOLERANCE", "0.02", 1);
        setenv("PLX_FINGERPRINT_BLOCKS", "20", 1);
        setenv("PLX_VERBOSE", "true", 1);
        plx_engine_config config = plx_engine_config::from_env();
        clear_plx_environment();

        THEN("They replace the defaults") {
            REQUIRE(config.row_tolerance == Approx(0.02));
            REQUIRE(config.fingerprint_blocks == 20);
            REQUIRE(config.verbose);
            REQUIRE(config.column_tolerance == Approx(0.03));
        }
    }

    GIVEN("Unusable overrides") {
        clear_plx_environment();
        setenv("PLX_COLUMN_TOLERANCE", "wide", 1);
        setenv("PLX_PROXIMITY_THRESHOLD", "-1", 1);
        setenv("PLX_FINGERPRINT_BLOCKS", "0", 1);
        plx_engine_config config = plx_engine_config::from_env();
        clear_plx_environment();

        THEN("The defaults are kept") {
            REQUIRE(config.column_tolerance == Approx(0.03));
            REQUIRE(config.proximity_threshold == Approx(0.1));
            REQUIRE(config.fingerprint_blocks == 50);
        }
    }
}

SCENARIO("Environment files are loaded into the process environment") {
    GIVEN("A .env file with comments and blank lines") {
        std::string path = "/tmp/plx_test.env";
        {
            std::ofstream out(path);
            out << "# engine settings\n"
                << "\n"
                << "PLX_VALUE_MAX_DISTANCE=0.25\n"
                << "PLX_TEST_NAME = box score\n";
        }

        WHEN("Loading it") {
            clear_plx_environment();
            REQUIRE(load_env_file(path));
            plx_engine_config config = plx_engine_config::from_env();

            THEN("Its values are visible to the lookups") {
                REQUIRE(config.value_max_distance == Approx(0.25));
                REQUIRE(env_string("PLX_TEST_NAME", "") == "box score");
                REQUIRE(env_string("PLX_TEST_UNSET", "fallback") == "fallback");
            }

            clear_plx_environment();
            unsetenv("PLX_TEST_NAME");
        }

        std::filesystem::remove(path);
    }

    GIVEN("A missing file") {
        THEN("Loading reports it") {
            REQUIRE_FALSE(load_env_file("/tmp/plx_no_such.env"));
        }
    }
}
