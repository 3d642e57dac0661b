#include <catch2/catch_all.hpp>
#include <processors/plx_region_resolver.h>
#include "shared/plx_test_fixtures.h"

using namespace plx::processors;

static std::vector<plx_string> ids_of(const plx_text_refs& blocks) {
    std::vector<plx_string> ids;
    for (const plx_layout_text* block : blocks) {
        ids.push_back(block->id.value());
    }
    return ids;
}

SCENARIO("Regions span the blocks between two anchors") {
    GIVEN("The box score layout with its anchors resolved") {
        plx_layout_document layout;
        build_box_score(layout);
        plx_processor processor;
        build_box_score_processor(processor);

        plx_execution_log log;
        plx_anchor_map anchors = plx_anchor_resolver(plx_engine_config()).resolve(layout, processor.anchors, log);

        WHEN("Resolving the player table") {
            plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);

            THEN("It starts below the start anchor and includes the end anchor row") {
                REQUIRE(regions.count("player_table") == 1);
                std::vector<plx_string> ids = ids_of(regions["player_table"]);
                std::vector<plx_string> expected = {"h0", "h1", "h2", "r0", "r1", "r2", "r3", "r4", "t0", "t1", "t2"};
                REQUIRE(ids == expected);
            }

            THEN("No warnings are logged") {
                REQUIRE(log.get_warnings().empty());
            }
        }

        WHEN("The region runs to the end of the document") {
            plx_region region;
            region.name = "rest";
            region.start_anchor = "hdr_name";
            region.end_anchor = end_of_document;
            add_block(layout, "other_page", "Coach", 0.05, 0.50, 0.20, 0.52, 1);

            plx_text_refs blocks;
            bool bounded = plx_region_resolver::resolve_region(layout, anchors, region, blocks, log);

            THEN("It covers the rest of the start anchor's page") {
                REQUIRE(bounded);
                std::vector<plx_string> ids = ids_of(blocks);
                std::vector<plx_string> expected = {"r0", "r1", "r2", "r3", "r4", "t0", "t1", "t2"};
                REQUIRE(ids == expected);
            }
        }
    }

    GIVEN("Anchors on different pages") {
        plx_layout_document layout;
        plx_layout_text& start = add_block(layout, "s", "Start", 0.1, 0.1, 0.2, 0.12, 0);
        add_block(layout, "mid", "Body", 0.1, 0.5, 0.2, 0.52, 0);
        plx_layout_text& end = add_block(layout, "e", "End", 0.1, 0.2, 0.2, 0.22, 1);

        plx_anchor_map anchors;
        anchors.blocks["start"] = &start;
        anchors.blocks["end"] = &end;

        plx_processor processor;
        processor.add_region("spanning", "start", "end");
        plx_execution_log log;

        WHEN("Resolving") {
            plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);

            THEN("The region is left out with a warning") {
                REQUIRE(regions.empty());
                REQUIRE(log.get_warnings().size() == 1);
                REQUIRE(log.get_warnings()[0].contains("different pages"));
            }
        }
    }

    GIVEN("A region whose end anchor was not found") {
        plx_layout_document layout;
        plx_layout_text& start = add_block(layout, "s", "Start", 0.1, 0.1, 0.2, 0.12);
        plx_anchor_map anchors;
        anchors.blocks["start"] = &start;

        plx_processor processor;
        processor.add_region("open", "start", "missing");
        plx_execution_log log;

        THEN("It is left out with a warning naming the anchor") {
            plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);
            REQUIRE(regions.empty());
            REQUIRE(log.get_warnings().size() == 1);
            REQUIRE(log.get_warnings()[0].contains("missing"));
        }
    }

    GIVEN("Blocks on the same line listed out of order") {
        plx_layout_document layout;
        plx_layout_text& start = add_block(layout, "s", "Start", 0.1, 0.1, 0.2, 0.12);
        add_block(layout, "right", "B", 0.6, 0.3, 0.7, 0.32);
        add_block(layout, "left", "A", 0.1, 0.3, 0.2, 0.32);
        add_block(layout, "upper", "C", 0.4, 0.2, 0.5, 0.22);
        plx_layout_text& end = add_block(layout, "e", "End", 0.1, 0.4, 0.2, 0.42);

        plx_anchor_map anchors;
        anchors.blocks["start"] = &start;
        anchors.blocks["end"] = &end;
        plx_processor processor;
        processor.add_region("body", "start", "end");
        plx_execution_log log;

        THEN("The region is sorted top to bottom then left to right") {
            plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);
            std::vector<plx_string> expected = {"upper", "left", "right", "e"};
            REQUIRE(ids_of(regions["body"]) == expected);
        }
    }
}
