#include <catch2/catch_all.hpp>
#include <processors/plx_field_extractor.h>
#include "shared/plx_test_fixtures.h"
#include <cmath>

using namespace plx::processors;
using Catch::Approx;

// Resolves the box score and runs one op of its processor
struct box_score_run {
    plx_layout_document layout;
    plx_processor processor;
    plx_execution_log log;
    plx_anchor_map anchors;
    plx_region_map regions;

    box_score_run() {
        build_box_score(layout);
        build_box_score_processor(processor);
        anchors = plx_anchor_resolver(plx_engine_config()).resolve(layout, processor.anchors, log);
        regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);
    }

    plx_variant run(size_t op_index) {
        plx_field_extractor extractor((plx_engine_config()));
        return extractor.extract(layout, regions, anchors, processor, processor.extraction_ops.at(op_index), log);
    }

    plx_variant run(const plx_string& field_path, const plx_string& source, const plx_string& transform = "") {
        plx_extraction_op op;
        op.field_path = field_path;
        op.source = source;
        if (!transform.empty()) {
            op.transform = transform;
        }
        plx_field_extractor extractor((plx_engine_config()));
        return extractor.extract(layout, regions, anchors, processor, op, log);
    }
};

static plxv_vector strings(std::initializer_list<const char*> items) {
    plxv_vector result;
    for (const char* item : items) {
        result.push_back(plx_variant(item));
    }
    return result;
}

SCENARIO("Table columns are read positionally") {
    GIVEN("The box score") {
        box_score_run box;

        THEN("The name column lists every player row") {
            plx_variant names = box.run(0);
            REQUIRE(names.is_vector());
            REQUIRE(names.vector_value() == strings({"John", "Mary"}));
        }

        THEN("The points column is converted to integers") {
            plx_variant points = box.run(1);
            REQUIRE(points.is_vector());
            REQUIRE(points.vector_value().size() == 2);
            REQUIRE(points.vector_value()[0].is_int());
            REQUIRE(points.vector_value()[0].int_value() == 10);
            REQUIRE(points.vector_value()[1].int_value() == 8);
        }

        THEN("The field mapping corrects a wrong column index") {
            plx_variant fouls = box.run(2);
            REQUIRE(fouls.is_vector());
            REQUIRE(fouls.vector_value().size() == 2);
            REQUIRE(fouls.vector_value()[0].string_value() == "2");
        }

        THEN("A missing cell keeps its row as an empty string") {
            plx_variant fouls = box.run(2);
            REQUIRE(fouls.vector_value()[1].string_value() == "");
        }

        THEN("A scalar path takes the first data row") {
            plx_variant first = box.run("team.leader", "region.player_table.column[0]");
            REQUIRE(first.is_string());
            REQUIRE(first.string_value() == "John");
        }

        THEN("A column past the last header is logged and yields nothing") {
            size_t before = box.log.get_warnings().size();
            plx_variant missing = box.run("team.players[].extra", "region.player_table.column[7]");
            REQUIRE(missing.is_null());
            REQUIRE(box.log.get_warnings().size() == before + 1);
        }

        THEN("The region text joins all of its blocks") {
            plx_variant text = box.run("raw", "region.player_table");
            REQUIRE(text.string_value().starts_with("Name Pts Fouls John"));
        }
    }
}

SCENARIO("A split end anchor still closes the table") {
    GIVEN("The box score with TOTALS TEAM as two blocks") {
        plx_layout_document layout;
        build_box_score(layout);
        add_block(layout, "t3", "TEAM", 0.16, 0.30, 0.22, 0.32);

        plx_processor processor;
        processor.add_anchor("players", "PLAYERS");
        processor.add_anchor("hdr_name", "Name", "exact").role = "name_column";
        processor.add_anchor("hdr_pts", "Pts", "exact").role = "column";
        processor.add_anchor("hdr_fouls", "Fouls", "exact").role = "column";
        processor.add_anchor("totals", "TOTALS TEAM");
        processor.add_region("player_table", "players", "totals").region_type = "table";
        processor.add_extraction_op("team.players[].name", "region.player_table.column[0]");
        processor.add_extraction_op("team.players[].points", "region.player_table.column[1]", "to_int");

        plx_execution_log log;
        plx_anchor_map anchors = plx_anchor_resolver(plx_engine_config()).resolve(layout, processor.anchors, log);
        plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);
        plx_field_extractor extractor((plx_engine_config()));

        THEN("The end anchor is a chained match outside the region blocks") {
            const plx_layout_text* end = anchors.find("totals");
            REQUIRE(end != nullptr);
            REQUIRE(end->text.value() == "TOTALS TEAM");
            REQUIRE(anchors.synthetic.size() == 1);
        }

        THEN("The totals row is not read as a player") {
            plx_variant names = extractor.extract(layout, regions, anchors, processor,
                                                  processor.extraction_ops.at(0), log);
            REQUIRE(names.vector_value() == strings({"John", "Mary"}));

            plx_variant points = extractor.extract(layout, regions, anchors, processor,
                                                   processor.extraction_ops.at(1), log);
            REQUIRE(points.vector_value().size() == 2);
            REQUIRE(points.vector_value()[0].int_value() == 10);
            REQUIRE(points.vector_value()[1].int_value() == 8);
        }
    }
}

SCENARIO("Values are read right of an anchor") {
    GIVEN("The box score") {
        box_score_run box;

        THEN("value[0] is the nearest number on the anchor's row") {
            plx_variant total = box.run(3);
            REQUIRE(total.is_int());
            REQUIRE(total.int_value() == 18);
        }

        THEN("value[1] is the next one") {
            plx_variant fouls = box.run("team.total_fouls", "anchor.totals.value[1]");
            REQUIRE(fouls.string_value() == "2");
        }

        THEN("An index past the last value yields nothing") {
            REQUIRE(box.run("team.x", "anchor.totals.value[5]").is_null());
        }

        THEN("The anchor text itself is available") {
            REQUIRE(box.run("team.label", "anchor.totals.text").string_value() == "TOTALS");
            REQUIRE(box.run("team.label", "anchor.totals").string_value() == "TOTALS");
        }

        THEN("Literals pass through") {
            REQUIRE(box.run("team.league", "literal:NBA").string_value() == "NBA");
        }

        THEN("Unknown anchors and malformed sources are logged and yield nothing") {
            size_t before = box.log.get_warnings().size();
            REQUIRE(box.run("team.x", "anchor.nowhere.value[0]").is_null());
            REQUIRE(box.run("team.x", "table.players.row[0]").is_null());
            REQUIRE(box.log.get_warnings().size() == before + 2);
        }
    }

    GIVEN("A number far to the right and one on the next line") {
        plx_layout_document layout;
        plx_layout_text& label = add_block(layout, "l", "Attendance", 0.05, 0.50, 0.20, 0.52);
        add_block(layout, "far", "999", 0.90, 0.50, 0.95, 0.52);
        add_block(layout, "below", "123", 0.25, 0.56, 0.30, 0.58);
        add_block(layout, "word", "Arena", 0.25, 0.50, 0.32, 0.52);

        plx_engine_config config;
        config.value_max_distance = 0.3;
        plx_field_extractor extractor(config);

        THEN("Neither is a value of the label") {
            REQUIRE(extractor.values_right_of(layout, label).empty());
        }
    }
}

SCENARIO("Rows and columns are inferred from geometry") {
    plx_field_extractor extractor((plx_engine_config()));

    GIVEN("Blocks with small vertical jitter") {
        plx_layout_document layout;
        add_block(layout, "b", "B", 0.40, 0.205, 0.45, 0.215);
        add_block(layout, "a", "A", 0.10, 0.200, 0.15, 0.210);
        add_block(layout, "c", "C", 0.10, 0.300, 0.15, 0.310);

        plx_row_list rows = extractor.group_rows(layout.all_blocks());

        THEN("Blocks within the row tolerance share a row sorted by x") {
            REQUIRE(rows.size() == 2);
            REQUIRE(rows[0].size() == 2);
            REQUIRE(rows[0][0]->id.value() == "a");
            REQUIRE(rows[0][1]->id.value() == "b");
            REQUIRE(rows[1][0]->id.value() == "c");
        }
    }

    GIVEN("Header markers, two of them nearly on top of each other") {
        plx_layout_document layout;
        add_block(layout, "h0", "Player", 0.08, 0.10, 0.12, 0.12);
        add_block(layout, "h1", "Name", 0.10, 0.10, 0.14, 0.12);
        add_block(layout, "h2", "MIN", 0.48, 0.10, 0.52, 0.12);

        std::vector<plx_column> columns = extractor.infer_columns(layout.all_blocks());

        THEN("Close markers merge into one column keeping both labels") {
            REQUIRE(columns.size() == 2);
            REQUIRE(columns[0].labels.size() == 2);
            REQUIRE(columns[0].center == Approx(0.11));
            REQUIRE(columns[0].matches_label("name", false));
            REQUIRE_FALSE(columns[0].matches_label("name", true));
        }

        THEN("Column boundaries lie halfway between centers") {
            REQUIRE(columns[0].start == 0.0);
            REQUIRE(columns[0].end == Approx(0.305));
            REQUIRE(columns[1].start == Approx(0.305));
            REQUIRE(std::isinf(columns[1].end));
        }

        THEN("The mapping selects a column by label") {
            plx_execution_log log;
            std::map<plx_string, plx_string> mapping = {{"minutes", "min"}, {"fouls", "PF"}};
            REQUIRE(extractor.select_column(columns, "minutes", 0, mapping, log) == 1);
            REQUIRE(log.get_warnings().empty());
            REQUIRE(extractor.select_column(columns, "fouls", 0, mapping, log) == 0);
            REQUIRE(log.get_warnings().size() == 1);
            REQUIRE(extractor.select_column(columns, "points", 1, mapping, log) == 1);
        }
    }

    GIVEN("A region without column markers") {
        plx_layout_document layout;
        add_block(layout, "top", "TEAM", 0.05, 0.05, 0.20, 0.07);
        add_block(layout, "h0", "Player", 0.05, 0.10, 0.15, 0.12);
        add_block(layout, "h1", "Goals", 0.50, 0.10, 0.60, 0.12);
        add_block(layout, "r0", "Smith", 0.05, 0.15, 0.15, 0.17);
        add_block(layout, "r1", "3", 0.50, 0.15, 0.52, 0.17);

        plx_processor processor;
        processor.add_anchor("team", "TEAM");
        processor.add_region("scorers", "team", end_of_document);
        processor.add_extraction_op("scorers[].goals", "region.scorers.column[1]", "to_int");

        plx_execution_log log;
        plx_anchor_map anchors = plx_anchor_resolver(plx_engine_config()).resolve(layout, processor.anchors, log);
        plx_region_map regions = plx_region_resolver::resolve(layout, anchors, processor.regions, log);

        THEN("The first row serves as the header") {
            plx_variant goals = extractor.extract(layout, regions, anchors, processor,
                                                  processor.extraction_ops.at(0), log);
            REQUIRE(goals.is_vector());
            REQUIRE(goals.vector_value().size() == 1);
            REQUIRE(goals.vector_value()[0].int_value() == 3);
        }
    }
}

SCENARIO("Transforms normalize extracted text") {
    plx_execution_log log;

    THEN("to_int and to_float parse or fall back to zero") {
        REQUIRE(plx_field_extractor::apply_transform(plx_variant(" 42 "), "to_int", log).int_value() == 42);
        REQUIRE(plx_field_extractor::apply_transform(plx_variant("DNP"), "to_int", log).int_value() == 0);
        REQUIRE(plx_field_extractor::apply_transform(plx_variant("3.5"), "to_float", log).double_value() == Approx(3.5));
        REQUIRE(plx_field_extractor::apply_transform(plx_variant(""), "to_float", log).double_value() == 0.0);
    }

    THEN("String transforms reshape the text") {
        REQUIRE(plx_field_extractor::apply_transform(plx_variant("  x  "), "strip", log).string_value() == "x");
        REQUIRE(plx_field_extractor::apply_transform(plx_variant("Lakers"), "upper", log).string_value() == "LAKERS");
        REQUIRE(plx_field_extractor::apply_transform(plx_variant("Lakers"), "lower", log).string_value() == "lakers");
        REQUIRE(plx_field_extractor::apply_transform(plx_variant("LeBron James"), "last_name_only", log)
                    .string_value() == "James");
    }

    THEN("Lists are transformed element by element") {
        plx_variant result = plx_field_extractor::apply_transform(plx_variant(strings({"1", "", "7"})), "to_int", log);
        REQUIRE(result.is_vector());
        REQUIRE(result.vector_value()[0].int_value() == 1);
        REQUIRE(result.vector_value()[1].int_value() == 0);
        REQUIRE(result.vector_value()[2].int_value() == 7);
    }

    THEN("Null stays null") {
        REQUIRE(plx_field_extractor::apply_transform(plx_variant(), "to_int", log).is_null());
    }

    THEN("Unknown transforms leave the value unchanged with a warning") {
        plx_variant result = plx_field_extractor::apply_transform(plx_variant("abc"), "reverse", log);
        REQUIRE(result.string_value() == "abc");
        REQUIRE(log.get_warnings().size() == 1);
    }

    THEN("Field names come from the last path segment") {
        REQUIRE(plx_field_extractor::field_name("team.players[].name") == "name");
        REQUIRE(plx_field_extractor::field_name("scorers[]") == "scorers");
        REQUIRE(plx_field_extractor::is_array_path("team.players[].name"));
        REQUIRE_FALSE(plx_field_extractor::is_array_path("team.total_points"));
    }
}
