#include <catch2/catch_all.hpp>
#include <processors/plx_processor_loader.h>
#include <processors/plx_errors.h>
#include "shared/plx_test_fixtures.h"
#include <filesystem>
#include <fstream>

using namespace plx::processors;

static const char* const hockey_processor = R"({
  "id": "proc-nhl-1",
  "name": "NHL game sheet",
  "document_type": "hockey_box_score",
  "layout_hash": "0f3a",
  "text_patterns": ["GAME SHEET"],
  "anchors": [
    {"name": "title", "patterns": ["GAME SHEET", "Official Game Sheet"], "pattern_type": "contains",
     "location_hint": "top_third"},
    {"name": "scoring", "patterns": ["SCORING"], "required": true},
    {"name": "penalties", "patterns": ["PENALTIES"], "required": false}
  ],
  "regions": [
    {"name": "goals", "start_anchor": "scoring", "end_anchor": "penalties", "region_type": "table"}
  ],
  "extraction_ops": [
    {"field_path": "goals[].scorer", "source": "region.goals.column[1]", "transform": "last_name_only"}
  ],
  "calculations": [],
  "validations": [
    {"name": "Some goals", "check": "len(goals) > 0", "severity": "warning"}
  ],
  "field_column_mapping": {"scorer": "Scorer"},
  "template": "{{ goals }}",
  "version": 3
})";

SCENARIO("Processors are loaded from their JSON form") {
    GIVEN("A valid processor definition") {
        plx_processor processor;
        plx_processor_loader::load_json(hockey_processor, processor);

        THEN("All sections are available") {
            REQUIRE(processor.id.value() == "proc-nhl-1");
            REQUIRE(processor.display_name() == "NHL game sheet");
            REQUIRE(processor.version.value() == 3);
            REQUIRE(processor.anchors.size() == 3);
            REQUIRE(processor.anchors.at(0).pattern_list().size() == 2);
            REQUIRE(processor.anchors.at(0).hint_or_default() == "top_third");
            REQUIRE_FALSE(processor.anchors.at(2).is_required());
            REQUIRE(processor.regions.at(0).end_anchor.value() == "penalties");
            REQUIRE(processor.extraction_ops.at(0).transform.value() == "last_name_only");
            REQUIRE(processor.validations.at(0).is_error() == false);
            REQUIRE(processor.column_mapping().at("scorer") == "Scorer");
            REQUIRE(processor.template_text.value() == "{{ goals }}");
        }

        THEN("Defaults fill the omitted fields") {
            REQUIRE(processor.anchors.at(1).type_or_default() == "contains");
            REQUIRE(processor.anchors.at(1).role_or_default() == "landmark");
            REQUIRE(processor.anchors.at(1).is_required());
        }

        THEN("The processor has no findings") {
            REQUIRE(plx_processor_loader::check(processor).empty());
        }

        WHEN("It is written back and read again") {
            plx_string text = plx_processor_loader::to_json(processor);
            plx_processor reloaded;
            plx_processor_loader::load_json(text, reloaded);

            THEN("Nothing is lost") {
                REQUIRE(reloaded.same_data(processor));
                REQUIRE(text.contains("\"template\""));
            }
        }
    }

    GIVEN("Text that is not a JSON object") {
        plx_processor processor;

        THEN("Loading is rejected") {
            REQUIRE_THROWS_AS(plx_processor_loader::load_json("[1, 2]", processor), plx_processor_error);
            REQUIRE_THROWS_AS(plx_processor_loader::load_json("{\"anchors\": [", processor), plx_processor_error);
        }
    }

    GIVEN("A file that does not exist") {
        plx_processor processor;

        THEN("Loading is rejected") {
            REQUIRE_THROWS_AS(plx_processor_loader::load_file("/tmp/plx_no_such_processor.json", processor),
                              plx_processor_error);
        }
    }

    GIVEN("A processor file on disk") {
        std::string path = "/tmp/plx_loader_processor.json";
        {
            std::ofstream out(path);
            out << hockey_processor;
        }
        plx_processor processor;
        plx_processor_loader::load_file(path, processor);
        std::filesystem::remove(path);

        THEN("It loads like the text") {
            REQUIRE(processor.regions.size() == 1);
        }
    }
}

SCENARIO("Processors are checked for integrity") {
    GIVEN("A region that references an undeclared anchor") {
        plx_processor processor;
        processor.name = "Broken";
        processor.add_anchor("start", "START");
        processor.add_region("body", "start", "finish");
        processor.regions.at(0).header_anchors.value().push_back(plx_variant("hdr"));

        THEN("The check lists every dangling reference") {
            try {
                plx_processor_loader::check(processor);
                FAIL("no exception");
            } catch (const plx_processor_error& e) {
                REQUIRE(e.get_problems().size() == 2);
                REQUIRE(e.get_problems()[0] == "Region 'body' references undeclared end_anchor 'finish'");
                REQUIRE(plx_string(e.what()).contains("Broken"));
            }
        }
    }

    GIVEN("A region that runs to the end of the document") {
        plx_processor processor;
        processor.add_anchor("start", "START");
        processor.add_region("rest", "start", end_of_document);

        THEN("No end anchor is needed") {
            REQUIRE_NOTHROW(plx_processor_loader::check(processor));
        }
    }

    GIVEN("Questionable but loadable definitions") {
        plx_processor processor;
        build_box_score_processor(processor);
        processor.add_anchor("totals", "Total", "fuzzy");
        processor.anchors.at(0).location_hint = "middle";
        processor.add_extraction_op("team.coach", "table.coaches.row[0]");
        processor.add_calculation("team.x", "len(team.players)");
        processor.add_validation("Odd", "team.total_points >", "info");

        std::vector<plx_string> findings = plx_processor_loader::check(processor);

        THEN("Each problem is a finding") {
            REQUIRE(findings.size() == 7);
            REQUIRE(findings[0] == "Anchor 'players' has unknown location_hint 'middle'");
            REQUIRE(findings[1] == "Anchor 'totals' is declared twice, the first one wins");
            REQUIRE(findings[2] == "Anchor 'totals' has unknown pattern_type 'fuzzy'");
            REQUIRE(findings[3].starts_with("Extraction for 'team.coach'"));
            REQUIRE(findings[4].starts_with("Calculation for 'team.x'"));
            REQUIRE(findings[5] == "Validation 'Odd' has unknown severity 'info', treated as warning");
            REQUIRE(findings[6].starts_with("Validation 'Odd': "));
        }
    }
}
