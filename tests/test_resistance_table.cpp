#include <catch2/catch.hpp>
#include "ripsim/succession/resistance_table.hpp"

#include <sstream>

using namespace ripsim;
using Catch::Detail::Approx;

TEST_CASE("ResistanceTable in memory", "[table]") {
    ResistanceTable table({{2, 5.0}, {3, 2.0}});

    REQUIRE(table.size() == 2);
    REQUIRE(table.contains(2));
    REQUIRE_FALSE(table.contains(4));
    REQUIRE(table.threshold(3) == 2.0);
    REQUIRE_THROWS_AS(table.threshold(4), std::out_of_range);
    REQUIRE_FALSE(table.has_roughness(2));

    table.set(4, 9.5, 0.035);
    REQUIRE(table.codes() == std::vector<int>{2, 3, 4});
    REQUIRE(table.roughness(4) == 0.035);
    REQUIRE_THROWS_AS(table.roughness(2), std::out_of_range);
}

TEST_CASE("ResistanceTable reads the second Code column", "[table]") {
    // The first "Code" column is a landscape-unit code; the second one
    // holds vegetation classes and is addressed as "Code.1"
    std::istringstream in(
        "Code,Landscape unit,Code,Vegetation,shear_resis,n_val\n"
        "1,Channel,0,Bare,0,0.03\n"
        "2,Bar,2,Willow,\"5.5\",0.08\n"
        ",,3,Cottonwood,12,\n"
        "\n");
    ResistanceTable table = ResistanceTable::parse_csv(in, TableConfig());

    REQUIRE(table.codes() == std::vector<int>{0, 2, 3});
    REQUIRE(table.threshold(2) == Approx(5.5));
    REQUIRE(table.threshold(3) == Approx(12.0));
    REQUIRE(table.roughness(2) == Approx(0.08));
    REQUIRE(table.has_roughness(0));
    REQUIRE_FALSE(table.has_roughness(3));
}

TEST_CASE("ResistanceTable delimiter detection", "[table]") {
    TableConfig config;
    config.code_column = "Code";

    SECTION("semicolon") {
        std::istringstream in("Code;shear_resis\n7;1.5\n");
        auto table = ResistanceTable::parse_csv(in, config);
        REQUIRE(table.threshold(7) == Approx(1.5));
    }

    SECTION("tab") {
        std::istringstream in("Code\tshear_resis\n7\t2.5\n");
        auto table = ResistanceTable::parse_csv(in, config);
        REQUIRE(table.threshold(7) == Approx(2.5));
    }
}

TEST_CASE("ResistanceTable malformed input", "[table]") {
    SECTION("missing code column") {
        std::istringstream in("Code,shear_resis\n1,2\n");
        REQUIRE_THROWS_AS(ResistanceTable::parse_csv(in, TableConfig()), FormatError);
    }

    SECTION("duplicate resistance column") {
        std::istringstream in("Code,Code,shear_resis,shear_resis\n1,2,3,4\n");
        REQUIRE_THROWS_AS(ResistanceTable::parse_csv(in, TableConfig()), FormatError);
    }

    SECTION("non-integer code") {
        std::istringstream in("Code,Code,shear_resis\n1,2.5,3\n");
        REQUIRE_THROWS_AS(ResistanceTable::parse_csv(in, TableConfig()), FormatError);
    }

    SECTION("non-numeric threshold") {
        std::istringstream in("Code,Code,shear_resis\n1,2,high\n");
        REQUIRE_THROWS_AS(ResistanceTable::parse_csv(in, TableConfig()), FormatError);
    }

    SECTION("empty input") {
        std::istringstream in("");
        REQUIRE_THROWS_AS(ResistanceTable::parse_csv(in, TableConfig()), FormatError);
    }
}

TEST_CASE("Column name helpers", "[table]") {
    auto cells = table_io::split_row(" a , \"b,c\" ,d\r", ',');
    REQUIRE(cells == std::vector<std::string>{"a", "b,c", "d"});

    auto names = table_io::disambiguate_columns({"Code", "x", "Code", "Code"});
    REQUIRE(names == std::vector<std::string>{"Code", "x", "Code.1", "Code.2"});
}
