#include <gtest/gtest.h>

#include <string>
#include <type_traits>

#include "api_gazetteer.hpp"
#include "test_support.hpp"

namespace geosuggest {
namespace {

using test_support::kHeader;
using test_support::load_tsv;
using test_support::row;

TEST(GazetteerLoad, parses_fields)
{
    LoadReport report;
    auto g = load_tsv(std::string(kHeader) +
                      row("Montréal", "Montreal, Monreal,,Монреаль", "45.50884", "-73.58781", "3268513", "CA", "10"),
                      report);
    ASSERT_NE(g, nullptr);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.rows, 1u);
    EXPECT_EQ(report.loaded, 1u);
    EXPECT_EQ(report.skipped, 0u);
    EXPECT_GT(report.keys, 0u);

    ASSERT_EQ(g->size(), 1u);
    const PlaceRecord& r = g->record(0);
    EXPECT_EQ(r.name, "Montréal");
    EXPECT_EQ(r.name_norm, "montreal");
    EXPECT_DOUBLE_EQ(r.latitude, 45.50884);
    EXPECT_DOUBLE_EQ(r.longitude, -73.58781);
    EXPECT_EQ(r.population, 3268513u);
    EXPECT_EQ(r.country_code, "CA");
    EXPECT_EQ(r.admin_region, "10");
    ASSERT_EQ(r.aliases.size(), 3u);
    EXPECT_EQ(r.aliases[0], "Montreal");
    EXPECT_EQ(r.aliases[1], "Monreal");
    EXPECT_EQ(r.aliases[2], "Монреаль");
}

TEST(GazetteerLoad, empty_population_means_unknown)
{
    auto g = load_tsv(std::string(kHeader) + row("Nowhere", "", "10", "10", ""));
    ASSERT_NE(g, nullptr);
    ASSERT_EQ(g->size(), 1u);
    EXPECT_EQ(g->record(0).population, 0u);
}

TEST(GazetteerLoad, out_of_range_latitude_is_skipped)
{
    LoadReport report;
    auto g = load_tsv(std::string(kHeader) +
                      row("Toronto", "", "43.70011", "-79.4163", "4612191") +
                      row("Atlantis", "", "200", "-30", "0") +
                      row("Vancouver", "", "49.24966", "-123.11934", "1837969"),
                      report);
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(report.rows, 3u);
    EXPECT_EQ(report.loaded, 2u);
    EXPECT_EQ(report.skipped, 1u);
    ASSERT_EQ(g->size(), 2u);
    EXPECT_EQ(g->record(0).name, "Toronto");
    EXPECT_EQ(g->record(1).name, "Vancouver");
}

TEST(GazetteerLoad, malformed_rows_do_not_abort)
{
    LoadReport report;
    auto g = load_tsv(std::string(kHeader) +
                      row("", "", "10", "10", "5") +            // empty name
                      row("   ", "", "10", "10", "5") +         // blank name
                      row("BadLon", "", "10", "east", "5") +    // non-numeric longitude
                      row("FarLon", "", "10", "181", "5") +     // longitude out of range
                      row("BadLat", "", "x", "10", "5") +       // non-numeric latitude
                      row("NegPop", "", "10", "10", "-5") +     // negative population
                      "Short\t\t10\n" +                          // too few columns
                      row("Good", "", "-90", "180", "1"),
                      report);
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(report.rows, 8u);
    EXPECT_EQ(report.skipped, 7u);
    EXPECT_EQ(report.loaded, 1u);
    ASSERT_EQ(g->size(), 1u);
    EXPECT_EQ(g->record(0).name, "Good");
}

TEST(GazetteerLoad, blank_lines_and_crlf)
{
    LoadReport report;
    std::string body = "name\tlat\tlong\tpopulation\r\n"
                       "London\t51.5\t-0.1\t8000000\r\n"
                       "\r\n"
                       "Paris\t48.85\t2.35\t2100000\r\n";
    auto g = load_tsv(body, report);
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(report.rows, 2u);
    ASSERT_EQ(g->size(), 2u);
    EXPECT_EQ(g->record(1).population, 2100000u);
}

TEST(GazetteerLoad, latin1_rows_are_stored_as_utf8)
{
    LoadReport report;
    auto g = load_tsv(std::string(kHeader) +
                      row("Montr\xE9" "al", "Montr\xE9" "al-Nord", "45.50884", "-73.58781", "3268513", "CA", "Qu\xE9" "bec"),
                      report);
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(report.skipped, 0u);
    ASSERT_EQ(g->size(), 1u);

    const PlaceRecord& r = g->record(0);
    EXPECT_EQ(r.name, "Montréal");
    EXPECT_EQ(r.name_norm, "montreal");
    ASSERT_EQ(r.aliases.size(), 1u);
    EXPECT_EQ(r.aliases[0], "Montréal-Nord");
    EXPECT_EQ(r.admin_region, "Québec");
}

TEST(GazetteerLoad, only_load_builds_catalogs)
{
    static_assert(!std::is_default_constructible<Gazetteer>::value, "catalogs come from load()");
    auto g = load_tsv(test_support::two_londons());
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(g.use_count(), 1);
}

TEST(GazetteerLoad, utf8_bom_in_header)
{
    auto g = load_tsv("\xEF\xBB\xBFname\tlatitude\tlongitude\nOslo\t59.91\t10.75\n");
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(g->size(), 1u);
}

TEST(GazetteerLoad, header_names_are_case_insensitive)
{
    auto g = load_tsv("NAME\tLatitude\tLNG\tPopulation\nOslo\t59.91\t10.75\t700000\n");
    ASSERT_NE(g, nullptr);
    ASSERT_EQ(g->size(), 1u);
    EXPECT_EQ(g->record(0).population, 700000u);
}

TEST(GazetteerLoad, missing_file_is_load_error)
{
    LoadReport report;
    auto g = Gazetteer::load(fs::path("/nonexistent/geosuggest/cities.tsv"), report);
    EXPECT_EQ(g, nullptr);
    EXPECT_FALSE(report.ok());
    EXPECT_NE(report.error.find("cannot open"), std::string::npos);
}

TEST(GazetteerLoad, empty_source_is_load_error)
{
    LoadReport report;
    auto g = load_tsv("", report);
    EXPECT_EQ(g, nullptr);
    EXPECT_FALSE(report.ok());
}

TEST(GazetteerLoad, missing_required_column_is_load_error)
{
    LoadReport report;
    auto g = load_tsv("name\tlat\tpopulation\nLondon\t51.5\t100\n", report);
    EXPECT_EQ(g, nullptr);
    EXPECT_NE(report.error.find("longitude"), std::string::npos);
}

TEST(GazetteerLoad, header_only_gives_empty_catalog)
{
    LoadReport report;
    auto g = load_tsv(kHeader, report);
    ASSERT_NE(g, nullptr);
    EXPECT_TRUE(g->empty());
    EXPECT_TRUE(g->index().empty());
}

TEST(GazetteerLoad, geonames_sample_file)
{
    LoadReport report;
    auto g = Gazetteer::load(fs::path(GEOSUGGEST_DATA_DIR) / "cities_canada-usa.tsv", report);
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(report.skipped, 0u);
    EXPECT_EQ(report.loaded, 12u);

    // ascii, alt_name, lat, long, country and admin1 columns are picked up
    const PlaceRecord& london = g->record(0);
    EXPECT_EQ(london.name, "London");
    EXPECT_EQ(london.country_code, "CA");
    EXPECT_EQ(london.admin_region, "08");
    EXPECT_DOUBLE_EQ(london.latitude, 42.98339);
    EXPECT_EQ(london.population, 346765u);
    EXPECT_EQ(london.aliases.size(), 4u);
}

} // namespace
} // namespace geosuggest
