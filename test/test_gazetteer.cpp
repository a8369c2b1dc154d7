#include <geotagger/geocode/location_resolver.hpp>
#include <geotagger/io/country_fields_json.hpp>
#include <geotagger/io/gazetteer.hpp>

#include <geotagger/geo_math/geo_math.hpp>

#include <gtest/gtest.h>

#include <random>

using namespace geotagger;

TEST(gazetteer, loads_fixture)
{
    GazetteerPlaceLookup gazetteer;

    ASSERT_TRUE(gazetteer.load(TEST_DATA_DIR "gazetteer.json"));

    // THEN: the place without coordinates is skipped
    EXPECT_EQ(gazetteer.size(), 3u);
}

TEST(gazetteer, finds_nearest_place)
{
    GazetteerPlaceLookup gazetteer;
    ASSERT_TRUE(gazetteer.load(TEST_DATA_DIR "gazetteer.json"));

    // WHEN: looking up a point on Table Mountain
    LocationRecord record = gazetteer.location(-33.958, 18.404);

    // THEN: it is Cape Town
    EXPECT_EQ(record.country_code, "ZA");
    EXPECT_EQ(record.locality.at("city"), "Cape Town");
    EXPECT_EQ(gazetteer.countryName("ZA"), "South Africa");
    EXPECT_EQ(gazetteer.timezone(Position{-33.958, 18.404, std::nullopt}), "Africa/Johannesburg");

    // AND: a point in Kent is Canterbury
    EXPECT_EQ(gazetteer.location(51.3, 1.1).locality.at("county"), "Kent");
}

TEST(gazetteer, unknown_country_code_is_returned_as_is)
{
    GazetteerPlaceLookup gazetteer;
    EXPECT_EQ(gazetteer.countryName("XX"), "XX");
}

TEST(gazetteer, empty_gazetteer_throws)
{
    GazetteerPlaceLookup gazetteer;
    EXPECT_THROW(gazetteer.location(0, 0), std::runtime_error);
    EXPECT_THROW(gazetteer.timezone(Position{}), std::runtime_error);
}

TEST(gazetteer, rejects_bad_documents)
{
    GazetteerPlaceLookup gazetteer;

    EXPECT_FALSE(gazetteer.parse("[]"));
    EXPECT_FALSE(gazetteer.parse("{\"version\": 2, \"places\": []}"));
    EXPECT_FALSE(gazetteer.parse("{\"version\": 1}"));
    EXPECT_FALSE(gazetteer.load(TEST_DATA_DIR "no_such_gazetteer.json"));
    EXPECT_EQ(gazetteer.size(), 0u);
}

TEST(gazetteer, added_places)
{
    GazetteerPlaceLookup gazetteer;
    GazetteerPlace place;
    place.latitude = 10;
    place.longitude = 10;
    place.record.country_code = "QQ";
    gazetteer.addPlace(place);
    gazetteer.addCountry("QQ", "Qqland");

    EXPECT_EQ(gazetteer.location(11, 11).country_code, "QQ");
    EXPECT_EQ(gazetteer.countryName("QQ"), "Qqland");
}

TEST(gazetteer, nearest_matches_great_circle_search)
{
    // GIVEN: a few hundred places scattered over the globe
    std::mt19937 gen(7);
    std::uniform_real_distribution<double> lat(-85, 85), lon(-180, 180);
    GazetteerPlaceLookup gazetteer;
    std::vector<GazetteerPlace> places;
    for (int i = 0; i < 300; i++)
    {
        GazetteerPlace place;
        place.latitude = lat(gen);
        place.longitude = lon(gen);
        place.record.country_code = std::to_string(i);
        places.push_back(place);
        gazetteer.addPlace(place);
    }

    // WHEN: looking up random points
    for (int q = 0; q < 100; q++)
    {
        const double qlat = lat(gen), qlon = lon(gen);
        const GazetteerPlace *best = &places.front();
        for (const auto &place : places)
        {
            if (distance(qlat, qlon, place.latitude, place.longitude) <
                distance(qlat, qlon, best->latitude, best->longitude))
            {
                best = &place;
            }
        }

        // THEN: the indexed lookup finds the place closest by great-circle distance
        EXPECT_EQ(gazetteer.location(qlat, qlon).country_code, best->record.country_code) << qlat << "," << qlon;
    }
}

TEST(gazetteer, nearest_across_the_antimeridian)
{
    GazetteerPlaceLookup gazetteer;
    GazetteerPlace fiji, hawaii;
    fiji.latitude = -17.7;
    fiji.longitude = 179.9;
    fiji.record.country_code = "FJ";
    hawaii.latitude = 19.9;
    hawaii.longitude = -155.6;
    hawaii.record.country_code = "US";
    gazetteer.addPlace(fiji);
    gazetteer.addPlace(hawaii);

    // WHEN: the query is just east of the antimeridian
    EXPECT_EQ(gazetteer.location(-17.7, -179.9).country_code, "FJ");
}

TEST(country_fields_json, loads_overrides)
{
    // GIVEN: the standard table
    CountryFieldTable table = CountryFieldTable::standard();
    const size_t standard_overrides = table.overrideCount();

    // WHEN: a file with an extra override is loaded over it
    ASSERT_TRUE(loadCountryFieldTable(TEST_DATA_DIR "country_fields.json", table));

    // THEN: the new override is added and the rest kept
    EXPECT_EQ(table.lookup("South Africa"), (LocalityFields{"suburb", "state"}));
    EXPECT_EQ(table.lookup("Netherlands").city, "town");
    EXPECT_EQ(table.overrideCount(), standard_overrides + 1);
}

TEST(country_fields_json, rejects_incomplete_entries)
{
    CountryFieldTable table;

    EXPECT_FALSE(parseCountryFieldTable("{\"default\": {\"city\": \"town\"}}", table));
    EXPECT_FALSE(parseCountryFieldTable("{\"overrides\": {\"Chile\": \"comuna\"}}", table));
    EXPECT_FALSE(parseCountryFieldTable("not json", table));

    // AND: the table is unchanged
    EXPECT_EQ(table.defaultFields(), (LocalityFields{"city", "state"}));
}

TEST(gazetteer, drives_location_resolver)
{
    // GIVEN: the fixture gazetteer and a field table choosing suburbs in South Africa
    auto gazetteer = std::make_shared<GazetteerPlaceLookup>();
    ASSERT_TRUE(gazetteer->load(TEST_DATA_DIR "gazetteer.json"));
    ResolverOptions options;
    ASSERT_TRUE(loadCountryFieldTable(TEST_DATA_DIR "country_fields.json", options.fields));
    LocationResolver resolver(gazetteer, options);

    // WHEN: resolving points in South Africa and the Netherlands
    PlaceInfo za = resolver.resolve(Position{-33.958, 18.404, std::nullopt});
    PlaceInfo nl = resolver.resolve(Position{52.37, 4.9, std::nullopt});

    // THEN: each uses its country's fields
    EXPECT_EQ(za.city, "Table Mountain");
    EXPECT_EQ(za.province, "Western Cape");
    EXPECT_EQ(nl.city, "Amsterdam");
    EXPECT_EQ(nl.province, "North Holland");
    EXPECT_EQ(nl.timezone, "Europe/Amsterdam");
}
