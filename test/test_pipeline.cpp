#include <geotagger/metadata/gps_tags.hpp>
#include <geotagger/pipeline/pipeline.hpp>

#include <gtest/gtest.h>

#include <mutex>

using namespace geotagger;

namespace
{
class FixedLookup : public PlaceLookup
{
  public:
    LocationRecord location(double, double) override
    {
        return LocationRecord{"GB", {{"city", "Canterbury"}, {"county", "Kent"}, {"state", "England"}}};
    }
    std::string countryName(const std::string &) override
    {
        return "United Kingdom";
    }
    std::string timezone(const Position &) override
    {
        return "Europe/London";
    }
};

class CollectingSink : public ResultSink
{
  public:
    void record(const ResultRow &row) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        rows.push_back(row);
    }

    std::mutex mutex;
    std::vector<ResultRow> rows;
};

std::shared_ptr<const Track> track()
{
    return std::make_shared<const Track>(Track::build({
        {Position{51.28, 1.08, std::nullopt}, fromUnixSeconds(1000)},
        {Position{51.28, 1.081, std::nullopt}, fromUnixSeconds(1030)},
    }));
}

TagMap photoTags(double seconds)
{
    return {{tags::DATE_TIME_ORIGINAL, fromUnixSeconds(seconds)}};
}
} // namespace

TEST(pipeline, constructs_with_only_a_writer)
{
    PipelineOptions options;
    options.store = std::make_shared<InMemoryMetadataStore>();

    Pipeline p(options);

    EXPECT_EQ(p.stageNames(), (std::vector<std::string>{"write"}));
    p.finish();
    EXPECT_TRUE(p.finished());
}

TEST(pipeline, assembles_enabled_stages_in_order)
{
    PipelineOptions options;
    options.store = std::make_shared<InMemoryMetadataStore>();
    options.augmentation = AugmentationTable{};
    options.track = track();
    options.place_lookup = std::make_shared<FixedLookup>();

    Pipeline p(options);

    EXPECT_EQ(p.stageNames(), (std::vector<std::string>{"augment", "correlate", "geocode", "write"}));
    EXPECT_EQ(p.summary().size(), 4u);
}

TEST(pipeline, empty_track_disables_correlation)
{
    PipelineOptions options;
    options.store = std::make_shared<InMemoryMetadataStore>();
    options.track = std::make_shared<const Track>(Track::build({}));
    options.place_lookup = std::make_shared<FixedLookup>();

    Pipeline p(options);

    EXPECT_EQ(p.stageNames(), (std::vector<std::string>{"geocode", "write"}));
}

TEST(pipeline, submit_after_finish_throws)
{
    PipelineOptions options;
    options.store = std::make_shared<InMemoryMetadataStore>();
    Pipeline p(options);

    p.finish();
    p.finish();

    EXPECT_THROW(p.submit(WorkItem("late.jpg")), std::logic_error);
}

TEST(pipeline, tags_photos_end_to_end)
{
    // GIVEN: a store with photos inside the track, outside it, and unreadable
    auto store = std::make_shared<InMemoryMetadataStore>();
    store->put("b.jpg", photoTags(1015));
    store->put("a.jpg", photoTags(1000));
    store->put("far.jpg", photoTags(50000));
    auto sink = std::make_shared<CollectingSink>();

    PipelineOptions options;
    options.queue_capacity = 1;
    options.store = store;
    options.results = sink;
    options.track = track();
    options.correlation.correlation.satisfy = SatisfyMode::ALL;
    options.place_lookup = std::make_shared<FixedLookup>();
    Pipeline p(options);

    // WHEN: the identities are driven through the pipeline
    std::atomic<bool> interrupted{false};
    std::vector<std::pair<size_t, size_t>> progress;
    DriveResult result =
        drive(p, *store, {"far.jpg", "missing.jpg", "b.jpg", "a.jpg", "b.jpg"}, interrupted,
              [&](size_t submitted, size_t total) { progress.emplace_back(submitted, total); });

    // THEN: duplicates are skipped and the missing photo is reported
    EXPECT_EQ(result.submitted, 3u);
    EXPECT_EQ(result.unreadable, 1u);
    EXPECT_FALSE(result.interrupted);
    EXPECT_TRUE(p.finished());
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), std::make_pair(size_t(3), size_t(4)));

    // AND: rows arrive in sorted identity order
    ASSERT_EQ(sink->rows.size(), 3u);
    EXPECT_EQ(sink->rows[0].at(columns::FILE), "a.jpg");
    EXPECT_EQ(sink->rows[1].at(columns::FILE), "b.jpg");
    EXPECT_EQ(sink->rows[2].at(columns::FILE), "far.jpg");

    // AND: the photo inside the track is interpolated and named with the UK fields
    EXPECT_EQ(sink->rows[1].at(columns::LONGITUDE), "1.0805000");
    EXPECT_EQ(sink->rows[1].at(columns::CITY), "Canterbury");
    EXPECT_EQ(sink->rows[1].at(columns::PROVINCE_STATE), "Kent");
    EXPECT_EQ(sink->rows[1].at(columns::COUNTRY_NAME), "United Kingdom");

    // AND: the snapped photo after the track end is positioned too
    EXPECT_EQ(sink->rows[2].at(columns::LATITUDE), "51.2800000");

    // AND: the store was updated for every tagged photo
    EXPECT_EQ(store->writeCount(), 3u);
    auto stored = store->read("b.jpg");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(std::get<std::string>(stored->at(tags::TIME_ZONE)), "Europe/London");
}

TEST(pipeline, interrupt_stops_submission_and_drains)
{
    // GIVEN: ten photos in the store
    auto store = std::make_shared<InMemoryMetadataStore>();
    std::vector<std::string> identities;
    for (int i = 0; i < 10; i++)
    {
        identities.push_back("p" + std::to_string(i) + ".jpg");
        store->put(identities.back(), photoTags(1000 + i));
    }
    auto sink = std::make_shared<CollectingSink>();

    PipelineOptions options;
    options.queue_capacity = 1;
    options.store = store;
    options.results = sink;
    options.track = track();
    Pipeline p(options);

    // WHEN: an interrupt arrives after the third submission
    std::atomic<bool> interrupted{false};
    DriveResult result = drive(p, *store, identities, interrupted, [&](size_t submitted, size_t) {
        if (submitted == 3)
        {
            interrupted = true;
        }
    });

    // THEN: submission stopped, and what was already submitted still completed
    EXPECT_TRUE(result.interrupted);
    EXPECT_EQ(result.submitted, 3u);
    EXPECT_EQ(sink->rows.size(), 3u);
    EXPECT_TRUE(p.finished());
}
