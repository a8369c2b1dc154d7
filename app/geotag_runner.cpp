#include <geotagger/correlate/correlate.hpp>
#include <geotagger/geocode/rate_limiter.hpp>
#include <geotagger/io/country_fields_json.hpp>
#include <geotagger/io/csv.hpp>
#include <geotagger/io/gazetteer.hpp>
#include <geotagger/io/sidecar_store.hpp>
#include <geotagger/performance/stage_stats.hpp>
#include <geotagger/pipeline/pipeline.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "CommandLine.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <set>

using namespace geotagger;

namespace
{
std::atomic<bool> interrupted{false};

void onInterrupt(int)
{
    interrupted.store(true);
}

bool isPhoto(const std::filesystem::path &path)
{
    static const std::set<std::string> extensions{".jpg", ".jpeg", ".tif", ".tiff", ".png",
                                                  ".heic", ".dng", ".cr2", ".nef", ".arw"};
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return extensions.count(ext) > 0;
}
} // namespace

int main(int argc, char *argv[])
{
    std::string input_dir = "";
    std::string track_file = "";
    std::string gazetteer_file = "";
    std::string country_fields_file = "";
    std::string augment_file = "";
    std::string output_file = "";
    std::string log_file = "";
    std::string policy_name = toString(CorrelationPolicy::AVERAGE);
    std::string satisfy_name = toString(SatisfyMode::ALL);
    double max_delta = 60;
    double max_distance = 100;
    double time_offset = 0;
    double throttle = 0;
    int32_t queue_capacity = 16;
    bool overwrite_position = false;
    bool overwrite_places = false;
    uint32_t debug_level = 3;
    bool printHelp = false;

    CommandLine args("Geotag photos from a GPS track and look up their place names");
    args.addArgument({"-i", "--input"}, &input_dir, "Input directory of photos");
    args.addArgument({"-t", "--track"}, &track_file, "GPS track CSV: time,latitude,longitude[,elevation]");
    args.addArgument({"-g", "--gazetteer"}, &gazetteer_file, "Gazetteer JSON for place name lookup");
    args.addArgument({"--country-fields"}, &country_fields_file, "Country to locality field table JSON");
    args.addArgument({"-a", "--augment"}, &augment_file, "Result CSV of a previous run to merge before correlating");
    args.addArgument({"-o", "--output"}, &output_file, "Output result CSV");
    args.addArgument({"-p", "--policy"}, &policy_name, "nearest, next, prev or average (default: average)");
    args.addArgument({"--satisfy"}, &satisfy_name, "any or all thresholds must hold (default: all)");
    args.addArgument({"--max-delta"}, &max_delta, "Maximum time gap in seconds (default: 60)");
    args.addArgument({"--max-distance"}, &max_distance, "Maximum track point spacing in meters (default: 100)");
    args.addArgument({"--time-offset"}, &time_offset, "Seconds added to photo times to reach UTC");
    args.addArgument({"--throttle"}, &throttle, "Maximum place lookups per hour, 0 for unlimited");
    args.addArgument({"-q", "--queue-capacity"}, &queue_capacity, "Items buffered between stages (default: 16)");
    args.addArgument({"--overwrite-position"}, &overwrite_position, "Correlate photos that already have a position");
    args.addArgument({"--overwrite-places"}, &overwrite_places, "Look up photos that already have place names");
    args.addArgument({"-d", "--debug"}, &debug_level, "none=0, critical=1, error=2, warn=3, info=4, debug=5");
    args.addArgument({"-l", "--log-file"}, &log_file, "Output logging file, overwrites existing files");
    args.addArgument({"-h", "--help"}, &printHelp, "You must specify at least an input directory");

    try
    {
        args.parse(argc, argv);
    }
    catch (std::runtime_error const &e)
    {
        std::cout << e.what() << std::endl;
        return -1;
    }

    if (printHelp)
    {
        args.printHelp();
        return 0;
    }

    auto level = spdlog::level::warn;
    switch (debug_level)
    {
    case 0:
        level = spdlog::level::off;
        break;
    case 1:
        level = spdlog::level::critical;
        break;
    case 2:
        level = spdlog::level::err;
        break;
    case 3:
        level = spdlog::level::warn;
        break;
    case 4:
        level = spdlog::level::info;
        break;
    default:
        level = spdlog::level::debug;
        break;
    }
    spdlog::set_level(level);
    if (log_file.size() > 0)
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
        spdlog::default_logger()->sinks().push_back(std::move(file_sink));
    }

    if (input_dir.empty())
    {
        std::cerr << "Error: --input is required" << std::endl;
        args.printHelp();
        return -1;
    }
    if (!std::isfinite(throttle) || (throttle > 0 && throttle < RateLimiter::MIN_REQUESTS_PER_HOUR))
    {
        std::cerr << "Error: --throttle must be 0 or at least one lookup a year" << std::endl;
        return -1;
    }
    if (queue_capacity < 1)
    {
        std::cerr << "Error: --queue-capacity must be at least 1" << std::endl;
        return -1;
    }

    auto store = std::make_shared<SidecarMetadataStore>();

    PipelineOptions options;
    options.queue_capacity = static_cast<size_t>(queue_capacity);
    options.store = store;

    if (track_file.size() > 0)
    {
        auto points = loadTrackCsv(track_file);
        if (!points.has_value())
        {
            return -1;
        }
        auto policy = parsePolicy(policy_name);
        auto satisfy = parseSatisfyMode(satisfy_name);
        if (!policy.has_value() || !satisfy.has_value())
        {
            std::cerr << "Error: unknown policy " << policy_name << " or satisfy mode " << satisfy_name << std::endl;
            return -1;
        }

        options.track = std::make_shared<const Track>(Track::build(std::move(*points)));
        options.correlation.correlation.policy = *policy;
        options.correlation.correlation.satisfy = *satisfy;
        options.correlation.correlation.max_delta_seconds = max_delta;
        options.correlation.correlation.max_distance_meters = max_distance;
        options.correlation.overwrite = overwrite_position;
        options.correlation.time_offset_seconds = time_offset;
        spdlog::info("Track has {} points spanning {:.0f}s", options.track->size(), options.track->timeSpan());
    }

    if (gazetteer_file.size() > 0)
    {
        auto gazetteer = std::make_shared<GazetteerPlaceLookup>();
        if (!gazetteer->load(gazetteer_file))
        {
            return -1;
        }
        if (country_fields_file.size() > 0 && !loadCountryFieldTable(country_fields_file, options.resolver.fields))
        {
            return -1;
        }
        options.place_lookup = gazetteer;
        options.resolver.throttle_rate = throttle;
        options.overwrite_places = overwrite_places;
    }

    if (augment_file.size() > 0)
    {
        options.augmentation = loadAugmentationCsv(augment_file);
        if (!options.augmentation.has_value())
        {
            return -1;
        }
    }

    if (output_file.size() > 0)
    {
        try
        {
            options.results = CsvResultSink::open(output_file);
        }
        catch (std::runtime_error const &e)
        {
            spdlog::error("{}", e.what());
            return -1;
        }
    }

    std::vector<std::string> files;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(input_dir, ec))
    {
        if (entry.is_regular_file() && isPhoto(entry.path()))
        {
            files.push_back(entry.path().string());
        }
    }
    if (ec)
    {
        spdlog::error("Unable to list {}: {}", input_dir, ec.message());
        return -1;
    }
    spdlog::info("Found {} photos in {}", files.size(), input_dir);

    std::signal(SIGINT, onInterrupt);

    Pipeline p(std::move(options));
    DriveResult result = drive(p, *store, files, interrupted, [](size_t submitted, size_t total) {
        if (submitted % 100 == 0 || submitted == total)
        {
            std::cout << "Submitted " << submitted << " / " << total << std::endl;
        }
    });

    if (result.interrupted)
    {
        std::cout << "Interrupted after " << result.submitted << " photos" << std::endl;
    }
    std::cout << "Complete!" << std::endl;
    std::cout << PipelineSummary(p.summary(), p.elapsedSeconds()) << std::endl;
    return 0;
}
