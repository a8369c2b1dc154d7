#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace geotagger
{

// written by the stage worker, read by the driver
struct StageStats
{
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> end_of_stream_received{0};
    std::atomic<uint64_t> end_of_stream_forwarded{0};
    std::atomic<int64_t> busy_ns{0};
};

// adds the lifetime of the measure to a busy counter
class StageTimer
{
  public:
    explicit StageTimer(std::atomic<int64_t> &total);
    ~StageTimer();

    StageTimer(const StageTimer &) = delete;
    StageTimer &operator=(const StageTimer &) = delete;

  private:
    std::atomic<int64_t> &_total;
    std::chrono::time_point<std::chrono::steady_clock> _start;
};

struct StageSummaryEntry
{
    std::string name;
    const StageStats *stats;
};

std::string PipelineSummary(const std::vector<StageSummaryEntry> &stages, double wall_seconds);

} // namespace geotagger
