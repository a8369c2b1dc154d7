#include <geotagger/performance/stage_stats.hpp>

#include <iomanip>
#include <sstream>

namespace geotagger
{

StageTimer::StageTimer(std::atomic<int64_t> &total) : _total(total), _start(std::chrono::steady_clock::now())
{
}

StageTimer::~StageTimer()
{
    auto now = std::chrono::steady_clock::now();
    int64_t duration = std::chrono::duration_cast<std::chrono::nanoseconds>(now - _start).count();
    _total.fetch_add(duration, std::memory_order_relaxed);
}

std::string PipelineSummary(const std::vector<StageSummaryEntry> &stages, double wall_seconds)
{
    std::ostringstream ss;
    ss << "=====================" << std::endl;
    ss << " Pipeline summary" << std::endl;

    ss << std::setw(15) << "Stage" << std::setw(10) << "Received" << std::setw(11) << "Forwarded" << std::setw(9)
       << "Dropped" << std::setw(13) << "Busy" << std::setw(13) << "Utilization" << std::endl;
    for (const auto &e : stages)
    {
        const double busy = e.stats->busy_ns.load() * 1e-9;
        ss << std::setw(14) << e.name << ":";
        ss << std::setw(10) << e.stats->received.load();
        ss << std::setw(11) << e.stats->forwarded.load();
        ss << std::setw(9) << e.stats->dropped.load();
        ss << std::fixed << std::setw(12) << std::setprecision(3) << busy << "s";
        ss << std::fixed << std::setw(12) << std::setprecision(1) << (wall_seconds > 0 ? 100 * busy / wall_seconds : 0)
           << "%";
        ss << std::endl;
    }
    ss << std::fixed << std::setprecision(3) << " Wall time: " << wall_seconds << "s" << std::endl;
    ss << "=====================" << std::endl;

    return ss.str();
}

} // namespace geotagger
