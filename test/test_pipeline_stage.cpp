#include <geotagger/pipeline/pipeline_stage.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <random>
#include <stdexcept>
#include <thread>

using namespace geotagger;
using namespace std::chrono_literals;

namespace
{
class FunctionStage final : public PipelineStage
{
  public:
    using Function = std::function<std::optional<WorkItem>(WorkItem)>;

    FunctionStage(std::string name, size_t queue_capacity, Function fn)
        : PipelineStage(std::move(name), queue_capacity), _fn(std::move(fn))
    {
    }
    ~FunctionStage() override
    {
        join();
    }

  protected:
    std::optional<WorkItem> transform(WorkItem item) override
    {
        return _fn(std::move(item));
    }

  private:
    Function _fn;
};

std::optional<WorkItem> passThrough(WorkItem item)
{
    return item;
}

// pops everything up to and including the end of stream marker
std::vector<std::string> drain(WorkQueue &queue, int &end_of_stream_count)
{
    std::vector<std::string> identities;
    while (queue.size() > 0)
    {
        QueueEntry entry = queue.pop();
        if (std::holds_alternative<EndOfStream>(entry))
        {
            end_of_stream_count++;
        }
        else
        {
            identities.push_back(std::get<WorkItem>(entry).identity());
        }
        queue.task_done();
    }
    return identities;
}
} // namespace

TEST(pipeline_stage, stops_on_end_of_stream)
{
    // GIVEN: an unconnected stage
    FunctionStage stage("solo", 2, passThrough);
    EXPECT_EQ(stage.state(), StageState::RUNNING);
    stage.start();

    // WHEN: the stream is ended
    stage.input().push(WorkItem("a"));
    stage.input().push(EndOfStream{});
    stage.join();

    // THEN: it is stopped, having seen the item and the marker once
    EXPECT_EQ(stage.state(), StageState::STOPPED);
    EXPECT_EQ(stage.stats().received.load(), 1u);
    EXPECT_EQ(stage.stats().end_of_stream_received.load(), 1u);
    EXPECT_EQ(stage.stats().end_of_stream_forwarded.load(), 0u);
    EXPECT_EQ(PipelineStage::toString(stage.state()), "Stopped");
}

TEST(pipeline_stage, cannot_connect_after_start)
{
    WorkQueue sink(1);
    FunctionStage stage("solo", 1, passThrough);
    stage.start();

    EXPECT_THROW(stage.connect(sink), std::logic_error);
    EXPECT_THROW(stage.start(), std::logic_error);

    stage.input().push(EndOfStream{});
    stage.join();
}

TEST(pipeline_stage, three_stage_chain_with_capacity_one)
{
    // GIVEN: three stages with single slot queues, the middle one slow and jittery
    const int N = 50;
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> jitter(0, 300);

    FunctionStage first("first", 1, passThrough);
    FunctionStage second("second", 1, [&](WorkItem item) -> std::optional<WorkItem> {
        std::this_thread::sleep_for(std::chrono::microseconds(jitter(gen)));
        return item;
    });
    FunctionStage third("third", 1, passThrough);
    WorkQueue collector(N + 1);

    first.connect(second);
    second.connect(third);
    third.connect(collector);
    first.start();
    second.start();
    third.start();

    // WHEN: N items and the end of stream are submitted
    for (int i = 0; i < N; i++)
    {
        first.input().push(WorkItem("item" + std::to_string(1000 + i)));
    }
    first.input().push(EndOfStream{});
    first.join();
    second.join();
    third.join();

    // THEN: every item arrives in order, followed by exactly one marker
    int end_of_stream_count = 0;
    auto identities = drain(collector, end_of_stream_count);
    ASSERT_EQ(identities.size(), static_cast<size_t>(N));
    for (int i = 0; i < N; i++)
    {
        EXPECT_EQ(identities[i], "item" + std::to_string(1000 + i));
    }
    EXPECT_EQ(end_of_stream_count, 1);

    // AND: each boundary saw the marker exactly once
    for (const PipelineStage *stage : {static_cast<PipelineStage *>(&first), static_cast<PipelineStage *>(&second),
                                       static_cast<PipelineStage *>(&third)})
    {
        EXPECT_EQ(stage->stats().received.load(), static_cast<uint64_t>(N)) << stage->name();
        EXPECT_EQ(stage->stats().forwarded.load(), static_cast<uint64_t>(N)) << stage->name();
        EXPECT_EQ(stage->stats().end_of_stream_received.load(), 1u) << stage->name();
        EXPECT_EQ(stage->stats().end_of_stream_forwarded.load(), 1u) << stage->name();
        EXPECT_EQ(stage->state(), StageState::STOPPED) << stage->name();
    }
}

TEST(pipeline_stage, failing_item_is_dropped_and_stage_continues)
{
    // GIVEN: a stage that fails on one item
    FunctionStage flaky("flaky", 1, [](WorkItem item) -> std::optional<WorkItem> {
        if (item.identity() == "x2")
        {
            throw std::runtime_error("corrupt metadata");
        }
        return item;
    });
    WorkQueue collector(8);
    flaky.connect(collector);
    flaky.start();

    // WHEN: it is fed items around the failing one
    for (const char *id : {"x0", "x1", "x2", "x3", "x4"})
    {
        flaky.input().push(WorkItem(id));
    }
    flaky.input().push(EndOfStream{});
    flaky.join();

    // THEN: only the failing item is missing
    int end_of_stream_count = 0;
    auto identities = drain(collector, end_of_stream_count);
    EXPECT_EQ(identities, (std::vector<std::string>{"x0", "x1", "x3", "x4"}));
    EXPECT_EQ(end_of_stream_count, 1);
    EXPECT_EQ(flaky.stats().dropped.load(), 1u);
    EXPECT_EQ(flaky.stats().received.load(), 5u);
}

TEST(pipeline_stage, non_standard_exception_drops_only_that_item)
{
    // GIVEN: a stage whose transform throws something that is not a std::exception
    FunctionStage odd("odd", 2, [](WorkItem item) -> std::optional<WorkItem> {
        if (item.identity() == "bad")
        {
            throw 42;
        }
        return item;
    });
    WorkQueue collector(4);
    odd.connect(collector);
    odd.start();

    // WHEN: the bad item is followed by a good one
    odd.input().push(WorkItem("bad"));
    odd.input().push(WorkItem("ok"));
    odd.input().push(EndOfStream{});
    odd.join();

    // THEN: the worker survives, drops the bad item and forwards the rest
    int end_of_stream_count = 0;
    EXPECT_EQ(drain(collector, end_of_stream_count), (std::vector<std::string>{"ok"}));
    EXPECT_EQ(end_of_stream_count, 1);
    EXPECT_EQ(odd.stats().dropped.load(), 1u);
    EXPECT_EQ(odd.state(), StageState::STOPPED);
}

TEST(pipeline_stage, state_machine_counts_runs_per_state)
{
    // GIVEN: a stage that has processed two items and the end of stream
    FunctionStage stage("counted", 4, passThrough);
    EXPECT_EQ(stage.getState(), StageState::RUNNING);
    stage.start();
    stage.input().push(WorkItem("a"));
    stage.input().push(WorkItem("b"));
    stage.input().push(EndOfStream{});
    stage.join();

    // THEN: it went through draining into stopped, which never ran
    EXPECT_EQ(stage.getState(), StageState::STOPPED);
    EXPECT_EQ(stage.stateRunCount(), 0u);
}

TEST(pipeline_stage, consumed_items_are_not_forwarded)
{
    FunctionStage sink("sink", 2, [](WorkItem) -> std::optional<WorkItem> { return std::nullopt; });
    WorkQueue collector(4);
    sink.connect(collector);
    sink.start();

    sink.input().push(WorkItem("a"));
    sink.input().push(WorkItem("b"));
    sink.input().push(EndOfStream{});
    sink.join();

    int end_of_stream_count = 0;
    EXPECT_TRUE(drain(collector, end_of_stream_count).empty());
    EXPECT_EQ(end_of_stream_count, 1);
    EXPECT_EQ(sink.stats().forwarded.load(), 0u);
    EXPECT_EQ(sink.stats().dropped.load(), 0u);
}

TEST(pipeline_stage, summary_lists_stages)
{
    FunctionStage stage("solo", 1, passThrough);
    stage.start();
    stage.input().push(WorkItem("a"));
    stage.input().push(EndOfStream{});
    stage.join();

    std::string summary = PipelineSummary({{stage.name(), &stage.stats()}}, 1.0);

    EXPECT_NE(summary.find("solo:"), std::string::npos) << summary;
    EXPECT_NE(summary.find("Wall time"), std::string::npos) << summary;
}
