#pragma once

#include <geotagger/performance/stage_stats.hpp>
#include <geotagger/pipeline/blocking_queue.hpp>
#include <geotagger/types/work_item.hpp>

#include <usm.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace geotagger
{

// no more items will arrive on the queue carrying it
struct EndOfStream
{
};

using QueueEntry = std::variant<WorkItem, EndOfStream>;
using WorkQueue = BlockingQueue<QueueEntry>;

enum class StageState
{
    RUNNING,
    DRAINING,
    STOPPED
};

enum class StageTransition
{
    REPEAT,
    NEXT,
    ERROR
};

/*
 * One worker thread consuming a bounded input queue in arrival order.
 * A failing transform drops only the item it was given, the stage keeps running.
 * The stage stops after it receives EndOfStream, which it forwards exactly once.
 */
class PipelineStage : public usm::StateMachine<StageState, StageTransition>
{
  public:
    PipelineStage(std::string name, size_t queue_capacity);

    // The worker calls transform, so a started stage must have been sent EndOfStream and joined before
    // the derived part is destroyed. Final stages join in their own destructors.
    virtual ~PipelineStage();

    PipelineStage(const PipelineStage &) = delete;
    PipelineStage &operator=(const PipelineStage &) = delete;

    const std::string &name() const
    {
        return _name;
    }

    WorkQueue &input()
    {
        return _input;
    }

    // must be called before start
    void connect(WorkQueue &output);
    void connect(PipelineStage &downstream)
    {
        connect(downstream.input());
    }
    bool connected() const
    {
        return _output != nullptr;
    }

    void start();

    // waits for the worker to stop, the stream must have been ended upstream
    void join();

    StageState state() const
    {
        return _state.load();
    }

    const StageStats &stats() const
    {
        return _stats;
    }

    static std::string toString(StageState state);

  protected:
    // Returning std::nullopt consumes the item, throwing drops it.
    virtual std::optional<WorkItem> transform(WorkItem item) = 0;

    StageState chooseNextState(StageState currentState, StageTransition transition) override;
    StageTransition runCurrentState(StageState currentState) override;

  private:
    void run();
    StageTransition running();
    StageTransition draining();
    void process(WorkItem item);

    std::string _name;
    WorkQueue _input;
    WorkQueue *_output = nullptr;

    // mirrors getState() for readers on other threads
    std::atomic<StageState> _state{StageState::RUNNING};
    StageStats _stats;
    std::thread _thread;
};

} // namespace geotagger
