#include <geotagger/pipeline/pipeline_stage.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace geotagger
{

PipelineStage::PipelineStage(std::string name, size_t queue_capacity)
    : usm::StateMachine<StageState, StageTransition>(StageState::RUNNING), _name(std::move(name)),
      _input(queue_capacity)
{
}

PipelineStage::~PipelineStage()
{
    if (_thread.joinable())
    {
        if (_state.load() != StageState::STOPPED)
        {
            spdlog::error("[{}] destroyed while its worker is still running", _name);
        }
        _thread.join();
    }
}

void PipelineStage::connect(WorkQueue &output)
{
    if (_thread.joinable())
    {
        throw std::logic_error("cannot connect stage " + _name + " after it started");
    }
    _output = &output;
}

void PipelineStage::start()
{
    if (_thread.joinable())
    {
        throw std::logic_error("stage " + _name + " already started");
    }
    _thread = std::thread(&PipelineStage::run, this);
}

void PipelineStage::join()
{
    if (_thread.joinable())
    {
        _thread.join();
    }
}

void PipelineStage::run()
{
    spdlog::debug("[{}] started", _name);

    while (getState() != StageState::STOPPED)
    {
        iterateOnce();
        _state = getState();
    }

    spdlog::debug("[{}] stopped after {} items, {} dropped", _name, _stats.received.load(), _stats.dropped.load());
}

StageState PipelineStage::chooseNextState(StageState currentState, StageTransition transition)
{
    switch (currentState)
    {
    case StageState::RUNNING:
        switch (transition)
        {
        case StageTransition::NEXT:
        case StageTransition::ERROR:
            // downstream still gets its end of stream
            return StageState::DRAINING;
        default:
            break;
        }
        break;
    case StageState::DRAINING:
    case StageState::STOPPED:
        break;
    }
    return StageState::STOPPED;
}

StageTransition PipelineStage::runCurrentState(StageState currentState)
{
    switch (currentState)
    {
    case StageState::RUNNING:
        return running();
    case StageState::DRAINING:
        return draining();
    case StageState::STOPPED:
        return StageTransition::REPEAT;
    }
    return StageTransition::ERROR;
}

StageTransition PipelineStage::running()
{
    QueueEntry entry = _input.pop();

    StageTransition t = StageTransition::REPEAT;
    if (std::holds_alternative<EndOfStream>(entry))
    {
        _stats.end_of_stream_received++;
        t = StageTransition::NEXT;
    }
    else
    {
        process(std::get<WorkItem>(std::move(entry)));
    }

    _input.task_done();
    return t;
}

StageTransition PipelineStage::draining()
{
    if (_output != nullptr)
    {
        _output->push(EndOfStream{});
        _stats.end_of_stream_forwarded++;
    }
    return StageTransition::NEXT;
}

void PipelineStage::process(WorkItem item)
{
    _stats.received++;

    std::string identity;
    try
    {
        identity = item.identity();

        std::optional<WorkItem> result;
        {
            StageTimer timer(_stats.busy_ns);
            result = transform(std::move(item));
        }

        if (result.has_value() && _output != nullptr)
        {
            _output->push(std::move(*result));
            _stats.forwarded++;
        }
    }
    catch (const std::exception &e)
    {
        _stats.dropped++;
        spdlog::error("[{}] dropping {}: {}", _name, identity, e.what());
    }
    catch (...)
    {
        _stats.dropped++;
        spdlog::error("[{}] dropping {}: unknown error", _name, identity);
    }
}

std::string PipelineStage::toString(StageState state)
{
    switch (state)
    {
    case StageState::RUNNING:
        return "Running";
    case StageState::DRAINING:
        return "Draining";
    case StageState::STOPPED:
        return "Stopped";
    }
    return "Error";
}

} // namespace geotagger
