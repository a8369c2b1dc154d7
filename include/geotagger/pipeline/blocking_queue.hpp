#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace geotagger
{

// Bounded FIFO handing entries between threads. push blocks while full, pop blocks while empty.
// Every popped entry must be acknowledged with task_done for join to return.
template <typename T> class BlockingQueue
{
  public:
    explicit BlockingQueue(size_t capacity) : _capacity(capacity)
    {
        if (_capacity == 0)
        {
            throw std::invalid_argument("queue capacity must be at least 1");
        }
    }

    BlockingQueue(const BlockingQueue &) = delete;
    BlockingQueue &operator=(const BlockingQueue &) = delete;

    void push(T value)
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _not_full.wait(lock, [this] { return _entries.size() < _capacity; });
        _entries.emplace_back(std::move(value));
        _unfinished++;
        _not_empty.notify_one();
    }

    T pop()
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _not_empty.wait(lock, [this] { return !_entries.empty(); });
        T value = std::move(_entries.front());
        _entries.pop_front();
        _not_full.notify_one();
        return value;
    }

    void task_done()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_unfinished == 0)
        {
            throw std::logic_error("task_done called more times than entries were pushed");
        }
        _unfinished--;
        if (_unfinished == 0)
        {
            _all_done.notify_all();
        }
    }

    // blocks until every pushed entry has been popped and acknowledged
    void join()
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _all_done.wait(lock, [this] { return _unfinished == 0; });
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries.size();
    }

    size_t capacity() const
    {
        return _capacity;
    }

  private:
    const size_t _capacity;
    size_t _unfinished = 0;
    std::deque<T> _entries;

    mutable std::mutex _mutex;
    std::condition_variable _not_full, _not_empty, _all_done;
};

} // namespace geotagger
