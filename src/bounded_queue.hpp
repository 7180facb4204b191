#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// FIFO with a fixed capacity, safe to share between threads. push()
// blocks while full, pop() while empty. After close() nothing more
// goes in, and every waiter wakes up.
template<typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(size_t capacity)
            : capacity(capacity == 0 ? 1 : capacity)
    {
    }

    // Returns false if the queue is closed, including when it gets
    // closed while waiting for room.
    bool push(T item)
    {
        std::unique_lock<std::mutex> lk(m);
        not_full.wait(lk, [this] { return closed || items.size() < capacity; });
        if(closed)
        {
            return false;
        }
        items.push_back(std::move(item));
        lk.unlock();
        not_empty.notify_one();
        return true;
    }

    // Nothing only when the queue is closed and empty.
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lk(m);
        not_empty.wait(lk, [this] { return closed || !items.empty(); });
        if(items.empty())
        {
            return std::nullopt;
        }
        return takeFront(lk);
    }

    std::optional<T> tryPop()
    {
        std::unique_lock<std::mutex> lk(m);
        if(items.empty())
        {
            return std::nullopt;
        }
        return takeFront(lk);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lk(m);
        if(!not_empty.wait_for(lk, timeout,
                               [this] { return closed || !items.empty(); }) ||
           items.empty())
        {
            return std::nullopt;
        }
        return takeFront(lk);
    }

    // Items already queued can still be popped.
    void close()
    {
        {
            std::lock_guard<std::mutex> lk(m);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    // Accept items again. Whatever was left from before the close is
    // thrown away.
    void reopen()
    {
        {
            std::lock_guard<std::mutex> lk(m);
            items.clear();
            closed = false;
        }
        not_full.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lk(m);
        return closed;
    }

private:
    T takeFront(std::unique_lock<std::mutex>& lk)
    {
        T item = std::move(items.front());
        items.pop_front();
        lk.unlock();
        not_full.notify_one();
        return item;
    }

    const size_t capacity;
    mutable std::mutex m;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> items;
    bool closed = false;
};
