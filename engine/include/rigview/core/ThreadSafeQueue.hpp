#pragma once

#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace rigview::core
{
    // Mutex-guarded FIFO used to hand results from worker threads back to
    // the thread that owns the viewer state.
    template<typename T>
    class ThreadSafeQueue
    {
    public:
        ThreadSafeQueue() = default;

        ThreadSafeQueue(const ThreadSafeQueue&) = delete;
        ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

        void push(T item)
        {
            std::lock_guard lock(m_mutex);
            m_items.push_back(std::move(item));
        }

        std::optional<T> tryPop()
        {
            std::lock_guard lock(m_mutex);
            if (m_items.empty())
            {
                return std::nullopt;
            }
            T item = std::move(m_items.front());
            m_items.pop_front();
            return item;
        }

        // Takes everything queued so far in a single critical section.
        std::vector<T> drain()
        {
            std::deque<T> taken;
            {
                std::lock_guard lock(m_mutex);
                taken.swap(m_items);
            }
            return {std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end())};
        }

        bool empty() const
        {
            std::lock_guard lock(m_mutex);
            return m_items.empty();
        }

        size_t size() const
        {
            std::lock_guard lock(m_mutex);
            return m_items.size();
        }

    private:
        mutable std::mutex m_mutex;
        std::deque<T> m_items;
    };
}
