// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace speakstream
{

/// @brief Multi-producer multi-consumer FIFO with a fixed capacity.
///
/// push() blocks while the queue is full and pop() blocks while it is empty. Both wake
/// up on close() and on a stop request of the passed token. After close(), remaining
/// items can still be popped; pop() returns nullopt only once the queue is drained.
template <typename T>
class BoundedQueue
{
  public:
    explicit BoundedQueue(std::size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// @brief Appends an item, blocking while the queue is full.
    /// @return false if the queue was closed or the token stopped; the item is dropped.
    auto push(T item, std::stop_token token) -> bool
    {
        {
            auto lock = std::unique_lock(_mutex);
            if (!_cv.wait(lock, token, [this] { return _closed || _items.size() < _capacity; }))
                return false;
            if (_closed)
                return false;
            _items.push_back(std::move(item));
        }
        _cv.notify_all();
        return true;
    }

    /// @brief Removes the oldest item, blocking while the queue is empty and open.
    /// @return The item, or nullopt once the queue is closed and drained or the token stopped.
    auto pop(std::stop_token token) -> std::optional<T>
    {
        auto item = std::optional<T> {};
        {
            auto lock = std::unique_lock(_mutex);
            if (!_cv.wait(lock, token, [this] { return _closed || !_items.empty(); }))
                return std::nullopt;
            if (_items.empty())
                return std::nullopt;
            item.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _cv.notify_all();
        return item;
    }

    /// @brief Removes the oldest item without blocking.
    auto tryPop() -> std::optional<T>
    {
        auto item = std::optional<T> {};
        {
            auto lock = std::lock_guard(_mutex);
            if (_items.empty())
                return std::nullopt;
            item.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _cv.notify_all();
        return item;
    }

    /// @brief Marks the end of the stream. Blocked producers and consumers wake up.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    /// @brief Discards all queued items.
    /// @return The number of discarded items.
    auto clear() -> std::size_t
    {
        auto count = std::size_t { 0 };
        {
            auto lock = std::lock_guard(_mutex);
            count = _items.size();
            _items.clear();
        }
        _cv.notify_all();
        return count;
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _items.size();
    }

    [[nodiscard]] auto closed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    std::size_t const _capacity;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<T> _items;
    bool _closed = false;
};

} // namespace speakstream
