#pragma once
#include <deque>
#include <cstddef>
#include <optional>

namespace TickBar {

// FIFO of the most recent values, oldest evicted first
template <typename T>
class bounded_history {
public:
    using value_type = T;
    using size_type = std::size_t;

    explicit bounded_history(size_type max_capacity)
        : _capacity(max_capacity) {}

    void push(const value_type& value) {
        if (_capacity == 0) return;

        if (_items.size() >= _capacity) {
            _items.pop_front();
        }
        _items.push_back(value);
    }

    // nullopt when empty, never 0
    std::optional<double> average() const {
        if (_items.empty()) return std::nullopt;

        double sum = 0;
        for (const auto& item : _items) {
            sum += static_cast<double>(item);
        }
        return sum / _items.size();
    }

    const value_type& oldest() const { return _items.front(); }
    const value_type& newest() const { return _items.back(); }

    bool empty() const noexcept { return _items.empty(); }
    size_type size() const noexcept { return _items.size(); }
    size_type capacity() const noexcept { return _capacity; }

    void clear() {
        _items.clear();
    }

private:
    size_type _capacity;
    std::deque<value_type> _items; // front = oldest
};

}
