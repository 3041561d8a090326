#pragma once
#include <iterator>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "ProgressEngine.hpp"
#include "io/Logger.hpp"

namespace TickBar {

// Range decorator: yields the elements of the wrapped range unchanged and
// ticks a ProgressEngine once per element. The engine is finished exactly
// once, when iteration reaches the end, on close(), or on destruction
// (early break, exception in the loop body).
//
//   for (const auto& item : TickBar::tqdm(items, {.description = "Processing"})) { ... }
//
template <typename Range>
class Tracked {
    using base_iterator = decltype(std::begin(std::declval<Range&>()));
    using base_sentinel = decltype(std::end(std::declval<Range&>()));

    public:
    struct sentinel {};

    class iterator {
        public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename std::iterator_traits<base_iterator>::value_type;
        using difference_type = typename std::iterator_traits<base_iterator>::difference_type;
        using reference = typename std::iterator_traits<base_iterator>::reference;
        using pointer = typename std::iterator_traits<base_iterator>::pointer;

        iterator(Tracked* owner, base_iterator cur, base_sentinel end)
            : m_owner(owner), m_cur(std::move(cur)), m_end(std::move(end)) {}

        reference operator*() const { return *m_cur; }

        iterator& operator++() {
            ++m_cur;
            m_owner->arrive(m_cur == m_end);
            return *this;
        }
        void operator++(int) { ++*this; }

        bool operator==(const sentinel&) const { return m_cur == m_end; }
        bool operator!=(const sentinel&) const { return !(m_cur == m_end); }

        private:
        Tracked* m_owner;
        base_iterator m_cur;
        base_sentinel m_end;
    };

    Tracked(Range&& range, Options options)
        : m_range(std::forward<Range>(range)), m_options(std::move(options)) {}

    Tracked(const Tracked&) = delete;
    Tracked& operator=(const Tracked&) = delete;

    ~Tracked() {
        try {
            close();
        } catch (const std::exception& e) {
            // can't throw from a destructor
            logger->error("progress: failed to finalize status line: {}", e.what());
        }
    }

    // starts the engine, ticks the first element if any
    iterator begin() {
        if( m_engine ){
            throw std::logic_error("progress: tracked range can only be iterated once");
        }

        auto first = std::begin(m_range);
        auto last = std::end(m_range);
        m_engine = std::make_unique<ProgressEngine>(resolve_total(first, last), m_options);

        const bool empty = (first == last);
        iterator it(this, std::move(first), std::move(last));
        arrive(empty);
        return it;
    }

    sentinel end() { return {}; }

    // finishes the engine unless already finished, propagates write errors
    void close() {
        if( m_engine && m_engine->state() != ProgressEngine::State::Finished ){
            m_engine->finish();
        }
    }

    // nullptr until begin()
    const ProgressEngine* engine() const { return m_engine.get(); }

    private:
    void arrive(bool at_end) {
        if( at_end ){
            close();
        } else {
            m_engine->on_item();
        }
    }

    uint64_t resolve_total(const base_iterator& first, const base_sentinel& last) const {
        if( m_options.total ){
            return *m_options.total;
        }

        // concept check, views report input_iterator_tag as their legacy category
        if constexpr (std::is_same_v<base_iterator, base_sentinel> && std::forward_iterator<base_iterator>) {
            return static_cast<uint64_t>(std::ranges::distance(first, last));
        } else {
            // counting a single-pass range would consume it
            logger->debug("progress: total unknown for a single-pass range");
            return 0;
        }
    }

    Range m_range;
    const Options m_options;
    std::unique_ptr<ProgressEngine> m_engine;
};

template <typename Range>
Tracked<Range> tqdm(Range&& range, Options options = {}) {
    return Tracked<Range>(std::forward<Range>(range), std::move(options));
}

}
