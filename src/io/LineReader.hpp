#pragma once
#include <cstddef>
#include <istream>
#include <iterator>
#include <string>

// single-pass range over the lines of a stream, newline stripped
class LineReader {
    public:
    class iterator {
        public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using reference = const std::string&;
        using pointer = const std::string*;

        iterator() = default; // end
        explicit iterator(LineReader* reader) : m_reader(reader) { next(); }

        reference operator*() const { return m_reader->m_line; }
        pointer operator->() const { return &m_reader->m_line; }

        iterator& operator++() { next(); return *this; }
        void operator++(int) { next(); }

        bool operator==(const iterator& other) const { return m_reader == other.m_reader; }
        bool operator!=(const iterator& other) const { return m_reader != other.m_reader; }

        private:
        void next();

        LineReader* m_reader = nullptr;
    };

    explicit LineReader(std::istream& is) : m_is(is) {}

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    size_t lines_read() const { return m_lines_read; }

    private:
    std::istream& m_is;
    std::string m_line;
    size_t m_lines_read = 0;
};

inline LineReader lines(std::istream& is) {
    return LineReader(is);
}
