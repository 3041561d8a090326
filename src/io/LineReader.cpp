/**
 * @file LineReader.cpp
 * @brief Line-by-line input range over std::istream.
 */

#include "LineReader.hpp"

#include <ios>

/**
 * @brief Reads the next line, or turns into the end iterator at EOF.
 *
 * A final line without a trailing newline is still returned. A stream error
 * other than EOF is not an end of input and is reported by throwing.
 *
 * @throws std::ios_base::failure If the stream fails before EOF.
 */
void LineReader::iterator::next() {
    if( !m_reader ){
        return;
    }

    if( std::getline(m_reader->m_is, m_reader->m_line) ){
        m_reader->m_lines_read++;
        return;
    }

    if( m_reader->m_is.bad() ){
        throw std::ios_base::failure("failed to read input line");
    }
    m_reader = nullptr;
}
