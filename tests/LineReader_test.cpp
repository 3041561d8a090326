#include <gtest/gtest.h>
#include "io/LineReader.hpp"

#include <sstream>
#include <vector>

static std::vector<std::string> read_all(const std::string& text) {
    std::istringstream is(text);
    LineReader reader(is);
    return std::vector<std::string>(reader.begin(), reader.end());
}

TEST(LineReader, lines) {
    EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), read_all("a\nb\nc\n"));
}

TEST(LineReader, last_line_without_newline) {
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), read_all("a\nb"));
}

TEST(LineReader, keeps_empty_lines) {
    EXPECT_EQ((std::vector<std::string>{"a", "", "b"}), read_all("a\n\nb\n"));
}

TEST(LineReader, empty_input) {
    EXPECT_TRUE(read_all("").empty());
}

TEST(LineReader, lines_read) {
    std::istringstream is("1\n2\n3\n");
    auto reader = lines(is);
    size_t n = 0;
    for (const auto& line : reader) {
        n++;
        EXPECT_EQ(n, reader.lines_read());
        EXPECT_EQ(std::to_string(n), line);
    }
    EXPECT_EQ(3u, n);
}

TEST(LineReader, bad_stream_throws) {
    std::istringstream is("a\nb\n");
    LineReader reader(is);
    auto it = reader.begin();
    is.setstate(std::ios::badbit);
    EXPECT_THROW(++it, std::ios_base::failure);
}
