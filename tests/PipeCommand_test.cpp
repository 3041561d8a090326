#include "test_utils.hpp"
#include "commands/PipeCommand.hpp"

class PipeCommandTest : public CmdTestBase<PipeCommand> {};

TEST_F(PipeCommandTest, passes_lines_through) {
    run_cmd({"pipe"}, "alpha\nbeta\n\ngamma\n");
    EXPECT_EQ("alpha\nbeta\n\ngamma\n", m_out.str());
}

TEST_F(PipeCommandTest, adds_missing_final_newline) {
    run_cmd({"pipe"}, "alpha\nbeta");
    EXPECT_EQ("alpha\nbeta\n", m_out.str());
}

TEST_F(PipeCommandTest, stdin_total_is_unknown) {
    run_cmd({"pipe"}, "1\n2\n3\n");
    EXPECT_THAT(m_err.str(), HasSubstr("\r3 [elapsed: "));
    EXPECT_THAT(m_err.str(), testing::Not(HasSubstr("|")));
    EXPECT_EQ('\r', m_err.str().back()); // cleared
}

TEST_F(PipeCommandTest, count_buffers_input) {
    run_cmd({"pipe", "--count", "--leave"}, "1\n2\n3\n");
    EXPECT_EQ("1\n2\n3\n", m_out.str());
    EXPECT_THAT(m_err.str(), HasSubstr("|##########| 3/3 100% "));
    EXPECT_EQ('\n', m_err.str().back());
}

TEST_F(PipeCommandTest, explicit_total) {
    run_cmd({"pipe", "-t", "4", "--min-interval", "0", "--segments", "4"}, "1\n2\n3\n");
    auto lines = rendered_lines(m_err.str());
    ASSERT_GE(lines.size(), 3u);
    EXPECT_THAT(lines[0], HasSubstr("|#---| 1/4 25% "));
    EXPECT_THAT(lines[1], HasSubstr("|##--| 2/4 50% "));
    EXPECT_THAT(lines[2], HasSubstr("|###-| 3/4 75% "));
}

TEST_F(PipeCommandTest, total_exceeded) {
    run_cmd({"pipe", "--total", "2", "--leave"}, "1\n2\n3\n");
    EXPECT_THAT(trim(m_err.str().substr(m_err.str().rfind('\r'))), testing::StartsWith("3 [elapsed: "));
}

TEST_F(PipeCommandTest, description) {
    run_cmd({"pipe", "-d", "Lines"}, "1\n");
    EXPECT_THAT(m_err.str(), HasSubstr("\rLines: 1 [elapsed: "));
}

TEST_F(PipeCommandTest, empty_input) {
    run_cmd({"pipe"}, "");
    EXPECT_EQ("", m_out.str());
    EXPECT_THAT(m_err.str(), HasSubstr("0 [elapsed: 00:00:00, 0 iters/sec]"));
}

TEST_F(PipeCommandTest, progress_to_stdout) {
    run_cmd({"pipe", "--stdout"}, "x\n");
    EXPECT_EQ("", m_err.str());
    EXPECT_THAT(m_out.str(), HasSubstr("x\n"));
    EXPECT_THAT(m_out.str(), HasSubstr("1 [elapsed: "));
}

TEST_F(PipeCommandTest, output_failure) {
    m_out.setstate(std::ios::badbit);
    run_cmd({"pipe"}, "x\n", 1);
}
