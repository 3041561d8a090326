#include "Command.hpp"

class PipeCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<PipeCommand>;

    template <typename Range>
    int copy_lines(Range&& range);

    static PipeCommand instance; // Static instance to trigger registration
    PipeCommand(bool reg=false);
};
