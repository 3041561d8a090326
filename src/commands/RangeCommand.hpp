#include "Command.hpp"

class RangeCommand : public Command {
public:
    int run() override;

private:
    friend class CmdTestBase<RangeCommand>;

    static RangeCommand instance; // Static instance to trigger registration
    RangeCommand(bool reg=false);
};
