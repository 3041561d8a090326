#pragma once
#include "core/Options.hpp"
#include "utils/common.hpp"

#include <ostream>

void register_progress_args(argparse::ArgumentParser &parser);
TickBar::Options progress_options(const argparse::ArgumentParser &parser, std::ostream& out, std::ostream& err);
