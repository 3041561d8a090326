#pragma once
#include "io/Logger.hpp"
#include "units.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "tickbar"

extern argparse::ArgumentParser program;
extern int verbosity;

void init_log(const std::string& log_fname);
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
