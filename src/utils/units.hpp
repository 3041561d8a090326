#pragma once
#include <chrono>
#include <cstdint>
#include <string>

std::chrono::milliseconds human2duration(const std::string& duration);
uint64_t human2count(const std::string& count);
