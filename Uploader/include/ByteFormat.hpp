#pragma once

#include <cstdint>
#include <string>

std::string FormatSize(uint64_t bytes);
std::string FormatSpeed(uint64_t bytes_per_second);
