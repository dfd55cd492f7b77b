#include "ByteFormat.hpp"

#include <fmt/core.h>

std::string FormatSize(uint64_t bytes)
{
	static const char* kUnits[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB" };

	if (bytes < 1024)
		return fmt::format("{} B", bytes);

	double value = static_cast<double>(bytes);
	size_t unit = 0;
	while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
		value /= 1024.0;
		++unit;
	}

	return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

std::string FormatSpeed(uint64_t bytes_per_second)
{
	return FormatSize(bytes_per_second) + "/s";
}
