#include "ChunkPlanner.hpp"

#include <algorithm>

#include <fmt/core.h>

std::string ByteRange::ToString() const
{
	return fmt::format("bytes {}-{}/*", first, last);
}

ChunkPlan ChunkPlanner::Plan(uint64_t size) noexcept
{
	// Rounded up: a truncated quotient would let a file just over
	// kMaxParts MiB exceed the part cap.
	uint64_t part_size = size / kMaxParts + (size % kMaxParts != 0 ? 1 : 0);
	if (part_size <= kMinPartSize)
		return ChunkPlan{ kMinPartSize };

	const uint64_t factor = (part_size + kMinPartSize - 1) / kMinPartSize;
	part_size = kMinPartSize * factor;

	part_size -= 1;
	part_size |= part_size >> 1;
	part_size |= part_size >> 2;
	part_size |= part_size >> 4;
	part_size |= part_size >> 8;
	part_size |= part_size >> 16;
	part_size |= part_size >> 32;
	part_size += 1;

	return ChunkPlan{ part_size };
}

uint64_t ChunkPlanner::PartCount(uint64_t size, uint64_t part_size) noexcept
{
	if (part_size == 0)
		return 0;

	return size / part_size + (size % part_size != 0 ? 1 : 0);
}

ByteRange ChunkPlanner::PartRange(uint64_t size, uint64_t part_size, uint64_t index) noexcept
{
	ByteRange range;

	range.first = index * part_size;
	range.last = std::min(range.first + part_size, size) - 1;

	return range;
}
