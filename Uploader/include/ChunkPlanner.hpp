#pragma once

#include <cstdint>
#include <string>

struct ByteRange {
	uint64_t first = 0;
	uint64_t last = 0;

	uint64_t Length() const noexcept { return last - first + 1; }

	// "bytes <first>-<last>/*", the vault's Content-Range form
	std::string ToString() const;
};

struct ChunkPlan {
	uint64_t part_size = 0;
};

class ChunkPlanner
{
public:
	static constexpr uint64_t kMinPartSize = 1024 * 1024;
	static constexpr uint64_t kMaxParts = 10000;

public:
	// Smallest power-of-two part size, never below 1 MiB, that keeps the
	// upload within kMaxParts.
	static ChunkPlan Plan(uint64_t size) noexcept;

	// An empty file has no parts.
	static uint64_t PartCount(uint64_t size, uint64_t part_size) noexcept;

	static ByteRange PartRange(uint64_t size, uint64_t part_size, uint64_t index) noexcept;
};
