#include "MultipartUpload.hpp"

#include <iterator>
#include <utility>

#include <fmt/core.h>

std::optional<FileStream::Error> MultipartUpload::Prepare() noexcept
{
	FileStream file(data_path);

	if (auto err = file.Open(std::ios::binary | std::ios::out | std::ios::trunc))
		return err;

	return file.Close();
}

std::tuple<bool, std::vector<TreeHash::Digest>, std::string>
MultipartUpload::Assemble(uint64_t archive_size) const
{
	std::vector<TreeHash::Digest> blocks;
	uint64_t next = 0;

	for (auto it = parts.begin(); it != parts.end(); ++it) {
		const uint64_t first = it->first;
		const Part& part = it->second;

		if (first != next)
			return { false, {}, fmt::format("missing range starting at byte {}", next) };

		const bool last = std::next(it) == parts.end();
		if (!last && part.length != part_size)
			return { false, {}, fmt::format("part at byte {} is {} bytes, expected {}", first, part.length, part_size) };

		blocks.insert(blocks.end(), part.blocks.begin(), part.blocks.end());
		next += part.length;
	}

	if (next != archive_size)
		return { false, {}, fmt::format("received {} bytes, archive size is {}", next, archive_size) };

	return { true, std::move(blocks), "" };
}
