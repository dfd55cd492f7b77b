#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "FileStream.hpp"
#include "TreeHash.hpp"

// Server side state of one in-progress multipart upload. Parts are keyed by
// their first byte; re-sending a range replaces the earlier copy.
struct MultipartUpload {
	struct Part {
		uint64_t length = 0;
		std::vector<TreeHash::Digest> blocks;
	};

	std::string vault;
	std::string description;
	uint64_t part_size = 0;
	std::filesystem::path data_path;

	std::mutex mutex;
	std::map<uint64_t, Part> parts;

	std::optional<FileStream::Error> Prepare() noexcept;

	// Checks that the stored parts tile [0, archive_size) and returns their
	// block digests in order, or a description of the gap.
	std::tuple<bool, std::vector<TreeHash::Digest>, std::string> Assemble(uint64_t archive_size) const;
};
