#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "Hasher.hpp"

// SHA-256 tree hash over 1 MiB blocks, as required by the vault to verify
// both individual parts and the assembled archive.
class TreeHash
{
public:
	using Digest = Hasher::Digest;

	static constexpr uint64_t kBlockSize = 1024 * 1024;

	struct Error {
		enum class Kind {
			NotFound = 0,
			InvalidArgument,
			ReadFailed,
			HashFailed
		};

		Kind kind;
		std::string message;
	};

	struct Tree {
		// Nodes covering exactly part_size bytes each (the last may be short).
		std::vector<Digest> leaves;
		Digest root;
	};

public:
	// Allocation failure is reported as HashFailed.
	static std::tuple<bool, Tree, Error> FromFile(const std::filesystem::path& path,
						      uint64_t part_size) noexcept;

	// Builds the tree from the 1 MiB block digests of some content. An empty
	// list is treated as the single digest of the empty string.
	static std::tuple<bool, Tree, Error> FromBlocks(std::vector<Digest> blocks,
							uint64_t part_size);

	static std::tuple<bool, Digest, Error> FromBuffer(std::string_view data);

	static bool IsValidPartSize(uint64_t part_size) noexcept;

	static std::string ToHex(const Digest& digest);

private:
	static std::tuple<bool, Tree, Error> HashFile(const std::filesystem::path& path, uint64_t part_size);
};

// Splits an arbitrarily chunked byte stream into 1 MiB blocks and digests
// each one as it completes.
class TreeHashAccumulator
{
public:
	TreeHashAccumulator();

public:
	std::optional<Hasher::Error> Update(const char* data, size_t size);
	std::optional<Hasher::Error> Update(std::string_view data);

	// Returns the digests of every block seen, including a trailing partial
	// block. Nothing written yields an empty list.
	std::tuple<bool, std::vector<TreeHash::Digest>, Hasher::Error> Finalize();

	uint64_t GetTotalSize() const noexcept;

private:
	Hasher hasher_;
	bool block_open_;
	uint64_t block_fill_;
	uint64_t total_;
	std::vector<TreeHash::Digest> blocks_;
};
