#include "TreeHash.hpp"

#include <algorithm>
#include <new>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "FileStream.hpp"

namespace fs = std::filesystem;

namespace {
	TreeHash::Error MakeErr(TreeHash::Error::Kind kind, std::string message)
	{
		return TreeHash::Error{ kind, std::move(message) };
	}

	TreeHash::Error FromHasherErr(const Hasher::Error& e)
	{
		return MakeErr(TreeHash::Error::Kind::HashFailed,
			       "sha256: (" + std::to_string(e.code) + ") " + e.message);
	}
}

bool TreeHash::IsValidPartSize(uint64_t part_size) noexcept
{
	if (part_size < kBlockSize || part_size % kBlockSize != 0)
		return false;

	const uint64_t blocks = part_size / kBlockSize;

	return (blocks & (blocks - 1)) == 0;
}

std::tuple<bool, TreeHash::Tree, TreeHash::Error>
TreeHash::FromFile(const fs::path& path, uint64_t part_size) noexcept
{
	try {
		return HashFile(path, part_size);
	} catch (const std::bad_alloc&) {
		return { false, Tree{}, MakeErr(Error::Kind::HashFailed, "out of memory hashing " + path.string()) };
	}
}

std::tuple<bool, TreeHash::Tree, TreeHash::Error>
TreeHash::HashFile(const fs::path& path, uint64_t part_size)
{
	std::error_code ec;
	if (!fs::exists(path, ec))
		return { false, Tree{}, MakeErr(Error::Kind::NotFound, "no such file: " + path.string()) };

	if (!fs::is_regular_file(path, ec))
		return { false, Tree{}, MakeErr(Error::Kind::NotFound, "not a regular file: " + path.string()) };

	if (!IsValidPartSize(part_size))
		return { false, Tree{}, MakeErr(Error::Kind::InvalidArgument,
						"part size " + std::to_string(part_size) + " is not a power-of-two multiple of 1 MiB") };

	FileStream stream(path);
	if (auto err = stream.Open(std::ios::binary | std::ios::in))
		return { false, Tree{}, MakeErr(Error::Kind::ReadFailed, "failed to open: " + err->message) };

	std::vector<Digest> blocks;
	std::string buffer(kBlockSize, '\0');

	while (true) {
		auto [ok, len, err] = stream.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		if (!ok)
			return { false, Tree{}, MakeErr(Error::Kind::ReadFailed, "failed to read: " + err.message) };

		if (len <= 0)
			break;

		auto [hashed, digest, herr] = Hasher::Digest256(std::string_view(buffer.data(), static_cast<size_t>(len)));
		if (!hashed)
			return { false, Tree{}, FromHasherErr(herr) };

		blocks.push_back(std::move(digest));

		if (static_cast<uint64_t>(len) < kBlockSize)
			break;
	}

	if (auto err = stream.Close())
		return { false, Tree{}, MakeErr(Error::Kind::ReadFailed, "failed to close: " + err->message) };

	const size_t block_count = blocks.size();

	auto result = FromBlocks(std::move(blocks), part_size);
	if (std::get<0>(result))
		spdlog::debug("Hashes = {}, chunks = {} (will differ if part size != 1 MiB)",
			      block_count, std::get<1>(result).leaves.size());

	return result;
}

std::tuple<bool, TreeHash::Tree, TreeHash::Error>
TreeHash::FromBlocks(std::vector<Digest> blocks, uint64_t part_size)
{
	if (!IsValidPartSize(part_size))
		return { false, Tree{}, MakeErr(Error::Kind::InvalidArgument,
						"part size " + std::to_string(part_size) + " is not a power-of-two multiple of 1 MiB") };

	if (blocks.empty()) {
		auto [ok, digest, herr] = Hasher::Digest256(std::string_view());
		if (!ok)
			return { false, Tree{}, FromHasherErr(herr) };

		blocks.push_back(std::move(digest));
	}

	Tree tree;
	bool captured = false;
	uint64_t node_size = kBlockSize;
	std::vector<Digest> level = std::move(blocks);

	while (true) {
		if (!captured && node_size == part_size) {
			tree.leaves = level;
			captured = true;
		}

		if (level.size() == 1)
			break;

		std::vector<Digest> next;
		next.reserve((level.size() + 1) / 2);

		for (size_t i = 0; i + 1 < level.size(); i += 2) {
			auto [ok, digest, herr] = Hasher::Combine(level[i], level[i + 1]);
			if (!ok)
				return { false, Tree{}, FromHasherErr(herr) };

			next.push_back(std::move(digest));
		}

		if (level.size() % 2 != 0)
			next.push_back(std::move(level.back()));

		level = std::move(next);
		node_size *= 2;
	}

	// content shorter than one part: the whole tree is the only leaf
	if (!captured)
		tree.leaves.push_back(level.front());

	tree.root = std::move(level.front());

	return { true, std::move(tree), Error{} };
}

std::tuple<bool, TreeHash::Digest, TreeHash::Error> TreeHash::FromBuffer(std::string_view data)
{
	TreeHashAccumulator accumulator;

	if (auto herr = accumulator.Update(data))
		return { false, Digest{}, FromHasherErr(*herr) };

	auto [ok, blocks, herr] = accumulator.Finalize();
	if (!ok)
		return { false, Digest{}, FromHasherErr(herr) };

	auto [built, tree, err] = FromBlocks(std::move(blocks), kBlockSize);
	if (!built)
		return { false, Digest{}, err };

	return { true, std::move(tree.root), Error{} };
}

std::string TreeHash::ToHex(const Digest& digest)
{
	static const char* kHex = "0123456789abcdef";

	std::string out;
	out.reserve(digest.size() * 2);
	for (uint8_t b : digest) {
		out.push_back(kHex[(b >> 4) & 0xF]);
		out.push_back(kHex[b & 0xF]);
	}

	return out;
}

TreeHashAccumulator::TreeHashAccumulator()
	: block_open_(false)
	, block_fill_(0)
	, total_(0)
{
}

std::optional<Hasher::Error> TreeHashAccumulator::Update(const char* data, size_t size)
{
	if (!data && size != 0)
		return Hasher::Error{ -3, "Update received null buffer with non-zero size" };

	while (size > 0) {
		if (!block_open_) {
			if (auto err = hasher_.Initialize())
				return err;

			block_open_ = true;
			block_fill_ = 0;
		}

		const uint64_t room = TreeHash::kBlockSize - block_fill_;
		const size_t take = static_cast<size_t>(std::min<uint64_t>(room, size));

		if (auto err = hasher_.Update(data, take))
			return err;

		data += take;
		size -= take;
		block_fill_ += take;
		total_ += take;

		if (block_fill_ == TreeHash::kBlockSize) {
			auto [ok, digest, err] = hasher_.Finalize();
			if (!ok)
				return err;

			blocks_.push_back(std::move(digest));
			block_open_ = false;
		}
	}

	return std::nullopt;
}

std::optional<Hasher::Error> TreeHashAccumulator::Update(std::string_view data)
{
	return Update(data.data(), data.size());
}

std::tuple<bool, std::vector<TreeHash::Digest>, Hasher::Error> TreeHashAccumulator::Finalize()
{
	if (block_open_) {
		auto [ok, digest, err] = hasher_.Finalize();
		if (!ok)
			return { false, {}, err };

		blocks_.push_back(std::move(digest));
		block_open_ = false;
	}

	return { true, std::move(blocks_), Hasher::Error{0, ""} };
}

uint64_t TreeHashAccumulator::GetTotalSize() const noexcept
{
	return total_;
}
