#pragma once

#include <filesystem>
#include <optional>

#include "ChunkPlanner.hpp"
#include "FileStream.hpp"

// Scratch file holding the part currently being sent. One instance is
// reused for every part of every file in a batch and deleted on destruction.
class StagingFile
{
public:
	using Error = FileStream::Error;

public:
	StagingFile(const StagingFile&) = delete;
	StagingFile& operator=(const StagingFile&) = delete;

public:
	explicit StagingFile(const std::filesystem::path& directory);
	~StagingFile();

public:
	std::optional<Error> Create() noexcept;

	// Replaces the contents with exactly range.Length() bytes of source.
	// Allocation failure is reported as an Error.
	std::optional<Error> Extract(const std::filesystem::path& source, const ByteRange& range) noexcept;

	std::optional<Error> Remove() noexcept;

	const std::filesystem::path& GetPath() const noexcept;

private:
	std::optional<Error> CopyRange(const std::filesystem::path& source, const ByteRange& range);

private:
	std::filesystem::path directory_;
	std::filesystem::path path_;
};
