#include "StagingFile.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <new>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {
	constexpr std::streamsize kCopyBlock = 1024 * 1024;

	StagingFile::Error ErrnoError(const char* what, const fs::path& path)
	{
		const int err = errno;
		return StagingFile::Error{ err, fmt::format("{}: {} ({})", what, path.string(), std::strerror(err)) };
	}
}

StagingFile::StagingFile(const fs::path& directory)
	: directory_(directory)
{
}

StagingFile::~StagingFile()
{
	if (auto err = Remove())
		spdlog::warn("failed to remove staging file: {}", err->message);
}

std::optional<StagingFile::Error> StagingFile::Create() noexcept
{
	if (!path_.empty())
		return std::nullopt;

	fs::path directory = directory_;
	if (directory.empty()) {
		std::error_code ec;
		directory = fs::temp_directory_path(ec);
		if (ec)
			return Error{ ec.value(), "no temporary directory: " + ec.message() };
	}

	std::string name = (directory / "archive-upload-XXXXXX").string();
	std::vector<char> buffer(name.begin(), name.end());
	buffer.push_back('\0');

	errno = 0;
	const int fd = mkstemp(buffer.data());
	if (fd < 0)
		return ErrnoError("mkstemp failed", name);

	if (close(fd) != 0)
		return ErrnoError("close failed", buffer.data());

	path_ = buffer.data();
	spdlog::debug("staging file: {}", path_.string());

	return std::nullopt;
}

std::optional<StagingFile::Error> StagingFile::Extract(const fs::path& source, const ByteRange& range) noexcept
{
	try {
		return CopyRange(source, range);
	} catch (const std::bad_alloc&) {
		return Error{ ENOMEM, "extract: out of memory copying " + range.ToString() };
	}
}

std::optional<StagingFile::Error> StagingFile::CopyRange(const fs::path& source, const ByteRange& range)
{
	if (path_.empty())
		return Error{ -1, "extract: staging file was not created" };

	FileStream in(source);
	if (auto err = in.Open(std::ios::binary | std::ios::in))
		return err;

	if (auto err = in.Seek(range.first))
		return err;

	FileStream out(path_);
	if (auto err = out.Open(std::ios::binary | std::ios::out | std::ios::trunc))
		return err;

	std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(kCopyBlock, range.Length())));
	uint64_t remain = range.Length();

	while (remain > 0) {
		const auto want = static_cast<std::streamsize>(std::min<uint64_t>(remain, buffer.size()));

		auto [ok, len, err] = in.Read(buffer.data(), want);
		if (!ok)
			return err;

		if (len <= 0)
			return Error{ -1, fmt::format("extract: {} ended {} bytes short of {}",
						      source.string(), remain, range.ToString()) };

		if (auto werr = out.Write(std::string_view(buffer.data(), static_cast<size_t>(len))))
			return werr;

		remain -= static_cast<uint64_t>(len);
	}

	if (auto err = out.Close())
		return err;

	return in.Close();
}

std::optional<StagingFile::Error> StagingFile::Remove() noexcept
{
	if (path_.empty())
		return std::nullopt;

	std::error_code ec;
	fs::remove(path_, ec);
	if (ec)
		return Error{ ec.value(), fmt::format("remove {}: {}", path_.string(), ec.message()) };

	path_.clear();

	return std::nullopt;
}

const fs::path& StagingFile::GetPath() const noexcept
{
	return path_;
}
