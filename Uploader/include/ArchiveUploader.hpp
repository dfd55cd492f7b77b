#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "PartTransporter.hpp"
#include "StagingFile.hpp"
#include "TaskRunner.hpp"
#include "UploadConfig.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "VaultTransport.hpp"

struct ArchiveReceipt {
	std::string name;
	uint64_t size = 0;
	uint64_t part_size = 0;
	uint64_t parts_completed = 0;
	std::string tree_hash;
	std::string upload_id;
	std::string archive_id;
};

struct ProgressUpdate {
	std::string prefix;
	std::string name;
	uint64_t file_done = 0;
	uint64_t file_size = 0;
	BatchProgress batch;
	bool finished = false;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

class ArchiveUploader
{
public:
	ArchiveUploader(UploadConfig config,
			VaultTransport& transport,
			TaskRunner& runner,
			SleepFunction sleep = SleepFor);

public:
	void SetProgressCallback(ProgressCallback callback);

	const UploadConfig& GetConfig() const noexcept;

	// Uploads a single file as one archive, using a private staging file.
	std::tuple<bool, ArchiveReceipt, UploadError> UploadFile(const std::filesystem::path& file);

	// Uploads files (relative to the working directory) in order and stops at
	// the first failure. bytes_total is only used for progress reporting.
	std::optional<UploadError> UploadBatch(const std::vector<std::string>& files, uint64_t bytes_total);

private:
	std::tuple<bool, ArchiveReceipt, UploadError> Upload(const std::filesystem::path& path,
							     const std::string& name,
							     StagingFile& staging,
							     BatchProgress& progress,
							     const std::string& prefix);

	void Report(const std::string& prefix, const UploadSession& session,
		    const BatchProgress& progress, bool finished) const;

private:
	const UploadConfig config_;
	VaultTransport& transport_;
	TaskRunner& runner_;
	SleepFunction sleep_;
	ProgressCallback progress_;
};
