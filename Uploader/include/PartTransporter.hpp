#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <tuple>
#include <vector>

#include "StagingFile.hpp"
#include "UploadConfig.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "VaultTransport.hpp"

enum class AttemptOutcome {
	Accepted = 0,
	ChecksumMismatch,
	ChecksumMissing,
	Timeout,
	TransportFailure
};

const char* ToString(AttemptOutcome outcome) noexcept;

struct PartReport {
	uint64_t part_index = 0;
	ByteRange range;
	std::vector<AttemptOutcome> attempts;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

void SleepFor(std::chrono::milliseconds delay);

class PartTransporter
{
public:
	PartTransporter(const UploadConfig& config,
			VaultTransport& transport,
			StagingFile& staging,
			SleepFunction sleep = SleepFor);

public:
	// Sends the next part of the session. part_index must equal
	// session.parts_completed.
	std::tuple<bool, PartReport, UploadError> SendPart(UploadSession& session,
							   const std::filesystem::path& file,
							   uint64_t part_index,
							   BatchProgress& progress);

private:
	AttemptOutcome Attempt(const UploadSession& session, const ByteRange& range,
			       const std::string& expected);

private:
	const UploadConfig& config_;
	VaultTransport& transport_;
	StagingFile& staging_;
	SleepFunction sleep_;
};
