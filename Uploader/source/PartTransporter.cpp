#include "PartTransporter.hpp"

#include <thread>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ByteFormat.hpp"

namespace {
	UploadError MakeErr(UploadError::Kind kind, std::string message)
	{
		return UploadError{ kind, std::move(message) };
	}
}

const char* ToString(AttemptOutcome outcome) noexcept
{
	switch (outcome) {
	case AttemptOutcome::Accepted:         return "accepted";
	case AttemptOutcome::ChecksumMismatch: return "checksum mismatch";
	case AttemptOutcome::ChecksumMissing:  return "checksum missing";
	case AttemptOutcome::Timeout:          return "timeout";
	case AttemptOutcome::TransportFailure: return "transport failure";
	}

	return "unknown";
}

void SleepFor(std::chrono::milliseconds delay)
{
	std::this_thread::sleep_for(delay);
}

PartTransporter::PartTransporter(const UploadConfig& config,
				 VaultTransport& transport,
				 StagingFile& staging,
				 SleepFunction sleep)
	: config_(config)
	, transport_(transport)
	, staging_(staging)
	, sleep_(sleep ? std::move(sleep) : SleepFunction(SleepFor))
{
}

std::tuple<bool, PartReport, UploadError>
PartTransporter::SendPart(UploadSession& session, const std::filesystem::path& file,
			  uint64_t part_index, BatchProgress& progress)
{
	PartReport report;
	report.part_index = part_index;

	const uint64_t part_count = ChunkPlanner::PartCount(session.size, session.plan.part_size);
	if (part_index >= part_count)
		return { false, report, MakeErr(UploadError::Kind::InvalidArgument,
			fmt::format("{}: part {} out of range ({} parts)", session.name, part_index, part_count)) };

	if (part_index != session.parts_completed)
		return { false, report, MakeErr(UploadError::Kind::InvalidArgument,
			fmt::format("{}: part {} sent out of order, next is {}", session.name, part_index, session.parts_completed)) };

	if (part_index >= session.tree.leaves.size())
		return { false, report, MakeErr(UploadError::Kind::HashError,
			fmt::format("{}: no leaf digest for part {} ({} leaves)", session.name, part_index, session.tree.leaves.size())) };

	const ByteRange range = ChunkPlanner::PartRange(session.size, session.plan.part_size, part_index);
	report.range = range;

	if (auto err = staging_.Extract(file, range)) {
		spdlog::error("Unable to extract {} of {} for upload: {}", range.ToString(), file.string(), err->message);
		return { false, report, MakeErr(UploadError::Kind::StagingError,
			fmt::format("{}: failed to extract {}: {}", session.name, range.ToString(), err->message)) };
	}

	const unsigned max_attempts = config_.retry.max_attempts;
	if (max_attempts == 0)
		return { false, report, MakeErr(UploadError::Kind::InvalidArgument, "retry policy allows no attempts") };

	const std::string expected = TreeHash::ToHex(session.tree.leaves[part_index]);

	for (unsigned attempt = 1; attempt <= max_attempts; ++attempt) {
		const AttemptOutcome outcome = Attempt(session, range, expected);
		report.attempts.push_back(outcome);

		if (outcome == AttemptOutcome::Accepted) {
			session.offset += range.Length();
			session.parts_completed += 1;
			progress.bytes_done += range.Length();

			return { true, std::move(report), UploadError{} };
		}

		if (attempt == max_attempts)
			break;

		const auto delay = config_.retry.backoff_step * attempt;
		spdlog::warn("{} @ {} failed to upload ({}), retrying in {}. {} tries left",
			     FormatSize(range.Length()), range.first, ToString(outcome),
			     std::chrono::duration<double>(delay), max_attempts - attempt);
		sleep_(delay);
	}

	spdlog::error("Unable to upload {} at offset {} of {} after {} attempts",
		      FormatSize(range.Length()), range.first, session.name, max_attempts);

	const std::string message = fmt::format("{}: {} at offset {} failed {} times, last outcome: {}",
						session.name, range.ToString(), range.first, max_attempts,
						ToString(report.attempts.back()));

	return { false, std::move(report), MakeErr(UploadError::Kind::PartExhausted, message) };
}

AttemptOutcome PartTransporter::Attempt(const UploadSession& session, const ByteRange& range,
					const std::string& expected)
{
	auto result = transport_.UploadPart(config_.vault, session.upload_id, range, staging_.GetPath());

	if (const auto error = std::get_if<TransportError>(&result)) {
		if (error->kind == TransportError::Kind::Timeout) {
			spdlog::warn("Timeout sending {} of {}: {}", range.ToString(), session.name, error->message);
			return AttemptOutcome::Timeout;
		}

		spdlog::debug("Upload of {} of {} failed: ({}) {}", range.ToString(), session.name,
			      error->code, error->message);
		return AttemptOutcome::TransportFailure;
	}

	const PartReceipt& receipt = std::get<PartReceipt>(result);

	if (receipt.checksum.empty()) {
		spdlog::error("No checksum returned for {} of {}, expected {}",
			      range.ToString(), session.name, expected);
		return AttemptOutcome::ChecksumMissing;
	}

	if (receipt.checksum != expected) {
		spdlog::error("Hash does not match for {} of {}, expected {} got {}.",
			      range.ToString(), session.name, expected, receipt.checksum);
		return AttemptOutcome::ChecksumMismatch;
	}

	return AttemptOutcome::Accepted;
}
