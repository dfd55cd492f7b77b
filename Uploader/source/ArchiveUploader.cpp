#include "ArchiveUploader.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ByteFormat.hpp"
#include "ChunkPlanner.hpp"
#include "TreeHash.hpp"

namespace fs = std::filesystem;

namespace {
	UploadError MakeErr(UploadError::Kind kind, std::string message)
	{
		return UploadError{ kind, std::move(message) };
	}

	UploadError::Kind MapHashError(TreeHash::Error::Kind kind)
	{
		switch (kind) {
		case TreeHash::Error::Kind::NotFound:        return UploadError::Kind::NotFound;
		case TreeHash::Error::Kind::InvalidArgument: return UploadError::Kind::InvalidArgument;
		case TreeHash::Error::Kind::ReadFailed:
		case TreeHash::Error::Kind::HashFailed:
		default:
			return UploadError::Kind::HashError;
		}
	}
}

ArchiveUploader::ArchiveUploader(UploadConfig config,
				 VaultTransport& transport,
				 TaskRunner& runner,
				 SleepFunction sleep)
	: config_(std::move(config))
	, transport_(transport)
	, runner_(runner)
	, sleep_(sleep ? std::move(sleep) : SleepFunction(SleepFor))
{
}

void ArchiveUploader::SetProgressCallback(ProgressCallback callback)
{
	progress_ = std::move(callback);
}

const UploadConfig& ArchiveUploader::GetConfig() const noexcept
{
	return config_;
}

std::tuple<bool, ArchiveReceipt, UploadError> ArchiveUploader::UploadFile(const fs::path& file)
{
	if (auto reason = ValidateUploadConfig(config_))
		return { false, ArchiveReceipt{}, MakeErr(UploadError::Kind::InvalidArgument, *reason) };

	const fs::path path = file.is_absolute() ? file : config_.working_dir / file;
	const std::string name = config_.with_path ? file.generic_string() : file.filename().string();

	std::error_code ec;
	BatchProgress progress;
	progress.bytes_total = fs::file_size(path, ec);
	if (ec)
		progress.bytes_total = 0;

	StagingFile staging(config_.staging_dir);
	if (auto err = staging.Create())
		return { false, ArchiveReceipt{}, MakeErr(UploadError::Kind::StagingError,
			"unable to create staging file: " + err->message) };

	return Upload(path, name, staging, progress, "");
}

std::optional<UploadError> ArchiveUploader::UploadBatch(const std::vector<std::string>& files, uint64_t bytes_total)
{
	if (auto reason = ValidateUploadConfig(config_))
		return MakeErr(UploadError::Kind::InvalidArgument, *reason);

	spdlog::info("Uploading {} files ({}) to vault {}, this may take a while",
		     files.size(), FormatSize(bytes_total), config_.vault);

	StagingFile staging(config_.staging_dir);
	if (auto err = staging.Create()) {
		spdlog::error("Unable to generate staging file: {}", err->message);
		return MakeErr(UploadError::Kind::StagingError, "unable to create staging file: " + err->message);
	}

	BatchProgress progress;
	progress.bytes_total = bytes_total;

	for (size_t i = 0; i < files.size(); ++i) {
		const fs::path relative(files[i]);
		const fs::path path = config_.working_dir / relative;
		const std::string name = config_.with_path ? relative.generic_string() : relative.filename().string();
		const std::string prefix = fmt::format("({} of {}) ", i + 1, files.size());

		auto [ok, receipt, err] = Upload(path, name, staging, progress, prefix);
		if (!ok) {
			spdlog::error("Batch stopped at {}: {} ({}), {} file(s) not attempted",
				      files[i], err.message, ToString(err.kind), files.size() - i - 1);
			return err;
		}

		spdlog::info("{}{} stored as archive {}", prefix, receipt.name, receipt.archive_id);
	}

	if (auto err = staging.Remove())
		spdlog::warn("failed to remove staging file: {}", err->message);

	return std::nullopt;
}

std::tuple<bool, ArchiveReceipt, UploadError>
ArchiveUploader::Upload(const fs::path& path, const std::string& name, StagingFile& staging,
			BatchProgress& progress, const std::string& prefix)
{
	ArchiveReceipt receipt;
	receipt.name = name;

	// Planning
	std::error_code ec;
	if (!fs::is_regular_file(path, ec)) {
		spdlog::error("File {} does not exist", path.string());
		return { false, receipt, MakeErr(UploadError::Kind::NotFound, "no such file: " + path.string()) };
	}

	UploadSession session;
	session.name = name;
	session.size = fs::file_size(path, ec);
	if (ec)
		return { false, receipt, MakeErr(UploadError::Kind::NotFound,
			fmt::format("unable to stat {}: {}", path.string(), ec.message())) };

	session.plan = ChunkPlanner::Plan(session.size);
	spdlog::debug("Using part size of {} based on size ({}) of {}",
		      FormatSize(session.plan.part_size), FormatSize(session.size), name);

	// Hashing
	auto [hashed, tree, herr] = TreeHash::FromFile(path, session.plan.part_size);
	if (!hashed) {
		spdlog::error("Unable to hash file {}: {}", path.string(), herr.message);
		return { false, receipt, MakeErr(MapHashError(herr.kind),
			fmt::format("unable to hash {}: {}", path.string(), herr.message)) };
	}
	session.tree = std::move(tree);

	// Initiating
	auto initiated = transport_.InitiateUpload(config_.vault, name, session.plan.part_size);
	if (const auto error = std::get_if<TransportError>(&initiated)) {
		spdlog::error("Unable to initiate upload of {}: ({}) {}", name, error->code, error->message);
		return { false, receipt, MakeErr(UploadError::Kind::InitiateError,
			fmt::format("{}: initiate failed: {}", name, error->message)) };
	}

	session.upload_id = std::get<InitiateReceipt>(initiated).upload_id;
	if (session.upload_id.empty()) {
		spdlog::error("Unable to initiate upload of {}: no upload id returned", name);
		return { false, receipt, MakeErr(UploadError::Kind::InitiateError,
			fmt::format("{}: initiate returned no upload id", name)) };
	}

	// Transferring
	const auto started = std::chrono::steady_clock::now();
	const uint64_t part_count = ChunkPlanner::PartCount(session.size, session.plan.part_size);
	PartTransporter transporter(config_, transport_, staging, sleep_);

	Report(prefix, session, progress, false);

	for (uint64_t index = 0; index < part_count; ++index) {
		std::tuple<bool, PartReport, UploadError> sent{ false, PartReport{}, UploadError{} };

		const bool ok = runner_.Run([&] {
			sent = transporter.SendPart(session, path, index, progress);
			return std::get<0>(sent);
		});

		if (!ok) {
			UploadError err = std::get<2>(sent);
			if (err.kind == UploadError::Kind::None)
				err = MakeErr(UploadError::Kind::PartExhausted,
					      fmt::format("{}: part {} was not run", name, index));

			if (auto aborted = transport_.AbortUpload(config_.vault, session.upload_id))
				spdlog::warn("Unable to abort upload {} of {}: ({}) {}", session.upload_id, name,
					     aborted->code, aborted->message);

			return { false, receipt, err };
		}

		Report(prefix, session, progress, false);
	}

	// Committing
	const std::string checksum = TreeHash::ToHex(session.tree.root);

	auto completed = transport_.CompleteUpload(config_.vault, session.upload_id, checksum, session.size);
	if (const auto error = std::get_if<TransportError>(&completed)) {
		spdlog::error("Failed to upload {}: ({}) {}", path.string(), error->code, error->message);
		return { false, receipt, MakeErr(UploadError::Kind::CommitError,
			fmt::format("{}: complete failed: {}", name, error->message)) };
	}

	const CompleteReceipt& done = std::get<CompleteReceipt>(completed);
	if (done.status_code != 0) {
		spdlog::error("Failed to upload {}: complete returned status {}", path.string(), done.status_code);
		return { false, receipt, MakeErr(UploadError::Kind::CommitError,
			fmt::format("{}: complete returned status {}", name, done.status_code)) };
	}

	Report(prefix, session, progress, true);

	const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
		std::chrono::steady_clock::now() - started).count();
	spdlog::debug("{} @ {}", path.string(),
		      FormatSpeed(session.size / static_cast<uint64_t>(std::max<decltype(elapsed)>(elapsed, 1))));

	receipt.size = session.size;
	receipt.part_size = session.plan.part_size;
	receipt.parts_completed = session.parts_completed;
	receipt.tree_hash = checksum;
	receipt.upload_id = session.upload_id;
	receipt.archive_id = done.archive_id;

	return { true, std::move(receipt), UploadError{} };
}

void ArchiveUploader::Report(const std::string& prefix, const UploadSession& session,
			     const BatchProgress& progress, bool finished) const
{
	if (!progress_)
		return;

	ProgressUpdate update;
	update.prefix = prefix;
	update.name = session.name;
	update.file_done = session.offset;
	update.file_size = session.size;
	update.batch = progress;
	update.finished = finished;

	progress_(update);
}
