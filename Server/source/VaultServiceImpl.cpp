#include "VaultServiceImpl.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

#include <openssl/rand.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "grpcpp/support/status.h"

namespace fs = std::filesystem;

namespace {
	static grpc::Status InvalidArg(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::move(msg));
	}

	static grpc::Status Internal(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INTERNAL, std::move(msg));
	}

	static grpc::Status NotFound(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::NOT_FOUND, std::move(msg));
	}

	static std::optional<std::string> MakeId(size_t bytes)
	{
		std::vector<uint8_t> raw(bytes);
		if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1)
			return std::nullopt;

		return TreeHash::ToHex(raw);
	}

	static bool IsPlainName(const std::string& name)
	{
		return !name.empty()
			&& name != "." && name != ".."
			&& name.find('/') == std::string::npos;
	}
}

VaultServiceImpl::VaultServiceImpl(const std::string_view root_dir)
	: root_dir_(root_dir)
{
}

VaultServiceImpl::~VaultServiceImpl()
{
	if (const size_t dropped = DiscardUploads())
		spdlog::info("discarded {} unfinished upload(s)", dropped);
}

bool VaultServiceImpl::IsValid() const noexcept
{
	std::error_code ec;
	return !root_dir_.empty()
		&& fs::exists(root_dir_, ec)
		&& fs::is_directory(root_dir_, ec);
}

grpc::Status VaultServiceImpl::InitiateMultipartUpload(grpc::ServerContext* context,
						       const InitiateMultipartUploadRequest* request,
						       InitiateMultipartUploadResponse* response)
{
	if (!IsPlainName(request->vault_name()))
		return InvalidArg("vault_name is not a valid name");

	const fs::path vault_dir = fs::path(root_dir_) / request->vault_name();

	std::error_code ec;
	if (!fs::is_directory(vault_dir, ec))
		return NotFound(fmt::format("vault {} does not exist", request->vault_name()));

	if (!TreeHash::IsValidPartSize(request->part_size()))
		return InvalidArg(fmt::format("part_size {} is not a power-of-two multiple of 1 MiB", request->part_size()));

	const auto upload_id = MakeId(16);
	if (!upload_id)
		return Internal("failed to generate upload id");

	auto upload = std::make_shared<MultipartUpload>();
	upload->vault = request->vault_name();
	upload->description = request->archive_description();
	upload->part_size = request->part_size();
	upload->data_path = vault_dir / (*upload_id + ".upload");

	if (auto err = upload->Prepare())
		return Internal("failed to create upload file: " + err->message);

	{
		std::lock_guard<std::mutex> lock(mutex_);
		uploads_.emplace(*upload_id, upload);
	}

	spdlog::info("initiated upload {} of '{}' in vault {} (part size {})",
		     *upload_id, upload->description, upload->vault, upload->part_size);

	response->set_upload_id(*upload_id);

	return grpc::Status::OK;
}

grpc::Status VaultServiceImpl::UploadMultipartPart(grpc::ServerContext* context,
						   grpc::ServerReader<UploadMultipartPartRequest>* reader,
						   UploadMultipartPartResponse* response)
{
	UploadMultipartPartRequest first;
	if (!reader->Read(&first))
		return InvalidArg("empty request stream");

	if (first.request_case() != UploadMultipartPartRequest::kHeader)
		return InvalidArg("first message must be header");

	const UploadPartHeader& header = first.header();

	auto [found, upload, st_find] = FindUpload(header.vault_name(), header.upload_id());
	if (!found)
		return st_find;

	const PartRange& range = header.range();
	if (range.last_byte() < range.first_byte())
		return InvalidArg("range.last_byte precedes range.first_byte");

	if (range.first_byte() % upload->part_size != 0)
		return InvalidArg(fmt::format("range does not start on a {} byte part boundary", upload->part_size));

	if (range.last_byte() - range.first_byte() + 1 > upload->part_size)
		return InvalidArg("range is larger than the part size");

	std::lock_guard<std::mutex> lock(upload->mutex);

	auto [ok_write, part, st_write] = WritePart(reader, *upload, range);
	if (!ok_write)
		return st_write;

	auto [ok_tree, tree, err] = TreeHash::FromBlocks(part.blocks, TreeHash::kBlockSize);
	if (!ok_tree)
		return Internal("failed to hash part: " + err.message);

	upload->parts[range.first_byte()] = std::move(part);

	response->set_checksum(TreeHash::ToHex(tree.root));

	return grpc::Status::OK;
}

grpc::Status VaultServiceImpl::CompleteMultipartUpload(grpc::ServerContext* context,
						       const CompleteMultipartUploadRequest* request,
						       CompleteMultipartUploadResponse* response)
{
	auto [found, upload, st_find] = FindUpload(request->vault_name(), request->upload_id());
	if (!found)
		return st_find;

	std::lock_guard<std::mutex> lock(upload->mutex);

	auto [complete, blocks, reason] = upload->Assemble(request->archive_size());
	if (!complete)
		return InvalidArg("upload is incomplete: " + reason);

	auto [ok_tree, tree, err] = TreeHash::FromBlocks(std::move(blocks), TreeHash::kBlockSize);
	if (!ok_tree)
		return Internal("failed to hash archive: " + err.message);

	const std::string tree_hash = TreeHash::ToHex(tree.root);
	if (tree_hash != request->checksum())
		return InvalidArg(fmt::format("checksum mismatch: computed {}, received {}",
					      tree_hash, request->checksum()));

	const auto archive_id = MakeId(32);
	if (!archive_id)
		return Internal("failed to generate archive id");

	std::error_code ec;
	fs::resize_file(upload->data_path, request->archive_size(), ec);
	if (ec)
		return Internal("failed to finalize archive: " + ec.message());

	fs::rename(upload->data_path, upload->data_path.parent_path() / *archive_id, ec);
	if (ec)
		return Internal("failed to store archive: " + ec.message());

	{
		std::lock_guard<std::mutex> map_lock(mutex_);
		uploads_.erase(request->upload_id());
	}

	spdlog::info("stored archive {} ('{}', {} bytes) in vault {}",
		     *archive_id, upload->description, request->archive_size(), upload->vault);

	ArchiveDescription* archive = response->mutable_archive();
	archive->set_archive_id(*archive_id);
	archive->set_description(upload->description);
	archive->set_size(request->archive_size());
	archive->set_tree_hash(tree_hash);
	response->set_status_code(0);

	return grpc::Status::OK;
}

grpc::Status VaultServiceImpl::AbortMultipartUpload(grpc::ServerContext* context,
						    const AbortMultipartUploadRequest* request,
						    AbortMultipartUploadResponse* response)
{
	auto [found, upload, st_find] = FindUpload(request->vault_name(), request->upload_id());
	if (!found)
		return st_find;

	{
		std::lock_guard<std::mutex> map_lock(mutex_);
		uploads_.erase(request->upload_id());
	}

	// waits for a part still being written
	std::lock_guard<std::mutex> lock(upload->mutex);
	RemoveData(*upload);

	spdlog::info("aborted upload {} of '{}' in vault {} ({} part(s) received)",
		     request->upload_id(), upload->description, upload->vault, upload->parts.size());

	return grpc::Status::OK;
}

size_t VaultServiceImpl::DiscardUploads()
{
	std::unordered_map<std::string, std::shared_ptr<MultipartUpload>> pending;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		pending.swap(uploads_);
	}

	for (const auto &[id, upload]: pending) {
		std::lock_guard<std::mutex> lock(upload->mutex);
		RemoveData(*upload);
		spdlog::debug("discarded upload {} in vault {}", id, upload->vault);
	}

	return pending.size();
}

void VaultServiceImpl::RemoveData(const MultipartUpload& upload)
{
	std::error_code ec;
	fs::remove(upload.data_path, ec);
	if (ec)
		spdlog::warn("failed to remove {}: {}", upload.data_path.string(), ec.message());
}

std::tuple<bool, std::shared_ptr<MultipartUpload>, grpc::Status>
VaultServiceImpl::FindUpload(const std::string& vault, const std::string& upload_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	const auto it = uploads_.find(upload_id);
	if (it == uploads_.end())
		return { false, nullptr, NotFound(fmt::format("no upload {}", upload_id)) };

	if (it->second->vault != vault)
		return { false, nullptr, NotFound(fmt::format("upload {} does not belong to vault {}", upload_id, vault)) };

	return { true, it->second, grpc::Status::OK };
}

std::tuple<bool, MultipartUpload::Part, grpc::Status>
VaultServiceImpl::WritePart(grpc::ServerReader<UploadMultipartPartRequest>* reader,
			    MultipartUpload& upload, const PartRange& range)
{
	const uint64_t expected = range.last_byte() - range.first_byte() + 1;
	uint64_t total = 0;

	FileStream file(upload.data_path);
	if (auto err = file.Open(std::ios::binary | std::ios::in | std::ios::out))
		return { false, MultipartUpload::Part{}, Internal("open failed: " + err->message) };

	if (auto err = file.Seek(range.first_byte()))
		return { false, MultipartUpload::Part{}, Internal("seek failed: " + err->message) };

	TreeHashAccumulator accumulator;

	UploadMultipartPartRequest req;
	while (reader->Read(&req)) {
		if (req.request_case() != UploadMultipartPartRequest::kData)
			return { false, MultipartUpload::Part{}, InvalidArg("header must appear only as the first message") };

		const std::string& data = req.data();
		if (data.empty())
			continue;

		if (total + data.size() > expected)
			return { false, MultipartUpload::Part{}, InvalidArg("received more bytes than the range holds") };

		if (auto err = file.Write(data))
			return { false, MultipartUpload::Part{}, Internal("write failed: " + err->message) };

		if (auto herr = accumulator.Update(data))
			return { false, MultipartUpload::Part{}, Internal("hash failed: " + herr->message) };

		total += data.size();
	}

	if (total != expected)
		return { false, MultipartUpload::Part{}, InvalidArg("stream ended before the whole range was received") };

	if (auto err = file.Close())
		return { false, MultipartUpload::Part{}, Internal("close failed: " + err->message) };

	auto [ok, blocks, herr] = accumulator.Finalize();
	if (!ok)
		return { false, MultipartUpload::Part{}, Internal("hash failed: " + herr.message) };

	MultipartUpload::Part part;
	part.length = total;
	part.blocks = std::move(blocks);

	return { true, std::move(part), grpc::Status::OK };
}
