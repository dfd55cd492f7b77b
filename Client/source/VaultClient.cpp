#include "VaultClient.hpp"

#include <algorithm>
#include <cstdio>
#include <string_view>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "FileStream.hpp"

namespace {
	static TransportError MakeErr(int code, std::string msg)
	{
		return TransportError{ TransportError::Kind::Failure, code, std::move(msg) };
	}

	static TransportError MakeGrpcErr(const grpc::Status& st)
	{
		const auto kind = st.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED
			? TransportError::Kind::Timeout
			: TransportError::Kind::Failure;

		return TransportError{ kind, static_cast<int>(st.error_code()), st.error_message() };
	}

	// A failed Write means the stream is closed; the server's status says why.
	template <typename Writer>
	static TransportError StreamClosed(Writer& writer, std::string msg)
	{
		grpc::Status st = writer->Finish();
		if (!st.ok())
			return MakeGrpcErr(st);

		return MakeErr(-1, std::move(msg));
	}
}

VaultClient::VaultClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline)
	: stub_(VaultService::NewStub(std::move(channel)))
	, deadline_(deadline)
{
}

TransportResult<InitiateReceipt>
VaultClient::InitiateUpload(const std::string& vault, const std::string& description, uint64_t part_size)
{
	if (!stub_)
		return MakeErr(-1, "stub not initialized");

	grpc::ClientContext ctx;
	ApplyDeadline(ctx);

	InitiateMultipartUploadRequest req;
	req.set_vault_name(vault);
	req.set_archive_description(description);
	req.set_part_size(part_size);

	InitiateMultipartUploadResponse resp;
	grpc::Status st = stub_->InitiateMultipartUpload(&ctx, req, &resp);
	if (!st.ok())
		return MakeGrpcErr(st);

	return InitiateReceipt{ resp.upload_id() };
}

TransportResult<PartReceipt>
VaultClient::UploadPart(const std::string& vault, const std::string& upload_id,
			const ByteRange& range, const std::filesystem::path& body)
{
	if (!stub_)
		return MakeErr(-1, "stub not initialized");

	grpc::ClientContext ctx;
	ApplyDeadline(ctx);

	UploadMultipartPartResponse resp;

	WriterPtr writer = stub_->UploadMultipartPart(&ctx, &resp);
	if (!writer)
		return MakeErr(-1, "failed to create ClientWriter");

	if (auto err = SendHeader(writer, vault, upload_id, range)) {
		ctx.TryCancel();
		return *err;
	}

	if (auto err = SendBody(writer, body, range)) {
		ctx.TryCancel();
		return *err;
	}

	writer->WritesDone();
	grpc::Status st = writer->Finish();
	if (!st.ok())
		return MakeGrpcErr(st);

	return PartReceipt{ resp.checksum() };
}

TransportResult<CompleteReceipt>
VaultClient::CompleteUpload(const std::string& vault, const std::string& upload_id,
			    const std::string& checksum_hex, uint64_t archive_size)
{
	if (!stub_)
		return MakeErr(-1, "stub not initialized");

	grpc::ClientContext ctx;
	ApplyDeadline(ctx);

	CompleteMultipartUploadRequest req;
	req.set_vault_name(vault);
	req.set_upload_id(upload_id);
	req.set_checksum(checksum_hex);
	req.set_archive_size(archive_size);

	CompleteMultipartUploadResponse resp;
	grpc::Status st = stub_->CompleteMultipartUpload(&ctx, req, &resp);
	if (!st.ok())
		return MakeGrpcErr(st);

	return CompleteReceipt{ resp.status_code(), resp.archive().archive_id() };
}

std::optional<TransportError>
VaultClient::AbortUpload(const std::string& vault, const std::string& upload_id)
{
	if (!stub_)
		return MakeErr(-1, "stub not initialized");

	grpc::ClientContext ctx;
	ApplyDeadline(ctx);

	AbortMultipartUploadRequest req;
	req.set_vault_name(vault);
	req.set_upload_id(upload_id);

	AbortMultipartUploadResponse resp;
	grpc::Status st = stub_->AbortMultipartUpload(&ctx, req, &resp);
	if (!st.ok())
		return MakeGrpcErr(st);

	return std::nullopt;
}

std::optional<TransportError>
VaultClient::SendHeader(WriterPtr& writer, const std::string& vault,
			const std::string& upload_id, const ByteRange& range)
{
	UploadMultipartPartRequest req;
	UploadPartHeader header;

	header.set_vault_name(vault);
	header.set_upload_id(upload_id);
	header.mutable_range()->set_first_byte(range.first);
	header.mutable_range()->set_last_byte(range.last);

	*req.mutable_header() = std::move(header);

	if (!writer->Write(req))
		return StreamClosed(writer, "failed to write header");

	return std::nullopt;
}

std::optional<TransportError>
VaultClient::SendBody(WriterPtr& writer, const std::filesystem::path& body, const ByteRange& range)
{
	FileStream stream(body);
	if (const auto &error = stream.Open(std::ios::binary | std::ios::in))
		return MakeErr(-1, "failed to open body: " + error->message);

	constexpr std::size_t kChunkSize = 64 * BUFSIZ;
	std::vector<char> buffer(kChunkSize);

	uint64_t remain = range.Length();

	while (remain > 0) {
		const auto want = static_cast<std::streamsize>(std::min<uint64_t>(remain, buffer.size()));

		const auto &[ok, len, err] = stream.Read(buffer.data(), want);
		if (!ok)
			return MakeErr(-1, "failed to read body: " + err.message);

		if (len <= 0)
			return MakeErr(-1, "body is shorter than " + range.ToString());

		UploadMultipartPartRequest req;
		req.set_data(buffer.data(), static_cast<std::size_t>(len));

		if (!writer->Write(req))
			return StreamClosed(writer, "failed to write data");

		remain -= static_cast<uint64_t>(len);
	}

	if (const auto err = stream.Close())
		return MakeErr(err->code, "failed to close body: " + err->message);

	return std::nullopt;
}

void VaultClient::ApplyDeadline(grpc::ClientContext& ctx) const
{
	if (deadline_.count() > 0)
		ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
}
