#pragma once

#include "vault_service.grpc.pb.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "vault_service.pb.h"
#include "archive.pb.h"

#include "VaultTransport.hpp"

// VaultTransport over the VaultService gRPC API.
class VaultClient final : public VaultTransport
{
public:
	// A zero deadline means calls never time out.
	VaultClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline);

public:
	TransportResult<InitiateReceipt> InitiateUpload(const std::string& vault,
							const std::string& description,
							uint64_t part_size) override;

	TransportResult<PartReceipt> UploadPart(const std::string& vault,
						const std::string& upload_id,
						const ByteRange& range,
						const std::filesystem::path& body) override;

	TransportResult<CompleteReceipt> CompleteUpload(const std::string& vault,
							const std::string& upload_id,
							const std::string& checksum_hex,
							uint64_t archive_size) override;

	std::optional<TransportError> AbortUpload(const std::string& vault,
						  const std::string& upload_id) override;

private:
	using WriterPtr = std::unique_ptr<grpc::ClientWriter<UploadMultipartPartRequest>>;

	std::optional<TransportError> SendHeader(WriterPtr& writer, const std::string& vault,
						 const std::string& upload_id, const ByteRange& range);
	std::optional<TransportError> SendBody(WriterPtr& writer, const std::filesystem::path& body,
					       const ByteRange& range);

	void ApplyDeadline(grpc::ClientContext& ctx) const;

private:
	std::unique_ptr<VaultService::Stub> stub_;
	std::chrono::milliseconds deadline_;
};
