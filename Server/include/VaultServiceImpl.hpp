#pragma once

#include "vault_service.grpc.pb.h"
#include "vault_service.pb.h"
#include "archive.pb.h"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>

#include "MultipartUpload.hpp"

// Stores archives under <root_dir>/<vault>/ and checks every part and every
// completed archive against its SHA-256 tree hash.
class VaultServiceImpl final : public VaultService::Service
{
public:
	VaultServiceImpl(const std::string_view root_dir);
	~VaultServiceImpl();

public:
	bool IsValid() const noexcept;

	// Drops every upload that was never completed, with its data file.
	// Returns how many were dropped.
	size_t DiscardUploads();

private:
	grpc::Status InitiateMultipartUpload(grpc::ServerContext* context,
					     const InitiateMultipartUploadRequest* request,
					     InitiateMultipartUploadResponse* response) override;

	grpc::Status UploadMultipartPart(grpc::ServerContext* context,
					 grpc::ServerReader<UploadMultipartPartRequest>* reader,
					 UploadMultipartPartResponse* response) override;

	grpc::Status CompleteMultipartUpload(grpc::ServerContext* context,
					     const CompleteMultipartUploadRequest* request,
					     CompleteMultipartUploadResponse* response) override;

	grpc::Status AbortMultipartUpload(grpc::ServerContext* context,
					  const AbortMultipartUploadRequest* request,
					  AbortMultipartUploadResponse* response) override;

private:
	static void RemoveData(const MultipartUpload& upload);

	std::tuple<bool, std::shared_ptr<MultipartUpload>, grpc::Status> FindUpload(const std::string& vault,
										    const std::string& upload_id);
	std::tuple<bool, MultipartUpload::Part, grpc::Status> WritePart(grpc::ServerReader<UploadMultipartPartRequest>* reader,
									MultipartUpload& upload,
									const PartRange& range);

private:
	const std::string root_dir_;

	std::mutex mutex_;
	std::unordered_map<std::string, std::shared_ptr<MultipartUpload>> uploads_;
};
