#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "TreeHash.hpp"
#include "VaultTransport.hpp"
#include "TestSupport.hpp"

// In-memory vault. Parts are answered with the real tree hash of the staged
// body unless part_script overrides the call.
class FakeVaultTransport final : public VaultTransport
{
public:
	struct PartCall {
		std::string upload_id;
		ByteRange range;
		std::string body;
	};

	struct CompleteCall {
		std::string upload_id;
		std::string checksum;
		uint64_t size = 0;
	};

	// Called with the zero-based index of the UploadPart call.
	using PartScript = std::function<std::optional<TransportResult<PartReceipt>>(size_t call, const ByteRange& range)>;

public:
	TransportResult<InitiateReceipt> InitiateUpload(const std::string& vault,
							const std::string& description,
							uint64_t part_size) override
	{
		initiated.push_back(description);
		part_sizes.push_back(part_size);

		if (initiate_error)
			return TransportError{ TransportError::Kind::Failure, 14, "vault unavailable" };

		return InitiateReceipt{ upload_id_for_next };
	}

	TransportResult<PartReceipt> UploadPart(const std::string& vault,
						const std::string& upload_id,
						const ByteRange& range,
						const std::filesystem::path& body) override
	{
		const size_t call = part_calls.size();
		part_calls.push_back(PartCall{ upload_id, range, read_file(body) });

		if (part_script) {
			if (auto scripted = part_script(call, range))
				return *scripted;
		}

		auto [ok, digest, err] = TreeHash::FromBuffer(part_calls.back().body);
		if (!ok)
			return TransportError{ TransportError::Kind::Failure, -1, err.message };

		return PartReceipt{ TreeHash::ToHex(digest) };
	}

	TransportResult<CompleteReceipt> CompleteUpload(const std::string& vault,
							const std::string& upload_id,
							const std::string& checksum_hex,
							uint64_t archive_size) override
	{
		completes.push_back(CompleteCall{ upload_id, checksum_hex, archive_size });

		if (complete_error)
			return TransportError{ TransportError::Kind::Failure, 13, "archive assembly failed" };

		return CompleteReceipt{ complete_status, "archive-" + std::to_string(completes.size()) };
	}

	std::optional<TransportError> AbortUpload(const std::string& vault,
						  const std::string& upload_id) override
	{
		aborts.push_back(upload_id);

		if (abort_error)
			return TransportError{ TransportError::Kind::Failure, 5, "no such upload" };

		return std::nullopt;
	}

public:
	std::string upload_id_for_next = "upload-1";
	bool initiate_error = false;
	bool complete_error = false;
	bool abort_error = false;
	int complete_status = 0;
	PartScript part_script;

	std::vector<std::string> initiated;
	std::vector<uint64_t> part_sizes;
	std::vector<PartCall> part_calls;
	std::vector<CompleteCall> completes;
	std::vector<std::string> aborts;
};
