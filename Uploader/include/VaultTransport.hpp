#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "ChunkPlanner.hpp"

struct TransportError {
	enum class Kind {
		Timeout = 0,
		Failure
	};

	Kind kind = Kind::Failure;
	int code = 0;
	std::string message;
};

struct InitiateReceipt {
	std::string upload_id;
};

struct PartReceipt {
	// Tree hash of the received range, hex encoded. Empty when the vault
	// answered without one.
	std::string checksum;
};

struct CompleteReceipt {
	int status_code = 0;
	std::string archive_id;
};

template <typename T>
using TransportResult = std::variant<T, TransportError>;

// Remote side of a multipart upload. Calls are synchronous and carry no
// idempotency guarantee beyond byte-range addressing.
class VaultTransport
{
public:
	virtual ~VaultTransport() = default;

public:
	virtual TransportResult<InitiateReceipt> InitiateUpload(const std::string& vault,
								const std::string& description,
								uint64_t part_size) = 0;

	virtual TransportResult<PartReceipt> UploadPart(const std::string& vault,
							const std::string& upload_id,
							const ByteRange& range,
							const std::filesystem::path& body) = 0;

	virtual TransportResult<CompleteReceipt> CompleteUpload(const std::string& vault,
								const std::string& upload_id,
								const std::string& checksum_hex,
								uint64_t archive_size) = 0;

	virtual std::optional<TransportError> AbortUpload(const std::string& vault,
							  const std::string& upload_id) = 0;
};
