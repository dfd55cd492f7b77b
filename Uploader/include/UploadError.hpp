#pragma once

#include <string>

struct UploadError {
	enum class Kind {
		None = 0,
		NotFound,
		InvalidArgument,
		HashError,
		StagingError,
		InitiateError,
		PartExhausted,
		CommitError
	};

	Kind kind = Kind::None;
	std::string message;
};

const char* ToString(UploadError::Kind kind) noexcept;
