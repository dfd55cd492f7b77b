#include "UploadError.hpp"

const char* ToString(UploadError::Kind kind) noexcept
{
	switch (kind) {
	case UploadError::Kind::None:            return "None";
	case UploadError::Kind::NotFound:        return "NotFound";
	case UploadError::Kind::InvalidArgument: return "InvalidArgument";
	case UploadError::Kind::HashError:       return "HashError";
	case UploadError::Kind::StagingError:    return "StagingError";
	case UploadError::Kind::InitiateError:   return "InitiateError";
	case UploadError::Kind::PartExhausted:   return "PartExhaustedError";
	case UploadError::Kind::CommitError:     return "CommitError";
	}

	return "Unknown";
}
