#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

struct RetryPolicy {
	unsigned max_attempts = 10;

	// Wait backoff_step * n before attempt n + 1.
	std::chrono::milliseconds backoff_step = std::chrono::seconds(30);
};

struct UploadConfig {
	std::string vault;

	// Relative batch paths are resolved against this directory.
	std::filesystem::path working_dir = ".";

	// Where the staging file lives; empty means the system temp directory.
	std::filesystem::path staging_dir;

	// Describe archives by their relative path instead of the file name.
	bool with_path = false;

	RetryPolicy retry;
};

std::optional<std::string> ValidateUploadConfig(const UploadConfig& config) noexcept;
