#include "UploadConfig.hpp"

#include <system_error>

#include <fmt/core.h>

std::optional<std::string> ValidateUploadConfig(const UploadConfig& config) noexcept
{
	if (config.vault.empty())
		return std::string("vault name is empty");

	std::error_code ec;
	if (!std::filesystem::is_directory(config.working_dir, ec))
		return fmt::format("working directory {} is not a directory", config.working_dir.string());

	if (!config.staging_dir.empty() && !std::filesystem::is_directory(config.staging_dir, ec))
		return fmt::format("staging directory {} is not a directory", config.staging_dir.string());

	if (config.retry.max_attempts == 0)
		return std::string("retry policy needs at least one attempt");

	if (config.retry.backoff_step.count() < 0)
		return std::string("backoff step is negative");

	return std::nullopt;
}
