#include <chrono>
#include <cstdio>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include <getopt.h>
#include <unistd.h>

#include <fmt/core.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "ArchiveUploader.hpp"
#include "ByteFormat.hpp"
#include "TaskRunner.hpp"
#include "VaultClient.hpp"

using ArgList = std::map<std::string, std::string>;

struct CommandLine {
	ArgList options;
	std::vector<std::string> files;
};

std::pair<bool, std::variant<CommandLine, std::string>> ParseArgument(int argc, char* argv[])
{
	CommandLine cmdline;
	ArgList& arglist = cmdline.options;

	const struct option options[] = {
		{ "loglevel",    required_argument, nullptr, 'l' },
		{ "vault",       required_argument, nullptr, 'v' },
		{ "workdir",     required_argument, nullptr, 'w' },
		{ "staging-dir", required_argument, nullptr, 's' },
		{ "with-path",   no_argument,       nullptr, 'p' },
		{ "attempts",    required_argument, nullptr, 'a' },
		{ "backoff",     required_argument, nullptr, 'b' },
		{ "timeout",     required_argument, nullptr, 't' },
		{ nullptr, 0, nullptr, 0 }
	};

	try {
		int optidx;
		for (int opt; (opt = getopt_long(argc, argv, "l:v:w:s:pa:b:t:", options, &optidx)) != -1; ) {
			switch (opt) {
			case 'l': arglist["loglevel"] = optarg; break;
			case 'v': arglist["vault"] = optarg; break;
			case 'w': arglist["workdir"] = optarg; break;
			case 's': arglist["staging-dir"] = optarg; break;
			case 'p': arglist["with-path"] = "1"; break;
			case 'a': arglist["attempts"] = optarg; break;
			case 'b': arglist["backoff"] = optarg; break;
			case 't': arglist["timeout"] = optarg; break;
			case ':':
				return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
			case '?':
				return { false, fmt::format("invalid argument: {}", static_cast<char>(optopt)) };
			}
		}
	}
	catch (std::exception& e) {
		return { false, fmt::format("invalid argument: {}", e.what()) };
	}

	const int rest = argc - optind;
	if (rest < 3)
		return { false, fmt::format("usage: {} [--loglevel <level>] [--vault <name>] [--workdir <directory>] "
					    "[--staging-dir <directory>] [--with-path] [--attempts <n>] "
					    "[--backoff <seconds>] [--timeout <seconds>] <host> <service> <file>...", *argv) };

	char** positional = argv + optind;

	arglist["host"] = *positional++;
	arglist["service"] = *positional++;
	for (int i = 2; i < rest; ++i)
		cmdline.files.emplace_back(*positional++);

	arglist.emplace("loglevel", "info");
	arglist.emplace("vault", "default");
	arglist.emplace("workdir", ".");
	arglist.emplace("attempts", "10");
	arglist.emplace("backoff", "30");
	arglist.emplace("timeout", "600");

	return { true, std::move(cmdline) };
}

std::pair<bool, std::variant<UploadConfig, std::string>> MakeConfig(const ArgList& arglist)
{
	UploadConfig config;

	config.vault = arglist.at("vault");
	config.working_dir = arglist.at("workdir");
	if (const auto it = arglist.find("staging-dir"); it != arglist.end())
		config.staging_dir = it->second;
	config.with_path = arglist.count("with-path") != 0;

	try {
		config.retry.max_attempts = static_cast<unsigned>(std::stoul(arglist.at("attempts")));
		config.retry.backoff_step = std::chrono::seconds(std::stoul(arglist.at("backoff")));
	}
	catch (std::exception& e) {
		return { false, fmt::format("invalid number: {}", e.what()) };
	}

	if (auto reason = ValidateUploadConfig(config))
		return { false, *reason };

	return { true, std::move(config) };
}

void ShowArgument(const CommandLine& cmdline)
{
	for (const auto &[name, value]: cmdline.options)
		spdlog::info("{}: {}", name, value);

	for (const auto &file: cmdline.files)
		spdlog::debug("file: {}", file);
}

void ShowProgress(const ProgressUpdate& update)
{
	const double file_pct = update.file_size == 0
		? (update.finished ? 100.0 : 0.0)
		: static_cast<double>(update.file_done) / static_cast<double>(update.file_size) * 100.0;
	const double total_pct = update.batch.bytes_total == 0
		? 0.0
		: static_cast<double>(update.batch.bytes_done) / static_cast<double>(update.batch.bytes_total) * 100.0;

	fmt::print("{}{}, {:.2f}% done ({:.2f}% total)\r", update.prefix, update.name, file_pct, total_pct);
	if (update.finished)
		fmt::print("\n");

	std::fflush(stdout);
}

int main(int argc, char* argv[])
{
	const auto &[success, result] = ParseArgument(argc, argv);
	if (!success) {
		spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
		return 1;
	}

	const CommandLine& cmdline = std::get<CommandLine>(result);
	const ArgList& arglist = cmdline.options;

	spdlog::set_level(spdlog::level::from_str(arglist.at("loglevel")));
	ShowArgument(cmdline);

	auto [configured, config_or_error] = MakeConfig(arglist);
	if (!configured) {
		spdlog::error("invalid configuration: {}", std::get<std::string>(config_or_error));
		return 1;
	}
	const UploadConfig& config = std::get<UploadConfig>(config_or_error);

	std::chrono::seconds timeout{0};
	try {
		timeout = std::chrono::seconds(std::stoul(arglist.at("timeout")));
	}
	catch (std::exception& e) {
		spdlog::error("invalid timeout: {}", e.what());
		return 1;
	}

	uint64_t bytes_total = 0;
	for (const auto &file: cmdline.files) {
		std::error_code ec;
		const auto size = std::filesystem::file_size(config.working_dir / file, ec);
		if (!ec)
			bytes_total += size;
	}

	const std::string target = fmt::format("{}:{}", arglist.at("host"), arglist.at("service"));
	std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
	spdlog::info("channel opened at: {}", target);

	VaultClient client(channel, timeout);
	InlineTaskRunner runner;

	ArchiveUploader uploader(config, client, runner);
	if (isatty(STDOUT_FILENO))
		uploader.SetProgressCallback(ShowProgress);

	if (const auto err = uploader.UploadBatch(cmdline.files, bytes_total)) {
		spdlog::error("upload failed: {} ({})", err->message, ToString(err->kind));
		return 1;
	}

	spdlog::info("uploaded {} file(s), {}", cmdline.files.size(), FormatSize(bytes_total));

	return 0;
}
