#include <csignal>
#include <filesystem>
#include <memory>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>
#include <string>
#include <map>

#include <getopt.h>
#include <pthread.h>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/grpcpp.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "VaultServiceImpl.hpp"
#include "ServerInterceptor.hpp"

using ArgList = std::map<std::string, std::string>;

struct CommandLine {
    ArgList options;
    std::vector<std::string> vaults;
};

std::pair<bool, std::variant<CommandLine, std::string>> ParseArgument(int argc, char* argv[])
{
    CommandLine cmdline;
    ArgList& arglist = cmdline.options;

    const struct option options[] = {
            { "loglevel", required_argument, nullptr, 'l' },
            { "root-dir", required_argument, nullptr, 'r' },
            { "create-vault", required_argument, nullptr, 'c' },
            { nullptr, 0, nullptr, 0 }
    };

    try {
        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "l:r:c:", options, &optidx)) != -1; ) {
            switch (opt) {
            case 'l':
                arglist["loglevel"] = optarg;
                break;
            case 'r':
                arglist["root-dir"] = optarg;
                break;
            case 'c':
                cmdline.vaults.emplace_back(optarg);
                break;
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

    argc -= optind;
    if (argc < 2)
        return { false, fmt::format("usage: {} [--loglevel <level>] [--root-dir <directory>] [--create-vault <name>]... <host> <service>", *argv) };

    argv += optind;

    arglist["host"] = *argv++;
    arglist["service"] = *argv++;

    arglist.emplace("root-dir", ".");
    arglist.emplace("loglevel", "info");

    return { true, std::move(cmdline) };
}

void ShowArgument(const CommandLine& cmdline)
{
    for (const auto &[name, value]: cmdline.options)
        spdlog::info("{}: {}", name, value);

    for (const auto &vault: cmdline.vaults)
        spdlog::info("vault: {}", vault);
}

bool CreateVaults(const std::filesystem::path& root, const std::vector<std::string>& vaults)
{
    for (const auto &vault: vaults) {
        if (vault.empty() || vault == "." || vault == ".." || vault.find('/') != std::string::npos) {
            spdlog::error("invalid vault name: '{}'", vault);
            return false;
        }

        std::error_code ec;
        std::filesystem::create_directories(root / vault, ec);
        if (ec) {
            spdlog::error("failed to create vault {}: {}", vault, ec.message());
            return false;
        }
    }

    return true;
}

// signals must already be blocked in every thread.
std::thread StartSignalWaiter(grpc::Server& server, sigset_t signals)
{
    return std::thread([&server, signals] {
        int signo = 0;
        if (sigwait(&signals, &signo) != 0) {
            spdlog::error("sigwait failed");
            return;
        }

        spdlog::info("received signal {}, shutting down", signo);
        server.Shutdown();
    });
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

    auto logger = spdlog::stdout_color_mt("vault");
    logger->set_level(spdlog::level::from_str(arglist.at("loglevel")));
    spdlog::set_default_logger(logger);

    ShowArgument(cmdline);

    if (!CreateVaults(arglist.at("root-dir"), cmdline.vaults))
        return 1;

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        spdlog::error("failed to block termination signals");
        return 1;
    }

    VaultServiceImpl service(arglist.at("root-dir"));
    if (!service.IsValid()) {
        spdlog::error("failed to create vault service: invalid root directory {}", arglist.at("root-dir"));
        return 1;
    }
    spdlog::info("registered service(s): Vault");

    std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> interceptors;
    interceptors.push_back(std::make_unique<ServerInterceptorFactory>(logger));

    grpc::ServerBuilder builder;
    builder.AddListeningPort(fmt::format("{}:{}", arglist.at("host"), arglist.at("service")), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    builder.experimental().SetInterceptorCreators(std::move(interceptors));

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("failed to start server on {}:{}", arglist.at("host"), arglist.at("service"));
        return 1;
    }
    spdlog::info("server started: listening on {}:{}", arglist.at("host"), arglist.at("service"));

    std::thread waiter = StartSignalWaiter(*server, signals);
    server->Wait();
    waiter.join();

    spdlog::info("server stopped");

    return 0;
}
