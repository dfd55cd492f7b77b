#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/support/interceptor.h>
#include <grpcpp/grpcpp.h>

#include <spdlog/spdlog.h>

// Logs one line per vault RPC: method, outcome, streamed message count and
// latency. Failed calls are logged at warn level with the status message.
class ServerInterceptor final : public grpc::experimental::Interceptor {
public:
	explicit ServerInterceptor(grpc::experimental::ServerRpcInfo *info,
				   std::shared_ptr<spdlog::logger> logger)
		: method_(info && info->method() ? info->method() : "")
		, logger_(std::move(logger))
		, start_(std::chrono::steady_clock::now()) { }

public:
	void Intercept(grpc::experimental::InterceptorBatchMethods *methods) override {
		using grpc::experimental::InterceptionHookPoints;

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_MESSAGE))
			recv_messages_.fetch_add(1, std::memory_order_relaxed);

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_STATUS))
			LogStatus(methods->GetSendStatus());

		methods->Proceed();
	}

private:
	void LogStatus(const grpc::Status& st) const {
		if (!logger_)
			return;

		const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start_).count();
		const int64_t messages = recv_messages_.load(std::memory_order_relaxed);

		if (st.ok()) {
			logger_->info("[vault] {} ok msgs={} latency_ms={}", method_, messages, ms);
			return;
		}

		logger_->warn("[vault] {} failed code={} \"{}\" msgs={} latency_ms={}",
			      method_, static_cast<int>(st.error_code()), st.error_message(), messages, ms);
	}

private:
	const std::string method_;
	std::shared_ptr<spdlog::logger> logger_;

	std::chrono::steady_clock::time_point start_;
	std::atomic<int64_t> recv_messages_{0};
};

class ServerInterceptorFactory final
	: public grpc::experimental::ServerInterceptorFactoryInterface {
public:
	explicit ServerInterceptorFactory(std::shared_ptr<spdlog::logger> logger)
		: logger_(std::move(logger)) { }

	grpc::experimental::Interceptor* CreateServerInterceptor(
		grpc::experimental::ServerRpcInfo *info
	) override
	{
		return new ServerInterceptor(info, logger_);
	}

private:
	std::shared_ptr<spdlog::logger> logger_;
};
