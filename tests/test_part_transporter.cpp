// Per-part retry behaviour: backoff schedule, exhaustion, outcome
// classification and session bookkeeping.

#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "ChunkPlanner.hpp"
#include "PartTransporter.hpp"
#include "StagingFile.hpp"
#include "TreeHash.hpp"
#include "UploadSession.hpp"
#include "FakeVaultTransport.hpp"
#include "AllocationFailure.hpp"
#include "TestSupport.hpp"

using namespace std::chrono_literals;

namespace {
    struct Fixture {
        fs::path dir;
        fs::path file;
        std::string content;
        UploadConfig config;
        UploadSession session;
        BatchProgress progress;
        std::vector<std::chrono::milliseconds> sleeps;

        Fixture(const std::string& name, uint64_t size) {
            dir = make_temp_dir(name);
            file = dir / "archive.bin";
            content = make_content(size, static_cast<uint32_t>(size));
            write_file(file, content);

            config.vault = "test";
            config.working_dir = dir;
            config.staging_dir = dir;

            session.name = "archive.bin";
            session.size = size;
            session.upload_id = "upload-1";
            session.plan = ChunkPlanner::Plan(size);

            auto [ok, tree, err] = TreeHash::FromFile(file, session.plan.part_size);
            if (!ok)
                throw std::runtime_error(err.message);
            session.tree = std::move(tree);

            progress.bytes_total = size;
        }

        ~Fixture() {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        SleepFunction Recorder() {
            return [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); };
        }
    };

    TransportResult<PartReceipt> Receipt(const std::string& checksum) {
        return PartReceipt{ checksum };
    }

    TransportResult<PartReceipt> Timeout() {
        return TransportError{ TransportError::Kind::Timeout, 4, "deadline exceeded" };
    }
}

static void test_success() {
    std::cout << "\n=== PartTransporter success ===" << std::endl;

    {
        TEST(parts_in_order_reassemble_the_file);
        Fixture fx("transporter-ok", 3 * MiB + 5);
        FakeVaultTransport vault;
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        const uint64_t count = ChunkPlanner::PartCount(fx.session.size, fx.session.plan.part_size);
        ASSERT_EQ(count, 4u, "part count");

        for (uint64_t i = 0; i < count; ++i) {
            auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, i, fx.progress);
            ASSERT_TRUE(ok, err.message);
            ASSERT_EQ(report.attempts.size(), 1u, "attempts for part " << i);
            ASSERT_EQ(fx.session.parts_completed, i + 1, "parts completed");
        }

        ASSERT_EQ(fx.session.offset, fx.session.size, "offset");
        ASSERT_EQ(fx.progress.bytes_done, fx.session.size, "bytes done");
        ASSERT_TRUE(fx.sleeps.empty(), "no backoff");

        std::string joined;
        for (const auto& call : vault.part_calls) {
            ASSERT_EQ(call.upload_id, std::string("upload-1"), "upload id");
            ASSERT_EQ(call.body.size(), call.range.Length(), "body matches range");
            joined += call.body;
        }
        ASSERT_TRUE(joined == fx.content, "bodies reassemble the file");
        PASS();
    }

    {
        TEST(timeout_then_success_advances_once);
        Fixture fx("transporter-timeout", 2 * MiB);
        FakeVaultTransport vault;
        vault.part_script = [](size_t call, const ByteRange&) -> std::optional<TransportResult<PartReceipt>> {
            if (call < 3)
                return Timeout();
            return std::nullopt;
        };
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);
        ASSERT_TRUE(ok, err.message);
        ASSERT_EQ(report.attempts.size(), 4u, "attempts");
        ASSERT_TRUE(report.attempts[2] == AttemptOutcome::Timeout, "third attempt timed out");
        ASSERT_TRUE(report.attempts[3] == AttemptOutcome::Accepted, "fourth accepted");
        ASSERT_EQ(fx.session.parts_completed, 1u, "parts completed");
        ASSERT_EQ(fx.session.offset, MiB, "offset");
        ASSERT_EQ(fx.progress.bytes_done, MiB, "bytes done");

        ASSERT_EQ(fx.sleeps.size(), 3u, "sleeps");
        ASSERT_TRUE(fx.sleeps[0] == 30s && fx.sleeps[1] == 60s && fx.sleeps[2] == 90s, "linear backoff");

        // the same range was re-sent each time
        ASSERT_EQ(vault.part_calls.size(), 4u, "calls");
        for (const auto& call : vault.part_calls)
            ASSERT_EQ(call.range.first, 0u, "range start");
        PASS();
    }
}

static void test_exhaustion() {
    std::cout << "\n=== PartTransporter exhaustion ===" << std::endl;

    {
        TEST(persistent_mismatch_exhausts_ten_attempts);
        Fixture fx("transporter-mismatch", MiB + 10);
        FakeVaultTransport vault;
        vault.part_script = [](size_t, const ByteRange&) -> std::optional<TransportResult<PartReceipt>> {
            return Receipt(std::string(64, '0'));
        };
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);
        ASSERT_TRUE(!ok, "should fail");
        ASSERT_TRUE(err.kind == UploadError::Kind::PartExhausted, "kind");
        ASSERT_TRUE(err.message.find("archive.bin") != std::string::npos, "message names file");
        ASSERT_TRUE(err.message.find("bytes 0-1048575/*") != std::string::npos, "message names range");

        ASSERT_EQ(report.attempts.size(), 10u, "attempts");
        for (auto outcome : report.attempts)
            ASSERT_TRUE(outcome == AttemptOutcome::ChecksumMismatch, "outcome");

        ASSERT_EQ(fx.sleeps.size(), 9u, "sleeps");
        for (size_t i = 0; i < fx.sleeps.size(); ++i)
            ASSERT_TRUE(fx.sleeps[i] == std::chrono::seconds(30 * (i + 1)), "delay " << i);

        ASSERT_EQ(fx.session.parts_completed, 0u, "nothing completed");
        ASSERT_EQ(fx.session.offset, 0u, "offset unchanged");
        ASSERT_EQ(fx.progress.bytes_done, 0u, "progress unchanged");
        PASS();
    }

    {
        TEST(missing_checksum_is_distinct_from_mismatch);
        Fixture fx("transporter-missing", MiB);
        fx.config.retry.max_attempts = 2;
        FakeVaultTransport vault;
        vault.part_script = [](size_t call, const ByteRange&) -> std::optional<TransportResult<PartReceipt>> {
            if (call == 0)
                return Receipt("");
            return Receipt("deadbeef");
        };
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);
        ASSERT_TRUE(!ok, "should fail");
        ASSERT_EQ(report.attempts.size(), 2u, "attempts");
        ASSERT_TRUE(report.attempts[0] == AttemptOutcome::ChecksumMissing, "first missing");
        ASSERT_TRUE(report.attempts[1] == AttemptOutcome::ChecksumMismatch, "second mismatch");
        ASSERT_EQ(fx.sleeps.size(), 1u, "one sleep");
        ASSERT_TRUE(err.message.find("checksum mismatch") != std::string::npos, "last outcome in message");
        PASS();
    }

    {
        TEST(transport_failure_is_retried);
        Fixture fx("transporter-failure", MiB);
        fx.config.retry.backoff_step = 5s;
        FakeVaultTransport vault;
        vault.part_script = [](size_t call, const ByteRange&) -> std::optional<TransportResult<PartReceipt>> {
            if (call == 0)
                return TransportResult<PartReceipt>(TransportError{ TransportError::Kind::Failure, 14, "unavailable" });
            return std::nullopt;
        };
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);
        ASSERT_TRUE(ok, err.message);
        ASSERT_TRUE(report.attempts[0] == AttemptOutcome::TransportFailure, "first failed");
        ASSERT_EQ(fx.sleeps.size(), 1u, "one sleep");
        ASSERT_TRUE(fx.sleeps[0] == 5s, "configured step");
        PASS();
    }
}

static void test_retry_log() {
    std::cout << "\n=== PartTransporter retry log ===" << std::endl;

    {
        TEST(sub_second_backoff_is_logged_exactly);
        Fixture fx("transporter-log", MiB);
        fx.config.retry.max_attempts = 2;
        fx.config.retry.backoff_step = 250ms;
        FakeVaultTransport vault;
        vault.part_script = [](size_t call, const ByteRange&) -> std::optional<TransportResult<PartReceipt>> {
            if (call == 0)
                return Timeout();
            return std::nullopt;
        };
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        std::ostringstream captured;
        auto previous = spdlog::default_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("%v");
        spdlog::set_default_logger(logger);

        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);

        spdlog::set_default_logger(previous);

        ASSERT_TRUE(ok, err.message);
        const std::string log = captured.str();
        ASSERT_TRUE(log.find("retrying in 0.25s") != std::string::npos, "log was: " << log);
        ASSERT_TRUE(log.find("1 tries left") != std::string::npos, "log was: " << log);
        PASS();
    }
}

static void test_preconditions() {
    std::cout << "\n=== PartTransporter preconditions ===" << std::endl;

    {
        TEST(out_of_order_and_out_of_range_rejected);
        Fixture fx("transporter-order", 2 * MiB);
        FakeVaultTransport vault;
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        auto [ok1, r1, e1] = transporter.SendPart(fx.session, fx.file, 1, fx.progress);
        ASSERT_TRUE(!ok1, "skipping ahead");
        ASSERT_TRUE(e1.kind == UploadError::Kind::InvalidArgument, "kind");

        auto [ok2, r2, e2] = transporter.SendPart(fx.session, fx.file, 2, fx.progress);
        ASSERT_TRUE(!ok2, "past the end");
        ASSERT_TRUE(e2.kind == UploadError::Kind::InvalidArgument, "kind");

        ASSERT_TRUE(vault.part_calls.empty(), "nothing sent");
        PASS();
    }

    {
        TEST(allocation_failure_is_a_staging_error);
        Fixture fx("transporter-nomem", MiB);
        FakeVaultTransport vault;
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        fail_large_allocations = true;
        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);
        fail_large_allocations = false;

        ASSERT_TRUE(!ok, "should fail");
        ASSERT_TRUE(err.kind == UploadError::Kind::StagingError, "kind");
        ASSERT_TRUE(vault.part_calls.empty(), "nothing sent");
        ASSERT_EQ(fx.session.parts_completed, 0u, "nothing completed");
        PASS();
    }

    {
        TEST(unreadable_source_is_a_staging_error);
        Fixture fx("transporter-staging", 2 * MiB);
        FakeVaultTransport vault;
        StagingFile staging(fx.dir);
        ASSERT_TRUE(!staging.Create(), "staging");
        PartTransporter transporter(fx.config, vault, staging, fx.Recorder());

        // the source shrank after hashing
        write_file(fx.file, fx.content.substr(0, 100));

        auto [ok, report, err] = transporter.SendPart(fx.session, fx.file, 0, fx.progress);
        ASSERT_TRUE(!ok, "should fail");
        ASSERT_TRUE(err.kind == UploadError::Kind::StagingError, "kind");
        ASSERT_TRUE(report.attempts.empty(), "no attempts");
        ASSERT_TRUE(vault.part_calls.empty(), "nothing sent");
        PASS();
    }
}

int main() {
    std::cout << "part transporter test suite" << std::endl;

    spdlog::set_level(spdlog::level::off);

    test_success();
    test_exhaustion();
    test_retry_log();
    test_preconditions();

    TEST_SUMMARY("part transporter");

    return tests_failed > 0 ? 1 : 0;
}
