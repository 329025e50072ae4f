#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include "application/MigrationExecutor.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/TransferLog.hpp"
#include "test/TestSupport.hpp"

using namespace tidyfile;
using tidyfile::test::ScratchDir;
namespace fs = std::filesystem;

namespace {

domain::TransferOperation MakeOp(const std::string& source, const std::string& target, bool success) {
    domain::TransferOperation op;
    op.kind = domain::OperationKind::Copy;
    op.sourcePath = source;
    op.targetPath = target;
    op.targetFolder = "Docs";
    op.success = success;
    op.fileSize = 100;
    if (!success) op.errorMessage = "permission denied";
    return op;
}

void TestSessionLifecycle() {
    std::cout << "[Test] Session start, append, end..." << std::endl;
    ScratchDir scratch("log_lifecycle");
    infrastructure::TransferLog log((scratch / "logs").string());

    bool threw = false;
    try {
        log.append(MakeOp("/a", "/b", true));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw && "append without a session must be refused");

    std::string path = log.start("nightly");
    assert(log.isOpen());
    assert(log.currentSessionPath() == path);
    assert(fs::path(path).filename() == "nightly.json");

    auto empty = log.load("nightly");
    assert(empty.operations.empty());
    assert(!empty.info.endTime);

    threw = false;
    try {
        log.start("other");
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw && "second start must be refused");

    std::int64_t previous = 0;
    for (int i = 0; i < 5; ++i) {
        auto recorded = log.append(MakeOp("/src/" + std::to_string(i), "/dst/" + std::to_string(i), i != 3));
        assert(recorded.id > previous);
        assert(!recorded.timestamp.empty());
        previous = recorded.id;
        // Every append is durable before it returns.
        assert(log.load(path).operations.size() == static_cast<std::size_t>(i + 1));
    }

    auto info = log.end();
    assert(!log.isOpen());
    assert(info.totalOperations == 5);
    assert(info.successfulOperations == 4);
    assert(info.failedOperations == 1);

    auto closed = log.load(path);
    assert(closed.info.endTime.has_value());
    assert(closed.operations[3].errorMessage == std::string("permission denied"));

    std::string second = log.start("nightly");
    assert(fs::path(second).filename() == "nightly_1.json");
    assert(log.append(MakeOp("/a", "/b", true)).id == 1);
    log.end();
    std::cout << "[PASS] State machine and strictly increasing ids." << std::endl;
}

void TestRestoreSkipsMissingTargetAndIsIdempotent() {
    std::cout << "[Test] Restore with an externally deleted target..." << std::endl;
    ScratchDir scratch("log_restore");
    test::WriteFile(scratch / "inbox/a.txt", "alpha");
    test::WriteFile(scratch / "inbox/b.txt", "bravo");
    test::WriteFile(scratch / "inbox/c.txt", "charlie");
    fs::create_directories(scratch / "target/Docs");
    std::string targetDir = (scratch / "target/Docs").string();

    auto log = std::make_shared<infrastructure::TransferLog>((scratch / "logs").string());
    application::MigrationExecutor executor(log);
    std::string session = log->start();
    auto results = executor.executePlan({
        {(scratch / "inbox/a.txt").string(), targetDir, domain::OperationKind::Move, "Docs"},
        {(scratch / "inbox/b.txt").string(), targetDir, domain::OperationKind::Move, "Docs"},
        {(scratch / "inbox/c.txt").string(), targetDir, domain::OperationKind::Copy, "Docs"}
    }, false);
    log->end();
    for (const auto& r : results) assert(r.success);

    fs::remove(scratch / "target/Docs/b.txt");
    fs::remove(scratch / "inbox/c.txt");

    auto before = test::Snapshot(scratch / "target");
    auto preview = log->restore(session, std::nullopt, true);
    assert(preview.dryRun);
    assert(preview.restored == 2);
    assert(preview.skipped == 1);
    assert(test::Snapshot(scratch / "target") == before);
    assert(!fs::exists(scratch / "inbox/a.txt"));

    auto report = log->restore(session, std::nullopt, false);
    assert(report.totalOperations == 3);
    assert(report.restored == 2);
    assert(report.skipped == 1);
    assert(report.failed == 0);
    // Newest first.
    assert(report.details[0].operationId == 3);
    assert(report.details[2].operationId == 1);
    for (const auto& detail : report.details) {
        if (detail.operationId == 2) {
            assert(detail.outcome == domain::RestoreOutcome::Skipped);
            assert(detail.message == "target missing");
        }
    }

    assert(test::ReadFile(scratch / "inbox/a.txt") == "alpha");
    assert(!fs::exists(scratch / "target/Docs/a.txt"));
    assert(test::ReadFile(scratch / "inbox/c.txt") == "charlie");
    assert(fs::exists(scratch / "target/Docs/c.txt"));

    auto again = log->restore(session, std::nullopt, false);
    assert(again.restored == 0);
    assert(again.alreadyIntact == 2);
    assert(again.skipped == 1);
    assert(test::ReadFile(scratch / "inbox/a.txt") == "alpha");
    std::cout << "[PASS] Batch completes, second restore changes nothing." << std::endl;
}

void TestRestoreSelectedIds() {
    std::cout << "[Test] Restore of selected operation ids..." << std::endl;
    ScratchDir scratch("log_restore_ids");
    test::WriteFile(scratch / "inbox/a.txt", "alpha");
    test::WriteFile(scratch / "inbox/b.txt", "bravo");
    std::string targetDir = (scratch / "target").string();

    auto log = std::make_shared<infrastructure::TransferLog>((scratch / "logs").string());
    application::MigrationExecutor executor(log);
    std::string session = log->start();
    executor.executePlan({
        {(scratch / "inbox/a.txt").string(), targetDir, domain::OperationKind::Move, ""},
        {(scratch / "inbox/b.txt").string(), targetDir, domain::OperationKind::Move, ""},
        {(scratch / "inbox/ghost.txt").string(), targetDir, domain::OperationKind::Move, ""}
    }, false);
    log->end();

    auto report = log->restore(session, std::vector<std::int64_t>{2, 3}, false);
    // Operation 3 failed and is never replayed.
    assert(report.totalOperations == 1);
    assert(report.restored == 1);
    assert(fs::exists(scratch / "inbox/b.txt"));
    assert(!fs::exists(scratch / "inbox/a.txt"));
    std::cout << "[PASS] Only the selected successful operations are undone." << std::endl;
}

void TestSummaryAndListing() {
    std::cout << "[Test] Summary counts only successful operations..." << std::endl;
    ScratchDir scratch("log_summary");
    infrastructure::TransferLog log((scratch / "logs").string());

    std::string oldPath = log.start("old_session");
    log.append(MakeOp("/a", "/b", true));
    log.end();
    fs::last_write_time(oldPath, fs::file_time_type::clock::now() - std::chrono::hours(24 * 40));

    std::string path = log.start("current");
    log.append(MakeOp("/a1", "/Docs/a1", true));
    auto move = MakeOp("/a2", "/Photos/a2", true);
    move.kind = domain::OperationKind::Move;
    move.targetFolder = "Photos";
    log.append(move);
    log.append(MakeOp("/a3", "/Docs/a3", false));

    auto summary = log.summarize("current");
    assert(summary.info.totalOperations == 3);
    assert(summary.operationKinds["copy"] == 1);
    assert(summary.operationKinds["move"] == 1);
    assert(summary.targetFolders["Docs"] == 1);
    assert(summary.targetFolders["Photos"] == 1);
    assert(summary.totalBytes == 200);

    auto sessions = log.listSessions();
    assert(sessions.size() == 2);
    assert(sessions[0] == path);
    assert(sessions[1] == oldPath);

    assert(log.cleanupOlderThan(30) == 1);
    assert(!fs::exists(oldPath));
    // The open session is never removed, whatever its age.
    assert(log.cleanupOlderThan(0) == 0);
    assert(fs::exists(path));
    log.end();
    std::cout << "[PASS] Summary, listing and cleanup." << std::endl;
}

void TestCorruptDocuments() {
    std::cout << "[Test] Missing and malformed session documents..." << std::endl;
    ScratchDir scratch("log_corrupt");
    infrastructure::TransferLog log((scratch / "logs").string());

    bool ioError = false;
    try {
        log.load("does_not_exist");
    } catch (const domain::IOError&) {
        ioError = true;
    }
    assert(ioError);

    test::WriteFile(scratch / "logs/broken.json", "{\"session_info\": {");
    bool corrupt = false;
    try {
        log.restore("broken", std::nullopt, true);
    } catch (const domain::LogCorruption&) {
        corrupt = true;
    }
    assert(corrupt);

    test::WriteFile(scratch / "logs/unknown.json", R"({"session_info": {"session_name": "unknown"},
        "operations": [{"operation_id": 1, "operation_type": "teleport", "source_path": "/a", "success": true}]})");
    corrupt = false;
    try {
        log.load((scratch / "logs/unknown.json").string());
    } catch (const domain::LogCorruption&) {
        corrupt = true;
    }
    assert(corrupt);
    std::cout << "[PASS] Typed errors for unreadable sessions." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TransferLog Test..." << std::endl;

    TestSessionLifecycle();
    TestRestoreSkipsMissingTargetAndIsIdempotent();
    TestRestoreSelectedIds();
    TestSummaryAndListing();
    TestCorruptDocuments();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
