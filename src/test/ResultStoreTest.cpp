#include <cassert>
#include <iostream>
#include <set>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include "domain/CrossProcessLock.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ResultStore.hpp"
#include "test/TestSupport.hpp"

using namespace tidyfile;
using tidyfile::test::ScratchDir;
namespace fs = std::filesystem;

namespace {

domain::ResultEntry MakeEntry(const std::string& fileName, const std::string& target,
                              domain::OutcomeStatus status = domain::OutcomeStatus::Migrated) {
    domain::ResultEntry e;
    e.processedAt = "2025-01-15T14:03:22";
    e.fileName = fileName;
    e.sourcePath = "/inbox/" + fileName;
    e.targetFolder = "Docs";
    e.finalTargetPath = target;
    e.operation = "copy";
    e.status = status;
    e.levelTags = {"Docs"};
    e.depth = domain::MatchDepth::Complete;
    e.extension = fs::path(fileName).extension().string();
    e.sizeBytes = 42;
    return e;
}

void TestUntargetedEntriesKeyedBySource() {
    std::cout << "[Test] Same-named failures from different folders..." << std::endl;
    ScratchDir scratch("store_untargeted");
    infrastructure::ResultStore store((scratch / "results.json").string());

    auto first = MakeEntry("report.pdf", "", domain::OutcomeStatus::ClassificationFailed);
    first.sourcePath = "/inbox/a/report.pdf";
    auto second = MakeEntry("report.pdf", "", domain::OutcomeStatus::ClassificationFailed);
    second.sourcePath = "/inbox/b/report.pdf";

    assert(store.append(first) == infrastructure::AppendStatus::Appended);
    assert(store.append(second) == infrastructure::AppendStatus::Appended);
    assert(store.append(first) == infrastructure::AppendStatus::Duplicate);

    // A migrated entry is still keyed by its target alone.
    auto moved = MakeEntry("report.pdf", "/target/Docs/report.pdf");
    moved.sourcePath = "/inbox/a/report.pdf";
    auto again = moved;
    again.sourcePath = "/elsewhere/report.pdf";
    assert(store.append(moved) == infrastructure::AppendStatus::Appended);
    assert(store.append(again) == infrastructure::AppendStatus::Duplicate);

    auto all = store.readAll();
    assert(all.size() == 3);
    assert(all[0].sourcePath == "/inbox/a/report.pdf");
    assert(all[1].sourcePath == "/inbox/b/report.pdf");
    std::cout << "[PASS] Both failures kept, migrated entries still deduplicated by target." << std::endl;
}

void TestAppendAndDuplicates() {
    std::cout << "[Test] Append, read back, duplicate detection..." << std::endl;
    ScratchDir scratch("store_basic");
    infrastructure::ResultStore store((scratch / "results.json").string());

    assert(store.readAll().empty());

    auto entry = MakeEntry("a.pdf", "/target/Docs/a.pdf");
    entry.summary = "Quarterly numbers";
    entry.reason = "level 1: literal - file name contains Docs";
    entry.timing.totalSeconds = 1.5;
    assert(store.append(entry) == infrastructure::AppendStatus::Appended);
    assert(store.append(entry) == infrastructure::AppendStatus::Duplicate);
    assert(infrastructure::IsAppendSuccess(infrastructure::AppendStatus::Duplicate));
    assert(store.append(MakeEntry("a.pdf", "/target/Other/a.pdf")) == infrastructure::AppendStatus::Appended);

    auto all = store.readAll();
    assert(all.size() == 2);
    assert(all[0].fileName == "a.pdf");
    assert(all[0].summary == "Quarterly numbers");
    assert(all[0].status == domain::OutcomeStatus::Migrated);
    assert(all[0].levelTags == std::vector<std::string>{"Docs"});
    assert(all[0].timing.totalSeconds == 1.5);
    assert(all[0].sizeBytes == 42);

    auto batch = store.appendBatch({MakeEntry("b.pdf", "/t/b.pdf"), MakeEntry("b.pdf", "/t/b.pdf"),
                                    MakeEntry("a.pdf", "/target/Docs/a.pdf"), MakeEntry("c.pdf", "")});
    assert(batch.status == infrastructure::AppendStatus::Appended);
    assert(batch.appended == 2);
    assert(batch.duplicates == 2);
    assert(store.readAll().size() == 4);
    std::cout << "[PASS] Records unique by file name and final target path." << std::endl;
}

void TestConcurrentThreads() {
    std::cout << "[Test] Concurrent appends from threads..." << std::endl;
    ScratchDir scratch("store_threads");
    infrastructure::ResultStore store((scratch / "results.json").string());

    const int kThreads = 8;
    const int kPerThread = 25;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, &failures, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                std::string name = "t" + std::to_string(t) + "_" + std::to_string(i) + ".txt";
                if (store.append(MakeEntry(name, "/target/" + name)) != infrastructure::AppendStatus::Appended) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(failures == 0);
    auto all = store.readAll();
    assert(all.size() == static_cast<std::size_t>(kThreads * kPerThread));
    std::set<std::string> names;
    for (const auto& e : all) names.insert(e.fileName);
    assert(names.size() == all.size());
    std::cout << "[PASS] " << all.size() << " distinct records." << std::endl;
}

void TestConcurrentProcesses() {
    std::cout << "[Test] Concurrent appends from separate processes..." << std::endl;
    ScratchDir scratch("store_processes");
    std::string path = (scratch / "results.json").string();

    const int kProcesses = 4;
    const int kPerProcess = 20;
    std::vector<pid_t> children;
    for (int p = 0; p < kProcesses; ++p) {
        pid_t pid = fork();
        assert(pid >= 0);
        if (pid == 0) {
            infrastructure::ResultStore store(path);
            int failed = 0;
            for (int i = 0; i < kPerProcess; ++i) {
                std::string name = "p" + std::to_string(p) + "_" + std::to_string(i) + ".txt";
                if (store.append(MakeEntry(name, "/target/" + name)) != infrastructure::AppendStatus::Appended) {
                    ++failed;
                }
            }
            _exit(failed == 0 ? 0 : 1);
        }
        children.push_back(pid);
    }

    for (pid_t child : children) {
        int status = 0;
        waitpid(child, &status, 0);
        assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
    }

    infrastructure::ResultStore store(path);
    auto all = store.readAll();
    assert(all.size() == static_cast<std::size_t>(kProcesses * kPerProcess));
    std::cout << "[PASS] No record lost across processes." << std::endl;
}

void TestCorruptStoreIsNeverOverwritten() {
    std::cout << "[Test] Corrupt store refuses writes..." << std::endl;
    ScratchDir scratch("store_corrupt");
    auto path = scratch / "results.json";
    test::WriteFile(path, "[{\"file_name\": \"a.pdf\",");
    infrastructure::ResultStore store(path.string());

    assert(store.append(MakeEntry("b.pdf", "/t/b.pdf")) == infrastructure::AppendStatus::Corrupted);
    assert(!infrastructure::IsAppendSuccess(infrastructure::AppendStatus::Corrupted));
    assert(test::ReadFile(path) == "[{\"file_name\": \"a.pdf\",");

    bool threw = false;
    try {
        store.readAll();
    } catch (const domain::LogCorruption&) {
        threw = true;
    }
    assert(threw);

    test::WriteFile(path, "{\"not\": \"an array\"}");
    assert(store.append(MakeEntry("b.pdf", "/t/b.pdf")) == infrastructure::AppendStatus::Corrupted);

    test::WriteFile(path, "  \n");
    assert(store.append(MakeEntry("b.pdf", "/t/b.pdf")) == infrastructure::AppendStatus::Appended);
    assert(store.readAll().size() == 1);
    std::cout << "[PASS] Corruption reported, whitespace treated as empty." << std::endl;
}

void TestLockTimeout() {
    std::cout << "[Test] Store lock held elsewhere..." << std::endl;
    ScratchDir scratch("store_lock");
    std::string path = (scratch / "results.json").string();
    infrastructure::ResultStore store(path, std::chrono::milliseconds(50));

    auto other = domain::CrossProcessLock::Create(path + ".lock");
    assert(other->lock(std::chrono::milliseconds(100)));
    assert(store.append(MakeEntry("a.pdf", "/t/a.pdf")) == infrastructure::AppendStatus::IoFailure);
    other->unlock();
    assert(store.append(MakeEntry("a.pdf", "/t/a.pdf")) == infrastructure::AppendStatus::Appended);
    std::cout << "[PASS] Write refused while locked, accepted after release." << std::endl;
}

void TestStatistics() {
    std::cout << "[Test] Statistics..." << std::endl;
    ScratchDir scratch("store_stats");
    infrastructure::ResultStore store((scratch / "results.json").string());

    std::vector<domain::ResultEntry> entries;
    for (int i = 0; i < 12; ++i) {
        std::string name = "file" + std::to_string(i) + (i % 2 ? ".pdf" : ".txt");
        entries.push_back(MakeEntry(name, "/t/" + name));
    }
    entries.push_back(MakeEntry("odd", "", domain::OutcomeStatus::ClassificationFailed));
    store.appendBatch(entries);

    auto stats = store.statistics();
    assert(stats.totalEntries == 13);
    assert(stats.successCount == 12);
    assert(stats.failureCount == 1);
    assert(stats.byStatus["migrated"] == 12);
    assert(stats.byStatus["classification_failed"] == 1);
    assert(stats.byExtension[".pdf"] == 6);
    assert(stats.byExtension["(none)"] == 1);
    assert(stats.recentEntries.size() == 10);
    assert(stats.recentEntries.back().fileName == "odd");
    std::cout << "[PASS] Counts and recent entries." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ResultStore Test..." << std::endl;

    TestAppendAndDuplicates();
    TestUntargetedEntriesKeyedBySource();
    TestConcurrentProcesses();
    TestConcurrentThreads();
    TestCorruptStoreIsNeverOverwritten();
    TestLockTimeout();
    TestStatistics();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
