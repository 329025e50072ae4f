#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include "application/Matchers.hpp"
#include "application/OrganizerService.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "test/TestSupport.hpp"

using namespace tidyfile;
using tidyfile::test::MockBackend;
using tidyfile::test::MockContentSource;
using tidyfile::test::ScratchDir;
namespace fs = std::filesystem;

namespace {

struct Harness {
    std::shared_ptr<MockBackend> backend = std::make_shared<MockBackend>();
    std::shared_ptr<infrastructure::TransferLog> log;
    std::shared_ptr<infrastructure::ResultStore> store;
    std::unique_ptr<application::OrganizerService> organizer;
};

std::unique_ptr<Harness> MakeHarness(const ScratchDir& scratch, std::chrono::milliseconds timeout, int workers) {
    auto h = std::make_unique<Harness>();
    auto summarizer = std::make_shared<application::ContentSummarizer>(std::make_shared<MockContentSource>(),
                                                                       h->backend, 2000, 150);
    auto rules = std::make_shared<const domain::ClassificationRules>();
    std::vector<std::shared_ptr<domain::Matcher>> matchers;
    matchers.push_back(std::make_shared<application::TemporalMatcher>(1900, 2099));
    matchers.push_back(std::make_shared<application::LiteralMatcher>());
    matchers.push_back(std::make_shared<application::ContentAssistedMatcher>(summarizer, rules));
    matchers.push_back(std::make_shared<application::FuzzyMatcher>(rules));
    auto classifier = std::make_shared<application::SmartClassifier>(std::move(matchers), 10);

    h->log = std::make_shared<infrastructure::TransferLog>((scratch / "logs").string());
    h->store = std::make_shared<infrastructure::ResultStore>((scratch / "results.json").string());
    auto executor = std::make_shared<application::MigrationExecutor>(h->log);

    application::OrganizerService::Settings settings;
    settings.workers = workers;
    settings.classificationTimeout = timeout;
    h->organizer = std::make_unique<application::OrganizerService>(classifier, executor, h->log, h->store, settings);
    return h;
}

void Populate(const ScratchDir& scratch) {
    test::MakeDirs(scratch / "target", {"2023", "2024", "Invoices", "Photos/Family", "Photos/Travel"});
    test::WriteFile(scratch / "inbox/Annual_Report_2023.pdf", "annual");
    test::WriteFile(scratch / "inbox/invoices_march.pdf", "march");
    test::WriteFile(scratch / "inbox/photos_travel_rome.jpg", "rome");
    test::WriteFile(scratch / "inbox/sub/Budget_2024.xlsx", "budget");
    test::WriteFile(scratch / "inbox/random.bin", "zzz");
    test::WriteFile(scratch / "inbox/.hidden_2023.txt", "hidden");
}

void TestScanAndClassify() {
    std::cout << "[Test] Scan and single-file classify..." << std::endl;
    ScratchDir scratch("organize_scan");
    Populate(scratch);
    auto h = MakeHarness(scratch, std::chrono::milliseconds(5000), 2);

    auto files = h->organizer->scan({(scratch / "inbox").string(), (scratch / "missing").string()});
    assert(files.size() == 5);
    for (const auto& f : files) {
        assert(f.name.front() != '.');
        assert(f.sizeBytes > 0);
    }

    auto decision = h->organizer->classify(files[0], (scratch / "target").string());
    assert(decision.success);
    assert(decision.relativePath == "2023");
    std::cout << "[PASS] Hidden files skipped, missing directory tolerated." << std::endl;
}

void TestDryRunMutatesNothing() {
    std::cout << "[Test] Dry run organize..." << std::endl;
    ScratchDir scratch("organize_dry");
    Populate(scratch);
    auto h = MakeHarness(scratch, std::chrono::milliseconds(5000), 4);
    h->backend->down = true;

    auto before = test::Snapshot(scratch.path());
    auto files = h->organizer->scan({(scratch / "inbox").string()});
    application::OrganizeOptions options;
    options.dryRun = true;
    auto report = h->organizer->organize(files, (scratch / "target").string(), options);

    assert(test::Snapshot(scratch.path()) == before);
    assert(!fs::exists(scratch / "results.json"));
    assert(h->log->listSessions().empty());
    assert(report.sessionPath.empty());

    assert(report.outcomes.size() == files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        assert(report.outcomes[i].sourcePath == files[i].path);
    }
    assert(report.planned == 4);
    assert(report.classificationFailed == 1);
    assert(report.migrated == 0);
    std::cout << "[PASS] Preview only, one outcome per file in input order." << std::endl;
}

void TestRealRunLogsAndStores() {
    std::cout << "[Test] Applied organize with copy..." << std::endl;
    ScratchDir scratch("organize_apply");
    Populate(scratch);
    auto h = MakeHarness(scratch, std::chrono::milliseconds(5000), 4);
    h->backend->down = true;

    auto files = h->organizer->scan({(scratch / "inbox").string()});
    application::OrganizeOptions options;
    options.dryRun = false;
    options.operation = domain::OperationKind::Copy;
    options.sessionName = "organize_test";
    auto report = h->organizer->organize(files, (scratch / "target").string(), options);

    assert(report.migrated == 4);
    assert(report.classificationFailed == 1);
    assert(fs::exists(scratch / "target/2023/Annual_Report_2023.pdf"));
    assert(fs::exists(scratch / "target/2024/Budget_2024.xlsx"));
    assert(fs::exists(scratch / "target/Invoices/invoices_march.pdf"));
    assert(fs::exists(scratch / "target/Photos/Travel/photos_travel_rome.jpg"));
    assert(fs::exists(scratch / "inbox/Annual_Report_2023.pdf"));
    assert(!h->log->isOpen());

    auto session = h->log->load(report.sessionPath);
    assert(session.info.name == "organize_test");
    assert(session.operations.size() == 4);
    assert(session.info.endTime.has_value());
    std::set<std::int64_t> ids;
    for (const auto& op : session.operations) ids.insert(op.id);
    assert(ids == (std::set<std::int64_t>{1, 2, 3, 4}));

    assert(report.storeAppended == 5);
    auto entries = h->store->readAll();
    assert(entries.size() == 5);
    int unmatched = 0;
    for (const auto& e : entries) {
        if (e.status == domain::OutcomeStatus::ClassificationFailed) {
            ++unmatched;
            assert(e.errorKind == domain::ErrorKind::ClassificationFailure);
            assert(e.finalTargetPath.empty());
        } else {
            assert(e.status == domain::OutcomeStatus::Migrated);
            assert(!e.finalTargetPath.empty());
            assert(e.operation == "copy");
        }
    }
    assert(unmatched == 1);

    assert(h->organizer->listSessions().size() == 1);
    assert(h->organizer->summarize(report.sessionPath).operationKinds["copy"] == 4);
    auto stats = h->organizer->statistics();
    assert(stats.totalEntries == 5);
    assert(stats.successCount == 4);
    assert(stats.failureCount == 1);
    assert(h->organizer->cleanupSessions(30) == 0);

    // Undo the session through the same driver.
    for (const auto& f : files) fs::remove(f.path);
    auto restore = h->organizer->restore(report.sessionPath, std::nullopt, false);
    assert(restore.restored == 4);
    assert(fs::exists(scratch / "inbox/sub/Budget_2024.xlsx"));
    std::cout << "[PASS] Session logged, results stored, session restorable." << std::endl;
}

void TestSameNamedFailuresAllStored() {
    std::cout << "[Test] Unclassified files sharing a name..." << std::endl;
    ScratchDir scratch("organize_samename");
    test::MakeDirs(scratch / "target", {"Zeta"});
    test::WriteFile(scratch / "inbox/a/report.pdf", "first");
    test::WriteFile(scratch / "inbox/b/report.pdf", "second");
    auto h = MakeHarness(scratch, std::chrono::milliseconds(5000), 2);
    h->backend->down = true;

    auto files = h->organizer->scan({(scratch / "inbox").string()});
    application::OrganizeOptions options;
    options.dryRun = false;
    auto report = h->organizer->organize(files, (scratch / "target").string(), options);

    assert(report.classificationFailed == 2);
    assert(report.storeAppended == 2);
    assert(report.storeDuplicates == 0);
    auto entries = h->store->readAll();
    assert(entries.size() == 2);
    assert(entries[0].sourcePath != entries[1].sourcePath);
    std::cout << "[PASS] One stored record per failed file." << std::endl;
}

void TestCollisionsFollowInputOrder() {
    std::cout << "[Test] Same-named files across several workers..." << std::endl;
    ScratchDir scratch("organize_order");
    test::MakeDirs(scratch / "target", {"Report"});
    test::WriteFile(scratch / "inbox/a/report.pdf", "alpha");
    test::WriteFile(scratch / "inbox/b/report.pdf", "bravo");
    test::WriteFile(scratch / "inbox/c/report.pdf", "charlie");
    auto mtime = fs::last_write_time(scratch / "inbox/a/report.pdf");
    fs::last_write_time(scratch / "inbox/b/report.pdf", mtime);
    fs::last_write_time(scratch / "inbox/c/report.pdf", mtime);
    auto h = MakeHarness(scratch, std::chrono::milliseconds(5000), 4);
    h->backend->down = true;

    auto files = h->organizer->scan({(scratch / "inbox").string()});
    assert(files.size() == 3);
    std::string stamp = infrastructure::TimeUtils::ToCompact(files[0].modified);
    std::vector<std::string> expected = {
        (scratch / "target/Report/report.pdf").string(),
        (scratch / ("target/Report/report_" + stamp + ".pdf")).string(),
        (scratch / ("target/Report/report_" + stamp + "_1.pdf")).string()
    };

    application::OrganizeOptions preview;
    preview.dryRun = true;
    for (int round = 0; round < 2; ++round) {
        auto report = h->organizer->organize(files, (scratch / "target").string(), preview);
        assert(report.planned == 3);
        for (std::size_t i = 0; i < files.size(); ++i) {
            assert(report.outcomes[i].targetPath == expected[i]);
        }
    }

    application::OrganizeOptions apply;
    apply.dryRun = false;
    auto report = h->organizer->organize(files, (scratch / "target").string(), apply);
    assert(report.migrated == 3);
    for (std::size_t i = 0; i < files.size(); ++i) {
        assert(report.outcomes[i].targetPath == expected[i]);
        assert(test::ReadFile(expected[i]) == test::ReadFile(files[i].path));
    }
    std::cout << "[PASS] Earlier input keeps the name, previews repeat exactly." << std::endl;
}

void TestTimeout() {
    std::cout << "[Test] Classification exceeding the timeout..." << std::endl;
    ScratchDir scratch("organize_timeout");
    test::MakeDirs(scratch / "target", {"Finance", "Travel"});
    test::WriteFile(scratch / "inbox/scan_0001.pdf", "content");
    auto h = MakeHarness(scratch, std::chrono::milliseconds(100), 1);
    h->backend->delay = std::chrono::milliseconds(600);
    h->backend->selector = [](const std::string&) -> std::optional<std::string> { return std::string("Finance"); };

    auto files = h->organizer->scan({(scratch / "inbox").string()});
    application::OrganizeOptions options;
    options.dryRun = false;
    auto report = h->organizer->organize(files, (scratch / "target").string(), options);

    assert(report.outcomes.size() == 1);
    assert(report.outcomes[0].status == domain::OutcomeStatus::TimedOut);
    assert(report.outcomes[0].errorKind == domain::ErrorKind::Timeout);
    assert(report.timedOut == 1);
    assert(test::Snapshot(scratch / "target").empty());
    assert(h->log->load(report.sessionPath).operations.empty());

    // Let the abandoned classification finish before the scratch directory goes away.
    std::this_thread::sleep_for(std::chrono::milliseconds(2000));
    std::cout << "[PASS] Timed out file reported, nothing migrated." << std::endl;
}

void TestCancellation() {
    std::cout << "[Test] Stop requested mid-run..." << std::endl;
    ScratchDir scratch("organize_cancel");
    test::MakeDirs(scratch / "target", {"Finance", "Travel"});
    test::WriteFile(scratch / "inbox/scan_0001.pdf", "one");
    test::WriteFile(scratch / "inbox/scan_0002.pdf", "two");
    test::WriteFile(scratch / "inbox/scan_0003.pdf", "three");
    auto h = MakeHarness(scratch, std::chrono::milliseconds(5000), 1);

    application::OrganizerService* organizer = h->organizer.get();
    h->backend->selector = [organizer](const std::string&) -> std::optional<std::string> {
        organizer->requestStop();
        return std::string("Finance");
    };

    auto files = h->organizer->scan({(scratch / "inbox").string()});
    application::OrganizeOptions options;
    options.dryRun = false;
    auto report = h->organizer->organize(files, (scratch / "target").string(), options);

    assert(report.outcomes.size() == 3);
    assert(report.cancelled == 3);
    assert(report.migrated == 0);
    for (const auto& outcome : report.outcomes) {
        assert(outcome.errorKind == domain::ErrorKind::Cancelled);
    }
    assert(test::Snapshot(scratch / "target").empty());
    assert(h->backend->selectionCalls == 1);
    std::cout << "[PASS] Remaining files cancelled, no migration after stop." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting OrganizerService Test..." << std::endl;

    TestScanAndClassify();
    TestDryRunMutatesNothing();
    TestRealRunLogsAndStores();
    TestSameNamedFailuresAllStored();
    TestCollisionsFollowInputOrder();
    TestTimeout();
    TestCancellation();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
