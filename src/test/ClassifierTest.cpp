#include <cassert>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include "application/ContentSummarizer.hpp"
#include "application/Matchers.hpp"
#include "application/SmartClassifier.hpp"
#include "infrastructure/ClassificationRulesLoader.hpp"
#include "infrastructure/FileSystemScanner.hpp"
#include "test/TestSupport.hpp"

using namespace tidyfile;
using tidyfile::test::MockBackend;
using tidyfile::test::MockContentSource;
using tidyfile::test::ScratchDir;

namespace {

struct Harness {
    std::shared_ptr<MockBackend> backend = std::make_shared<MockBackend>();
    std::shared_ptr<MockContentSource> content = std::make_shared<MockContentSource>();
    std::shared_ptr<application::SmartClassifier> classifier;
};

Harness MakeHarness(domain::ClassificationRules rules = {}, int maxDepth = 10) {
    Harness h;
    auto summarizer = std::make_shared<application::ContentSummarizer>(h.content, h.backend, 2000, 150);
    auto sharedRules = std::make_shared<const domain::ClassificationRules>(std::move(rules));

    std::vector<std::shared_ptr<domain::Matcher>> matchers;
    matchers.push_back(std::make_shared<application::TemporalMatcher>(1900, 2099));
    matchers.push_back(std::make_shared<application::LiteralMatcher>());
    matchers.push_back(std::make_shared<application::ContentAssistedMatcher>(summarizer, sharedRules));
    matchers.push_back(std::make_shared<application::FuzzyMatcher>(sharedRules));
    h.classifier = std::make_shared<application::SmartClassifier>(std::move(matchers), maxDepth);
    return h;
}

domain::ClassificationDecision Classify(Harness& h, const ScratchDir& scratch, const std::string& fileName,
                                        const std::string& root) {
    auto path = scratch / ("inbox/" + fileName);
    test::WriteFile(path, "placeholder");
    auto record = infrastructure::FileSystemScanner::Capture(path.string());
    assert(record && "source should be captured");
    domain::ClassificationContext ctx(*record);
    auto decision = h.classifier->classify(ctx, root);
    if (decision.success) {
        assert(std::filesystem::is_directory(std::filesystem::path(root) / decision.relativePath));
    }
    return decision;
}

void TestTemporalWithoutBackend() {
    std::cout << "[Test] Year in file name selects the year directory..." << std::endl;
    ScratchDir scratch("classify_temporal");
    auto root = scratch / "target";
    test::MakeDirs(root, {"2022", "2023", "Misc"});

    Harness h = MakeHarness();
    auto decision = Classify(h, scratch, "Annual_Report_2023.pdf", root.string());

    assert(decision.success);
    assert(decision.relativePath == "2023");
    assert(decision.levelTags == std::vector<std::string>{"2023"});
    assert(decision.depth == domain::MatchDepth::Complete);
    assert(decision.reason.find("temporal") != std::string::npos);
    assert(h.backend->calls == 0);
    assert(h.content->calls == 0);
    std::cout << "[PASS] Temporal match with zero backend calls." << std::endl;
}

void TestLiteralLongestWins() {
    std::cout << "[Test] Longest directory name contained in the file name wins..." << std::endl;
    ScratchDir scratch("classify_literal");
    auto root = scratch / "target";
    test::MakeDirs(root, {"Photos", "Photos_Family", "Misc"});

    Harness h = MakeHarness();
    auto decision = Classify(h, scratch, "photos_family_beach.jpg", root.string());

    assert(decision.success);
    assert(decision.relativePath == "Photos_Family");
    assert(decision.reason.find("literal") != std::string::npos);
    assert(h.backend->calls == 0);
    std::cout << "[PASS] Literal match is case-insensitive and prefers the longest name." << std::endl;
}

void TestContentAssistedRecursesWithCachedSummary() {
    std::cout << "[Test] Content-assisted match at two levels reuses one summary..." << std::endl;
    ScratchDir scratch("classify_content");
    auto root = scratch / "target";
    test::MakeDirs(root, {"Finance/Invoices", "Finance/Statements", "Travel", "Misc"});

    Harness h = MakeHarness();
    h.backend->selector = [](const std::string& prompt) -> std::optional<std::string> {
        if (prompt.find("Invoices\n") != std::string::npos) return std::string("2. Invoices");
        return std::string("<think>it is money related</think>\nFinance");
    };
    auto decision = Classify(h, scratch, "scan_0001.pdf", root.string());

    assert(decision.success);
    assert(decision.relativePath == "Finance/Invoices");
    assert(decision.depth == domain::MatchDepth::Complete);
    assert(!decision.summary.empty());
    assert(h.backend->summaryCalls == 1);
    assert(h.backend->selectionCalls == 2);
    assert(h.content->calls == 1);
    std::cout << "[PASS] Summary generated once, selection asked per level." << std::endl;
}

void TestOutOfSetAnswerRejected() {
    std::cout << "[Test] Backend answer outside the candidate set is rejected..." << std::endl;
    ScratchDir scratch("classify_reject");
    auto root = scratch / "target";
    test::MakeDirs(root, {"Finance", "Travel", "Misc"});

    Harness h = MakeHarness();
    h.backend->summaryAnswer = std::string("Unrelated text.");
    h.backend->selector = [](const std::string&) -> std::optional<std::string> { return std::string("Taxes"); };
    auto decision = Classify(h, scratch, "scan_0001.pdf", root.string());

    assert(!decision.success);
    assert(decision.depth == domain::MatchDepth::Unmatched);
    assert(decision.relativePath.empty());
    assert(decision.levelTags.empty());
    assert(decision.reason.find("level 1: no matching directory") != std::string::npos);
    assert(h.backend->selectionCalls == 1);

    auto candidates = std::vector<std::string>{"Finance", "Travel"};
    assert(application::ContentAssistedMatcher::ResolveAnswer("1. Finance", candidates) == std::string("Finance"));
    assert(application::ContentAssistedMatcher::ResolveAnswer("\"travel\"", candidates) == std::string("Travel"));
    assert(application::ContentAssistedMatcher::ResolveAnswer("Directory: Finance.", candidates) ==
           std::string("Finance"));
    assert(!application::ContentAssistedMatcher::ResolveAnswer("Taxes", candidates));
    assert(!application::ContentAssistedMatcher::ResolveAnswer("", candidates));
    std::cout << "[PASS] Only candidate names are accepted." << std::endl;
}

void TestBackendDownDegradesToFuzzy() {
    std::cout << "[Test] Unreachable backend degrades to fuzzy matching, partial depth..." << std::endl;
    ScratchDir scratch("classify_degrade");
    auto root = scratch / "target";
    test::MakeDirs(root, {"Travel Plans/Hotels", "Travel Plans/Flights", "Misc"});

    Harness h = MakeHarness();
    h.backend->down = true;
    auto decision = Classify(h, scratch, "travel_itinerary.docx", root.string());

    assert(decision.success);
    assert(decision.relativePath == "Travel Plans");
    assert(decision.depth == domain::MatchDepth::Partial);
    assert(decision.reason.find("fuzzy") != std::string::npos);
    assert(decision.reason.find("level 2: no matching directory") != std::string::npos);
    assert(decision.summary.empty());
    // One failed summary call marks the backend unavailable for the rest of the file.
    assert(h.backend->calls == 1);
    std::cout << "[PASS] Classification continues without the backend." << std::endl;
}

void TestRuleKeywords() {
    std::cout << "[Test] Rule keywords feed the fuzzy matcher..." << std::endl;
    ScratchDir scratch("classify_rules");
    auto root = scratch / "target";
    test::MakeDirs(root, {"Receipts", "Misc"});

    auto rules = infrastructure::ClassificationRulesLoader::FromJson(nlohmann::json::parse(R"({
        "Receipts": {"description": "Proof of purchase", "keywords": ["invoice", "receipt"]},
        "Misc": "Anything else"
    })"));
    assert(rules.size() == 2);
    assert(rules.describe({"Misc", "Receipts", "Other"}) ==
           (std::vector<std::string>{"Misc: Anything else", "Receipts: Proof of purchase"}));

    Harness h = MakeHarness(rules);
    h.backend->down = true;
    auto decision = Classify(h, scratch, "march_invoice.pdf", root.string());

    assert(decision.success);
    assert(decision.relativePath == "Receipts");
    assert(decision.reason.find("invoice") != std::string::npos);
    std::cout << "[PASS] Keyword from the rules document matched." << std::endl;
}

void TestDepthCap() {
    std::cout << "[Test] Recursion stops at the depth cap..." << std::endl;
    ScratchDir scratch("classify_depth");
    auto root = scratch / "target";
    test::MakeDirs(root, {"Projects/Alpha/Docs", "Projects/Beta"});

    Harness h = MakeHarness({}, 2);
    auto decision = Classify(h, scratch, "projects_alpha_docs.txt", root.string());

    assert(decision.success);
    assert(decision.relativePath == "Projects/Alpha");
    assert(decision.levelTags.size() == 2);
    assert(decision.depth == domain::MatchDepth::Complete);
    std::cout << "[PASS] Depth cap yields a complete decision." << std::endl;
}

void TestEmptyTargetRoot() {
    std::cout << "[Test] Target root without subdirectories..." << std::endl;
    ScratchDir scratch("classify_empty");
    auto root = scratch / "target";
    std::filesystem::create_directories(root);

    Harness h = MakeHarness();
    auto decision = Classify(h, scratch, "notes.txt", root.string());

    assert(!decision.success);
    assert(decision.depth == domain::MatchDepth::Unmatched);
    assert(decision.reason.find("no subdirectories") != std::string::npos);
    assert(h.backend->calls == 0);
    std::cout << "[PASS] Unmatched without asking the backend." << std::endl;
}

void TestYearExtraction() {
    std::cout << "[Test] Year extraction..." << std::endl;
    application::TemporalMatcher matcher(1900, 2099);
    assert(matcher.extractYears("IMG_20230514_1999.jpg") == (std::vector<int>{2023, 1999}));
    assert(matcher.extractYears("v12345_final").empty());
    assert(matcher.extractYears("2021-2021 recap") == std::vector<int>{2021});
    assert(matcher.extractYears("no digits").empty());

    assert(application::FuzzyMatcher::Keywords("Travel Plans_2024-eu") ==
           (std::vector<std::string>{"travel", "plans", "2024"}));
    assert(application::ContentSummarizer::CleanResponse("<think>\nreasoning\n</think>\n\n  Short summary.  \n") ==
           "Short summary.");
    std::cout << "[PASS] Years, keywords and answer cleaning." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Classifier Test..." << std::endl;

    TestTemporalWithoutBackend();
    TestLiteralLongestWins();
    TestContentAssistedRecursesWithCachedSummary();
    TestOutOfSetAnswerRejected();
    TestBackendDownDegradesToFuzzy();
    TestRuleKeywords();
    TestDepthCap();
    TestEmptyTargetRoot();
    TestYearExtraction();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
