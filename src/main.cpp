#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/RiskStateStoreJson.h"
#include "engine/ReplayRunner.h"
#include "engine/RiskEngine.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace riskbook;

// riskbook_replay <config.json> <events.jsonl>
// 행 형식은 engine/ReplayRunner.h 참고

// 작업 디렉토리에 있으면 그대로, 없으면 실행 파일 기준
static std::filesystem::path resolvePath(const std::string& path) {
    if (std::filesystem::path(path).is_absolute() || std::filesystem::exists(path)) {
        return std::filesystem::absolute(path);
    }
    return utils::PathUtils::resolveRelativePath(path);
}

static void printUsage() {
    std::cout << "사용법: riskbook_replay <config.json> <events.jsonl>\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage();
        return 1;
    }

    auto& config = Config::getInstance();
    config.load(resolvePath(argv[1]).string());

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<engine::RiskEngine> risk_engine;
    try {
        risk_engine = std::make_unique<engine::RiskEngine>(config.getRiskConfig());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Engine init failed: {}", e.what());
        return 1;
    }

    std::unique_ptr<core::RiskStateStoreJson> store;
    if (!config.getSnapshotPath().empty()) {
        store = std::make_unique<core::RiskStateStoreJson>(resolvePath(config.getSnapshotPath()));
        if (auto snapshot = store->load()) {
            risk_engine->restore(*snapshot);
        }
    }

    std::shared_ptr<core::EventJournalJsonl> journal;
    std::uint64_t journal_start = 1;
    if (!config.getJournalPath().empty()) {
        journal = std::make_shared<core::EventJournalJsonl>(resolvePath(config.getJournalPath()));
        journal_start = journal->lastSeq() + 1;
        risk_engine->setEventJournal(journal);
    }

    const std::filesystem::path events_path = resolvePath(argv[2]);
    std::ifstream in(events_path, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open event file: {}", events_path.string());
        return 1;
    }

    std::map<engine::ReplayLineResult, int> counts;
    std::string row;
    while (std::getline(in, row)) {
        counts[engine::applyReplayLine(*risk_engine, row)]++;
    }
    LOG_INFO("Replay finished: {} applied, {} unknown, {} malformed",
             counts[engine::ReplayLineResult::APPLIED],
             counts[engine::ReplayLineResult::UNKNOWN],
             counts[engine::ReplayLineResult::MALFORMED]);

    const auto report = engine::buildReplayReport(*risk_engine, journal.get(), journal_start);
    std::cout << report.dump(2) << std::endl;

    if (store && !store->save(risk_engine->snapshot())) {
        LOG_ERROR("Risk state snapshot save failed: {}", config.getSnapshotPath());
        return 1;
    }
    return 0;
}
