#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "risk/RiskConfig.h"

namespace riskbook {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // 완성된 리스크 설정 구조체 반환
    risk::RiskConfig getRiskConfig() const { return risk_config_; }

    double getInitialBalance() const { return risk_config_.initial_balance; }

    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

    // 상태 저장 경로 (빈 문자열이면 저장 안 함)
    std::string getSnapshotPath() const { return snapshot_path_; }
    std::string getJournalPath() const { return journal_path_; }

    // 기본값으로 복원 (테스트용)
    void reset();

private:
    Config() = default;

    risk::RiskConfig risk_config_;
    std::string log_dir_ = "logs";
    std::string log_level_ = "info";
    std::string snapshot_path_ = "state/risk_state.json";
    std::string journal_path_ = "state/risk_journal.jsonl";
};

} // namespace riskbook
