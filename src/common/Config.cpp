#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace riskbook {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    risk_config_ = risk::RiskConfig();
    log_dir_ = "logs";
    log_level_ = "info";
    snapshot_path_ = "state/risk_state.json";
    journal_path_ = "state/risk_journal.jsonl";
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "설정 파일 경로: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
            std::cout << "기본값을 사용합니다." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;

        risk::RiskConfig loaded = risk_config_;

        if (j.contains("account")) {
            auto& a = j["account"];
            loaded.initial_balance = a.value("initial_balance", loaded.initial_balance);
        }

        if (j.contains("risk")) {
            auto& r = j["risk"];
            loaded.max_position_size_pct = r.value("max_position_size_pct", loaded.max_position_size_pct);
            loaded.stop_loss_pct = r.value("stop_loss_pct", loaded.stop_loss_pct);
            loaded.take_profit_pct = r.value("take_profit_pct", loaded.take_profit_pct);
            loaded.max_drawdown_limit = r.value("max_drawdown_limit", loaded.max_drawdown_limit);
            loaded.max_consecutive_losses = r.value("max_consecutive_losses", loaded.max_consecutive_losses);
            loaded.risk_free_rate_per_period = r.value("risk_free_rate_per_period", loaded.risk_free_rate_per_period);
            loaded.min_trades_for_metrics = r.value("min_trades_for_metrics", loaded.min_trades_for_metrics);
            loaded.stable_sample_size = r.value("stable_sample_size", loaded.stable_sample_size);
        }

        if (j.contains("signals")) {
            auto& s = j["signals"];
            loaded.signals.high_drawdown = s.value("high_drawdown", loaded.signals.high_drawdown);
            loaded.signals.consecutive_losses = s.value("consecutive_losses", loaded.signals.consecutive_losses);
            loaded.signals.max_open_positions = s.value("max_open_positions", loaded.signals.max_open_positions);
            loaded.signals.concentration = s.value("concentration", loaded.signals.concentration);
            loaded.signals.capital_loss_floor = s.value("capital_loss_floor", loaded.signals.capital_loss_floor);
        }

        std::string reason;
        if (loaded.isValid(&reason)) {
            risk_config_ = loaded;
        } else {
            std::cerr << "경고: 리스크 설정이 올바르지 않아 기본값을 사용합니다 (" << reason << ")" << std::endl;
            risk_config_ = risk::RiskConfig();
        }

        if (j.contains("logging")) {
            auto& l = j["logging"];
            log_dir_ = trimCopy(l.value("dir", log_dir_));
            log_level_ = toLowerCopy(trimCopy(l.value("level", log_level_)));
        }

        if (j.contains("state")) {
            auto& st = j["state"];
            snapshot_path_ = trimCopy(st.value("snapshot_path", snapshot_path_));
            journal_path_ = trimCopy(st.value("journal_path", journal_path_));
        }

        std::cout << "설정 파일 로드 완료" << std::endl;
        std::cout << "Config Loaded: Balance=" << risk_config_.initial_balance
                  << ", MaxPosition=" << risk_config_.max_position_size_pct
                  << ", SL=" << risk_config_.stop_loss_pct
                  << ", TP=" << risk_config_.take_profit_pct << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "설정 로드 오류: " << e.what() << std::endl;
    }
}

} // namespace riskbook
