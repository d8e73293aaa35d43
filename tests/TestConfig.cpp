#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace riskbook;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // 1. Defaults
    auto defaults = config.getRiskConfig();
    assert(std::abs(defaults.initial_balance - 10000.0) < 1e-9);
    assert(std::abs(defaults.max_position_size_pct - 0.95) < 1e-9);
    assert(defaults.max_consecutive_losses == 5);
    assert(defaults.signals.consecutive_losses == 3);
    assert(config.getLogLevel() == "info");

    // 2. Load a full file by absolute path
    const auto dir = std::filesystem::temp_directory_path() / "riskbook_test_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({
            "account": { "initial_balance": 25000 },
            "risk": { "stop_loss_pct": 0.03, "max_consecutive_losses": 4 },
            "signals": { "max_open_positions": 6 },
            "logging": { "dir": " logs/test ", "level": "WARN" },
            "state": { "snapshot_path": "", "journal_path": "state/j.jsonl" }
        })";
    }
    config.load(path.string());

    auto loaded = config.getRiskConfig();
    std::cout << "Balance: " << loaded.initial_balance << std::endl;
    std::cout << "Stop Loss: " << loaded.stop_loss_pct << std::endl;
    assert(std::abs(config.getInitialBalance() - 25000.0) < 1e-9);
    assert(std::abs(loaded.stop_loss_pct - 0.03) < 1e-9);
    assert(std::abs(loaded.take_profit_pct - 0.10) < 1e-9);     // untouched key keeps default
    assert(loaded.max_consecutive_losses == 4);
    assert(loaded.signals.max_open_positions == 6);
    assert(config.getLogDir() == "logs/test");
    assert(config.getLogLevel() == "warn");
    assert(config.getSnapshotPath().empty());
    assert(config.getJournalPath() == "state/j.jsonl");

    // 3. Invalid risk section falls back to defaults
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({ "risk": { "max_position_size_pct": 1.5 } })";
    }
    config.load(path.string());
    assert(std::abs(config.getRiskConfig().max_position_size_pct - 0.95) < 1e-9);

    // 3b. Balance beyond the money range falls back too
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({ "account": { "initial_balance": 2e11 } })";
    }
    config.load(path.string());
    assert(std::abs(config.getInitialBalance() - 10000.0) < 1e-9);

    // 4. Missing file keeps current values
    config.load((dir / "missing.json").string());
    assert(std::abs(config.getRiskConfig().max_position_size_pct - 0.95) < 1e-9);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    config.reset();

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
