#include "core/state/RiskStateStoreJson.h"
#include "core/state/RiskStateJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace riskbook {
namespace core {

RiskStateStoreJson::RiskStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<RiskStateSnapshot> RiskStateStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Risk state snapshot unreadable ({}): {}", file_path_.string(), e.what());
        return std::nullopt;
    }

    if (!raw.is_object()) {
        LOG_ERROR("Risk state snapshot root is not an object ({})", file_path_.string());
        return std::nullopt;
    }

    RiskStateSnapshot snapshot;
    try {
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        snapshot.next_position_id = raw.value("next_position_id", static_cast<PositionId>(1));
        snapshot.account = accountFromJson(raw.value("account", nlohmann::json::object()));

        const auto positions = raw.value("positions", nlohmann::json::array());
        const auto trades = raw.value("trade_history", nlohmann::json::array());
        if (!positions.is_array() || !trades.is_array()) {
            LOG_ERROR("Risk state snapshot lists are not arrays ({})", file_path_.string());
            return std::nullopt;
        }
        for (const auto& row : positions) {
            snapshot.positions.push_back(positionFromJson(row));
        }
        for (const auto& row : trades) {
            snapshot.trade_history.push_back(tradeFromJson(row));
        }
    } catch (const nlohmann::json::exception& e) {
        // wrong field type anywhere rejects the whole snapshot
        LOG_ERROR("Risk state snapshot invalid ({}): {}", file_path_.string(), e.what());
        return std::nullopt;
    }
    return snapshot;
}

bool RiskStateStoreJson::save(const RiskStateSnapshot& snapshot) {
    nlohmann::json raw;
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["next_position_id"] = snapshot.next_position_id;
    raw["account"] = toJson(snapshot.account);

    raw["positions"] = nlohmann::json::array();
    for (const auto& pos : snapshot.positions) {
        raw["positions"].push_back(toJson(pos));
    }
    raw["trade_history"] = nlohmann::json::array();
    for (const auto& trade : snapshot.trade_history) {
        raw["trade_history"].push_back(toJson(trade));
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Windows can fail rename over existing file; fallback to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace riskbook
