#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace riskbook {
namespace core {

namespace {
bool fail(std::string* reason, const char* message) {
    if (reason != nullptr) {
        *reason = message;
    }
    return false;
}

// seq of any parseable row, valid or not, so numbering never repeats
std::uint64_t rowSeq(const std::string& row) {
    try {
        const auto line = nlohmann::json::parse(row);
        if (line.is_object() && line.contains("seq") && line["seq"].is_number_unsigned()) {
            return line["seq"].get<std::uint64_t>();
        }
    } catch (const nlohmann::json::exception&) {
        // malformed row
    }
    return 0;
}
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (!row.empty()) {
            last_seq_ = (std::max)(last_seq_, rowSeq(row));
        }
    }
    LOG_INFO("Event journal opened: {} (last seq {})", file_path_.string(), last_seq_);
}

bool EventJournalJsonl::validate(const JournalEvent& event, std::string* reason) {
    if (!event.payload.is_object()) {
        return fail(reason, "payload must be an object");
    }
    switch (event.type) {
        case JournalEventType::POSITION_OPENED:
        case JournalEventType::POSITION_CLOSED:
            if (event.symbol.empty()) {
                return fail(reason, "position event without symbol");
            }
            if (event.position_id == 0) {
                return fail(reason, "position event without position id");
            }
            return true;
        case JournalEventType::ENTRY_REJECTED:
            if (event.position_id != 0) {
                return fail(reason, "rejected entry cannot carry a position id");
            }
            if (!event.payload.contains("reason") || !event.payload["reason"].is_string() ||
                event.payload["reason"].get<std::string>().empty()) {
                return fail(reason, "rejected entry without reason");
            }
            return true;
    }
    return fail(reason, "unknown event type");
}

nlohmann::json EventJournalJsonl::encode(const JournalEvent& event) {
    nlohmann::json line;
    line["seq"] = event.seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["position_id"] = event.position_id;
    line["payload"] = event.payload;
    return line;
}

std::optional<JournalEvent> EventJournalJsonl::decode(const nlohmann::json& line) {
    if (!line.is_object()) {
        return std::nullopt;
    }

    JournalEvent event;
    try {
        event.seq = line.at("seq").get<std::uint64_t>();
        event.ts_ms = line.value("ts_ms", 0LL);
        if (!parseJournalEventType(line.at("type").get<std::string>(), event.type)) {
            return std::nullopt;
        }
        event.symbol = line.value("symbol", std::string());
        event.position_id = line.value("position_id", static_cast<PositionId>(0));
        event.payload = line.value("payload", nlohmann::json::object());
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }

    if (event.seq == 0 || !validate(event)) {
        return std::nullopt;
    }
    return event;
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::string reason;
    if (!validate(event, &reason)) {
        LOG_WARN("Journal event refused ({}): {}", toString(event.type), reason);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Journal directory create failed: {} ({})", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    JournalEvent stamped = event;
    stamped.seq = last_seq_ + 1;

    out << encode(stamped).dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = stamped.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::read(const JournalQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    int skipped = 0;
    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        std::optional<JournalEvent> event;
        try {
            event = decode(nlohmann::json::parse(row));
        } catch (const nlohmann::json::exception&) {
            event = std::nullopt;
        }
        if (!event) {
            ++skipped;
            continue;
        }
        if (query.matches(*event)) {
            out.push_back(std::move(*event));
        }
    }

    if (skipped > 0) {
        LOG_WARN("Event journal {}: {} unreadable rows skipped", file_path_.string(), skipped);
    }
    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace riskbook
