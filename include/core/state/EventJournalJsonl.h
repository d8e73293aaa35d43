#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IEventJournal.h"

namespace riskbook {
namespace core {

// append-only JSONL 이벤트 저널
// seq 는 파일 전체에서 단조 증가. 깨진 행, 형식이 맞지 않는 행은 읽을 때 건너뛴다.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> read(const JournalQuery& query) override;
    std::uint64_t lastSeq() const override;

    // 종류별 필수 필드 검사 (JournalEvent 주석 참고)
    static bool validate(const JournalEvent& event, std::string* reason = nullptr);

    // JSONL 1행 <-> 이벤트. decode 는 형식 오류/검사 실패면 nullopt
    static nlohmann::json encode(const JournalEvent& event);
    static std::optional<JournalEvent> decode(const nlohmann::json& line);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace riskbook
