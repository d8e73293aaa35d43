#pragma once

#include <cstdint>
#include <vector>

#include "core/model/StateTypes.h"

namespace riskbook {
namespace core {

class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    // seq 는 구현이 부여한다. 형식이 맞지 않는 이벤트는 false
    virtual bool append(const JournalEvent& event) = 0;
    // seq 오름차순
    virtual std::vector<JournalEvent> read(const JournalQuery& query) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace riskbook
