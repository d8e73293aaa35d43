#pragma once

#include <optional>

#include "core/model/StateTypes.h"

namespace riskbook {
namespace core {

class IRiskStateStore {
public:
    virtual ~IRiskStateStore() = default;

    virtual std::optional<RiskStateSnapshot> load() = 0;
    virtual bool save(const RiskStateSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace riskbook
