#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/IRiskStateStore.h"

namespace riskbook {
namespace core {

// 단일 JSON 스냅샷 (tmp 에 쓴 뒤 rename)
class RiskStateStoreJson : public IRiskStateStore {
public:
    explicit RiskStateStoreJson(std::filesystem::path file_path);

    std::optional<RiskStateSnapshot> load() override;
    bool save(const RiskStateSnapshot& snapshot) override;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace riskbook
