#pragma once

#include "Types.hpp"
#include "LotLedger.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Corporate Action Adjuster - пересчет лотов при сплите
// ═══════════════════════════════════════════════════════════════════════════════
//
// Лоты, открытые до даты сплита, пересчитываются:
//   factor = ratio_to / ratio_from
//   quantity *= factor, unit_price /= factor  (стоимость лота не меняется)
//
// Состояние "уже применено" в лотах не хранится. Экземпляр ведет курсор по
// отсортированным действиям и применяет каждое ровно один раз по мере
// продвижения по истории сделок.

class CorporateActionAdjuster {
public:
    explicit CorporateActionAdjuster(const std::vector<CorporateAction>& actions);

    // ───────────────────────────────────────────────────────────────────────────
    // Чистые функции
    // ───────────────────────────────────────────────────────────────────────────

    // Пересчитать очередь одного тикера. Ошибка содержит причину пропуска
    static std::expected<LotQueue, std::string> adjust(
        const LotQueue& lots,
        const CorporateAction& action);

    // Причина, по которой действие нельзя применить (nullopt - можно)
    static std::optional<std::string> skipReason(const CorporateAction& action);

    // ───────────────────────────────────────────────────────────────────────────
    // Применение по времени
    // ───────────────────────────────────────────────────────────────────────────

    // Применить к ledger все еще не примененные действия с effective_date <= upTo.
    // Возвращает количество примененных действий
    std::size_t applyPending(LotLedger& ledger, const Date& upTo);

    // Применить все оставшиеся действия
    std::size_t applyAll(LotLedger& ledger);

    bool hasPending() const noexcept { return cursor_ < pending_.size(); }

    const std::vector<SkippedCorporateAction>& skipped() const noexcept {
        return skipped_;
    }

private:
    std::vector<CorporateAction> pending_;  // Валидные сплиты по возрастанию даты
    std::size_t cursor_ = 0;
    std::vector<SkippedCorporateAction> skipped_;

    void applyOne(LotLedger& ledger, const CorporateAction& action);
};

}  // namespace taxlot
