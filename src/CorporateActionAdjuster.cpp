#include "CorporateActionAdjuster.hpp"
#include "DateUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Подготовка: фильтрация и сортировка действий
// ═══════════════════════════════════════════════════════════════════════════════

CorporateActionAdjuster::CorporateActionAdjuster(const std::vector<CorporateAction>& actions)
{
    for (const auto& action : actions) {
        if (!action.active) {
            continue;
        }

        if (auto reason = skipReason(action)) {
            std::cerr << "⚠ Warning: skipping corporate action " << toString(action.actionType)
                      << " for " << action.symbol << " on " << formatIsoDate(action.effectiveDate)
                      << ": " << *reason << std::endl;

            skipped_.push_back(SkippedCorporateAction{
                action.symbol, action.actionType, action.effectiveDate, *reason});
            continue;
        }

        pending_.push_back(action);
    }

    std::stable_sort(pending_.begin(), pending_.end(),
        [](const CorporateAction& a, const CorporateAction& b) {
            return a.effectiveDate < b.effectiveDate;
        });
}

std::optional<std::string> CorporateActionAdjuster::skipReason(const CorporateAction& action)
{
    if (action.actionType != CorporateActionType::Split) {
        return std::string("action type ") + toString(action.actionType) + " is not supported";
    }

    if (!std::isfinite(action.ratioFrom) || !std::isfinite(action.ratioTo)) {
        return std::string("unparsable split ratio");
    }

    if (action.ratioFrom <= 0.0 || action.ratioTo <= 0.0) {
        std::ostringstream oss;
        oss << "non-positive split ratio " << action.ratioFrom << ":" << action.ratioTo;
        return oss.str();
    }

    return std::nullopt;
}

std::expected<LotQueue, std::string> CorporateActionAdjuster::adjust(
    const LotQueue& lots,
    const CorporateAction& action)
{
    if (auto reason = skipReason(action)) {
        return std::unexpected(*reason);
    }

    const double factor = action.ratioTo / action.ratioFrom;
    LotQueue adjusted = lots;

    for (auto& lot : adjusted) {
        if (lot.acquisitionDate < action.effectiveDate) {
            lot.quantity *= factor;
            lot.grossUnitPrice /= factor;
            lot.netUnitPrice /= factor;
        }
    }

    return adjusted;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Применение по времени
// ═══════════════════════════════════════════════════════════════════════════════

std::size_t CorporateActionAdjuster::applyPending(LotLedger& ledger, const Date& upTo)
{
    std::size_t applied = 0;
    while (cursor_ < pending_.size() && pending_[cursor_].effectiveDate <= upTo) {
        applyOne(ledger, pending_[cursor_]);
        ++cursor_;
        ++applied;
    }
    return applied;
}

std::size_t CorporateActionAdjuster::applyAll(LotLedger& ledger)
{
    std::size_t applied = 0;
    while (cursor_ < pending_.size()) {
        applyOne(ledger, pending_[cursor_]);
        ++cursor_;
        ++applied;
    }
    return applied;
}

void CorporateActionAdjuster::applyOne(LotLedger& ledger, const CorporateAction& action)
{
    if (!ledger.hasSymbol(action.symbol)) {
        return;
    }

    auto adjusted = adjust(ledger.lots(action.symbol), action);
    if (!adjusted) {
        skipped_.push_back(SkippedCorporateAction{
            action.symbol, action.actionType, action.effectiveDate, adjusted.error()});
        return;
    }

    ledger.replaceLots(action.symbol, std::move(*adjusted));
}

}  // namespace taxlot
