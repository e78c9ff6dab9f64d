#pragma once

#include "Types.hpp"
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace taxlot {

using LotQueue = std::deque<Lot>;

// ═══════════════════════════════════════════════════════════════════════════════
// Результат списания продажи с очереди лотов
// ═══════════════════════════════════════════════════════════════════════════════

struct SellMatch {
    // Списанные части лотов: копия лота, quantity = списанное количество
    std::vector<Lot> slices;
    double matchedQuantity = 0.0;
    double unmatchedQuantity = 0.0;

    bool fullyMatched(double epsilon) const noexcept {
        return unmatchedQuantity <= epsilon;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Lot Ledger - FIFO очереди открытых лотов по тикерам
// ═══════════════════════════════════════════════════════════════════════════════

class LotLedger {
public:
    explicit LotLedger(double epsilon = kLedgerEpsilon);

    // Один экземпляр принадлежит одному расчету
    LotLedger(const LotLedger&) = delete;
    LotLedger& operator=(const LotLedger&) = delete;

    LotLedger(LotLedger&&) noexcept = default;
    LotLedger& operator=(LotLedger&&) noexcept = default;

    // ───────────────────────────────────────────────────────────────────────────
    // Изменение очередей
    // ───────────────────────────────────────────────────────────────────────────

    // Покупка: новый лот в конец очереди
    void addLot(const std::string& symbol, Lot lot);

    // Продажа: списание с начала очереди (FIFO).
    // Остаток сверх истории покупок возвращается в unmatchedQuantity
    SellMatch consume(const std::string& symbol, double quantity);

    // Заменить очередь тикера (используется при корректировке на сплит)
    void replaceLots(const std::string& symbol, LotQueue lots);

    // ───────────────────────────────────────────────────────────────────────────
    // Чтение
    // ───────────────────────────────────────────────────────────────────────────

    const LotQueue& lots(std::string_view symbol) const;

    bool hasSymbol(std::string_view symbol) const;

    double totalQuantity(std::string_view symbol) const;

    // Средняя цена по net-цене лотов. nullopt если позиции нет
    std::optional<double> averageCost(std::string_view symbol) const;

    std::vector<std::string> symbols() const;

    // Копия всех очередей (включая пустые тикеры)
    Holdings snapshot() const;

    double epsilon() const noexcept { return epsilon_; }

private:
    double epsilon_;
    std::map<std::string, LotQueue, std::less<>> queues_;
};

}  // namespace taxlot
