#include "LotLedger.hpp"
#include <algorithm>

namespace taxlot {

LotLedger::LotLedger(double epsilon)
    : epsilon_(epsilon)
{
}

void LotLedger::addLot(const std::string& symbol, Lot lot)
{
    queues_[symbol].push_back(std::move(lot));
}

SellMatch LotLedger::consume(const std::string& symbol, double quantity)
{
    SellMatch match;
    double remaining = quantity;
    auto& queue = queues_[symbol];

    while (remaining > epsilon_ && !queue.empty()) {
        Lot& front = queue.front();
        double take = std::min(front.quantity, remaining);

        if (take <= 0.0) {
            // Пустой лот в голове очереди - убираем
            queue.pop_front();
            continue;
        }

        Lot slice = front;
        slice.quantity = take;
        match.slices.push_back(std::move(slice));
        match.matchedQuantity += take;

        front.quantity -= take;
        remaining -= take;

        if (front.quantity <= epsilon_) {
            queue.pop_front();
        }
    }

    match.unmatchedQuantity = remaining > epsilon_ ? remaining : 0.0;
    return match;
}

void LotLedger::replaceLots(const std::string& symbol, LotQueue lots)
{
    queues_[symbol] = std::move(lots);
}

const LotQueue& LotLedger::lots(std::string_view symbol) const
{
    static const LotQueue empty;
    auto it = queues_.find(symbol);
    return it != queues_.end() ? it->second : empty;
}

bool LotLedger::hasSymbol(std::string_view symbol) const
{
    return queues_.find(symbol) != queues_.end();
}

double LotLedger::totalQuantity(std::string_view symbol) const
{
    double total = 0.0;
    for (const auto& lot : lots(symbol)) {
        total += lot.quantity;
    }
    return total;
}

std::optional<double> LotLedger::averageCost(std::string_view symbol) const
{
    double qty = 0.0;
    double cost = 0.0;
    for (const auto& lot : lots(symbol)) {
        qty += lot.quantity;
        cost += lot.quantity * lot.netUnitPrice;
    }

    if (qty <= epsilon_) {
        return std::nullopt;
    }
    return cost / qty;
}

std::vector<std::string> LotLedger::symbols() const
{
    std::vector<std::string> result;
    result.reserve(queues_.size());
    for (const auto& [symbol, _] : queues_) {
        result.push_back(symbol);
    }
    return result;
}

Holdings LotLedger::snapshot() const
{
    Holdings result;
    for (const auto& [symbol, queue] : queues_) {
        result[symbol] = std::vector<Lot>(queue.begin(), queue.end());
    }
    return result;
}

}  // namespace taxlot
