#pragma once

#include "Types.hpp"
#include "Error.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace taxlot {

struct MissingPrice {
    std::string symbol;
    std::string attempted;  // Тикер после применения псевдонима
};

struct PriceLookup {
    PriceMap prices;  // Ключ - исходный тикер
    std::vector<MissingPrice> missingSymbols;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Price Cache - кеш текущих цен с ограниченным временем жизни
// ═══════════════════════════════════════════════════════════════════════════════
//
// Ключ: отсортированные пары "symbol:resolved" через запятую. Один и тот же
// набор тикеров с одинаковыми псевдонимами дает один ключ независимо от
// порядка в запросе.

class PriceCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    // symbols + карта symbol -> resolved
    using Loader = std::function<Expected<PriceLookup>(
        const std::vector<std::string>& symbols,
        const std::map<std::string, std::string>& resolved)>;

    static constexpr std::chrono::seconds kDefaultTtl{600};

    explicit PriceCache(std::chrono::seconds ttl = kDefaultTtl, ClockFn clock = nullptr);

    // Запись из кеша или вызов loader. Ошибка loader не кешируется
    Expected<PriceLookup> getOrLoad(
        const std::vector<std::string>& symbols,
        const SymbolAliasMap& aliases,
        const Loader& loader);

    static std::string makeKey(
        const std::vector<std::string>& symbols,
        const SymbolAliasMap& aliases);

    void clear() noexcept { entries_.clear(); }
    std::size_t size() const noexcept { return entries_.size(); }
    std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        Clock::time_point storedAt;
        PriceLookup value;
    };

    std::chrono::seconds ttl_;
    ClockFn clock_;
    std::map<std::string, Entry> entries_;
};

}  // namespace taxlot
