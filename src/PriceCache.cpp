#include "PriceCache.hpp"
#include "PortfolioReport.hpp"
#include <algorithm>
#include <map>

namespace taxlot {

PriceCache::PriceCache(std::chrono::seconds ttl, ClockFn clock)
    : ttl_(ttl),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
{
}

std::string PriceCache::makeKey(
    const std::vector<std::string>& symbols,
    const SymbolAliasMap& aliases)
{
    std::vector<std::string> pairs;
    pairs.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        pairs.push_back(symbol + ":" + resolveSymbol(symbol, aliases));
    }
    std::sort(pairs.begin(), pairs.end());
    pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());

    std::string key;
    for (const auto& pair : pairs) {
        if (!key.empty()) {
            key += ",";
        }
        key += pair;
    }
    return key;
}

Expected<PriceLookup> PriceCache::getOrLoad(
    const std::vector<std::string>& symbols,
    const SymbolAliasMap& aliases,
    const Loader& loader)
{
    if (symbols.empty()) {
        return PriceLookup{};
    }

    const std::string key = makeKey(symbols, aliases);
    const auto now = clock_();

    auto it = entries_.find(key);
    if (it != entries_.end() && now - it->second.storedAt <= ttl_) {
        return it->second.value;
    }

    std::map<std::string, std::string> resolved;
    for (const auto& symbol : symbols) {
        resolved[symbol] = resolveSymbol(symbol, aliases);
    }

    auto loaded = loader(symbols, resolved);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    // Устаревшие записи удаляются перед сохранением новой
    std::erase_if(entries_, [this, now](const auto& entry) {
        return now - entry.second.storedAt > ttl_;
    });

    entries_.insert_or_assign(key, Entry{now, *loaded});
    return *loaded;
}

}  // namespace taxlot
