#include "Types.hpp"
#include "Error.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace taxlot {

namespace {

std::string normalizeToken(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

}  // namespace

std::optional<TradeSide> parseTradeSide(std::string_view text) noexcept
{
    std::string token = normalizeToken(text);
    if (token == "BUY" || token == "B") {
        return TradeSide::Buy;
    }
    if (token == "SELL" || token == "S") {
        return TradeSide::Sell;
    }
    return std::nullopt;
}

const char* toString(TradeSide side) noexcept
{
    switch (side) {
        case TradeSide::Buy:  return "BUY";
        case TradeSide::Sell: return "SELL";
    }
    return "UNKNOWN";
}

CorporateActionType parseCorporateActionType(std::string_view text) noexcept
{
    std::string token = normalizeToken(text);
    if (token == "SPLIT") return CorporateActionType::Split;
    if (token == "BONUS") return CorporateActionType::Bonus;
    if (token == "MERGER") return CorporateActionType::Merger;
    return CorporateActionType::Other;
}

const char* toString(CorporateActionType type) noexcept
{
    switch (type) {
        case CorporateActionType::Split:  return "SPLIT";
        case CorporateActionType::Bonus:  return "BONUS";
        case CorporateActionType::Merger: return "MERGER";
        case CorporateActionType::Other:  return "OTHER";
    }
    return "OTHER";
}

double roundTo(double value, int digits) noexcept
{
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

const char* toString(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::InvalidInput:       return "InvalidInput";
        case ErrorCode::UnsupportedCountry: return "UnsupportedCountry";
        case ErrorCode::InvalidRequest:     return "InvalidRequest";
        case ErrorCode::IoError:            return "IoError";
    }
    return "Unknown";
}

}  // namespace taxlot
