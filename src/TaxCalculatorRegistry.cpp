#include "TaxCalculatorRegistry.hpp"
#include "FinlandTaxCalculator.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace taxlot {

TaxCalculatorRegistry TaxCalculatorRegistry::createDefault()
{
    TaxCalculatorRegistry registry;
    // Встроенный калькулятор с уникальным кодом - регистрация не может упасть
    auto registered = registry.registerCalculator(std::make_shared<FinlandTaxCalculator>());
    if (!registered) {
        throw std::logic_error("Failed to register built-in calculator: "
                               + registered.error().message);
    }
    return registry;
}

std::string TaxCalculatorRegistry::normalizeCountryCode(std::string_view countryCode)
{
    std::string code;
    for (char c : countryCode) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            code.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return code;
}

Result TaxCalculatorRegistry::registerCalculator(std::shared_ptr<const ITaxCalculator> calculator)
{
    if (!calculator) {
        return makeError(ErrorCode::InvalidInput, "Calculator is null");
    }

    std::string code = normalizeCountryCode(calculator->countryCode());
    if (code.empty()) {
        return makeError(ErrorCode::InvalidInput, "Calculator has empty country code");
    }

    if (calculators_.count(code)) {
        return makeError(ErrorCode::InvalidInput,
            "Calculator already registered for country_code: " + code);
    }

    calculators_.emplace(std::move(code), std::move(calculator));
    return {};
}

Expected<std::shared_ptr<const ITaxCalculator>> TaxCalculatorRegistry::get(
    std::string_view countryCode) const
{
    auto it = calculators_.find(normalizeCountryCode(countryCode));
    if (it == calculators_.end()) {
        return makeError(ErrorCode::UnsupportedCountry,
            "Unsupported country_code: " + std::string(countryCode));
    }
    return it->second;
}

bool TaxCalculatorRegistry::isSupported(std::string_view countryCode) const
{
    return calculators_.count(normalizeCountryCode(countryCode)) > 0;
}

std::vector<std::string> TaxCalculatorRegistry::supportedCountries() const
{
    std::vector<std::string> codes;
    codes.reserve(calculators_.size());
    for (const auto& [code, _] : calculators_) {
        codes.push_back(code);
    }
    return codes;
}

std::vector<TaxCalculatorRegistry::AvailableCalculator> TaxCalculatorRegistry::listAvailable() const
{
    std::vector<AvailableCalculator> result;
    for (const auto& [code, calculator] : calculators_) {
        result.push_back(AvailableCalculator{code, std::string(calculator->countryName())});
    }
    return result;
}

Expected<TaxReport> calculateTaxReport(
    const TaxCalculatorRegistry& registry,
    const TaxReportRequest& request,
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges,
    const std::vector<CorporateAction>& corporateActions)
{
    auto calculator = registry.get(request.countryCode);
    if (!calculator) {
        return std::unexpected(calculator.error());
    }

    auto mode = validateRequest(request);
    if (!mode) {
        return std::unexpected(mode.error());
    }

    return (*calculator)->calculate(request, trades, dailyCharges, corporateActions);
}

}  // namespace taxlot
