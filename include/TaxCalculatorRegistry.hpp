#pragma once

#include "ITaxCalculator.hpp"
#include "Error.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Tax Calculator Registry - код страны -> калькулятор
// ═══════════════════════════════════════════════════════════════════════════════

class TaxCalculatorRegistry {
public:
    struct AvailableCalculator {
        std::string countryCode;
        std::string countryName;
    };

    TaxCalculatorRegistry() = default;

    TaxCalculatorRegistry(const TaxCalculatorRegistry&) = delete;
    TaxCalculatorRegistry& operator=(const TaxCalculatorRegistry&) = delete;

    TaxCalculatorRegistry(TaxCalculatorRegistry&&) noexcept = default;
    TaxCalculatorRegistry& operator=(TaxCalculatorRegistry&&) noexcept = default;

    // Реестр со всеми встроенными странами (FI)
    static TaxCalculatorRegistry createDefault();

    // Зарегистрировать калькулятор. Повторный код страны - ошибка
    Result registerCalculator(std::shared_ptr<const ITaxCalculator> calculator);

    // Код нормализуется: пробелы по краям, верхний регистр
    Expected<std::shared_ptr<const ITaxCalculator>> get(std::string_view countryCode) const;

    bool isSupported(std::string_view countryCode) const;

    // Отсортированный список кодов
    std::vector<std::string> supportedCountries() const;

    std::vector<AvailableCalculator> listAvailable() const;

    static std::string normalizeCountryCode(std::string_view countryCode);

private:
    std::map<std::string, std::shared_ptr<const ITaxCalculator>> calculators_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Точка входа: валидация запроса и вызов калькулятора страны
// ═══════════════════════════════════════════════════════════════════════════════

Expected<TaxReport> calculateTaxReport(
    const TaxCalculatorRegistry& registry,
    const TaxReportRequest& request,
    const std::vector<Trade>& trades,
    const std::vector<DailyChargeAggregate>& dailyCharges,
    const std::vector<CorporateAction>& corporateActions);

}  // namespace taxlot
