#include "TaxTypes.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace taxlot {

Expected<MethodMode> parseMethodMode(std::string_view text)
{
    std::string mode;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            mode.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    // Пустое значение - режим по умолчанию
    if (mode.empty() || mode == "auto_best_per_sale") {
        return MethodMode::AutoBestPerSale;
    }
    if (mode == "actual") {
        return MethodMode::Actual;
    }
    if (mode == "deemed") {
        return MethodMode::Deemed;
    }

    return makeError(ErrorCode::InvalidRequest,
        "method_mode must be one of: actual, deemed, auto_best_per_sale (got '"
        + std::string(text) + "')");
}

const char* toString(MethodMode mode) noexcept
{
    switch (mode) {
        case MethodMode::Actual:          return "actual";
        case MethodMode::Deemed:          return "deemed";
        case MethodMode::AutoBestPerSale: return "auto_best_per_sale";
    }
    return "auto_best_per_sale";
}

Expected<MethodMode> validateRequest(const TaxReportRequest& request)
{
    if (request.taxYear < kMinTaxYear || request.taxYear > kMaxTaxYear) {
        return makeError(ErrorCode::InvalidRequest,
            "tax_year must be between " + std::to_string(kMinTaxYear) + " and "
            + std::to_string(kMaxTaxYear) + " (got " + std::to_string(request.taxYear) + ")");
    }

    if (!std::isfinite(request.priorLossCarryforward)) {
        return makeError(ErrorCode::InvalidRequest, "prior_loss_carryforward must be a finite number");
    }

    return parseMethodMode(request.methodMode);
}

}  // namespace taxlot
