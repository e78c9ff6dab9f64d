#include "DateUtils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <algorithm>

namespace taxlot {

using namespace std::chrono;

Expected<Date> parseIsoDate(std::string_view text)
{
    // Обрезаем пробелы по краям
    auto first = std::find_if_not(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    if (first >= last) {
        return makeError(ErrorCode::InvalidInput, "Empty date string");
    }

    std::string trimmed(first, last);
    std::tm tm = {};
    std::istringstream iss(trimmed);
    iss >> std::get_time(&tm, "%Y-%m-%d");

    if (iss.fail()) {
        return makeError(ErrorCode::InvalidInput,
            "Failed to parse date: '" + trimmed + "' (expected YYYY-MM-DD)");
    }

    // Допускаем хвост со временем ("2024-01-10 00:00:00", "2024-01-10T09:15")
    int next = iss.peek();
    if (next != std::char_traits<char>::eof() && next != ' ' && next != 'T') {
        return makeError(ErrorCode::InvalidInput,
            "Unexpected characters after date: '" + trimmed + "'");
    }

    year_month_day ymd{
        year{tm.tm_year + 1900},
        month{static_cast<unsigned>(tm.tm_mon + 1)},
        day{static_cast<unsigned>(tm.tm_mday)}};

    if (!ymd.ok()) {
        return makeError(ErrorCode::InvalidInput, "Invalid calendar date: '" + trimmed + "'");
    }

    return sys_days{ymd};
}

std::string formatIsoDate(const Date& date)
{
    year_month_day ymd{date};
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

Date makeDate(int y, unsigned m, unsigned d)
{
    return sys_days{year{y} / month{m} / day{d}};
}

int yearOf(const Date& date) noexcept
{
    return static_cast<int>(year_month_day{date}.year());
}

Date addYearsClamped(const Date& date, int years) noexcept
{
    year_month_day ymd{date};
    year_month_day shifted = ymd + std::chrono::years{years};

    if (!shifted.ok()) {
        // Единственный недопустимый случай: 29 февраля -> невисокосный год
        shifted = year_month_day{shifted.year(), February, day{28}};
    }
    return sys_days{shifted};
}

bool heldAtLeastYears(const Date& buyDate, const Date& sellDate, int years) noexcept
{
    if (sellDate < buyDate) {
        return false;
    }
    return sellDate >= addYearsClamped(buyDate, years);
}

double holdingYears(const Date& buyDate, const Date& sellDate) noexcept
{
    auto days = (sellDate - buyDate).count();
    return std::max(0.0, static_cast<double>(days) / 365.25);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Финансовый год
// ═══════════════════════════════════════════════════════════════════════════════

std::string fiscalYearLabel(const Date& date)
{
    year_month_day ymd{date};
    int y = static_cast<int>(ymd.year());
    if (ymd.month() >= April) {
        ++y;
    }
    return "FY" + std::to_string(y);
}

namespace {

Expected<int> parseFiscalYear(std::string_view label)
{
    if (label.size() <= 2 || label.substr(0, 2) != "FY") {
        return makeError(ErrorCode::InvalidInput,
            "FY must be like FY2025, got: '" + std::string(label) + "'");
    }

    auto digits = label.substr(2);
    if (!std::all_of(digits.begin(), digits.end(),
            [](unsigned char c) { return std::isdigit(c); }) || digits.size() > 4) {
        return makeError(ErrorCode::InvalidInput,
            "FY must be like FY2025, got: '" + std::string(label) + "'");
    }

    return std::stoi(std::string(digits));
}

}  // namespace

Expected<Date> fiscalYearStart(std::string_view label)
{
    auto fy = parseFiscalYear(label);
    if (!fy) {
        return std::unexpected(fy.error());
    }
    return makeDate(*fy - 1, 4, 1);
}

Expected<Date> fiscalYearEnd(std::string_view label)
{
    auto fy = parseFiscalYear(label);
    if (!fy) {
        return std::unexpected(fy.error());
    }
    return makeDate(*fy, 3, 31);
}

}  // namespace taxlot
