// include/DateUtils.hpp
#pragma once

#include "Types.hpp"
#include "Error.hpp"
#include <string>
#include <string_view>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Работа с календарными датами
// ═══════════════════════════════════════════════════════════════════════════════

// Разобрать дату в формате ISO-8601 (YYYY-MM-DD)
Expected<Date> parseIsoDate(std::string_view text);

std::string formatIsoDate(const Date& date);

Date makeDate(int year, unsigned month, unsigned day);

int yearOf(const Date& date) noexcept;

// Годовщина через years лет. 29 февраля в невисокосный год -> 28 февраля
Date addYearsClamped(const Date& date, int years) noexcept;

// Владение не меньше years полных лет (сравнение по годовщине)
bool heldAtLeastYears(const Date& buyDate, const Date& sellDate, int years) noexcept;

// Срок владения в годах: дни / 365.25, не меньше нуля
double holdingYears(const Date& buyDate, const Date& sellDate) noexcept;

// ───────────────────────────────────────────────────────────────────────────
// Финансовый год апрель-март: 2024-04-01 -> "FY2025"
// ───────────────────────────────────────────────────────────────────────────

std::string fiscalYearLabel(const Date& date);

Expected<Date> fiscalYearStart(std::string_view label);
Expected<Date> fiscalYearEnd(std::string_view label);

}  // namespace taxlot
