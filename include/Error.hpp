#pragma once

#include <string>
#include <expected>

namespace taxlot {

// ═══════════════════════════════════════════════════════════════════════════════
// Категории ошибок
// ═══════════════════════════════════════════════════════════════════════════════

enum class ErrorCode {
    InvalidInput,        // Нет обязательных колонок/полей во входных данных
    UnsupportedCountry,  // Код страны не зарегистрирован в реестре
    InvalidRequest,      // Некорректный method_mode или tax_year
    IoError              // Ошибка чтения файла
};

struct Error {
    ErrorCode code;
    std::string message;
};

template<typename T>
using Expected = std::expected<T, Error>;

using Result = std::expected<void, Error>;

inline std::unexpected<Error> makeError(ErrorCode code, std::string message)
{
    return std::unexpected(Error{code, std::move(message)});
}

const char* toString(ErrorCode code) noexcept;

}  // namespace taxlot
