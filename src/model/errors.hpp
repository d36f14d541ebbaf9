/**
 * @file errors.hpp
 * @brief Типизированные ошибки расчётного ядра
 *
 * Структурные ошибки входных данных сообщаются исключениями.
 * Физически неправдоподобные отсчёты исключений не вызывают:
 * они помечаются NULL-значением в выходной кривой.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace petrolog::model {

/**
 * @brief Категория ошибки
 */
enum class ErrorKind {
    MalformedInput,     ///< Несогласованные длины кривой и оси глубин, битый файл
    CurveNotFound,      ///< Ни один псевдоним кривой не найден
    InsufficientData,   ///< Мало валидных отсчётов для расчёта
    InvalidParameter    ///< Параметр вне допустимого диапазона
};

[[nodiscard]] inline const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedInput: return "malformed_input";
        case ErrorKind::CurveNotFound: return "curve_not_found";
        case ErrorKind::InsufficientData: return "insufficient_data";
        case ErrorKind::InvalidParameter: return "invalid_parameter";
    }
    return "malformed_input";
}

/**
 * @brief Базовая ошибка ядра
 */
class PetroError : public std::runtime_error {
public:
    PetroError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Некорректные входные данные
 */
class MalformedInputError : public PetroError {
public:
    explicit MalformedInputError(const std::string& message, size_t line = 0)
        : PetroError(ErrorKind::MalformedInput, message)
        , line_(line) {}

    /// Номер строки исходного файла (0, если не применимо)
    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/**
 * @brief Кривая не найдена ни по одному псевдониму
 */
class CurveNotFoundError : public PetroError {
public:
    explicit CurveNotFoundError(std::vector<std::string> aliases)
        : PetroError(ErrorKind::CurveNotFound, makeMessage(aliases))
        , aliases_(std::move(aliases)) {}

    [[nodiscard]] const std::vector<std::string>& aliases() const noexcept { return aliases_; }

private:
    static std::string makeMessage(const std::vector<std::string>& aliases) {
        std::string msg = "Кривая не найдена (искали: ";
        for (size_t i = 0; i < aliases.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += aliases[i];
        }
        msg += ")";
        return msg;
    }

    std::vector<std::string> aliases_;
};

/**
 * @brief Недостаточно валидных отсчётов
 */
class InsufficientDataError : public PetroError {
public:
    InsufficientDataError(const std::string& what, size_t required, size_t available)
        : PetroError(ErrorKind::InsufficientData,
              what + ": требуется не менее " + std::to_string(required) +
              " валидных отсчётов, доступно " + std::to_string(available))
        , required_(required)
        , available_(available) {}

    [[nodiscard]] size_t required() const noexcept { return required_; }
    [[nodiscard]] size_t available() const noexcept { return available_; }

private:
    size_t required_;
    size_t available_;
};

/**
 * @brief Параметр вне допустимого диапазона
 */
class InvalidParameterError : public PetroError {
public:
    InvalidParameterError(const std::string& name, const std::string& message)
        : PetroError(ErrorKind::InvalidParameter, message)
        , name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace petrolog::model
