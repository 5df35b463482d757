#pragma once

#include <stdexcept>
#include <utility>
#include <variant>

#include "spacecheck/Record.hpp"
#include "spacecheck/Violation.hpp"

namespace spacecheck {

// Either a value or a non-empty ErrorReport. There is no partial state.
template <typename T>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }

    static Result fail(ErrorReport report) {
        if (report.violations.empty()) throw std::logic_error("failed result needs at least one violation");
        return Result(std::move(report));
    }

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const {
        if (!is_ok()) throw std::logic_error("value() called on a failed result");
        return std::get<T>(m_data);
    }

    T take() && {
        if (!is_ok()) throw std::logic_error("take() called on a failed result");
        return std::get<T>(std::move(m_data));
    }

    const ErrorReport& error() const {
        if (is_ok()) throw std::logic_error("error() called on a successful result");
        return std::get<ErrorReport>(m_data);
    }

private:
    explicit Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    explicit Result(ErrorReport report) : m_data(std::in_place_index<1>, std::move(report)) {}

    std::variant<T, ErrorReport> m_data;
};

using ValidationResult = Result<ValidatedRecord>;

}  // namespace spacecheck
