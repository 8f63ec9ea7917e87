#pragma once

#include <QString>

#include <optional>
#include <utility>

#include "models/Errors.hpp"

namespace marketbrief {

//! Value or (ErrorKind, message) returned from every fallible boundary.
template <typename T>
class Result {
public:
    static Result success(T value)
    {
        Result result;
        result.m_value = std::move(value);
        return result;
    }

    static Result failure(ErrorKind kind, QString message = {})
    {
        Result result;
        result.m_error = kind;
        result.m_errorMessage = std::move(message);
        return result;
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *m_value; }
    T& value() { return *m_value; }
    T valueOr(T fallback) const { return m_value ? *m_value : std::move(fallback); }

    ErrorKind error() const { return m_error; }
    const QString& errorMessage() const { return m_errorMessage; }

private:
    Result() = default;

    std::optional<T> m_value;
    ErrorKind        m_error = ErrorKind::NotFound;
    QString          m_errorMessage;
};

} // namespace marketbrief
