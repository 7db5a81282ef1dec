#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace numopt {

enum class ErrorKind {
    NonConvergence,
    InvalidBracket,
    DegenerateDerivative
};

const char* to_string(ErrorKind kind);

struct Failure {
    ErrorKind kind;
    std::string message;
};

// Thrown when the value of a failed Outcome is requested.
class SolverError : public std::runtime_error {
public:
    SolverError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Either the solver's value or the reason it gave up.
template <class T>
class Outcome {
public:
    static Outcome success(T value) {
        return Outcome(std::in_place_index<0>, std::move(value));
    }

    static Outcome failure(ErrorKind kind, std::string message) {
        return Outcome(std::in_place_index<1>, Failure{kind, std::move(message)});
    }

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            const Failure& f = std::get<1>(state_);
            throw SolverError(f.kind, f.message);
        }
        return std::get<0>(state_);
    }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(state_) : std::move(fallback);
    }

    // Empty on success.
    std::optional<ErrorKind> kind() const {
        if (ok()) {
            return std::nullopt;
        }
        return std::get<1>(state_).kind;
    }

    const Failure& error() const {
        if (ok()) {
            throw std::logic_error("Outcome::error: outcome holds a value");
        }
        return std::get<1>(state_);
    }

private:
    template <std::size_t I, class U>
    Outcome(std::in_place_index_t<I> tag, U&& payload)
        : state_(tag, std::forward<U>(payload)) {}

    std::variant<T, Failure> state_;
};

} // namespace numopt
