#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace flowscope {

/// Marker payload for operations that only report success or failure
struct Unit {};

/// Value-or-error return for operations whose failure is expected:
/// event parsing, config loading, baseline persistence.
///
/// Holds exactly one of T or E. Accessing the wrong alternative throws
/// std::logic_error, which is a programming error rather than a data error.
template <typename T, typename E = std::string>
class Result {
    // Alternatives are addressed by index so that T and E may be the same type
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<kValue>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<kError>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == kValue; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == kError; }

    [[nodiscard]] const T& value() const& {
        expect(kValue, "value()");
        return std::get<kValue>(data_);
    }

    [[nodiscard]] T value() && {
        expect(kValue, "value()");
        return std::get<kValue>(std::move(data_));
    }

    [[nodiscard]] const E& error() const& {
        expect(kError, "error()");
        return std::get<kError>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<kValue>(data_) : std::move(fallback);
    }

    /// Move the payload out; the only accessor usable with move-only T
    [[nodiscard]] T take_value() && {
        expect(kValue, "take_value()");
        return std::get<kValue>(std::move(data_));
    }

    /// Apply func to the payload, passing an error through untouched
    template <typename F>
    [[nodiscard]] auto map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
        if (is_err()) {
            return Mapped::Err(std::get<kError>(data_));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kValue>(data_)));
    }

private:
    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> tag, Arg&& arg)
        : data_(tag, std::forward<Arg>(arg)) {}

    void expect(std::size_t index, const char* accessor) const {
        if (data_.index() != index) {
            throw std::logic_error(std::string("Result::") + accessor +
                                   (index == kValue ? " called on an error" : " called on a value"));
        }
    }

    std::variant<T, E> data_;
};

}  // namespace flowscope
