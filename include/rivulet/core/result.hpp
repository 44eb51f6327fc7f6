// ============================================================================
// rivulet/core/result.hpp - Value-or-Error Outcome
// ============================================================================
//
// Result<T, E> holds either a success value or an error. It is the outcome
// type of every Deferred<T> (Result<T, Error>) and the return type of
// Task-based state-action steps, so a step can fail without exceptions.
//
// USAGE:
// ------
//   Result<std::pair<int, long>, Error> Step(long seed) {
//       if (seed < 0) return Err(make_error_code(Errc::StepFailed));
//       return Ok(std::make_pair(static_cast<int>(seed), seed + 1));
//   }
//
//   auto r = Step(1);
//   if (r.IsOk()) Use(r.Value().first);
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace rivulet {

template <typename T, typename E>
class Result;

// ============================================================================
// Ok / Err construction tags
// ============================================================================

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct ErrTag {
    E error;

    template <typename U>
    explicit ErrTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>(std::forward<E>(error));
}

// Placeholder value for outcomes that carry no payload
struct Unit {
    friend bool operator==(Unit, Unit) noexcept { return true; }
};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

// ============================================================================
// Result<T, E>
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsOk(); }

    // Accessing the wrong alternative is undefined behavior; check first.
    T& Value() & { return *std::get_if<0>(&data_); }
    const T& Value() const& { return *std::get_if<0>(&data_); }
    T&& Value() && { return std::move(*std::get_if<0>(&data_)); }

    E& Error() & { return *std::get_if<1>(&data_); }
    const E& Error() const& { return *std::get_if<1>(&data_); }
    E&& Error() && { return std::move(*std::get_if<1>(&data_)); }

    T ValueOr(T fallback) const {
        if (IsOk()) return Value();
        return fallback;
    }

    // Transform the success value, keep the error
    template <typename F>
    auto Map(F&& func) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        if (IsOk()) {
            return Ok(func(Value()));
        }
        return Err(Error());
    }

    template <typename F>
    auto Map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        if (IsOk()) {
            return Ok(func(std::move(*this).Value()));
        }
        return Err(std::move(*this).Error());
    }

    // Chain a step that itself returns a Result
    template <typename F>
    auto AndThen(F&& func) && -> std::invoke_result_t<F, T&&> {
        if (IsOk()) {
            return func(std::move(*this).Value());
        }
        return Err(std::move(*this).Error());
    }

   private:
    std::variant<T, E> data_;
};

template <typename T, typename E>
bool operator==(const Result<T, E>& lhs, const Result<T, E>& rhs) {
    if (lhs.IsOk() != rhs.IsOk()) return false;
    if (lhs.IsOk()) return lhs.Value() == rhs.Value();
    return lhs.Error() == rhs.Error();
}

template <typename T, typename E>
bool operator!=(const Result<T, E>& lhs, const Result<T, E>& rhs) {
    return !(lhs == rhs);
}

}  // namespace rivulet
