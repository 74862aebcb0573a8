#pragma once

#include "gridcalc/core/ErrorCode.hpp"
#include "gridcalc/core/Exception.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace gridcalc {
namespace core {

/**
 * @brief Expected<T, E> - 成功值或错误二选一
 *
 * 类似于 std::expected (C++23)：
 * - 热路径无异常开销
 * - 支持移动语义，T 可以是只移动类型
 * - valueOrThrow() 供偏好异常的调用方使用
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

    void destroy() noexcept {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

public:
    using value_type = T;
    using error_type = E;

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(other.value_);
            } else {
                new(&error_) E(other.error_);
            }
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new(&value_) T(std::move(other.value_));
            } else {
                new(&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问（不检查） ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    const T& valueOr(const T& default_value) const & noexcept {
        return has_value_ ? value_ : default_value;
    }

    T valueOr(T&& default_value) && {
        return has_value_ ? std::move(value_) : std::move(default_value);
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    // ========== 函数式操作 ==========

    /**
     * @brief 成功时映射值，失败时原样传递错误
     */
    template<typename F>
    auto map(F&& func) const -> Expected<std::decay_t<decltype(func(std::declval<const T&>()))>, E> {
        using U = std::decay_t<decltype(func(std::declval<const T&>()))>;
        if (has_value_) {
            return Expected<U, E>(func(value_));
        }
        return Expected<U, E>(error_);
    }

    /**
     * @brief 链式操作：func 返回另一个 Expected
     */
    template<typename F>
    auto andThen(F&& func) const -> decltype(func(std::declval<const T&>())) {
        using R = decltype(func(std::declval<const T&>()));
        if (has_value_) {
            return func(value_);
        }
        return R(error_);
    }

    /**
     * @brief 失败时抛出异常
     */
    const T& valueOrThrow() const & {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw error_;
            }
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw std::move(error_);
            }
        }
        return std::move(value_);
    }
};

/**
 * @brief void 特化
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : error_(), has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    const E& error() const & noexcept { return error_; }

    void valueOrThrow() const {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw error_;
            }
        }
    }
};

template<typename T>
Expected<std::decay_t<T>> makeExpected(T&& value) {
    return Expected<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

}} // namespace gridcalc::core
