#pragma once

#include "fastxls/core/ErrorCode.hpp"
#include <new>
#include <utility>

namespace fastxls {
namespace core {

/**
 * @brief Expected<T, E> - 不抛异常的结果类型
 *
 * 类似于 std::expected (C++23)。底层模块（有界表、公式记号解析）用它返回
 * 可恢复的错误，调用方决定抛出异常还是降级处理。
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
            Expected copy(other);
            *this = std::move(copy);
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
};

template<typename T>
using Result = Expected<T, Error>;

}} // namespace fastxls::core
