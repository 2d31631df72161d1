#pragma once

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "cirrus/common/result.h"
#include "cirrus/common/types.h"

namespace cirrus {
namespace config {

// ============================================================================
// Type Traits
// ============================================================================

template <typename T>
inline constexpr bool IsPrimitive = std::is_trivially_copyable_v<T> && sizeof(T) <= 8;

template <typename T>
using ReturnType = std::conditional_t<IsPrimitive<T>, T, const T&>;

template <typename T>
using ValueType = std::conditional_t<std::is_same_v<T, const char*>, std::string, T>;

// ============================================================================
// AtomicValue<T> - 基本类型的无锁存储
// ============================================================================

template <typename T>
class AtomicValue {
public:
    AtomicValue() = default;
    explicit AtomicValue(T value) : value_(value) {}
    AtomicValue(const AtomicValue& o) : value_(o.value()) {}

    T value() const { return value_.load(); }
    void setValue(T value) { value_.store(value); }

    AtomicValue& operator=(const AtomicValue& o) {
        setValue(o.value());
        return *this;
    }

private:
    std::atomic<T> value_{};
};

// ============================================================================
// LockedValue<T> - 字符串等复合类型，互斥锁保护
// ============================================================================

template <typename T>
class LockedValue {
public:
    explicit LockedValue(T value) : value_(std::move(value)) {}
    LockedValue(const LockedValue& o) : value_(o.value()) {}

    // 按值返回，并发 set 时引用可能悬空
    T value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    void setValue(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
    }

    LockedValue& operator=(const LockedValue& o) {
        setValue(o.value());
        return *this;
    }

private:
    mutable std::mutex mutex_;
    T value_;
};

template <typename T>
using StoreType = std::conditional_t<IsPrimitive<T>, AtomicValue<T>, LockedValue<T>>;

// ============================================================================
// IItem - 配置项接口
// ============================================================================

struct IItem {
    virtual ~IItem() = default;
    virtual Result<Void> validate(const std::string& path) const = 0;
    virtual Result<Void> parse(const std::string& text) = 0;
    virtual bool supportHotUpdate() const = 0;
    virtual std::string toString() const = 0;
};

// ============================================================================
// Item<T>
// ============================================================================

template <typename T>
class Item : public IItem {
public:
    using Checker = std::function<bool(ReturnType<T>)>;

    Item(std::string name, T defaultValue, bool hotUpdatable, Checker checker = nullptr)
        : value_(std::move(defaultValue)),
          name_(std::move(name)),
          hotUpdatable_(hotUpdatable),
          checker_(checker ? std::move(checker) : [](ReturnType<T>) { return true; }) {}

    T value() const { return value_.value(); }

    bool checkAndSet(ReturnType<T> value) {
        if (checker_(value)) {
            value_.setValue(value);
            return true;
        }
        return false;
    }

    Result<Void> validate(const std::string& path) const override {
        if (!checker_(value())) {
            return Err<Void>(ErrorCode::kInvalidArgument, "Check failed: " + path);
        }
        return Ok();
    }

    Result<Void> parse(const std::string& text) override {
        T parsed{};
        if constexpr (std::is_same_v<T, std::string>) {
            parsed = text;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (text == "true" || text == "1" || text == "yes") parsed = true;
            else if (text == "false" || text == "0" || text == "no") parsed = false;
            else return Err<Void>(ErrorCode::kInvalidArgument, name_ + ": not a boolean: " + text);
        } else if constexpr (std::is_integral_v<T>) {
            char* end = nullptr;
            errno = 0;
            long long v = std::strtoll(text.c_str(), &end, 10);
            if (text.empty() || *end != '\0' || errno == ERANGE) {
                return Err<Void>(ErrorCode::kInvalidArgument, name_ + ": not an integer: " + text);
            }
            if constexpr (std::is_unsigned_v<T>) {
                if (v < 0) {
                    return Err<Void>(ErrorCode::kInvalidArgument, name_ + ": must not be negative");
                }
            }
            parsed = static_cast<T>(v);
        } else {
            static_assert(std::is_same_v<T, std::string>, "unsupported config item type");
        }
        if (!checkAndSet(parsed)) {
            return Err<Void>(ErrorCode::kInvalidArgument, name_ + ": value rejected: " + text);
        }
        return Ok();
    }

    bool supportHotUpdate() const override { return hotUpdatable_; }

    std::string toString() const override {
        if constexpr (std::is_same_v<T, std::string>) {
            return value();
        } else if constexpr (std::is_same_v<T, bool>) {
            return value() ? "true" : "false";
        } else {
            return std::to_string(value());
        }
    }

private:
    StoreType<T> value_;
    std::string name_;
    bool hotUpdatable_;
    Checker checker_;
};

// ============================================================================
// IConfig
// ============================================================================

struct IConfig {
    virtual ~IConfig() = default;
    virtual Result<Void> validate(const std::string& path = {}) const = 0;
};

// ============================================================================
// ConfigBase<Derived> - CRTP 配置基类
// ============================================================================

template <typename Derived>
class ConfigBase : public IConfig {
protected:
    ConfigBase() = default;
    ConfigBase(const ConfigBase&) = default;
    ConfigBase& operator=(const ConfigBase&) = default;

public:
    Result<Void> validate(const std::string& path = {}) const override {
        auto* self = static_cast<const Derived*>(this);
        for (const auto& [name, item] : items_) {
            auto fullPath = path.empty() ? name : path + "." + name;
            auto res = (self->*item).validate(fullPath);
            if (res.hasError()) return res;
        }
        return Ok();
    }

    // 按文本形式设置配置项，例如来自 "--port=9000"
    Result<Void> set(const std::string& name, const std::string& text) {
        auto it = items_.find(name);
        if (it == items_.end()) {
            return Err<Void>(ErrorCode::kInvalidArgument, "Unknown config item: " + name);
        }
        auto* self = static_cast<Derived*>(this);
        return (self->*(it->second)).parse(text);
    }

    // "name=value" lines, sorted by name.
    std::vector<std::string> dump() const {
        std::vector<std::string> lines;
        auto* self = static_cast<const Derived*>(this);
        for (const auto& [name, item] : items_) {
            lines.push_back(name + "=" + (self->*item).toString());
        }
        return lines;
    }

protected:
    std::map<std::string, IItem Derived::*, std::less<>> items_;
};

}  // namespace config

// ============================================================================
// 配置项宏
// ============================================================================

#define CONFIG_ADD_ITEM(name, defaultValue, hotUpdatable, ...)                          \
private:                                                                                \
    using T##name = ::cirrus::config::ValueType<std::decay_t<decltype(defaultValue)>>;  \
    using R##name = ::cirrus::config::ReturnType<T##name>;                              \
public:                                                                                 \
    T##name name() const { return name##_.value(); }                                    \
    bool set_##name(R##name value) { return name##_.checkAndSet(value); }               \
private:                                                                                \
    ::cirrus::config::Item<T##name> name##_ = ::cirrus::config::Item<T##name>(          \
        #name, defaultValue, [this] {                                                   \
            using Self = std::decay_t<decltype(*this)>;                                 \
            ConfigBase<Self>::items_[#name] =                                           \
                reinterpret_cast<::cirrus::config::IItem Self::*>(&Self::name##_);      \
            return hotUpdatable;                                                        \
        }() __VA_OPT__(, ) __VA_ARGS__)

#define CONFIG_ITEM(name, defaultValue, ...) \
    CONFIG_ADD_ITEM(name, defaultValue, false, __VA_ARGS__)

#define CONFIG_HOT_UPDATED_ITEM(name, defaultValue, ...) \
    CONFIG_ADD_ITEM(name, defaultValue, true, __VA_ARGS__)

// ============================================================================
// 校验器
// ============================================================================

namespace config::checkers {

template <typename T>
bool checkPositive(T val) { return val > 0; }

template <typename T>
bool checkNotEmpty(const T& c) { return !c.empty(); }

template <typename T, T Min, T Max>
bool checkRange(T val) { return val >= Min && val <= Max; }

inline bool checkOneOf(const std::string& val, std::initializer_list<const char*> allowed) {
    for (const char* a : allowed) {
        if (val == a) return true;
    }
    return false;
}

}  // namespace config::checkers

}  // namespace cirrus
