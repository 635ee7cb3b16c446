/*
 * config_section.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: ConfigSection CRTP base and range checking for configuration
sections

**************************************************/

#ifndef SWEEPLINK_CONFIG_CORE_CONFIG_SECTION_HPP
#define SWEEPLINK_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace sweeplink::config {

using json = nlohmann::json;

struct ConfigValidationError {
    std::string path;  ///< JSON pointer of the offending value
    std::string message;
};

struct ConfigValidationResult {
    bool valid{true};
    std::vector<ConfigValidationError> errors;

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message) {
        valid = false;
        errors.push_back({std::move(path), std::move(message)});
    }
};

/**
 * @brief Records range violations below a JSON pointer prefix
 *
 * Sections receive a checker positioned at their own key; nested objects are
 * reached through at().
 */
class ConfigChecker {
public:
    ConfigChecker(ConfigValidationResult& result, std::string prefix)
        : result_(result), prefix_(std::move(prefix)) {}

    [[nodiscard]] auto at(std::string_view key) const -> ConfigChecker {
        return {result_, pointer(key)};
    }

    void positive(std::string_view key, size_t value) const {
        if (value == 0) {
            fail(key, "must be greater than zero");
        }
    }

    void port(std::string_view key, int value) const {
        if (value < 1 || value > 65535) {
            fail(key,
                 "port must be in 1..65535, got " + std::to_string(value));
        }
    }

    void atLeast(std::string_view key, double value, double minimum) const {
        if (value < minimum) {
            fail(key, "must be at least " + std::to_string(minimum));
        }
    }

    void fraction(std::string_view key, double value) const {
        if (value < 0.0 || value > 1.0) {
            fail(key, "must be within [0, 1]");
        }
    }

    /**
     * @brief Exponential backoff: initial > 0, max >= initial,
     * multiplier >= 1 and jitter in [0, 1]
     */
    void backoff(size_t initialDelayMs, size_t maxDelayMs, double multiplier,
                 double jitter) const {
        positive("initialDelayMs", initialDelayMs);
        if (maxDelayMs < initialDelayMs) {
            fail("maxDelayMs", "must not be smaller than initialDelayMs");
        }
        atLeast("multiplier", multiplier, 1.0);
        fraction("jitter", jitter);
    }

    void fail(std::string_view key, std::string message) const {
        result_.addError(pointer(key), std::move(message));
    }

private:
    [[nodiscard]] auto pointer(std::string_view key) const -> std::string {
        std::string path = prefix_;
        path += '/';
        path += key;
        return path;
    }

    ConfigValidationResult& result_;
    std::string prefix_;
};

template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
};

template <typename T>
concept RangeChecked = requires(const T& t, const ConfigChecker& checker) {
    t.check(checker);
};

/**
 * @brief CRTP base class for configuration sections
 *
 * A section provides PATH ("/sweeplink/<key>"), serialize() and a static
 * deserialize() that fills missing keys from the member defaults. It may
 * also provide check(const ConfigChecker&) to report out-of-range values.
 *
 * @tparam Derived The section struct
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Last component of PATH, used as the key in the fleet document
     */
    [[nodiscard]] static constexpr std::string_view key() noexcept {
        auto full = path();
        auto slash = full.rfind('/');
        return slash == std::string_view::npos ? full
                                               : full.substr(slash + 1);
    }

    [[nodiscard]] json toJson() const { return self().serialize(); }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @return nullopt when a value has the wrong type
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Append range violations to result under "/<key>"
     */
    void validate(ConfigValidationResult& result) const {
        if constexpr (RangeChecked<Derived>) {
            self().check(ConfigChecker(result, "/" + std::string(key())));
        }
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        validate(result);
        return result;
    }

    /**
     * @brief Apply partial overrides as an RFC 7396 merge patch
     *
     * A null in the overrides resets that key to its default.
     * @throws json::exception if an override has the wrong type
     */
    void merge(const json& overrides) {
        auto merged = toJson();
        merged.merge_patch(overrides);
        static_cast<Derived&>(*this) = Derived::deserialize(merged);
    }

    /**
     * @return RFC 6902 patch turning this section into other
     */
    [[nodiscard]] json diff(const Derived& other) const {
        return json::diff(toJson(), other.toJson());
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == other.toJson();
    }

private:
    [[nodiscard]] const Derived& self() const {
        return static_cast<const Derived&>(*this);
    }
};

}  // namespace sweeplink::config

#endif  // SWEEPLINK_CONFIG_CORE_CONFIG_SECTION_HPP
