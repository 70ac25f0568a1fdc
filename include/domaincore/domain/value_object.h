/**
 * @file value_object.h
 * @brief Base classes for Value Objects in DDD
 *
 * Value Objects are immutable objects that are defined by their attributes.
 * A concrete Value Object derives from ValueObjectBase (or the
 * SimpleValueObject convenience) and supplies:
 *   - `static constexpr std::string_view kTypeName` used by toString()
 *   - `static void validate(const T&)`, throwing on invalid domain values
 *   - getValue() and isEqualTo() (already provided by SimpleValueObject)
 *
 * Usage example:
 *   class Email : public SimpleValueObject<Email, std::string> {
 *   public:
 *       static constexpr std::string_view kTypeName = "Email";
 *       explicit Email(std::string value) : SimpleValueObject(std::move(value)) {}
 *       static void validate(const std::string& value);
 *   };
 */

#pragma once

#include "domaincore/domain/value_object_properties.h"
#include "domaincore/exception/exceptions.h"
#include "domaincore/utils/predicates.h"
#include "domaincore/utils/value_format.h"
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <spdlog/spdlog.h>

namespace domaincore {
namespace domain {

/**
 * @brief Non-template root of every Value Object
 */
class IValueObject {
public:
    virtual ~IValueObject() = default;

    /**
     * @brief Statically declared name of the concrete type
     */
    [[nodiscard]] virtual std::string_view getTypeName() const noexcept = 0;

    /**
     * @brief Debug representation, "<TypeName> [<value>]" by default
     */
    [[nodiscard]] virtual std::string toString() const = 0;

    /**
     * @brief Check whether a value is a Value Object
     */
    template<typename U>
    static bool isValueObject(const U& candidate) noexcept {
        if constexpr (std::is_pointer_v<U>) {
            return candidate != nullptr && isValueObject(*candidate);
        } else if constexpr (std::is_base_of_v<IValueObject, U>) {
            return true;
        } else if constexpr (std::is_polymorphic_v<U>) {
            return dynamic_cast<const IValueObject*>(std::addressof(candidate)) != nullptr;
        } else {
            return false;
        }
    }

    static bool isValueObject(std::nullptr_t) noexcept {
        return false;
    }

protected:
    IValueObject() = default;
    IValueObject(const IValueObject&) = default;
    IValueObject& operator=(const IValueObject&) = delete;
};

/**
 * @brief Value Object interface over the represented type T
 *
 * @tparam T The type of the represented value
 */
template<typename T>
class ValueObject : public IValueObject {
public:
    using value_type = T;

    /**
     * @brief Get the represented value
     */
    [[nodiscard]] virtual T getValue() const = 0;

    /**
     * @brief Structural equality
     *
     * A null pointer is never equal; the same instance always is.
     */
    [[nodiscard]] bool equals(const ValueObject<T>* other) const {
        if (other == nullptr) {
            return false;
        }
        if (other == this) {
            return true;
        }
        return isEqualTo(*other);
    }

    [[nodiscard]] bool equals(const ValueObject<T>& other) const {
        return equals(&other);
    }

    bool operator==(const ValueObject<T>& other) const {
        return equals(other);
    }

    bool operator!=(const ValueObject<T>& other) const {
        return !equals(other);
    }

protected:
    /**
     * @brief Compare with a distinct instance
     */
    virtual bool isEqualTo(const ValueObject<T>& other) const = 0;
};

/**
 * @brief Generic carrier: emptiness check, validation and storage
 *
 * The only constructor rejects empty input with
 * ArgumentNotProvidedException, then runs Derived::validate, then stores
 * the value. Objects are copyable but never assignable.
 *
 * @tparam Derived Concrete Value Object type (CRTP)
 * @tparam T The type of the represented value
 */
template<typename Derived, typename T>
class ValueObjectBase : public ValueObject<T> {
    static_assert(!utils::is_borrowed_text_v<T>,
                  "Value objects must own their text; store std::string instead");

public:
    [[nodiscard]] std::string_view getTypeName() const noexcept override {
        return Derived::kTypeName;
    }

    /**
     * @brief Debugging representation, not a stable format
     *
     * Numbers use fmt's shortest form, so large or tiny doubles come out in
     * exponent notation (1e+20).
     */
    [[nodiscard]] std::string toString() const override {
        return std::string(getTypeName()) + " [" + formatProperties() + "]";
    }

protected:
    /**
     * @brief Construct a new Value Object
     * @param value The raw value
     * @throws exception::ArgumentNotProvidedException if value is empty
     */
    explicit ValueObjectBase(T value) : properties_(createProperties(std::move(value))) {}

    ValueObjectBase(const ValueObjectBase&) = default;
    ValueObjectBase& operator=(const ValueObjectBase&) = delete;

    [[nodiscard]] const ValueObjectProperties<T>& getProperties() const noexcept {
        return properties_;
    }

private:
    const ValueObjectProperties<T> properties_;

    static ValueObjectProperties<T> createProperties(T value) {
        checkIfEmpty(value);
        Derived::validate(value);
        return ValueObjectProperties<T>::of(std::move(value));
    }

    static void checkIfEmpty(const T& value) {
        if (utils::isEmpty(value)) {
            spdlog::debug("Rejected empty value for value object {}", Derived::kTypeName);
            throw exception::ArgumentNotProvidedException(
                "Property of value object (" + std::string(Derived::kTypeName) +
                ") cannot be empty");
        }
    }

    std::string formatProperties() const {
        const T& value = properties_.value();
        if constexpr (utils::is_primitive_v<T>) {
            return utils::formatValue(value);
        } else if constexpr (std::is_same_v<T, Json::Value>) {
            return properties_.isPrimitive() ? utils::formatValue(value)
                                             : utils::toJsonString(value);
        } else {
            static_assert(utils::has_to_json_v<T>,
                          "Structured value types need a toJson(const T&) overload");
            using utils::toJson;
            return utils::toJsonString(toJson(value));
        }
    }
};

/**
 * @brief Value Object whose equality is equality of the stored value
 *
 * Two instances are equal when they have the same concrete type and their
 * values compare equal.
 */
template<typename Derived, typename T>
class SimpleValueObject : public ValueObjectBase<Derived, T> {
public:
    [[nodiscard]] T getValue() const override {
        return this->getProperties().value();
    }

protected:
    explicit SimpleValueObject(T value) : ValueObjectBase<Derived, T>(std::move(value)) {}

    bool isEqualTo(const ValueObject<T>& other) const override {
        const auto* same = dynamic_cast<const Derived*>(&other);
        return same != nullptr && this->getProperties().value() == same->getProperties().value();
    }
};

/**
 * @brief Specialization for string-based Value Objects
 */
template<typename Derived>
class StringValueObject : public SimpleValueObject<Derived, std::string> {
public:
    /**
     * @brief Get the string length
     */
    [[nodiscard]] size_t length() const noexcept {
        return this->getProperties().value().length();
    }

protected:
    explicit StringValueObject(std::string value)
        : SimpleValueObject<Derived, std::string>(std::move(value)) {}
};

inline std::ostream& operator<<(std::ostream& os, const IValueObject& valueObject) {
    return os << valueObject.toString();
}

} // namespace domain
} // namespace domaincore
