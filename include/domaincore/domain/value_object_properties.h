/**
 * @file value_object_properties.h
 * @brief Storage carrier for Value Objects
 */

#pragma once

#include "domaincore/utils/predicates.h"
#include <utility>
#include <variant>

namespace domaincore {
namespace domain {

/**
 * @brief Single-field carrier wrapping a primitive value
 */
template<typename T>
struct PrimitiveProperties {
    T value;
};

/**
 * @brief Tagged union holding a Value Object's internal representation
 *
 * Primitives are wrapped in PrimitiveProperties; structured values are
 * stored as-is. The kind is decided once, on construction.
 */
template<typename T>
class ValueObjectProperties {
public:
    enum class Kind {
        Primitive,
        Structured
    };

    /**
     * @brief Wrap a value, choosing the kind with utils::isPrimitive
     */
    static ValueObjectProperties of(T value) {
        if (utils::isPrimitive(value)) {
            return ValueObjectProperties(
                Storage(std::in_place_index<0>, PrimitiveProperties<T>{std::move(value)}));
        }
        return ValueObjectProperties(Storage(std::in_place_index<1>, std::move(value)));
    }

    [[nodiscard]] Kind kind() const noexcept {
        return storage_.index() == 0 ? Kind::Primitive : Kind::Structured;
    }

    [[nodiscard]] bool isPrimitive() const noexcept {
        return kind() == Kind::Primitive;
    }

    /**
     * @brief Get the stored value regardless of kind
     */
    [[nodiscard]] const T& value() const noexcept {
        if (const auto* wrapped = std::get_if<0>(&storage_)) {
            return wrapped->value;
        }
        return *std::get_if<1>(&storage_);
    }

private:
    using Storage = std::variant<PrimitiveProperties<T>, T>;

    explicit ValueObjectProperties(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

} // namespace domain
} // namespace domaincore
