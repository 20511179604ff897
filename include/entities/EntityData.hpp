/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_DATA_HPP
#define ENTITY_DATA_HPP

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace StrataEngine {

using EntityValue = std::variant<int, float, bool, std::string>;

/**
 * @brief Persistable snapshot of one entity.
 *
 * initArgs are passed back to the registered constructor; changedFields
 * are applied afterwards, in order, through Entity::applyField.
 */
struct EntityData {
    std::string className;
    std::vector<EntityValue> initArgs;
    std::vector<std::pair<std::string, EntityValue>> changedFields;

    bool operator==(const EntityData&) const = default;
};

// Numeric view of a value; ints widen to float
inline std::optional<float> entityValueAsFloat(const EntityValue& value) {
    if (const float* f = std::get_if<float>(&value)) {
        return *f;
    }
    if (const int* i = std::get_if<int>(&value)) {
        return static_cast<float>(*i);
    }
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, const EntityValue& value) {
    std::visit([&os](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            os << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, bool>) {
            os << (v ? "true" : "false");
        } else {
            os << v;
        }
    }, value);
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const EntityData& data) {
    os << data.className << "(";
    for (size_t i = 0; i < data.initArgs.size(); ++i) {
        if (i > 0) os << ", ";
        os << data.initArgs[i];
    }
    os << ")";
    for (const auto& [name, value] : data.changedFields) {
        os << " " << name << "=" << value;
    }
    return os;
}

} // namespace StrataEngine

#endif // ENTITY_DATA_HPP
