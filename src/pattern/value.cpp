// ---------------------------------------------------------------------------
// value.cpp
// ---------------------------------------------------------------------------

#include "pattern/value.hpp"

ValueKind Value::kind() const noexcept {
    return static_cast<ValueKind>(node_.index());
}

bool Value::is_null() const noexcept {
    const auto* scalar = std::get_if<Scalar>(&node_);
    return scalar != nullptr && std::holds_alternative<std::nullptr_t>(*scalar);
}

const std::string* Value::as_string() const noexcept {
    const auto* scalar = std::get_if<Scalar>(&node_);
    if (scalar == nullptr) {
        return nullptr;
    }
    return std::get_if<std::string>(scalar);
}

const Value* Value::find(std::string_view key) const noexcept {
    const auto* map = std::get_if<Map>(&node_);
    if (map == nullptr) {
        return nullptr;
    }
    for (const auto& [k, v] : *map) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

std::string_view Value::type_name() const noexcept {
    switch (kind()) {
        case ValueKind::kMap:   return "map";
        case ValueKind::kArray: return "array";
        case ValueKind::kScalar:
            break;
    }

    // Scalar 내부 alternative 순서: nullptr_t, bool, int64, double, string
    switch (std::get<Scalar>(node_).index()) {
        case 0:  return "null";
        case 1:  return "bool";
        case 2:  return "int";
        case 3:  return "float";
        case 4:  return "string";
        default: return "unknown";
    }
}
