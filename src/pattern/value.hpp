#pragma once

// ---------------------------------------------------------------------------
// value.hpp
//
// 스키마가 없는 문서 트리 (JSON/YAML 호환) 표현.
//
// [구조]
// - Map    : 삽입 순서를 보존하는 (key, Value) 목록
// - Array  : Value 의 순서 있는 목록
// - Scalar : null | bool | int64 | double | string
//
// [설계 원칙]
// - 트리는 외부 로더(PolicyLoader)가 한 번 생성하고 이후 읽기 전용으로 쓰인다.
// - 순회 코드는 visit() 로 세 가지 경우를 모두 처리해야 한다.
//   "알 수 없는 노드 타입" 분기는 이 타입 안에서는 존재하지 않는다.
// - 트리는 값 의미론(value semantics)으로 소유되므로 순환이 생길 수 없다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// ValueKind
//   트리 노드의 세 가지 형태.
// ---------------------------------------------------------------------------
enum class ValueKind : std::uint8_t {
    kMap    = 0,
    kArray  = 1,
    kScalar = 2,
};

using Scalar = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

// ---------------------------------------------------------------------------
// Value
//   문서 트리 노드 하나. 생성자는 테스트/로더에서 리터럴처럼 트리를
//   조립할 수 있도록 암시적 변환을 허용한다.
//
//   Value pattern = Value::Map{
//       {"spec", Value::Map{{"containers", Value::Array{}}}},
//   };
// ---------------------------------------------------------------------------
class Value {
public:
    using Array = std::vector<Value>;
    using Map   = std::vector<std::pair<std::string, Value>>;
    using Node  = std::variant<Map, Array, Scalar>;

    Value() : node_(Scalar{nullptr}) {}

    // NOLINTBEGIN(google-explicit-constructor)
    Value(std::nullptr_t)       : node_(Scalar{nullptr}) {}
    Value(bool b)               : node_(Scalar{b}) {}
    Value(int i)                : node_(Scalar{static_cast<std::int64_t>(i)}) {}
    Value(std::int64_t i)       : node_(Scalar{i}) {}
    Value(double d)             : node_(Scalar{d}) {}
    Value(const char* s)        : node_(Scalar{std::string{s}}) {}
    Value(std::string s)        : node_(Scalar{std::move(s)}) {}
    Value(Scalar s)             : node_(std::move(s)) {}
    Value(Array a)              : node_(std::move(a)) {}
    Value(Map m)                : node_(std::move(m)) {}
    // NOLINTEND(google-explicit-constructor)

    [[nodiscard]] ValueKind kind() const noexcept;

    [[nodiscard]] bool is_map() const noexcept    { return kind() == ValueKind::kMap; }
    [[nodiscard]] bool is_array() const noexcept  { return kind() == ValueKind::kArray; }
    [[nodiscard]] bool is_scalar() const noexcept { return kind() == ValueKind::kScalar; }
    [[nodiscard]] bool is_null() const noexcept;

    // as_*
    //   형태가 맞지 않으면 std::bad_variant_access 를 던진다.
    //   호출 전에 is_*() 또는 kind() 로 확인할 것.
    [[nodiscard]] const Map&    as_map() const    { return std::get<Map>(node_); }
    [[nodiscard]] const Array&  as_array() const  { return std::get<Array>(node_); }
    [[nodiscard]] const Scalar& as_scalar() const { return std::get<Scalar>(node_); }

    // as_string
    //   문자열 scalar 이면 그 포인터, 아니면 nullptr.
    [[nodiscard]] const std::string* as_string() const noexcept;

    // find
    //   Map 노드에서 key 와 정확히 일치하는 첫 항목의 값을 반환한다.
    //   Map 이 아니거나 key 가 없으면 nullptr.
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;

    // type_name
    //   오류 메시지용 타입 이름: "map" | "array" | "string" | "bool" |
    //   "int" | "float" | "null"
    [[nodiscard]] std::string_view type_name() const noexcept;

    // visit
    //   Map / Array / Scalar 세 경우를 모두 처리하는 visitor 를 적용한다.
    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), node_);
    }

    bool operator==(const Value&) const = default;

private:
    Node node_;
};
