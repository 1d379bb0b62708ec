// bff/eval/value.hpp - Run-time values of the BFF language
//
// A Value is one of Boolean, Integer, String, Array or Struct. Arrays are
// homogeneous (all Strings or all Structs) and untyped while empty. Values
// own their contents and are copied, never shared, between variables.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bff
{

/// Session-wide id of a VariableDefinition. Ids start at 1 and only grow.
using DefinitionId = int32_t;

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  Boolean,
  Integer,
  String,
  Array,
  Struct,
};

struct StructMember;

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  /// Default value is `false`.
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_bool(bool value);
  static Value make_integer(int32_t value);
  static Value make_string(std::string value);
  static Value make_array(std::vector<Value> items = {});
  static Value make_struct(std::vector<StructMember> members = {});

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Boolean; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_array() const noexcept { return kind_ == ValueKind::Array; }
  [[nodiscard]] bool is_struct() const noexcept { return kind_ == ValueKind::Struct; }

  /// Kind of the items of a non-empty array; nullopt for empty arrays and non-arrays.
  [[nodiscard]] std::optional<ValueKind> element_kind() const noexcept
  {
    if (!is_array() || arrayItems_.empty()) {
      return std::nullopt;
    }
    return arrayItems_.front().kind();
  }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  [[nodiscard]] bool as_bool() const noexcept { return boolValue_; }
  [[nodiscard]] int32_t as_integer() const noexcept { return intValue_; }
  [[nodiscard]] const std::string & as_string() const noexcept { return stringValue_; }
  [[nodiscard]] const std::vector<Value> & as_array() const noexcept { return arrayItems_; }
  [[nodiscard]] const std::vector<StructMember> & members() const noexcept { return members_; }

  [[nodiscard]] std::string & string_mut() noexcept { return stringValue_; }
  [[nodiscard]] std::vector<Value> & array_mut() noexcept { return arrayItems_; }
  [[nodiscard]] std::vector<StructMember> & members_mut() noexcept { return members_; }

  void set_integer(int32_t v) noexcept { intValue_ = v; }

  /// Struct member by name, or nullptr.
  [[nodiscard]] const StructMember * find_member(std::string_view name) const noexcept;

  /**
   * Structural equality.
   *
   * Arrays compare item by item. Structs compare as sets of (name, value)
   * pairs, so member order does not matter.
   */
  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

private:
  ValueKind kind_ = ValueKind::Boolean;
  bool boolValue_ = false;
  int32_t intValue_ = 0;
  std::string stringValue_;
  std::vector<Value> arrayItems_;
  std::vector<StructMember> members_;
};

/**
 * A field of a Struct value.
 *
 * `definitions` lists the variable definitions the field came from. A field
 * gains extra owners when it is pulled into a scope with Using and then
 * captured again by a struct literal.
 */
struct StructMember
{
  std::string name;
  Value value;
  std::vector<DefinitionId> definitions;
};

// Factories are defined once StructMember is complete.

inline Value Value::make_bool(bool value)
{
  Value v;
  v.kind_ = ValueKind::Boolean;
  v.boolValue_ = value;
  return v;
}

inline Value Value::make_integer(int32_t value)
{
  Value v;
  v.kind_ = ValueKind::Integer;
  v.intValue_ = value;
  return v;
}

inline Value Value::make_string(std::string value)
{
  Value v;
  v.kind_ = ValueKind::String;
  v.stringValue_ = std::move(value);
  return v;
}

inline Value Value::make_array(std::vector<Value> items)
{
  Value v;
  v.kind_ = ValueKind::Array;
  v.arrayItems_ = std::move(items);
  return v;
}

inline Value Value::make_struct(std::vector<StructMember> members)
{
  Value v;
  v.kind_ = ValueKind::Struct;
  v.members_ = std::move(members);
  return v;
}

// ============================================================================
// Type Names
// ============================================================================

/// "Boolean", "Integer", "String", "Array" or "Struct".
[[nodiscard]] std::string_view type_name(const Value & value) noexcept;

/// type_name() with an article: "a String", "an Array", ...
[[nodiscard]] std::string type_name_a(const Value & value);

/**
 * Like type_name_a(), but non-empty arrays name their element type:
 * "an Array of Strings", "an Array of Structs".
 */
[[nodiscard]] std::string type_name_a_detailed(const Value & value);

// ============================================================================
// Rendering
// ============================================================================

/**
 * Multi-line rendering used by hover.
 *
 * Scalars render as JSON (strings quoted). Arrays render as `{ ... }` and
 * structs as `[ .Name = value ... ]`, one item per line, indented by four
 * spaces per level.
 */
[[nodiscard]] std::string value_to_string(const Value & value, const std::string & indentation = "");

/**
 * Text substituted for a `$Name$` interpolation.
 *
 * Strings are used as-is, Integers and Booleans in their literal spelling
 * and Arrays of Strings comma-joined. Returns nullopt for values that have
 * no string form (Structs and Arrays of Structs).
 */
[[nodiscard]] std::optional<std::string> to_interpolated_string(const Value & value);

}  // namespace bff
