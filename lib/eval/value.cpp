// bff/eval/value.cpp - Run-time values of the BFF language
#include "bff/eval/value.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace bff
{
namespace
{

constexpr const char * k_indentation = "    ";

// JSON escaping doubles backslashes; paths read better without that.
std::string scalar_to_json(const nlohmann::json & j)
{
  std::string out = j.dump();
  std::string result;
  result.reserve(out.size());
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i] == '\\' && i + 1 < out.size() && out[i + 1] == '\\') {
      result += '\\';
      ++i;
      continue;
    }
    result += out[i];
  }
  return result;
}

}  // namespace

const StructMember * Value::find_member(std::string_view name) const noexcept
{
  for (const auto & m : members_) {
    if (m.name == name) {
      return &m;
    }
  }
  return nullptr;
}

bool Value::operator==(const Value & other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ValueKind::Boolean:
      return boolValue_ == other.boolValue_;
    case ValueKind::Integer:
      return intValue_ == other.intValue_;
    case ValueKind::String:
      return stringValue_ == other.stringValue_;
    case ValueKind::Array:
      return arrayItems_ == other.arrayItems_;
    case ValueKind::Struct: {
      if (members_.size() != other.members_.size()) {
        return false;
      }
      return std::all_of(members_.begin(), members_.end(), [&](const StructMember & m) {
        const StructMember * o = other.find_member(m.name);
        return o != nullptr && o->value == m.value;
      });
    }
  }
  return false;
}

std::string_view type_name(const Value & value) noexcept
{
  switch (value.kind()) {
    case ValueKind::Boolean:
      return "Boolean";
    case ValueKind::Integer:
      return "Integer";
    case ValueKind::String:
      return "String";
    case ValueKind::Array:
      return "Array";
    case ValueKind::Struct:
      return "Struct";
  }
  return "";
}

std::string type_name_a(const Value & value)
{
  const std::string_view name = type_name(value);
  const bool vowel = value.is_integer() || value.is_array();
  return std::string(vowel ? "an " : "a ") + std::string(name);
}

std::string type_name_a_detailed(const Value & value)
{
  if (!value.is_array() || value.as_array().empty()) {
    return type_name_a(value);
  }
  return "an Array of " + std::string(type_name(value.as_array().front())) + "s";
}

std::string value_to_string(const Value & value, const std::string & indentation)
{
  switch (value.kind()) {
    case ValueKind::Boolean:
      return value.as_bool() ? "true" : "false";
    case ValueKind::Integer:
      return std::to_string(value.as_integer());
    case ValueKind::String:
      return scalar_to_json(nlohmann::json(value.as_string()));
    case ValueKind::Array: {
      if (value.as_array().empty()) {
        return "{}";
      }
      const std::string item_indentation = indentation + k_indentation;
      std::string out = "{";
      for (const auto & item : value.as_array()) {
        out += "\n" + item_indentation + value_to_string(item, item_indentation);
      }
      out += "\n" + indentation + "}";
      return out;
    }
    case ValueKind::Struct: {
      if (value.members().empty()) {
        return "[]";
      }
      const std::string item_indentation = indentation + k_indentation;
      std::string out = "[";
      for (const auto & m : value.members()) {
        out += "\n" + item_indentation + "." + m.name + " = " +
               value_to_string(m.value, item_indentation);
      }
      out += "\n" + indentation + "]";
      return out;
    }
  }
  return "";
}

std::optional<std::string> to_interpolated_string(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Boolean:
      return std::string(value.as_bool() ? "true" : "false");
    case ValueKind::Integer:
      return std::to_string(value.as_integer());
    case ValueKind::String:
      return value.as_string();
    case ValueKind::Array: {
      std::string out;
      bool first = true;
      for (const auto & item : value.as_array()) {
        if (!item.is_string()) {
          return std::nullopt;
        }
        if (!first) {
          out += ",";
        }
        out += item.as_string();
        first = false;
      }
      return out;
    }
    case ValueKind::Struct:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace bff
