// bff/eval/operators.cpp - The `+` and `-` algebra over values
#include "bff/eval/operators.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include "bff/eval/errors.hpp"

namespace bff
{
namespace
{

[[noreturn]] void fail(SourceRange range, const std::string & message)
{
  throw EvaluationError(range, message);
}

int32_t wrap_int32(int64_t v) { return static_cast<int32_t>(static_cast<uint32_t>(v)); }

void add_to_array(Value & existing, const Value & rhs, SourceRange range)
{
  auto & items = existing.array_mut();
  const auto element = existing.element_kind();

  if (!element) {
    if (rhs.is_array()) {
      items.insert(items.end(), rhs.as_array().begin(), rhs.as_array().end());
      return;
    }
    if (rhs.is_string() || rhs.is_struct()) {
      items.push_back(rhs);
      return;
    }
    fail(
      range, "Cannot add " + type_name_a(rhs) +
               " to an Array. Can only add a String, a Struct, or an Array.");
  }

  const bool rhs_matches = rhs.is_array() ? (!rhs.element_kind() || rhs.element_kind() == element)
                                          : rhs.kind() == *element;
  if (!rhs_matches) {
    const std::string element_name = type_name_a(existing.as_array().front());
    const std::string plural = std::string(type_name(existing.as_array().front())) + "s";
    fail(
      range, "Cannot add " + type_name_a_detailed(rhs) + " to an Array of " + plural +
               ". Can only add " + element_name + " or an Array of " + plural + ".");
  }

  if (rhs.is_array()) {
    items.insert(items.end(), rhs.as_array().begin(), rhs.as_array().end());
  } else {
    items.push_back(rhs);
  }
}

void merge_structs(Value & existing, const Value & rhs)
{
  auto & members = existing.members_mut();
  for (const auto & m : rhs.members()) {
    const auto it = std::find_if(
      members.begin(), members.end(), [&](const StructMember & e) { return e.name == m.name; });
    if (it != members.end()) {
      *it = m;
    } else {
      members.push_back(m);
    }
  }
}

void remove_all(std::string & haystack, const std::string & needle)
{
  if (needle.empty()) {
    return;
  }
  std::string out;
  out.reserve(haystack.size());
  size_t pos = 0;
  while (true) {
    const size_t found = haystack.find(needle, pos);
    if (found == std::string::npos) {
      out.append(haystack, pos, std::string::npos);
      break;
    }
    out.append(haystack, pos, found - pos);
    pos = found + needle.size();
  }
  haystack = std::move(out);
}

}  // namespace

void add_in_place(Value & existing, const Value & rhs, SourceRange range)
{
  switch (existing.kind()) {
    case ValueKind::Array:
      add_to_array(existing, rhs, range);
      return;
    case ValueKind::Struct:
      if (!rhs.is_struct()) {
        fail(range, "Cannot add " + type_name_a(rhs) + " to a Struct. Can only add a Struct.");
      }
      merge_structs(existing, rhs);
      return;
    case ValueKind::String:
      if (!rhs.is_string()) {
        fail(range, "Cannot add " + type_name_a(rhs) + " to a String. Can only add a String.");
      }
      existing.string_mut() += rhs.as_string();
      return;
    case ValueKind::Integer:
      if (!rhs.is_integer()) {
        fail(
          range, "Cannot add " + type_name_a(rhs) + " to an Integer. Can only add an Integer.");
      }
      existing.set_integer(
        wrap_int32(static_cast<int64_t>(existing.as_integer()) + rhs.as_integer()));
      return;
    case ValueKind::Boolean:
      fail(range, "Cannot add to a Boolean.");
  }
}

void subtract_in_place(Value & existing, const Value & rhs, SourceRange range)
{
  switch (existing.kind()) {
    case ValueKind::Array: {
      const auto element = existing.element_kind();
      if (!element) {
        return;
      }
      if (*element != ValueKind::String) {
        fail(
          range,
          "Cannot subtract from an Array of Structs. Can only subtract from an Array if it is "
          "an Array of Strings.");
      }
      if (!rhs.is_string()) {
        fail(
          range, "Cannot subtract " + type_name_a(rhs) +
                   " from an Array of Strings. Can only subtract a String.");
      }
      auto & items = existing.array_mut();
      items.erase(
        std::remove_if(
          items.begin(), items.end(),
          [&](const Value & item) { return item.as_string() == rhs.as_string(); }),
        items.end());
      return;
    }
    case ValueKind::Struct:
      fail(range, "Cannot subtract from a Struct.");
    case ValueKind::String:
      if (!rhs.is_string()) {
        fail(
          range,
          "Cannot subtract " + type_name_a(rhs) + " from a String. Can only subtract a String.");
      }
      remove_all(existing.string_mut(), rhs.as_string());
      return;
    case ValueKind::Integer:
      if (!rhs.is_integer()) {
        fail(
          range, "Cannot subtract " + type_name_a(rhs) +
                   " from an Integer. Can only subtract an Integer.");
      }
      existing.set_integer(
        wrap_int32(static_cast<int64_t>(existing.as_integer()) - rhs.as_integer()));
      return;
    case ValueKind::Boolean:
      fail(range, "Cannot subtract from a Boolean.");
  }
}

}  // namespace bff
