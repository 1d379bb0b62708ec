// bff/eval/json_dump.cpp - JSON serialization of evaluation results
#include "bff/eval/json_dump.hpp"

#include <string>

namespace bff
{

using nlohmann::json;

namespace
{

json j_position(const Position & p) { return json{{"line", p.line}, {"character", p.character}}; }

json j_diagnostic(const Diagnostic & d, const SourceRegistry & sources)
{
  json j{
    {"severity", std::string(to_string(d.severity))},
    {"message", d.message},
    {"range", to_json(sources.to_file_range(d.primary_range()))},
  };
  json related = json::array();
  for (const auto & label : d.labels) {
    if (label.style == LabelStyle::Secondary) {
      related.push_back(
        json{{"message", label.message}, {"range", to_json(sources.to_file_range(label.range))}});
    }
  }
  j["related"] = std::move(related);
  return j;
}

}  // namespace

json to_json(const FileRange & range)
{
  return json{{"uri", range.uri}, {"start", j_position(range.start)}, {"end", j_position(range.end)}};
}

json to_json(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Boolean:
      return value.as_bool();
    case ValueKind::Integer:
      return value.as_integer();
    case ValueKind::String:
      return value.as_string();
    case ValueKind::Array: {
      json arr = json::array();
      for (const auto & item : value.as_array()) {
        arr.push_back(to_json(item));
      }
      return arr;
    }
    case ValueKind::Struct: {
      json obj = json::object();
      for (const auto & member : value.members()) {
        obj[member.name] = to_json(member.value);
      }
      return obj;
    }
  }
  return nullptr;
}

json to_json(const EvaluatedData & data)
{
  json j;

  json evaluated = json::array();
  for (const auto & v : data.evaluatedVariables) {
    evaluated.push_back(json{{"value", to_json(v.value)}, {"range", to_json(v.range)}});
  }
  j["evaluatedVariables"] = std::move(evaluated);

  json definitions = json::array();
  for (const auto & d : data.variableDefinitions) {
    definitions.push_back(json{{"id", d.id}, {"name", d.name}, {"range", to_json(d.range)}});
  }
  j["variableDefinitions"] = std::move(definitions);

  json references = json::array();
  for (const auto & r : data.variableReferences) {
    references.push_back(json{
      {"definitions", r.definitions},
      {"range", to_json(r.range)},
      {"kind", std::string(to_string(r.kind))},
    });
  }
  j["variableReferences"] = std::move(references);

  json targets = json::array();
  for (const auto & t : data.targetDefinitions) {
    targets.push_back(json{{"id", t.id}, {"name", t.name}, {"range", to_json(t.range)}});
  }
  j["targetDefinitions"] = std::move(targets);

  json target_refs = json::array();
  for (const auto & t : data.targetReferences) {
    target_refs.push_back(json{{"definition", t.definition}, {"range", to_json(t.range)}});
  }
  j["targetReferences"] = std::move(target_refs);

  json includes = json::array();
  for (const auto & inc : data.includeReferences) {
    includes.push_back(json{{"includeUri", inc.includeUri}, {"range", to_json(inc.range)}});
  }
  j["includeReferences"] = std::move(includes);
  j["includeDefinitions"] = data.includeDefinitions;

  json bodies = json::array();
  for (const auto & b : data.genericFunctionBodies) {
    bodies.push_back(json{{"functionName", b.functionName}, {"bodyRange", to_json(b.bodyRange)}});
  }
  j["genericFunctionBodies"] = std::move(bodies);

  return j;
}

json to_json(const EvaluationResult & result, const SourceRegistry & sources)
{
  json j = to_json(result.data);

  if (result.error) {
    json related = json::array();
    for (const auto & info : result.error->related) {
      related.push_back(
        json{{"message", info.message}, {"range", to_json(sources.to_file_range(info.range))}});
    }
    j["error"] = json{
      {"kind", std::string(to_string(result.error->kind))},
      {"message", result.error->message},
      {"range", to_json(sources.to_file_range(result.error->range))},
      {"related", std::move(related)},
    };
  } else {
    j["error"] = nullptr;
  }

  json warnings = json::array();
  for (const auto & d : result.warnings) {
    warnings.push_back(j_diagnostic(d, sources));
  }
  j["warnings"] = std::move(warnings);
  return j;
}

}  // namespace bff
