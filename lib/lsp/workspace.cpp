#include "bff/lsp/workspace.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bff/basic/diagnostic.hpp"
#include "bff/basic/uri.hpp"
#include "bff/eval/errors.hpp"
#include "bff/eval/evaluated_data.hpp"
#include "bff/eval/file_system.hpp"
#include "bff/eval/generic_functions.hpp"
#include "bff/eval/parse_data_provider.hpp"
#include "bff/eval/value.hpp"

namespace bff::lsp
{
namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

constexpr const char * k_root_file_name = "fbuild.bff";
constexpr const char * k_language_id = "fastbuild";

// -----------------------------
// Range helpers
// -----------------------------

json position_to_json(const Position & p)
{
  return json{{"line", p.line}, {"character", p.character}};
}

json range_to_json(const FileRange & r)
{
  return json{{"start", position_to_json(r.start)}, {"end", position_to_json(r.end)}};
}

json location_to_json(const FileRange & r)
{
  return json{{"uri", r.uri}, {"range", range_to_json(r)}};
}

/// Start of the file: where navigation to a whole file lands.
FileRange file_start(const std::string & uri) { return FileRange{uri, {}, {}}; }

/// Dedup key for a location.
std::string location_key(const FileRange & r)
{
  return r.uri + '#' + std::to_string(r.start.line) + ':' + std::to_string(r.start.character) +
         '-' + std::to_string(r.end.line) + ':' + std::to_string(r.end.character);
}

bool range_at(const FileRange & r, std::string_view uri, const Position & p)
{
  return r.uri == uri && r.contains(p);
}

// -----------------------------
// Symbol matching
// -----------------------------

/// Case-insensitive subsequence match. An empty query matches everything.
bool fuzzy_match(std::string_view query, std::string_view name)
{
  size_t qi = 0;
  for (size_t ni = 0; ni < name.size() && qi < query.size(); ++ni) {
    if (
      std::tolower(static_cast<unsigned char>(query[qi])) ==
      std::tolower(static_cast<unsigned char>(name[ni]))) {
      ++qi;
    }
  }
  return qi == query.size();
}

std::string root_setting_error(const std::string & setting)
{
  const std::string prefix = "The \"Root File\" setting is set to \"" + setting + "\", which ";
  if (!is_absolute_path(setting)) {
    return prefix + "is not an absolute file path.";
  }
  std::error_code ec;
  const auto status = fs::status(fs::path(setting), ec);
  if (ec || !fs::exists(status)) {
    return prefix + "does not exist.";
  }
  if (!fs::is_regular_file(status)) {
    return prefix + "is not a file.";
  }
  return {};
}

// -----------------------------
// Cached evaluation of one root
// -----------------------------

struct RootEvaluation
{
  std::string rootUri;
  EvaluatedData data;
  /// Diagnostic items per file URI, in first-reported order of files.
  std::vector<std::pair<std::string, json>> diagnostics;

  json & items_for(const std::string & uri)
  {
    for (auto & [u, items] : diagnostics) {
      if (u == uri) {
        return items;
      }
    }
    diagnostics.emplace_back(uri, json::array());
    return diagnostics.back().second;
  }
};

}  // namespace

// ============================================================================
// Workspace::Impl
// ============================================================================

struct Workspace::Impl
{
  DiskFileSystem disk;
  InMemoryFileSystem overlay{&disk};
  ParseDataProvider provider{overlay};

  EvaluationOptions options;
  std::string rootSetting;

  std::set<std::string> documents;
  std::unordered_map<std::string, std::unique_ptr<RootEvaluation>> cache;

  void invalidate() { cache.clear(); }

  // -----------------------------
  // Root selection
  // -----------------------------

  std::string find_root_uri(std::string_view uri) const
  {
    if (!rootSetting.empty()) {
      if (!root_setting_error(rootSetting).empty()) {
        return {};
      }
      return path_to_file_uri(rootSetting);
    }

    if (const auto path = file_uri_to_path(uri)) {
      fs::path dir = fs::path(*path).parent_path();
      while (true) {
        const std::string candidate = path_to_file_uri((dir / k_root_file_name).generic_string());
        if (overlay.file_exists(candidate)) {
          return candidate;
        }
        const fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) {
          break;
        }
        dir = parent;
      }
    }

    return std::string(uri);
  }

  // -----------------------------
  // Evaluation
  // -----------------------------

  json diagnostic_item(
    Severity severity, std::string message, FileRange range, const json & related) const
  {
    json item;
    item["source"] = k_diagnostic_source;
    item["message"] = std::move(message);
    item["severity"] = std::string(to_string(severity));
    item["range"] = range_to_json(range);
    if (!related.empty()) {
      item["relatedInformation"] = related;
    }
    return item;
  }

  void add_fatal_error(RootEvaluation & ev, const FatalError & error) const
  {
    const auto & sources = provider.sources();
    FileRange range = sources.to_file_range(error.range);
    if (range.uri.empty()) {
      range = file_start(ev.rootUri);
    }

    // Report every syntax error of a file that does not parse, not only the first.
    if (error.kind == FatalErrorKind::Parse) {
      const DiagnosticBag * syntax = provider.syntax_diagnostics(range.uri);
      if (syntax != nullptr && !syntax->empty()) {
        auto & items = ev.items_for(range.uri);
        for (const auto & d : *syntax) {
          items.push_back(diagnostic_item(
            d.severity, d.message, sources.to_file_range(d.primary_range()), json::array()));
        }
        return;
      }
    }

    json related = json::array();
    for (const auto & info : error.related) {
      const FileRange r = sources.to_file_range(info.range);
      if (!r.uri.empty()) {
        related.push_back(json{{"location", location_to_json(r)}, {"message", info.message}});
      }
    }

    std::string message = error.message;
    if (error.kind == FatalErrorKind::Internal) {
      message = "Internal error: " + message;
    }
    ev.items_for(range.uri).push_back(
      diagnostic_item(Severity::Error, std::move(message), range, related));
  }

  void add_warning(RootEvaluation & ev, const Diagnostic & d) const
  {
    const auto & sources = provider.sources();
    FileRange range = sources.to_file_range(d.primary_range());
    if (range.uri.empty()) {
      range = file_start(ev.rootUri);
    }

    json related = json::array();
    for (const auto & label : d.labels) {
      if (label.style != LabelStyle::Secondary) {
        continue;
      }
      const FileRange r = sources.to_file_range(label.range);
      if (!r.uri.empty()) {
        related.push_back(json{{"location", location_to_json(r)}, {"message", label.message}});
      }
    }
    ev.items_for(range.uri).push_back(diagnostic_item(d.severity, d.message, range, related));
  }

  RootEvaluation & evaluate_root(const std::string & root_uri)
  {
    auto it = cache.find(root_uri);
    if (it != cache.end()) {
      return *it->second;
    }

    auto ev = std::make_unique<RootEvaluation>();
    ev->rootUri = root_uri;

    Evaluator evaluator(provider, options);
    EvaluationResult result = evaluator.evaluate(root_uri);

    // Ranges are resolved now: the registry changes when files are re-parsed.
    if (result.error) {
      add_fatal_error(*ev, *result.error);
    }
    for (const auto & w : result.warnings) {
      add_warning(*ev, w);
    }
    ev->data = std::move(result.data);

    auto & slot = cache[root_uri];
    slot = std::move(ev);
    return *slot;
  }

  /// Evaluation for the document, or nullptr when the root setting is invalid.
  RootEvaluation * evaluation_for(std::string_view uri)
  {
    const std::string root = find_root_uri(uri);
    if (root.empty()) {
      return nullptr;
    }
    return &evaluate_root(root);
  }

  // -----------------------------
  // Features
  // -----------------------------

  json diagnostics_json_impl(std::string_view uri)
  {
    json out;
    out["rootUri"] = nullptr;
    out["files"] = json::array();

    if (!rootSetting.empty()) {
      std::string error = root_setting_error(rootSetting);
      if (!error.empty()) {
        json items = json::array();
        items.push_back(diagnostic_item(
          Severity::Error, std::move(error), file_start(std::string(uri)), json::array()));
        out["files"].push_back(json{{"uri", std::string(uri)}, {"items", std::move(items)}});
        return out;
      }
    }

    RootEvaluation * ev = evaluation_for(uri);
    if (ev == nullptr) {
      return out;
    }
    out["rootUri"] = ev->rootUri;
    for (const auto & [file_uri, items] : ev->diagnostics) {
      out["files"].push_back(json{{"uri", file_uri}, {"items", items}});
    }
    return out;
  }

  json hover_json_impl(std::string_view uri, const Position & pos)
  {
    json out;
    out["uri"] = std::string(uri);
    out["contents"] = nullptr;
    out["range"] = nullptr;

    RootEvaluation * ev = evaluation_for(uri);
    if (ev == nullptr) {
      return out;
    }

    const EvaluatedVariable * first = nullptr;
    std::vector<const Value *> values;
    for (const auto & var : ev->data.evaluatedVariables) {
      if (!range_at(var.range, uri, pos)) {
        continue;
      }
      if (first == nullptr) {
        first = &var;
      }
      const bool seen = std::any_of(
        values.begin(), values.end(), [&](const Value * v) { return *v == var.value; });
      if (!seen) {
        values.push_back(&var.value);
      }
    }

    if (first == nullptr) {
      return out;
    }

    std::string text;
    if (values.size() == 1) {
      text = value_to_string(*values.front());
    } else {
      text = "Values:";
      for (const Value * v : values) {
        text += "\n" + value_to_string(*v);
      }
    }

    out["contents"] = std::string("```") + k_language_id + "\n" + text + "\n```";
    out["range"] = range_to_json(first->range);
    return out;
  }

  json definition_json_impl(std::string_view uri, const Position & pos)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    RootEvaluation * ev = evaluation_for(uri);
    if (ev == nullptr) {
      return out;
    }
    const EvaluatedData & data = ev->data;

    auto push = [&](const FileRange & target, const FileRange & origin) {
      json loc = location_to_json(target);
      loc["originSelectionRange"] = range_to_json(origin);
      out["locations"].push_back(std::move(loc));
    };

    for (const auto & ref : data.variableReferences) {
      if (!range_at(ref.range, uri, pos)) {
        continue;
      }
      for (const DefinitionId id : ref.definitions) {
        if (const auto * def = data.find_variable_definition(id)) {
          push(def->range, ref.range);
        }
      }
      return out;
    }

    for (const auto & ref : data.targetReferences) {
      if (!range_at(ref.range, uri, pos)) {
        continue;
      }
      if (const auto * def = data.find_target_definition(ref.definition)) {
        push(def->range, ref.range);
      }
      return out;
    }

    for (const auto & inc : data.includeReferences) {
      if (range_at(inc.range, uri, pos)) {
        push(file_start(inc.includeUri), inc.range);
        return out;
      }
    }

    return out;
  }

  json references_json_impl(std::string_view uri, const Position & pos)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    RootEvaluation * ev = evaluation_for(uri);
    if (ev == nullptr) {
      return out;
    }
    const EvaluatedData & data = ev->data;

    // Loops and repeated includes record the same location many times.
    std::set<std::string> seen;
    auto push = [&](const FileRange & r) {
      if (seen.insert(location_key(r)).second) {
        out["locations"].push_back(location_to_json(r));
      }
    };

    const auto var_it = std::find_if(
      data.variableReferences.begin(), data.variableReferences.end(),
      [&](const VariableReference & ref) { return range_at(ref.range, uri, pos); });
    if (var_it != data.variableReferences.end()) {
      const auto & wanted = var_it->definitions;
      for (const auto & ref : data.variableReferences) {
        const bool shares = std::any_of(
          ref.definitions.begin(), ref.definitions.end(), [&](DefinitionId id) {
            return std::find(wanted.begin(), wanted.end(), id) != wanted.end();
          });
        if (shares) {
          push(ref.range);
        }
      }
      return out;
    }

    const auto target_it = std::find_if(
      data.targetReferences.begin(), data.targetReferences.end(),
      [&](const TargetReference & ref) { return range_at(ref.range, uri, pos); });
    if (target_it != data.targetReferences.end()) {
      for (const auto & ref : data.targetReferences) {
        if (ref.definition == target_it->definition) {
          push(ref.range);
        }
      }
      return out;
    }

    const auto inc_it = std::find_if(
      data.includeReferences.begin(), data.includeReferences.end(),
      [&](const IncludeReference & inc) { return range_at(inc.range, uri, pos); });
    if (inc_it != data.includeReferences.end()) {
      push(file_start(inc_it->includeUri));
      for (const auto & inc : data.includeReferences) {
        if (inc.includeUri == inc_it->includeUri) {
          push(inc.range);
        }
      }
    }

    return out;
  }

  json document_symbols_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["symbols"] = json::array();

    RootEvaluation * ev = evaluation_for(uri);
    if (ev == nullptr) {
      return out;
    }

    auto push_sym = [&](const std::string & name, const char * kind, const FileRange & range) {
      json s;
      s["name"] = name;
      s["kind"] = kind;
      s["range"] = range_to_json(range);
      s["selectionRange"] = range_to_json(range);
      out["symbols"].push_back(std::move(s));
    };

    for (const auto & def : ev->data.targetDefinitions) {
      if (def.range.uri == uri) {
        push_sym(def.name, "Function", def.range);
      }
    }

    std::set<std::string> seen;
    for (const auto & def : ev->data.variableDefinitions) {
      if (def.range.uri == uri && seen.insert(location_key(def.range)).second) {
        push_sym(def.name, "Variable", def.range);
      }
    }

    return out;
  }

  json workspace_symbols_json_impl(std::string_view query)
  {
    json out;
    out["symbols"] = json::array();

    std::set<std::string> roots;
    for (const auto & doc : documents) {
      const std::string root = find_root_uri(doc);
      if (!root.empty()) {
        roots.insert(root);
      }
    }

    std::set<std::string> seen;
    auto push_sym = [&](const std::string & name, const char * kind, const FileRange & range) {
      if (!fuzzy_match(query, name) || !seen.insert(location_key(range)).second) {
        return;
      }
      json s;
      s["name"] = name;
      s["kind"] = kind;
      s["location"] = location_to_json(range);
      out["symbols"].push_back(std::move(s));
    };

    for (const auto & root : roots) {
      const RootEvaluation & ev = evaluate_root(root);
      for (const auto & def : ev.data.targetDefinitions) {
        push_sym(def.name, "Function", def.range);
      }
      for (const auto & def : ev.data.variableDefinitions) {
        push_sym(def.name, "Variable", def.range);
      }
    }

    return out;
  }

  json completion_json_impl(std::string_view uri, const Position & pos)
  {
    json out;
    out["uri"] = std::string(uri);
    out["isIncomplete"] = false;
    out["items"] = json::array();

    RootEvaluation * ev = evaluation_for(uri);
    if (ev == nullptr) {
      return out;
    }

    std::set<std::string> labels;
    auto push_item = [&](std::string label, const char * kind, std::string detail) {
      if (!labels.insert(label).second) {
        return;
      }
      json item;
      item["label"] = std::move(label);
      item["kind"] = kind;
      if (!detail.empty()) {
        item["detail"] = std::move(detail);
      }
      out["items"].push_back(std::move(item));
    };

    // Innermost enclosing build function body.
    const GenericFunctionBody * body = nullptr;
    for (const auto & b : ev->data.genericFunctionBodies) {
      if (!range_at(b.bodyRange, uri, pos)) {
        continue;
      }
      if (body == nullptr || body->bodyRange.start < b.bodyRange.start) {
        body = &b;
      }
    }
    if (body != nullptr) {
      if (const auto * info = find_generic_function(body->functionName)) {
        for (const auto & prop : info->properties) {
          push_item(
            "." + std::string(prop.name), "Property",
            prop.required ? "Required: true" : "Required: false");
        }
      }
    }

    for (const auto & def : ev->data.variableDefinitions) {
      if (def.range.uri == uri && def.range.start < pos) {
        push_item("." + def.name, "Variable", {});
      }
    }

    return out;
  }
};

// ============================================================================
// Workspace
// ============================================================================

Workspace::Workspace() : impl_(new Impl()) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

void Workspace::set_document(std::string uri, std::string text)
{
  impl_->documents.insert(uri);
  impl_->overlay.set_file(uri, std::move(text));
  impl_->invalidate();
}

void Workspace::remove_document(std::string_view uri)
{
  const std::string key(uri);
  impl_->documents.erase(key);
  impl_->overlay.remove_file(key);
  impl_->provider.invalidate(key);
  impl_->invalidate();
}

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->documents.count(std::string(uri)) != 0;
}

void Workspace::set_root_file(std::string path)
{
  impl_->rootSetting = std::move(path);
  impl_->invalidate();
}

void Workspace::set_evaluation_options(EvaluationOptions options)
{
  impl_->options = std::move(options);
  impl_->invalidate();
}

std::string Workspace::root_uri(std::string_view uri) { return impl_->find_root_uri(uri); }

std::string Workspace::diagnostics_json(std::string_view uri)
{
  const json j = impl_->diagnostics_json_impl(uri);
  return j.dump();
}

std::string Workspace::hover_json(std::string_view uri, uint32_t line, uint32_t character)
{
  const json j = impl_->hover_json_impl(uri, Position{line, character});
  return j.dump();
}

std::string Workspace::definition_json(std::string_view uri, uint32_t line, uint32_t character)
{
  const json j = impl_->definition_json_impl(uri, Position{line, character});
  return j.dump();
}

std::string Workspace::references_json(std::string_view uri, uint32_t line, uint32_t character)
{
  const json j = impl_->references_json_impl(uri, Position{line, character});
  return j.dump();
}

std::string Workspace::document_symbols_json(std::string_view uri)
{
  const json j = impl_->document_symbols_json_impl(uri);
  return j.dump();
}

std::string Workspace::workspace_symbols_json(std::string_view query)
{
  const json j = impl_->workspace_symbols_json_impl(query);
  return j.dump();
}

std::string Workspace::completion_json(std::string_view uri, uint32_t line, uint32_t character)
{
  const json j = impl_->completion_json_impl(uri, Position{line, character});
  return j.dump();
}

}  // namespace bff::lsp
