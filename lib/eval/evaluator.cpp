// bff/eval/evaluator.cpp - Evaluator entry point and session bookkeeping
#include "bff/eval/evaluator.hpp"

#include <exception>
#include <utility>

#include "bff/basic/uri.hpp"
#include "evaluation_session.hpp"

namespace bff
{

// ============================================================================
// Platform
// ============================================================================

Platform host_platform() noexcept
{
#if defined(_WIN32)
  return Platform::Windows;
#elif defined(__APPLE__)
  return Platform::OSX;
#else
  return Platform::Linux;
#endif
}

std::string_view platform_define_symbol(Platform platform) noexcept
{
  switch (platform) {
    case Platform::Linux:
      return "__LINUX__";
    case Platform::OSX:
      return "__OSX__";
    case Platform::Windows:
      return "__WINDOWS__";
  }
  return "";
}

std::optional<Platform> parse_platform(std::string_view name) noexcept
{
  if (name == "linux") return Platform::Linux;
  if (name == "osx") return Platform::OSX;
  if (name == "windows") return Platform::Windows;
  return std::nullopt;
}

// ============================================================================
// Evaluator
// ============================================================================

Evaluator::Evaluator(ParseDataProvider & provider, EvaluationOptions options)
: provider_(provider), options_(std::move(options))
{
}

EvaluationResult Evaluator::evaluate(const std::string & root_uri)
{
  EvaluationResult result;
  detail::EvaluationSession session(provider_, options_, result.data, result.warnings);

  try {
    session.run(root_uri);
  } catch (const EvaluationError & e) {
    result.error = FatalError{FatalErrorKind::Evaluation, e.what(), e.range(), {}};
  } catch (const ParseError & e) {
    result.error = FatalError{FatalErrorKind::Parse, e.what(), e.range(), {}};
  } catch (const FileReadError & e) {
    result.error = FatalError{FatalErrorKind::Evaluation, e.what(), {}, {}};
  } catch (const std::exception & e) {
    result.error = FatalError{FatalErrorKind::Internal, e.what(), {}, {}};
  }

  session.resolve_pending_target_references();
  return result;
}

namespace detail
{

// ============================================================================
// EvaluationSession
// ============================================================================

EvaluationSession::EvaluationSession(
  ParseDataProvider & provider, const EvaluationOptions & options, EvaluatedData & data,
  DiagnosticBag & warnings)
: provider_(provider), options_(options), data_(data), warnings_(warnings)
{
}

void EvaluationSession::run(const std::string & root_uri)
{
  rootDirUri_ = uri_dirname(root_uri);
  defines_.builtin = std::string(platform_define_symbol(options_.platform));
  bind_builtins();

  const ParsedFile & root = provider_.get_parse_data(root_uri);
  evaluate_file(root);
}

void EvaluationSession::bind_builtins()
{
  std::string working_dir = file_uri_to_path(rootDirUri_).value_or(rootDirUri_);
  while (working_dir.size() > 1 && working_dir.back() == '/') {
    working_dir.pop_back();
  }

  Scope & root = scopes_.root();
  root.set("_WORKING_DIR_", Value::make_string(working_dir), {});
  root.set("_CURRENT_BFF_DIR_", Value::make_string(""), {});
  root.set("_FASTBUILD_VERSION_STRING_", Value::make_string("vPlaceholderFastBuildVersionString"), {});
  root.set("_FASTBUILD_VERSION_", Value::make_integer(-1), {});
  root.set("_FASTBUILD_EXE_PATH_", Value::make_string("placeholder-path-to-fastbuild-exe"), {});
}

void EvaluationSession::resolve_pending_target_references()
{
  for (auto & pending : pendingTargetReferences_) {
    const auto it = targets_.find(pending.name);
    if (it == targets_.end()) {
      continue;
    }
    data_.targetReferences.push_back(TargetReference{it->second.id, std::move(pending.range)});
  }
  pendingTargetReferences_.clear();
}

// ============================================================================
// Records
// ============================================================================

FileRange EvaluationSession::to_file_range(SourceRange range) const
{
  return provider_.sources().to_file_range(range);
}

DefinitionId EvaluationSession::add_definition(const std::string & name, SourceRange range)
{
  const DefinitionId id = nextDefinitionId_++;
  data_.variableDefinitions.push_back(VariableDefinition{id, name, to_file_range(range)});
  return id;
}

void EvaluationSession::add_reference(
  std::vector<DefinitionId> definitions, SourceRange range, ReferenceKind kind)
{
  add_reference(std::move(definitions), to_file_range(range), kind);
}

void EvaluationSession::add_reference(
  std::vector<DefinitionId> definitions, FileRange range, ReferenceKind kind)
{
  // Built-ins have no definition to point at.
  if (definitions.empty()) {
    return;
  }
  data_.variableReferences.push_back(
    VariableReference{std::move(definitions), std::move(range), kind});
}

size_t EvaluationSession::add_evaluated(const Value & value, SourceRange range)
{
  data_.evaluatedVariables.push_back(EvaluatedVariable{value, to_file_range(range)});
  return data_.evaluatedVariables.size() - 1;
}

void EvaluationSession::warn(SourceRange range, std::string message)
{
  warnings_.report_warning(range, std::move(message));
}

void EvaluationSession::warn(
  SourceRange range, std::string message, SourceRange related, std::string related_message)
{
  auto builder = warnings_.report_warning(range, std::move(message));
  if (related.is_valid()) {
    builder.with_secondary_label(related, std::move(related_message));
  }
}

std::string EvaluationSession::current_dir_uri() const
{
  return currentFile_ != nullptr ? uri_dirname(currentFile_->uri) : rootDirUri_;
}

}  // namespace detail
}  // namespace bff
