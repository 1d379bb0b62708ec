// bff/eval/parse_data_provider.cpp - Cache of parsed BFF files
#include "bff/eval/parse_data_provider.hpp"

#include <utility>

#include "bff/eval/errors.hpp"
#include "bff/syntax/frontend.hpp"

namespace bff
{

const ParsedFile & ParseDataProvider::get_parse_data(const std::string & uri)
{
  std::string content = fs_.read_file(uri);

  auto it = cache_.find(uri);
  if (it == cache_.end() || it->second.content != content) {
    Entry entry;
    entry.content = content;

    auto parsed = std::make_unique<ParsedFile>();
    parsed->uri = uri;
    parsed->content = content;
    parsed->ast = std::make_unique<AstContext>();
    const ParseOutput out =
      parse_source(sources_, uri, std::move(content), *parsed->ast, entry.diagnostics);
    parsed->fileId = out.file_id;
    parsed->program = out.program;

    if (!entry.diagnostics.has_errors()) {
      entry.parsed = std::move(parsed);
    }
    it = cache_.insert_or_assign(uri, std::move(entry)).first;
  }

  const Entry & entry = it->second;
  if (!entry.parsed) {
    const Diagnostic * first = entry.diagnostics.first_error();
    if (first == nullptr) {
      throw ParseError({}, "failed to parse " + uri);
    }
    throw ParseError(first->primary_range(), first->message);
  }
  return *entry.parsed;
}

const DiagnosticBag * ParseDataProvider::syntax_diagnostics(const std::string & uri) const
{
  const auto it = cache_.find(uri);
  return it == cache_.end() ? nullptr : &it->second.diagnostics;
}

void ParseDataProvider::invalidate(const std::string & uri) { cache_.erase(uri); }

}  // namespace bff
