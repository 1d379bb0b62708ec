// bff/eval/errors.cpp - Errors that stop an evaluation
#include "bff/eval/errors.hpp"

namespace bff
{

Diagnostic FatalError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(to_string(kind));
  d.message = message;
  d.labels.push_back(Label{range, "", LabelStyle::Primary});
  for (const auto & r : related) {
    d.labels.push_back(Label{r.range, r.message, LabelStyle::Secondary});
  }
  return d;
}

}  // namespace bff
