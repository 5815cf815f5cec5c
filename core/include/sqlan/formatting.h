#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "sqlan/syntax_options.h"

namespace sqlan {

/// Selects how regenerated SQL is laid out.
/// Inline keeps the canonical single line; Prefixed and Suffixed place list commas
/// at the start or at the end of item lines.
enum class FormattingMode { Inline, Prefixed, Suffixed };

/// Carries layout preferences for SQL regeneration.
/// MUST default to the canonical single-line form.
struct FormattingOptions {
  FormattingMode mode = FormattingMode::Inline;
  size_t indent_size = 4;
};

/// Lays out SQL text on clause-aware lines.
/// MUST return the input unchanged in Inline mode and MUST be idempotent on its own output.
/// Inputs are SQL text, layout options and the dialect used to re-tokenize; outputs are text.
std::string format_sql(const std::string& sql,
                       const FormattingOptions& options,
                       const SyntaxOptions& syntax = SyntaxOptions::defaults());

/// Resolves inline, prefixed or suffixed (case-insensitive).
std::optional<FormattingMode> formatting_mode_from_name(const std::string& name);

/// Lowercase name of a formatting mode.
const char* formatting_mode_name(FormattingMode mode);

}  // namespace sqlan
