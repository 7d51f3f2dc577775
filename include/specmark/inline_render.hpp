#pragma once
#include "specmark/context.hpp"

namespace specmark {

// Element kinds whose text is never inline-rendered.
bool is_opaque_for_inline(const doc::node& n);

// Register the clause's own text runs under its namespace and, when a renderer is
// configured, replace each non-blank run by the rendered fragment, keeping the run's
// leading and trailing whitespace.
void render_clause_text(Clause& clause, CompileContext& ctx);

} // namespace specmark
