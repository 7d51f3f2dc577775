// Everything one compile run owns: options, bibliography, effect worklist, diagnostics, clause forest
#pragma once
#include "specmark/biblio.hpp"
#include "specmark/clause.hpp"
#include "specmark/config.hpp"
#include "specmark/diagnostics.hpp"
#include "specmark/document.hpp"
#include "specmark/effects.hpp"
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace specmark {

// Builder contract violations and clauses without any header under legacy lookup.
struct clause_error : std::runtime_error {
    clause_error(const std::string& msg, const doc::node* n) : std::runtime_error(msg), node(n) {}
    const doc::node* node;
};

// Renders the trimmed text of one inline run into markup.
using InlineRenderer = std::function<std::string(const std::string&)>;

class CompileContext {
public:
    explicit CompileContext(CompileOptions opts = CompileOptions{});
    CompileContext(const CompileContext&) = delete;
    CompileContext& operator=(const CompileContext&) = delete;

    CompileOptions options;
    BiblioRegistry biblio;
    EffectWorklist effects;
    std::vector<Diagnostic> diagnostics;
    DiagnosticSink sink;
    std::vector<std::unique_ptr<Clause>> clauses;
    // Text runs per namespace, for later cross-link scanning.
    std::map<std::string, std::vector<doc::node*>> text_runs;
    InlineRenderer inline_renderer;
    const doc::document* document = nullptr;

    // Document source, when the compile runs over a loaded document.
    const std::string* source() const { return document && document->source ? document->source.get() : nullptr; }
};

} // namespace specmark
