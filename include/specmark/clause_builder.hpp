// Builds the clause forest from enter/exit events over clause-like elements
#pragma once
#include "specmark/clause_numberer.hpp"
#include "specmark/context.hpp"
#include <vector>

namespace specmark {

bool is_clause_like(const doc::node& n);

class ClauseTreeBuilder {
public:
    explicit ClauseTreeBuilder(CompileContext& ctx);

    // Opens a clause and compiles its header. Throws clause_error when `n` is not
    // emu-clause, emu-annex or emu-intro, or when legacy lookup finds no header.
    Clause& enter(doc::node& n);
    // Finalizes the innermost open clause; throws clause_error when `n` is not that clause.
    void exit(doc::node& n);

    // Notes and examples attach to the innermost open clause; ignored outside any clause.
    void add_note(doc::node& n);
    void add_example(doc::node& n);

    Clause* current() const { return stack_.empty() ? nullptr : stack_.back(); }
    size_t depth() const { return stack_.size(); }

private:
    void attach_header(Clause& c);
    doc::node* locate_header(doc::node& n) const;
    doc::node* locate_legacy_header(doc::node& n) const;
    void finalize_notes(Clause& c);
    void apply_attributes_label(Clause& c);
    void register_entries(Clause& c);

    CompileContext& ctx_;
    ClauseNumberer numberer_;
    std::vector<Clause*> stack_;
};

// Walks the whole document, filling ctx (clauses, biblio, effects, diagnostics).
void compile_document(doc::document& d, CompileContext& ctx);

} // namespace specmark
