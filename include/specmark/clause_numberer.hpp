// Section numbers for ordinary clauses ("3.2.1") and annexes ("B", "B.1")
#pragma once
#include "specmark/diagnostics.hpp"
#include <string>
#include <vector>

namespace specmark {

// Bijective base-26 letters: 1 -> "A", 26 -> "Z", 27 -> "AA".
std::string annex_letter(int n);

class ClauseNumberer {
public:
    explicit ClauseNumberer(DiagnosticSink* sink = nullptr) : sink_(sink) {}

    // Number for a clause opened at `depth` (0 = top level). An explicit `number`
    // attribute on `node` seeds the counter for ordinary clauses.
    std::string next(size_t depth, bool annex, const doc::node& node);

    bool in_annex() const { return in_annex_; }

private:
    void warn(const doc::node& n, const std::string& msg);
    int take(int current, const doc::node& n);
    std::string label(size_t depth) const;

    DiagnosticSink* sink_;
    int top_clause_ = 0;
    int top_annex_ = 0;
    bool in_annex_ = false;
    std::vector<int> counters_{0};  // [0] is unused; the top level lives in top_clause_/top_annex_
};

} // namespace specmark
