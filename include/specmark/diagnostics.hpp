// Non-fatal diagnostics raised while compiling a document
#pragma once
#include "specmark/document.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace specmark {

// What the diagnostic points at: the node itself, one of its attributes, or a position inside its contents.
enum class DiagnosticLocus { Node, Attribute, Contents };

struct Diagnostic {
    std::string rule_id;
    std::string message;
    DiagnosticLocus locus = DiagnosticLocus::Node;
    const doc::node* node = nullptr;
    std::string attr;
    int line = -1;
    int col = -1;
};

// Collects into a vector and optionally forwards each diagnostic as it arrives.
struct DiagnosticSink {
    std::vector<Diagnostic>* out = nullptr;
    std::function<void(const Diagnostic&)> forward{};

    void emit(const Diagnostic& d){ if(out) out->push_back(d); if(forward) forward(d); }

    void node_warning(std::string rule, std::string message, const doc::node* n){
        Diagnostic d; d.rule_id = std::move(rule); d.message = std::move(message); d.node = n;
        if(n){ d.line = n->span().line; d.col = n->span().col; }
        emit(d);
    }
    void attr_warning(std::string rule, std::string message, const doc::node* n, std::string attr){
        Diagnostic d; d.rule_id = std::move(rule); d.message = std::move(message); d.node = n;
        d.locus = DiagnosticLocus::Attribute; d.attr = std::move(attr);
        if(n){ d.line = n->span().line; d.col = n->span().col; }
        emit(d);
    }
    void contents_warning(std::string rule, std::string message, const doc::node* n, int line, int col){
        Diagnostic d; d.rule_id = std::move(rule); d.message = std::move(message); d.node = n;
        d.locus = DiagnosticLocus::Contents; d.line = line; d.col = col;
        emit(d);
    }
};

// Count diagnostics with the given rule id.
inline size_t count_rule(const std::vector<Diagnostic>& ds, const std::string& rule){
    size_t n = 0;
    for(auto& d : ds) if(d.rule_id == rule) ++n;
    return n;
}

} // namespace specmark
