#include "specmark/clause.hpp"

namespace specmark {

std::optional<ClauseKind> parse_clause_kind(std::string_view s){
    if(s == "abstract operation") return ClauseKind::AbstractOperation;
    if(s == "syntax-directed operation" || s == "sdo") return ClauseKind::SyntaxDirectedOperation;
    if(s == "host-defined abstract operation") return ClauseKind::HostDefinedAbstractOperation;
    if(s == "implementation-defined abstract operation") return ClauseKind::ImplementationDefinedAbstractOperation;
    if(s == "numeric method") return ClauseKind::NumericMethod;
    if(s == "concrete method") return ClauseKind::ConcreteMethod;
    if(s == "internal method") return ClauseKind::InternalMethod;
    if(s == "built-in function") return ClauseKind::BuiltInFunction;
    return std::nullopt;
}

const char* to_string(ClauseKind k){
    switch(k){
        case ClauseKind::None: return "none";
        case ClauseKind::AbstractOperation: return "abstract operation";
        case ClauseKind::SyntaxDirectedOperation: return "syntax-directed operation";
        case ClauseKind::HostDefinedAbstractOperation: return "host-defined abstract operation";
        case ClauseKind::ImplementationDefinedAbstractOperation: return "implementation-defined abstract operation";
        case ClauseKind::NumericMethod: return "numeric method";
        case ClauseKind::ConcreteMethod: return "concrete method";
        case ClauseKind::InternalMethod: return "internal method";
        case ClauseKind::BuiltInFunction: return "built-in function";
    }
    return "none";
}

bool is_aoid_kind(ClauseKind k){
    switch(k){
        case ClauseKind::AbstractOperation:
        case ClauseKind::SyntaxDirectedOperation:
        case ClauseKind::HostDefinedAbstractOperation:
        case ClauseKind::ImplementationDefinedAbstractOperation:
        case ClauseKind::NumericMethod:
            return true;
        default:
            return false;
    }
}

size_t Clause::depth() const {
    size_t d = 0;
    for(const Clause* p = parent; p; p = p->parent) ++d;
    return d;
}

bool Clause::can_have_effect(std::string_view effect) const {
    // Static semantics never run user code.
    if(effect == "user-code" && title.rfind("Static Semantics:", 0) == 0) return false;
    return true;
}

std::string Clause::secnum_label() const {
    if(is_intro || is_back_matter) return "";
    if(is_annex && !parent)
        return "Annex " + number + (is_normative ? " (normative)" : " (informative)");
    return number;
}

} // namespace specmark
