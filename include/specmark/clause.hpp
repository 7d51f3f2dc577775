// Clause tree nodes: one per emu-clause / emu-annex / emu-intro
#pragma once
#include "specmark/document.hpp"
#include "specmark/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace specmark {

enum class ClauseKind
{
    None,
    AbstractOperation,
    SyntaxDirectedOperation,
    HostDefinedAbstractOperation,
    ImplementationDefinedAbstractOperation,
    NumericMethod,
    ConcreteMethod,
    InternalMethod,
    BuiltInFunction
};

// Maps a `type` attribute value; "sdo" is accepted for syntax-directed operation.
std::optional<ClauseKind> parse_clause_kind(std::string_view s);
const char* to_string(ClauseKind k);
// Kinds whose structured header name becomes the clause's aoid.
bool is_aoid_kind(ClauseKind k);

struct Parameter {
    std::string name;
    TypePtr type; // null when untyped
};

struct Signature {
    std::vector<Parameter> parameters;
    std::vector<Parameter> optional_parameters;
    TypePtr return_type;
};

struct Note {
    doc::node* node = nullptr;
    bool editor = false;
    std::string number; // "" when unlabeled
};

struct Clause {
    std::string id;
    std::string ns;
    Clause* parent = nullptr;
    std::vector<std::unique_ptr<Clause>> subclauses;

    doc::node* node = nullptr;
    doc::node* header = nullptr;

    std::string title;
    std::string title_html;
    std::string number;
    std::optional<std::string> aoid;
    ClauseKind kind = ClauseKind::None;
    std::optional<Signature> signature;
    std::vector<std::string> effects;
    std::string receiver; // "for" field of methods

    bool is_annex = false;
    bool is_back_matter = false;
    bool is_normative = false;
    bool is_intro = false;
    bool is_redefinition = false;
    bool skip_global_checks = false;
    bool skip_return_checks = false;

    std::vector<Note> notes;
    std::vector<Note> editor_notes;
    std::vector<Note> examples;
    std::vector<std::string> preamble;
    // The dl.header replaced by the preamble; kept so diagnostics can still point into it.
    std::unique_ptr<doc::node> description_list;
    std::string attributes_label;

    size_t depth() const;
    bool can_have_effect(std::string_view effect) const;
    // "3.2", "Annex B (informative)", or "" for introduction and back matter.
    std::string secnum_label() const;
};

} // namespace specmark
