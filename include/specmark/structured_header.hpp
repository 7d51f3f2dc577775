// Structured headers: an algorithm header followed by a `dl.header` description list
#pragma once
#include "specmark/context.hpp"
#include "specmark/header_parser.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace specmark {

// Header markup as parsed, and whether its offsets are document offsets.
struct HeaderSource {
    std::string text;
    size_t base = 0;
    bool located = false;
};

// A header that is a single run of the document uses that run's raw slice;
// anything else uses the serialised inner markup.
HeaderSource header_source(const doc::node& h1, const std::string* document_source);

// 1-based line/column of `offset` into `hs.text`, in document coordinates where possible.
std::pair<int, int> header_position(const HeaderSource& hs, const doc::node& h1, size_t offset, const std::string* document_source);

// The `dl.header` after `header`, skipping del/ins wrappers and empty spans; null if absent.
doc::node* find_header_dl(doc::node& header);

struct HeaderFields {
    std::string description;
    std::optional<std::string> receiver;  // "for"
    std::vector<std::string> effects;
    bool redefinition = false;
    bool skip_global_checks = false;
    bool skip_return_checks = false;
};

// Reads dt/dd pairs. Malformed entries are reported and skipped.
HeaderFields read_header_fields(const doc::node& dl, const CompileOptions& opts, DiagnosticSink& sink);

// "Name ( _a_, _b_ [ , _c_ ] )"; syntax-directed operations show the name only.
std::string format_header(const HeaderParseResult& r, ClauseKind kind);
// "no arguments", "argument _x_ (a Number)", "arguments _a_, _b_, and _c_", ...
std::string format_params_phrase(const HeaderParseResult& r);
std::string format_preamble(ClauseKind kind, const std::string& name, const std::string& receiver,
                            const std::string& params, const std::optional<std::string>& return_type,
                            const std::string& description, const std::string& trailer);

// Parses `header`, attaches the signature, aoid, effects and flags to `clause`, and
// replaces `dl` with the synthesized preamble.
void compile_structured_header(Clause& clause, doc::node& header, doc::node& dl, CompileContext& ctx);

} // namespace specmark
