// Type expressions used in algorithm headers ("a List of Strings", "either a Number or ~empty~", ...)
#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace specmark {

struct Type;
using TypePtr = std::shared_ptr<const Type>;

struct RecordField {
    std::string name;
    TypePtr type; // null when the field is listed without a type
};

enum class CompletionKind { Normal, Abrupt, Mixed };

struct Type {
    enum class Kind
    {
        Named,
        List,
        Record,
        Union,
        Completion
    } kind;
    std::string name;                 // Named; Record (empty for an anonymous Record)
    TypePtr element;                  // List (null: element type not stated)
    std::vector<RecordField> fields;  // Record
    std::vector<TypePtr> members;     // Union, flattened, at least two
    CompletionKind completion{};      // Completion
    TypePtr normal_value;             // Completion (Normal only; null when unspecified)
};

TypePtr make_named(std::string name);
TypePtr make_list(TypePtr element);
TypePtr make_record(std::string name, std::vector<RecordField> fields);
TypePtr make_union(std::vector<TypePtr> members);
TypePtr make_completion(CompletionKind kind, TypePtr normal_value = nullptr);

bool is_completion(const Type& t);
// A union that contains both completion and non-completion members.
bool is_mixed_completion_union(const Type& t);

std::string to_string(const Type& t);
const char* to_string(CompletionKind k);

struct type_parse_error : std::runtime_error {
    type_parse_error(const std::string& msg, size_t offset) : std::runtime_error(msg), offset(offset) {}
    size_t offset; // byte offset into the parsed string
};

// Throws type_parse_error.
TypePtr parse_type(std::string_view src);

} // namespace specmark
