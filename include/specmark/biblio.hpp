// Namespace-scoped bibliography of clause and operation entries
#pragma once
#include "specmark/clause.hpp"
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace specmark {

struct ClauseEntry {
    std::string id;
    std::optional<std::string> aoid;
    std::string title;
    std::string title_html;
    std::string number;
};

struct OpEntry {
    std::string aoid;
    std::string ref_id;
    std::optional<ClauseKind> kind;
    std::optional<Signature> signature;
    std::vector<std::string> effects;
    bool skip_global_checks = false;
    bool skip_return_checks = false;
};

using BiblioEntry = std::variant<ClauseEntry, OpEntry>;

// Op aoids and clause ids are separate key spaces. Lookups that miss in a namespace
// continue in its parent, recursively.
class BiblioRegistry {
public:
    explicit BiblioRegistry(std::string root_namespace = "spec");

    const std::string& root() const { return root_; }

    // Returns false (and changes nothing) when the namespace already exists.
    // Throws std::invalid_argument for an unknown parent.
    bool create_namespace(const std::string& name, const std::string& parent);
    bool has_namespace(const std::string& name) const;

    // Inserts into exactly `ns`. The first op registered under an aoid keeps the key.
    void add(BiblioEntry entry, const std::string& ns);

    // Op aoids present directly in `ns`.
    std::set<std::string> keys_for_namespace(const std::string& ns) const;

    const OpEntry* by_aoid(const std::string& aoid, const std::string& ns) const;
    const ClauseEntry* by_id(const std::string& id, const std::string& ns) const;
    // Searches every namespace in creation order.
    const ClauseEntry* find_id(const std::string& id) const;

    const std::deque<BiblioEntry>& local_entries(const std::string& ns) const;
    const std::vector<std::string>& namespaces() const { return order_; }
    std::optional<std::string> parent_of(const std::string& ns) const;

private:
    struct Namespace {
        std::optional<std::string> parent;
        std::deque<BiblioEntry> entries;
        std::unordered_map<std::string, const OpEntry*> ops;
        std::unordered_map<std::string, const ClauseEntry*> ids;
    };
    const Namespace& get(const std::string& ns) const;

    std::string root_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, Namespace> spaces_;
};

std::string type_to_json(const Type& t);
std::string signature_to_json(const Signature& s);
std::string biblio_to_json(const BiblioRegistry& reg);

} // namespace specmark
