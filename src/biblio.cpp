#include "specmark/biblio.hpp"
#include "specmark/diagnostics_json.hpp"
#include <sstream>
#include <stdexcept>

namespace specmark {

BiblioRegistry::BiblioRegistry(std::string root_namespace) : root_(std::move(root_namespace)) {
    order_.push_back(root_);
    spaces_.emplace(root_, Namespace{});
}

bool BiblioRegistry::create_namespace(const std::string& name, const std::string& parent){
    if(spaces_.count(name)) return false;
    if(!spaces_.count(parent))
        throw std::invalid_argument("unknown parent namespace '" + parent + "' for '" + name + "'");
    Namespace ns; ns.parent = parent;
    spaces_.emplace(name, std::move(ns));
    order_.push_back(name);
    return true;
}

bool BiblioRegistry::has_namespace(const std::string& name) const { return spaces_.count(name) != 0; }

const BiblioRegistry::Namespace& BiblioRegistry::get(const std::string& ns) const {
    auto it = spaces_.find(ns);
    if(it == spaces_.end()) throw std::invalid_argument("unknown namespace '" + ns + "'");
    return it->second;
}

void BiblioRegistry::add(BiblioEntry entry, const std::string& ns){
    auto it = spaces_.find(ns);
    if(it == spaces_.end()) throw std::invalid_argument("unknown namespace '" + ns + "'");
    auto& space = it->second;
    space.entries.push_back(std::move(entry));
    const BiblioEntry& stored = space.entries.back();
    if(auto op = std::get_if<OpEntry>(&stored)) space.ops.emplace(op->aoid, op);
    else if(auto cl = std::get_if<ClauseEntry>(&stored)){ if(!cl->id.empty()) space.ids.emplace(cl->id, cl); }
}

std::set<std::string> BiblioRegistry::keys_for_namespace(const std::string& ns) const {
    std::set<std::string> keys;
    for(auto& kv : get(ns).ops) keys.insert(kv.first);
    return keys;
}

const OpEntry* BiblioRegistry::by_aoid(const std::string& aoid, const std::string& ns) const {
    for(const Namespace* s = &get(ns); s; s = s->parent ? &get(*s->parent) : nullptr){
        auto it = s->ops.find(aoid);
        if(it != s->ops.end()) return it->second;
    }
    return nullptr;
}

const ClauseEntry* BiblioRegistry::by_id(const std::string& id, const std::string& ns) const {
    for(const Namespace* s = &get(ns); s; s = s->parent ? &get(*s->parent) : nullptr){
        auto it = s->ids.find(id);
        if(it != s->ids.end()) return it->second;
    }
    return nullptr;
}

const ClauseEntry* BiblioRegistry::find_id(const std::string& id) const {
    for(auto& name : order_){
        auto& ids = get(name).ids;
        auto it = ids.find(id);
        if(it != ids.end()) return it->second;
    }
    return nullptr;
}

const std::deque<BiblioEntry>& BiblioRegistry::local_entries(const std::string& ns) const { return get(ns).entries; }

std::optional<std::string> BiblioRegistry::parent_of(const std::string& ns) const { return get(ns).parent; }

// ---- JSON export ----

static std::string opt_json(const std::optional<std::string>& s){ return s ? json_escape(*s) : "null"; }
static std::string type_or_null(const TypePtr& t){ return t ? type_to_json(*t) : "null"; }

std::string type_to_json(const Type& t){
    std::ostringstream os;
    switch(t.kind){
        case Type::Kind::Named:
            os<<"{\"kind\":\"opaque\",\"type\":"<<json_escape(t.name)<<"}";
            break;
        case Type::Kind::List:
            os<<"{\"kind\":\"list\",\"elements\":"<<type_or_null(t.element)<<"}";
            break;
        case Type::Kind::Record:
            os<<"{\"kind\":\"record\",\"name\":"<<(t.name.empty() ? std::string("null") : json_escape(t.name))<<",\"fields\":[";
            for(size_t i=0;i<t.fields.size(); ++i){
                if(i) os<<",";
                os<<"{\"name\":"<<json_escape(t.fields[i].name)<<",\"type\":"<<type_or_null(t.fields[i].type)<<"}";
            }
            os<<"]}";
            break;
        case Type::Kind::Union:
            os<<"{\"kind\":\"union\",\"types\":[";
            for(size_t i=0;i<t.members.size(); ++i){ if(i) os<<","; os<<type_to_json(*t.members[i]); }
            os<<"]}";
            break;
        case Type::Kind::Completion:
            os<<"{\"kind\":\"completion\",\"completionType\":\""<<to_string(t.completion)<<"\"";
            if(t.completion == CompletionKind::Normal) os<<",\"typeOfValueIfNormal\":"<<type_or_null(t.normal_value);
            os<<"}";
            break;
    }
    return os.str();
}

static void append_params_json(std::ostringstream& os, const std::vector<Parameter>& ps){
    os<<"[";
    for(size_t i=0;i<ps.size(); ++i){
        if(i) os<<",";
        os<<"{\"name\":"<<json_escape(ps[i].name)<<",\"type\":"<<type_or_null(ps[i].type)<<"}";
    }
    os<<"]";
}

std::string signature_to_json(const Signature& s){
    std::ostringstream os;
    os<<"{\"parameters\":";
    append_params_json(os, s.parameters);
    os<<",\"optionalParameters\":";
    append_params_json(os, s.optional_parameters);
    os<<",\"return\":"<<type_or_null(s.return_type)<<"}";
    return os.str();
}

static void append_entry_json(std::ostringstream& os, const BiblioEntry& e){
    if(auto c = std::get_if<ClauseEntry>(&e)){
        os<<"{\"type\":\"clause\",\"id\":"<<json_escape(c->id)
          <<",\"aoid\":"<<opt_json(c->aoid)
          <<",\"title\":"<<json_escape(c->title)
          <<",\"titleHTML\":"<<json_escape(c->title_html)
          <<",\"number\":"<<json_escape(c->number)<<"}";
        return;
    }
    const auto& op = std::get<OpEntry>(e);
    os<<"{\"type\":\"op\",\"aoid\":"<<json_escape(op.aoid)
      <<",\"refId\":"<<json_escape(op.ref_id)
      <<",\"kind\":"<<(op.kind ? json_escape(to_string(*op.kind)) : std::string("null"))
      <<",\"signature\":"<<(op.signature ? signature_to_json(*op.signature) : std::string("null"))
      <<",\"effects\":[";
    for(size_t i=0;i<op.effects.size(); ++i){ if(i) os<<","; os<<json_escape(op.effects[i]); }
    os<<"],\"skipGlobalChecks\":"<<(op.skip_global_checks?"true":"false")
      <<",\"skipReturnChecks\":"<<(op.skip_return_checks?"true":"false")<<"}";
}

std::string biblio_to_json(const BiblioRegistry& reg){
    std::ostringstream os;
    os<<"{\"root\":"<<json_escape(reg.root())<<",\"namespaces\":[";
    const auto& names = reg.namespaces();
    for(size_t i=0;i<names.size(); ++i){
        if(i) os<<",";
        os<<"{\"name\":"<<json_escape(names[i])<<",\"parent\":"<<opt_json(reg.parent_of(names[i]))<<",\"entries\":[";
        const auto& entries = reg.local_entries(names[i]);
        for(size_t j=0;j<entries.size(); ++j){ if(j) os<<","; append_entry_json(os, entries[j]); }
        os<<"]}";
    }
    os<<"]}";
    return os.str();
}

} // namespace specmark
