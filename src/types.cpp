// types.cpp - type expression reader
#include "specmark/types.hpp"
#include <algorithm>
#include <cctype>

namespace specmark {

TypePtr make_named(std::string name){
    auto t = std::make_shared<Type>();
    t->kind = Type::Kind::Named;
    t->name = std::move(name);
    return t;
}

TypePtr make_list(TypePtr element){
    auto t = std::make_shared<Type>();
    t->kind = Type::Kind::List;
    t->element = std::move(element);
    return t;
}

TypePtr make_record(std::string name, std::vector<RecordField> fields){
    auto t = std::make_shared<Type>();
    t->kind = Type::Kind::Record;
    t->name = std::move(name);
    t->fields = std::move(fields);
    return t;
}

TypePtr make_union(std::vector<TypePtr> members){
    auto t = std::make_shared<Type>();
    t->kind = Type::Kind::Union;
    for(auto& m : members){
        if(m->kind == Type::Kind::Union) t->members.insert(t->members.end(), m->members.begin(), m->members.end());
        else t->members.push_back(m);
    }
    return t;
}

TypePtr make_completion(CompletionKind kind, TypePtr normal_value){
    auto t = std::make_shared<Type>();
    t->kind = Type::Kind::Completion;
    t->completion = kind;
    t->normal_value = std::move(normal_value);
    return t;
}

bool is_completion(const Type& t){ return t.kind == Type::Kind::Completion; }

bool is_mixed_completion_union(const Type& t){
    if(t.kind != Type::Kind::Union) return false;
    bool completion = false, other = false;
    for(auto& m : t.members){
        if(is_completion(*m)) completion = true;
        else other = true;
    }
    return completion && other;
}

const char* to_string(CompletionKind k){
    switch(k){
        case CompletionKind::Normal: return "normal";
        case CompletionKind::Abrupt: return "abrupt";
        case CompletionKind::Mixed: return "mixed";
    }
    return "mixed";
}

std::string to_string(const Type& t){
    switch(t.kind){
        case Type::Kind::Named: return t.name;
        case Type::Kind::List: return t.element ? "List of " + to_string(*t.element) : "List";
        case Type::Kind::Record: {
            if(t.fields.empty()) return t.name.empty() ? "Record" : t.name;
            std::string s = "Record { ";
            for(size_t i = 0; i < t.fields.size(); ++i){
                if(i) s += ", ";
                s += "[[" + t.fields[i].name + "]]";
                if(t.fields[i].type) s += ": " + to_string(*t.fields[i].type);
            }
            return s + " }";
        }
        case Type::Kind::Union: {
            std::string s;
            for(size_t i = 0; i < t.members.size(); ++i){ if(i) s += " | "; s += to_string(*t.members[i]); }
            return s;
        }
        case Type::Kind::Completion:
            if(t.completion == CompletionKind::Normal)
                return t.normal_value ? "normal completion containing " + to_string(*t.normal_value) : "normal completion";
            return t.completion == CompletionKind::Abrupt ? "abrupt completion" : "Completion Record";
    }
    return "<bad-type>";
}

namespace {

enum class Tok { Word, Comma, Bar, LParen, RParen, LBrackets, RBrackets, End };

struct Token {
    Tok kind;
    std::string_view text;
    size_t offset;
};

std::vector<Token> tokenize(std::string_view s){
    std::vector<Token> out;
    size_t i = 0;
    auto starts = [&](size_t at, const char* two){ return at + 1 < s.size() && s[at] == two[0] && s[at + 1] == two[1]; };
    while(i < s.size()){
        char c = s[i];
        if(std::isspace((unsigned char)c)){ ++i; continue; }
        if(c == ','){ out.push_back({Tok::Comma, s.substr(i, 1), i}); ++i; continue; }
        if(c == '|'){ out.push_back({Tok::Bar, s.substr(i, 1), i}); ++i; continue; }
        if(c == '('){ out.push_back({Tok::LParen, s.substr(i, 1), i}); ++i; continue; }
        if(c == ')'){ out.push_back({Tok::RParen, s.substr(i, 1), i}); ++i; continue; }
        if(starts(i, "[[")){ out.push_back({Tok::LBrackets, s.substr(i, 2), i}); i += 2; continue; }
        if(starts(i, "]]")){ out.push_back({Tok::RBrackets, s.substr(i, 2), i}); i += 2; continue; }
        size_t b = i;
        while(i < s.size()){
            char d = s[i];
            if(std::isspace((unsigned char)d) || d == ',' || d == '|' || d == '(' || d == ')' || starts(i, "[[") || starts(i, "]]")) break;
            ++i;
        }
        out.push_back({Tok::Word, s.substr(b, i - b), b});
    }
    out.push_back({Tok::End, std::string_view(), s.size()});
    return out;
}

std::string depluralize(std::string phrase){
    size_t sp = phrase.rfind(' ');
    size_t last = sp == std::string::npos ? 0 : sp + 1;
    size_t n = phrase.size() - last;
    if(n > 3 && phrase.compare(phrase.size() - 3, 3, "ies") == 0)
        return phrase.substr(0, phrase.size() - 3) + "y";
    if(n > 1 && phrase.back() == 's' && phrase[phrase.size() - 2] != 's')
        phrase.pop_back();
    return phrase;
}

class TypeReader {
public:
    explicit TypeReader(std::string_view src) : src_(src), toks_(tokenize(src)) {}

    TypePtr read(){
        if(at(Tok::End)) fail("expected a type", 0);
        auto t = parse_union();
        if(!at(Tok::End)) fail("unexpected \"" + std::string(cur().text) + "\" after type", cur().offset);
        return t;
    }

private:
    const Token& cur() const { return toks_[i_]; }
    const Token& peek(size_t ahead) const { return toks_[std::min(i_ + ahead, toks_.size() - 1)]; }
    bool at(Tok k) const { return cur().kind == k; }
    bool at_word(std::string_view w, size_t ahead = 0) const { auto& t = peek(ahead); return t.kind == Tok::Word && t.text == w; }
    void advance(size_t n = 1){ i_ = std::min(i_ + n, toks_.size() - 1); }
    [[noreturn]] void fail(const std::string& msg, size_t offset) const { throw type_parse_error(msg, offset); }
    void expect(Tok k, const char* what){
        if(!at(k)) fail(std::string("expected ") + what, cur().offset);
        advance();
    }

    TypePtr parse_union(){
        std::vector<TypePtr> members{parse_alt(false)};
        while(at(Tok::Bar) || at_word("or")){
            advance();
            members.push_back(parse_alt(false));
        }
        return members.size() == 1 ? members[0] : make_union(std::move(members));
    }

    // either A or B / either A, B, or C
    TypePtr parse_either(bool plural){
        advance();
        std::vector<TypePtr> members{parse_alt(plural)};
        for(;;){
            if(at(Tok::Comma)){
                advance();
                if(!at_word("or")){ members.push_back(parse_alt(plural)); continue; }
            }
            if(at_word("or")){
                advance();
                members.push_back(parse_alt(plural));
                break;
            }
            fail("expected \"or\" to close \"either\"", cur().offset);
        }
        return make_union(std::move(members));
    }

    TypePtr parse_alt(bool plural){
        if(at_word("either")) return parse_either(plural);
        if(!plural && (at_word("a") || at_word("an"))){
            advance();
            if(auto t = parse_article_form()) return t;
        } else if(plural){
            if(at_word("Lists") && at_word("of", 1)){ advance(2); return make_list(parse_alt(true)); }
            if(at_word("Completion") && at_word("Records", 1)){ advance(2); return make_completion(CompletionKind::Mixed); }
        }
        return parse_named(plural);
    }

    // Forms that only appear after an article; null means "read it as a named type".
    TypePtr parse_article_form(){
        if(at_word("normal") && at_word("completion", 1)){
            advance(2);
            TypePtr value;
            if(at_word("containing")){ advance(); value = parse_alt(false); }
            return make_completion(CompletionKind::Normal, value);
        }
        for(const char* w : {"throw", "return", "break", "continue", "abrupt"}){
            if(at_word(w) && at_word("completion", 1)){ advance(2); return make_completion(CompletionKind::Abrupt); }
        }
        if(at_word("Completion") && at_word("Record", 1)){ advance(2); return make_completion(CompletionKind::Mixed); }
        if(at_word("List") || (at_word("empty") && at_word("List", 1))){
            advance(at_word("empty") ? 2 : 1);
            TypePtr element;
            if(at_word("of")){ advance(); element = parse_alt(true); }
            return make_list(element);
        }
        if(at_word("Record") && !(peek(1).kind == Tok::Word && !at_word("with", 1))){
            advance();
            std::vector<RecordField> fields;
            if(at_word("with") && at_word("fields", 1)){ advance(2); fields = parse_fields(); }
            return make_record("", std::move(fields));
        }
        return nullptr;
    }

    std::vector<RecordField> parse_fields(){
        std::vector<RecordField> fields;
        for(;;){
            expect(Tok::LBrackets, "\"[[\" to open a field name");
            if(!at(Tok::Word)) fail("expected a field name", cur().offset);
            RecordField f; f.name = std::string(cur().text); advance();
            expect(Tok::RBrackets, "\"]]\" to close a field name");
            if(at(Tok::LParen)){
                advance();
                f.type = parse_union();
                expect(Tok::RParen, "\")\" after field type");
            }
            fields.push_back(std::move(f));
            if(at(Tok::Comma) && (peek(1).kind == Tok::LBrackets || at_word("and", 1))){
                advance();
                if(at_word("and")) advance();
                continue;
            }
            if(at_word("and") && peek(1).kind == Tok::LBrackets){ advance(); continue; }
            break;
        }
        return fields;
    }

    TypePtr parse_named(bool plural){
        if(!at(Tok::Word) || at_word("or")) fail("expected a type", cur().offset);
        size_t first = cur().offset, last_end = first;
        while(at(Tok::Word) && !at_word("or") && !at_word("containing")){
            last_end = cur().offset + cur().text.size();
            advance();
        }
        std::string name(src_.substr(first, last_end - first));
        return make_named(plural ? depluralize(name) : name);
    }

    std::string_view src_;
    std::vector<Token> toks_;
    size_t i_ = 0;
};

} // namespace

TypePtr parse_type(std::string_view src){
    return TypeReader(src).read();
}

} // namespace specmark
