#include "specmark/clause_numberer.hpp"
#include <cctype>

namespace specmark {

std::string annex_letter(int n){
    std::string s;
    while(n > 0){
        --n;
        s.insert(s.begin(), static_cast<char>('A' + n % 26));
        n /= 26;
    }
    return s;
}

void ClauseNumberer::warn(const doc::node& n, const std::string& msg){
    if(sink_) sink_->attr_warning("clause-numbering", msg, &n, "number");
}

// Next counter value: one past `current`, unless the node carries a valid, larger `number`.
int ClauseNumberer::take(int current, const doc::node& n){
    auto v = n.attr("number");
    if(!v) return current + 1;
    bool digits = !v->empty() && v->size() < 9;
    for(char c : *v) if(!std::isdigit((unsigned char)c)) digits = false;
    if(!digits || std::stoi(*v) <= 0){
        warn(n, "clause numbers must be positive integers; found \"" + *v + "\"");
        return current + 1;
    }
    int want = std::stoi(*v);
    if(want <= current){
        warn(n, "clause numbers should be strictly increasing; " + *v + " follows " + std::to_string(current));
        return current + 1;
    }
    return want;
}

std::string ClauseNumberer::label(size_t depth) const {
    std::string s = in_annex_ ? annex_letter(top_annex_) : std::to_string(top_clause_);
    for(size_t d = 1; d <= depth; ++d) s += "." + std::to_string(counters_[d]);
    return s;
}

std::string ClauseNumberer::next(size_t depth, bool annex, const doc::node& node){
    if(depth == 0){
        if(annex){
            if(node.has_attr("number")) warn(node, "top-level annexes cannot be numbered explicitly");
            ++top_annex_;
            in_annex_ = true;
        } else {
            if(top_annex_ > 0) warn(node, "clauses cannot follow annexes");
            top_clause_ = take(top_clause_, node);
            in_annex_ = false;
        }
        counters_.assign(1, 0);
        return label(0);
    }
    if(annex && top_annex_ == 0)
        warn(node, "first annex must be at depth 0");
    counters_.resize(depth + 1, 0);
    counters_[depth] = take(counters_[depth], node);
    return label(depth);
}

} // namespace specmark
