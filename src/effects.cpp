#include "specmark/effects.hpp"

namespace specmark {

void EffectWorklist::add(const std::string& effect, const Clause& clause){
    auto it = by_effect_.find(effect);
    if(it == by_effect_.end()){
        order_.push_back(effect);
        it = by_effect_.emplace(effect, std::vector<const Clause*>{}).first;
    }
    it->second.push_back(&clause);
}

const std::vector<const Clause*>& EffectWorklist::clauses_for(const std::string& effect) const {
    static const std::vector<const Clause*> none;
    auto it = by_effect_.find(effect);
    return it == by_effect_.end() ? none : it->second;
}

} // namespace specmark
