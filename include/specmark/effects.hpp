// Effect name -> clauses that declared it directly, in traversal order
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace specmark {

struct Clause;

class EffectWorklist {
public:
    void add(const std::string& effect, const Clause& clause);
    // Empty when the effect was never declared.
    const std::vector<const Clause*>& clauses_for(const std::string& effect) const;
    // Effect names in first-declaration order.
    const std::vector<std::string>& effects() const { return order_; }
    bool empty() const { return order_.empty(); }

private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::vector<const Clause*>> by_effect_;
};

} // namespace specmark
