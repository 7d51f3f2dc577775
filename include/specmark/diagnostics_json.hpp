#pragma once
#include "specmark/diagnostics.hpp"
#include <string>
#include <vector>

namespace specmark {

// Quoted JSON string literal.
std::string json_escape(const std::string& s);
std::string diagnostics_to_json(const std::vector<Diagnostic>& ds);

} // namespace specmark
