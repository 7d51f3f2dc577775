// Compile options, sourced from SPECMARK_* environment variables
#pragma once
#include <string>
#include <vector>

namespace specmark {

bool env_flag_enabled(const char* name);

struct CompileOptions {
    std::string root_namespace = "spec";
    // Accept any descendant <h1> as a clause header and throw when a clause has none.
    bool legacy_header_lookup = false;
    bool trace = false;
    bool diag_json = false;
    std::vector<std::string> known_effects{"user-code"};

    // SPECMARK_NAMESPACE, SPECMARK_LEGACY_HEADERS, SPECMARK_TRACE, SPECMARK_DIAG_JSON, SPECMARK_EFFECTS
    static CompileOptions from_env();
};

} // namespace specmark
