#include <cassert>
#include "specmark/config.hpp"
#include "test_env.hpp"

using namespace specmark;

void run_config_tests(){
    {
        ScopedEnv ns("SPECMARK_NAMESPACE", nullptr);
        ScopedEnv legacy("SPECMARK_LEGACY_HEADERS", nullptr);
        ScopedEnv fx("SPECMARK_EFFECTS", nullptr);
        auto o = CompileOptions::from_env();
        assert(o.root_namespace == "spec");
        assert(!o.legacy_header_lookup);
        assert(o.known_effects.size() == 1 && o.known_effects[0] == "user-code");
    }
    {
        ScopedEnv ns("SPECMARK_NAMESPACE", "ecma262");
        ScopedEnv legacy("SPECMARK_LEGACY_HEADERS", "yes");
        ScopedEnv trace("SPECMARK_TRACE", "0");
        ScopedEnv fx("SPECMARK_EFFECTS", " user-code , host-hook,,");
        auto o = CompileOptions::from_env();
        assert(o.root_namespace == "ecma262");
        assert(o.legacy_header_lookup);
        assert(!o.trace);
        assert(o.known_effects.size() == 2);
        assert(o.known_effects[0] == "user-code" && o.known_effects[1] == "host-hook");
    }
    {
        ScopedEnv flag("SPECMARK_TEST_FLAG", "T");
        assert(env_flag_enabled("SPECMARK_TEST_FLAG"));
    }
    assert(!env_flag_enabled("SPECMARK_TEST_FLAG"));
}
