// Cross-platform environment setter for tests that exercise SPECMARK_* options.

#include "test_env.hpp"
#include <cstdlib>

static void set_env(const std::string& name, const char* value)
{
#if defined(_WIN32)
    _putenv_s(name.c_str(), value ? value : "");
#else
    if (value) ::setenv(name.c_str(), value, 1);
    else ::unsetenv(name.c_str());
#endif
}

ScopedEnv::ScopedEnv(const char* name, const char* value) : name_(name)
{
    if (const char* old = std::getenv(name)) previous_ = old;
    set_env(name_, value);
}

ScopedEnv::~ScopedEnv()
{
    set_env(name_, previous_ ? previous_->c_str() : nullptr);
}
