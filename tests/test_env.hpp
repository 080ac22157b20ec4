#pragma once
#include <optional>
#include <string>

// Sets an environment variable for the lifetime of the object and restores the previous value.
// An empty value unsets the variable.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};
