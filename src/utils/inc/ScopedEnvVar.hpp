#pragma once

#include <optional>
#include <string>

// Sets (or unsets, given nullopt) an environment variable for the lifetime of the object
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value);
    ~ScopedEnvVar();

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    static void apply(const std::string& name, const std::optional<std::string>& value);

    std::string name_;
    std::optional<std::string> old_value_;
};
