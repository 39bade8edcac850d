#include "ScopedEnvVar.hpp"
#include "LogUtils.hpp"
#include <cstdlib>
#include <stdexcept>

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value)
    : name_(name) {
    if (name_.empty()) {
        throw std::invalid_argument("ScopedEnvVar: environment variable name cannot be empty");
    }

    if (const char* old = std::getenv(name_.c_str())) {
        old_value_ = old;
    }
    apply(name_, new_value);
}

ScopedEnvVar::~ScopedEnvVar() {
    try {
        apply(name_, old_value_);
    } catch (const std::exception& e) {
        LogUtils::error("ScopedEnvVar: failed to restore {}: {}", name_, e.what());
    }
}

void ScopedEnvVar::apply(const std::string& name, const std::optional<std::string>& value) {
    int rc = value ? setenv(name.c_str(), value->c_str(), 1) : unsetenv(name.c_str());
    if (rc != 0) {
        throw std::runtime_error("ScopedEnvVar: cannot update " + name);
    }
}
