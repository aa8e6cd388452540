#pragma once

#include <string>
#include <vector>

#include "lumen/env.hpp"
#include "lumen/value.hpp"

namespace lumen {

class log_sink;

class registrar {
public:
    explicit registrar(env_ptr global_env);

    // Both refuse names already bound in the global frame.
    void register_builtin(const std::string& full_name, primitive_fn fn);
    void register_value(const std::string& full_name, value bound_value);

private:
    void ensure_registerable_name(const std::string& full_name, const char* where) const;

    env_ptr global_env_;
};

using extension_register_hook_fn = void (*)(registrar* r, void* user);

struct runtime_config {
    // Receives evaluator traces for user code. Null disables tracing.
    log_sink* trace_sink = nullptr;
    // Also trace the in-language bootstrap definitions.
    bool trace_bootstrap = false;
    // Bound as *ARGV*, a list of strings.
    std::vector<std::string> argv;
    extension_register_hook_fn extension_register_hook = nullptr;
    void* extension_register_user = nullptr;
};

}  // namespace lumen
