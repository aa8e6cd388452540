#include "lumen/extensions.hpp"

#include <utility>

#include "lumen/error.hpp"

namespace lumen {

registrar::registrar(env_ptr global_env) : global_env_(global_env) {
    if (!global_env_) {
        throw eval_error("registrar: null global environment");
    }
}

void registrar::register_builtin(const std::string& full_name, primitive_fn fn) {
    ensure_registerable_name(full_name, "registrar.register_builtin");
    if (!fn) {
        throw eval_error("registrar.register_builtin: function must not be empty");
    }
    define(global_env_, full_name, make_primitive(full_name, std::move(fn)));
}

void registrar::register_value(const std::string& full_name, value bound_value) {
    ensure_registerable_name(full_name, "registrar.register_value");
    if (!bound_value) {
        throw eval_error("registrar.register_value: bound value must not be null");
    }
    define(global_env_, full_name, bound_value);
}

void registrar::ensure_registerable_name(const std::string& full_name, const char* where) const {
    if (full_name.empty()) {
        throw eval_error(std::string(where) + ": name must not be empty");
    }
    if (global_env_->bindings.find(full_name) != global_env_->bindings.end()) {
        throw eval_error(std::string(where) + ": symbol already defined: " + full_name);
    }
}

}  // namespace lumen
