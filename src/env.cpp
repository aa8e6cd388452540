#include "lumen/env.hpp"

#include "lumen/error.hpp"
#include "lumen/value.hpp"

namespace lumen {

env::env(env_ptr parent_env) : parent(parent_env), trace(parent_env ? parent_env->trace : nullptr) {}

void env::gc_mark_children(gc& heap) {
    heap.mark_env(parent);
    for (const auto& [_, bound] : bindings) {
        heap.mark_value(bound);
    }
}

std::size_t env::gc_size_bytes() const {
    return sizeof(env);
}

env_ptr make_env(env_ptr parent) {
    return default_gc().allocate<env>(parent);
}

env_ptr make_env(env_ptr parent, const std::vector<std::string>& params, const std::vector<value>& args) {
    env_ptr scope = make_env(parent);
    const std::size_t bound = params.size() < args.size() ? params.size() : args.size();
    for (std::size_t i = 0; i < bound; ++i) {
        scope->bindings[params[i]] = args[i];
    }
    return scope;
}

void define(env_ptr scope, const std::string& name, value bound_value) {
    if (!scope) {
        throw eval_error("define: null environment");
    }
    scope->bindings[name] = bound_value;
}

value lookup(env_ptr scope, const std::string& name) {
    for (env_ptr cursor = scope; cursor; cursor = cursor->parent) {
        const auto it = cursor->bindings.find(name);
        if (it != cursor->bindings.end()) {
            return it->second;
        }
    }
    throw name_error("'" + name + "' not found");
}

}  // namespace lumen
