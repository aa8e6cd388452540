#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "lumen/gc.hpp"

namespace lumen {

class log_sink;

struct env final : gc_node {
    explicit env(env_ptr parent_env = nullptr);

    env_ptr parent = nullptr;
    // Evaluator trace target; child frames inherit it from their parent.
    log_sink* trace = nullptr;
    std::unordered_map<std::string, value> bindings;

    void gc_mark_children(gc& heap) override;
    [[nodiscard]] std::size_t gc_size_bytes() const override;
};

env_ptr make_env(env_ptr parent = nullptr);
env_ptr make_env(env_ptr parent, const std::vector<std::string>& params, const std::vector<value>& args);
void define(env_ptr scope, const std::string& name, value bound_value);
value lookup(env_ptr scope, const std::string& name);

}  // namespace lumen
