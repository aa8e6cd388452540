#pragma once

#include <string_view>
#include <vector>

#include "lumen/builtins.hpp"
#include "lumen/env.hpp"
#include "lumen/extensions.hpp"
#include "lumen/gc.hpp"

namespace lumen {

value eval(value expr, env_ptr scope);
value eval_ast(value expr, env_ptr scope);
value apply_function(value fn, const std::vector<value>& args);
value eval_source(std::string_view source, env_ptr scope);
// Environments stay rooted until the returned handle is destroyed.
root_env_handle create_core_env(bool trace_bootstrap, log_sink* trace_sink);
root_env_handle create_global_env();
root_env_handle create_global_env(const runtime_config& config);

}  // namespace lumen
