#pragma once

#include "lumen/env.hpp"

namespace lumen {

void install_core_builtins(env_ptr global_env);

}  // namespace lumen
