#include "lumen/eval.hpp"

#include <string>
#include <utility>

#include "lumen/error.hpp"
#include "lumen/gc.hpp"
#include "lumen/logging.hpp"
#include "lumen/printer.hpp"
#include "lumen/reader.hpp"

namespace lumen {
namespace {

constexpr std::string_view kNotDefinition = "(def! not (fn* (a) (if a false true)))";

constexpr std::string_view kLoadFileDefinition =
    R"lisp((def! load-file (fn* (f) (eval (read-string (str "(do " (slurp f) "\nnil)"))))))lisp";

void trace(env_ptr scope, const std::string& message) {
    if (scope && scope->trace) {
        log_to(scope->trace, log_level::debug, "eval", message);
    }
}

std::string describe_call(value fn, const std::vector<value>& args) {
    std::string out = write_value(fn) + "(";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += write_value(args[i]);
    }
    out += ")";
    return out;
}

void require_closure_arity(value fn, std::size_t argc) {
    const std::size_t expected = closure_params(fn).size();
    if (expected != argc) {
        throw type_error("closure: expected " + std::to_string(expected) + " arguments, got " + std::to_string(argc));
    }
}

std::vector<std::string> parse_params(value params_expr) {
    if (!is_sequential(params_expr)) {
        throw type_error("fn*: parameter list must be a list or vector");
    }

    std::vector<std::string> params;
    for (value entry : sequence_items(params_expr)) {
        if (!is_symbol(entry)) {
            throw type_error("fn*: parameters must be symbols");
        }
        params.push_back(symbol_name(entry));
    }
    return params;
}

std::vector<value> eval_items(const std::vector<value>& items, env_ptr scope) {
    gc_root_scope roots(default_gc());
    std::vector<value> out;
    out.reserve(items.size());
    roots.add(&out);
    for (value item : items) {
        out.push_back(eval(item, scope));
    }
    return out;
}

value eval_def(const std::vector<value>& items, env_ptr scope) {
    if (items.size() != 3) {
        throw eval_error("def!: expected symbol and expression");
    }
    if (!is_symbol(items[1])) {
        throw type_error("def!: first argument must be a symbol");
    }
    trace(scope, "def! " + symbol_name(items[1]));
    value bound = eval(items[2], scope);
    define(scope, symbol_name(items[1]), bound);
    return bound;
}

// The tail forms below rewrite (expr, scope) in place. expr is assigned last
// because items still refers into the form being replaced.

void eval_let(value& expr, env_ptr& scope) {
    const std::vector<value>& items = sequence_items(expr);
    if (items.size() != 3) {
        throw eval_error("let*: expected binding list and body");
    }
    if (!is_sequential(items[1])) {
        throw type_error("let*: bindings must be a list or vector");
    }
    const std::vector<value>& bindings = sequence_items(items[1]);
    if (bindings.size() % 2 != 0) {
        throw eval_error("let*: bindings need an even number of forms");
    }

    gc_root_scope roots(default_gc());
    env_ptr let_scope = make_env(scope);
    roots.add(&let_scope);
    trace(scope, "let* with " + std::to_string(bindings.size() / 2) + " bindings");

    for (std::size_t i = 0; i < bindings.size(); i += 2) {
        if (!is_symbol(bindings[i])) {
            throw type_error("let*: binding name must be a symbol");
        }
        value bound = eval(bindings[i + 1], let_scope);
        define(let_scope, symbol_name(bindings[i]), bound);
    }

    scope = let_scope;
    expr = items[2];
}

void eval_do(value& expr, env_ptr scope) {
    const std::vector<value>& items = sequence_items(expr);
    if (items.size() == 1) {
        expr = make_nil();
        return;
    }
    for (std::size_t i = 1; i + 1 < items.size(); ++i) {
        (void)eval(items[i], scope);
    }
    expr = items.back();
}

void eval_if(value& expr, env_ptr scope) {
    const std::vector<value>& items = sequence_items(expr);
    if (items.size() != 3 && items.size() != 4) {
        throw eval_error("if: expected 2 or 3 arguments");
    }
    value test = eval(items[1], scope);
    if (is_truthy(test)) {
        expr = items[2];
    } else if (items.size() == 4) {
        expr = items[3];
    } else {
        expr = make_nil();
    }
}

value eval_fn(const std::vector<value>& items, env_ptr scope) {
    if (items.size() != 3) {
        throw eval_error("fn*: expected parameter list and one body expression");
    }
    return make_closure(parse_params(items[1]), items[2], scope);
}

}  // namespace

value eval_ast(value expr, env_ptr scope) {
    gc_root_scope roots(default_gc());
    roots.add(&expr);

    switch (type_of(expr)) {
        case value_type::symbol:
            return lookup(scope, symbol_name(expr));
        case value_type::list:
            return make_list(eval_items(sequence_items(expr), scope));
        case value_type::vector:
            return make_vector(eval_items(sequence_items(expr), scope));
        case value_type::map: {
            value out = make_map();
            roots.add(&out);
            for (const auto& [key, mapped] : map_entries(expr)) {
                value evaluated = eval(mapped, scope);
                out->map_data.insert_or_assign(key, evaluated);
            }
            return out;
        }
        case value_type::nil:
        case value_type::boolean:
        case value_type::integer:
        case value_type::string:
        case value_type::keyword:
        case value_type::atom:
        case value_type::primitive_fn:
        case value_type::closure:
            return expr;
    }

    throw eval_error("eval: unknown value type");
}

value eval(value expr, env_ptr scope) {
    if (!expr) {
        throw eval_error("eval: null expression");
    }
    if (!scope) {
        throw eval_error("eval: null environment");
    }

    gc_root_scope roots(default_gc());
    roots.add(&expr);
    roots.add(&scope);
    std::vector<value> call;
    roots.add(&call);

    while (true) {
        default_gc().maybe_collect();
        if (scope->trace) {
            trace(scope, "eval: " + write_value(expr));
        }

        if (!is_list(expr)) {
            return eval_ast(expr, scope);
        }

        const std::vector<value>& items = sequence_items(expr);
        if (items.empty()) {
            return expr;
        }

        if (is_symbol(items.front())) {
            const std::string& form = symbol_name(items.front());
            if (form == "def!") {
                return eval_def(items, scope);
            }
            if (form == "let*") {
                eval_let(expr, scope);
                continue;
            }
            if (form == "do") {
                eval_do(expr, scope);
                continue;
            }
            if (form == "if") {
                eval_if(expr, scope);
                continue;
            }
            if (form == "fn*") {
                return eval_fn(items, scope);
            }
        }

        call = eval_items(items, scope);
        value fn = call.front();
        const std::vector<value> args(call.begin() + 1, call.end());

        if (is_primitive(fn)) {
            if (scope->trace) {
                trace(scope, "call: " + describe_call(fn, args));
            }
            value result = primitive_function(fn)(args);
            if (scope->trace) {
                trace(scope, "return: " + primitive_name(fn) + " => " + write_value(result));
            }
            return result;
        }

        if (is_closure(fn)) {
            if (scope->trace) {
                trace(scope, "call: " + describe_call(fn, args));
            }
            require_closure_arity(fn, args.size());
            env_ptr frame = make_env(closure_env(fn), closure_params(fn), args);
            expr = closure_body(fn);
            scope = frame;
            call.clear();
            continue;
        }

        throw type_error("cannot apply " + std::string(type_name(type_of(fn))) + ": " + write_value(fn));
    }
}

value apply_function(value fn, const std::vector<value>& args) {
    if (is_primitive(fn)) {
        return primitive_function(fn)(args);
    }

    if (is_closure(fn)) {
        require_closure_arity(fn, args.size());
        env_ptr frame = make_env(closure_env(fn), closure_params(fn), args);
        return eval(closure_body(fn), frame);
    }

    throw type_error("cannot apply " + std::string(type_name(type_of(fn))) + ": " + write_value(fn));
}

value eval_source(std::string_view source, env_ptr scope) {
    std::vector<value> exprs = read_all(source);

    gc_root_scope roots(default_gc());
    roots.add(&exprs);

    value last = make_nil();
    roots.add(&last);

    for (value expr : exprs) {
        last = eval(expr, scope);
    }

    return last;
}

root_env_handle create_core_env(bool trace_bootstrap, log_sink* trace_sink) {
    root_env_handle handle(make_env());
    env_ptr core = handle.get();
    install_core_builtins(core);

    core->trace = trace_bootstrap ? trace_sink : nullptr;
    eval_source(kNotDefinition, core);
    core->trace = trace_sink;
    return handle;
}

root_env_handle create_global_env() {
    return create_global_env(runtime_config{});
}

// The global frame keeps the core frame alive through its parent link.
root_env_handle create_global_env(const runtime_config& config) {
    const root_env_handle core = create_core_env(config.trace_bootstrap, config.trace_sink);
    root_env_handle handle(make_env(core.get()));
    env_ptr global = handle.get();
    global->trace = config.trace_bootstrap ? config.trace_sink : nullptr;

    registrar r(global);
    r.register_builtin("eval", [global](const std::vector<value>& args) {
        if (args.size() != 1) {
            throw type_error("eval: expected 1 arguments, got " + std::to_string(args.size()));
        }
        return eval(args[0], global);
    });
    eval_source(kLoadFileDefinition, global);

    std::vector<value> argv;
    argv.reserve(config.argv.size());
    for (const std::string& arg : config.argv) {
        argv.push_back(make_string(arg));
    }
    r.register_value("*ARGV*", make_list(std::move(argv)));

    if (config.extension_register_hook) {
        config.extension_register_hook(&r, config.extension_register_user);
    }

    global->trace = config.trace_sink;
    return handle;
}

}  // namespace lumen
