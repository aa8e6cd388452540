#include "lumen/builtins.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

#include "lumen/error.hpp"
#include "lumen/eval.hpp"
#include "lumen/gc.hpp"
#include "lumen/printer.hpp"
#include "lumen/reader.hpp"

namespace lumen {
namespace {

void require_arity(const std::string& name, const std::vector<value>& args, std::size_t expected) {
    if (args.size() != expected) {
        throw type_error(name + ": expected " + std::to_string(expected) + " arguments, got " + std::to_string(args.size()));
    }
}

void require_min_arity(const std::string& name, const std::vector<value>& args, std::size_t min_expected) {
    if (args.size() < min_expected) {
        throw type_error(name + ": expected at least " + std::to_string(min_expected) + " arguments, got " +
                         std::to_string(args.size()));
    }
}

std::int64_t require_int_arg(value v, const std::string& where) {
    if (!is_integer(v)) {
        throw type_error(where + ": expected integer, got " + std::string(type_name(type_of(v))));
    }
    return integer_value(v);
}

const std::vector<value>& require_seq_arg(value v, const std::string& where) {
    if (!is_sequential(v)) {
        throw type_error(where + ": expected list or vector, got " + std::string(type_name(type_of(v))));
    }
    return sequence_items(v);
}

const map_storage& require_map_arg(value v, const std::string& where) {
    if (!is_map(v)) {
        throw type_error(where + ": expected map, got " + std::string(type_name(type_of(v))));
    }
    return map_entries(v);
}

value require_fn_arg(value v, const std::string& where) {
    if (!is_function(v)) {
        throw type_error(where + ": expected function, got " + std::string(type_name(type_of(v))));
    }
    return v;
}

value require_atom_arg(value v, const std::string& where) {
    if (!is_atom(v)) {
        throw type_error(where + ": expected atom, got " + std::string(type_name(type_of(v))));
    }
    return v;
}

const std::string& require_string_arg(value v, const std::string& where) {
    if (!is_string(v)) {
        throw type_error(where + ": expected string, got " + std::string(type_name(type_of(v))));
    }
    return string_value(v);
}

std::string read_text_file(const std::string& path, const std::string& where) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw io_error(where + ": failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw io_error(where + ": failed while reading file: " + path);
    }
    return ss.str();
}

std::string join_printed(const std::vector<value>& args, bool readable, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += print_str(args[i], readable);
    }
    return out;
}

void assoc_pairs(map_storage& entries, const std::vector<value>& args, std::size_t first, const std::string& where) {
    if ((args.size() - first) % 2 != 0) {
        throw type_error(where + ": expected an even number of key/value arguments");
    }
    for (std::size_t i = first; i < args.size(); i += 2) {
        entries.insert_or_assign(map_key_from_value(args[i], where), args[i + 1]);
    }
}

bool checked_add(std::int64_t lhs, std::int64_t rhs, std::int64_t& out) {
#if defined(__clang__) || defined(__GNUC__)
    return !__builtin_add_overflow(lhs, rhs, &out);
#else
    if ((rhs > 0 && lhs > std::numeric_limits<std::int64_t>::max() - rhs) ||
        (rhs < 0 && lhs < std::numeric_limits<std::int64_t>::min() - rhs)) {
        return false;
    }
    out = lhs + rhs;
    return true;
#endif
}

bool checked_sub(std::int64_t lhs, std::int64_t rhs, std::int64_t& out) {
#if defined(__clang__) || defined(__GNUC__)
    return !__builtin_sub_overflow(lhs, rhs, &out);
#else
    if ((rhs < 0 && lhs > std::numeric_limits<std::int64_t>::max() + rhs) ||
        (rhs > 0 && lhs < std::numeric_limits<std::int64_t>::min() + rhs)) {
        return false;
    }
    out = lhs - rhs;
    return true;
#endif
}

bool checked_mul(std::int64_t lhs, std::int64_t rhs, std::int64_t& out) {
#if defined(__clang__) || defined(__GNUC__)
    return !__builtin_mul_overflow(lhs, rhs, &out);
#else
    if (lhs == 0 || rhs == 0) {
        out = 0;
        return true;
    }
    if (lhs == -1 && rhs == std::numeric_limits<std::int64_t>::min()) {
        return false;
    }
    if (rhs == -1 && lhs == std::numeric_limits<std::int64_t>::min()) {
        return false;
    }

    const auto result = lhs * rhs;
    if (result / rhs != lhs) {
        return false;
    }
    out = result;
    return true;
#endif
}

void bind_primitive(env_ptr global_env, const std::string& name, primitive_fn fn) {
    define(global_env, name, make_primitive(name, std::move(fn)));
}

value builtin_throw(const std::vector<value>& args) {
    require_arity("throw", args, 1);
    throw user_error(args[0], write_value(args[0]));
}

value builtin_add(const std::vector<value>& args) {
    require_arity("+", args, 2);
    std::int64_t out = 0;
    if (!checked_add(require_int_arg(args[0], "+"), require_int_arg(args[1], "+"), out)) {
        throw eval_error("+: integer overflow");
    }
    return make_integer(out);
}

value builtin_sub(const std::vector<value>& args) {
    require_arity("-", args, 2);
    std::int64_t out = 0;
    if (!checked_sub(require_int_arg(args[0], "-"), require_int_arg(args[1], "-"), out)) {
        throw eval_error("-: integer overflow");
    }
    return make_integer(out);
}

value builtin_mul(const std::vector<value>& args) {
    require_arity("*", args, 2);
    std::int64_t out = 0;
    if (!checked_mul(require_int_arg(args[0], "*"), require_int_arg(args[1], "*"), out)) {
        throw eval_error("*: integer overflow");
    }
    return make_integer(out);
}

// Rounds toward negative infinity, so (/ -7 2) is -4.
value builtin_div(const std::vector<value>& args) {
    require_arity("/", args, 2);
    const std::int64_t lhs = require_int_arg(args[0], "/");
    const std::int64_t rhs = require_int_arg(args[1], "/");
    if (rhs == 0) {
        throw eval_error("/: division by zero");
    }
    if (lhs == std::numeric_limits<std::int64_t>::min() && rhs == -1) {
        throw eval_error("/: integer overflow");
    }

    std::int64_t quotient = lhs / rhs;
    if (lhs % rhs != 0 && ((lhs < 0) != (rhs < 0))) {
        --quotient;
    }
    return make_integer(quotient);
}

value builtin_equal(const std::vector<value>& args) {
    require_arity("=", args, 2);
    return make_boolean(equal_values(args[0], args[1]));
}

value builtin_greater(const std::vector<value>& args) {
    require_arity(">", args, 2);
    return make_boolean(require_int_arg(args[0], ">") > require_int_arg(args[1], ">"));
}

value builtin_greater_equal(const std::vector<value>& args) {
    require_arity(">=", args, 2);
    return make_boolean(require_int_arg(args[0], ">=") >= require_int_arg(args[1], ">="));
}

value builtin_less(const std::vector<value>& args) {
    require_arity("<", args, 2);
    return make_boolean(require_int_arg(args[0], "<") < require_int_arg(args[1], "<"));
}

value builtin_less_equal(const std::vector<value>& args) {
    require_arity("<=", args, 2);
    return make_boolean(require_int_arg(args[0], "<=") <= require_int_arg(args[1], "<="));
}

value builtin_cons(const std::vector<value>& args) {
    require_arity("cons", args, 2);
    const std::vector<value>& tail = require_seq_arg(args[1], "cons");
    std::vector<value> items;
    items.reserve(tail.size() + 1);
    items.push_back(args[0]);
    items.insert(items.end(), tail.begin(), tail.end());
    return make_list(std::move(items));
}

value builtin_concat(const std::vector<value>& args) {
    std::vector<value> items;
    for (value arg : args) {
        const std::vector<value>& part = require_seq_arg(arg, "concat");
        items.insert(items.end(), part.begin(), part.end());
    }
    return make_list(std::move(items));
}

value builtin_list(const std::vector<value>& args) {
    return make_list(args);
}

value builtin_list_pred(const std::vector<value>& args) {
    require_arity("list?", args, 1);
    return make_boolean(is_list(args[0]));
}

value builtin_empty_pred(const std::vector<value>& args) {
    require_arity("empty?", args, 1);
    return make_boolean(require_seq_arg(args[0], "empty?").empty());
}

// Anything that is not a list or vector counts as empty.
value builtin_count(const std::vector<value>& args) {
    require_arity("count", args, 1);
    if (!is_sequential(args[0])) {
        return make_integer(0);
    }
    return make_integer(static_cast<std::int64_t>(sequence_items(args[0]).size()));
}

value builtin_nth(const std::vector<value>& args) {
    require_arity("nth", args, 2);
    const std::vector<value>& items = require_seq_arg(args[0], "nth");
    const std::int64_t index = require_int_arg(args[1], "nth");
    if (index < 0 || static_cast<std::uint64_t>(index) >= items.size()) {
        throw index_error("nth: index out of range");
    }
    return items[static_cast<std::size_t>(index)];
}

value builtin_first(const std::vector<value>& args) {
    require_arity("first", args, 1);
    if (is_nil(args[0])) {
        return make_nil();
    }
    const std::vector<value>& items = require_seq_arg(args[0], "first");
    return items.empty() ? make_nil() : items.front();
}

value builtin_rest(const std::vector<value>& args) {
    require_arity("rest", args, 1);
    if (is_nil(args[0])) {
        return make_list();
    }
    const std::vector<value>& items = require_seq_arg(args[0], "rest");
    if (items.empty()) {
        return make_list();
    }
    return make_list(std::vector<value>(items.begin() + 1, items.end()));
}

value builtin_apply(const std::vector<value>& args) {
    require_min_arity("apply", args, 2);
    value fn = require_fn_arg(args.front(), "apply");
    const std::vector<value>& spread = require_seq_arg(args.back(), "apply");

    std::vector<value> call_args(args.begin() + 1, args.end() - 1);
    call_args.insert(call_args.end(), spread.begin(), spread.end());

    gc_root_scope roots(default_gc());
    roots.add(&call_args);
    return apply_function(fn, call_args);
}

value builtin_map(const std::vector<value>& args) {
    require_arity("map", args, 2);
    value fn = require_fn_arg(args[0], "map");
    const std::vector<value>& items = require_seq_arg(args[1], "map");

    gc_root_scope roots(default_gc());
    std::vector<value> results;
    results.reserve(items.size());
    roots.add(&results);
    for (value item : items) {
        results.push_back(apply_function(fn, {item}));
    }
    return make_list(std::move(results));
}

value builtin_map_pred(const std::vector<value>& args) {
    require_arity("map?", args, 1);
    return make_boolean(is_map(args[0]));
}

value builtin_hash_map(const std::vector<value>& args) {
    map_storage entries;
    assoc_pairs(entries, args, 0, "hash-map");
    return make_map(std::move(entries));
}

value builtin_assoc(const std::vector<value>& args) {
    require_min_arity("assoc", args, 1);
    map_storage entries = require_map_arg(args[0], "assoc");
    assoc_pairs(entries, args, 1, "assoc");
    return make_map(std::move(entries));
}

value builtin_dissoc(const std::vector<value>& args) {
    require_min_arity("dissoc", args, 1);
    map_storage entries = require_map_arg(args[0], "dissoc");
    for (std::size_t i = 1; i < args.size(); ++i) {
        (void)entries.erase(map_key_from_value(args[i], "dissoc"));
    }
    return make_map(std::move(entries));
}

value builtin_get(const std::vector<value>& args) {
    require_arity("get", args, 2);
    if (is_nil(args[0])) {
        return make_nil();
    }
    const value* found = require_map_arg(args[0], "get").find(map_key_from_value(args[1], "get"));
    return found ? *found : make_nil();
}

value builtin_contains_pred(const std::vector<value>& args) {
    require_arity("contains?", args, 2);
    const map_storage& entries = require_map_arg(args[0], "contains?");
    return make_boolean(entries.find(map_key_from_value(args[1], "contains?")) != nullptr);
}

value builtin_keys(const std::vector<value>& args) {
    require_arity("keys", args, 1);
    const map_storage& entries = require_map_arg(args[0], "keys");
    std::vector<value> keys;
    keys.reserve(entries.size());
    for (const auto& [key, _] : entries) {
        keys.push_back(map_key_to_value(key));
    }
    return make_list(std::move(keys));
}

value builtin_vals(const std::vector<value>& args) {
    require_arity("vals", args, 1);
    const map_storage& entries = require_map_arg(args[0], "vals");
    std::vector<value> vals;
    vals.reserve(entries.size());
    for (const auto& [_, mapped] : entries) {
        vals.push_back(mapped);
    }
    return make_list(std::move(vals));
}

value builtin_sequential_pred(const std::vector<value>& args) {
    require_arity("sequential?", args, 1);
    return make_boolean(is_sequential(args[0]));
}

value builtin_vector_pred(const std::vector<value>& args) {
    require_arity("vector?", args, 1);
    return make_boolean(is_vector(args[0]));
}

value builtin_vector(const std::vector<value>& args) {
    return make_vector(args);
}

value builtin_vec(const std::vector<value>& args) {
    require_arity("vec", args, 1);
    if (is_vector(args[0])) {
        return args[0];
    }
    if (is_list(args[0])) {
        return make_vector(sequence_items(args[0]));
    }
    throw type_error("vec: expected list or vector, got " + std::string(type_name(type_of(args[0]))));
}

value builtin_symbol(const std::vector<value>& args) {
    require_arity("symbol", args, 1);
    return make_symbol(require_string_arg(args[0], "symbol"));
}

value builtin_keyword(const std::vector<value>& args) {
    require_arity("keyword", args, 1);
    if (is_keyword(args[0])) {
        return args[0];
    }
    return make_keyword(require_string_arg(args[0], "keyword"));
}

value builtin_nil_pred(const std::vector<value>& args) {
    require_arity("nil?", args, 1);
    return make_boolean(is_nil(args[0]));
}

value builtin_symbol_pred(const std::vector<value>& args) {
    require_arity("symbol?", args, 1);
    return make_boolean(is_symbol(args[0]));
}

value builtin_keyword_pred(const std::vector<value>& args) {
    require_arity("keyword?", args, 1);
    return make_boolean(is_keyword(args[0]));
}

value builtin_true_pred(const std::vector<value>& args) {
    require_arity("true?", args, 1);
    return make_boolean(is_boolean(args[0]) && boolean_value(args[0]));
}

value builtin_false_pred(const std::vector<value>& args) {
    require_arity("false?", args, 1);
    return make_boolean(is_boolean(args[0]) && !boolean_value(args[0]));
}

value builtin_read_string(const std::vector<value>& args) {
    require_arity("read-string", args, 1);
    const std::optional<value> parsed = read_str(require_string_arg(args[0], "read-string"));
    return parsed ? *parsed : make_nil();
}

value builtin_slurp(const std::vector<value>& args) {
    require_arity("slurp", args, 1);
    return make_string(read_text_file(require_string_arg(args[0], "slurp"), "slurp"));
}

value builtin_pr_str(const std::vector<value>& args) {
    return make_string(join_printed(args, true, " "));
}

value builtin_str(const std::vector<value>& args) {
    return make_string(join_printed(args, false, ""));
}

value builtin_prn(const std::vector<value>& args) {
    std::cout << join_printed(args, true, " ") << std::endl;
    return make_nil();
}

value builtin_println(const std::vector<value>& args) {
    std::cout << join_printed(args, false, " ") << std::endl;
    return make_nil();
}

value builtin_atom(const std::vector<value>& args) {
    require_arity("atom", args, 1);
    return make_atom(args[0]);
}

value builtin_atom_pred(const std::vector<value>& args) {
    require_arity("atom?", args, 1);
    return make_boolean(is_atom(args[0]));
}

value builtin_deref(const std::vector<value>& args) {
    require_arity("deref", args, 1);
    return atom_value(require_atom_arg(args[0], "deref"));
}

value builtin_reset(const std::vector<value>& args) {
    require_arity("reset!", args, 2);
    atom_reset(require_atom_arg(args[0], "reset!"), args[1]);
    return args[1];
}

value builtin_swap(const std::vector<value>& args) {
    require_min_arity("swap!", args, 2);
    value cell = require_atom_arg(args[0], "swap!");
    value fn = require_fn_arg(args[1], "swap!");

    std::vector<value> call_args;
    call_args.reserve(args.size() - 1);
    call_args.push_back(atom_value(cell));
    call_args.insert(call_args.end(), args.begin() + 2, args.end());

    gc_root_scope roots(default_gc());
    roots.add(&call_args);
    value next = apply_function(fn, call_args);
    atom_reset(cell, next);
    return next;
}

}  // namespace

void install_core_builtins(env_ptr global_env) {
    if (!global_env) {
        throw eval_error("install_core_builtins: null environment");
    }

    bind_primitive(global_env, "throw", builtin_throw);

    bind_primitive(global_env, "+", builtin_add);
    bind_primitive(global_env, "-", builtin_sub);
    bind_primitive(global_env, "*", builtin_mul);
    bind_primitive(global_env, "/", builtin_div);
    bind_primitive(global_env, "=", builtin_equal);
    bind_primitive(global_env, ">", builtin_greater);
    bind_primitive(global_env, ">=", builtin_greater_equal);
    bind_primitive(global_env, "<", builtin_less);
    bind_primitive(global_env, "<=", builtin_less_equal);

    bind_primitive(global_env, "cons", builtin_cons);
    bind_primitive(global_env, "concat", builtin_concat);
    bind_primitive(global_env, "list", builtin_list);
    bind_primitive(global_env, "list?", builtin_list_pred);
    bind_primitive(global_env, "empty?", builtin_empty_pred);
    bind_primitive(global_env, "count", builtin_count);
    bind_primitive(global_env, "nth", builtin_nth);
    bind_primitive(global_env, "first", builtin_first);
    bind_primitive(global_env, "rest", builtin_rest);

    bind_primitive(global_env, "apply", builtin_apply);
    bind_primitive(global_env, "map", builtin_map);

    bind_primitive(global_env, "map?", builtin_map_pred);
    bind_primitive(global_env, "hash-map", builtin_hash_map);
    bind_primitive(global_env, "assoc", builtin_assoc);
    bind_primitive(global_env, "dissoc", builtin_dissoc);
    bind_primitive(global_env, "get", builtin_get);
    bind_primitive(global_env, "contains?", builtin_contains_pred);
    bind_primitive(global_env, "keys", builtin_keys);
    bind_primitive(global_env, "vals", builtin_vals);

    bind_primitive(global_env, "sequential?", builtin_sequential_pred);
    bind_primitive(global_env, "vector?", builtin_vector_pred);
    bind_primitive(global_env, "vector", builtin_vector);
    bind_primitive(global_env, "vec", builtin_vec);

    bind_primitive(global_env, "symbol", builtin_symbol);
    bind_primitive(global_env, "keyword", builtin_keyword);

    bind_primitive(global_env, "nil?", builtin_nil_pred);
    bind_primitive(global_env, "symbol?", builtin_symbol_pred);
    bind_primitive(global_env, "keyword?", builtin_keyword_pred);
    bind_primitive(global_env, "true?", builtin_true_pred);
    bind_primitive(global_env, "false?", builtin_false_pred);

    bind_primitive(global_env, "read-string", builtin_read_string);
    bind_primitive(global_env, "slurp", builtin_slurp);

    bind_primitive(global_env, "pr-str", builtin_pr_str);
    bind_primitive(global_env, "str", builtin_str);
    bind_primitive(global_env, "prn", builtin_prn);
    bind_primitive(global_env, "println", builtin_println);

    bind_primitive(global_env, "atom", builtin_atom);
    bind_primitive(global_env, "atom?", builtin_atom_pred);
    bind_primitive(global_env, "deref", builtin_deref);
    bind_primitive(global_env, "reset!", builtin_reset);
    bind_primitive(global_env, "swap!", builtin_swap);
}

}  // namespace lumen
