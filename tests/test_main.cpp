#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "lumen/env.hpp"
#include "lumen/error.hpp"
#include "lumen/eval.hpp"
#include "lumen/extensions.hpp"
#include "lumen/gc.hpp"
#include "lumen/logging.hpp"
#include "lumen/printer.hpp"
#include "lumen/reader.hpp"
#include "lumen/value.hpp"

namespace {

void check(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

lumen::value eval_text(const std::string& source, lumen::env_ptr env) {
    return lumen::eval_source(source, env);
}

std::string eval_print(const std::string& source, lumen::env_ptr env) {
    return lumen::write_value(lumen::eval_source(source, env));
}

void check_eval(const std::string& source, const std::string& expected, lumen::env_ptr env) {
    const std::string actual = eval_print(source, env);
    check(actual == expected, source + ": expected " + expected + ", got " + actual);
}

template <typename Error>
void check_throws(const std::string& source, lumen::env_ptr env, const std::string& message) {
    try {
        (void)eval_text(source, env);
    } catch (const Error&) {
        return;
    }
    throw std::runtime_error(message);
}

std::filesystem::path temp_file_path(const std::string& stem, const std::string& extension = ".lisp") {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("lumen_" + stem + "_" + std::to_string(now) + extension);
}

void write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("failed to open file for test write: " + path.string());
    }
    out << content;
    if (!out) {
        throw std::runtime_error("failed while writing test file: " + path.string());
    }
}

class capture_stdout {
public:
    capture_stdout() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~capture_stdout() { std::cout.rdbuf(previous_); }

    capture_stdout(const capture_stdout&) = delete;
    capture_stdout& operator=(const capture_stdout&) = delete;

    [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

void register_force_gc(lumen::registrar* r, void* user) {
    (void)user;
    r->register_builtin("force-gc", [](const std::vector<lumen::value>& args) {
        if (!args.empty()) {
            throw lumen::type_error("force-gc: expected 0 arguments");
        }
        lumen::default_gc().collect();
        return lumen::make_nil();
    });
}

void test_reader_basics() {
    using namespace lumen;

    check(integer_value(*read_str("42")) == 42, "integer parse failed");
    check(integer_value(*read_str("-17")) == -17, "negative integer parse failed");
    check(is_symbol(*read_str("-")), "lone minus should be a symbol");
    check(is_nil(*read_str("nil")), "nil parse failed");
    check(boolean_value(*read_str("true")), "true parse failed");
    check(!boolean_value(*read_str("false")), "false parse failed");
    check(keyword_name(*read_str(":kw")) == "kw", "keyword parse failed");
    check(string_value(*read_str("\"hi\\nthere\\\"\"")) == "hi\nthere\"", "string escape parse failed");

    check(!read_str("").has_value(), "empty input should read nothing");
    check(!read_str("   ; only a comment\n").has_value(), "comment-only input should read nothing");

    const value vec = *read_str("[1, 2 3]");
    check(is_vector(vec) && sequence_items(vec).size() == 3, "vector with commas parse failed");

    const value map = *read_str("{\"a\" 1 :a 2}");
    check(is_map(map) && map_entries(map).size() == 2, "string and keyword keys must not collide");

    check(print_value(*read_str("@a")) == "(deref a)", "deref sugar parse failed");
    check(print_value(*read_str("(1 (2 [3]) {:k \"v\"})")) == "(1 (2 [3]) {:k v})", "nested parse failed");

    const auto exprs = read_all("1 ; comment\n2");
    check(exprs.size() == 2, "comment handling failed");

    try {
        (void)read_all("(1 [2");
        throw std::runtime_error("expected parse error for incomplete list");
    } catch (const parse_error& e) {
        check(e.incomplete(), "incomplete parse should be marked incomplete");
    }

    try {
        (void)read_all("(1 2))");
        throw std::runtime_error("expected parse error for stray ')'");
    } catch (const parse_error& e) {
        check(!e.incomplete(), "stray ')' should not be marked incomplete");
    }

    try {
        (void)read_all("{:a}");
        throw std::runtime_error("expected parse error for odd map literal");
    } catch (const parse_error& e) {
        check(!e.incomplete(), "odd map literal should not be marked incomplete");
    }

    try {
        (void)read_all("12abc");
        throw std::runtime_error("expected parse error for malformed integer");
    } catch (const parse_error&) {
    }
}

void test_printer_modes() {
    using namespace lumen;

    const value text = make_string("a\"b\nc");
    check(write_value(text) == "\"a\\\"b\\nc\"", "readable string escaping failed");
    check(print_value(text) == "a\"b\nc", "human string printing failed");
    check(print_str(text, true) == write_value(text), "print_str readable mismatch");

    check(write_value(make_list({make_integer(1), make_vector({make_keyword("k")})})) == "(1 [:k])",
          "list/vector printing failed");
    check(write_value(make_atom(make_integer(3))) == "(atom 3)", "atom printing failed");
    check(write_value(make_nil()) == "nil", "nil printing failed");
    check(write_value(make_boolean(false)) == "false", "false printing failed");

    map_storage entries;
    entries.insert_or_assign(map_key{map_key_type::string, "s"}, make_string("v"));
    entries.insert_or_assign(map_key{map_key_type::keyword, "k"}, make_integer(1));
    const value map = make_map(std::move(entries));
    check(write_value(map) == "{\"s\" \"v\" :k 1}", "readable map printing failed");
    check(print_value(map) == "{s v :k 1}", "human map printing failed");

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();
    check(eval_print("+", env) == "#<function:+>", "primitive printing failed");
    check(eval_print("(fn* (x) x)", env) == "#<closure>", "closure printing failed");

    check_eval("(let* (a (atom nil)) (do (reset! a a) a))", "(atom (atom ...))", env);
    check_eval("(let* (b (atom 1)) (do (reset! b [b {:self b}]) b))", "(atom [(atom ...) {:self (atom ...)}])", env);
    check_eval("(let* (c (atom 1)) [c (atom c) c])", "[(atom 1) (atom (atom 1)) (atom 1)]", env);
    check(string_value(eval_text("(let* (d (atom nil)) (do (reset! d (list d)) (str d)))", env)) == "(atom ((atom ...)))",
          "human printing of a self-referencing atom failed");
}

void test_round_trip() {
    using namespace lumen;

    const std::vector<std::string> sources = {
        "(1 -2 \"two\\\\\" :three [4 {:five \"six\\n\\t\"}] nil true false sym)",
        "{\"a\" [1 2] :b (c d) \"quote\\\"d\" {}}",
        "[]",
        "()",
        "\"\\r\"",
    };

    for (const std::string& source : sources) {
        const value original = *read_str(source);
        const std::string printed = write_value(original);
        const value reread = *read_str(printed);
        check(equal_values(original, reread), "round trip changed value: " + source);
        check(write_value(reread) == printed, "round trip printed form not stable: " + printed);
    }
}

void test_environment_shadowing() {
    using namespace lumen;

    env_ptr global = make_env();
    define(global, "x", make_integer(1));

    env_ptr child = make_env(global);
    define(child, "y", make_integer(2));
    define(child, "x", make_integer(3));

    check(integer_value(lookup(global, "x")) == 1, "global lookup failed");
    check(integer_value(lookup(child, "x")) == 3, "shadowed lookup failed");
    check(integer_value(lookup(child, "y")) == 2, "child lookup failed");

    try {
        (void)lookup(global, "y");
        throw std::runtime_error("child binding must not leak into parent");
    } catch (const name_error& e) {
        check(std::string(e.what()) == "'y' not found", "unbound symbol message should name the symbol");
    }

    env_ptr bound = make_env(global, {"a", "b"}, {make_integer(10), make_integer(20)});
    check(integer_value(lookup(bound, "a")) == 10, "positional binding a failed");
    check(integer_value(lookup(bound, "b")) == 20, "positional binding b failed");
    check(integer_value(lookup(bound, "x")) == 1, "parent lookup through bound frame failed");

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();
    check_eval("(let* (x 1) (let* (x 2) x))", "2", env);
    check_eval("(let* (x 1) (do (let* (x 2) x) x))", "1", env);
    check_eval("(let* (y 1) (def! inner 5))", "5", env);
    check_throws<name_error>("inner", env, "def! inside let* must bind in the let* frame only");
}

void test_error_hierarchy_basics() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_throws<name_error>("missing-symbol", env, "expected name_error for unbound symbol");
    check_throws<type_error>("(1 2)", env, "expected type_error for non-function call");
    check_throws<type_error>("(+ 1 \"a\")", env, "expected type_error for string arithmetic");
    check_throws<type_error>("(first 1)", env, "expected type_error for first on integer");
    check_throws<index_error>("(nth [1] 5)", env, "expected index_error for nth");
    check_throws<io_error>("(slurp \"/nonexistent/lumen/file.lisp\")", env, "expected io_error for slurp");
    check_throws<eval_error>("(/ 1 0)", env, "expected eval_error for division by zero");
    check_throws<eval_error>("(* 3037000500 3037000500)", env, "expected eval_error for overflow");

    try {
        (void)eval_text("(throw {:msg \"boom\"})", env);
        throw std::runtime_error("expected user_error from throw");
    } catch (const eval_error&) {
        throw std::runtime_error("throw must not surface as an eval_error");
    } catch (const user_error& e) {
        check(is_map(e.payload()), "throw payload should be the raised map");
        check(std::string(e.what()) == "{:msg \"boom\"}", "throw message should print the payload");
    }

    try {
        (void)eval_text("(throw 7)", env);
        throw std::runtime_error("expected user_error from throw");
    } catch (const lisp_error& e) {
        check(std::string(e.what()) == "7", "user_error should be a lisp_error");
    }
}

void test_special_forms() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_eval("(def! x 10)", "10", env);
    check_eval("x", "10", env);
    check_eval("(let* (a 2 b (+ a 1)) (* a b))", "6", env);
    check_eval("(let* [a 1 b a] b)", "1", env);
    check_eval("(do (def! y 1) (def! y (+ y 1)) y)", "2", env);
    check_eval("(do)", "nil", env);
    check_eval("(if true 1 2)", "1", env);
    check_eval("(if nil 1 2)", "2", env);
    check_eval("(if false 1)", "nil", env);
    check_eval("(if 0 :zero-is-truthy :no)", ":zero-is-truthy", env);
    check_eval("(if \"\" :empty-string-is-truthy :no)", ":empty-string-is-truthy", env);
    check_eval("((fn* (a b) (- a b)) 5 3)", "2", env);
    check_eval("((fn* [a b] (- a b)) 5 3)", "2", env);
    check_eval("()", "()", env);
    check_eval("[(+ 1 1) x]", "[2 10]", env);
    check_eval("{:a (+ 1 2) \"b\" [x]}", "{:a 3 \"b\" [10]}", env);
    check_eval(":kw", ":kw", env);
    check_eval("(not nil)", "true", env);
    check_eval("(not 0)", "false", env);

    check_throws<type_error>("(def! 1 2)", env, "def! needs a symbol");
    check_throws<type_error>("(let* (1 2) 3)", env, "let* names must be symbols");
    check_throws<eval_error>("(let* (a) 1)", env, "let* needs even bindings");
    check_throws<eval_error>("(if)", env, "if needs a condition and a branch");
    check_throws<type_error>("(fn* (1) 1)", env, "fn* params must be symbols");
    check_throws<eval_error>("(fn* (a))", env, "fn* needs a body");
    check_throws<type_error>("((fn* (a b) a) 1)", env, "closure arity mismatch must fail");
}

void test_arithmetic_and_comparisons() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_eval("(+ 1 2)", "3", env);
    check_eval("(- 1 2)", "-1", env);
    check_eval("(* -3 4)", "-12", env);
    check_eval("(/ 7 2)", "3", env);
    check_eval("(/ -7 2)", "-4", env);
    check_eval("(/ 7 -2)", "-4", env);
    check_eval("(/ -8 2)", "-4", env);
    check_eval("(/ -7 -2)", "3", env);
    check_eval("(+ (* (/ -7 2) 2) 1)", "-7", env);

    check_eval("(> 2 1)", "true", env);
    check_eval("(>= 2 2)", "true", env);
    check_eval("(< 2 1)", "false", env);
    check_eval("(<= 1 1)", "true", env);

    check_throws<type_error>("(< 1 :a)", env, "comparison needs integers");
    check_throws<type_error>("(+ 1 2 3)", env, "arithmetic takes two operands");
    check_throws<eval_error>("(- -9223372036854775807 2)", env, "subtraction overflow must fail");
}

void test_structural_equality() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_eval("(= (list 1 2 3) (vector 1 2 3))", "true", env);
    check_eval("(= [1 [2 3]] (list 1 (list 2 3)))", "true", env);
    check_eval("(= [1 2] [1 2 3])", "false", env);
    check_eval("(= (hash-map \"a\" 1 \"b\" 2) (hash-map \"b\" 2 \"a\" 1))", "true", env);
    check_eval("(= {:a [1]} {:a (list 1)})", "true", env);
    check_eval("(= {:a 1} {:a 1 :b 2})", "false", env);
    check_eval("(= {\"a\" 1} {:a 1})", "false", env);
    check_eval("(= 1 \"1\")", "false", env);
    check_eval("(= \"abc\" \"abc\")", "true", env);
    check_eval("(= :a :a)", "true", env);
    check_eval("(= :a \"a\")", "false", env);
    check_eval("(= (symbol \"s\") (symbol \"s\"))", "true", env);
    check_eval("(= nil nil)", "true", env);
    check_eval("(= nil false)", "false", env);
    check_eval("(= (list) nil)", "false", env);
    check_eval("(= (atom 1) (atom 1))", "false", env);
    check_eval("(let* (a (atom 1)) (= a a))", "true", env);
}

void test_tail_calls_are_bounded() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    (void)eval_text("(def! sum-to (fn* (n acc) (if (= n 0) acc (sum-to (- n 1) (+ acc n)))))", env);
    check_eval("(sum-to 100000 0)", "5000050000", env);

    (void)eval_text("(def! count-down (fn* (n) (do (def! seen n) (if (> n 0) (count-down (- n 1)) :done))))", env);
    check_eval("(count-down 100000)", ":done", env);

    (void)eval_text("(def! loop-let (fn* (n) (let* (m (- n 1)) (if (< m 0) n (loop-let m)))))", env);
    check_eval("(loop-let 100000)", "0", env);

    (void)eval_text(
        "(def! even-odd (fn* (n even) (if (= n 0) even (even-odd (- n 1) (not even)))))", env);
    check_eval("(even-odd 100001 true)", "false", env);

    check(default_gc().stats().collections > 0, "long tail loops should have triggered collections");

    runtime_config config;
    config.extension_register_hook = register_force_gc;
    const root_env_handle gc_env = create_global_env(config);
    env = gc_env.get();

    (void)eval_text("(def! nest (fn* (n acc) (if (= n 0) acc (nest (- n 1) (list acc)))))", env);
    (void)eval_text("(def! deep-list (nest 100000 (list)))", env);
    (void)eval_text("(def! nest-atom (fn* (n acc) (if (= n 0) acc (nest-atom (- n 1) (atom acc)))))", env);
    (void)eval_text("(def! deep-atom (nest-atom 100000 :bottom))", env);
    (void)eval_text("(def! nest-map (fn* (n acc) (if (= n 0) acc (nest-map (- n 1) {:k acc}))))", env);
    (void)eval_text("(def! deep-map (nest-map 100000 {}))", env);
    check_eval("(force-gc)", "nil", env);
    check_eval("(count deep-list)", "1", env);
    check_eval("(atom? @deep-atom)", "true", env);
    check_eval("(contains? deep-map :k)", "true", env);
}

void test_closures_capture_environment() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_eval("(((fn* (x) (fn* (y) (+ x y))) 5) 3)", "8", env);

    (void)eval_text("(def! make-adder (fn* (x) (fn* (y) (+ x y))))", env);
    (void)eval_text("(def! add5 (make-adder 5))", env);
    (void)eval_text("(def! add7 (make-adder 7))", env);
    check_eval("(add5 1)", "6", env);
    check_eval("(add7 1)", "8", env);

    (void)eval_text(
        "(def! make-counter (fn* () (let* (n (atom 0)) (fn* () (swap! n (fn* (v) (+ v 1)))))))", env);
    (void)eval_text("(def! counter (make-counter))", env);
    (void)eval_text("(counter)", env);
    (void)eval_text("(counter)", env);
    check_eval("(counter)", "3", env);

    (void)eval_text("(def! late (fn* () later-binding))", env);
    (void)eval_text("(def! later-binding :visible)", env);
    check_eval("(late)", ":visible", env);
}

void test_sequence_builtins() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_eval("(cons 0 [1 2])", "(0 1 2)", env);
    check_eval("(cons [0] (list))", "([0])", env);
    check_eval("(concat [1 2] (list 3) [])", "(1 2 3)", env);
    check_eval("(concat)", "()", env);
    check_eval("(list 1 :a \"s\")", "(1 :a \"s\")", env);
    check_eval("(list? (list))", "true", env);
    check_eval("(list? [])", "false", env);
    check_eval("(empty? [])", "true", env);
    check_eval("(empty? (list 1))", "false", env);
    check_eval("(count [1 2 3])", "3", env);
    check_eval("(count 5)", "0", env);
    check_eval("(count nil)", "0", env);
    check_eval("(nth (list 1 2 3) 2)", "3", env);
    check_eval("(first nil)", "nil", env);
    check_eval("(first [])", "nil", env);
    check_eval("(first (list 7 8))", "7", env);
    check_eval("(rest nil)", "()", env);
    check_eval("(rest [1 2 3])", "(2 3)", env);
    check_eval("(rest [])", "()", env);

    check_eval("(apply + 1 [2])", "3", env);
    check_eval("(apply list 1 2 [3 4])", "(1 2 3 4)", env);
    check_eval("(apply (fn* (a b) (* a b)) (list 6 7))", "42", env);
    check_eval("(map (fn* (x) (* x x)) [1 2 3])", "(1 4 9)", env);
    check_eval("(map list? (list (list) [] 1))", "(true false false)", env);

    check_throws<index_error>("(nth (list 1 2 3) 3)", env, "nth past the end must fail");
    check_throws<index_error>("(nth [1 2 3] -1)", env, "negative nth must fail");
    check_throws<type_error>("(cons 1 2)", env, "cons needs a sequence");
    check_throws<type_error>("(concat [1] 2)", env, "concat needs sequences");
    check_throws<type_error>("(empty? 1)", env, "empty? needs a sequence");
    check_throws<type_error>("(rest :a)", env, "rest needs a sequence or nil");
    check_throws<type_error>("(apply 1 [2])", env, "apply needs a function");
    check_throws<type_error>("(apply + 1 2)", env, "apply needs a trailing sequence");
    check_throws<type_error>("(map + 1)", env, "map needs a sequence");
}

void test_map_builtins() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    (void)eval_text("(def! m (hash-map :a 1 \"b\" 2))", env);
    check_eval("(map? m)", "true", env);
    check_eval("(map? [])", "false", env);
    check_eval("(get m :a)", "1", env);
    check_eval("(get m \"b\")", "2", env);
    check_eval("(get m \"a\")", "nil", env);
    check_eval("(get nil :a)", "nil", env);
    check_eval("(contains? m :a)", "true", env);
    check_eval("(contains? m :b)", "false", env);
    check_eval("(keys m)", "(:a \"b\")", env);
    check_eval("(vals m)", "(1 2)", env);
    check_eval("(assoc m :c 3 :a 9)", "{:a 9 \"b\" 2 :c 3}", env);
    check_eval("m", "{:a 1 \"b\" 2}", env);
    check_eval("(dissoc m :a :missing)", "{\"b\" 2}", env);
    check_eval("(count (keys (dissoc m :a \"b\")))", "0", env);
    check_eval("m", "{:a 1 \"b\" 2}", env);
    check_eval("(hash-map)", "{}", env);

    check_throws<type_error>("(hash-map :a)", env, "hash-map needs pairs");
    check_throws<type_error>("(hash-map 1 2)", env, "map keys must be strings or keywords");
    check_throws<type_error>("(assoc [] :a 1)", env, "assoc needs a map");
    check_throws<type_error>("(get [] :a)", env, "get needs a map or nil");
    check_throws<type_error>("(keys nil)", env, "keys needs a map");
}

void test_predicates_and_conversions() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check_eval("(sequential? (list))", "true", env);
    check_eval("(sequential? [])", "true", env);
    check_eval("(sequential? {})", "false", env);
    check_eval("(vector? [])", "true", env);
    check_eval("(vector? (list))", "false", env);
    check_eval("(symbol? (symbol \"abc\"))", "true", env);
    check_eval("(symbol? \"abc\")", "false", env);
    check_eval("(keyword? :k)", "true", env);
    check_eval("(keyword? \"k\")", "false", env);
    check_eval("(nil? nil)", "true", env);
    check_eval("(nil? false)", "false", env);
    check_eval("(true? true)", "true", env);
    check_eval("(true? 1)", "false", env);
    check_eval("(false? false)", "true", env);
    check_eval("(false? nil)", "false", env);

    check_eval("(symbol \"abc\")", "abc", env);
    check_eval("(keyword \"k\")", ":k", env);
    check_eval("(keyword :k)", ":k", env);
    check_eval("(vector 1 2)", "[1 2]", env);
    check_eval("(vec (list 1 2))", "[1 2]", env);
    check_eval("(vec [1 2])", "[1 2]", env);

    check_throws<type_error>("(symbol 1)", env, "symbol needs a string");
    check_throws<type_error>("(keyword 1)", env, "keyword needs a string or keyword");
    check_throws<type_error>("(vec {})", env, "vec needs a sequence");
}

void test_atoms_share_state() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    (void)eval_text("(def! a (atom 1))", env);
    (void)eval_text("(def! b a)", env);
    check_eval("(atom? a)", "true", env);
    check_eval("(atom? 1)", "false", env);
    check_eval("(deref a)", "1", env);
    check_eval("(swap! a (fn* (old extra) (+ old extra)) 10)", "11", env);
    check_eval("(deref b)", "11", env);
    check_eval("@b", "11", env);
    check_eval("(swap! b + 4)", "15", env);
    check_eval("@a", "15", env);
    check_eval("(reset! a :replaced)", ":replaced", env);
    check_eval("@b", ":replaced", env);
    check_eval("a", "(atom :replaced)", env);

    check_throws<type_error>("(deref 1)", env, "deref needs an atom");
    check_throws<type_error>("(reset! 1 2)", env, "reset! needs an atom");
    check_throws<type_error>("(swap! a 1)", env, "swap! needs a function");
}

void test_text_builtins() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();

    check(string_value(eval_text(R"((pr-str "a\"b" 1 :k))", env)) == R"("a\"b" 1 :k)", "pr-str mismatch");
    check(string_value(eval_text(R"((str "a\"b" 1 :k nil))", env)) == "a\"b1:knil", "str mismatch");
    check(string_value(eval_text("(str)", env)).empty(), "empty str mismatch");
    check(string_value(eval_text("(pr-str)", env)).empty(), "empty pr-str mismatch");

    {
        capture_stdout captured;
        check(is_nil(eval_text(R"((prn "hi" [1]))", env)), "prn should return nil");
        check(is_nil(eval_text(R"((println "hi" "there" "\"q\""))", env)), "println should return nil");
        check(captured.text() == "\"hi\" [1]\nhi there \"q\"\n", "prn/println output mismatch: " + captured.text());
    }

    check_eval("(read-string \"(+ 1 2)\")", "(+ 1 2)", env);
    check_eval("(eval (read-string \"(+ 1 2)\"))", "3", env);
    check_eval("(read-string \"  ; nothing here\")", "nil", env);
    check_eval("(read-string \"7 8\")", "7", env);
    check_throws<parse_error>("(read-string \"(1 2\")", env, "read-string should surface parse errors");
    check_throws<type_error>("(read-string 1)", env, "read-string needs a string");
}

void test_files_argv_and_eval() {
    using namespace lumen;

    const auto path = temp_file_path("load");
    write_text_file(path, "(def! from-file (+ 40 2))\n(def! doubled (* from-file 2))\n; trailing comment");

    runtime_config config;
    config.argv = {"first", "second"};
    const root_env_handle global_env = create_global_env(config);
    env_ptr env = global_env.get();

    check_eval("*ARGV*", "(\"first\" \"second\")", env);
    check_eval("(load-file \"" + path.string() + "\")", "nil", env);
    check_eval("doubled", "84", env);
    check(string_value(eval_text("(slurp \"" + path.string() + "\")", env)).rfind("(def! from-file", 0) == 0,
          "slurp should return the file contents");

    check_eval("(eval (list + 1 2))", "3", env);
    check_eval("(let* (x 99) (eval (read-string \"(def! evaluated-globally 1)\")))", "1", env);
    check_eval("evaluated-globally", "1", env);

    check_eval("(count *ARGV*)", "2", env);
    check_eval("*ARGV*", "()", create_global_env().get());

    check_throws<io_error>("(load-file \"/nonexistent/lumen/file.lisp\")", env, "load-file should surface io_error");

    std::filesystem::remove(path);
}

void test_gc_during_nested_evaluation() {
    using namespace lumen;

    runtime_config config;
    config.extension_register_hook = register_force_gc;
    const root_env_handle global_env = create_global_env(config);
    env_ptr env = global_env.get();

    const std::size_t before = default_gc().stats().collections;

    check(string_value(eval_text("(let* (x (list 1 2 3) y [x (force-gc) x]) (pr-str x y))", env)) ==
              "(1 2 3) [(1 2 3) nil (1 2 3)]",
          "values held across a collection were lost");

    (void)eval_text("(def! cell (atom {:k [1 2]}))", env);
    (void)eval_text("(force-gc)", env);
    check_eval("@cell", "{:k [1 2]}", env);

    check_eval("(map (fn* (x) (do (force-gc) (* x 2))) [1 2 3])", "(2 4 6)", env);
    check_eval("(apply (fn* (a b) (do (force-gc) (list a b))) [:a] [[:b]])", "([:a] [:b])", env);
    check_eval("(swap! cell (fn* (m) (do (force-gc) (assoc m :n (list 3)))))", "{:k [1 2] :n (3)}", env);
    check_eval("{:a (do (force-gc) [1]) :b (do (force-gc) [2])}", "{:a [1] :b [2]}", env);
    check_eval("(let* (f (fn* (n) (do (force-gc) n))) (f (list 4 5)))", "(4 5)", env);

    check(default_gc().stats().collections >= before + 8, "force-gc should have collected");
    check(default_gc().stats().live_objects_after_last_gc > 0, "live objects should be reported");
}

void test_released_environments_are_collected() {
    using namespace lumen;

    runtime_config config;
    config.extension_register_hook = register_force_gc;
    root_env_handle scratch = create_global_env(config);
    (void)eval_text("(def! payload (map (fn* (n) [n (atom n) {:n n}]) (vec (read-string \"(1 2 3 4 5 6 7 8 9 10)\"))))",
                    scratch.get());
    (void)eval_text("(force-gc)", scratch.get());
    const std::size_t with_scratch = default_gc().stats().live_objects_after_last_gc;

    scratch.reset();
    check(scratch.get() == nullptr, "reset should release the environment");
    default_gc().collect();
    check(default_gc().stats().live_objects_after_last_gc < with_scratch,
          "releasing the last handle should let the environment be collected");

    const root_env_handle first = create_global_env();
    root_env_handle moved = create_global_env();
    moved = root_env_handle(first.get());
    default_gc().collect();
    check_eval("(+ 1 2)", "3", first.get());
    moved.reset();
    default_gc().collect();
    check_eval("(not nil)", "true", first.get());
}

void test_tracing_and_bootstrap() {
    using namespace lumen;

    memory_log_sink quiet_sink(4096);
    runtime_config quiet;
    quiet.trace_sink = &quiet_sink;
    const root_env_handle global_env = create_global_env(quiet);
    env_ptr env = global_env.get();
    check(quiet_sink.size() == 0, "bootstrap should not be traced unless requested");

    check_eval("(+ 1 2)", "3", env);
    bool saw_call = false;
    bool saw_return = false;
    for (const log_record& rec : quiet_sink.snapshot()) {
        check(rec.category == "eval", "trace records should use the eval category");
        check(rec.level == log_level::debug, "trace records should be debug level");
        saw_call = saw_call || rec.message == "call: #<function:+>(1, 2)";
        saw_return = saw_return || rec.message == "return: + => 3";
    }
    check(saw_call, "trace should record native calls");
    check(saw_return, "trace should record native returns");

    quiet_sink.clear();
    check_eval("(not false)", "true", env);
    check(quiet_sink.size() > 0, "bootstrapped definitions should be traced once user code calls them");

    memory_log_sink loud_sink(4096);
    runtime_config loud;
    loud.trace_sink = &loud_sink;
    loud.trace_bootstrap = true;
    (void)create_global_env(loud);
    bool saw_bootstrap = false;
    for (const log_record& rec : loud_sink.snapshot()) {
        saw_bootstrap = saw_bootstrap || rec.message == "def! not";
    }
    check(saw_bootstrap, "trace_bootstrap should trace the bootstrap definitions");

    memory_log_sink bounded(2);
    for (int i = 0; i < 5; ++i) {
        log_to(&bounded, log_level::info, "test", std::to_string(i));
    }
    const auto records = bounded.snapshot();
    check(records.size() == 2, "memory sink should stay bounded");
    check(records.back().message == "4" && records.back().sequence == 5, "memory sink should keep the newest records");

    std::ostringstream stream;
    stream_log_sink to_stream(stream);
    log_to(&to_stream, log_level::warn, "eval", "hello");
    check(stream.str() == "[1] warn eval: hello\n", "stream sink format mismatch: " + stream.str());
}

void test_registrar_rules() {
    using namespace lumen;

    const root_env_handle global_env = create_global_env();
    env_ptr env = global_env.get();
    registrar r(env);

    r.register_value("answer", make_integer(42));
    check_eval("answer", "42", env);

    r.register_builtin("twice", [](const std::vector<value>& args) {
        if (args.size() != 1) {
            throw type_error("twice: expected 1 arguments");
        }
        return make_list({args[0], args[0]});
    });
    check_eval("(twice :x)", "(:x :x)", env);

    try {
        r.register_value("answer", make_integer(1));
        throw std::runtime_error("duplicate registration should fail");
    } catch (const eval_error&) {
    }

    try {
        r.register_builtin("", [](const std::vector<value>&) { return make_nil(); });
        throw std::runtime_error("empty name should fail");
    } catch (const eval_error&) {
    }
}

void test_map_storage_order() {
    using namespace lumen;

    map_storage entries;
    entries.insert_or_assign(map_key{map_key_type::keyword, "a"}, make_integer(1));
    entries.insert_or_assign(map_key{map_key_type::string, "a"}, make_integer(2));
    entries.insert_or_assign(map_key{map_key_type::keyword, "b"}, make_integer(3));
    entries.insert_or_assign(map_key{map_key_type::keyword, "a"}, make_integer(4));

    check(entries.size() == 3, "string and keyword keys must be distinct");
    check(integer_value(*entries.find(map_key{map_key_type::keyword, "a"})) == 4, "overwrite failed");
    check(integer_value(*entries.find(map_key{map_key_type::string, "a"})) == 2, "string key lookup failed");

    check(entries.erase(map_key{map_key_type::string, "a"}), "erase should report removal");
    check(!entries.erase(map_key{map_key_type::string, "a"}), "second erase should report nothing removed");
    check(integer_value(*entries.find(map_key{map_key_type::keyword, "b"})) == 3, "index should survive erase");

    std::vector<std::string> order;
    for (const auto& [key, _] : entries) {
        order.push_back(key.text_data);
    }
    check(order == std::vector<std::string>{"a", "b"}, "insertion order should be kept");
}

}  // namespace

int main() {
    const std::vector<std::pair<std::string, std::function<void()>>> tests = {
        {"reader basics", test_reader_basics},
        {"printer modes", test_printer_modes},
        {"reader/printer round trip", test_round_trip},
        {"environment shadowing", test_environment_shadowing},
        {"error hierarchy basics", test_error_hierarchy_basics},
        {"special forms", test_special_forms},
        {"arithmetic and comparisons", test_arithmetic_and_comparisons},
        {"structural equality", test_structural_equality},
        {"tail calls are bounded", test_tail_calls_are_bounded},
        {"closures capture environment", test_closures_capture_environment},
        {"sequence builtins", test_sequence_builtins},
        {"map builtins", test_map_builtins},
        {"predicates and conversions", test_predicates_and_conversions},
        {"atoms share state", test_atoms_share_state},
        {"text builtins", test_text_builtins},
        {"files, argv and eval", test_files_argv_and_eval},
        {"gc during nested evaluation", test_gc_during_nested_evaluation},
        {"released environments are collected", test_released_environments_are_collected},
        {"tracing and bootstrap", test_tracing_and_bootstrap},
        {"registrar rules", test_registrar_rules},
        {"map storage order", test_map_storage_order},
    };

    std::size_t passed = 0;
    for (const auto& [name, test_fn] : tests) {
        try {
            test_fn();
            ++passed;
            std::cout << "[PASS] " << name << '\n';
        } catch (const std::exception& e) {
            std::cerr << "[FAIL] " << name << ": " << e.what() << '\n';
            return 1;
        }
    }

    std::cout << "All tests passed (" << passed << "/" << tests.size() << ").\n";
    return 0;
}
