#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "lumen/error.hpp"
#include "lumen/eval.hpp"
#include "lumen/gc.hpp"
#include "lumen/logging.hpp"
#include "lumen/printer.hpp"
#include "lumen/reader.hpp"

namespace {

bool trace_requested() {
    const char* flag = std::getenv("LUMEN_TRACE");
    return flag && std::string(flag) != "" && std::string(flag) != "0";
}

int run_script(const std::string& path, lumen::env_ptr env) {
    lumen::value form = lumen::make_list({lumen::make_symbol("load-file"), lumen::make_string(path)});
    lumen::gc_root_scope roots(lumen::default_gc());
    roots.add(&form);

    (void)lumen::eval(form, env);
    return 0;
}

int run_repl(lumen::env_ptr env) {
    std::string buffer;
    while (true) {
        std::cout << (buffer.empty() ? "user> " : "...   ");
        std::cout.flush();

        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << '\n';
            break;
        }

        if (buffer.empty() && (line == ":q" || line == ":quit" || line == ":exit")) {
            break;
        }

        buffer += line;
        buffer.push_back('\n');

        try {
            std::vector<lumen::value> exprs = lumen::read_all(buffer);

            lumen::gc_root_scope roots(lumen::default_gc());
            roots.add(&exprs);

            for (lumen::value expr : exprs) {
                lumen::value result = lumen::eval(expr, env);
                std::cout << lumen::write_value(result) << '\n';
            }
            buffer.clear();
        } catch (const lumen::parse_error& e) {
            if (e.incomplete()) {
                continue;
            }
            std::cerr << "Error: " << e.what() << '\n';
            buffer.clear();
        } catch (const lumen::lisp_error& e) {
            std::cerr << "Error: " << e.what() << '\n';
            buffer.clear();
        }
    }

    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::unique_ptr<lumen::log_sink> trace_sink;
        lumen::runtime_config config;
        if (trace_requested()) {
            trace_sink = std::make_unique<lumen::stream_log_sink>(std::cerr);
            config.trace_sink = trace_sink.get();
        }
        for (int i = 2; i < argc; ++i) {
            config.argv.emplace_back(argv[i]);
        }

        const lumen::root_env_handle global = lumen::create_global_env(config);
        lumen::env_ptr env = global.get();
        if (argc > 1) {
            return run_script(argv[1], env);
        }
        return run_repl(env);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
