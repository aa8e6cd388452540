#include "lumen/reader.hpp"

#include <charconv>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "lumen/error.hpp"

namespace lumen {
namespace {

class parser {
public:
    explicit parser(std::string_view source) : source_(source) {}

    std::vector<value> read_all_expressions() {
        std::vector<value> exprs;
        while (true) {
            skip_ws_and_comments();
            if (eof()) {
                break;
            }
            exprs.push_back(read_expr());
        }
        return exprs;
    }

    std::optional<value> read_first_expression() {
        skip_ws_and_comments();
        if (eof()) {
            return std::nullopt;
        }
        return read_expr();
    }

private:
    [[nodiscard]] parse_error parse_error_at(const std::string& message, bool incomplete, std::size_t position) const {
        std::size_t line = 1;
        std::size_t column = 1;
        const std::size_t end = position < source_.size() ? position : source_.size();
        for (std::size_t i = 0; i < end; ++i) {
            if (source_[i] == '\n') {
                ++line;
                column = 1;
                continue;
            }
            ++column;
        }
        return parse_error("line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message, incomplete);
    }

    [[nodiscard]] parse_error parse_error_here(const std::string& message, bool incomplete) const {
        return parse_error_at(message, incomplete, pos_);
    }

    [[nodiscard]] bool eof() const {
        return pos_ >= source_.size();
    }

    [[nodiscard]] char peek() const {
        return source_[pos_];
    }

    [[nodiscard]] char get() {
        return source_[pos_++];
    }

    void skip_ws_and_comments() {
        while (!eof()) {
            const char c = peek();
            if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
                ++pos_;
                continue;
            }
            if (c == ';') {
                while (!eof() && peek() != '\n') {
                    ++pos_;
                }
                continue;
            }
            break;
        }
    }

    [[nodiscard]] value read_expr() {
        skip_ws_and_comments();
        if (eof()) {
            throw parse_error_here("unexpected end of input", true);
        }

        const char c = get();
        switch (c) {
            case '(':
                return make_list(read_sequence(')', "list"));
            case '[':
                return make_vector(read_sequence(']', "vector"));
            case '{':
                return read_map();
            case ')':
            case ']':
            case '}':
                throw parse_error_here(std::string("unexpected '") + c + "'", false);
            case '@': {
                value target = read_expr();
                return make_list({make_symbol("deref"), target});
            }
            case '"':
                return read_string();
            default:
                return read_atom(c);
        }
    }

    [[nodiscard]] std::vector<value> read_sequence(char close, const char* what) {
        std::vector<value> items;
        while (true) {
            skip_ws_and_comments();
            if (eof()) {
                throw parse_error_here(std::string("unterminated ") + what, true);
            }
            if (peek() == close) {
                ++pos_;
                return items;
            }
            items.push_back(read_expr());
        }
    }

    [[nodiscard]] value read_map() {
        const std::size_t start = pos_;
        const std::vector<value> items = read_sequence('}', "map");
        if (items.size() % 2 != 0) {
            throw parse_error_at("map literal needs an even number of forms", false, start);
        }

        map_storage entries;
        for (std::size_t i = 0; i < items.size(); i += 2) {
            if (!is_string(items[i]) && !is_keyword(items[i])) {
                throw parse_error_at("map keys must be strings or keywords", false, start);
            }
            entries.insert_or_assign(map_key_from_value(items[i], "reader"), items[i + 1]);
        }
        return make_map(std::move(entries));
    }

    [[nodiscard]] value read_string() {
        std::string out;
        while (true) {
            if (eof()) {
                throw parse_error_here("unterminated string", true);
            }

            const char c = get();
            if (c == '"') {
                return make_string(out);
            }
            if (c == '\\') {
                if (eof()) {
                    throw parse_error_here("unterminated string escape", true);
                }
                const char escaped = get();
                switch (escaped) {
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case '"':
                        out.push_back('"');
                        break;
                    case '\\':
                        out.push_back('\\');
                        break;
                    default:
                        throw parse_error_here("unknown string escape", false);
                }
                continue;
            }
            out.push_back(c);
        }
    }

    [[nodiscard]] static bool delimiter(char c) {
        switch (c) {
            case '(':
            case ')':
            case '[':
            case ']':
            case '{':
            case '}':
            case '"':
            case ';':
            case ',':
                return true;
            default:
                return std::isspace(static_cast<unsigned char>(c)) != 0;
        }
    }

    [[nodiscard]] value read_atom(char first_char) {
        const std::size_t start = pos_ - 1;
        std::string token(1, first_char);
        while (!eof() && !delimiter(peek())) {
            token.push_back(get());
        }

        if (token == "nil") {
            return make_nil();
        }
        if (token == "true") {
            return make_boolean(true);
        }
        if (token == "false") {
            return make_boolean(false);
        }
        if (token[0] == ':') {
            if (token.size() == 1) {
                throw parse_error_at("keyword needs a name", false, start);
            }
            return make_keyword(token.substr(1));
        }

        const bool numeric_start = std::isdigit(static_cast<unsigned char>(token[0])) ||
                                   ((token[0] == '-' || token[0] == '+') && token.size() > 1 &&
                                    std::isdigit(static_cast<unsigned char>(token[1])));
        if (numeric_start) {
            std::int64_t integer = 0;
            const char* begin = token.data() + (token[0] == '+' ? 1 : 0);
            const char* end = token.data() + token.size();
            const auto result = std::from_chars(begin, end, integer);
            if (result.ec == std::errc::result_out_of_range) {
                throw parse_error_at("integer literal out of range: " + token, false, start);
            }
            if (result.ec != std::errc{} || result.ptr != end) {
                throw parse_error_at("malformed integer literal: " + token, false, start);
            }
            return make_integer(integer);
        }

        return make_symbol(token);
    }

    std::string_view source_;
    std::size_t pos_ = 0;
};

}  // namespace

std::optional<value> read_str(std::string_view source) {
    parser p(source);
    return p.read_first_expression();
}

std::vector<value> read_all(std::string_view source) {
    parser p(source);
    return p.read_all_expressions();
}

}  // namespace lumen
