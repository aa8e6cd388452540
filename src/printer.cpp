#include "lumen/printer.hpp"

#include <sstream>
#include <string_view>
#include <unordered_set>

#include "lumen/error.hpp"

namespace lumen {
namespace {

std::string escape_string(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

class printer {
public:
    explicit printer(bool readable) : readable_(readable) {}

    std::string print(value v) {
        if (!v) {
            throw eval_error("print_str: null value");
        }

        switch (type_of(v)) {
            case value_type::nil:
                return "nil";
            case value_type::boolean:
                return boolean_value(v) ? "true" : "false";
            case value_type::integer:
                return std::to_string(integer_value(v));
            case value_type::string:
                if (readable_) {
                    return "\"" + escape_string(string_value(v)) + "\"";
                }
                return string_value(v);
            case value_type::symbol:
                return symbol_name(v);
            case value_type::keyword:
                return ":" + keyword_name(v);
            case value_type::list: {
                std::ostringstream out;
                append_items(out, sequence_items(v), '(', ')');
                return out.str();
            }
            case value_type::vector: {
                std::ostringstream out;
                append_items(out, sequence_items(v), '[', ']');
                return out.str();
            }
            case value_type::map: {
                std::ostringstream out;
                append_map(out, map_entries(v));
                return out.str();
            }
            case value_type::atom:
                return print_atom(v);
            case value_type::primitive_fn:
                return "#<function:" + primitive_name(v) + ">";
            case value_type::closure:
                return "#<closure>";
        }

        return "<unknown>";
    }

private:
    void append_items(std::ostringstream& out, const std::vector<value>& items, char open, char close) {
        out << open;
        bool first = true;
        for (value item : items) {
            if (!first) {
                out << " ";
            }
            out << print(item);
            first = false;
        }
        out << close;
    }

    void append_map(std::ostringstream& out, const map_storage& entries) {
        out << "{";
        bool first = true;
        for (const auto& [key, mapped] : entries) {
            if (!first) {
                out << " ";
            }
            switch (key.type) {
                case map_key_type::string:
                    out << (readable_ ? "\"" + escape_string(key.text_data) + "\"" : key.text_data);
                    break;
                case map_key_type::keyword:
                    out << ":" << key.text_data;
                    break;
            }
            out << " " << print(mapped);
            first = false;
        }
        out << "}";
    }

    // An atom reachable from its own contents prints as (atom ...) the
    // second time it is entered.
    std::string print_atom(value v) {
        if (!open_atoms_.insert(v).second) {
            return "(atom ...)";
        }
        std::string out = "(atom " + print(atom_value(v)) + ")";
        open_atoms_.erase(v);
        return out;
    }

    bool readable_;
    std::unordered_set<value> open_atoms_;
};

}  // namespace

std::string print_str(value v, bool readable) {
    return printer(readable).print(v);
}

std::string print_value(value v) {
    return print_str(v, false);
}

std::string write_value(value v) {
    return print_str(v, true);
}

}  // namespace lumen
