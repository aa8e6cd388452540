#include "lumen/value.hpp"

#include <unordered_map>
#include <utility>

#include "lumen/env.hpp"
#include "lumen/error.hpp"

namespace lumen {
namespace {

value make_object(value_type type) {
    return default_gc().allocate<object>(type);
}

void require_type(value v, value_type expected, const std::string& where) {
    if (!v || v->type != expected) {
        throw type_error(where + ": expected " + std::string(type_name(expected)));
    }
}

std::unordered_map<std::string, value>& symbol_table() {
    static std::unordered_map<std::string, value> table;
    return table;
}

bool equal_sequences(const std::vector<value>& lhs, const std::vector<value>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!equal_values(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

bool equal_maps(const map_storage& lhs, const map_storage& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, mapped] : lhs) {
        const value* other = rhs.find(key);
        if (!other || !equal_values(mapped, *other)) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool map_key::operator==(const map_key& other) const noexcept {
    return type == other.type && text_data == other.text_data;
}

std::size_t map_key_hash::operator()(const map_key& key) const noexcept {
    constexpr std::size_t mix = 0x9e3779b97f4a7c15ull;
    const std::size_t seed = std::hash<int>{}(static_cast<int>(key.type));
    const std::size_t text = std::hash<std::string>{}(key.text_data);
    return seed ^ (text + mix + (seed << 6u) + (seed >> 2u));
}

const value* map_storage::find(const map_key& key) const {
    const auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

void map_storage::insert_or_assign(const map_key& key, value mapped) {
    const auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = mapped;
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, mapped);
}

bool map_storage::erase(const map_key& key) {
    const auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    const std::size_t removed = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(removed));
    index_.erase(it);
    for (auto& [_, position] : index_) {
        if (position > removed) {
            --position;
        }
    }
    return true;
}

object::object(value_type value_type_tag) : type(value_type_tag) {}

void object::gc_mark_children(gc& heap) {
    switch (type) {
        case value_type::list:
        case value_type::vector:
            for (value item : items_data) {
                heap.mark_value(item);
            }
            break;
        case value_type::map:
            for (const auto& [_, mapped] : map_data) {
                heap.mark_value(mapped);
            }
            break;
        case value_type::atom:
            heap.mark_value(atom_data);
            break;
        case value_type::closure:
            heap.mark_value(closure_body_data);
            heap.mark_env(closure_env_data);
            break;
        default:
            break;
    }
}

std::size_t object::gc_size_bytes() const {
    return sizeof(object);
}

value make_nil() {
    static value nil_value = make_object(value_type::nil);
    return nil_value;
}

value make_boolean(bool v) {
    static value true_value = [] {
        auto out = make_object(value_type::boolean);
        out->boolean_data = true;
        return out;
    }();
    static value false_value = [] {
        auto out = make_object(value_type::boolean);
        out->boolean_data = false;
        return out;
    }();
    return v ? true_value : false_value;
}

value make_integer(std::int64_t v) {
    auto out = make_object(value_type::integer);
    out->integer_data = v;
    return out;
}

value make_string(const std::string& text) {
    auto out = make_object(value_type::string);
    out->text_data = text;
    return out;
}

value make_symbol(const std::string& name) {
    auto& table = symbol_table();

    const auto found = table.find(name);
    if (found != table.end()) {
        return found->second;
    }

    auto sym = make_object(value_type::symbol);
    sym->text_data = name;
    table.emplace(name, sym);
    return sym;
}

value make_keyword(const std::string& name) {
    auto out = make_object(value_type::keyword);
    out->text_data = name;
    return out;
}

value make_list(std::vector<value> items) {
    auto out = make_object(value_type::list);
    out->items_data = std::move(items);
    return out;
}

value make_vector(std::vector<value> items) {
    auto out = make_object(value_type::vector);
    out->items_data = std::move(items);
    return out;
}

value make_map() {
    return make_object(value_type::map);
}

value make_map(map_storage entries) {
    auto out = make_object(value_type::map);
    out->map_data = std::move(entries);
    return out;
}

value make_atom(value initial) {
    auto out = make_object(value_type::atom);
    out->atom_data = initial;
    return out;
}

value make_primitive(const std::string& name, primitive_fn fn) {
    auto out = make_object(value_type::primitive_fn);
    out->text_data = name;
    out->primitive_data = std::move(fn);
    return out;
}

value make_closure(const std::vector<std::string>& params, value body, env_ptr captured_env) {
    auto out = make_object(value_type::closure);
    out->closure_params_data = params;
    out->closure_body_data = body;
    out->closure_env_data = captured_env;
    return out;
}

value_type type_of(value v) {
    if (!v) {
        throw eval_error("null value");
    }
    return v->type;
}

std::string_view type_name(value_type t) {
    switch (t) {
        case value_type::nil:
            return "nil";
        case value_type::boolean:
            return "boolean";
        case value_type::integer:
            return "integer";
        case value_type::string:
            return "string";
        case value_type::symbol:
            return "symbol";
        case value_type::keyword:
            return "keyword";
        case value_type::list:
            return "list";
        case value_type::vector:
            return "vector";
        case value_type::map:
            return "map";
        case value_type::atom:
            return "atom";
        case value_type::primitive_fn:
            return "primitive_fn";
        case value_type::closure:
            return "closure";
    }
    return "unknown";
}

bool is_nil(value v) {
    return v && v->type == value_type::nil;
}

bool is_boolean(value v) {
    return v && v->type == value_type::boolean;
}

bool is_integer(value v) {
    return v && v->type == value_type::integer;
}

bool is_string(value v) {
    return v && v->type == value_type::string;
}

bool is_symbol(value v) {
    return v && v->type == value_type::symbol;
}

bool is_keyword(value v) {
    return v && v->type == value_type::keyword;
}

bool is_list(value v) {
    return v && v->type == value_type::list;
}

bool is_vector(value v) {
    return v && v->type == value_type::vector;
}

bool is_sequential(value v) {
    return is_list(v) || is_vector(v);
}

bool is_map(value v) {
    return v && v->type == value_type::map;
}

bool is_atom(value v) {
    return v && v->type == value_type::atom;
}

bool is_primitive(value v) {
    return v && v->type == value_type::primitive_fn;
}

bool is_closure(value v) {
    return v && v->type == value_type::closure;
}

bool is_function(value v) {
    return is_primitive(v) || is_closure(v);
}

bool is_truthy(value v) {
    if (is_nil(v)) {
        return false;
    }
    if (is_boolean(v) && !boolean_value(v)) {
        return false;
    }
    return true;
}

bool boolean_value(value v) {
    require_type(v, value_type::boolean, "boolean_value");
    return v->boolean_data;
}

std::int64_t integer_value(value v) {
    require_type(v, value_type::integer, "integer_value");
    return v->integer_data;
}

const std::string& string_value(value v) {
    require_type(v, value_type::string, "string_value");
    return v->text_data;
}

const std::string& symbol_name(value v) {
    require_type(v, value_type::symbol, "symbol_name");
    return v->text_data;
}

const std::string& keyword_name(value v) {
    require_type(v, value_type::keyword, "keyword_name");
    return v->text_data;
}

const std::vector<value>& sequence_items(value v) {
    if (!is_sequential(v)) {
        throw type_error("sequence_items: expected list or vector");
    }
    return v->items_data;
}

const map_storage& map_entries(value v) {
    require_type(v, value_type::map, "map_entries");
    return v->map_data;
}

value atom_value(value v) {
    require_type(v, value_type::atom, "atom_value");
    return v->atom_data;
}

void atom_reset(value v, value next) {
    require_type(v, value_type::atom, "atom_reset");
    v->atom_data = next;
}

const primitive_fn& primitive_function(value v) {
    require_type(v, value_type::primitive_fn, "primitive_function");
    return v->primitive_data;
}

const std::string& primitive_name(value v) {
    require_type(v, value_type::primitive_fn, "primitive_name");
    return v->text_data;
}

const std::vector<std::string>& closure_params(value v) {
    require_type(v, value_type::closure, "closure_params");
    return v->closure_params_data;
}

value closure_body(value v) {
    require_type(v, value_type::closure, "closure_body");
    return v->closure_body_data;
}

env_ptr closure_env(value v) {
    require_type(v, value_type::closure, "closure_env");
    return v->closure_env_data;
}

map_key map_key_from_value(value key, const std::string& where) {
    if (is_string(key)) {
        return map_key{map_key_type::string, string_value(key)};
    }
    if (is_keyword(key)) {
        return map_key{map_key_type::keyword, keyword_name(key)};
    }
    throw type_error(where + ": expected key as string or keyword");
}

value map_key_to_value(const map_key& key) {
    switch (key.type) {
        case map_key_type::string:
            return make_string(key.text_data);
        case map_key_type::keyword:
            return make_keyword(key.text_data);
    }
    throw eval_error("map_key_to_value: invalid key type");
}

bool equal_values(value lhs, value rhs) {
    if (lhs == rhs) {
        return true;
    }
    if (!lhs || !rhs) {
        return false;
    }

    if (is_sequential(lhs) && is_sequential(rhs)) {
        return equal_sequences(lhs->items_data, rhs->items_data);
    }
    if (lhs->type != rhs->type) {
        return false;
    }

    switch (lhs->type) {
        case value_type::nil:
            return true;
        case value_type::boolean:
            return lhs->boolean_data == rhs->boolean_data;
        case value_type::integer:
            return lhs->integer_data == rhs->integer_data;
        case value_type::string:
        case value_type::symbol:
        case value_type::keyword:
            return lhs->text_data == rhs->text_data;
        case value_type::map:
            return equal_maps(lhs->map_data, rhs->map_data);
        case value_type::list:
        case value_type::vector:
        case value_type::atom:
        case value_type::primitive_fn:
        case value_type::closure:
            // Identity only; handled by the pointer check above.
            return false;
    }
    return false;
}

void mark_constants(gc& heap) {
    heap.mark_value(make_nil());
    heap.mark_value(make_boolean(true));
    heap.mark_value(make_boolean(false));

    for (const auto& [_, sym] : symbol_table()) {
        heap.mark_value(sym);
    }
}

}  // namespace lumen
