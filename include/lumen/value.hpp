#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lumen/gc.hpp"

namespace lumen {

using primitive_fn = std::function<value(const std::vector<value>&)>;

enum class value_type {
    nil,
    boolean,
    integer,
    string,
    symbol,
    keyword,
    list,
    vector,
    map,
    atom,
    primitive_fn,
    closure
};

// String and keyword keys never compare equal, even with the same text.
enum class map_key_type {
    string,
    keyword
};

struct map_key {
    map_key_type type = map_key_type::string;
    std::string text_data;

    [[nodiscard]] bool operator==(const map_key& other) const noexcept;
};

struct map_key_hash {
    [[nodiscard]] std::size_t operator()(const map_key& key) const noexcept;
};

// Insertion-ordered key/value storage.
class map_storage {
public:
    using entry = std::pair<map_key, value>;

    [[nodiscard]] const value* find(const map_key& key) const;
    void insert_or_assign(const map_key& key, value mapped);
    bool erase(const map_key& key);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::vector<entry>::const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] std::vector<entry>::const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<entry> entries_;
    std::unordered_map<map_key, std::size_t, map_key_hash> index_;
};

struct object final : gc_node {
    explicit object(value_type value_type_tag);

    value_type type = value_type::nil;
    bool boolean_data = false;
    std::int64_t integer_data = 0;
    std::string text_data;
    std::vector<value> items_data;
    map_storage map_data;
    value atom_data = nullptr;
    primitive_fn primitive_data;
    std::vector<std::string> closure_params_data;
    value closure_body_data = nullptr;
    env_ptr closure_env_data = nullptr;

    void gc_mark_children(gc& heap) override;
    [[nodiscard]] std::size_t gc_size_bytes() const override;
};

value make_nil();
value make_boolean(bool v);
value make_integer(std::int64_t v);
value make_string(const std::string& text);
value make_symbol(const std::string& name);
value make_keyword(const std::string& name);
value make_list(std::vector<value> items = {});
value make_vector(std::vector<value> items = {});
value make_map();
value make_map(map_storage entries);
value make_atom(value initial);
value make_primitive(const std::string& name, primitive_fn fn);
value make_closure(const std::vector<std::string>& params, value body, env_ptr captured_env);

[[nodiscard]] value_type type_of(value v);
[[nodiscard]] std::string_view type_name(value_type t);

[[nodiscard]] bool is_nil(value v);
[[nodiscard]] bool is_boolean(value v);
[[nodiscard]] bool is_integer(value v);
[[nodiscard]] bool is_string(value v);
[[nodiscard]] bool is_symbol(value v);
[[nodiscard]] bool is_keyword(value v);
[[nodiscard]] bool is_list(value v);
[[nodiscard]] bool is_vector(value v);
[[nodiscard]] bool is_sequential(value v);
[[nodiscard]] bool is_map(value v);
[[nodiscard]] bool is_atom(value v);
[[nodiscard]] bool is_primitive(value v);
[[nodiscard]] bool is_closure(value v);
[[nodiscard]] bool is_function(value v);
[[nodiscard]] bool is_truthy(value v);

[[nodiscard]] bool boolean_value(value v);
[[nodiscard]] std::int64_t integer_value(value v);
[[nodiscard]] const std::string& string_value(value v);
[[nodiscard]] const std::string& symbol_name(value v);
[[nodiscard]] const std::string& keyword_name(value v);
[[nodiscard]] const std::vector<value>& sequence_items(value v);
[[nodiscard]] const map_storage& map_entries(value v);
[[nodiscard]] value atom_value(value v);
void atom_reset(value v, value next);
[[nodiscard]] const primitive_fn& primitive_function(value v);
[[nodiscard]] const std::string& primitive_name(value v);
[[nodiscard]] const std::vector<std::string>& closure_params(value v);
[[nodiscard]] value closure_body(value v);
[[nodiscard]] env_ptr closure_env(value v);

[[nodiscard]] map_key map_key_from_value(value key, const std::string& where);
[[nodiscard]] value map_key_to_value(const map_key& key);

[[nodiscard]] bool equal_values(value lhs, value rhs);

void mark_constants(gc& heap);

}  // namespace lumen
