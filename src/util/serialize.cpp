#include <tid/serialize.hpp>

namespace tid {

static const char* node_type_name(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::table:          return "table";
        case toml::node_type::array:          return "array";
        case toml::node_type::string:         return "string";
        case toml::node_type::integer:        return "integer";
        case toml::node_type::floating_point: return "float";
        case toml::node_type::boolean:        return "boolean";
        case toml::node_type::date:           return "date";
        case toml::node_type::time:           return "time";
        case toml::node_type::date_time:      return "date-time";
        default:                              return "none";
    }
}

toml::value<std::string> to_toml(const Suffix& suffix) {
    return toml::value<std::string>(suffix.to_string());
}

Result<Suffix> from_toml(const toml::node& node) {
    auto str = node.as_string();
    if (!str) {
        TidError e{TidError::Parse,
            std::string("expected a string for TypeID suffix, got ") + node_type_name(node)};
        const auto& src = node.source();
        if (src.path) e.file = *src.path;
        e.line = static_cast<int>(src.begin.line);
        return e;
    }

    auto r = Suffix::parse(str->get());
    if (r.is_err()) {
        const auto& src = node.source();
        if (src.path) r.error().file = *src.path;
        r.error().line = static_cast<int>(src.begin.line);
    }
    return r;
}

Result<Suffix> read_suffix(const toml::table& tbl, std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return TidError{TidError::Parse,
            "missing TypeID suffix field '" + std::string(key) + "'"};
    }
    return from_toml(*node);
}

void write_suffix(toml::table& tbl, std::string_view key, const Suffix& suffix) {
    tbl.insert_or_assign(key, to_toml(suffix));
}

} // namespace tid
