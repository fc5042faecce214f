#pragma once

#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

namespace dset {

// =============================================================================
// Field wrapper for named serialization
// =============================================================================

template<typename T>
struct field_t {
    const char* name;
    T& value;
};

template<typename T>
constexpr field_t<T> field(const char* name, T& value) {
    return field_t<T>{name, value};
}

template<typename T>
constexpr field_t<const T> field(const char* name, const T& value) {
    return field_t<const T>{name, value};
}

// =============================================================================
// Serializable concepts
// =============================================================================

template<typename T>
concept HasFields = requires(T t) {
    { t.fields() } -> std::same_as<decltype(t.fields())>;
};

template<typename T>
concept HasConstFields = requires(const T t) {
    { t.fields() } -> std::same_as<decltype(t.fields())>;
};

// Enums convert through ADL to_string / from_string
template<typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<const char*>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

// =============================================================================
// Archive concepts
// =============================================================================

template<typename A>
concept ArchiveWriter = requires(A& ar, const char* name) {
    { ar.begin_named(name) } -> std::same_as<void>;
    { ar.write(int{}) } -> std::same_as<void>;
    { ar.write(double{}) } -> std::same_as<void>;
    { ar.write(std::string{}) } -> std::same_as<void>;
    { ar.begin_group() } -> std::same_as<void>;
    { ar.end_group() } -> std::same_as<void>;
    { ar.begin_list() } -> std::same_as<void>;
    { ar.end_list() } -> std::same_as<void>;
};

template<typename A>
concept ArchiveReader = requires(A& ar, const char* name, int& i, double& d, std::string& s) {
    { ar.begin_named(name) } -> std::same_as<void>;
    { ar.read(i) } -> std::same_as<bool>;
    { ar.read(d) } -> std::same_as<bool>;
    { ar.read(s) } -> std::same_as<bool>;
    { ar.begin_group() } -> std::same_as<bool>;
    { ar.end_group() } -> std::same_as<void>;
    { ar.begin_list() } -> std::same_as<bool>;
    { ar.end_list() } -> std::same_as<void>;
    { ar.has_field(name) } -> std::same_as<bool>;
    { ar.count_items(name) } -> std::same_as<std::size_t>;
};

// =============================================================================
// Serialize declarations (two-arg: anonymous, three-arg: named)
// =============================================================================

template<ArchiveWriter A, typename T>
void serialize(A& ar, const char* name, const T& value);

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const T& value);

template<ArchiveWriter A>
void serialize(A& ar, const std::string& value);

template<ArchiveWriter A>
void serialize(A& ar, const std::monostate& value);

template<ArchiveWriter A, typename E>
    requires HasEnumStrings<E>
void serialize(A& ar, const E& value);

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const std::vector<T>& value);

template<ArchiveWriter A, typename T>
    requires (!std::is_arithmetic_v<T>)
void serialize(A& ar, const std::vector<T>& value);

template<ArchiveWriter A, typename T>
void serialize(A& ar, const std::map<std::string, T>& value);

template<ArchiveWriter A, typename T>
    requires HasConstFields<T>
void serialize(A& ar, const T& value);

template<ArchiveWriter A, typename T>
void serialize(A& ar, const std::optional<T>& value);

template<ArchiveWriter A, typename... Ts>
void serialize(A& ar, const std::variant<Ts...>& value);

// =============================================================================
// Deserialize declarations
// =============================================================================

template<ArchiveReader A, typename T>
auto deserialize(A& ar, const char* name, T& value) -> bool;

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, T& value) -> bool;

template<ArchiveReader A>
auto deserialize(A& ar, std::string& value) -> bool;

template<ArchiveReader A>
auto deserialize(A& ar, std::monostate& value) -> bool;

template<ArchiveReader A, typename E>
    requires HasEnumStrings<E>
auto deserialize(A& ar, E& value) -> bool;

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, std::vector<T>& value) -> bool;

template<ArchiveReader A, typename T>
    requires (!std::is_arithmetic_v<T>)
auto deserialize(A& ar, std::vector<T>& value) -> bool;

template<ArchiveReader A, typename T>
auto deserialize(A& ar, std::map<std::string, T>& value) -> bool;

template<ArchiveReader A, typename T>
    requires HasFields<T>
auto deserialize(A& ar, T& value) -> bool;

template<ArchiveReader A, typename T>
auto deserialize(A& ar, std::optional<T>& value) -> bool;

template<ArchiveReader A, typename... Ts>
auto deserialize(A& ar, std::variant<Ts...>& value) -> bool;

// =============================================================================
// Named wrappers
// =============================================================================

template<ArchiveWriter A, typename T>
void serialize(A& ar, const char* name, const T& value) {
    ar.begin_named(name);
    serialize(ar, value);
}

template<ArchiveReader A, typename T>
auto deserialize(A& ar, const char* name, T& value) -> bool {
    ar.begin_named(name);
    return deserialize(ar, value);
}

// =============================================================================
// Serialize implementations
// =============================================================================

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const T& value) {
    ar.write(value);
}

template<ArchiveWriter A>
void serialize(A& ar, const std::string& value) {
    ar.write(value);
}

// An empty group, so that "no value" survives as a variant alternative
template<ArchiveWriter A>
void serialize(A& ar, const std::monostate&) {
    ar.begin_group();
    ar.end_group();
}

template<ArchiveWriter A, typename E>
    requires HasEnumStrings<E>
void serialize(A& ar, const E& value) {
    ar.write(std::string(to_string(value)));
}

template<ArchiveWriter A, typename T>
    requires std::is_arithmetic_v<T>
void serialize(A& ar, const std::vector<T>& value) {
    ar.write(value);
}

template<ArchiveWriter A, typename T>
    requires (!std::is_arithmetic_v<T>)
void serialize(A& ar, const std::vector<T>& value) {
    ar.begin_list();
    for (const auto& elem : value) {
        serialize(ar, elem);
    }
    ar.end_list();
}

template<ArchiveWriter A, typename T>
void serialize(A& ar, const std::map<std::string, T>& value) {
    ar.begin_list();
    for (const auto& [key, val] : value) {
        ar.begin_group();
        serialize(ar, "key", key);
        serialize(ar, "value", val);
        ar.end_group();
    }
    ar.end_list();
}

template<ArchiveWriter A, typename T>
    requires HasConstFields<T>
void serialize(A& ar, const T& value) {
    ar.begin_group();
    std::apply([&ar](auto&&... fields) {
        (serialize(ar, fields.name, fields.value), ...);
    }, value.fields());
    ar.end_group();
}

template<ArchiveWriter A, typename T>
void serialize(A& ar, const std::optional<T>& value) {
    ar.begin_group();
    bool has_value = value.has_value();
    serialize(ar, "has_value", has_value);
    if (has_value) {
        serialize(ar, "value", *value);
    }
    ar.end_group();
}

template<ArchiveWriter A, typename... Ts>
void serialize(A& ar, const std::variant<Ts...>& value) {
    ar.begin_group();
    serialize(ar, "index", value.index());
    std::visit([&ar](const auto& v) { serialize(ar, "value", v); }, value);
    ar.end_group();
}

// =============================================================================
// Deserialize implementations
// =============================================================================

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, T& value) -> bool {
    return ar.read(value);
}

template<ArchiveReader A>
auto deserialize(A& ar, std::string& value) -> bool {
    return ar.read(value);
}

template<ArchiveReader A>
auto deserialize(A& ar, std::monostate&) -> bool {
    if (!ar.begin_group()) return false;
    ar.end_group();
    return true;
}

template<ArchiveReader A, typename E>
    requires HasEnumStrings<E>
auto deserialize(A& ar, E& value) -> bool {
    std::string str;
    if (!ar.read(str)) return false;
    value = from_string(std::type_identity<E>{}, str);
    return true;
}

template<ArchiveReader A, typename T>
    requires std::is_arithmetic_v<T>
auto deserialize(A& ar, std::vector<T>& value) -> bool {
    return ar.read(value);
}

template<ArchiveReader A, typename T>
    requires (!std::is_arithmetic_v<T>)
auto deserialize(A& ar, std::vector<T>& value) -> bool {
    if (!ar.begin_list()) return false;
    value.clear();
    while (true) {
        T elem;
        if (!deserialize(ar, elem)) break;
        value.push_back(std::move(elem));
    }
    ar.end_list();
    return true;
}

template<ArchiveReader A, typename T>
auto deserialize(A& ar, std::map<std::string, T>& value) -> bool {
    if (!ar.begin_list()) return false;
    value.clear();
    while (ar.begin_group()) {
        std::string key;
        T val;
        deserialize(ar, "key", key);
        deserialize(ar, "value", val);
        value[key] = std::move(val);
        ar.end_group();
    }
    ar.end_list();
    return true;
}

template<ArchiveReader A, typename T>
    requires HasFields<T>
auto deserialize(A& ar, T& value) -> bool {
    if (!ar.begin_group()) return false;
    std::apply([&ar](auto&&... fields) {
        (deserialize(ar, fields.name, fields.value), ...);
    }, value.fields());
    ar.end_group();
    return true;
}

template<ArchiveReader A, typename T>
auto deserialize(A& ar, std::optional<T>& value) -> bool {
    if (!ar.begin_group()) return false;
    bool has_value = false;
    deserialize(ar, "has_value", has_value);
    if (has_value) {
        T temp;
        deserialize(ar, "value", temp);
        value = std::move(temp);
    } else {
        value = std::nullopt;
    }
    ar.end_group();
    return true;
}

namespace detail {

template<ArchiveReader A, typename Variant, std::size_t I = 0>
auto deserialize_variant_by_index(A& ar, Variant& value, std::size_t index) -> bool {
    if constexpr (I >= std::variant_size_v<Variant>) {
        return false;
    } else {
        if (I == index) {
            std::variant_alternative_t<I, Variant> temp;
            if (!deserialize(ar, temp)) return false;
            value = std::move(temp);
            return true;
        }
        return deserialize_variant_by_index<A, Variant, I + 1>(ar, value, index);
    }
}

} // namespace detail

template<ArchiveReader A, typename... Ts>
auto deserialize(A& ar, std::variant<Ts...>& value) -> bool {
    if (!ar.begin_group()) return false;
    std::size_t index = 0;
    deserialize(ar, "index", index);
    ar.begin_named("value");
    auto result = detail::deserialize_variant_by_index(ar, value, index);
    ar.end_group();
    return result;
}

// =============================================================================
// Config field setter by path
// =============================================================================

namespace detail {

template<typename T>
void parse_and_assign(T& target, const std::string& value) {
    if constexpr (std::is_same_v<T, int>) {
        target = std::stoi(value);
    } else if constexpr (std::is_same_v<T, long>) {
        target = std::stol(value);
    } else if constexpr (std::is_same_v<T, long long>) {
        target = std::stoll(value);
    } else if constexpr (std::is_same_v<T, unsigned int> || std::is_same_v<T, unsigned long>) {
        target = std::stoul(value);
    } else if constexpr (std::is_same_v<T, double>) {
        target = std::stod(value);
    } else if constexpr (std::is_same_v<T, bool>) {
        target = (value == "true" || value == "1");
    } else if constexpr (std::is_same_v<T, std::string>) {
        target = value;
    } else if constexpr (HasEnumStrings<T>) {
        target = from_string(std::type_identity<T>{}, value);
    } else {
        throw std::runtime_error("unsupported type for set()");
    }
}

template<typename T>
void set_impl(T& obj, const std::string& path, const std::string& value);

template<typename T>
void set_field(T& target, const std::string& rest, const std::string& value) {
    if (rest.empty()) {
        parse_and_assign(target, value);
    } else if constexpr (HasFields<T>) {
        set_impl(target, rest, value);
    } else {
        throw std::runtime_error("cannot descend into '" + rest + "': not a struct");
    }
}

template<typename T>
void try_set_field(const char* name, T& target, const std::string& key,
                   const std::string& rest, const std::string& value, bool& found) {
    if (!found && std::string(name) == key) {
        set_field(target, rest, value);
        found = true;
    }
}

template<typename T>
void set_impl(T& obj, const std::string& path, const std::string& value) {
    auto dot = path.find('.');
    std::string key = path.substr(0, dot);
    std::string rest = (dot != std::string::npos) ? path.substr(dot + 1) : "";

    bool found = false;
    std::apply([&](auto&&... field) {
        (try_set_field(field.name, field.value, key, rest, value, found), ...);
    }, obj.fields());

    if (!found) {
        throw std::runtime_error("field not found: " + key);
    }
}

} // namespace detail

/**
 * Set a field in a struct by dot-separated path.
 *
 * Example:
 *   set(options, "threshold", "100");
 *   set(options, "precision", "4");
 */
template<HasFields T>
void set(T& obj, const std::string& path, const std::string& value) {
    detail::set_impl(obj, path, value);
}

} // namespace dset
