#include "tgwire/request/params.hpp"

#include <cmath>

namespace tgwire::request {

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

auto Value::null() -> Value {
    return Value(Storage{std::in_place_type<std::nullptr_t>, nullptr});
}

auto Value::boolean(bool b) -> Value {
    return Value(Storage{std::in_place_type<bool>, b});
}

auto Value::integer(std::int64_t i) -> Value {
    return Value(Storage{std::in_place_type<std::int64_t>, i});
}

auto Value::floating(double d) -> Value {
    if (!std::isfinite(d)) {
        throw std::invalid_argument("floating point parameter must be finite");
    }
    return Value(Storage{std::in_place_type<double>, d});
}

auto Value::string(std::string s) -> Value {
    return Value(Storage{std::in_place_type<std::string>, std::move(s)});
}

auto Value::sequence(Sequence elements) -> Value {
    for (const auto& element : elements) {
        if (element.is_absent()) {
            throw std::invalid_argument("sequence element cannot be absent");
        }
    }
    return Value(Storage{std::in_place_type<Sequence>, std::move(elements)});
}

auto Value::from_json(const json& j) -> Value {
    switch (j.type()) {
        case json::value_t::null:
            return null();
        case json::value_t::boolean:
            return boolean(j.get<bool>());
        case json::value_t::number_integer:
            return integer(j.get<std::int64_t>());
        case json::value_t::number_unsigned:
            return of(j.get<std::uint64_t>());
        case json::value_t::number_float:
            return floating(j.get<double>());
        case json::value_t::string:
            return string(j.get<std::string>());
        case json::value_t::array: {
            Sequence elements;
            elements.reserve(j.size());
            for (const auto& element : j) {
                elements.push_back(from_json(element));
            }
            return sequence(std::move(elements));
        }
        case json::value_t::object:
            return json_record(j);
        default:
            throw std::invalid_argument(std::string("unsupported JSON value: ") + j.type_name());
    }
}

auto Value::encode() const -> json {
    return std::visit(
        [](const auto& v) -> json {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, Absent>) {
                throw std::logic_error("an absent value has no encoding");
            } else if constexpr (std::is_same_v<V, std::nullptr_t>) {
                return nullptr;
            } else if constexpr (std::is_same_v<V, RecordRef> || std::is_same_v<V, VariantRef>) {
                return v.payload->encode();
            } else if constexpr (std::is_same_v<V, Sequence>) {
                json arr = json::array();
                for (const auto& element : v) {
                    arr.push_back(element.encode());
                }
                return arr;
            } else {
                return v;
            }
        },
        storage_);
}

auto kind_to_string(Value::Kind kind) -> std::string_view {
    switch (kind) {
        case Value::Kind::Absent: return "absent";
        case Value::Kind::Null: return "null";
        case Value::Kind::Boolean: return "boolean";
        case Value::Kind::Integer: return "integer";
        case Value::Kind::Float: return "float";
        case Value::Kind::String: return "string";
        case Value::Kind::Record: return "record";
        case Value::Kind::Sequence: return "sequence";
        case Value::Kind::Variant: return "variant";
        default: return "unknown";
    }
}

// ---------------------------------------------------------------------------
// ParameterMap
// ---------------------------------------------------------------------------

auto ParameterMap::set_value(std::string name, Value value) -> ParameterMap& {
    if (name.empty()) {
        throw std::invalid_argument("parameter name must not be empty");
    }
    if (value.is_absent()) {
        entries_.erase(name);
    } else {
        entries_.insert_or_assign(std::move(name), std::move(value));
    }
    return *this;
}

auto ParameterMap::unset(std::string_view name) -> bool {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

auto ParameterMap::contains(std::string_view name) const -> bool {
    return entries_.find(name) != entries_.end();
}

auto ParameterMap::get(std::string_view name) const -> const Value* {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

auto ParameterMap::encode() const -> json {
    json body = json::object();
    for (const auto& [name, value] : entries_) {
        body[name] = value.encode();
    }
    return body;
}

auto ParameterMap::from_json(const json& object) -> Result<ParameterMap> {
    if (!object.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Parameters must be a JSON object",
                                          object.type_name()));
    }
    ParameterMap params;
    try {
        for (const auto& [name, value] : object.items()) {
            params.set_value(name, Value::from_json(value));
        }
    } catch (const std::invalid_argument& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Invalid parameter", e.what()));
    }
    return params;
}

} // namespace tgwire::request
