#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "tgwire/core/error.hpp"

namespace tgwire::codec {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Type traits
// ---------------------------------------------------------------------------

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T>
struct is_vector : std::false_type {};

template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

// ---------------------------------------------------------------------------
// Record wire tables
// ---------------------------------------------------------------------------

/// One entry of a record's wire table: the JSON key and the member it
/// maps to.
template <typename Owner, typename Member>
struct Field {
    std::string_view wire_name;
    Member Owner::*member;
};

template <typename Owner, typename Member>
constexpr auto field(std::string_view wire_name, Member Owner::*member) -> Field<Owner, Member> {
    return Field<Owner, Member>{wire_name, member};
}

/// A record exposes its fixed in-memory -> wire name table through a
/// static `wire_fields()` returning a tuple of Field entries.
template <typename T>
concept WireRecord = std::is_class_v<T> && requires {
    { T::wire_fields() };
};

template <typename T>
inline constexpr bool is_wire_record_v = WireRecord<T>;

// ---------------------------------------------------------------------------
// Strict value decoding
// ---------------------------------------------------------------------------

/// Builds the error reported when a node does not have the JSON shape a
/// decoder expects.
auto shape_mismatch(std::string_view expected, const json& actual) -> Error;

/// Builds the error reported when a record is missing a required key.
auto missing_field(std::string_view wire_name) -> Error;

/// Decodes `j` as `T`, requiring the exact JSON type: integers need a
/// JSON integer, strings a JSON string, booleans a JSON boolean. Floating
/// point accepts any number. Records and unions go through their
/// nlohmann adapters. Throws DecodeError on mismatch.
template <typename T>
auto decode_value(const json& j) -> T {
    if constexpr (std::is_same_v<T, bool>) {
        if (!j.is_boolean()) throw DecodeError(shape_mismatch("boolean", j));
        return j.get<bool>();
    } else if constexpr (std::is_integral_v<T>) {
        if (!j.is_number_integer()) throw DecodeError(shape_mismatch("integer", j));
        // get<T>() wraps silently, so out-of-range values fail the decode.
        const bool fits = j.is_number_unsigned() ? std::in_range<T>(j.get<std::uint64_t>())
                                                 : std::in_range<T>(j.get<std::int64_t>());
        if (!fits) throw DecodeError(shape_mismatch("integer", j));
        return j.get<T>();
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!j.is_number()) throw DecodeError(shape_mismatch("number", j));
        return j.get<T>();
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!j.is_string()) throw DecodeError(shape_mismatch("string", j));
        return j.get<std::string>();
    } else if constexpr (is_vector_v<T>) {
        if (!j.is_array()) throw DecodeError(shape_mismatch("array", j));
        T out;
        out.reserve(j.size());
        for (const auto& element : j) {
            out.push_back(decode_value<typename T::value_type>(element));
        }
        return out;
    } else if constexpr (std::is_same_v<T, json>) {
        return j;
    } else {
        return j.get<T>();
    }
}

namespace detail {

template <typename Member>
void write_field(json& j, std::string_view wire_name, const Member& value) {
    if constexpr (is_optional_v<Member>) {
        if (value.has_value()) {
            j[std::string(wire_name)] = *value;
        }
    } else {
        j[std::string(wire_name)] = value;
    }
}

template <typename Member>
void read_field(const json& j, std::string_view wire_name, Member& out) {
    auto it = j.find(std::string(wire_name));
    if constexpr (is_optional_v<Member>) {
        // Optional members tolerate a missing key and an explicit null.
        if (it == j.end() || it->is_null()) {
            out.reset();
            return;
        }
        out = decode_value<typename Member::value_type>(*it);
    } else {
        if (it == j.end()) {
            throw DecodeError(missing_field(wire_name));
        }
        out = decode_value<Member>(*it);
    }
}

} // namespace detail

/// Serializes a record field by field using its wire table. Empty
/// optional members are left out.
template <WireRecord T>
void write_record(json& j, const T& record) {
    j = json::object();
    std::apply(
        [&](const auto&... f) { (detail::write_field(j, f.wire_name, record.*(f.member)), ...); },
        T::wire_fields());
}

/// Populates a record from a JSON object using its wire table. Unknown
/// keys are ignored. Throws DecodeError on a missing required key or a
/// wrongly typed value.
template <WireRecord T>
void read_record(const json& j, T& record) {
    if (!j.is_object()) {
        throw DecodeError(shape_mismatch("object", j));
    }
    std::apply(
        [&](const auto&... f) { (detail::read_field(j, f.wire_name, record.*(f.member)), ...); },
        T::wire_fields());
}

/// Decodes a record, reporting failure as a Result instead of throwing.
template <WireRecord T>
auto decode_record(const json& j) -> Result<T> {
    try {
        T record{};
        read_record(j, record);
        return record;
    } catch (const DecodeError& e) {
        return std::unexpected(e.error());
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to decode record", e.what()));
    }
}

} // namespace tgwire::codec

namespace nlohmann {

template <typename T>
struct adl_serializer<T, std::enable_if_t<tgwire::codec::is_wire_record_v<T>>> {
    static void to_json(json& j, const T& record) {
        tgwire::codec::write_record(j, record);
    }

    static void from_json(const json& j, T& record) {
        tgwire::codec::read_record(j, record);
    }
};

} // namespace nlohmann
