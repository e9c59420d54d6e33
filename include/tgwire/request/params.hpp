#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "tgwire/codec/variant.hpp"
#include "tgwire/codec/wire.hpp"
#include "tgwire/core/error.hpp"

namespace tgwire::request {

using json = nlohmann::json;

/// Marks a parameter as not supplied. Absent entries are never emitted.
struct Absent {
    auto operator==(const Absent&) const -> bool = default;
};

inline constexpr Absent absent{};

/// Type-erased payload of a nested record or union value.
class Encodable {
public:
    virtual ~Encodable() = default;
    [[nodiscard]] virtual auto encode() const -> json = 0;
};

template <typename T>
class Holder final : public Encodable {
public:
    explicit Holder(T value) : value_(std::move(value)) {}

    [[nodiscard]] auto encode() const -> json override {
        json j = value_;
        return j;
    }

private:
    T value_;
};

/// A runtime-typed parameter value: absent, null, boolean, integer,
/// floating point, string, nested record, ordered sequence or union value.
class Value {
public:
    enum class Kind {
        Absent,
        Null,
        Boolean,
        Integer,
        Float,
        String,
        Record,
        Sequence,
        Variant,
    };

    using Sequence = std::vector<Value>;

    /// Absent.
    Value() = default;

    static auto null() -> Value;
    static auto boolean(bool b) -> Value;
    static auto integer(std::int64_t i) -> Value;

    /// Throws std::invalid_argument for NaN and infinities, which JSON
    /// cannot represent.
    static auto floating(double d) -> Value;

    static auto string(std::string s) -> Value;

    /// Throws std::invalid_argument if any element is absent.
    static auto sequence(Sequence elements) -> Value;

    template <codec::WireRecord T>
    static auto record(T value) -> Value {
        return Value(Storage{RecordRef{std::make_shared<const Holder<T>>(std::move(value))}});
    }

    template <codec::UnionKind U>
    static auto variant(U value) -> Value {
        return Value(Storage{VariantRef{std::make_shared<const Holder<U>>(std::move(value))}});
    }

    /// Wraps an arbitrary JSON tree: objects become records, arrays
    /// sequences, scalars their matching kind.
    static auto from_json(const json& j) -> Value;

    /// Maps a typed C++ value onto its runtime kind. An empty optional
    /// yields an absent value.
    template <typename T>
    static auto of(const T& value) -> Value;

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(storage_.index()); }
    [[nodiscard]] auto is_absent() const noexcept -> bool { return kind() == Kind::Absent; }

    /// JSON form of the value. Throws std::logic_error when absent.
    [[nodiscard]] auto encode() const -> json;

private:
    struct RecordRef {
        std::shared_ptr<const Encodable> payload;
    };
    struct VariantRef {
        std::shared_ptr<const Encodable> payload;
    };

    // Alternative order mirrors Kind.
    using Storage = std::variant<Absent,
                                 std::nullptr_t,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 RecordRef,
                                 Sequence,
                                 VariantRef>;

    explicit Value(Storage storage) : storage_(std::move(storage)) {}

    static auto json_record(json object) -> Value {
        return Value(Storage{RecordRef{std::make_shared<const Holder<json>>(std::move(object))}});
    }

    Storage storage_;
};

auto kind_to_string(Value::Kind kind) -> std::string_view;

namespace detail {

template <typename>
inline constexpr bool unsupported_parameter_type = false;

} // namespace detail

template <typename T>
auto Value::of(const T& value) -> Value {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else if constexpr (std::is_same_v<T, Absent>) {
        return Value{};
    } else if constexpr (std::is_same_v<T, json>) {
        return from_json(value);
    } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
        return null();
    } else if constexpr (codec::is_optional_v<T>) {
        if (!value.has_value()) {
            return Value{};
        }
        return of(*value);
    } else if constexpr (std::is_same_v<T, bool>) {
        return boolean(value);
    } else if constexpr (std::is_integral_v<T>) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (value > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                throw std::invalid_argument("integer parameter out of range");
            }
        }
        return integer(static_cast<std::int64_t>(value));
    } else if constexpr (std::is_floating_point_v<T>) {
        return floating(static_cast<double>(value));
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return string(std::string(std::string_view(value)));
    } else if constexpr (codec::is_vector_v<T>) {
        Sequence elements;
        elements.reserve(value.size());
        for (const auto& element : value) {
            elements.push_back(of(static_cast<const typename T::value_type&>(element)));
        }
        return sequence(std::move(elements));
    } else if constexpr (codec::is_union_kind_v<T>) {
        return variant(value);
    } else if constexpr (codec::is_wire_record_v<T>) {
        return record(value);
    } else {
        static_assert(detail::unsupported_parameter_type<T>, "type cannot be used as a parameter");
    }
}

/// Field name -> Value. Names are wire names (snake_case). Setting a
/// name to an absent value removes it.
class ParameterMap {
public:
    ParameterMap() = default;

    /// Throws std::invalid_argument for an empty name.
    template <typename T>
    auto set(std::string name, const T& value) -> ParameterMap& {
        return set_value(std::move(name), Value::of(value));
    }

    auto set_value(std::string name, Value value) -> ParameterMap&;

    auto unset(std::string_view name) -> bool;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto get(std::string_view name) const -> const Value*;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    /// A JSON object with one key per present entry.
    [[nodiscard]] auto encode() const -> json;

    /// Builds a map from a JSON object; nulls are kept as explicit nulls.
    static auto from_json(const json& object) -> Result<ParameterMap>;

private:
    std::map<std::string, Value, std::less<>> entries_;
};

} // namespace tgwire::request
