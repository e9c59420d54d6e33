#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "tgwire/codec/wire.hpp"
#include "tgwire/core/error.hpp"
#include "tgwire/core/logger.hpp"

namespace tgwire::codec {

/// Closed, untagged union over a fixed, ordered list of alternatives.
///
/// Each union kind derives from this template (CRTP) and provides
///   static constexpr std::string_view kind_name;
///   static constexpr std::array<std::string_view, N> alternative_names;
/// The order of `Alternatives...` is the order in which decode attempts
/// candidates: the first one that decodes wins.
///
/// Exactly one alternative is held at all times. A default constructed
/// union holds a value-initialised first alternative.
template <typename Kind, typename... Alternatives>
class Union {
    static_assert(sizeof...(Alternatives) >= 2, "a union kind needs at least two alternatives");

public:
    using variant_type = std::variant<Alternatives...>;
    static constexpr std::size_t alternative_count = sizeof...(Alternatives);

    Union() = default;

    /// Converting constructor: picks the alternative the same way
    /// std::variant does, so `ChatId{42}` holds an integer and
    /// `ChatId{"@channel"}` a string.
    template <typename T>
        requires (!std::derived_from<std::remove_cvref_t<T>, Union>)
              && std::constructible_from<variant_type, T&&>
    Union(T&& value) : value_(std::forward<T>(value)) {}

    template <std::size_t I, typename... Args>
    explicit Union(std::in_place_index_t<I> index, Args&&... args)
        : value_(index, std::forward<Args>(args)...) {}

    template <typename T>
    [[nodiscard]] auto holds() const noexcept -> bool {
        return std::holds_alternative<T>(value_);
    }

    /// Projects out alternative `T`; nullopt when another one is held.
    template <typename T>
    [[nodiscard]] auto get() const -> std::optional<T> {
        if (const auto* p = std::get_if<T>(&value_)) {
            return *p;
        }
        return std::nullopt;
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&value_);
    }

    [[nodiscard]] auto index() const noexcept -> std::size_t { return value_.index(); }
    [[nodiscard]] auto value() const noexcept -> const variant_type& { return value_; }

    [[nodiscard]] auto alternative_name() const -> std::string_view {
        return Kind::alternative_names[value_.index()];
    }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), value_);
    }

    friend auto operator==(const Union& a, const Union& b) -> bool {
        return a.value_ == b.value_;
    }

private:
    variant_type value_;
};

template <typename T>
concept UnionKind = requires {
    typename T::variant_type;
    { T::kind_name } -> std::convertible_to<std::string_view>;
    T::alternative_names;
} && std::variant_size_v<typename T::variant_type> == std::size(T::alternative_names);

template <typename T>
inline constexpr bool is_union_kind_v = UnionKind<T>;

// ---------------------------------------------------------------------------
// Ordered trial decoder
// ---------------------------------------------------------------------------

/// Error reported when no candidate of `kind_name` accepts `raw`.
auto kind_not_recognized(std::string_view kind_name, const json& raw) -> Error;

namespace detail {

template <typename T>
auto try_candidate(const json& j) -> std::optional<T> {
    try {
        return decode_value<T>(j);
    } catch (const DecodeError& e) {
        LOG_TRACE("candidate rejected: {}", e.what());
    } catch (const json::exception& e) {
        LOG_TRACE("candidate rejected: {}", e.what());
    }
    return std::nullopt;
}

template <UnionKind U, std::size_t I = 0>
auto trial_decode(const json& j) -> std::optional<U> {
    using V = typename U::variant_type;
    if constexpr (I == std::variant_size_v<V>) {
        return std::nullopt;
    } else {
        using Candidate = std::variant_alternative_t<I, V>;
        if (auto decoded = try_candidate<Candidate>(j)) {
            LOG_TRACE("{} resolved to {}", U::kind_name, U::alternative_names[I]);
            return U(std::in_place_index<I>, std::move(*decoded));
        }
        return trial_decode<U, I + 1>(j);
    }
}

} // namespace detail

/// Resolves an untagged union field by trying the kind's candidates in
/// declared order and committing to the first that decodes. Fails with
/// ErrorCode::KindNotRecognized when none does.
template <UnionKind U>
auto decode_union(const json& j) -> Result<U> {
    if (auto resolved = detail::trial_decode<U>(j)) {
        return std::move(*resolved);
    }
    return std::unexpected(kind_not_recognized(U::kind_name, j));
}

// ---------------------------------------------------------------------------
// Variant encoder
// ---------------------------------------------------------------------------

/// Serializes the held alternative as-is: no tag, no wrapper.
template <UnionKind U>
auto encode_union(const U& u) -> json {
    return u.visit([](const auto& alternative) -> json {
        json j = alternative;
        return j;
    });
}

} // namespace tgwire::codec

namespace nlohmann {

template <typename U>
struct adl_serializer<U, std::enable_if_t<tgwire::codec::is_union_kind_v<U>>> {
    static auto from_json(const json& j) -> U {
        auto result = tgwire::codec::decode_union<U>(j);
        if (!result) {
            throw tgwire::DecodeError(std::move(result.error()));
        }
        return std::move(*result);
    }

    static void to_json(json& j, const U& u) {
        j = tgwire::codec::encode_union(u);
    }
};

} // namespace nlohmann
