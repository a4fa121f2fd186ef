#pragma once
#include <cstdint>
#include <optional>

namespace swarmauth::protocol::canonical {

/**
 * Message namespace of a request: unspecified, a number, or every namespace.
 *
 * Signed messages omit the default namespace (unspecified or 0) while the
 * request body still carries it.
 */
class Namespace {
public:
    enum class Kind : uint8_t {
        Default,
        Number,
        All
    };

    [[nodiscard]] static constexpr Namespace Default() noexcept {
        return Namespace(Kind::Default, 0);
    }

    [[nodiscard]] static constexpr Namespace Number(const int32_t value) noexcept {
        return Namespace(Kind::Number, value);
    }

    [[nodiscard]] static constexpr Namespace All() noexcept {
        return Namespace(Kind::All, 0);
    }

    [[nodiscard]] constexpr Kind GetKind() const noexcept { return kind_; }

    [[nodiscard]] constexpr bool IsAll() const noexcept { return kind_ == Kind::All; }

    /// Unspecified and explicit zero sign identically
    [[nodiscard]] constexpr bool IsDefault() const noexcept {
        return kind_ == Kind::Default || (kind_ == Kind::Number && value_ == 0);
    }

    /// Effective numeric namespace; nullopt for All
    [[nodiscard]] constexpr std::optional<int32_t> GetNumber() const noexcept {
        if (kind_ == Kind::All) {
            return std::nullopt;
        }
        return value_;
    }

    [[nodiscard]] constexpr bool operator==(const Namespace& other) const noexcept {
        return kind_ == other.kind_ && value_ == other.value_;
    }

private:
    constexpr Namespace(const Kind kind, const int32_t value) noexcept
        : kind_(kind), value_(value) {}

    Kind kind_;
    int32_t value_;
};

}
