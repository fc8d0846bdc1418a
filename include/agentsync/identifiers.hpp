#pragma once

#include "agentsync/types.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace agentsync {

namespace detail {

// Random 128-bit value rendered as 32 lowercase hex digits
std::string random_hex_id();

// Throws InvalidIdentifierException unless `id` is 1-255 chars of
// alphanumerics, '-' or '_'
void validate_identifier(const std::string& id);

} // namespace detail

// Opaque string identifier; Tag distinguishes agent, conflict and task ids.
template <typename Tag>
class Identifier {
public:
    Identifier() = default;
    explicit Identifier(std::string value) : value_(std::move(value)) {}

    static Identifier validated(std::string value) {
        detail::validate_identifier(value);
        return Identifier(std::move(value));
    }

    // "<prefix>-<32 hex digits>"
    static Identifier generate() {
        return Identifier(std::string(Tag::prefix) + "-" + detail::random_hex_id());
    }

    const std::string& str() const noexcept { return value_; }
    bool empty() const noexcept { return value_.empty(); }

    friend bool operator==(const Identifier& a, const Identifier& b) { return a.value_ == b.value_; }
    friend bool operator!=(const Identifier& a, const Identifier& b) { return a.value_ != b.value_; }
    friend bool operator<(const Identifier& a, const Identifier& b) { return a.value_ < b.value_; }

    friend std::ostream& operator<<(std::ostream& os, const Identifier& id) {
        return os << id.value_;
    }

private:
    std::string value_;
};

struct AgentIdTag    { static constexpr const char* prefix = "agent"; };
struct ConflictIdTag { static constexpr const char* prefix = "conflict"; };
struct TaskIdTag     { static constexpr const char* prefix = "task"; };

using AgentId    = Identifier<AgentIdTag>;
using ConflictId = Identifier<ConflictIdTag>;
using TaskId     = Identifier<TaskIdTag>;

template <typename Tag>
void to_json(Json& j, const Identifier<Tag>& id) {
    j = id.str();
}

template <typename Tag>
void from_json(const Json& j, Identifier<Tag>& id) {
    id = Identifier<Tag>(j.get<std::string>());
}

} // namespace agentsync

namespace std {

template <typename Tag>
struct hash<agentsync::Identifier<Tag>> {
    std::size_t operator()(const agentsync::Identifier<Tag>& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

} // namespace std
