#include "agentsync/identifiers.hpp"
#include "agentsync/exceptions.hpp"

#include <cctype>
#include <cstdint>
#include <random>

namespace agentsync::detail {

namespace {

constexpr std::size_t kMaxIdentifierLength = 255;

} // anonymous namespace

std::string random_hex_id() {
    static const char digits[] = "0123456789abcdef";
    thread_local std::mt19937_64 gen(std::random_device{}());

    std::uniform_int_distribution<std::uint64_t> dis;
    std::string out;
    out.reserve(32);
    for (int word = 0; word < 2; ++word) {
        std::uint64_t bits = dis(gen);
        for (int i = 0; i < 16; ++i) {
            out.push_back(digits[bits & 0xF]);
            bits >>= 4;
        }
    }
    return out;
}

void validate_identifier(const std::string& id) {
    if (id.empty()) {
        throw InvalidIdentifierException("Identifier cannot be empty");
    }
    if (id.size() > kMaxIdentifierLength) {
        throw InvalidIdentifierException("Identifier too long: " +
                                         std::to_string(id.size()) + " chars");
    }
    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_') {
            throw InvalidIdentifierException("Identifier contains invalid characters: " + id);
        }
    }
}

} // namespace agentsync::detail
