#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace castbridge::utils {

class Uuid {
public:
    Uuid() = default;
    explicit Uuid(const std::array<std::uint8_t, 16>& bytes);

    [[nodiscard]] static Uuid generate_v4();

    [[nodiscard]] std::string to_string() const;
    // 32 lowercase hex digits, no dashes; used for media tokens and upload file names
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] const std::array<std::uint8_t, 16>& bytes() const { return m_bytes; }

    bool operator==(const Uuid& other) const { return m_bytes == other.m_bytes; }

private:
    std::array<std::uint8_t, 16> m_bytes{};

    static std::mt19937_64& get_rng();
};

}
