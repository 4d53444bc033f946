#include "castbridge/utils/uuid.hpp"

#include <iomanip>
#include <sstream>

namespace castbridge::utils {

Uuid::Uuid(const std::array<std::uint8_t, 16>& bytes) : m_bytes(bytes) {}

Uuid Uuid::generate_v4() {
    std::array<std::uint8_t, 16> bytes{};
    auto& rng = get_rng();
    std::uniform_int_distribution<std::uint16_t> dist(0, 255);

    for (auto& byte : bytes) {
        byte = static_cast<std::uint8_t>(dist(rng));
    }

    // version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < m_bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<unsigned>(m_bytes[i]);
    }

    return oss.str();
}

std::string Uuid::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : m_bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::mt19937_64& Uuid::get_rng() {
    static thread_local std::mt19937_64 gen([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());
    return gen;
}

}
