#include "Fingerprint.hpp"
#include "Common.h"

namespace PerceptualDedup
{

Fingerprint Fingerprint::fromBits(const std::vector<std::uint8_t>& bits) {
    Fingerprint fp;
    fp.m_bitCount = bits.size();
    fp.m_words.assign((bits.size() + 63) / 64, 0);
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            fp.m_words[i / 64] |= (1ULL << (i % 64));
        }
    }
    return fp;
}

bool Fingerprint::bit(std::size_t index) const {
    if (index >= m_bitCount) {
        throw std::out_of_range("Fingerprint bit index " + std::to_string(index) +
                                " out of range (" + std::to_string(m_bitCount) + " bits)");
    }
    return (m_words[index / 64] >> (index % 64)) & 1ULL;
}

std::string Fingerprint::toHex() const {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve((m_bitCount + 3) / 4);

    for (std::size_t i = 0; i < m_bitCount; i += 4) {
        int nibble = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            nibble <<= 1;
            // Trailing group of a non multiple-of-4 length is zero padded
            if (i + j < m_bitCount && bit(i + j)) nibble |= 1;
        }
        out.push_back(digits[nibble]);
    }
    return out;
}

bool Fingerprint::operator==(const Fingerprint& other) const {
    return m_bitCount == other.m_bitCount && m_words == other.m_words;
}

int hammingDistance(const Fingerprint& a, const Fingerprint& b) {
    if (a.size() != b.size()) {
        throw LengthMismatchException(a.size(), b.size());
    }

    const auto& wa = a.words();
    const auto& wb = b.words();
    int dist = 0;
    for (std::size_t i = 0; i < wa.size(); ++i) {
        std::uint64_t x = wa[i] ^ wb[i];
        // Kernighan: clear the lowest set bit each round
        while (x) {
            dist++;
            x &= x - 1;
        }
    }
    return dist;
}

} // namespace PerceptualDedup
