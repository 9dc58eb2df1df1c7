#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace PerceptualDedup
{
    /**
     * @brief Fixed-length bit sequence summarizing coarse luminance structure.
     *
     * Bits are stored row-major, packed into 64-bit words (bit i lives in
     * word i / 64 at position i % 64). A Fingerprint never changes after
     * construction.
     */
    class Fingerprint {
    public:
        Fingerprint() = default;

        // Each element is treated as one bit: zero -> 0, anything else -> 1.
        static Fingerprint fromBits(const std::vector<std::uint8_t>& bits);

        [[nodiscard]] std::size_t size() const { return m_bitCount; }
        [[nodiscard]] bool empty() const { return m_bitCount == 0; }
        [[nodiscard]] bool bit(std::size_t index) const;
        [[nodiscard]] const std::vector<std::uint64_t>& words() const { return m_words; }

        // Hex text, four bits per digit, first bit is the most significant.
        [[nodiscard]] std::string toHex() const;

        bool operator==(const Fingerprint& other) const;
        bool operator!=(const Fingerprint& other) const { return !(*this == other); }

    private:
        std::size_t m_bitCount{0};
        std::vector<std::uint64_t> m_words;
    };

    /**
     * @brief Hamming distance: number of bit positions where a and b differ.
     * @throws LengthMismatchException if a.size() != b.size()
     */
    int hammingDistance(const Fingerprint& a, const Fingerprint& b);

} // namespace PerceptualDedup
