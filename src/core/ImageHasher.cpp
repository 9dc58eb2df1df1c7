#include "ImageHasher.hpp"

namespace PerceptualDedup
{

cv::Mat ImageHasher::toGrayscale(const cv::Mat& img) {
    cv::Mat src = img;

    // 16-bit PNG/TIFF and float images are brought to the 0..255 range first
    if (src.depth() != CV_8U) {
        double scale = 1.0;
        if (src.depth() == CV_16U) scale = 1.0 / 257.0;
        else if (src.depth() == CV_32F || src.depth() == CV_64F) scale = 255.0;
        src.convertTo(src, CV_MAKETYPE(CV_8U, src.channels()), scale);
    }

    cv::Mat gray;
    switch (src.channels()) {
        case 1: gray = src; break;
        case 3: cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw DedupException("unsupported channel count: " + std::to_string(src.channels()));
    }
    return gray;
}

Fingerprint ImageHasher::computeAverageHash(const cv::Mat& img, int hash_size) {
    if (img.empty()) {
        throw DedupException("cannot fingerprint an empty image");
    }
    if (hash_size < 1 || hash_size > MAX_HASH_SIZE) {
        throw DedupException("hash_size must be in [1, " + std::to_string(MAX_HASH_SIZE) +
                             "], got " + std::to_string(hash_size));
    }

    // 1. Convert to Gray, 2. Resize to hash_size x hash_size
    cv::Mat gray = toGrayscale(img);
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(hash_size, hash_size), 0, 0, cv::INTER_AREA);

    // 3. Compute Mean (floating point, integer division would bias the threshold)
    double mean = cv::mean(resized)[0];

    // 4. Compute Bits
    std::vector<std::uint8_t> bits;
    bits.reserve(static_cast<std::size_t>(hash_size) * hash_size);
    for (int i = 0; i < resized.rows; ++i) {
        for (int j = 0; j < resized.cols; ++j) {
            bits.push_back(resized.at<std::uint8_t>(i, j) >= mean ? 1 : 0);
        }
    }
    return Fingerprint::fromBits(bits);
}

} // namespace PerceptualDedup
