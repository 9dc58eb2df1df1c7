#pragma once

#include "Common.h"
#include "Fingerprint.hpp"
#include <opencv2/opencv.hpp>

namespace PerceptualDedup
{
    class ImageHasher {
    public:
        /**
         * @brief aHash (Average Hash) of a decoded image.
         *
         * Grayscale, area-resample to hash_size x hash_size, then one bit per
         * cell in row-major order: 1 if the cell is >= the mean intensity.
         *
         * @param img Decoded image, 1, 3 or 4 channels (BGR/BGRA order as from cv::imread).
         * @param hash_size Grid side length; the result has hash_size * hash_size bits.
         * @throws DedupException for an empty image or an out of range hash_size.
         */
        static Fingerprint computeAverageHash(const cv::Mat& img, int hash_size = HASH_SIZE);

    private:
        static cv::Mat toGrayscale(const cv::Mat& img);
    };

} // namespace PerceptualDedup
