#include "ImageLoader.hpp"
#include "ImageHasher.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <future>
#include <thread>
#include <system_error>
#include <utility>
#include <opencv2/opencv.hpp>

namespace PerceptualDedup
{

ImageLoader::ImageLoader(LoaderOptions options, ItemLoader itemLoader)
    : m_options(options), m_itemLoader(std::move(itemLoader))
{
    if (m_options.workers == 0) m_options.workers = 1;
}

ImageRecord ImageLoader::load(const std::string& path) const {
    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return ImageRecord::failed(path, 0, SkipReason::Unreadable, ec.message());
    }
    if (size > m_options.maxImageSize) {
        return ImageRecord::failed(path, size, SkipReason::Oversize,
                                   "File too large (" + std::to_string(size) + " bytes, limit " +
                                   std::to_string(m_options.maxImageSize) + ")");
    }
    if (size == 0) {
        return ImageRecord::failed(path, size, SkipReason::DecodeFailure, "Empty file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ImageRecord::failed(path, size, SkipReason::Unreadable, "Could not open file");
    }
    std::vector<uchar> buffer(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (file.gcount() != static_cast<std::streamsize>(buffer.size())) {
        return ImageRecord::failed(path, size, SkipReason::Unreadable, "Short read");
    }

    try {
        cv::Mat img = cv::imdecode(buffer, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
        if (img.empty()) {
            return ImageRecord::failed(path, size, SkipReason::DecodeFailure, "Invalid or corrupted image");
        }
        return ImageRecord::withFingerprint(path, size, ImageHasher::computeAverageHash(img, m_options.hashSize));
    } catch (const cv::Exception& e) {
        return ImageRecord::failed(path, size, SkipReason::DecodeFailure, e.what());
    }
}

ImageRecord ImageLoader::loadItem(const std::string& path) const {
    return m_itemLoader ? m_itemLoader(path) : load(path);
}

std::vector<ImageRecord> ImageLoader::loadBatch(const std::vector<std::string>& paths) const {
    if (m_options.itemTimeout.count() > 0) {
        return loadWithDeadline(paths);
    }
    return loadStriped(paths);
}

// Thread t handles indices t, t + n, t + 2n, ... and writes only its own slots.
std::vector<ImageRecord> ImageLoader::loadStriped(const std::vector<std::string>& paths) const {
    std::vector<ImageRecord> results(paths.size());
    const unsigned num_threads = static_cast<unsigned>(
        std::min<std::size_t>(m_options.workers, std::max<std::size_t>(paths.size(), 1)));

    if (num_threads <= 1) {
        for (std::size_t i = 0; i < paths.size(); ++i) results[i] = loadItem(paths[i]);
        return results;
    }

    std::vector<std::exception_ptr> errors(num_threads);
    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (unsigned t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            try {
                for (std::size_t i = t; i < paths.size(); i += num_threads) {
                    results[i] = loadItem(paths[i]);
                }
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }
    for (auto& th : threads) th.join();

    for (const auto& err : errors) {
        if (err) std::rethrow_exception(err);
    }
    return results;
}

std::vector<ImageRecord> ImageLoader::loadWithDeadline(const std::vector<std::string>& paths) const {
    std::vector<ImageRecord> results(paths.size());
    // Futures from std::async join on destruction, so anything left here is
    // waited for when this function returns
    std::vector<std::future<ImageRecord>> abandoned;

    const std::size_t workers = m_options.workers;
    std::size_t next = 0;
    while (next < paths.size()) {
        // A timed-out task holds its worker slot until it returns
        abandoned.erase(std::remove_if(abandoned.begin(), abandoned.end(),
                                       [](const std::future<ImageRecord>& f) {
                                           return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                       }),
                        abandoned.end());
        if (abandoned.size() >= workers) {
            abandoned.front().wait();
            abandoned.erase(abandoned.begin());
            continue;
        }

        const std::size_t start = next;
        const std::size_t end = std::min(paths.size(), start + (workers - abandoned.size()));

        std::vector<std::future<ImageRecord>> inflight;
        std::vector<std::chrono::steady_clock::time_point> deadlines;
        for (std::size_t i = start; i < end; ++i) {
            deadlines.push_back(std::chrono::steady_clock::now() + m_options.itemTimeout);
            inflight.push_back(std::async(std::launch::async, [this, path = paths[i]]() { return loadItem(path); }));
        }

        for (std::size_t k = 0; k < inflight.size(); ++k) {
            const std::size_t i = start + k;
            if (inflight[k].wait_until(deadlines[k]) == std::future_status::ready) {
                results[i] = inflight[k].get();
            } else {
                std::error_code ec;
                std::uintmax_t size = fs::file_size(paths[i], ec);
                results[i] = ImageRecord::failed(paths[i], ec ? 0 : size, SkipReason::Timeout,
                                                 "Processing exceeded " +
                                                 std::to_string(m_options.itemTimeout.count()) + " ms");
                abandoned.push_back(std::move(inflight[k]));
            }
        }
        next = end;
    }
    return results;
}

} // namespace PerceptualDedup
