#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

namespace PerceptualDedup
{
    class FSETool {
    public:
        static bool pathContains(const std::string& parent_path, const std::string& child_path);

        static bool createDirectory(const std::string& dirpath);

        static std::string toAbsolutePath(const std::string& path);

        // Regular files whose lower-cased extension is in `extensions`
        // (empty list = SUPPORTED_IMG_FORMATS), sorted by path.
        static std::vector<std::string> getImagesList(const std::string& directory,
                                                      const std::vector<std::string>& extensions = {},
                                                      bool recursive = true);

        static std::uintmax_t totalSize(const std::vector<std::string>& files);

        /**
         * @brief Copies `file` below `dest_root` at its path relative to `src_root`.
         * @return Destination path.
         * @throws DedupException if `file` is not inside `src_root` or the copy fails.
         */
        static fs::path copyPreservingStructure(const fs::path& file,
                                                const fs::path& src_root,
                                                const fs::path& dest_root);
    };

} // namespace PerceptualDedup
