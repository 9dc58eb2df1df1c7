#include "FileSystemTool.hpp"
#include "Common.h"
#include <iostream>
#include <algorithm>
#include <system_error>
#include <iterator>

namespace PerceptualDedup
{

bool FSETool::pathContains(const std::string& parent_path, const std::string& child_path) {
    std::error_code ec;
    fs::path parent = fs::weakly_canonical(fs::absolute(parent_path), ec);
    if (ec) return false;
    fs::path child = fs::weakly_canonical(fs::absolute(child_path), ec);
    if (ec) return false;

    auto [it_p, it_c] = std::mismatch(parent.begin(), parent.end(), child.begin(), child.end());
    return it_p == parent.end() || (std::next(it_p) == parent.end() && it_p->empty());
}

bool FSETool::createDirectory(const std::string& dirpath) {
    try {
        if (fs::exists(dirpath)) return fs::is_directory(dirpath);
        fs::create_directories(dirpath);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: could not create directory '" << dirpath << "': " << e.what() << std::endl;
        return false;
    }
}

std::string FSETool::toAbsolutePath(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    return ec ? path : abs.lexically_normal().string();
}

std::vector<std::string> FSETool::getImagesList(const std::string& directory,
                                                const std::vector<std::string>& extensions,
                                                bool recursive) {
    std::vector<std::string> images;
    std::string dir_abs = toAbsolutePath(directory);
    if (!fs::is_directory(dir_abs)) {
        throw DedupException("input directory not found: " + directory);
    }

    const std::vector<std::string> exts = normalize_extensions(extensions);
    auto check = [&](const fs::path& p) {
        std::string ext = to_lower(p.extension().string());
        return std::find(exts.begin(), exts.end(), ext) != exts.end();
    };

    if (recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(dir_abs))
            if (entry.is_regular_file() && check(entry.path())) images.push_back(entry.path().string());
    } else {
        for (const auto& entry : fs::directory_iterator(dir_abs))
            if (entry.is_regular_file() && check(entry.path())) images.push_back(entry.path().string());
    }

    // Directory iteration order is unspecified; classification is order sensitive
    std::sort(images.begin(), images.end());
    return images;
}

std::uintmax_t FSETool::totalSize(const std::vector<std::string>& files) {
    std::uintmax_t total = 0;
    for (const auto& f : files) {
        std::error_code ec;
        auto sz = fs::file_size(f, ec);
        if (!ec) total += sz;
    }
    return total;
}

fs::path FSETool::copyPreservingStructure(const fs::path& file,
                                          const fs::path& src_root,
                                          const fs::path& dest_root) {
    fs::path rel = file.lexically_relative(src_root);
    if (rel.empty() || *rel.begin() == "..") {
        throw DedupException("'" + file.string() + "' is not inside '" + src_root.string() + "'");
    }

    fs::path dest = dest_root / rel;
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        throw DedupException("could not create '" + dest.parent_path().string() + "': " + ec.message());
    }
    fs::copy_file(file, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw DedupException("could not copy '" + file.string() + "': " + ec.message());
    }
    return dest;
}

} // namespace PerceptualDedup
