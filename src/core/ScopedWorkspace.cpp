#include "ScopedWorkspace.hpp"
#include "Common.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>
#include <vector>
#include <stdlib.h>

namespace PerceptualDedup
{

ScopedWorkspace::ScopedWorkspace(const std::string& prefix, const fs::path& parent) {
    std::string tmpl = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        throw DedupException("could not create workspace '" + tmpl + "': " + std::strerror(errno));
    }
    m_path = buf.data();

    // mkdtemp already uses 0700; enforce it regardless of platform defaults
    std::error_code ec;
    fs::permissions(m_path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove_all(m_path, ignored);
        throw DedupException("could not restrict workspace permissions: " + ec.message());
    }
}

ScopedWorkspace::~ScopedWorkspace() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        std::cerr << "Warning: could not remove workspace '" << m_path.string() << "': " << ec.message() << std::endl;
    }
}

fs::path ScopedWorkspace::subdir(const std::string& name) const {
    fs::path p = m_path / name;
    fs::create_directories(p);
    return p;
}

} // namespace PerceptualDedup
