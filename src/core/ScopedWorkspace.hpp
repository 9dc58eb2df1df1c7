#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace PerceptualDedup
{
    /**
     * @brief Owner-only temporary directory that lives exactly as long as this object.
     *
     * Created with mkdtemp (mode 0700) under the given parent, the system temp
     * directory by default, and removed recursively by the destructor,
     * whichever way the run ends.
     */
    class ScopedWorkspace {
    public:
        explicit ScopedWorkspace(const std::string& prefix = "dedup_",
                                 const fs::path& parent = fs::temp_directory_path());
        ~ScopedWorkspace();

        ScopedWorkspace(const ScopedWorkspace&) = delete;
        ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

        [[nodiscard]] const fs::path& path() const { return m_path; }

        // Creates (if needed) and returns a subdirectory of the workspace.
        fs::path subdir(const std::string& name) const;

    private:
        fs::path m_path;
    };

} // namespace PerceptualDedup
