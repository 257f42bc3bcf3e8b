#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

// mkdtemp'd directory, removed with everything in it on destruction
class CTempDir {
  public:
    CTempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "mmconf-test-XXXXXX").string();
        if (mkdtemp(tmpl.data()))
            m_path = tmpl;
    }

    ~CTempDir() {
        std::error_code ec;
        if (!m_path.empty())
            std::filesystem::remove_all(m_path, ec);
    }

    CTempDir(const CTempDir&) = delete;

    std::string path(const std::string& rel = "") const {
        return rel.empty() ? m_path : (std::filesystem::path(m_path) / rel).string();
    }

    void write(const std::string& rel, const std::string& content) const {
        const auto P = std::filesystem::path(path(rel));
        std::filesystem::create_directories(P.parent_path());
        std::ofstream of(P, std::ios::trunc | std::ios::binary);
        of << content;
    }

  private:
    std::string m_path;
};
