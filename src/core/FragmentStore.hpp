#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

// One file per module under the templates dir, <name>.js
class CFragmentStore {
  public:
    explicit CFragmentStore(const std::string& dir);

    // Alphanumerics plus a few separators. No paths, no dotfiles, no quotes.
    static bool                      validName(const std::string& name);

    std::string                      pathFor(const std::string& name) const;
    bool                             exists(const std::string& name) const;
    std::optional<std::string>       read(const std::string& name) const;

    // overwrites. Callers decide whether an existing fragment may be replaced.
    std::expected<void, std::string> write(const std::string& name, const std::string& content);

    // names with a fragment, sorted
    std::vector<std::string>         list() const;

    // creates the directory if missing
    std::expected<void, std::string> ensureExists() const;

    const std::string&               dir() const;

  private:
    std::string m_dir;
};
