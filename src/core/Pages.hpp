#pragma once

#include <optional>
#include <string>
#include <vector>

struct SPage {
    std::string              id; // PAGE1, PAGE2, ...
    std::string              description;
    std::vector<std::string> modules;
};

// Reads the page layout out of the MMM-pages block of a config, e.g.
//   ["clock", "weather"],   // PAGE1 - Weather page
namespace NPages {
    std::vector<SPage> parse(const std::string& document, const std::string& pagesModule = "MMM-pages", const std::string& keyword = "module");

    // pages that list module
    std::vector<SPage> pagesWith(const std::vector<SPage>& pages, const std::string& module);

    /*
        Edits on the MMM-pages fragment itself. Only the page lines are
        touched, everything else comes back byte for byte.
    */

    // appends module to the list of pageId. nullopt if there's no such page.
    std::optional<std::string> addToPage(const std::string& fragment, const std::string& pageId, const std::string& module);

    // PAGE<highest + 1>
    std::string                nextPageId(const std::string& fragment);

    // new last page holding only module. nullopt if the modules array can't be found.
    std::optional<std::string> addPage(const std::string& fragment, const std::string& module, const std::string& description);

    // drops module from every page that lists it
    std::string                removeFromPages(const std::string& fragment, const std::string& module);
};
