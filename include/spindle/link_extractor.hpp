#pragma once
#include <string>
#include <vector>

namespace Spindle {

// Best effort: malformed markup yields a partial or empty list, never a throw.
class LinkExtractor {
public:
    virtual ~LinkExtractor() = default;

    virtual std::vector<std::string> extract_links(const std::string& body) const = 0;
};

}  // namespace Spindle
