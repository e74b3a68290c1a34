#pragma once
#include <string>
#include <vector>

#include "spindle/link_extractor.hpp"

namespace Spindle {
namespace Utils {
namespace Text {

// href values of <a> and <area> elements, in document order.
class HtmlLinkExtractor : public LinkExtractor {
public:
    std::vector<std::string> extract_links(const std::string& body) const override;
};

}  // namespace Text
}  // namespace Utils
}  // namespace Spindle
