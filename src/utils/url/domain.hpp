#pragma once
#include <string>

namespace Spindle {
namespace Utils {

class Domain {
public:
    static bool is_ip_literal(const std::string& host);

    // Number of labels in the public suffix: 1 for "com", 2 for "co.uk".
    static size_t public_suffix_length(const std::string& host);

    // eTLD+1 ("example.co.uk" for "www.example.co.uk"). IP literals, single
    // label hosts and bare public suffixes are returned unchanged.
    static std::string registrable_domain(const std::string& host);
};

}  // namespace Utils
}  // namespace Spindle
