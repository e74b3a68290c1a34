#include "domain.hpp"
#include <algorithm>
#include <unordered_set>
#include <vector>

namespace Spindle {
namespace Utils {

namespace {

// Common multi-label suffixes; everything else is treated as a one-label TLD.
const std::unordered_set<std::string>& multi_label_suffixes() {
    static const std::unordered_set<std::string> suffixes = {
        "co.uk",  "ac.uk",  "gov.uk", "org.uk",  "sch.uk", "me.uk",  "com.au", "net.au",
        "org.au", "edu.au", "gov.au", "co.jp",   "ne.jp",  "or.jp",  "ac.jp",  "go.jp",
        "co.nz",  "org.nz", "govt.nz", "ac.nz",  "com.br", "net.br", "org.br", "gov.br",
        "com.cn", "net.cn", "org.cn", "gov.cn",  "co.in",  "co.za",  "com.mx", "com.tr",
        "github.io", "blogspot.com", "herokuapp.com"};
    return suffixes;
}

std::vector<std::string> split_labels(const std::string& host) {
    std::vector<std::string> out;
    size_t                   start = 0;
    while (true) {
        size_t dot = host.find('.', start);
        out.emplace_back(host.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return out;
}

bool is_ipv4(const std::string& host) {
    int    dots   = 0;
    size_t digits = 0;
    for (char c : host) {
        if (c == '.') {
            if (digits == 0)
                return false;
            ++dots;
            digits = 0;
        }
        else if (c >= '0' && c <= '9') {
            if (++digits > 3)
                return false;
        }
        else {
            return false;
        }
    }
    return dots == 3 && digits > 0;
}

}  // namespace

bool Domain::is_ip_literal(const std::string& host) {
    if (!host.empty() && host.front() == '[' && host.back() == ']')
        return true;
    return is_ipv4(host);
}

size_t Domain::public_suffix_length(const std::string& host) {
    if (host.empty() || is_ip_literal(host))
        return 0;

    for (const auto& suffix : multi_label_suffixes()) {
        if (host.size() > suffix.size()
            && host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0
            && host[host.size() - suffix.size() - 1] == '.') {
            return static_cast<size_t>(std::count(suffix.begin(), suffix.end(), '.')) + 1;
        }
        if (host == suffix)
            return static_cast<size_t>(std::count(suffix.begin(), suffix.end(), '.')) + 1;
    }
    return 1;
}

std::string Domain::registrable_domain(const std::string& host) {
    if (is_ip_literal(host))
        return host;

    auto   labels = split_labels(host);
    size_t ps_len = public_suffix_length(host);
    if (ps_len == 0 || labels.size() <= ps_len)
        return host;

    size_t      start = labels.size() - (ps_len + 1);
    std::string out   = labels[start];
    for (size_t i = start + 1; i < labels.size(); ++i) {
        out += '.';
        out += labels[i];
    }
    return out;
}

}  // namespace Utils
}  // namespace Spindle
