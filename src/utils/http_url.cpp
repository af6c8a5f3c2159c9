#include "utils/http_url.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace chunkfetch {

std::string HttpUrl::origin() const {
    std::string out = scheme + "://" + host;
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (!std::regex_match(url, match, re)) {
        return parsed;
    }
    std::string scheme = match[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    int port = scheme == "https" ? 443 : 80;
    if (match[3].matched) {
        try {
            port = std::stoi(match[3].str());
        } catch (const std::out_of_range&) {
            return parsed;
        }
        if (port <= 0 || port > 65535) {
            return parsed;
        }
    }

    parsed.scheme = std::move(scheme);
    parsed.host = match[2].str();
    parsed.port = port;
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

bool isHttpScheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}  // namespace chunkfetch
