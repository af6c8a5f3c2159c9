#pragma once

#include <string>

namespace chunkfetch {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;

    bool valid() const { return !scheme.empty() && !host.empty(); }
    // scheme://host:port, the form httplib::Client accepts
    std::string origin() const;
};

// Parse scheme://host[:port][/path]. Returns an invalid HttpUrl on mismatch.
HttpUrl parseUrl(const std::string& url);

bool isHttpScheme(const std::string& scheme);

std::string trimTrailingSlash(std::string value);

}  // namespace chunkfetch
