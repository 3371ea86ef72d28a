#pragma once

#include <string>

struct ServiceEndpoint {
    std::string url;
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;   // "/" when the URL has none
    bool is_https = false;

    bool operator==(const ServiceEndpoint& other) const {
        return url == other.url;
    }

    // host, plus ":port" when it is not the scheme's default
    std::string authority() const {
        bool default_port = (is_https && port == 443) || (!is_https && port == 80);
        return default_port ? host : host + ":" + std::to_string(port);
    }
};
