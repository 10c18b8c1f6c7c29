#pragma once
#include <string>
#include <optional>

// Absolute URL split into its parts by libcurl's URL parser. Schemes libcurl
// cannot fetch (udp:// trackers) are accepted.
class Url {
public:
    static std::optional<Url> parse(const std::string& text);

    const std::string& toString() const { return url; }
    const std::string& getScheme() const { return scheme; }
    const std::string& getHost() const { return host; }
    const std::optional<std::string>& getPort() const { return port; }
    const std::string& getPath() const { return path; }
    const std::optional<std::string>& getQuery() const { return query; }

    bool operator==(const Url& other) const { return url == other.url; }
    bool operator!=(const Url& other) const { return url != other.url; }

private:
    Url() = default;

    std::string url;
    std::string scheme;
    std::string host;
    std::optional<std::string> port;
    std::string path;
    std::optional<std::string> query;
};
