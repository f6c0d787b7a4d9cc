#ifndef RAWHTTP_REQUEST_HPP
#define RAWHTTP_REQUEST_HPP

#include <string>
#include <map>

namespace rawhttp {
    class Router;

    using Params = std::map<std::string, std::string>;
    using Headers = std::map<std::string, std::string>;

    struct HTTP_Request {
        std::string method;
        std::string path;       // matched route pattern, or the raw path when nothing matched
        std::string raw_path;
        std::string version;
        Params params;
        Headers headers;        // keys are lower-case with '-' mapped to '_'
        std::string body;
    };

    // "User-Agent" -> "user_agent"
    std::string normalize_header_name(const std::string &name);

    // Never throws on malformed input; bad request lines simply miss every route.
    HTTP_Request parse_request(const std::string &raw, const Router &router);
}

#endif
