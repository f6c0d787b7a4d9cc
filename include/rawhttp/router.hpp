#ifndef RAWHTTP_ROUTER_HPP
#define RAWHTTP_ROUTER_HPP

#include <rawhttp/request.hpp>      // HTTP_Request, Params
#include <functional>               // std::function
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rawhttp {
    class HTTP_Response;

    using Handler = std::function<void(const HTTP_Request &, HTTP_Response &)>;

    struct PathSegment {
        std::string text;           // literal text, or the parameter name without ':'
        bool is_param;
    };

    struct Route {
        std::string path_pattern;
        std::vector<PathSegment> segments;
        Handler handler;
    };

    struct RouteMatch {
        std::string path_pattern;
        const Handler *handler;
        Params params;
    };

    class Router {
        private:
            std::map<std::string, std::vector<Route>> routes;
        public:
            void add_route(const std::string &method, const std::string &path_pattern, Handler handler);

            // First registered pattern matching raw_path wins.
            std::optional<RouteMatch> match(const std::string &method, const std::string &raw_path) const;

            // Exact lookup of a pattern string, as produced by match().
            const Handler *find(const std::string &method, const std::string &path) const;

            bool has_method(const std::string &method) const;

            static std::vector<PathSegment> compile_path_pattern(const std::string &path_pattern);
            static std::vector<std::string> split_path(const std::string &path);
            static bool is_param_char(char c);
    };
}

#endif
