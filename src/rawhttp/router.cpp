#include <rawhttp/router.hpp>
#include <cctype>
#include <iostream>

void rawhttp::Router::add_route(const std::string &method, const std::string &path_pattern, Handler handler) {
    routes[method].push_back({path_pattern, compile_path_pattern(path_pattern), std::move(handler)});
    std::cout << "Registered route: " << method << " " << path_pattern << std::endl;
}

std::optional<rawhttp::RouteMatch> rawhttp::Router::match(const std::string &method, const std::string &raw_path) const {
    auto method_routes = routes.find(method);
    if(method_routes == routes.end()) {
        return std::nullopt;
    }

    const std::vector<std::string> parts = split_path(raw_path);
    for(const auto &route : method_routes->second) {
        if(route.segments.size() != parts.size()) {
            continue;
        }

        Params params;
        bool matched = true;
        for(size_t i = 0; i < parts.size() && matched; ++i) {
            const PathSegment &segment = route.segments[i];
            const std::string &part = parts[i];
            if(!segment.is_param) {
                matched = (segment.text == part);
                continue;
            }
            // One or more of [A-Za-z0-9_.-], never a bare "." or ".."
            if(part.empty() || part == "." || part == "..") {
                matched = false;
                continue;
            }
            for(char c : part) {
                if(!is_param_char(c)) {
                    matched = false;
                    break;
                }
            }
            if(matched) {
                params[segment.text] = part;
            }
        }

        if(matched) {
            return RouteMatch{route.path_pattern, &route.handler, std::move(params)};
        }
    }
    return std::nullopt;
}

const rawhttp::Handler *rawhttp::Router::find(const std::string &method, const std::string &path) const {
    auto method_routes = routes.find(method);
    if(method_routes == routes.end()) {
        return nullptr;
    }
    for(const auto &route : method_routes->second) {
        if(route.path_pattern == path) {
            return &route.handler;
        }
    }
    return nullptr;
}

bool rawhttp::Router::has_method(const std::string &method) const {
    auto method_routes = routes.find(method);
    return method_routes != routes.end() && !method_routes->second.empty();
}

std::vector<rawhttp::PathSegment> rawhttp::Router::compile_path_pattern(const std::string &path_pattern) {
    std::vector<PathSegment> segments;
    for(const auto &part : split_path(path_pattern)) {
        if(part.size() > 1 && part[0] == ':') {
            segments.push_back({part.substr(1), true});
        } else {
            segments.push_back({part, false});
        }
    }
    return segments;
}

std::vector<std::string> rawhttp::Router::split_path(const std::string &path) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end;
    while((end = path.find('/', start)) != std::string::npos) {
        parts.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    parts.push_back(path.substr(start));
    return parts;
}

bool rawhttp::Router::is_param_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-' || c == '.';
}
