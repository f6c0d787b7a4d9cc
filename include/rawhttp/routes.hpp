#ifndef RAWHTTP_ROUTES_HPP
#define RAWHTTP_ROUTES_HPP

#include <rawhttp/router.hpp>
#include <string>

namespace rawhttp {
    // Registers the built-in endpoints: /, /echo/:str, /user-agent and
    // GET/POST /files/:filename served from root_path.
    void register_routes(Router &router, const std::string &root_path);
}

#endif
