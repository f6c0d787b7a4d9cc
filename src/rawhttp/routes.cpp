#include <rawhttp/routes.hpp>
#include <rawhttp/request.hpp>
#include <rawhttp/response.hpp>
#include <rawhttp/status.hpp>
#include <utils/file_utils.hpp>
#include <utils/path_validation.hpp>
#include <iostream>
#include <stdexcept>

void rawhttp::register_routes(Router &router, const std::string &root_path) {
    router.add_route("GET", "/", [](const HTTP_Request &, HTTP_Response &response) {
        response.status(HTTP_STATUS_CODE::OK).send();
    });

    router.add_route("GET", "/echo/:str", [](const HTTP_Request &request, HTTP_Response &response) {
        auto it = request.params.find("str");
        if(it == request.params.end()) {
            response.status(HTTP_STATUS_CODE::NOT_FOUND).send("Nothing to echo");
            return;
        }
        response.status(HTTP_STATUS_CODE::OK).send(it->second);
    });

    router.add_route("GET", "/user-agent", [](const HTTP_Request &request, HTTP_Response &response) {
        auto it = request.headers.find("user_agent");
        if(it != request.headers.end()) {
            response.status(HTTP_STATUS_CODE::OK).send(it->second);
        } else {
            response.status(HTTP_STATUS_CODE::NOT_FOUND).send("No user-agent header found.");
        }
    });

    router.add_route("GET", "/files/:filename", [root_path](const HTTP_Request &request, HTTP_Response &response) {
        auto it = request.params.find("filename");
        if(it != request.params.end()) {
            try {
                std::string file_path = path_validation::validate_file_path(root_path, it->second);
                if(auto content = file_utils::read_file(file_path)) {
                    response.status(HTTP_STATUS_CODE::OK).send(Bytes(content->begin(), content->end()));
                    return;
                }
            } catch(const std::exception &e) {
                std::cerr << "Rejected file request: " << e.what() << std::endl;
            }
        }
        response.status(HTTP_STATUS_CODE::NOT_FOUND).send("File not found");
    });

    router.add_route("POST", "/files/:filename", [root_path](const HTTP_Request &request, HTTP_Response &response) {
        auto it = request.params.find("filename");
        if(it != request.params.end()) {
            try {
                std::string file_path = path_validation::validate_file_path(root_path, it->second);
                file_utils::save_file(file_path, request.body);
                response.status(HTTP_STATUS_CODE::CREATED).send();
                return;
            } catch(const std::exception &e) {
                std::cerr << "Error saving file: " << e.what() << std::endl;
            }
        }
        response.status(HTTP_STATUS_CODE::NOT_FOUND).send("Something went terribly wrong");
    });
}
