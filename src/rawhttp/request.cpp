#include <rawhttp/request.hpp>
#include <rawhttp/router.hpp>
#include <vector>
#include <cctype>
#include <algorithm>       // std::transform

std::string rawhttp::normalize_header_name(const std::string &name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return normalized;
}

rawhttp::HTTP_Request rawhttp::parse_request(const std::string &raw, const Router &router) {
    HTTP_Request request;

    // Split into CRLF-delimited lines
    std::vector<std::string> lines;
    size_t start = 0;
    size_t end;
    while((end = raw.find("\r\n", start)) != std::string::npos) {
        lines.push_back(raw.substr(start, end - start));
        start = end + 2;
    }
    lines.push_back(raw.substr(start));

    {
        // Request line: METHOD SP PATH SP VERSION
        const std::string &request_line = lines[0];
        std::vector<std::string> tokens;
        size_t token_start = 0;
        size_t token_end;
        while((token_end = request_line.find(' ', token_start)) != std::string::npos) {
            tokens.push_back(request_line.substr(token_start, token_end - token_start));
            token_start = token_end + 1;
        }
        tokens.push_back(request_line.substr(token_start));

        request.method = tokens[0];
        if(tokens.size() > 1) request.raw_path = tokens[1];
        if(tokens.size() > 2) request.version = tokens[2];
    }

    // The header block ends at the first blank line; without one every line
    // between the request line and the last line is a header.
    size_t sep = raw.find("\r\n\r\n");
    size_t header_end = lines.size() - 1;
    if(sep != std::string::npos) {
        request.body = raw.substr(sep + 4);
        header_end = static_cast<size_t>(std::find(lines.begin() + 1, lines.end(), std::string()) - lines.begin());
    } else if(lines.size() > 1) {
        request.body = lines.back();
    }

    for(size_t i = 1; i < header_end; ++i) {
        const std::string &line = lines[i];
        size_t colon = line.find(':');
        if(colon == std::string::npos || colon == 0) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        if(!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
        request.headers[normalize_header_name(line.substr(0, colon))] = value;
    }

    request.path = request.raw_path;
    if(auto match = router.match(request.method, request.raw_path)) {
        request.params = std::move(match->params);
        request.path = match->path_pattern;
    }

    return request;
}
