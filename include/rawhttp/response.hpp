#ifndef RAWHTTP_RESPONSE_HPP
#define RAWHTTP_RESPONSE_HPP

#include <rawhttp/status.hpp>                   // HTTP_STATUS_CODE
#include <rawhttp/sink.hpp>                     // ByteSink
#include <rawhttp/compression/compressor.hpp>   // Compressor
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rawhttp {
    using Bytes = std::vector<char>;
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    // Written directly when no route matches; carries no headers at all.
    inline constexpr char BARE_NOT_FOUND[] = "HTTP/1.1 404 Not Found\r\n\r\n";

    class HTTP_Response {
    public:
        // `compressor` is the encoding decision for this response; nullptr means identity.
        explicit HTTP_Response(ByteSink &sink, const compression::Compressor *compressor = nullptr);

        HTTP_Response &status(HTTP_STATUS_CODE code);
        // Replaces an existing header of the same name (case-insensitive) in place.
        HTTP_Response &header(const std::string &name, const std::string &value);

        // Terminal: serializes and writes to the sink. Throws std::logic_error if called twice.
        void send();
        void send(const std::string &text);
        void send(const char *text);
        void send(const Bytes &data);
        void send(const nlohmann::json &data);

        std::string to_string() const;

        HTTP_STATUS_CODE status_code() const { return code; }
        const HeaderList &headers() const { return header_list; }
        std::optional<std::string> header_value(const std::string &name) const;
        const std::optional<std::string> &body() const { return payload; }
        bool sent() const { return is_sent; }
    private:
        ByteSink &sink;
        const compression::Compressor *compressor;
        HTTP_STATUS_CODE code = HTTP_STATUS_CODE::NOT_FOUND;
        HeaderList header_list;
        std::optional<std::string> payload;
        bool is_sent = false;

        void finish(std::optional<std::string> body, const char *content_type);
        HeaderList::iterator find_header(const std::string &name);
    };
}
#endif
