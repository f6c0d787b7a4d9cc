#ifndef RAWHTTP_STATUS_HPP
#define RAWHTTP_STATUS_HPP

namespace rawhttp {
    enum class HTTP_STATUS_CODE{
        OK                      = 200,
        CREATED                 = 201,
        NOT_FOUND               = 404,
    };

    // Reason phrase for the status line, e.g. "Not Found"
    const char *reason_phrase(HTTP_STATUS_CODE code);
}

#endif
