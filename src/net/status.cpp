#include <pagescope/net/status.h>

namespace pagescope::net {

const char* reason_phrase(int status_code) {
    switch (status_code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non-Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Request Entity Too Large";
        case 414: return "Request URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Requested Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 418: return "I'm a teapot";
        case 421: return "Misdirected Request";
        case 422: return "Unprocessable Entity";
        case 425: return "Too Early";
        case 426: return "Upgrade Required";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        case 511: return "Network Authentication Required";
        default:  return "";
    }
}

std::string describe_status(int status_code, std::string_view reason) {
    switch (status_code) {
        case 400:
            return "Bad Request: The server could not understand the request.";
        case 401:
            return "Unauthorized: The page requires authentication.";
        case 403:
            return "Forbidden: Access to this page is not allowed.";
        case 404:
            return "Page Not Found: The requested page does not exist on the server.";
        case 405:
            return "Method Not Allowed: The server does not allow GET requests for this page.";
        case 408:
            return "Request Timeout: The server timed out waiting for the request.";
        case 410:
            return "Gone: The requested page is no longer available.";
        case 429:
            return "Too Many Requests: The server is rate limiting requests. Please try again later.";
        case 500:
            return "Internal Server Error: The server encountered an error while processing the request.";
        case 502:
            return "Bad Gateway: The server received an invalid response from an upstream server.";
        case 503:
            return "Service Unavailable: The server is temporarily unable to handle the request.";
        case 504:
            return "Gateway Timeout: The upstream server did not respond in time.";
        default:
            break;
    }

    std::string text(reason);
    if (text.empty()) {
        text = reason_phrase(status_code);
    }
    return "HTTP " + std::to_string(status_code) + ": " + text;
}

} // namespace pagescope::net
