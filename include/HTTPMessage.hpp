#ifndef HTTP_MESSAGE_HPP
#define HTTP_MESSAGE_HPP

#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace HTTP {

    enum class Method {
        GET,
        POST,
        PUT,
        DELETE,
        HEAD,
        OPTIONS,
        CONNECT,
        TRACE,
        PATCH,
        UNINITIALIZED  // Unknown or missing method token
    };

    enum class Version {
        V1_1,
        V2_0,
        UNINITIALIZED  // Unknown or missing version token
    };

    /**
     * Request target. Only the Path form exists; the path is kept verbatim.
     */
    struct Resource {
        enum class Kind { Path };

        Kind kind = Kind::Path;
        std::string path;

        static Resource Path(std::string p) { return Resource{Kind::Path, std::move(p)}; }

        bool operator==(const Resource&) const = default;
    };

    /**
     * Parsed HTTP request. Built once by HTTPRequestParser::parse and read directly.
     */
    struct HttpRequest {
        Method method = Method::UNINITIALIZED;
        Version version = Version::UNINITIALIZED;
        Resource resource;
        std::map<std::string, std::string> headers;
        std::string msg_body;
    };

    // Total conversions: anything unrecognized maps to UNINITIALIZED
    Method toMethod(std::string_view token);
    Version toVersion(std::string_view token);

    std::string toString(Method method);
    std::string toString(Version version);

} // namespace HTTP

#endif // HTTP_MESSAGE_HPP
