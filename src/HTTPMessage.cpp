#include "HTTPMessage.hpp"

#include <array>
#include <utility>

namespace HTTP {

    namespace {
        constexpr std::array<std::pair<std::string_view, Method>, 9> METHOD_TOKENS{{
            {"GET", Method::GET},
            {"POST", Method::POST},
            {"PUT", Method::PUT},
            {"DELETE", Method::DELETE},
            {"HEAD", Method::HEAD},
            {"OPTIONS", Method::OPTIONS},
            {"CONNECT", Method::CONNECT},
            {"TRACE", Method::TRACE},
            {"PATCH", Method::PATCH},
        }};

        constexpr std::string_view VERSION_1_1 = "HTTP/1.1";
        constexpr std::string_view VERSION_2_0 = "HTTP/2.0";
        constexpr std::string_view UNINITIALIZED_NAME = "UNINITIALIZED";
    }

    Method toMethod(std::string_view token) {
        for (const auto& [name, method] : METHOD_TOKENS) {
            if (name == token) return method;
        }
        return Method::UNINITIALIZED;
    }

    Version toVersion(std::string_view token) {
        if (token == VERSION_1_1) return Version::V1_1;
        if (token == VERSION_2_0) return Version::V2_0;
        return Version::UNINITIALIZED;
    }

    std::string toString(Method method) {
        for (const auto& [name, m] : METHOD_TOKENS) {
            if (m == method) return std::string{name};
        }
        return std::string{UNINITIALIZED_NAME};
    }

    std::string toString(Version version) {
        switch (version) {
            case Version::V1_1: return std::string{VERSION_1_1};
            case Version::V2_0: return std::string{VERSION_2_0};
            default:            return std::string{UNINITIALIZED_NAME};
        }
    }

} // namespace HTTP
