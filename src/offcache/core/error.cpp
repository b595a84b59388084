#include "offcache/core/error.h"

namespace offcache {
namespace core {

const char* code_name(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace offcache
