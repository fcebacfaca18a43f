#include "util/curlWrappers.hpp"

#include <mutex>

namespace usync::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}
