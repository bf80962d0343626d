#include "geocluster/log.hpp"

#include <cstdlib>

namespace geocluster {

bool env_log_enabled() {
    static const bool once = []() {
        const char* e = std::getenv("GEOCLUSTER_LOG");
        return e && (e[0] == '1' || e[0] == 'y' || e[0] == 'Y');
    }();
    return once;
}

}  // namespace geocluster
