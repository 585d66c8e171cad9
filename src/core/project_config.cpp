#include "core/project_config.hpp"

namespace spectre::make {

std::string default_compiler() {
#if defined(__APPLE__)
    return "clang";
#else
    return "gcc";
#endif
}

} // namespace spectre::make
