#include "beacon/core/fatal.hpp"
#include <cstdio>
#include <cstdlib>
namespace beacon::node {

void Fatal(const std::string_view message) noexcept {
    std::fprintf(stderr, "[BCN-FATAL] %.*s\n",
                 static_cast<int>(message.size()), message.data());
    std::fflush(stderr);
    std::abort();
}

}
