#include "utils/request_id.h"

#include <iomanip>
#include <random>
#include <sstream>

namespace kvplane {

std::string generate_request_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t v = rng();
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << v;
    return oss.str();
}

}  // namespace kvplane
