// request_id.h - routing request-id generator (hex)
#pragma once

#include <string>

namespace kvplane {

// Generate a random 16-hex-character request id.
std::string generate_request_id();

}  // namespace kvplane
