#pragma once

#include <string>

namespace atomicswap::util {

// Random RFC 4122 version 4 UUID, lower-case canonical text
// (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx). Used for swap ids and simulated txids.
std::string NewId();

} // namespace atomicswap::util
