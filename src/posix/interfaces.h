#pragma once

#include "../components.h"

namespace artlink {
namespace posix {

// Up, non-loopback IPv4 interfaces with their MAC, one entry per address.
InterfaceList localInterfaces();

} // namespace posix
} // namespace artlink
