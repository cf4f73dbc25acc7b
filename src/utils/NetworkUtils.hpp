#pragma once

#include <QString>

namespace wb::license::utils {

//! First non-loopback IPv4 address of an interface that is up, or an empty string.
QString primaryIpAddress();

} // namespace wb::license::utils
