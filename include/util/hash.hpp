#pragma once

#include <string>
#include <string_view>

namespace dt::util {

// Lowercase hex MD5, the digest format the store reports in md5Checksum
std::string md5Hex(std::string_view data);

}
