#include "util/hash.hpp"

#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dt::util {

std::string md5Hex(const std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(md5) failed");

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return oss.str();
}

}
