#include <authfetch/auth/credential.h>

#include <openssl/evp.h>

#include <vector>

namespace authfetch::auth {

std::string base64Encode(std::string_view data) {
    if (data.empty())
        return {};
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL terminator.
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written > 0 ? written : 0));
}

std::string BasicIdentity::authorizationValue() const {
    return "Basic " + base64Encode(username + ":" + password);
}

} // namespace authfetch::auth
