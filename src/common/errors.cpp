#include "common/errors.hpp"
#include <openssl/err.h>

namespace authtree {

void throw_crypto_error(const std::string& context) {
    std::string msg = context;
    unsigned long code = 0;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    throw CryptoError(msg);
}

} // namespace authtree
