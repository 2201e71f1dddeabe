#pragma once

#include <string>
#include <vector>

namespace securemail::smime {

/**
 * @brief Already composed outgoing message
 */
struct MailMessage {
    std::string from;               // Bare sender address
    std::vector<std::string> to;    // Bare recipient addresses
    std::vector<std::string> cc;
    std::string encoded;            // Complete MIME entity to protect
};

/**
 * @brief Requested protection of an outgoing message
 */
struct SecurityOptions {
    bool sign = false;
    bool encrypt = false;
};

} // namespace securemail::smime
