#include "core/securityconfig.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace securemail::core {

namespace {

bool readAllowExpired(const nlohmann::json& root, const char* section) {
    auto it = root.find(section);
    if (it == root.end() || it->is_null()) {
        return false;
    }
    if (!it->is_object()) {
        throw ConfigurationError(std::string("'") + section + "' must be an object");
    }
    return it->value("allow_expired", false);
}

} // namespace

SecurityConfig SecurityConfig::fromJson(const std::string& json) {
    SecurityConfig config;

    try {
        auto root = nlohmann::json::parse(json);
        if (!root.is_object()) {
            throw ConfigurationError("security configuration must be a JSON object");
        }

        config.allowExpiredForSigning = readAllowExpired(root, "sign");
        config.allowExpiredForEncryption = readAllowExpired(root, "encryption");
        config.cipher = root.value("cipher", std::string(DEFAULT_CIPHER));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("invalid security configuration: ") + e.what());
    }

    // Reject unknown ciphers at load time, not at the first encryption
    config.resolveCipher();
    return config;
}

SecurityConfig SecurityConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open security configuration " + path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromJson(buffer.str());
}

const EVP_CIPHER* SecurityConfig::resolveCipher() const {
    const EVP_CIPHER* evp = EVP_get_cipherbyname(cipher.c_str());
    if (!evp) {
        throw ConfigurationError("unsupported cipher '" + cipher + "'");
    }
    return evp;
}

} // namespace securemail::core
