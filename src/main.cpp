#include <securemail/smime/outgoing.hpp>
#include "audit/securitylog.hpp"
#include "certs/certificateimporter.hpp"
#include "certs/certificatestore.hpp"
#include "core/errors.hpp"
#include "core/securityconfig.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace securemail;

void printUsage() {
    std::cerr << "usage: securemail --db <file> [--config <file>] [--log <file>] <command>\n"
              << "\n"
              << "commands:\n"
              << "  import-cert <pemfile>            store certificates\n"
              << "  import-key <pemfile> <secret>    attach private keys\n"
              << "  list                             list stored certificates\n"
              << "  sign <from> <messagefile>        write signed message to stdout\n"
              << "  encrypt <to[,to...]> <messagefile> write encrypted message to stdout\n";
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot read " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<std::string> splitAddresses(const std::string& list) {
    std::vector<std::string> addresses;
    std::stringstream in(list);
    std::string address;
    while (std::getline(in, address, ',')) {
        if (!address.empty()) {
            addresses.push_back(address);
        }
    }
    return addresses;
}

std::string formatDate(std::chrono::system_clock::time_point tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

void listCertificates(const certs::CertificateStore& store) {
    for (const auto& cert : store.all()) {
        std::cout << cert.fingerprint() << "  "
                  << formatDate(cert.notBefore()) << " - " << formatDate(cert.notAfter());
        for (const auto& address : cert.emailAddresses()) {
            std::cout << "  " << address;
        }
        if (cert.hasPrivateKey()) {
            std::cout << "  [key]";
        }
        if (cert.expired()) {
            std::cout << "  [expired]";
        }
        std::cout << "  " << cert.subject() << std::endl;
    }
}

int run(const std::vector<std::string>& args) {
    std::optional<std::string> dbPath;
    std::optional<std::string> configPath;
    std::string logPath;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "--db" || args[i] == "--config" || args[i] == "--log") &&
            i + 1 < args.size()) {
            const std::string& value = args[++i];
            if (args[i - 1] == "--db") dbPath = value;
            else if (args[i - 1] == "--config") configPath = value;
            else logPath = value;
        } else if (args[i] == "--help" || args[i] == "-h") {
            printUsage();
            return 0;
        } else {
            positional.push_back(args[i]);
        }
    }

    if (!dbPath || positional.empty()) {
        printUsage();
        return 2;
    }

    certs::CertificateStore store(*dbPath);
    const std::string& command = positional[0];

    if (command == "import-cert" && positional.size() == 2) {
        certs::CertificateImporter importer(store);
        for (const auto& cert : importer.importCertificates(readFile(positional[1]))) {
            std::cout << cert.fingerprint() << "  " << cert.subject() << std::endl;
        }
        return 0;
    }
    if (command == "import-key" && positional.size() == 3) {
        certs::CertificateImporter importer(store);
        importer.importPrivateKeys(readFile(positional[1]), positional[2]);
        return 0;
    }
    if (command == "list" && positional.size() == 1) {
        listCertificates(store);
        return 0;
    }

    if ((command == "sign" || command == "encrypt") && positional.size() == 3) {
        core::SecurityConfig config = configPath
            ? core::SecurityConfig::loadFromFile(*configPath)
            : core::SecurityConfig{};
        audit::SqliteSecurityLog log(logPath.empty() ? *dbPath : logPath, smime::Outgoing::TYPE);
        smime::Outgoing outgoing(store, config, log);

        smime::MailMessage mail;
        mail.encoded = readFile(positional[2]);
        if (command == "sign") {
            mail.from = positional[1];
            std::cout << outgoing.sign(mail);
        } else {
            mail.to = splitAddresses(positional[1]);
            std::cout << outgoing.encrypt(mail, mail.encoded);
        }
        return 0;
    }

    printUsage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << "securemail: " << e.what() << std::endl;
        return 1;
    }
}
