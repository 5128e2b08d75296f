/**
 * @file jws_sign_verify.cpp
 * @brief Example signing and verifying compact JWS tokens
 *
 * This example shows how to:
 * 1. Load an HMAC secret or a PEM key
 * 2. Sign a JSON payload into a compact token
 * 3. Verify a token and print its decoded parts
 * 4. Register a custom algorithm pattern
 */

#include "jwsign/compact.hpp"
#include "jwsign/jws.hpp"
#include "jwsign/logging.hpp"
#include "jwsign/secure_vector.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <getopt.h>

using namespace jwsign;

/**
 * @brief Read a whole file into a string
 */
std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

/**
 * @brief Truncated HMAC-SHA256, selected by identifiers like "HS256-T16"
 */
class TruncatedHmac : public SigningAlgorithm {
  public:
    explicit TruncatedHmac(size_t length) : length_(length) {}

    std::string identifier() const override { return "HS256-T" + std::to_string(length_); }

  protected:
    std::vector<uint8_t> signImpl(std::span<const uint8_t> message, const Key& key) const override {
        auto mac = hmac(HashAlgorithm::SHA256, key.secret(), message);
        mac.resize(std::min(length_, mac.size()));
        return mac;
    }

    void verifyImpl(std::span<const uint8_t> message, std::span<const uint8_t> signature,
                    const Key& key) const override {
        if (!secure_utils::constantTimeEqual(signImpl(message, key), signature)) {
            throw SignatureError("truncated HMAC mismatch");
        }
    }

  private:
    size_t length_;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --alg, -a ALG          Algorithm identifier (default HS256)\n";
    std::cout << "  --secret, -s SECRET    Shared secret for HS* algorithms\n";
    std::cout << "  --key, -k FILE         PEM key file for RS*/ES* algorithms\n";
    std::cout << "  --payload, -p JSON     Payload to sign (default {\"sub\":\"example\"})\n";
    std::cout << "  --verify, -v TOKEN     Verify a compact token instead of signing\n";
    std::cout << "  --log-level, -l LEVEL  trace, debug, info, warn, error, off\n";
    std::cout << "  --help, -h             Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --secret secret\n";
    std::cout << "  " << program_name << " --alg ES256 --key ec.pem --payload '{\"n\":1}'\n";
    std::cout << "  " << program_name << " --alg HS256-T16 --secret secret\n";
    std::cout << "  " << program_name << " --secret secret --verify eyJ...\n";
}

int main(int argc, char* argv[]) {
    std::string alg = "HS256";
    std::string secret;
    std::string key_file;
    std::string payload_json = R"({"sub":"example"})";
    std::string token;

    static struct option long_options[] = {
        {"alg", required_argument, 0, 'a'},
        {"secret", required_argument, 0, 's'},
        {"key", required_argument, 0, 'k'},
        {"payload", required_argument, 0, 'p'},
        {"verify", required_argument, 0, 'v'},
        {"log-level", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "a:s:k:p:v:l:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'a':
                alg = optarg;
                break;
            case 's':
                secret = optarg;
                break;
            case 'k':
                key_file = optarg;
                break;
            case 'p':
                payload_json = optarg;
                break;
            case 'v':
                token = optarg;
                break;
            case 'l':
                logging::Logger::getInstance().setLogLevel(optarg);
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (secret.empty() && key_file.empty()) {
        std::cerr << "Either --secret or --key is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    registerAlgorithm(AlgorithmPattern::regex(R"(HS256-T(?P<len>\d{1,2}))"),
                      [](const AlgorithmParams& params) {
                          return std::make_unique<TruncatedHmac>(std::stoul(params.at("len")));
                      });

    try {
        Key key = secret.empty() ? Key::fromPem(read_file(key_file)) : Key::fromSecret(secret);

        if (!token.empty()) {
            auto jws = compact::verify(token, key.type() == KeyType::Secret ? key : key.publicKey());
            std::cout << "Signature valid\n";
            std::cout << "Header:  " << jws.header.dump() << "\n";
            std::cout << "Payload: " << jws.payload.dump() << "\n";
            return 0;
        }

        Header header = {{"alg", alg}, {"typ", "JWT"}};
        Payload payload = Payload::parse(payload_json);
        std::cout << compact::serialize(header, payload, key) << "\n";

    } catch (const SignatureError& e) {
        std::cerr << "Invalid token: " << e.reason() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
