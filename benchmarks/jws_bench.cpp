#include <benchmark/benchmark.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include "jwsign/jws.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace jwsign;

static Key GenerateKey(const char* type, const char* curve, size_t bits) {
    EvpKeyPtr pkey(curve ? EVP_PKEY_Q_keygen(nullptr, nullptr, type, curve)
                         : EVP_PKEY_Q_keygen(nullptr, nullptr, type, bits));
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!pkey || !bio ||
        PEM_write_bio_PrivateKey(bio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw std::runtime_error("Benchmark key generation failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return Key::fromPem(std::string(data, static_cast<size_t>(len)));
}

static Key KeyFor(const std::string& alg) {
    if (alg.starts_with("HS")) return Key::fromSecret("benchmark-shared-secret-0123456789abcdef");
    if (alg.starts_with("RS")) return GenerateKey("RSA", nullptr, 2048);
    if (alg == "ES384") return GenerateKey("EC", "P-384", 0);
    if (alg == "ES512") return GenerateKey("EC", "P-521", 0);
    return GenerateKey("EC", "P-256", 0);
}

static const Payload PAYLOAD = {
    {"iss", "https://issuer.example"},
    {"sub", "1234567890"},
    {"aud", {"client1", "client2"}},
    {"exp", 1893456000},
    {"scope", "read write"}};

static void BM_Sign(benchmark::State& state, const std::string& alg) {
    Header header = {{"alg", alg}, {"typ", "JWT"}};
    auto key = KeyFor(alg);

    for (auto _ : state) {
        auto signature = sign(header, PAYLOAD, key);
        benchmark::DoNotOptimize(signature);
    }
}

static void BM_Verify(benchmark::State& state, const std::string& alg) {
    Header header = {{"alg", alg}, {"typ", "JWT"}};
    auto key = KeyFor(alg);
    auto signature = sign(header, PAYLOAD, key);
    auto verifying = alg.starts_with("HS") ? key : key.publicKey();

    for (auto _ : state) {
        verify(header, PAYLOAD, signature, verifying);
    }
}

BENCHMARK_CAPTURE(BM_Sign, HS256, std::string("HS256"));
BENCHMARK_CAPTURE(BM_Sign, HS512, std::string("HS512"));
BENCHMARK_CAPTURE(BM_Sign, RS256, std::string("RS256"));
BENCHMARK_CAPTURE(BM_Sign, ES256, std::string("ES256"));
BENCHMARK_CAPTURE(BM_Sign, ES384, std::string("ES384"));
BENCHMARK_CAPTURE(BM_Sign, ES512, std::string("ES512"));

BENCHMARK_CAPTURE(BM_Verify, HS256, std::string("HS256"));
BENCHMARK_CAPTURE(BM_Verify, RS256, std::string("RS256"));
BENCHMARK_CAPTURE(BM_Verify, ES256, std::string("ES256"));
BENCHMARK_CAPTURE(BM_Verify, ES512, std::string("ES512"));

static void BM_SigningInput(benchmark::State& state) {
    Header header = {{"alg", "HS256"}, {"typ", "JWT"}, {"kid", "key-1"}};
    for (auto _ : state) {
        auto input = createSigningInput(header, PAYLOAD);
        benchmark::DoNotOptimize(input);
    }
}
BENCHMARK(BM_SigningInput);

static void BM_Resolve_Builtin(benchmark::State& state) {
    AlgorithmRegistry registry;
    for (auto _ : state) {
        auto algorithm = registry.resolve("ES512");
        benchmark::DoNotOptimize(algorithm);
    }
}
BENCHMARK(BM_Resolve_Builtin);

// Worst case: the identifier is matched against every custom pattern
static void BM_Resolve_CustomPattern(benchmark::State& state) {
    AlgorithmRegistry registry;
    for (int64_t i = 0; i < state.range(0); ++i) {
        registry.registerAlgorithm(
            AlgorithmPattern::regex("C" + std::to_string(i) + R"(-(?P<n>\d+))"),
            [](const AlgorithmParams&) { return std::make_unique<HmacAlgorithm>(HashAlgorithm::SHA256); });
    }
    std::string target = "C" + std::to_string(state.range(0) - 1) + "-42";

    for (auto _ : state) {
        auto algorithm = registry.resolve(target);
        benchmark::DoNotOptimize(algorithm);
    }
}
BENCHMARK(BM_Resolve_CustomPattern)->Arg(1)->Arg(8)->Arg(64);
