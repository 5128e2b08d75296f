#include <doctest/doctest.h>
#include "jwsign/logging.hpp"
#include "jwsign/registry.hpp"

#ifdef JWSIGN_ENABLE_LOGGING
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace jwsign;
using jwsign::logging::Logger;
using jwsign::logging::LogLevel;

TEST_CASE("Logging: Level names") {
    auto& logger = Logger::getInstance();
    auto previous = logger.getLogger()->level();

    CHECK(logger.setLogLevel("debug"));
    CHECK(logger.getLogger()->level() == spdlog::level::debug);

    CHECK_FALSE(logger.setLogLevel("verbose"));
    CHECK(logger.getLogger()->level() == spdlog::level::debug);

    CHECK(logger.setLogLevel("off"));
    CHECK(logger.getLogger()->level() == spdlog::level::off);

    logger.setLevel(LogLevel::WARN);
    CHECK(logger.getLogger()->level() == spdlog::level::warn);

    logger.getLogger()->set_level(previous);
}

TEST_CASE("Logging: Application logger receives library messages") {
    auto& logger = Logger::getInstance();
    auto previous = logger.getLogger();

    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto app = std::make_shared<spdlog::logger>("app", sink);
    app->set_level(spdlog::level::debug);
    logger.setLogger(app);

    AlgorithmRegistry registry;
    CHECK_THROWS_AS((void)registry.resolve("no-such-alg"), AlgorithmNotImplementedError);
    app->flush();

    logger.setLogger(previous);
    CHECK(captured.str().find("no-such-alg") != std::string::npos);
}

TEST_CASE("Logging: Shadowed custom patterns are reported") {
    auto& logger = Logger::getInstance();
    auto previous = logger.getLogger();

    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto app = std::make_shared<spdlog::logger>("app", sink);
    app->set_level(spdlog::level::warn);
    logger.setLogger(app);

    AlgorithmRegistry registry;
    auto factory = [](const AlgorithmParams&) { return std::make_unique<HmacAlgorithm>(HashAlgorithm::SHA256); };
    registry.registerAlgorithm(AlgorithmPattern::exact("RS384"), factory);
    registry.registerAlgorithm(AlgorithmPattern::regex(R"(RS(?P<bits>\d+))"), factory);
    registry.registerAlgorithm(AlgorithmPattern::exact("HS256-CUSTOM"), factory);
    app->flush();

    logger.setLogger(previous);
    auto text = captured.str();
    CHECK(text.find("Pattern 'RS384' is shadowed by built-in algorithm 'RS384'") != std::string::npos);
    CHECK(text.find("Pattern 'RS(?P<bits>\\d+)' is shadowed by built-in algorithm 'RS512'") != std::string::npos);
    CHECK(text.find("HS256-CUSTOM") == std::string::npos);
    CHECK(registry.resolve("RS384")->identifier() == "RS384");
}

TEST_CASE("Logging: Null logger is ignored") {
    auto& logger = Logger::getInstance();
    auto current = logger.getLogger();
    logger.setLogger(nullptr);
    CHECK(logger.getLogger() == current);
}

#else

TEST_CASE("Logging: Compiled out") {
    CHECK_FALSE(jwsign::logging::Logger::getInstance().setLogLevel("debug"));
}

#endif
