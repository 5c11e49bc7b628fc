#include <catch2/catch_test_macros.hpp>

#include "translate/ErrorClassifier.hpp"

#include <new>
#include <stdexcept>
#include <string>
#include <system_error>

using namespace translate;

namespace {

template <typename E>
std::exception_ptr make(const E& e) {
    return std::make_exception_ptr(e);
}

} // namespace

TEST_CASE("Exception types take precedence over messages", "[translate][classifier]") {
    SECTION("invalid_argument is a validation error") {
        auto e = ErrorClassifier::classify(make(std::invalid_argument("CUDA out of memory")), "CUDA out of memory");
        REQUIRE(e.kind == ErrorKind::Validation);
        REQUIRE_FALSE(e.is_retryable);
    }

    SECTION("ValidationError is a validation error") {
        auto e = ErrorClassifier::classify(make(ValidationError("empty text")), "empty text");
        REQUIRE(e.kind == ErrorKind::Validation);
    }

    SECTION("bad_alloc is a memory error") {
        auto e = ErrorClassifier::classify(make(std::bad_alloc()), "std::bad_alloc");
        REQUIRE(e.kind == ErrorKind::Memory);
        REQUIRE(e.is_retryable);
    }

    SECTION("TimeoutError is a timeout") {
        auto e = ErrorClassifier::classify(make(TimeoutError("took too long")), "took too long");
        REQUIRE(e.kind == ErrorKind::Timeout);
        REQUIRE(e.is_retryable);
    }

    SECTION("Connection errors are network errors unless they mention a timeout") {
        auto net = ErrorClassifier::classify(make(ConnectionError("refused")), "refused");
        REQUIRE(net.kind == ErrorKind::Network);
        REQUIRE(net.is_retryable);

        auto slow = ErrorClassifier::classify(make(ConnectionError("Connection timed out")), "Connection timed out");
        REQUIRE(slow.kind == ErrorKind::Timeout);
    }

    SECTION("system_error is treated as an OS-level connection failure") {
        std::system_error se(std::make_error_code(std::errc::connection_refused));
        auto e = ErrorClassifier::classify(std::make_exception_ptr(se), "broken pipe");
        REQUIRE(e.kind == ErrorKind::Network);
    }
}

TEST_CASE("Message patterns classify untyped failures", "[translate][classifier]") {
    auto kindOf = [](const std::string& msg) {
        return ErrorClassifier::classify(make(std::runtime_error(msg)), msg).kind;
    };

    REQUIRE(kindOf("Request timed out") == ErrorKind::Timeout);
    REQUIRE(kindOf("read timeout") == ErrorKind::Timeout);
    REQUIRE(kindOf("DEADLINE EXCEEDED") == ErrorKind::Timeout);

    REQUIRE(kindOf("CUDA out of memory") == ErrorKind::Memory);
    REQUIRE(kindOf("MPS out of memory") == ErrorKind::Memory);
    REQUIRE(kindOf("cannot allocate tensor") == ErrorKind::Memory);
    REQUIRE(kindOf("MemoryError") == ErrorKind::Memory);

    REQUIRE(kindOf("Connection refused") == ErrorKind::Network);
    REQUIRE(kindOf("socket closed") == ErrorKind::Network);
    REQUIRE(kindOf("URLError: unreachable") == ErrorKind::Network);

    REQUIRE(kindOf("Model not loaded") == ErrorKind::Model);
    REQUIRE(kindOf("model was not initialized") == ErrorKind::Model);
    REQUIRE(kindOf("failed to load the model") == ErrorKind::Model);

    REQUIRE(kindOf("something odd") == ErrorKind::Unknown);
}

TEST_CASE("Classification priority and determinism", "[translate][classifier]") {
    const std::string msg = "timeout while allocating: out of memory";

    auto first = ErrorClassifier::classify(nullptr, msg);
    auto second = ErrorClassifier::classify(nullptr, msg);
    REQUIRE(first.kind == ErrorKind::Timeout);
    REQUIRE(second.kind == first.kind);
    REQUIRE(second.cause == first.cause);
    REQUIRE(second.solution == first.solution);
    REQUIRE(second.is_retryable == first.is_retryable);

    SECTION("Memory beats network") {
        REQUIRE(ErrorClassifier::classifyMessage("connection lost: out of memory").kind == ErrorKind::Memory);
    }

    SECTION("Network beats model") {
        REQUIRE(ErrorClassifier::classifyMessage("model download failed: network down").kind == ErrorKind::Network);
    }
}

TEST_CASE("Every kind carries user-facing guidance", "[translate][classifier]") {
    for (auto kind : {ErrorKind::Network, ErrorKind::Memory, ErrorKind::Model, ErrorKind::Timeout,
                      ErrorKind::Validation, ErrorKind::Unknown}) {
        auto e = ErrorClassifier::makeError(kind, "raw", "trace");
        REQUIRE(e.kind == kind);
        REQUIRE(e.message == "raw");
        REQUIRE(e.diagnostic == "trace");
        REQUIRE_FALSE(e.cause.empty());
        REQUIRE_FALSE(e.solution.empty());
        REQUIRE(std::string(toString(kind)).size() > 0);
        REQUIRE(e.is_retryable == (kind != ErrorKind::Model && kind != ErrorKind::Validation));
    }

    auto timeout = ErrorClassifier::makeTimeoutError();
    REQUIRE(timeout.kind == ErrorKind::Timeout);
    REQUIRE(timeout.is_retryable);
    REQUIRE(timeout.message == "Translation timed out");
}
