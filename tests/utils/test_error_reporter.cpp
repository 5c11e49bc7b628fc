#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"

#include <string>

using namespace utils;

TEST_CASE("ErrorReporter queues reports until drained", "[utils][errors]") {
    ErrorReporter::ClearErrors();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::GetLastError().category == ErrorCategory::Unknown);

    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "adjusted", "debounce_ms");
    ErrorReporter::ReportError(ErrorCategory::Translation, "failed");

    auto last = ErrorReporter::GetLastError();
    REQUIRE(last.category == ErrorCategory::Translation);
    REQUIRE(last.severity == ErrorSeverity::Error);
    REQUIRE_FALSE(last.is_fatal);

    auto errors = ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].user_message == "adjusted");
    REQUIRE(errors[0].technical_details == "debounce_ms");
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter marks fatal reports", "[utils][errors]") {
    ErrorReporter::ClearErrors();
    ErrorReporter::ReportFatal(ErrorCategory::Initialization, "backend missing");
    REQUIRE(ErrorReporter::GetLastError().is_fatal);
    REQUIRE(ErrorReporter::SeverityToString(ErrorReporter::GetLastError().severity) == "Fatal");
    ErrorReporter::ClearErrors();
}

TEST_CASE("ErrorReporter drops the oldest reports when full", "[utils][errors]") {
    ErrorReporter::ClearErrors();
    for (int i = 0; i < 105; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Validation, "report " + std::to_string(i));

    REQUIRE(ErrorReporter::DroppedCount() == 5);
    auto errors = ErrorReporter::GetPendingErrors();
    REQUIRE(errors.size() == 100);
    REQUIRE(errors.front().user_message == "report 5");
    REQUIRE(errors.back().user_message == "report 104");

    ErrorReporter::ClearErrors();
    REQUIRE(ErrorReporter::DroppedCount() == 0);
}
