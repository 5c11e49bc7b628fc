#include "ErrorClassifier.hpp"

#include <initializer_list>
#include <new>
#include <regex>
#include <system_error>
#include <vector>

namespace translate
{

namespace
{

struct KindInfo
{
    const char* cause;
    const char* solution;
    bool is_retryable;
};

KindInfo infoFor(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Network:
        return { "A network connection problem occurred.",
                 "Check your connection to the translation server and try again in a moment.", true };
    case ErrorKind::Memory:
        return { "The system is running out of memory.",
                 "Close other programs or try again with a shorter text.", true };
    case ErrorKind::Model:
        return { "The translation model is not available.",
                 "Restart the application. If the problem persists, check that the model is installed and that "
                 "at least 10 GB of storage is free.",
                 false };
    case ErrorKind::Timeout:
        return { "The translation took too long.",
                 "The text may be too long. Split it into smaller parts or try again in a moment.", true };
    case ErrorKind::Validation:
        return { "There is a problem with the input text.", "Check the text and enter it again.", false };
    case ErrorKind::Unknown:
    default:
        return { "An unexpected error occurred.",
                 "Try again in a moment. If the problem persists, restart the application.", true };
    }
}

using PatternFamily = std::vector<std::regex>;

PatternFamily compile(std::initializer_list<const char*> patterns)
{
    PatternFamily family;
    family.reserve(patterns.size());
    for (const char* p : patterns)
        family.emplace_back(p, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    return family;
}

const PatternFamily& timeoutPatterns()
{
    static const PatternFamily family = compile({ R"(timed? ?out)", R"(timeout)", R"(deadline exceeded)" });
    return family;
}

const PatternFamily& memoryPatterns()
{
    static const PatternFamily family =
        compile({ R"(out of memory)", R"(OOM)", R"(MemoryError)", R"(CUDA out of memory)", R"(MPS out of memory)",
                  R"(cannot allocate)", R"(allocation failed)" });
    return family;
}

const PatternFamily& networkPatterns()
{
    static const PatternFamily family = compile({ R"(connection)", R"(network)", R"(socket)", R"(ConnectionError)",
                                                  R"(URLError)", R"(ConnectionRefused)", R"(ConnectionReset)" });
    return family;
}

const PatternFamily& modelPatterns()
{
    static const PatternFamily family = compile(
        { R"(Model not loaded)", R"(model.*not.*initialized)", R"(failed to load.*model)", R"(model.*failed)" });
    return family;
}

bool matchesAny(const PatternFamily& family, const std::string& message)
{
    for (const auto& re : family)
    {
        if (std::regex_search(message, re))
            return true;
    }
    return false;
}

enum class ExceptionTag
{
    None,
    Validation,
    Memory,
    Timeout,
    Connection
};

ExceptionTag tagOf(const std::exception_ptr& error)
{
    if (!error)
        return ExceptionTag::None;

    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::invalid_argument&)
    {
        return ExceptionTag::Validation;
    }
    catch (const std::bad_alloc&)
    {
        return ExceptionTag::Memory;
    }
    catch (const TimeoutError&)
    {
        return ExceptionTag::Timeout;
    }
    catch (const ConnectionError&)
    {
        return ExceptionTag::Connection;
    }
    catch (const std::system_error&)
    {
        return ExceptionTag::Connection;
    }
    catch (...)
    {
        // Untagged: falls through to message patterns.
        return ExceptionTag::None;
    }
}

} // namespace

const char* toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Network:
        return "Network";
    case ErrorKind::Memory:
        return "Memory";
    case ErrorKind::Model:
        return "Model";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::Validation:
        return "Validation";
    case ErrorKind::Unknown:
    default:
        return "Unknown";
    }
}

ErrorKind ErrorClassifier::kindFromMessage(const std::string& message)
{
    if (matchesAny(timeoutPatterns(), message))
        return ErrorKind::Timeout;
    if (matchesAny(memoryPatterns(), message))
        return ErrorKind::Memory;
    if (matchesAny(networkPatterns(), message))
        return ErrorKind::Network;
    if (matchesAny(modelPatterns(), message))
        return ErrorKind::Model;
    return ErrorKind::Unknown;
}

TranslationError ErrorClassifier::classify(std::exception_ptr error, const std::string& message,
                                           const std::string& trace)
{
    ErrorKind kind = ErrorKind::Unknown;
    switch (tagOf(error))
    {
    case ExceptionTag::Validation:
        kind = ErrorKind::Validation;
        break;
    case ExceptionTag::Memory:
        kind = ErrorKind::Memory;
        break;
    case ExceptionTag::Timeout:
        kind = ErrorKind::Timeout;
        break;
    case ExceptionTag::Connection:
        kind = matchesAny(timeoutPatterns(), message) ? ErrorKind::Timeout : ErrorKind::Network;
        break;
    case ExceptionTag::None:
        kind = kindFromMessage(message);
        break;
    }
    return makeError(kind, message, trace);
}

TranslationError ErrorClassifier::classifyMessage(const std::string& message, const std::string& trace)
{
    return classify(nullptr, message, trace);
}

TranslationError ErrorClassifier::makeTimeoutError()
{
    return makeError(ErrorKind::Timeout, "Translation timed out");
}

TranslationError ErrorClassifier::makeValidationError(const std::string& message)
{
    return makeError(ErrorKind::Validation, message);
}

TranslationError ErrorClassifier::makeError(ErrorKind kind, const std::string& message, const std::string& trace)
{
    const KindInfo info = infoFor(kind);
    TranslationError err;
    err.kind = kind;
    err.message = message;
    err.cause = info.cause;
    err.solution = info.solution;
    err.is_retryable = info.is_retryable;
    err.diagnostic = trace;
    return err;
}

} // namespace translate
