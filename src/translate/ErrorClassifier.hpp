#pragma once

#include "TranslationError.hpp"

#include <exception>
#include <string>

namespace translate
{

/**
 * @brief Maps raw failures to structured TranslationError values.
 *
 * Decision order, first match wins:
 *   1. std::invalid_argument (incl. ValidationError)  -> Validation
 *   2. std::bad_alloc                                 -> Memory
 *   3. TimeoutError                                   -> Timeout
 *   4. std::system_error / ConnectionError            -> Timeout if the message
 *                                                        looks like one, else Network
 *   5. message patterns: Timeout, Memory, Network, Model
 *   6. Unknown
 *
 * Stateless; every function is safe to call from any thread.
 */
class ErrorClassifier
{
public:
    static TranslationError classify(std::exception_ptr error, const std::string& message,
                                     const std::string& trace = {});

    // For failures that only exist as text (no exception object).
    static TranslationError classifyMessage(const std::string& message, const std::string& trace = {});

    // Attempt deadline expired without a result.
    static TranslationError makeTimeoutError();

    static TranslationError makeValidationError(const std::string& message);

    static TranslationError makeError(ErrorKind kind, const std::string& message, const std::string& trace = {});

    static ErrorKind kindFromMessage(const std::string& message);
};

} // namespace translate
