#pragma once

#include <toml++/toml.h>

struct TranslationConfig;
struct BackendConfig;

// Centralized TOML serialization for the [translation] section
class StateSerializer
{
public:
    // Serialize to a root table holding [translation] and [translation.backend]
    static toml::table serializeTranslation(const TranslationConfig& config, const BackendConfig& backend);

    // Deserialize from the root table. Missing keys keep their current values;
    // out-of-range values are clamped and reported as configuration warnings.
    static void deserializeTranslation(const toml::table& root, TranslationConfig& config, BackendConfig& backend);
};
