#pragma once

#include <string>

namespace flycache {
namespace cache {

/**
 * @brief Сопоставление glob в стиле Redis для keys()/clear() всех адаптеров.
 *
 * Поддерживает `*`, `?`, `[abc]`, `[^a]`, `[a-z]` и экранирование `\`,
 * как KEYS и SCAN MATCH в Redis.
 */
bool globMatch(const std::string& pattern, const std::string& text);

/// true, если шаблон содержит классы `[` или экранирование `\`.
bool globHasClassOrEscape(const std::string& pattern);

} // namespace cache
} // namespace flycache
