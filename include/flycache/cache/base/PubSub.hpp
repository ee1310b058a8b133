#pragma once

#include <functional>
#include <string>
#include "flycache/cache/base/CacheTypes.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Транспорт событий кэша между процессами.
 *
 * Обработчики выполняются в потоке доставки транспорта. Исключение одного
 * обработчика логируется, остальные все равно получают событие.
 */
class PubSub {
public:
    using EventHandler = std::function<void(const CacheChangeEvent& event)>;
    using Unsubscribe = std::function<void()>;

    virtual ~PubSub() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    // Опубликовать событие в канал, соответствующий шаблону
    virtual void publish(const std::string& pattern, const CacheChangeEvent& event) = 0;

    /**
     * @brief Регистрирует обработчик сообщений в каналах, подходящих под `pattern`.
     * @return идемпотентная функция, удаляющая только этот обработчик
     */
    virtual Unsubscribe subscribe(const std::string& pattern, EventHandler handler) = 0;
};

/**
 * @brief Канал публикации для шаблона: сам текст шаблона.
 *
 * Glob из литералов, `*` и `?` совпадает со своим текстом, поэтому подписчики
 * шаблона получают сообщение, а разные шаблоны не делят один канал.
 * @throws ValidationError для пустых шаблонов и шаблонов с `[` или `\`
 */
std::string channelForPattern(const std::string& pattern, const std::string& adapter);

} // namespace cache
} // namespace flycache
