#pragma once

#include <cstddef>
#include "trainsync/core/cache/CacheTypes.hpp"

namespace trainsync {
namespace core {
namespace cache {

// Cacheable - кэш, который умеет регистрироваться в CacheEventBus
class Cacheable {
public:
    virtual ~Cacheable() = default;
    virtual CacheIdentity identity() const = 0; // Уникальный идентификатор
    virtual void clearCache() = 0;              // Очистить
    virtual size_t getCacheSize() const = 0;    // Размер (байт)
    virtual bool isExpired() const = 0;         // Просрочен? Не должен ничего удалять
};

// CacheEventListener - получатель уведомлений об инвалидации
class CacheEventListener {
public:
    virtual ~CacheEventListener() = default;
    virtual void onCacheInvalidated(const InvalidationReason& reason) = 0;
};

} // namespace cache
} // namespace core
} // namespace trainsync
