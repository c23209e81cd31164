#pragma once

#include <initializer_list>
#include <map>
#include <set>
#include <utility>
#include "trainsync/core/cache/CacheTypes.hpp"

namespace trainsync {
namespace core {
namespace cache {

// InvalidationMap - статическая таблица DataDomain -> набор CacheIdentity.
// Таблица тотальна: у каждого домена есть запись (возможно пустая).
// Симметрия не требуется. Поддерживается вручную при добавлении кэша.
class InvalidationMap {
public:
    using Entry = std::pair<DataDomain, std::set<CacheIdentity>>;

    InvalidationMap(); // Все домены -> пустой набор
    InvalidationMap(std::initializer_list<Entry> entries);

    static const InvalidationMap& standard(); // Таблица приложения

    const std::set<CacheIdentity>& affected(DataDomain domain) const; // Кэши домена
    void set(DataDomain domain, std::set<CacheIdentity> identities);
    bool references(const CacheIdentity& identity) const; // Упоминается хоть в одном домене?
    std::set<CacheIdentity> allIdentities() const;
private:
    std::map<DataDomain, std::set<CacheIdentity>> table_;
};

} // namespace cache
} // namespace core
} // namespace trainsync
