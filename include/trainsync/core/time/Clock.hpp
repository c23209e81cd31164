#pragma once

#include <chrono>
#include <cstdint>

namespace trainsync {
namespace core {
namespace time {

// Все метки времени - целые epoch-миллисекунды (никаких double/Date-ключей)
using EpochMillis = int64_t;

// Clock - источник текущего времени, подменяется в тестах
class Clock {
public:
    virtual ~Clock() = default;
    virtual EpochMillis nowMillis() const = 0; // Текущее время (epoch ms)
    EpochMillis nowSeconds() const { return nowMillis() / 1000; }
};

// SystemClock - системные часы
class SystemClock : public Clock {
public:
    EpochMillis nowMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

} // namespace time
} // namespace core
} // namespace trainsync
