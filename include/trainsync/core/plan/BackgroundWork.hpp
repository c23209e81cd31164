#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace trainsync {
namespace core {
namespace plan {

using BackgroundWorkToken = uint64_t;

// BackgroundWorkProvider - токен длительной работы ОС (продление жизни процесса)
class BackgroundWorkProvider {
public:
    virtual ~BackgroundWorkProvider() = default;
    virtual BackgroundWorkToken begin(const std::string& name) = 0;
    virtual void end(BackgroundWorkToken token) = 0;
};

// Провайдер без ОС-интеграции (CLI)
class NullBackgroundWorkProvider : public BackgroundWorkProvider {
public:
    BackgroundWorkToken begin(const std::string&) override { return ++next_; }
    void end(BackgroundWorkToken) override {}
private:
    std::atomic<BackgroundWorkToken> next_{0};
};

// ScopedBackgroundWork - токен освобождается ровно один раз на любом пути выхода
class ScopedBackgroundWork {
public:
    ScopedBackgroundWork(BackgroundWorkProvider& provider, const std::string& name)
        : provider_(&provider), token_(provider.begin(name)) {}
    ~ScopedBackgroundWork() { release(); }
    ScopedBackgroundWork(const ScopedBackgroundWork&) = delete;
    ScopedBackgroundWork& operator=(const ScopedBackgroundWork&) = delete;

    void release() {
        if (provider_) {
            provider_->end(token_);
            provider_ = nullptr;
        }
    }
    BackgroundWorkToken token() const { return token_; }
private:
    BackgroundWorkProvider* provider_;
    BackgroundWorkToken token_;
};

} // namespace plan
} // namespace core
} // namespace trainsync
