#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace trainsync {
namespace core {
namespace task {

// OperationCanceled - кооперативная отмена (не ошибка)
class OperationCanceled : public std::runtime_error {
public:
    OperationCanceled() : std::runtime_error("operation canceled") {}
    explicit OperationCanceled(const std::string& what) : std::runtime_error(what) {}
};

// CancellationToken - проверяется телом операции в точках ожидания
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {} // Никогда не отменяется
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }
    void throwIfCancelled() const {
        if (isCancelled()) {
            throw OperationCanceled();
        }
    }
private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}
    std::shared_ptr<std::atomic<bool>> flag_;
};

// CancellationSource - владелец флага отмены
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const { return flag_->load(std::memory_order_acquire); }
    CancellationToken token() const { return CancellationToken(flag_); }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace task
} // namespace core
} // namespace trainsync
