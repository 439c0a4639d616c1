#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace dopc {
namespace common {

// 固定容量的准入信号量, 限制同时进行中的定价流水线数量
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // 准入许可, RAII 管理许可的获取和归还
    class Permit {
    public:
        Permit() = default;
        explicit Permit(AdmissionGate* gate) : gate_(gate) {}
        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        ~Permit();

        explicit operator bool() const noexcept { return gate_ != nullptr; }
    private:
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        AdmissionGate* gate_ = nullptr;
    };

    // 获取许可, 满载时阻塞直到有许可归还 (无超时)
    Permit Acquire();

    std::size_t Capacity() const noexcept { return capacity_; }
    std::size_t InFlight() const;
    // 历史最大并发数
    std::size_t PeakInFlight() const;

private:
    void Release();

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_flight_ = 0;
    std::size_t peak_ = 0;
};

} // namespace common
} // namespace dopc
