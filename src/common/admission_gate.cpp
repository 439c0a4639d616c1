#include "common/admission_gate.hpp"

#include <algorithm>

namespace dopc {
namespace common {

AdmissionGate::AdmissionGate(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

AdmissionGate::Permit::Permit(Permit&& other) noexcept : gate_(other.gate_) {
    other.gate_ = nullptr;
}

AdmissionGate::Permit& AdmissionGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        // 先归还当前持有的许可
        if (gate_) {
            gate_->Release();
        }
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

AdmissionGate::Permit::~Permit() {
    if (gate_) {
        gate_->Release();
    }
}

AdmissionGate::Permit AdmissionGate::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return in_flight_ < capacity_; });
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return Permit(this);
}

std::size_t AdmissionGate::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t AdmissionGate::PeakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void AdmissionGate::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    cv_.notify_one();
}

} // namespace common
} // namespace dopc
