#pragma once

#include <string>
#include <utility>

namespace dopc {
namespace common {

// 状态码枚举, 沿用 gRPC 编号
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kNotFound = 5,
    kFailedPrecondition = 9,
    kOutOfRange = 11,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
};

// 表示操作结果的状态
class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() {
        return Status(StatusCode::kOk, "");
    }
    static Status InvalidArgument(std::string message) {
        return Status(StatusCode::kInvalidArgument, std::move(message));
    }
    static Status NotFound(std::string message) {
        return Status(StatusCode::kNotFound, std::move(message));
    }
    static Status FailedPrecondition(std::string message) {
        return Status(StatusCode::kFailedPrecondition, std::move(message));
    }
    static Status OutOfRange(std::string message) {
        return Status(StatusCode::kOutOfRange, std::move(message));
    }
    static Status Internal(std::string message) {
        return Status(StatusCode::kInternal, std::move(message));
    }
    static Status Unavailable(std::string message) {
        return Status(StatusCode::kUnavailable, std::move(message));
    }
    static Status DataLoss(std::string message) {
        return Status(StatusCode::kDataLoss, std::move(message));
    }

    bool IsOk() const {
        return code_ == StatusCode::kOk;
    }
    StatusCode Code() const {
        return code_;
    }
    const std::string& Message() const {
        return message_;
    }
private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
};

inline std::string StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "Invalid Argument";
        case StatusCode::kNotFound:
            return "Not Found";
        case StatusCode::kFailedPrecondition:
            return "Failed Precondition";
        case StatusCode::kOutOfRange:
            return "Out Of Range";
        case StatusCode::kInternal:
            return "Internal";
        case StatusCode::kUnavailable:
            return "Unavailable";
        case StatusCode::kDataLoss:
            return "Data Loss";
        default:
            return "Unknown";
    }
}

}
}
