#pragma once

#include "common/status.hpp"

#include <string>

namespace dopc {
namespace core {

enum class PriceErrorCode {
    kOk = 0,
    kInvalidInput = 1,
    kUpstreamFailure = 2,
    kUpstreamDataInvalid = 3,
    kDistanceExceeded = 4,
    kNoRangeFound = 5,
    kInternal = 6,
};

// 状态码映射到定价错误分类
inline PriceErrorCode MapStatus(const dopc::common::Status& status) {
    using dopc::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return PriceErrorCode::kOk;
        case StatusCode::kInvalidArgument:
            return PriceErrorCode::kInvalidInput;
        case StatusCode::kUnavailable:
            return PriceErrorCode::kUpstreamFailure;
        case StatusCode::kDataLoss:
            return PriceErrorCode::kUpstreamDataInvalid;
        case StatusCode::kOutOfRange:
            return PriceErrorCode::kDistanceExceeded;
        case StatusCode::kNotFound:
            return PriceErrorCode::kNoRangeFound;
        default:
            return PriceErrorCode::kInternal;
    }
}

// 客户端可见的 HTTP 状态码, 除内部错误外均为 400
inline int ToHttpStatus(PriceErrorCode code) {
    switch (code) {
        case PriceErrorCode::kOk:
            return 200;
        case PriceErrorCode::kInternal:
            return 500;
        default:
            return 400;
    }
}

inline std::string PriceErrorCodeToString(PriceErrorCode code) {
    switch (code) {
        case PriceErrorCode::kOk:
            return "OK";
        case PriceErrorCode::kInvalidInput:
            return "InvalidInput";
        case PriceErrorCode::kUpstreamFailure:
            return "UpstreamFailure";
        case PriceErrorCode::kUpstreamDataInvalid:
            return "UpstreamDataInvalid";
        case PriceErrorCode::kDistanceExceeded:
            return "DistanceExceeded";
        case PriceErrorCode::kNoRangeFound:
            return "NoRangeFound";
        default:
            return "Internal";
    }
}

} // namespace core
} // namespace dopc
