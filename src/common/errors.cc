#include "errors.h"

namespace UpgradeJourney {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kSequence:          return "SequenceError";
        case ErrorKind::kConfig:            return "ConfigError";
        case ErrorKind::kClusterStart:      return "ClusterStartError";
        case ErrorKind::kRollingUpdate:     return "RollingUpdateError";
        case ErrorKind::kSchema:            return "SchemaError";
        case ErrorKind::kImport:            return "ImportError";
        case ErrorKind::kDataLoss:          return "DataLossError";
        case ErrorKind::kAggregateMismatch: return "AggregateMismatchError";
        case ErrorKind::kTimeout:           return "TimeoutError";
        case ErrorKind::kService:           return "ServiceError";
        case ErrorKind::kUnknown:           return "UnknownError";
    }
    return "UnknownError";
}

} // namespace UpgradeJourney
