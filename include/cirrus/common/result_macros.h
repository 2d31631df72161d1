#pragma once

#include "cirrus/common/result.h"

#define CIRRUS_CONCAT_IMPL(x, y) x##y
#define CIRRUS_CONCAT(x, y) CIRRUS_CONCAT_IMPL(x, y)

// RETURN_ON_ERROR: 失败时向上传播 Status
#define RETURN_ON_ERROR(result)                                   \
    do {                                                          \
        auto&& CIRRUS_CONCAT(_result_, __LINE__) = (result);      \
        if (CIRRUS_CONCAT(_result_, __LINE__).hasError())         \
            return CIRRUS_CONCAT(_result_, __LINE__).error();     \
    } while (0)

// ASSIGN_OR_RETURN: 成功则绑定值，否则传播 Status
#define ASSIGN_OR_RETURN(var, result)                              \
    auto&& CIRRUS_CONCAT(_tmp_, __LINE__) = (result);              \
    if (CIRRUS_CONCAT(_tmp_, __LINE__).hasError())                 \
        return CIRRUS_CONCAT(_tmp_, __LINE__).error();             \
    var = std::move(CIRRUS_CONCAT(_tmp_, __LINE__)).value()
