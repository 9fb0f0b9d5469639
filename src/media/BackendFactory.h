#pragma once
#include <expected>
#include <memory>
#include <string>
#include "BackendAdapter.h"

namespace media {

class BackendFactory {
public:
    virtual ~BackendFactory() = default;

    // 引擎上下文创建失败时返回错误信息
    virtual auto create(BackendKind kind, int serial, BackendEventSink& sink)
        -> std::expected<std::unique_ptr<BackendAdapter>, std::string> = 0;
};

} // namespace media
