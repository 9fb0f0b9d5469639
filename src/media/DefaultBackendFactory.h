#pragma once
#include "BackendFactory.h"
#include "UniversalAdapter.h"

class QObject;

namespace media {

// 构造真实的 Qt Multimedia / libmpv 引擎
class DefaultBackendFactory final : public BackendFactory {
public:
    DefaultBackendFactory(QObject* videoOutput, UniversalAdapter::Options options);

    auto create(BackendKind kind, int serial, BackendEventSink& sink)
        -> std::expected<std::unique_ptr<BackendAdapter>, std::string> override;

    void setUniversalOptions(const UniversalAdapter::Options& options) { m_options = options; }

private:
    QObject* m_videoOutput{nullptr};
    UniversalAdapter::Options m_options;
};

} // namespace media
