#include "DefaultBackendFactory.h"
#include <logger.h>
#include "PrimaryAdapter.h"

namespace media {

DefaultBackendFactory::DefaultBackendFactory(QObject* videoOutput, UniversalAdapter::Options options)
    : m_videoOutput(videoOutput), m_options(std::move(options))
{
}

auto DefaultBackendFactory::create(BackendKind kind, int serial, BackendEventSink& sink)
    -> std::expected<std::unique_ptr<BackendAdapter>, std::string>
{
    NEAPU_LOGI("Creating {} backend, serial={}", backendKindName(kind), serial);
    try {
        switch (kind) {
        case BackendKind::Primary:
            return std::expected<std::unique_ptr<BackendAdapter>, std::string>(
                std::make_unique<PrimaryAdapter>(serial, sink, m_videoOutput));
        case BackendKind::Universal:
            return std::expected<std::unique_ptr<BackendAdapter>, std::string>(
                std::make_unique<UniversalAdapter>(serial, sink, m_options));
        default:
            break;
        }
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Failed to create ") + backendKindName(kind) + " backend: " + e.what());
    }
    return std::unexpected(std::string("Unknown backend kind"));
}

} // namespace media
