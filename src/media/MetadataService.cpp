#include "MetadataService.h"
#include <logger.h>
#include <stdexcept>
#include "MetadataProbe.h"

namespace media {

MetadataService::MetadataService(QObject* parent)
    : MetadataService(&MetadataProbe::probe, 2, parent)
{
}
MetadataService::MetadataService(Prober prober, size_t threads, QObject* parent)
    : QObject(parent), m_prober(std::move(prober)), m_pool(threads)
{
}
MetadataService::~MetadataService() = default;

void MetadataService::request(const std::string& sourceId, const std::string& path)
{
    NEAPU_LOGD("Metadata probe requested for {} ({})", sourceId, path);
    bool queued = m_pool.post([this, sourceId, path] {
        std::expected<MediaMetadata, std::string> result;
        try {
            result = m_prober(path);
        } catch (const std::exception& e) {
            result = std::unexpected(std::string(e.what()));
        }
        // 本对象销毁后排队的调用会被丢弃
        QMetaObject::invokeMethod(
            this,
            [this, sourceId, result = std::move(result)] {
                if (result) {
                    emit metadataReady(sourceId, *result);
                } else {
                    NEAPU_LOGW("Metadata probe failed for {}: {}", sourceId, result.error());
                    emit metadataFailed(sourceId, result.error());
                }
            },
            Qt::QueuedConnection);
    });
    if (!queued) {
        NEAPU_LOGW("Metadata service is stopping, dropped request for {}", sourceId);
    }
}

} // namespace media
