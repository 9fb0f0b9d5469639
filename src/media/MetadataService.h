#pragma once
#include <QObject>
#include <expected>
#include <functional>
#include <string>
#include "MediaInfo.h"
#include "ThreadPool.h"

namespace media {

// 探测在线程池中执行，结果回到本对象所在线程
class MetadataService : public QObject {
    Q_OBJECT
public:
    using Prober = std::function<std::expected<MediaMetadata, std::string>(const std::string& path)>;

    explicit MetadataService(QObject* parent = nullptr);
    MetadataService(Prober prober, size_t threads, QObject* parent = nullptr);
    ~MetadataService() override;

    void request(const std::string& sourceId, const std::string& path);

signals:
    void metadataReady(const std::string& sourceId, const media::MediaMetadata& metadata);
    void metadataFailed(const std::string& sourceId, const std::string& message);

private:
    Prober m_prober;
    ThreadPool m_pool;
};

} // namespace media
