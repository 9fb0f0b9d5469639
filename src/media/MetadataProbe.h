#pragma once
#include <expected>
#include <string>
#include "MediaInfo.h"

namespace media {

// 同步探测，调用方负责放到工作线程
class MetadataProbe {
public:
    static auto probe(const std::string& path) -> std::expected<MediaMetadata, std::string>;
};

} // namespace media
