#include "MediaInfo.h"
#include <algorithm>
#include <array>
#include <cctype>

namespace media {

bool MediaMetadata::isProfessionalIntermediate() const
{
    static constexpr std::array<const char*, 10> PRORES_CODECS = {
        "prores", "prores_ks", "ap4h", "ap4x", "apcn", "apch", "apcs", "apco", "aprn", "aprh"};

    auto* video = primaryVideoStream();
    if (!video || video->codec.empty()) {
        return false;
    }
    std::string codec = video->codec;
    std::transform(codec.begin(), codec.end(), codec.begin(), [](unsigned char c) { return std::tolower(c); });
    return std::any_of(PRORES_CODECS.begin(), PRORES_CODECS.end(), [&codec](const char* name) {
        return codec.find(name) != std::string::npos;
    });
}

std::optional<double> MediaMetadata::displayAspectRatio() const
{
    auto* video = primaryVideoStream();
    if (!video) {
        return std::nullopt;
    }
    if (auto dar = video->displayAspectRatio.value(); dar && *dar > 0.0) {
        return dar;
    }
    if (video->width > 0 && video->height > 0) {
        double ratio = static_cast<double>(video->width) / video->height;
        if (auto sar = video->sampleAspectRatio.value(); sar && *sar > 0.0) {
            ratio *= *sar;
        }
        return ratio;
    }
    return std::nullopt;
}

} // namespace media
