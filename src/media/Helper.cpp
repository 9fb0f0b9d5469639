#include "Helper.h"
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/pixdesc.h>
}

namespace media {
std::string getFFmpegErrorString(int errNum)
{
    char errBuf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errNum, errBuf, sizeof(errBuf));
    return std::string(errBuf);
}
std::string getAVCodecIDString(int codecId)
{
    return avNameOrEmpty(avcodec_get_name(static_cast<AVCodecID>(codecId)));
}
std::string getAVPixelFormatString(int pixFmt)
{
    return avNameOrEmpty(av_get_pix_fmt_name(static_cast<AVPixelFormat>(pixFmt)));
}
std::string avNameOrEmpty(const char* name)
{
    if (!name) {
        return {};
    }
    std::string value(name);
    if (value == "unknown" || value == "unspecified" || value == "none") {
        return {};
    }
    return value;
}
} // namespace media
