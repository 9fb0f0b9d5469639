#include "UniversalAdapter.h"
#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <logger.h>
extern "C" {
#include <mpv/client.h>
}

namespace media {
namespace {
enum PropertyId : uint64_t {
    PROP_TIME_POS = 1,
    PROP_DURATION,
    PROP_PAUSE,
    PROP_SPEED,
    PROP_EOF_REACHED,
    PROP_ASPECT,
    PROP_TRACK_COUNT
};

std::string toUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
    return text;
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

struct TrackFields {
    int64_t id{0};
    std::string type;
    std::string title;
    std::string lang;
    std::string codec;
    int64_t channels{0};
    int64_t sampleRate{0};
    int64_t ffIndex{-1};
    int64_t width{0};
    int64_t height{0};
};

TrackFields readTrack(const mpv_node& node)
{
    TrackFields fields;
    if (node.format != MPV_FORMAT_NODE_MAP) {
        return fields;
    }
    const mpv_node_list* map = node.u.list;
    for (int i = 0; i < map->num; ++i) {
        std::string key = map->keys[i];
        const mpv_node& value = map->values[i];
        if (value.format == MPV_FORMAT_STRING) {
            if (key == "type") {
                fields.type = value.u.string;
            } else if (key == "title") {
                fields.title = value.u.string;
            } else if (key == "lang") {
                fields.lang = value.u.string;
            } else if (key == "codec") {
                fields.codec = value.u.string;
            }
        } else if (value.format == MPV_FORMAT_INT64) {
            if (key == "id") {
                fields.id = value.u.int64;
            } else if (key == "demux-channel-count") {
                fields.channels = value.u.int64;
            } else if (key == "demux-samplerate") {
                fields.sampleRate = value.u.int64;
            } else if (key == "ff-index") {
                fields.ffIndex = value.u.int64;
            } else if (key == "demux-w") {
                fields.width = value.u.int64;
            } else if (key == "demux-h") {
                fields.height = value.u.int64;
            }
        }
    }
    return fields;
}

// "#0 • ENG • Commentary • AAC • 5.1 • 48 kHz"
std::string describeTrack(const TrackFields& track, int ordinal)
{
    std::string name = "#" + std::to_string(ordinal);
    auto append = [&name](const std::string& part) {
        name += " • ";
        name += part;
    };
    if (!track.lang.empty()) {
        append(toUpper(track.lang));
    }
    if (!track.title.empty() && toLower(track.title) != toLower(track.lang)) {
        append(track.title);
    }
    if (!track.codec.empty()) {
        append(toUpper(track.codec));
    }
    if (track.channels > 0) {
        append(UniversalAdapter::formatChannelCount(static_cast<int>(track.channels)));
    }
    if (track.sampleRate > 0) {
        append(std::to_string(track.sampleRate / 1000) + " kHz");
    }
    return name;
}
} // namespace

UniversalAdapter::UniversalAdapter(int serial, BackendEventSink& sink, const Options& options)
    : m_serial(serial), m_sink(sink)
{
    NEAPU_FUNC_TRACE;
    m_mpv = mpv_create();
    if (!m_mpv) {
        NEAPU_LOGE("Failed to create mpv context");
        throw std::runtime_error("Failed to create mpv context");
    }

    if (options.windowId != 0) {
        int64_t wid = options.windowId;
        mpv_set_option(m_mpv, "wid", MPV_FORMAT_INT64, &wid);
    }
    const std::pair<const char*, std::string> stringOptions[] = {
        {"vo", options.vo},
        {"hwdec", options.hwdec},
        {"keep-open", "yes"},
        {"idle", "yes"},
        {"ytdl", "no"},
        {"load-scripts", "no"},
        {"input-default-bindings", "no"},
        {"input-vo-keyboard", "no"},
        {"osc", "no"},
        {"terminal", "no"},
        {"sid", "no"},
        {"hr-seek", "yes"},
    };
    for (const auto& [name, value] : stringOptions) {
        int ret = mpv_set_option_string(m_mpv, name, value.c_str());
        if (ret < 0) {
            NEAPU_LOGW("mpv option {}={} rejected: {}", name, value, mpv_error_string(ret));
        }
    }

    int ret = mpv_initialize(m_mpv);
    if (ret < 0) {
        std::string error = mpv_error_string(ret);
        NEAPU_LOGE("Failed to initialize mpv: {}", error);
        mpv_terminate_destroy(m_mpv);
        m_mpv = nullptr;
        throw std::runtime_error("Failed to initialize mpv: " + error);
    }

    mpv_request_log_messages(m_mpv, "warn");
    mpv_observe_property(m_mpv, PROP_TIME_POS, "time-pos", MPV_FORMAT_DOUBLE);
    mpv_observe_property(m_mpv, PROP_DURATION, "duration", MPV_FORMAT_DOUBLE);
    mpv_observe_property(m_mpv, PROP_PAUSE, "pause", MPV_FORMAT_FLAG);
    mpv_observe_property(m_mpv, PROP_SPEED, "speed", MPV_FORMAT_DOUBLE);
    mpv_observe_property(m_mpv, PROP_EOF_REACHED, "eof-reached", MPV_FORMAT_FLAG);
    mpv_observe_property(m_mpv, PROP_ASPECT, "video-params/aspect", MPV_FORMAT_DOUBLE);
    mpv_observe_property(m_mpv, PROP_TRACK_COUNT, "track-list/count", MPV_FORMAT_INT64);

    m_eventThread = std::thread(&UniversalAdapter::eventLoop, this);
    NEAPU_LOGI("Universal backend initialized (hwdec={}, vo={})", options.hwdec, options.vo);
}
UniversalAdapter::~UniversalAdapter()
{
    teardown();
}

std::string UniversalAdapter::formatChannelCount(int channels)
{
    switch (channels) {
    case 1:
        return "Mono";
    case 2:
        return "Stereo";
    case 6:
        return "5.1";
    case 8:
        return "7.1";
    default:
        return std::to_string(channels) + " ch";
    }
}

void UniversalAdapter::eventLoop()
{
    while (!m_stopping.load()) {
        mpv_event* event = mpv_wait_event(m_mpv, -1);
        if (!event || event->event_id == MPV_EVENT_SHUTDOWN) {
            break;
        }
        if (event->event_id == MPV_EVENT_NONE) {
            continue;
        }
        handleEvent(*event);
    }
    NEAPU_LOGD("mpv event loop exited");
}

void UniversalAdapter::handleEvent(const mpv_event& event)
{
    switch (event.event_id) {
    case MPV_EVENT_PROPERTY_CHANGE:
        handlePropertyChange(event);
        break;
    case MPV_EVENT_FILE_LOADED: {
        NEAPU_LOGI("mpv file loaded");
        m_fileLoaded.store(true);
        refreshTrackList();
        BackendEvent ready;
        ready.type = BackendEvent::Type::Ready;
        post(std::move(ready));
        break;
    }
    case MPV_EVENT_END_FILE: {
        auto* endFile = static_cast<mpv_event_end_file*>(event.data);
        if (endFile && endFile->reason == MPV_END_FILE_REASON_ERROR) {
            std::string message = mpv_error_string(endFile->error);
            NEAPU_LOGE("mpv end file error: {}", message);
            BackendEvent failed;
            failed.type = BackendEvent::Type::Failed;
            failed.failure = BackendEvent::FailureKind::Terminal;
            failed.message = "Unable to play media: " + message;
            post(std::move(failed));
        } else if (endFile && endFile->reason == MPV_END_FILE_REASON_EOF) {
            BackendEvent end;
            end.type = BackendEvent::Type::EndOfMedia;
            post(std::move(end));
        }
        break;
    }
    case MPV_EVENT_LOG_MESSAGE: {
        auto* message = static_cast<mpv_event_log_message*>(event.data);
        std::string text = message->text ? message->text : "";
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        NEAPU_LOGD("[mpv/{}] {}: {}", message->prefix, message->level, text);
        break;
    }
    case MPV_EVENT_COMMAND_REPLY:
    case MPV_EVENT_SET_PROPERTY_REPLY:
        if (event.error < 0) {
            NEAPU_LOGW("mpv request failed: {}", mpv_error_string(event.error));
        }
        break;
    default:
        break;
    }
}

void UniversalAdapter::handlePropertyChange(const mpv_event& event)
{
    auto* property = static_cast<mpv_event_property*>(event.data);
    if (!property || property->format == MPV_FORMAT_NONE || !property->data) {
        return;
    }
    BackendEvent out;
    switch (event.reply_userdata) {
    case PROP_TIME_POS:
        m_timePos.store(*static_cast<double*>(property->data));
        out.type = BackendEvent::Type::TimeChanged;
        out.value = m_timePos.load();
        break;
    case PROP_DURATION:
        m_duration.store(*static_cast<double*>(property->data));
        out.type = BackendEvent::Type::DurationChanged;
        out.value = m_duration.load();
        break;
    case PROP_PAUSE:
        m_paused.store(*static_cast<int*>(property->data) != 0);
        out.type = BackendEvent::Type::PlayingChanged;
        out.flag = !m_paused.load();
        break;
    case PROP_SPEED:
        m_speed.store(*static_cast<double*>(property->data));
        out.type = BackendEvent::Type::RateChanged;
        out.value = m_speed.load();
        break;
    case PROP_EOF_REACHED:
        if (*static_cast<int*>(property->data) == 0) {
            return;
        }
        NEAPU_LOGI("mpv reached end of file, holding last frame");
        out.type = BackendEvent::Type::EndOfMedia;
        break;
    case PROP_ASPECT: {
        double aspect = *static_cast<double*>(property->data);
        if (aspect <= 0.0) {
            return;
        }
        m_aspect.store(aspect);
        out.type = BackendEvent::Type::AspectRatioChanged;
        out.value = aspect;
        break;
    }
    case PROP_TRACK_COUNT:
        refreshTrackList();
        out.type = BackendEvent::Type::TracksChanged;
        break;
    default:
        return;
    }
    post(std::move(out));
}

void UniversalAdapter::refreshTrackList()
{
    mpv_node node;
    if (mpv_get_property(m_mpv, "track-list", MPV_FORMAT_NODE, &node) < 0) {
        return;
    }
    std::vector<NativeTrack> audio;
    std::vector<NativeTrack> subtitles;
    std::vector<VideoTrackInfo> video;
    if (node.format == MPV_FORMAT_NODE_ARRAY) {
        for (int i = 0; i < node.u.list->num; ++i) {
            auto fields = readTrack(node.u.list->values[i]);
            if (fields.id <= 0) {
                continue;
            }
            if (fields.type == "audio") {
                NativeTrack track;
                track.nativeId = static_cast<int>(fields.id);
                track.name = describeTrack(fields, static_cast<int>(audio.size()));
                track.channels = static_cast<int>(fields.channels);
                track.sampleRate = static_cast<int>(fields.sampleRate);
                if (fields.ffIndex >= 0) {
                    track.sourceIndex = static_cast<int>(fields.ffIndex);
                }
                audio.push_back(std::move(track));
            } else if (fields.type == "sub") {
                NativeTrack track;
                track.nativeId = static_cast<int>(fields.id);
                track.name = describeTrack(fields, static_cast<int>(subtitles.size()));
                if (fields.ffIndex >= 0) {
                    track.sourceIndex = static_cast<int>(fields.ffIndex);
                }
                subtitles.push_back(std::move(track));
            } else if (fields.type == "video") {
                VideoTrackInfo info;
                info.width = static_cast<int>(fields.width);
                info.height = static_cast<int>(fields.height);
                info.hasFormat = !fields.codec.empty();
                info.decodable = true;
                video.push_back(info);
            }
        }
    }
    mpv_free_node_contents(&node);

    std::lock_guard<std::mutex> lock(m_trackMutex);
    m_audioTracks = std::move(audio);
    m_subtitleTracks = std::move(subtitles);
    m_videoTracks = std::move(video);
}

void UniversalAdapter::post(BackendEvent event)
{
    if (m_stopping.load()) {
        return;
    }
    event.serial = m_serial;
    m_sink.post(std::move(event));
}

void UniversalAdapter::command(const std::vector<std::string>& args)
{
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    int ret = mpv_command_async(m_mpv, 0, argv.data());
    if (ret < 0) {
        NEAPU_LOGW("mpv command {} failed: {}", args.front(), mpv_error_string(ret));
    }
}
void UniversalAdapter::setFlag(const char* name, bool value)
{
    int flag = value ? 1 : 0;
    int ret = mpv_set_property_async(m_mpv, 0, name, MPV_FORMAT_FLAG, &flag);
    if (ret < 0) {
        NEAPU_LOGW("mpv set {} failed: {}", name, mpv_error_string(ret));
    }
}
void UniversalAdapter::setDouble(const char* name, double value)
{
    int ret = mpv_set_property_async(m_mpv, 0, name, MPV_FORMAT_DOUBLE, &value);
    if (ret < 0) {
        NEAPU_LOGW("mpv set {} failed: {}", name, mpv_error_string(ret));
    }
}
void UniversalAdapter::setString(const char* name, const std::string& value)
{
    const char* data = value.c_str();
    int ret = mpv_set_property_async(m_mpv, 0, name, MPV_FORMAT_STRING, &data);
    if (ret < 0) {
        NEAPU_LOGW("mpv set {}={} failed: {}", name, value, mpv_error_string(ret));
    }
}

void UniversalAdapter::prepare(const MediaSource& source, double startTime)
{
    NEAPU_LOGI("Universal backend opening {} at {:.3f}s", source.path, startTime);
    m_fileLoaded.store(false);
    setFlag("pause", true);
    setString("start", std::format("{:.6f}", std::max(0.0, startTime)));
    command({"loadfile", source.path, "replace"});
}
void UniversalAdapter::play()
{
    setFlag("pause", false);
}
void UniversalAdapter::pause()
{
    setFlag("pause", true);
}
bool UniversalAdapter::isPlaying() const
{
    return m_fileLoaded.load() && !m_paused.load();
}
double UniversalAdapter::rate() const
{
    return m_speed.load();
}
void UniversalAdapter::setRate(double rate)
{
    m_speed.store(rate);
    setDouble("speed", rate);
}
void UniversalAdapter::seek(double seconds)
{
    double duration = m_duration.load();
    if (duration > 0.0) {
        // 留出最后一帧，避免触发 eof
        seconds = std::min(seconds, std::max(0.0, duration - 0.05));
    }
    seconds = std::max(0.0, seconds);
    m_timePos.store(seconds);
    command({"seek", std::format("{:.6f}", seconds), "absolute"});
}
double UniversalAdapter::currentTime() const
{
    return m_timePos.load();
}
double UniversalAdapter::currentDuration() const
{
    return m_duration.load();
}

std::vector<VideoTrackInfo> UniversalAdapter::videoTracks() const
{
    std::lock_guard<std::mutex> lock(m_trackMutex);
    return m_videoTracks;
}
std::vector<NativeTrack> UniversalAdapter::enumerateAudioTracks() const
{
    std::lock_guard<std::mutex> lock(m_trackMutex);
    return m_audioTracks;
}
std::vector<NativeTrack> UniversalAdapter::enumerateSubtitleTracks() const
{
    std::lock_guard<std::mutex> lock(m_trackMutex);
    return m_subtitleTracks;
}
void UniversalAdapter::selectAudioTrack(int nativeId)
{
    setString("aid", std::to_string(nativeId));
}
void UniversalAdapter::selectSubtitleTrack(std::optional<int> nativeId)
{
    setString("sid", nativeId ? std::to_string(*nativeId) : std::string("no"));
}
void UniversalAdapter::setVolume(double volume)
{
    setDouble("volume", std::clamp(volume, 0.0, 100.0));
}
void UniversalAdapter::setMuted(bool muted)
{
    setFlag("mute", muted);
}
std::optional<double> UniversalAdapter::reportedAspectRatio() const
{
    double aspect = m_aspect.load();
    if (aspect > 0.0) {
        return aspect;
    }
    return std::nullopt;
}

void UniversalAdapter::teardown()
{
    if (!m_mpv) {
        return;
    }
    NEAPU_FUNC_TRACE;
    m_stopping.store(true);
    mpv_wakeup(m_mpv);
    if (m_eventThread.joinable()) {
        m_eventThread.join();
    }
    mpv_terminate_destroy(m_mpv);
    m_mpv = nullptr;
}

} // namespace media
