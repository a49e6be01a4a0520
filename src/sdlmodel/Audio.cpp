#include <sdlmodel/sdlmodel.hpp>

// AudioData ------------------------------------------------------------------

sdlmodel::AudioData sdlmodel::AudioData::loadWAV(const std::filesystem::path& path) {
    SDL_AudioSpec spec{};
    uint8_t* buffer{nullptr};
    uint32_t length{0};
    if (!SDL_LoadWAV(path.string().c_str(), &spec, &buffer, &length)) {
        Logger::global()->logError("Cannot load WAV %s: %s", path.string().c_str(), SDL_GetError());
        throw std::runtime_error(std::format("Cannot load WAV {}: {}", path.string(), SDL_GetError()));
    }
    std::vector<uint8_t> bytes(buffer, buffer + length);
    SDL_free(buffer);
    return AudioData{spec, std::move(bytes)};
}

// AudioDevice ----------------------------------------------------------------

std::string sdlmodel::AudioDevice::name() const {
    auto s = SDL_GetAudioDeviceName(deviceId_);
    return s ? s : "";
}

SDL_AudioSpec sdlmodel::AudioDevice::spec() const {
    SDL_AudioSpec ret{};
    if (deviceId_ == 0 || !SDL_GetAudioDeviceFormat(deviceId_, &ret, nullptr))
        return SDL_AudioSpec{};
    return ret;
}

int sdlmodel::AudioDevice::sampleFrames() const {
    SDL_AudioSpec spec{};
    int ret{0};
    if (deviceId_ == 0 || !SDL_GetAudioDeviceFormat(deviceId_, &spec, &ret))
        return 0;
    return ret;
}

std::vector<sdlmodel::AudioPlaybackDevice> sdlmodel::AudioDevice::playbackDevices() {
    int count{0};
    auto ids = SDL_GetAudioPlaybackDevices(&count);
    if (!ids) {
        Logger::global()->logError("Unable to get audio playback devices: %s", SDL_GetError());
        throw std::runtime_error(std::format("Unable to get audio playback devices: {}", SDL_GetError()));
    }
    std::vector<AudioPlaybackDevice> ret{};
    for (int i = 0; i < count; i++)
        ret.emplace_back(ids[i]);
    SDL_free(ids);
    return ret;
}

std::vector<sdlmodel::AudioRecordingDevice> sdlmodel::AudioDevice::recordingDevices() {
    int count{0};
    auto ids = SDL_GetAudioRecordingDevices(&count);
    std::vector<AudioRecordingDevice> ret{};
    if (!ids)
        return ret;
    for (int i = 0; i < count; i++)
        ret.emplace_back(ids[i]);
    SDL_free(ids);
    return ret;
}

std::string sdlmodel::AudioDevice::currentDriverName() {
    auto s = SDL_GetCurrentAudioDriver();
    return s ? s : "";
}

std::vector<std::string> sdlmodel::AudioDevice::driverNames() {
    std::vector<std::string> ret{};
    auto count = SDL_GetNumAudioDrivers();
    for (int i = 0; i < count; i++)
        if (auto name = SDL_GetAudioDriver(i))
            ret.emplace_back(name);
    return ret;
}

// AudioPlaybackDevice / AudioRecordingDevice ---------------------------------

sdlmodel::AudioPlaybackDevice sdlmodel::AudioPlaybackDevice::defaultDevice() {
    auto devices = playbackDevices();
    if (devices.empty())
        throw std::runtime_error("No playback devices available.");
    return devices[0];
}

std::shared_ptr<sdlmodel::LogicalPlaybackDevice> sdlmodel::AudioPlaybackDevice::open() {
    auto deviceSpec = spec();
    auto id = SDL_OpenAudioDevice(deviceId_, &deviceSpec);
    if (id == 0) {
        Logger::global()->logError("Cannot open audio device %s: %s", name().c_str(), SDL_GetError());
        throw std::runtime_error(std::format("Cannot open audio device: {}", SDL_GetError()));
    }
    return std::make_shared<LogicalPlaybackDevice>(id);
}

std::future<void> sdlmodel::AudioPlaybackDevice::play(const AudioData& data, float volume) {
    auto device = open();
    device->volume(volume);
    auto played = device->play(data);
    return std::async(std::launch::async, [device, played = std::move(played)]() mutable {
        played.wait();
        device->dispose();
    });
}

sdlmodel::AudioRecordingDevice sdlmodel::AudioRecordingDevice::defaultDevice() {
    auto devices = recordingDevices();
    if (devices.empty())
        throw std::runtime_error("No recording devices available.");
    return devices[0];
}

std::future<void> sdlmodel::playAudio(const AudioData& data, float volume) {
    return AudioPlaybackDevice::defaultDevice().play(data, volume);
}

// LogicalPlaybackDevice ------------------------------------------------------

sdlmodel::LogicalPlaybackDevice::LogicalPlaybackDevice(SDL_AudioDeviceID opened) :
    AudioPlaybackDevice(opened), device_(opened) {
}

sdlmodel::LogicalPlaybackDevice::~LogicalPlaybackDevice() {
    dispose();
}

void sdlmodel::LogicalPlaybackDevice::dispose() {
    if (disposed())
        return;
    for (auto& stream : *streams_.snapshot())
        stream->dispose();
    streams_.clear();
    device_.reset();
    deviceId_ = 0;
}

float sdlmodel::LogicalPlaybackDevice::volume() const {
    return disposed() ? 0.0f : SDL_GetAudioDeviceGain(device_.get());
}

void sdlmodel::LogicalPlaybackDevice::volume(float value) {
    if (!disposed())
        SDL_SetAudioDeviceGain(device_.get(), value);
}

std::vector<std::shared_ptr<sdlmodel::AudioStream>> sdlmodel::LogicalPlaybackDevice::streams() const {
    return *streams_.snapshot();
}

void sdlmodel::LogicalPlaybackDevice::removeStream(AudioStream* stream) {
    streams_.removeIf([stream](const std::shared_ptr<AudioStream>& s) { return s.get() == stream; });
}

std::shared_ptr<sdlmodel::AudioStream> sdlmodel::LogicalPlaybackDevice::createStream(const SDL_AudioSpec& sourceSpec, AudioDataRequested onDataRequested) {
    if (disposed())
        throw std::runtime_error("Cannot create a stream on a closed audio device");
    auto deviceSpec = spec();
    auto stream = SDL_CreateAudioStream(&sourceSpec, &deviceSpec);
    if (!stream) {
        Logger::global()->logError("Cannot create audio stream: %s", SDL_GetError());
        throw std::runtime_error(std::format("Cannot create audio stream: {}", SDL_GetError()));
    }
    auto ret = std::make_shared<AudioStream>(this, stream, std::move(onDataRequested));
    if (!SDL_BindAudioStream(device_.get(), stream)) {
        Logger::global()->logError("Cannot bind audio stream: %s", SDL_GetError());
        throw std::runtime_error(std::format("Cannot bind audio stream: {}", SDL_GetError()));
    }
    streams_.add(ret);
    return ret;
}

std::future<void> sdlmodel::LogicalPlaybackDevice::play(const AudioData& data) {
    auto drained = std::make_shared<std::promise<void>>();
    auto signalled = std::make_shared<std::atomic<bool>>(false);
    auto future = drained->get_future();

    auto stream = createStream(data.spec(), [drained, signalled](AudioStream& s, int, int) {
        if ((s.disposed() || s.queuedBytes() == 0) && !signalled->exchange(true))
            drained->set_value();
    });
    stream->queue(data);
    stream->flush();
    stream->paused(false);

    // the stream cannot be destroyed from within its own callback.
    return std::async(std::launch::async, [stream, future = std::move(future)]() mutable {
        future.wait();
        stream->dispose();
    });
}

// AudioStream ----------------------------------------------------------------

sdlmodel::AudioStream::AudioStream(LogicalPlaybackDevice* device, SDL_AudioStream* stream, AudioDataRequested onDataRequested) :
    stream_(stream), device_(device), onDataRequested_(std::move(onDataRequested)) {
    SDL_SetAudioStreamGetCallback(stream, getDataCallback, this);
}

sdlmodel::AudioStream::~AudioStream() {
    dispose();
}

void SDLCALL sdlmodel::AudioStream::getDataCallback(void* userData, SDL_AudioStream*, int additionalAmount, int totalAmount) {
    auto self = static_cast<AudioStream*>(userData);
    if (self->onDataRequested_)
        self->onDataRequested_(*self, additionalAmount, totalAmount);
}

void sdlmodel::AudioStream::dispose() {
    if (!stream_.reset())
        return;
    if (auto device = std::exchange(device_, nullptr))
        device->removeStream(this);
    if (onDataRequested_)
        onDataRequested_(*this, 0, 0);
}

float sdlmodel::AudioStream::volume() const {
    return disposed() ? 0.0f : SDL_GetAudioStreamGain(stream_.get());
}

void sdlmodel::AudioStream::volume(float value) {
    if (value < 0.0f || value > 1.0f)
        throw std::out_of_range("Volume must be between 0.0 and 1.0");
    if (!disposed())
        SDL_SetAudioStreamGain(stream_.get(), value);
}

int sdlmodel::AudioStream::queuedBytes() const {
    return disposed() ? 0 : SDL_GetAudioStreamQueued(stream_.get());
}

bool sdlmodel::AudioStream::paused() const {
    return disposed() || SDL_AudioStreamDevicePaused(stream_.get());
}

void sdlmodel::AudioStream::paused(bool value) {
    if (disposed())
        return;
    if (value)
        SDL_PauseAudioStreamDevice(stream_.get());
    else
        SDL_ResumeAudioStreamDevice(stream_.get());
}

void sdlmodel::AudioStream::clear() {
    if (!disposed())
        SDL_ClearAudioStream(stream_.get());
}

void sdlmodel::AudioStream::flush() {
    if (!disposed())
        SDL_FlushAudioStream(stream_.get());
}

bool sdlmodel::AudioStream::queue(std::span<const uint8_t> bytes) {
    if (disposed())
        return false;
    return SDL_PutAudioStreamData(stream_.get(), bytes.data(), static_cast<int>(bytes.size()));
}
