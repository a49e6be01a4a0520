#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <SDL3/SDL.h>
#include "copy-on-write.hpp"
#include "disposable.hpp"
#include "native-handle.hpp"

namespace sdlmodel {

    class AudioPlaybackDevice;
    class AudioRecordingDevice;
    class LogicalPlaybackDevice;
    class AudioStream;

    // Decoded PCM data with its format.
    class AudioData {
        SDL_AudioSpec spec_;
        std::vector<uint8_t> bytes_;

    public:
        AudioData(SDL_AudioSpec spec, std::vector<uint8_t> bytes) : spec_(spec), bytes_(std::move(bytes)) {}

        const SDL_AudioSpec& spec() const { return spec_; }
        std::span<const uint8_t> bytes() const { return bytes_; }

        // Throws std::runtime_error when the file cannot be loaded.
        static AudioData loadWAV(const std::filesystem::path& path);
    };

    // A physical audio device as enumerated by SDL.
    class AudioDevice {
    protected:
        SDL_AudioDeviceID deviceId_;

    public:
        explicit AudioDevice(SDL_AudioDeviceID deviceId) : deviceId_(deviceId) {}
        virtual ~AudioDevice() = default;

        SDL_AudioDeviceID id() const { return deviceId_; }
        std::string name() const;
        SDL_AudioSpec spec() const;
        int sampleFrames() const;
        // Only opened (logical) devices have a volume; -1 otherwise.
        virtual float volume() const { return -1.0f; }
        virtual void volume(float value) {}

        // Throws std::runtime_error when SDL cannot enumerate playback devices.
        static std::vector<AudioPlaybackDevice> playbackDevices();
        static std::vector<AudioRecordingDevice> recordingDevices();
        static std::string currentDriverName();
        static std::vector<std::string> driverNames();
    };

    class AudioPlaybackDevice : public AudioDevice {
    public:
        explicit AudioPlaybackDevice(SDL_AudioDeviceID deviceId) : AudioDevice(deviceId) {}

        // The first playback device. Throws std::runtime_error when there is none.
        static AudioPlaybackDevice defaultDevice();

        // Throws std::runtime_error when SDL cannot open the device.
        std::shared_ptr<LogicalPlaybackDevice> open();

        // Opens the device, plays the data and closes it again once the data is drained.
        std::future<void> play(const AudioData& data, float volume = 1.0f);
    };

    class AudioRecordingDevice : public AudioDevice {
    public:
        explicit AudioRecordingDevice(SDL_AudioDeviceID deviceId) : AudioDevice(deviceId) {}

        // The first recording device. Throws std::runtime_error when there is none.
        static AudioRecordingDevice defaultDevice();
    };

    // Invoked on the audio thread when the device wants more data from a stream,
    // and once more (with zero amounts) when the stream is disposed.
    using AudioDataRequested = std::function<void(AudioStream& stream, int additionalAmount, int totalAmount)>;

    // An opened device. Disposing it disposes its streams and closes the device.
    class LogicalPlaybackDevice : public AudioPlaybackDevice, public Disposable {
        NativeHandle<SDL_AudioDeviceID, SDL_CloseAudioDevice> device_;
        CopyOnWriteList<std::shared_ptr<AudioStream>> streams_{};

        friend class AudioStream;
        void removeStream(AudioStream* stream);

    public:
        explicit LogicalPlaybackDevice(SDL_AudioDeviceID opened);
        ~LogicalPlaybackDevice() override;

        void dispose() override;
        bool disposed() const override { return !device_.alive(); }

        float volume() const override;
        void volume(float value) override;

        std::vector<std::shared_ptr<AudioStream>> streams() const;
        // Throws std::runtime_error when SDL cannot create or bind the stream.
        std::shared_ptr<AudioStream> createStream(const SDL_AudioSpec& sourceSpec, AudioDataRequested onDataRequested = {});

        // Plays the data on a new stream; the future completes when the stream drained or was disposed.
        std::future<void> play(const AudioData& data);
    };

    class AudioStream : public Disposable {
        NativeHandle<SDL_AudioStream*, SDL_DestroyAudioStream> stream_;
        LogicalPlaybackDevice* device_;
        AudioDataRequested onDataRequested_;

        static void SDLCALL getDataCallback(void* userData, SDL_AudioStream* stream, int additionalAmount, int totalAmount);

    public:
        AudioStream(LogicalPlaybackDevice* device, SDL_AudioStream* stream, AudioDataRequested onDataRequested);
        ~AudioStream() override;

        SDL_AudioStream* handle() const { return stream_.get(); }
        void dispose() override;
        bool disposed() const override { return !stream_.alive(); }

        float volume() const;
        // Throws std::out_of_range unless 0 <= value <= 1.
        void volume(float value);
        int queuedBytes() const;
        bool paused() const;
        void paused(bool value);
        void clear();
        void flush();
        bool queue(std::span<const uint8_t> bytes);
        bool queue(const AudioData& data) { return queue(data.bytes()); }
    };

    // Plays the data on the default playback device.
    std::future<void> playAudio(const AudioData& data, float volume = 1.0f);

}
