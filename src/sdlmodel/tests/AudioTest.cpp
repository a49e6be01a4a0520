#include <gtest/gtest.h>

#include <stdexcept>

#include <sdlmodel/sdlmodel.hpp>

namespace {

// Uses SDL's dummy audio driver so that no sound hardware is needed.
class AudioTest : public ::testing::Test {
protected:
    std::unique_ptr<sdlmodel::Application> app{};
    std::shared_ptr<sdlmodel::LogicalPlaybackDevice> device{};

    void SetUp() override {
        SDL_SetHint(SDL_HINT_AUDIO_DRIVER, "dummy");
        app = std::make_unique<sdlmodel::Application>(SDL_INIT_AUDIO);
        auto devices = sdlmodel::AudioDevice::playbackDevices();
        if (devices.empty())
            GTEST_SKIP() << "The dummy audio driver exposes no playback device.";
        device = devices[0].open();
    }

    void TearDown() override {
        device.reset();
        app.reset();
        SDL_ResetHint(SDL_HINT_AUDIO_DRIVER);
    }

    static SDL_AudioSpec stereoFloat() {
        return SDL_AudioSpec{SDL_AUDIO_F32, 2, 48000};
    }
};

}

TEST_F(AudioTest, DriverIsDummy) {
    EXPECT_EQ(sdlmodel::AudioDevice::currentDriverName(), "dummy");
    EXPECT_FALSE(sdlmodel::AudioDevice::driverNames().empty());
}

TEST_F(AudioTest, StreamVolumeMustBeInRange) {
    auto stream = device->createStream(stereoFloat());
    EXPECT_NO_THROW(stream->volume(0.5f));
    EXPECT_NEAR(stream->volume(), 0.5f, 1e-5);
    EXPECT_THROW(stream->volume(1.5f), std::out_of_range);
    EXPECT_THROW(stream->volume(-0.1f), std::out_of_range);
}

TEST_F(AudioTest, QueueAndClear) {
    auto stream = device->createStream(stereoFloat());
    stream->paused(true);
    std::vector<uint8_t> silence(4096, 0);
    EXPECT_TRUE(stream->queue(silence));
    EXPECT_GT(stream->queuedBytes(), 0);
    stream->clear();
    EXPECT_EQ(stream->queuedBytes(), 0);
}

TEST_F(AudioTest, DisposingDeviceDisposesStreamsAndNotifiesThem) {
    int finalCalls = 0;
    auto stream = device->createStream(stereoFloat(), [&](sdlmodel::AudioStream&, int additional, int total) {
        if (additional == 0 && total == 0)
            finalCalls++;
    });
    EXPECT_EQ(device->streams().size(), 1u);

    device->dispose();
    EXPECT_TRUE(device->disposed());
    EXPECT_TRUE(stream->disposed());
    EXPECT_TRUE(device->streams().empty());
    EXPECT_EQ(finalCalls, 1);

    stream->dispose();
    EXPECT_EQ(finalCalls, 1);
    EXPECT_EQ(stream->queuedBytes(), 0);
}

TEST(AudioDataTest, MissingWavThrows) {
    EXPECT_THROW(sdlmodel::AudioData::loadWAV("/nonexistent/sound.wav"), std::runtime_error);
}
