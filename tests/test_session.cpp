/**
 * @file test_session.cpp
 * @brief End-to-end tests for SpeechSession over the linked native engine
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "scripted_engine.h"
#include "vgl/client/vgl_speech_session.h"

using namespace vgl::client;
namespace wire = vgl::wire;
using vgl_test::one_second_audio;
using vgl_test::RecordingDiagnostics;
using vgl_test::ScriptedEngine;

namespace {

SessionConfig test_config() {
    SessionConfig config;
    config.model_path = "model.bin";
    config.wake_words = {"Hey Assistant"};
    config.log_level = "warn";
    return config;
}

// Each engine call returns the next line; the last one repeats.
void script_lines(std::vector<std::string> lines) {
    auto call = std::make_shared<std::atomic<size_t>>(0);
    ScriptedEngine::instance().set_script([lines, call](const std::vector<float>&) {
        const size_t n = (*call)++;
        return lines[std::min(n, lines.size() - 1)];
    });
}

vgl_bool_t refuse_fragment(const char* /*text*/, size_t /*len*/, void* /*user_data*/) {
    return VGL_FALSE;
}

// The reader thread fills the transcript asynchronously.
bool wait_for_fragments(const SpeechSession& session, size_t count) {
    for (int i = 0; i < 500; ++i) {
        if (session.transcript().size() >= count) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return false;
}

class SpeechSessionTest : public ::testing::Test {
   protected:
    void SetUp() override {
        vgl_shutdown();
        ScriptedEngine::instance().install();
        baseline_ = vgl_outstanding_buffers();
    }

    void TearDown() override {
        vgl_shutdown();
        EXPECT_EQ(vgl_outstanding_buffers(), baseline_);
    }

    RecordingDiagnostics diagnostics_;
    OwnershipTracker tracker_;
    size_t baseline_ = 0;
};

}  // namespace

// =============================================================================
// LIFECYCLE
// =============================================================================

TEST_F(SpeechSessionTest, StartBuildsContext) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_, &tracker_);
    EXPECT_FALSE(session.is_running());

    session.start();

    EXPECT_TRUE(session.is_running());
    wire::Context context = session.context();
    EXPECT_EQ(context.model_path, "model.bin");
    EXPECT_EQ(context.wake_words, std::vector<std::string>{"Hey Assistant"});

    session.stop();
    EXPECT_FALSE(session.is_running());
    EXPECT_TRUE(tracker_.balanced());
}

TEST_F(SpeechSessionTest, StartFailsWhenModelCannotLoad) {
    SessionConfig config = test_config();
    config.model_path = "models/corrupt.bin";
    SpeechSession session(config, Boundary::native(), diagnostics_);

    try {
        session.start();
        FAIL() << "expected EngineFault";
    } catch (const vgl::EngineFault& e) {
        EXPECT_EQ(e.code(), VGL_ERROR_NULL_RESPONSE);
    }
    EXPECT_FALSE(session.is_running());
    EXPECT_NO_THROW(session.stop());
}

TEST_F(SpeechSessionTest, CallsBeforeStartAreRejected) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    EXPECT_THROW(session.detect(one_second_audio()), std::logic_error);
    EXPECT_THROW(session.context(), std::logic_error);
}

TEST_F(SpeechSessionTest, StartTwiceIsRejected) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();
    EXPECT_THROW(session.start(), std::logic_error);
    session.stop();
    session.stop();
}

// =============================================================================
// OPERATIONS
// =============================================================================

TEST_F(SpeechSessionTest, DetectThenTranscribe) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_, &tracker_);
    session.start();

    wire::WakeWordDetection detection = session.detect(one_second_audio()).get();
    EXPECT_TRUE(detection.detected);
    EXPECT_EQ(detection.start_index, 0u);
    EXPECT_EQ(detection.end_index, 13u);

    EXPECT_EQ(session.transcribe(one_second_audio()).get(), "open the door");
    EXPECT_EQ(session.context().transcript, "open the door");

    session.stop();
    EXPECT_TRUE(tracker_.balanced());
}

TEST_F(SpeechSessionTest, StagedAudioIsUsedWhenNoSamplesGiven) {
    size_t seen_samples = 0;
    ScriptedEngine::instance().set_script([&seen_samples](const std::vector<float>& samples) {
        seen_samples = samples.size();
        return std::string(vgl_test::kWakeSentence);
    });

    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();

    unwrap(session.stage_audio(std::vector<float>(8000, 0.1f)).get());
    EXPECT_TRUE(session.detect().get().detected);
    EXPECT_EQ(seen_samples, 8000u);

    session.stop();
}

TEST_F(SpeechSessionTest, ErrorReplySurfacesAsEngineFault) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();
    const wire::Context before = session.context();

    // Another registration takes over the native side, then goes away
    ASSERT_EQ(vgl_register_callback(&refuse_fragment, nullptr), VGL_SUCCESS);
    vgl_unregister_callback(&refuse_fragment, nullptr);

    try {
        session.listen(one_second_audio()).get();
        FAIL() << "expected EngineFault";
    } catch (const vgl::EngineFault& e) {
        EXPECT_STREQ(e.what(), "delivery channel not registered");
    }
    EXPECT_EQ(session.context(), before);

    session.stop();
}

TEST_F(SpeechSessionTest, DebugEchoes) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();
    EXPECT_EQ(session.debug("ping").get(), "ping");
    session.stop();
}

// =============================================================================
// STREAMING AND COMMANDS
// =============================================================================

TEST_F(SpeechSessionTest, ListenStreamsFragmentsAndFindsCommand) {
    script_lines({"Hey Assistant", "open the door"});

    SpeechSession session(test_config(), Boundary::native(), diagnostics_, &tracker_);
    session.start();

    std::vector<float> two_seconds(VGL_ENGINE_SAMPLE_RATE * 2, 0.2f);
    EXPECT_EQ(session.listen(two_seconds, 1000).get(), "Hey Assistant open the door");

    ASSERT_TRUE(wait_for_fragments(session, 2));
    const std::vector<std::string> expected = {"Hey Assistant", "open the door"};
    EXPECT_EQ(session.transcript(), expected);

    EXPECT_EQ(session.process_commands(), std::optional<std::string>("Open: the door"));
    EXPECT_EQ(session.command(), std::optional<std::string>("Open: the door"));

    session.stop();
    EXPECT_TRUE(tracker_.balanced());
}

TEST_F(SpeechSessionTest, TranscriptKeepsUniqueFragments) {
    script_lines({"Hey Assistant"});

    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();

    std::vector<float> three_seconds(VGL_ENGINE_SAMPLE_RATE * 3, 0.2f);
    session.listen(three_seconds, 1000).get();
    session.listen(one_second_audio(), 1000).get();
    session.stop();

    // Every delivered fragment is the same text
    EXPECT_EQ(session.transcript(), std::vector<std::string>{"Hey Assistant"});
    EXPECT_EQ(session.process_commands(), std::nullopt);
}

TEST_F(SpeechSessionTest, StopKeepsFragmentsNotYetRead) {
    script_lines({"Hey Assistant", "please", "open the window"});

    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();

    std::vector<float> three_seconds(VGL_ENGINE_SAMPLE_RATE * 3, 0.2f);
    session.listen(three_seconds, 1000).get();
    session.stop();

    const std::vector<std::string> expected = {"Hey Assistant", "please", "open the window"};
    EXPECT_EQ(session.transcript(), expected);
    EXPECT_EQ(session.process_commands(), std::optional<std::string>("Open: the window"));
}

TEST_F(SpeechSessionTest, CommandSurvivesSentenceWithoutOpen) {
    script_lines({"open the garage", "thanks", "that is all"});

    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();

    session.listen(one_second_audio(), 1000).get();
    ASSERT_TRUE(wait_for_fragments(session, 1));
    EXPECT_EQ(session.process_commands(), std::optional<std::string>("Open: the garage"));

    std::vector<float> two_seconds(VGL_ENGINE_SAMPLE_RATE * 2, 0.2f);
    session.listen(two_seconds, 1000).get();
    ASSERT_TRUE(wait_for_fragments(session, 3));
    EXPECT_EQ(session.process_commands(), std::optional<std::string>("Open: the garage"));

    session.stop();
}

TEST_F(SpeechSessionTest, StopDrainsQueuedCalls) {
    SpeechSession session(test_config(), Boundary::native(), diagnostics_);
    session.start();

    std::future<std::string> pending = session.transcribe(one_second_audio());
    session.stop();

    EXPECT_EQ(pending.get(), "open the door");
}

// =============================================================================
// COMMAND EXTRACTION
// =============================================================================

TEST(ExtractCommand, FindsTargetAfterOpen) {
    EXPECT_EQ(extract_command("Hey Assistant, open the door"),
              std::optional<std::string>("Open: the door"));
    EXPECT_EQ(extract_command("OPEN   Spotify  "), std::optional<std::string>("Open: Spotify"));
}

TEST(ExtractCommand, NoTargetOrNoOpen) {
    EXPECT_EQ(extract_command("please open"), std::nullopt);
    EXPECT_EQ(extract_command("close the door"), std::nullopt);
    EXPECT_EQ(extract_command(""), std::nullopt);
}
