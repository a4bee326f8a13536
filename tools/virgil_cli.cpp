/**
 * @file virgil_cli.cpp
 * @brief Virgil CLI - Wake-word detection and command transcription from a WAV file
 *
 * Usage:
 *   virgil-cli --audio <file.wav> [options]
 *
 * Options:
 *   --config, -c <path>     Session config (JSON)
 *   --model, -m <path>      Path to GGML Whisper model (overrides config)
 *   --audio, -a <path>      WAV file to process (required)
 *   --wake, -w <phrase>     Wake word, may be repeated (overrides config)
 *   --listen, -l            Stream windowed fragments instead of one transcription
 *   --library <path>        Native library to dlopen instead of the linked one
 *   --verbose, -v           Enable verbose logging
 *   --help, -h              Show this help message
 *
 * Environment Variables:
 *   VGL_MODEL_PATH          Model path (alternative to --model)
 *   VGL_LOG_LEVEL           Log level (trace, debug, info, warn, error, fatal)
 *
 * Example:
 *   virgil-cli -m models/ggml-tiny.en.bin -a command.wav -w "Hey Assistant"
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

#include "vgl/client/vgl_speech_session.h"
#include "vgl/core/vgl_audio_utils.h"
#include "vgl/core/vgl_logger.h"

using namespace vgl::client;

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

struct CliOptions {
    std::string configPath;
    std::string modelPath;
    std::string audioPath;
    std::string library;
    std::vector<std::string> wakeWords;
    bool listen = false;
    bool verbose = false;
    bool showHelp = false;
};

static void printUsage(const char* programName) {
    printf("Virgil CLI - Wake-word detection and command transcription\n\n");
    printf("Usage: %s --audio <file.wav> [options]\n\n", programName);
    printf("Required:\n");
    printf("  --audio, -a <path>      WAV file to process (PCM16 or float32)\n\n");
    printf("Options:\n");
    printf("  --config, -c <path>     Session config (JSON)\n");
    printf("  --model, -m <path>      Path to GGML Whisper model\n");
    printf("  --wake, -w <phrase>     Wake word, may be repeated\n");
    printf("  --listen, -l            Stream windowed fragments\n");
    printf("  --library <path>        Native library to load at runtime\n");
    printf("  --verbose, -v           Enable verbose logging\n");
    printf("  --help, -h              Show this help message\n\n");
    printf("Environment Variables:\n");
    printf("  VGL_MODEL_PATH          Model path (alternative to --model)\n");
    printf("  VGL_LOG_LEVEL           Log level\n\n");
    printf("Example:\n");
    printf("  %s -m models/ggml-tiny.en.bin -a command.wav -w \"Hey Assistant\"\n", programName);
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            opts.verbose = true;
        }
        else if (std::strcmp(arg, "--listen") == 0 || std::strcmp(arg, "-l") == 0) {
            opts.listen = true;
        }
        else if ((std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "-c") == 0) && i + 1 < argc) {
            opts.configPath = argv[++i];
        }
        else if ((std::strcmp(arg, "--model") == 0 || std::strcmp(arg, "-m") == 0) && i + 1 < argc) {
            opts.modelPath = argv[++i];
        }
        else if ((std::strcmp(arg, "--audio") == 0 || std::strcmp(arg, "-a") == 0) && i + 1 < argc) {
            opts.audioPath = argv[++i];
        }
        else if ((std::strcmp(arg, "--wake") == 0 || std::strcmp(arg, "-w") == 0) && i + 1 < argc) {
            opts.wakeWords.push_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--library") == 0 && i + 1 < argc) {
            opts.library = argv[++i];
        }
        else {
            fprintf(stderr, "Warning: ignoring unknown argument %s\n", arg);
        }
    }

    return opts;
}

static SessionConfig buildConfig(const CliOptions& opts) {
    SessionConfig config;
    if (!opts.configPath.empty()) {
        config = SessionConfig::load(opts.configPath);
    }
    // Environment overrides the file, command line overrides both
    config.apply_env_overrides();

    if (!opts.modelPath.empty()) config.model_path = opts.modelPath;
    if (!opts.wakeWords.empty()) config.wake_words = opts.wakeWords;
    if (!opts.library.empty()) config.native_library = opts.library;
    if (opts.verbose) config.log_level = "debug";
    if (config.wake_words.empty()) config.wake_words = {"Hey Assistant"};

    config.validate();
    return config;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    CliOptions opts = parseArgs(argc, argv);

    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    if (opts.audioPath.empty()) {
        fprintf(stderr, "Error: Audio file is required\n\n");
        printUsage(argv[0]);
        return 1;
    }

    SessionConfig config;
    try {
        config = buildConfig(opts);
    } catch (const ConfigError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    if (config.model_path.empty()) {
        fprintf(stderr, "Error: Model path is required (--model, config or VGL_MODEL_PATH)\n\n");
        printUsage(argv[0]);
        return 1;
    }

    vgl_logger_set_min_level(config.log_level_value());

    // Load and convert audio to 16 kHz mono
    vgl::audio::WavAudio wav;
    vgl_result_t result = vgl::audio::read_wav(opts.audioPath, wav);
    if (result != VGL_SUCCESS) {
        fprintf(stderr, "Error: Cannot read %s: %s\n", opts.audioPath.c_str(),
                vgl_error_message(result));
        return 1;
    }
    std::vector<float> samples = vgl::audio::to_engine_input(wav);
    printf("Audio: %s (%d Hz, %u ch) -> %zu samples at %d Hz\n", opts.audioPath.c_str(),
           wav.sample_rate, static_cast<unsigned>(wav.channels), samples.size(),
           VGL_ENGINE_SAMPLE_RATE);

    LoggerDiagnostics diagnostics;
    try {
        Boundary boundary = config.native_library.empty() ? Boundary::native()
                                                          : Boundary::load(config.native_library);
        SpeechSession session(config, boundary, diagnostics);
        session.start();

        unwrap(session.stage_audio(samples).get());

        vgl::wire::WakeWordDetection detection = session.detect().get();
        if (!detection.detected) {
            printf("No wake word detected\n");
            session.stop();
            return 0;
        }
        printf("Wake word detected at [%llu, %llu)\n",
               static_cast<unsigned long long>(*detection.start_index),
               static_cast<unsigned long long>(*detection.end_index));

        std::optional<std::string> command;
        if (opts.listen) {
            std::string text = session.listen().get();
            printf("Listened: %s\n", text.c_str());
            session.stop();

            for (const auto& fragment : session.transcript()) {
                printf("  fragment: %s\n", fragment.c_str());
            }
            command = session.process_commands();
        } else {
            std::string text = session.transcribe().get();
            printf("Transcript: %s\n", text.c_str());
            session.stop();
            command = extract_command(text);
        }

        if (command) {
            printf("%s\n", command->c_str());
        }
    } catch (const vgl::BridgeError& e) {
        fprintf(stderr, "Error [%s]: %s\n", e.category(), e.what());
        if (e.retryable()) {
            fprintf(stderr, "The engine may accept the same request on a later attempt\n");
        }
        return 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
