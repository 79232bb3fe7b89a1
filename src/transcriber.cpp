#include "huginn/transcriber.h"
#include "huginn/audio_extractor.h"
#include "huginn/language_report.h"
#include "huginn/mel_spectrogram.h"
#include <ctranslate2/devices.h>
#include <ctranslate2/models/whisper.h>
#include <ctranslate2/types.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace huginn {

namespace {

constexpr int SAMPLE_RATE = 16000;
constexpr int N_FFT = 400;
constexpr int HOP_LENGTH = 160;
constexpr int CHUNK_FRAMES = 3000;                 // 30 seconds of mel frames
constexpr int CHUNK_SAMPLES = CHUNK_FRAMES * HOP_LENGTH;
constexpr float FRAME_SECONDS = 0.01f;             // 10ms per mel frame
constexpr size_t MAX_PROMPT_TOKENS = 223;          // Half the text context, minus <|startofprev|>

const std::string GPT2_SPACE = "\xC4\xA0";         // Ġ in UTF-8 (U+0120)

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

bool is_bracketed(const std::string& token) {
    return token.size() >= 4 && token.compare(0, 2, "<|") == 0 &&
           token.compare(token.size() - 2, 2, "|>") == 0;
}

/**
 * @brief Parse a timestamp token like "<|0.00|>" and return the time in seconds
 * @return Time in seconds, or -1.0f if not a valid timestamp token
 */
float parse_timestamp_token(const std::string& token) {
    if (token.size() < 6 || !is_bracketed(token)) {
        return -1.0f;
    }

    std::string inner = token.substr(2, token.size() - 4);
    bool has_dot = false;
    for (char c : inner) {
        if (c == '.') {
            if (has_dot) return -1.0f;
            has_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1.0f;
        }
    }
    if (!has_dot) {
        return -1.0f;
    }

    std::istringstream iss(inner);
    float value = -1.0f;
    iss >> value;
    return iss.fail() ? -1.0f : value;
}

/**
 * @brief Check if a token starts a new word (has GPT-2 BPE space marker Ġ)
 *
 * - "Ġdon" starts word "don"
 * - "'t" continues the previous word, giving "don't"
 */
bool is_word_start(const std::string& token) {
    return token.compare(0, GPT2_SPACE.size(), GPT2_SPACE) == 0;
}

/**
 * @brief Check if a token is punctuation-only (no alphanumeric content)
 */
bool is_punctuation_only(const std::string& token) {
    std::string text = is_word_start(token) ? token.substr(GPT2_SPACE.size()) : token;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) >= 0x80) {
            return false;
        }
    }
    return true;
}

std::string replace_bpe_space(const std::string& token, const std::string& with) {
    std::string processed = token;
    size_t pos = 0;
    while ((pos = processed.find(GPT2_SPACE, pos)) != std::string::npos) {
        processed.replace(pos, GPT2_SPACE.size(), with);
        pos += with.size();
    }
    return processed;
}

/**
 * @brief Text of a decoded token sequence, special and timestamp tokens removed
 */
std::string extract_text(const std::vector<std::string>& tokens) {
    std::string text;
    for (const auto& token : tokens) {
        if (is_bracketed(token)) {
            continue;
        }
        text += replace_bpe_space(token, " ");
    }
    return trim(text);
}

/**
 * @brief Linear interpolation resampler for in-memory input
 */
std::vector<float> resample_linear(const std::vector<float>& input, int from_rate, int to_rate) {
    if (from_rate <= 0) {
        throw std::invalid_argument("Invalid sample rate: " + std::to_string(from_rate));
    }
    if (from_rate == to_rate || input.empty()) {
        return input;
    }

    const double ratio = static_cast<double>(from_rate) / to_rate;
    size_t out_size = static_cast<size_t>(input.size() / ratio);
    std::vector<float> output(out_size);

    for (size_t i = 0; i < out_size; ++i) {
        double pos = i * ratio;
        size_t idx = static_cast<size_t>(pos);
        double frac = pos - idx;
        float a = input[std::min(idx, input.size() - 1)];
        float b = input[std::min(idx + 1, input.size() - 1)];
        output[i] = static_cast<float>(a + (b - a) * frac);
    }
    return output;
}

/**
 * @brief Heuristic word timing inside a segment
 *
 * Whisper segments often start with silence, so speech is aligned to the END
 * of the segment at ~0.35 s per word and distributed by character count.
 */
void estimate_word_timings(Segment& seg, const std::vector<std::string>& words) {
    if (words.empty()) return;

    float seg_duration = seg.end - seg.start;
    float speech_duration = std::min(seg_duration, words.size() * 0.35f);
    float speech_start = seg.end - speech_duration;

    size_t total_chars = 0;
    for (const auto& w : words) {
        total_chars += w.length();
    }

    float word_start = speech_start;
    for (const auto& text : words) {
        Word w;
        w.word = text;
        w.start = word_start;
        float word_duration = (total_chars > 0)
            ? speech_duration * (float(text.length()) / float(total_chars))
            : speech_duration / float(words.size());
        w.end = word_start + word_duration;
        w.probability = 1.0f;
        seg.words.push_back(w);
        word_start = w.end;
    }
}

/**
 * @brief Split decoded tokens into segments on Whisper timestamp tokens
 *
 * Text after the last timestamp closes at window_end.
 */
std::vector<Segment> extract_timestamped_segments(
    const std::vector<std::string>& tokens,
    float window_start,
    float window_end,
    bool word_timestamps
) {
    std::vector<Segment> segments;

    float current_start = -1.0f;
    std::string current_text;
    std::vector<std::string> word_buffer;

    auto close_segment = [&](float end_time) {
        std::string text = trim(current_text);
        if (!text.empty() && current_start >= 0.0f) {
            Segment seg;
            seg.start = current_start;
            seg.end = std::max(current_start, std::min(end_time, window_end));
            seg.text = text;
            if (word_timestamps) {
                estimate_word_timings(seg, word_buffer);
            }
            segments.push_back(seg);
        }
        current_text.clear();
        word_buffer.clear();
    };

    for (const auto& token : tokens) {
        float timestamp = parse_timestamp_token(token);

        if (timestamp >= 0.0f) {
            float absolute_time = std::min(window_start + timestamp, window_end);
            if (current_start >= 0.0f && !trim(current_text).empty()) {
                close_segment(absolute_time);
            }
            current_start = absolute_time;
            continue;
        }

        if (is_bracketed(token)) {
            continue;  // Language, task and other special tokens
        }

        if (current_start < 0.0f) {
            current_start = window_start;
        }
        current_text += replace_bpe_space(token, " ");

        if (word_timestamps) {
            // BPE-aware merging: Ġ starts a word, continuations and
            // punctuation attach to the previous word
            std::string token_text = replace_bpe_space(token, "");
            if (token_text.empty()) continue;

            if (word_buffer.empty() || (is_word_start(token) && !is_punctuation_only(token))) {
                word_buffer.push_back(token_text);
            } else {
                word_buffer.back() += token_text;
            }
        }
    }

    close_segment(window_end);
    return segments;
}

bool is_hallucination(const Segment& segment,
                      size_t num_tokens,
                      float avg_logprob,
                      float no_speech_prob,
                      const TranscribeOptions& options)
{
    // 1. No-speech detection (both conditions must be met)
    if (no_speech_prob > options.no_speech_threshold && avg_logprob < options.log_prob_threshold) {
        std::cerr << "[Huginn] Skipping no-speech segment (no_speech: " << no_speech_prob
                  << ", avg_logprob: " << avg_logprob << ")\n";
        return true;
    }

    // 2. Very low token count with poor confidence
    if (num_tokens <= 2 && avg_logprob < -0.5f) {
        std::cerr << "[Huginn] Skipping low-token hallucination: '" << segment.text
                  << "' (tokens: " << num_tokens << ", avg_logprob: " << avg_logprob << ")\n";
        return true;
    }

    // 3. Repetition: "Thank you Thank you" or "A A A A"
    std::vector<std::string> words;
    std::istringstream iss(segment.text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }

    if (words.size() >= 3) {
        int max_repeat_count = 1;
        for (size_t i = 0; i < words.size(); i++) {
            int repeat_count = 1;
            for (size_t j = i + 1; j < words.size() && words[j] == words[i]; j++) {
                repeat_count++;
            }
            max_repeat_count = std::max(max_repeat_count, repeat_count);
        }

        if (max_repeat_count >= static_cast<int>(words.size()) / 2 && max_repeat_count >= 3) {
            std::cerr << "[Huginn] Skipping repetitive hallucination: '"
                      << truncate_utf8(segment.text, 50)
                      << "' (repeat: " << max_repeat_count << "/" << words.size() << " words)\n";
            return true;
        }

        // Repeating 3-6 word phrases
        for (int ngram_size = 3; ngram_size <= 6 && ngram_size <= static_cast<int>(words.size()) / 2; ngram_size++) {
            std::map<std::string, int> ngram_counts;
            for (size_t i = 0; i + ngram_size <= words.size(); i++) {
                std::string ngram;
                for (int j = 0; j < ngram_size; j++) {
                    if (j > 0) ngram += " ";
                    ngram += words[i + j];
                }
                ngram_counts[ngram]++;
            }

            for (const auto& [ngram, count] : ngram_counts) {
                if (count >= 3) {
                    std::cerr << "[Huginn] Skipping phrase-repetition hallucination: '"
                              << ngram << "' repeated " << count << " times\n";
                    return true;
                }
            }
        }
    }

    // 4. Compression ratio check
    if (segment.compression_ratio > options.compression_ratio_threshold && avg_logprob < -0.5f) {
        std::cerr << "[Huginn] Skipping high-compression hallucination: '"
                  << truncate_utf8(segment.text, 50)
                  << "' (ratio: " << segment.compression_ratio << ", logprob: " << avg_logprob << ")\n";
        return true;
    }

    return false;
}

/**
 * @brief Retry with a higher temperature when the output looks degenerate
 */
bool needs_temperature_fallback(float compression_ratio, float avg_logprob, const TranscribeOptions& options) {
    return compression_ratio > options.compression_ratio_threshold ||
           avg_logprob < options.log_prob_threshold;
}

std::string model_name_from_path(const std::string& model_path) {
    static const char* names[] = {
        "large-v3-turbo", "large-v3", "large-v2", "large", "medium", "small", "base", "tiny"
    };
    for (const char* name : names) {
        if (model_path.find(name) != std::string::npos) {
            return name;
        }
    }
    return "unknown";
}

} // anonymous namespace

// =======================
// Transcriber::Impl
// =======================

class Transcriber::Impl {
public:
    struct WindowResult {
        std::vector<Segment> segments;
        std::vector<std::string> text_tokens;   // Decoded text tokens for conditioning
        float temperature = 0.0f;
    };

    std::unique_ptr<ctranslate2::models::Whisper> model;
    MelSpectrogram mel_converter;
    std::string model_name;
    std::string device_str;
    std::string compute_type_str;

    Impl() : mel_converter(SAMPLE_RATE, N_FFT, 80, HOP_LENGTH) {}

    ctranslate2::StorageView make_features(const std::vector<float>& window) const {
        return ctranslate2::StorageView(
            ctranslate2::Shape{1,
                               static_cast<ctranslate2::dim_t>(mel_converter.getMelBins()),
                               static_cast<ctranslate2::dim_t>(CHUNK_FRAMES)},
            window);
    }

    // Detect language from one 30-second feature window
    std::pair<std::string, float> detect_language(const std::vector<float>& window) {
        auto features = make_features(window);
        auto future_results = model->detect_language(features);
        if (future_results.empty()) {
            throw std::runtime_error("Language detection returned no result");
        }

        auto lang_probs = future_results[0].get();
        if (lang_probs.empty()) {
            throw std::runtime_error("Language detection returned no languages");
        }

        auto best = std::max_element(lang_probs.begin(), lang_probs.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });

        // Strip <| and |> markers
        std::string lang_code = best->first;
        if (is_bracketed(lang_code)) {
            lang_code = lang_code.substr(2, lang_code.size() - 4);
        }

        std::cout << "[Huginn] Detected language: " << lang_code
                  << " (probability: " << best->second << ")\n";

        return {lang_code, best->second};
    }

    WindowResult transcribe_window(const std::vector<float>& window,
                                   float window_start,
                                   float window_duration,
                                   const TranscribeOptions& options,
                                   const std::vector<std::string>& previous_tokens);
};

Transcriber::Impl::WindowResult Transcriber::Impl::transcribe_window(
    const std::vector<float>& window,
    float window_start,
    float window_duration,
    const TranscribeOptions& options,
    const std::vector<std::string>& previous_tokens)
{
    WindowResult window_result;
    auto features = make_features(window);

    // Prompt: [<|startofprev|>, prev..., <|startoftranscript|>, <|lang|>, <|task|>]
    std::vector<std::string> prompt_tokens;
    if (!previous_tokens.empty()) {
        prompt_tokens.push_back("<|startofprev|>");
        size_t first = previous_tokens.size() > MAX_PROMPT_TOKENS
            ? previous_tokens.size() - MAX_PROMPT_TOKENS : 0;
        prompt_tokens.insert(prompt_tokens.end(), previous_tokens.begin() + first, previous_tokens.end());
    }
    prompt_tokens.push_back("<|startoftranscript|>");
    if (model->is_multilingual()) {
        prompt_tokens.push_back("<|" + options.language + "|>");
        prompt_tokens.push_back("<|" + options.task + "|>");
    }

    const std::vector<std::vector<std::string>> prompts = {prompt_tokens};

    const auto temperatures = options.temperature_fallback.empty()
        ? std::vector<float>{options.temperature}
        : options.temperature_fallback;

    const float window_end = window_start + window_duration;

    for (size_t temp_idx = 0; temp_idx < temperatures.size(); ++temp_idx) {
        float current_temp = temperatures[temp_idx];

        // Matching faster-whisper defaults
        ctranslate2::models::WhisperOptions whisper_options;
        whisper_options.beam_size = current_temp > 0.0f ? 1 : options.beam_size;
        whisper_options.patience = options.patience;
        whisper_options.length_penalty = options.length_penalty;
        whisper_options.repetition_penalty = options.repetition_penalty;
        whisper_options.no_repeat_ngram_size = options.no_repeat_ngram_size;
        whisper_options.max_length = options.max_length;
        whisper_options.sampling_topk = (current_temp > 0.0f) ? 0 : 1;
        whisper_options.sampling_temperature = current_temp > 0.0f ? current_temp : 1.0f;
        whisper_options.num_hypotheses = 1;
        whisper_options.return_scores = true;
        whisper_options.return_no_speech_prob = true;
        whisper_options.max_initial_timestamp_index = 50;
        whisper_options.suppress_blank = options.suppress_blank;
        whisper_options.suppress_tokens = options.suppress_tokens;

        auto future_results = model->generate(features, prompts, whisper_options);
        if (future_results.empty()) {
            throw std::runtime_error("No results from Whisper inference");
        }

        auto result = future_results[0].get();
        if (result.sequences.empty()) {
            throw std::runtime_error("Whisper inference returned no sequence");
        }

        const auto& tokens = result.sequences[0];
        size_t num_tokens = result.sequences_ids.empty() ? tokens.size() : result.sequences_ids[0].size();

        float avg_logprob = 0.0f;
        if (result.has_scores() && !result.scores.empty()) {
            avg_logprob = result.scores[0] / static_cast<float>(num_tokens + 1);
        }

        std::string full_text = extract_text(tokens);
        float compression_ratio = static_cast<float>(num_tokens) /
            static_cast<float>(std::max(1, static_cast<int>(full_text.length())));

        if (needs_temperature_fallback(compression_ratio, avg_logprob, options) &&
            temp_idx + 1 < temperatures.size()) {
            std::cout << "[Huginn] Temperature fallback: T=" << current_temp
                      << " -> T=" << temperatures[temp_idx + 1]
                      << " (compression=" << compression_ratio
                      << ", logprob=" << avg_logprob << ")\n";
            continue;
        }

        window_result.temperature = current_temp;

        auto segments = extract_timestamped_segments(tokens, window_start, window_end,
                                                     options.word_timestamps);
        const size_t tokens_per_segment = num_tokens / std::max(size_t(1), segments.size());

        for (auto& seg : segments) {
            seg.avg_logprob = avg_logprob;
            seg.no_speech_prob = result.no_speech_prob;
            seg.temperature = current_temp;
            seg.compression_ratio = static_cast<float>(tokens_per_segment) /
                static_cast<float>(std::max(1, static_cast<int>(seg.text.length())));

            if (is_hallucination(seg, tokens_per_segment, avg_logprob, result.no_speech_prob, options)) {
                continue;
            }

            std::cout << "[Huginn] Segment [" << seg.start << "-" << seg.end << "]: "
                      << truncate_utf8(seg.text, 80) << "\n";
            window_result.segments.push_back(seg);
        }

        for (const auto& token : tokens) {
            if (!is_bracketed(token)) {
                window_result.text_tokens.push_back(token);
            }
        }

        break;
    }

    return window_result;
}

// =======================
// Transcriber Public API
// =======================

Transcriber::Transcriber(const ModelOptions& options)
    : pimpl_(std::make_unique<Impl>())
{
    try {
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "HUGINN - LOADING WHISPER MODEL\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

        pimpl_->model_name = model_name_from_path(options.model_path);
        pimpl_->device_str = options.device_string();
        pimpl_->compute_type_str = options.compute_type_string();

        std::cout << "Model: " << pimpl_->model_name << " (" << options.model_path << ")\n";
        std::cout << "Device: " << pimpl_->device_str << ", compute type: " << pimpl_->compute_type_str << "\n";

        ctranslate2::Device ct_device = ctranslate2::str_to_device(pimpl_->device_str);
        ctranslate2::ComputeType ct_compute = ctranslate2::str_to_compute_type(pimpl_->compute_type_str);
        std::vector<int> device_indices(static_cast<size_t>(std::max(1, options.inter_threads)),
                                        options.device_index);

        pimpl_->model = std::make_unique<ctranslate2::models::Whisper>(
            options.model_path,
            ct_device,
            ct_compute,
            device_indices
        );

        size_t num_languages = pimpl_->model->num_languages();
        bool is_multilingual = pimpl_->model->is_multilingual();
        size_t n_mels = pimpl_->model->n_mels();

        std::cout << "Languages: " << (is_multilingual ? "Multilingual" : "English-only")
                  << " (" << num_languages << " languages)\n";
        std::cout << "Mel features: " << n_mels << "\n";

        if (n_mels != static_cast<size_t>(pimpl_->mel_converter.getMelBins())) {
            pimpl_->mel_converter = MelSpectrogram(SAMPLE_RATE, N_FFT, static_cast<int>(n_mels), HOP_LENGTH);
        }

        std::cout << "✓ Model loaded successfully\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

    } catch (const std::exception& e) {
        std::cerr << "✗ Failed to load Whisper model: " << e.what() << "\n";
        std::cerr << "═══════════════════════════════════════════════════════════\n";
        throw std::runtime_error("Failed to load Whisper model from " + options.model_path + ": " + e.what());
    }
}

namespace {

ModelOptions make_model_options(const std::string& model_path,
                                const std::string& device,
                                const std::string& compute_type)
{
    ModelOptions options;
    options.model_path = model_path;

    if (device == "cuda") options.device = DeviceType::CUDA;
    else if (device == "cpu") options.device = DeviceType::CPU;
    else options.device = DeviceType::Auto;

    if (compute_type == "float32") options.compute_type = ComputeType::Float32;
    else if (compute_type == "float16") options.compute_type = ComputeType::Float16;
    else if (compute_type == "int8") options.compute_type = ComputeType::Int8;
    else if (compute_type == "int8_float16") options.compute_type = ComputeType::Int8Float16;
    else options.compute_type = ComputeType::Auto;

    return options;
}

} // anonymous namespace

Transcriber::Transcriber(const std::string& model_path,
                         const std::string& device,
                         const std::string& compute_type)
    : Transcriber(make_model_options(model_path, device, compute_type))
{
}

Transcriber::~Transcriber() = default;

Transcriber::Transcriber(Transcriber&&) noexcept = default;
Transcriber& Transcriber::operator=(Transcriber&&) noexcept = default;

TranscribeResult Transcriber::transcribe(
    const std::vector<float>& audio_samples,
    int sample_rate,
    const TranscribeOptions& options)
{
    if (!pimpl_->model) {
        throw std::runtime_error("Whisper model not loaded");
    }

    TranscribeResult result;
    std::vector<float> audio = resample_linear(audio_samples, sample_rate, SAMPLE_RATE);

    // Clip window, timestamps shifted back afterwards
    float clip_offset = 0.0f;
    float full_duration = audio.size() / static_cast<float>(SAMPLE_RATE);
    if (options.clip_start > 0.0f || (options.clip_end >= 0.0f && options.clip_end < full_duration)) {
        float clip_start = std::max(0.0f, options.clip_start);
        float clip_end = (options.clip_end < 0.0f) ? full_duration : std::min(full_duration, options.clip_end);

        if (clip_start < clip_end) {
            size_t start_sample = static_cast<size_t>(clip_start * SAMPLE_RATE);
            size_t end_sample = std::min(static_cast<size_t>(clip_end * SAMPLE_RATE), audio.size());
            audio = std::vector<float>(audio.begin() + start_sample, audio.begin() + end_sample);
            clip_offset = clip_start;

            std::cout << "[Huginn] Clipping audio: " << clip_start << "s - " << clip_end << "s ("
                      << audio.size() << " samples)\n";
        }
    }

    result.duration = audio.size() / static_cast<float>(SAMPLE_RATE);
    const int content_frames = static_cast<int>(audio.size() / HOP_LENGTH);

    TranscribeOptions effective_options = options;
    const bool auto_language = options.language.empty() || options.language == AUTO_LANGUAGE;

    if (content_frames == 0) {
        std::cout << "[Huginn] Audio too short to transcribe (" << audio.size() << " samples)\n";
        result.language = auto_language ? UNKNOWN_LANGUAGE : options.language;
        return result;
    }

    // Whisper appends 30s of silence before the log-mel so every window is full length
    audio.resize(audio.size() + CHUNK_SAMPLES, 0.0f);
    MelFeatures mel = pimpl_->mel_converter.compute(audio);

    std::cout << "[Huginn] Mel-spectrogram: " << content_frames << " frames x "
              << mel.n_mels << " mels\n";

    if (!pimpl_->model->is_multilingual()) {
        effective_options.language = "en";
        result.language = "en";
        result.language_probability = 1.0f;
    } else if (auto_language) {
        try {
            auto [detected_lang, lang_prob] = pimpl_->detect_language(mel.window(0, CHUNK_FRAMES));
            effective_options.language = detected_lang;
            result.language = detected_lang;
            result.language_probability = lang_prob;
        } catch (const std::exception& e) {
            std::cerr << "[Huginn] Language detection failed: " << e.what()
                      << ", decoding as English\n";
            effective_options.language = "en";
            result.language = UNKNOWN_LANGUAGE;
            result.language_probability = 0.0f;
        }
    } else {
        result.language = options.language;
        result.language_probability = 1.0f;
    }

    std::vector<std::string> previous_tokens;
    if (!options.initial_prompt.empty()) {
        // Whitespace words as BPE tokens; words outside the vocabulary map to the unknown token
        std::istringstream words(options.initial_prompt);
        std::string word;
        while (words >> word) {
            previous_tokens.push_back(GPT2_SPACE + word);
        }
    }

    // Track repeated segments across windows ("Thank you" loops)
    std::map<std::string, int> segment_text_counts;

    const int num_windows = (content_frames + CHUNK_FRAMES - 1) / CHUNK_FRAMES;
    for (int seek = 0, window_idx = 0; seek < content_frames; seek += CHUNK_FRAMES, ++window_idx) {
        const int window_frames = std::min(CHUNK_FRAMES, content_frames - seek);
        const float window_start = seek * FRAME_SECONDS;

        if (num_windows > 1) {
            std::cout << "[Huginn] Window " << (window_idx + 1) << "/" << num_windows
                      << " [" << window_start << "s]\n";
        }

        auto window_result = pimpl_->transcribe_window(
            mel.window(seek, CHUNK_FRAMES),
            window_start,
            window_frames * FRAME_SECONDS,
            effective_options,
            previous_tokens);

        for (auto& seg : window_result.segments) {
            std::string normalized = seg.text;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            if (++segment_text_counts[normalized] >= 3) {
                std::cerr << "[Huginn] Skipping cross-window hallucination (appears "
                          << segment_text_counts[normalized] << " times): '" << seg.text << "'\n";
                continue;
            }
            result.segments.push_back(std::move(seg));
        }

        if (!options.condition_on_previous ||
            window_result.temperature >= options.prompt_reset_on_temperature) {
            previous_tokens.clear();
        } else {
            previous_tokens.insert(previous_tokens.end(),
                                   window_result.text_tokens.begin(), window_result.text_tokens.end());
        }
    }

    for (size_t i = 0; i < result.segments.size(); ++i) {
        auto& seg = result.segments[i];
        seg.id = static_cast<int>(i);
        seg.language = result.language;
        seg.start += clip_offset;
        seg.end += clip_offset;
        for (auto& word : seg.words) {
            word.start += clip_offset;
            word.end += clip_offset;
        }

        if (!result.text.empty()) result.text += " ";
        result.text += seg.text;
    }

    std::cout << "[Huginn] Transcribed " << result.segments.size() << " segment(s), language="
              << result.language << "\n";

    return result;
}

TranscribeResult Transcriber::transcribe(const std::string& audio_path,
                                         const TranscribeOptions& options)
{
    std::cout << "[Huginn] Loading audio from: " << audio_path << "\n";

    AudioExtractor extractor;
    std::vector<float> samples;
    float duration = 0.0f;
    if (!extractor.extract_audio(audio_path, samples, duration)) {
        throw std::runtime_error("Failed to read audio from " + audio_path + ": " +
                                 extractor.get_last_error());
    }

    return transcribe(samples, SAMPLE_RATE, options);
}

Transcriber::ModelInfo Transcriber::get_model_info() const {
    if (!pimpl_->model) {
        throw std::runtime_error("Model not loaded");
    }

    ModelInfo info;
    info.is_multilingual = pimpl_->model->is_multilingual();
    info.n_mels = static_cast<int>(pimpl_->model->n_mels());
    info.num_languages = static_cast<int>(pimpl_->model->num_languages());
    info.model_type = pimpl_->model_name;
    return info;
}

} // namespace huginn
