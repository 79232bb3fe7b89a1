#include "huginn/audio_extractor.h"
#include "huginn/multilang_transcriber.h"
#include "huginn/subtitle_export.h"
#include "huginn/whisper_models.h"
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Huginn - Multi-Language Transcription Example\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    std::string audio_path = (argc > 1) ? argv[1] : "interview.mp4";
    std::string models_dir = (argc > 2) ? argv[2] : "models";

    try {
        // One loaded model per size, shared by sampling and retranscription
        huginn::CachedModelProvider models(huginn::whisper_model_loader(models_dir));
        huginn::AudioExtractor slicer;

        huginn::MultilangOptions options;
        options.model_size = "base";
        options.classification.min_secondary_hits = 1;

        huginn::MultilangTranscriber pipeline(models, slicer, options);

        auto result = pipeline.transcribe_multilang(audio_path,
            [](const std::string& message, std::optional<float> percent) {
                std::cout << "[Example] " << message;
                if (percent) std::cout << " (" << static_cast<int>(*percent) << "%)";
                std::cout << "\n";
            });

        std::cout << "\n═══════════════════════════════════════════════════════════\n";
        std::cout << "LANGUAGE TIMELINE (" << huginn::to_string(result.classification.mode) << ")\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << result.timeline << "\n\n";

        for (const auto& span : result.language_segments) {
            std::cout << "[" << span.start << "s - " << span.end << "s] "
                      << span.language << ": " << span.text << "\n";
        }

        huginn::SubtitleExportOptions export_options;
        export_options.format = huginn::SubtitleFormat::VTT;
        export_options.vtt_lang_spans = true;

        huginn::SubtitleExporter exporter;
        std::cout << "\n[Example] Wrote " << exporter.export_subtitles(result.language_segments, audio_path, export_options)
                  << "\n";

    } catch (const std::exception& e) {
        std::cerr << "[Example] ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
