#include "huginn/segment_merger.h"
#include <string>

namespace huginn {

namespace {

std::string join_texts(const std::vector<std::string>& texts) {
    std::string joined;
    for (size_t i = 0; i < texts.size(); ++i) {
        if (i > 0) joined += " ";
        joined += texts[i];
    }
    return joined;
}

} // anonymous namespace

std::vector<LanguageSegment> merge_consecutive_language_segments(
    const std::vector<LanguageSegment>& segments)
{
    std::vector<LanguageSegment> merged;
    if (segments.empty()) {
        return merged;
    }

    // Open span: texts are accumulated and joined once when the span closes
    LanguageSegment current = segments.front();
    std::vector<std::string> texts = {segments.front().text};

    for (size_t i = 1; i < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (seg.language == current.language) {
            current.end = seg.end;
            texts.push_back(seg.text);
            continue;
        }

        current.text = join_texts(texts);
        merged.push_back(std::move(current));

        current = seg;
        texts = {seg.text};
    }

    current.text = join_texts(texts);
    merged.push_back(std::move(current));

    return merged;
}

} // namespace huginn
