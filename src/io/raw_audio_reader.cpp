#include "emodata/raw_audio_reader.h"
#include "emodata/annotations.h"
#include "emodata/arff_reader.h"
#include "emodata/audio_utils.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"
#include <filesystem>
#include <fstream>

namespace emodata {
namespace io {

    std::string default_raw_annotation_path(const std::string& list_path) {
        return (std::filesystem::path(list_path).parent_path() / "labels.txt").string();
    }

    std::vector<std::string> read_file_list(const std::string& list_path) {
        if (!std::filesystem::exists(list_path)) {
            throw SourceReadError("File list not found: " + list_path);
        }
        std::ifstream file(list_path);
        if (!file.is_open()) {
            throw SourceReadError("Cannot open file list: " + list_path);
        }

        std::vector<std::string> paths;
        std::string line;
        while (std::getline(file, line)) {
            std::string entry = arff_utils::trim(line);
            if (!entry.empty()) {
                paths.push_back(entry);
            }
        }
        return paths;
    }

    RawTable read_raw_audio(const std::string& list_path,
                            const std::optional<std::string>& annotation_path) {
        const auto entries = read_file_list(list_path);
        const auto annotations = parse_classification_annotations(
            annotation_path.value_or(default_raw_annotation_path(list_path)));
        const std::filesystem::path list_dir = std::filesystem::path(list_path).parent_path();

        RawTable table;
        table.layout = TableLayout::WAVEFORMS;
        table.attribute_names = {"pcm"};
        table.names.reserve(entries.size());
        table.waveforms.reserve(entries.size());
        table.label_tokens.reserve(entries.size());

        WavLoader loader;
        for (const auto& entry : entries) {
            std::filesystem::path audio_path(entry);
            if (audio_path.is_relative() && !std::filesystem::exists(audio_path)) {
                audio_path = list_dir / audio_path;
            }

            std::string name = audio_path.stem().string();
            auto it = annotations.find(name);
            if (it == annotations.end()) {
                throw MissingLabelError(name);
            }

            AudioBuffer buffer;
            try {
                buffer = loader.loadFile(audio_path.string());
            } catch (const AudioError& e) {
                throw SourceReadError(e.what());
            }
            buffer.convertToMono();

            const auto& samples = buffer.getData();
            Eigen::MatrixXd waveform(static_cast<Eigen::Index>(samples.size()), 1);
            for (size_t i = 0; i < samples.size(); ++i) {
                waveform(static_cast<Eigen::Index>(i), 0) = samples[i];
            }

            table.names.push_back(name);
            table.waveforms.push_back(std::move(waveform));
            table.label_tokens.push_back(it->second);
        }

        Logger::instance().log_source_read("raw", list_path, table.size());
        return table;
    }

} // namespace io
} // namespace emodata
