#pragma once

#include <vector>
#include <string>
#include <stdexcept>
#include <cstdint>
#include <fstream>

namespace emodata {

    /**
     * @brief Exception class for audio decoding errors
     */
    class AudioError : public std::runtime_error {
    public:
        explicit AudioError(const std::string& message)
            : std::runtime_error("Audio Error: " + message) {}
    };

    /**
     * @brief Audio format information
     */
    struct AudioFormat {
        uint32_t sample_rate;      // Sample rate in Hz
        uint16_t channels;         // Number of channels
        uint16_t bits_per_sample;  // Bits per sample (8, 16, 24, 32)
        bool is_float;             // IEEE float samples (32-bit only)
        uint32_t length_samples;   // Total number of samples per channel
        double duration;           // Duration in seconds

        AudioFormat()
            : sample_rate(16000), channels(1), bits_per_sample(16), is_float(false),
              length_samples(0), duration(0.0) {}

        bool isValid() const {
            if (sample_rate == 0 || channels == 0) return false;
            if (is_float) return bits_per_sample == 32;
            return bits_per_sample == 8 || bits_per_sample == 16 ||
                   bits_per_sample == 24 || bits_per_sample == 32;
        }
    };

    /**
     * @brief Interleaved sample buffer in [-1.0, 1.0]
     */
    class AudioBuffer {
    public:
        AudioBuffer();
        AudioBuffer(uint32_t sample_rate, uint16_t channels, uint32_t length_samples);

        /**
         * @brief Initialize buffer with given format, zero-filled
         */
        void initialize(uint32_t sample_rate, uint16_t channels, uint32_t length_samples);

        const std::vector<double>& getData() const { return data_; }
        std::vector<double>& getData() { return data_; }

        /**
         * @brief Convert to mono by averaging channels
         */
        void convertToMono();

        // Getters
        const AudioFormat& getFormat() const { return format_; }
        uint32_t getSampleRate() const { return format_.sample_rate; }
        uint16_t getChannels() const { return format_.channels; }
        uint32_t getLengthSamples() const { return format_.length_samples; }
        double getDuration() const { return format_.duration; }
        bool isEmpty() const { return data_.empty(); }

    private:
        AudioFormat format_;
        std::vector<double> data_;

        void updateDuration();
    };

    /**
     * @brief RIFF/WAVE reader and writer
     *
     * Reads PCM 8/16/24/32-bit and IEEE float 32-bit data, including
     * WAVE_FORMAT_EXTENSIBLE headers, with arbitrary chunk order.
     */
    class WavLoader {
    public:
        WavLoader() = default;

        /**
         * @brief Load WAV file into audio buffer
         * @throws AudioError on unreadable or unsupported files
         */
        AudioBuffer loadFile(const std::string& filename);

        /**
         * @brief Get WAV file format information without loading data
         */
        AudioFormat getFileInfo(const std::string& filename);

        /**
         * @brief Save audio buffer to WAV file
         * @param bits_per_sample Output bit depth (16, 24 or 32)
         * @param ieee_float Write 32-bit float samples instead of PCM
         */
        void saveFile(const AudioBuffer& buffer, const std::string& filename,
                      uint16_t bits_per_sample = 16, bool ieee_float = false);

        bool isValidWavFile(const std::string& filename);

    private:
        struct WavHeader {
            uint16_t audio_format = 0;     // 1 = PCM, 3 = IEEE float
            uint16_t num_channels = 0;
            uint32_t sample_rate = 0;
            uint32_t byte_rate = 0;
            uint16_t block_align = 0;
            uint16_t bits_per_sample = 0;
            uint32_t data_size = 0;
            std::streampos data_offset = 0;
        };

        void readWavHeader(std::ifstream& file, WavHeader& header, const std::string& filename);
        void writeWavHeader(std::ofstream& file, const AudioFormat& format,
                            uint16_t bits_per_sample, bool ieee_float);
        std::vector<double> readAudioData(std::ifstream& file, const WavHeader& header);
        void writeAudioData(std::ofstream& file, const AudioBuffer& buffer,
                            uint16_t bits_per_sample, bool ieee_float);
    };

} // namespace emodata
