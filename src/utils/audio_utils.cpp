#include "emodata/audio_utils.h"
#include "emodata/logger.h"
#include <algorithm>
#include <cstring>
#include <cmath>

namespace emodata {

    namespace {
        constexpr uint16_t WAVE_FORMAT_PCM = 1;
        constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 3;
        constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

        uint16_t le16(const uint8_t* p) {
            return static_cast<uint16_t>(p[0] | (p[1] << 8));
        }

        uint32_t le32(const uint8_t* p) {
            return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                   (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
        }

        void put16(std::ofstream& file, uint16_t value) {
            uint8_t bytes[2] = {
                static_cast<uint8_t>(value & 0xFF),
                static_cast<uint8_t>((value >> 8) & 0xFF)
            };
            file.write(reinterpret_cast<const char*>(bytes), 2);
        }

        void put32(std::ofstream& file, uint32_t value) {
            uint8_t bytes[4] = {
                static_cast<uint8_t>(value & 0xFF),
                static_cast<uint8_t>((value >> 8) & 0xFF),
                static_cast<uint8_t>((value >> 16) & 0xFF),
                static_cast<uint8_t>((value >> 24) & 0xFF)
            };
            file.write(reinterpret_cast<const char*>(bytes), 4);
        }
    }

    // AudioBuffer implementation
    AudioBuffer::AudioBuffer() {
        format_ = AudioFormat();
    }

    AudioBuffer::AudioBuffer(uint32_t sample_rate, uint16_t channels, uint32_t length_samples) {
        initialize(sample_rate, channels, length_samples);
    }

    void AudioBuffer::initialize(uint32_t sample_rate, uint16_t channels, uint32_t length_samples) {
        format_.sample_rate = sample_rate;
        format_.channels = channels;
        format_.length_samples = length_samples;
        format_.bits_per_sample = 32;
        format_.is_float = true;  // Internal format is double precision float

        if (!format_.isValid()) {
            throw AudioError("Invalid audio format parameters");
        }

        data_.assign(static_cast<size_t>(length_samples) * channels, 0.0);
        updateDuration();
    }

    void AudioBuffer::convertToMono() {
        if (format_.channels == 1) {
            return;
        }

        std::vector<double> mono_data(format_.length_samples);
        for (uint32_t i = 0; i < format_.length_samples; ++i) {
            double sum = 0.0;
            for (uint16_t ch = 0; ch < format_.channels; ++ch) {
                sum += data_[static_cast<size_t>(i) * format_.channels + ch];
            }
            mono_data[i] = sum / format_.channels;
        }

        data_ = std::move(mono_data);
        format_.channels = 1;
    }

    void AudioBuffer::updateDuration() {
        format_.duration = static_cast<double>(format_.length_samples) / format_.sample_rate;
    }

    // WavLoader implementation
    AudioBuffer WavLoader::loadFile(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw AudioError("Cannot open WAV file: " + filename);
        }

        WavHeader header;
        readWavHeader(file, header, filename);

        std::vector<double> audio_data = readAudioData(file, header);

        uint32_t length_samples = static_cast<uint32_t>(audio_data.size() / header.num_channels);
        AudioBuffer buffer(header.sample_rate, header.num_channels, length_samples);
        audio_data.resize(static_cast<size_t>(length_samples) * header.num_channels);
        buffer.getData() = std::move(audio_data);

        EMODATA_LOG_DEBUG_F("Loaded %s: %uHz, %u channels, %u bits, %u samples",
                            filename.c_str(), header.sample_rate,
                            static_cast<unsigned>(header.num_channels),
                            static_cast<unsigned>(header.bits_per_sample), length_samples);
        return buffer;
    }

    AudioFormat WavLoader::getFileInfo(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw AudioError("Cannot open WAV file: " + filename);
        }

        WavHeader header;
        readWavHeader(file, header, filename);

        AudioFormat format;
        format.sample_rate = header.sample_rate;
        format.channels = header.num_channels;
        format.bits_per_sample = header.bits_per_sample;
        format.is_float = header.audio_format == WAVE_FORMAT_IEEE_FLOAT;
        format.length_samples = header.data_size / header.block_align;
        format.duration = static_cast<double>(format.length_samples) / format.sample_rate;
        return format;
    }

    void WavLoader::saveFile(const AudioBuffer& buffer, const std::string& filename,
                             uint16_t bits_per_sample, bool ieee_float) {
        if (buffer.isEmpty()) {
            throw AudioError("Cannot save empty audio buffer");
        }
        if (bits_per_sample != 16 && bits_per_sample != 24 && bits_per_sample != 32) {
            throw AudioError("Unsupported bit depth: " + std::to_string(bits_per_sample));
        }
        if (ieee_float && bits_per_sample != 32) {
            throw AudioError("Float output requires 32 bits per sample");
        }

        std::ofstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw AudioError("Cannot create WAV file: " + filename);
        }

        writeWavHeader(file, buffer.getFormat(), bits_per_sample, ieee_float);
        writeAudioData(file, buffer, bits_per_sample, ieee_float);
        Logger::instance().log_file_operation("write", filename, file.good());
    }

    bool WavLoader::isValidWavFile(const std::string& filename) {
        try {
            getFileInfo(filename);
            return true;
        } catch (const AudioError&) {
            return false;
        }
    }

    void WavLoader::readWavHeader(std::ifstream& file, WavHeader& header, const std::string& filename) {
        uint8_t riff[12];
        if (!file.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
            std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
            throw AudioError("Invalid WAV file format: " + filename);
        }

        file.seekg(0, std::ios::end);
        const std::streamoff file_size = file.tellg();
        file.seekg(12, std::ios::beg);

        bool have_fmt = false;
        bool have_data = false;
        uint8_t chunk[8];

        // Chunks may appear in any order; walk them all until both are found
        while (!(have_fmt && have_data) && file.read(reinterpret_cast<char*>(chunk), sizeof(chunk))) {
            uint32_t chunk_size = le32(chunk + 4);
            std::streampos body = file.tellg();

            if (std::memcmp(chunk, "fmt ", 4) == 0) {
                if (chunk_size < 16) {
                    throw AudioError("Truncated fmt chunk in " + filename);
                }
                uint8_t fmt[40] = {};
                size_t to_read = std::min<size_t>(chunk_size, sizeof(fmt));
                if (!file.read(reinterpret_cast<char*>(fmt), static_cast<std::streamsize>(to_read))) {
                    throw AudioError("Truncated fmt chunk in " + filename);
                }
                header.audio_format = le16(fmt);
                header.num_channels = le16(fmt + 2);
                header.sample_rate = le32(fmt + 4);
                header.byte_rate = le32(fmt + 8);
                header.block_align = le16(fmt + 12);
                header.bits_per_sample = le16(fmt + 14);
                if (header.audio_format == WAVE_FORMAT_EXTENSIBLE && to_read >= 26) {
                    header.audio_format = le16(fmt + 24);  // sub-format GUID prefix
                }
                have_fmt = true;
            } else if (std::memcmp(chunk, "data", 4) == 0) {
                header.data_offset = body;
                std::streamoff available = file_size - static_cast<std::streamoff>(body);
                header.data_size = static_cast<uint32_t>(
                    std::min<std::streamoff>(chunk_size, std::max<std::streamoff>(available, 0)));
                have_data = true;
            }

            // Chunk bodies are padded to an even size
            std::streamoff next = static_cast<std::streamoff>(body) + chunk_size + (chunk_size & 1);
            if (next >= file_size) {
                break;
            }
            file.seekg(next, std::ios::beg);
        }

        if (!have_fmt || !have_data) {
            throw AudioError("Missing fmt or data chunk in " + filename);
        }

        bool pcm = header.audio_format == WAVE_FORMAT_PCM;
        bool ieee = header.audio_format == WAVE_FORMAT_IEEE_FLOAT;
        if (!pcm && !ieee) {
            throw AudioError("Unsupported WAV encoding " + std::to_string(header.audio_format) +
                             " in " + filename);
        }
        AudioFormat format;
        format.sample_rate = header.sample_rate;
        format.channels = header.num_channels;
        format.bits_per_sample = header.bits_per_sample;
        format.is_float = ieee;
        if (!format.isValid()) {
            throw AudioError("Unsupported WAV format (" + std::to_string(header.bits_per_sample) +
                             " bits, " + std::to_string(header.num_channels) + " channels) in " + filename);
        }
        header.block_align = static_cast<uint16_t>(header.num_channels * (header.bits_per_sample / 8));

        file.clear();
        file.seekg(header.data_offset);
    }

    void WavLoader::writeWavHeader(std::ofstream& file, const AudioFormat& format,
                                   uint16_t bits_per_sample, bool ieee_float) {
        uint32_t data_size = format.length_samples * format.channels * (bits_per_sample / 8);
        uint16_t block_align = static_cast<uint16_t>(format.channels * (bits_per_sample / 8));

        file.write("RIFF", 4);
        put32(file, 36 + data_size);
        file.write("WAVE", 4);
        file.write("fmt ", 4);
        put32(file, 16);
        put16(file, ieee_float ? WAVE_FORMAT_IEEE_FLOAT : WAVE_FORMAT_PCM);
        put16(file, format.channels);
        put32(file, format.sample_rate);
        put32(file, format.sample_rate * block_align);
        put16(file, block_align);
        put16(file, bits_per_sample);
        file.write("data", 4);
        put32(file, data_size);
    }

    std::vector<double> WavLoader::readAudioData(std::ifstream& file, const WavHeader& header) {
        const size_t bytes_per_sample = header.bits_per_sample / 8;
        const size_t num_samples = header.data_size / bytes_per_sample;

        std::vector<uint8_t> raw(num_samples * bytes_per_sample);
        if (!raw.empty() && !file.read(reinterpret_cast<char*>(raw.data()),
                                       static_cast<std::streamsize>(raw.size()))) {
            throw AudioError("Truncated audio data");
        }

        std::vector<double> audio_data(num_samples);
        const uint8_t* p = raw.data();

        switch (header.bits_per_sample) {
            case 8:
                for (size_t i = 0; i < num_samples; ++i) {
                    audio_data[i] = (p[i] - 128.0) / 128.0;
                }
                break;
            case 16:
                for (size_t i = 0; i < num_samples; ++i) {
                    audio_data[i] = static_cast<int16_t>(le16(p + i * 2)) / 32768.0;
                }
                break;
            case 24:
                for (size_t i = 0; i < num_samples; ++i) {
                    int32_t sample = static_cast<int32_t>(
                        (static_cast<uint32_t>(p[i*3]) << 8) |
                        (static_cast<uint32_t>(p[i*3+1]) << 16) |
                        (static_cast<uint32_t>(p[i*3+2]) << 24));
                    sample >>= 8; // Sign extend
                    audio_data[i] = sample / 8388608.0;
                }
                break;
            case 32:
                for (size_t i = 0; i < num_samples; ++i) {
                    uint32_t bits = le32(p + i * 4);
                    if (header.audio_format == WAVE_FORMAT_IEEE_FLOAT) {
                        float value;
                        std::memcpy(&value, &bits, sizeof(value));
                        audio_data[i] = value;
                    } else {
                        audio_data[i] = static_cast<int32_t>(bits) / 2147483648.0;
                    }
                }
                break;
            default:
                throw AudioError("Unsupported bit depth: " + std::to_string(header.bits_per_sample));
        }

        return audio_data;
    }

    void WavLoader::writeAudioData(std::ofstream& file, const AudioBuffer& buffer,
                                   uint16_t bits_per_sample, bool ieee_float) {
        const std::vector<double>& data = buffer.getData();

        switch (bits_per_sample) {
            case 16:
                for (double sample : data) {
                    int16_t int_sample = static_cast<int16_t>(
                        std::clamp(sample * 32767.0, -32768.0, 32767.0));
                    put16(file, static_cast<uint16_t>(int_sample));
                }
                break;
            case 24:
                for (double sample : data) {
                    int32_t int_sample = static_cast<int32_t>(
                        std::clamp(sample * 8388607.0, -8388608.0, 8388607.0));
                    uint8_t bytes[3] = {
                        static_cast<uint8_t>(int_sample & 0xFF),
                        static_cast<uint8_t>((int_sample >> 8) & 0xFF),
                        static_cast<uint8_t>((int_sample >> 16) & 0xFF)
                    };
                    file.write(reinterpret_cast<const char*>(bytes), 3);
                }
                break;
            case 32:
                for (double sample : data) {
                    uint32_t bits;
                    if (ieee_float) {
                        float value = static_cast<float>(sample);
                        std::memcpy(&bits, &value, sizeof(bits));
                    } else {
                        int32_t int_sample = static_cast<int32_t>(
                            std::clamp(sample * 2147483647.0, -2147483648.0, 2147483647.0));
                        bits = static_cast<uint32_t>(int_sample);
                    }
                    put32(file, bits);
                }
                break;
            default:
                throw AudioError("Unsupported output bit depth: " + std::to_string(bits_per_sample));
        }
    }

} // namespace emodata
