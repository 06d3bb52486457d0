#include "emodata/corpus_registry.h"
#include "emodata/error_handler.h"
#include "emodata/logger.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace emodata {

namespace name_rules {

    std::string slice(const std::string& s, std::optional<long> start, std::optional<long> stop) {
        const long n = static_cast<long>(s.size());
        auto clamp = [n](long i) {
            if (i < 0) i += n;
            return std::max(0L, std::min(i, n));
        };
        long begin = start ? clamp(*start) : 0;
        long end = stop ? clamp(*stop) : n;
        if (end <= begin) {
            return std::string();
        }
        return s.substr(static_cast<size_t>(begin), static_cast<size_t>(end - begin));
    }

    std::string char_at(const std::string& s, long index) {
        const long n = static_cast<long>(s.size());
        long i = index < 0 ? index + n : index;
        if (i < 0 || i >= n) {
            throw std::out_of_range("string index " + std::to_string(index) +
                                    " out of range for '" + s + "'");
        }
        return std::string(1, s[static_cast<size_t>(i)]);
    }

    long find(const std::string& s, char c) {
        size_t pos = s.find(c);
        return pos == std::string::npos ? -1 : static_cast<long>(pos);
    }

    long rfind(const std::string& s, char c) {
        size_t pos = s.rfind(c);
        return pos == std::string::npos ? -1 : static_cast<long>(pos);
    }

    std::string regex_group(const std::string& s, const std::regex& pattern) {
        std::smatch match;
        if (!std::regex_match(s, match, pattern) || match.size() < 2) {
            throw std::out_of_range("name '" + s + "' does not match the corpus naming pattern");
        }
        return match[1].str();
    }

} // namespace name_rules

bool GroupMembership::is_positive(const std::string& label) const {
    return std::find(positive.begin(), positive.end(), label) != positive.end();
}

std::vector<std::string> CorpusMetadata::classes() const {
    std::vector<std::string> vocabulary;
    for (const auto& entry : label_map) {
        if (std::find(vocabulary.begin(), vocabulary.end(), entry.second) == vocabulary.end()) {
            vocabulary.push_back(entry.second);
        }
    }
    return vocabulary;
}

const std::string* CorpusMetadata::find_label(const std::string& code) const {
    for (const auto& entry : label_map) {
        if (entry.first == code) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string CorpusMetadata::label_code(const std::string& name) const {
    if (!label_rule) {
        throw ConfigurationError("Corpus " + id + " has no label rule");
    }
    try {
        return label_rule(name);
    } catch (const std::out_of_range& e) {
        throw UnknownLabelError("Cannot extract label code from '" + name +
                                "' for corpus " + id + ": " + e.what());
    }
}

std::string CorpusMetadata::speaker_id(const std::string& name) const {
    try {
        return speaker_rule(name);
    } catch (const std::out_of_range& e) {
        throw UnknownSpeakerError("Cannot extract speaker id from '" + name +
                                  "' for corpus " + id + ": " + e.what());
    }
}

// CorpusRegistry implementation
const CorpusRegistry& CorpusRegistry::instance() {
    static const CorpusRegistry registry(builtin_corpora());
    return registry;
}

CorpusRegistry::CorpusRegistry(std::vector<CorpusMetadata> entries) {
    for (auto& entry : entries) {
        if (entry.has_gender_split()) {
            entry.speakers = *entry.male_speakers;
            entry.speakers.insert(entry.speakers.end(),
                                  entry.female_speakers->begin(), entry.female_speakers->end());
        }
        std::string corpus_id = entry.id;
        corpora_[corpus_id] = std::move(entry);
    }
}

const CorpusMetadata& CorpusRegistry::resolve(const std::string& corpus_id) const {
    auto it = corpora_.find(corpus_id);
    if (it == corpora_.end()) {
        throw UnknownCorpusError(corpus_id);
    }
    return it->second;
}

bool CorpusRegistry::contains(const std::string& corpus_id) const {
    return corpora_.find(corpus_id) != corpora_.end();
}

std::vector<std::string> CorpusRegistry::corpus_ids() const {
    std::vector<std::string> ids;
    ids.reserve(corpora_.size());
    for (const auto& entry : corpora_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

namespace {

    using name_rules::slice;
    using name_rules::char_at;

    // prefix + zero-padded numbers in [first, last] with the given step
    std::vector<std::string> numbered_ids(const std::string& prefix, int first, int last,
                                          int step, int width,
                                          const std::vector<int>& excluded = {}) {
        std::vector<std::string> ids;
        for (int i = first; i <= last; i += step) {
            if (std::find(excluded.begin(), excluded.end(), i) != excluded.end()) {
                continue;
            }
            std::ostringstream oss;
            oss << prefix << std::setw(width) << std::setfill('0') << i;
            ids.push_back(oss.str());
        }
        return ids;
    }

    CorpusMetadata cafe() {
        CorpusMetadata c;
        c.id = "cafe";
        c.label_map = {
            {"C", "anger"}, {"D", "disgust"}, {"J", "happiness"}, {"N", "neutral"},
            {"P", "fear"}, {"S", "surprise"}, {"T", "sadness"}
        };
        c.male_speakers = std::vector<std::string>{"01", "03", "05", "07", "09", "11"};
        c.female_speakers = std::vector<std::string>{"02", "04", "06", "08", "10", "12"};
        c.label_rule = [](const std::string& n) { return char_at(n, 3); };
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 2); };
        return c;
    }

    CorpusMetadata crema_d() {
        CorpusMetadata c;
        c.id = "crema-d";
        c.label_map = {
            {"A", "anger"}, {"D", "disgust"}, {"F", "fear"}, {"H", "happy"},
            {"S", "sad"}, {"N", "neutral"}
        };
        c.speakers = {
            "1042", "1070", "1030", "1087", "1061", "1086", "1026", "1017",
            "1039", "1082", "1032", "1015", "1062", "1012", "1046", "1010",
            "1014", "1064", "1080", "1023", "1056", "1066", "1035", "1074",
            "1068", "1027", "1043", "1065", "1076", "1060", "1019", "1011",
            "1075", "1008", "1006", "1025", "1053", "1058", "1085", "1069",
            "1024", "1084", "1033", "1054", "1090", "1013", "1038", "1072",
            "1036", "1088", "1071", "1005", "1057", "1029", "1020", "1073",
            "1050", "1007", "1031", "1003", "1002", "1079", "1040", "1047",
            "1077", "1078", "1049", "1051", "1041", "1052", "1083", "1016",
            "1034", "1009", "1055", "1048", "1018", "1091", "1045", "1022",
            "1004", "1089", "1067", "1059", "1063", "1001", "1021", "1028",
            "1044", "1037", "1081"
        };
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 4); };
        return c;
    }

    CorpusMetadata demos() {
        CorpusMetadata c;
        c.id = "demos";
        c.label_map = {
            {"rab", "anger"}, {"tri", "sadness"}, {"gio", "happiness"}, {"pau", "fear"},
            {"dis", "disgust"}, {"col", "guilt"}, {"sor", "surprise"}
        };
        c.arousal_groups = GroupMembership{
            {"anger", "fear", "happiness", "surprise"},
            {"disgust", "neutral", "sadness", "guilt"}
        };
        c.valence_groups = GroupMembership{
            {"happiness", "neutral", "surprise"},
            {"anger", "guilt", "disgust", "fear", "sadness"}
        };
        c.male_speakers = std::vector<std::string>{
            "02", "03", "04", "05", "08", "09", "10", "11", "12", "14", "15",
            "16", "18", "19", "23", "24", "25", "26", "27", "28", "30", "33",
            "34", "39", "41", "50", "51", "52", "53", "58", "59", "63", "64",
            "65", "66", "67", "68", "69"
        };
        c.female_speakers = std::vector<std::string>{
            "01", "17", "21", "22", "29", "31", "36", "37", "38", "40", "43",
            "45", "46", "47", "49", "54", "55", "56", "57", "60", "61"
        };
        c.label_rule = [](const std::string& n) { return slice(n, -6, -3); };
        c.speaker_rule = [](const std::string& n) { return slice(n, -9, -7); };
        return c;
    }

    CorpusMetadata emodb() {
        CorpusMetadata c;
        c.id = "emodb";
        c.label_map = {
            {"W", "anger"}, {"L", "boredom"}, {"E", "disgust"}, {"A", "fear"},
            {"F", "happiness"}, {"T", "sadness"}, {"N", "neutral"}
        };
        c.arousal_groups = GroupMembership{
            {"anger", "fear", "happiness"},
            {"boredom", "disgust", "neutral", "sadness"}
        };
        c.valence_groups = GroupMembership{
            {"happiness", "neutral"},
            {"anger", "boredom", "disgust", "fear", "sadness"}
        };
        c.male_speakers = std::vector<std::string>{"03", "10", "11", "12", "15"};
        c.female_speakers = std::vector<std::string>{"08", "09", "13", "14", "16"};
        c.label_rule = [](const std::string& n) { return char_at(n, 5); };
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 2); };
        return c;
    }

    CorpusMetadata emofilm() {
        CorpusMetadata c;
        c.id = "emofilm";
        c.label_map = {
            {"ans", "fear"}, {"dis", "disgust"}, {"gio", "happiness"},
            {"rab", "anger"}, {"tri", "sadness"}
        };
        c.speakers = {"en", "es", "it"};
        c.label_rule = [](const std::string& n) { return slice(n, 2, 5); };
        c.speaker_rule = [](const std::string& n) { return slice(n, -2, std::nullopt); };
        return c;
    }

    CorpusMetadata enterface() {
        CorpusMetadata c;
        c.id = "enterface";
        c.label_map = {
            {"an", "anger"}, {"di", "disgust"}, {"fe", "fear"},
            {"ha", "happiness"}, {"sa", "sadness"}, {"su", "surprise"}
        };
        c.arousal_groups = GroupMembership{
            {"anger", "fear", "happiness", "surprise"},
            {"disgust", "sadness"}
        };
        c.valence_groups = GroupMembership{
            {"happiness", "surprise"},
            {"anger", "disgust", "fear", "sadness"}
        };
        c.speakers = numbered_ids("s", 1, 44, 1, 1, {6});
        c.label_rule = [](const std::string& n) { return slice(n, -4, -2); };
        c.speaker_rule = [](const std::string& n) {
            return slice(n, std::nullopt, name_rules::find(n, '_'));
        };
        return c;
    }

    CorpusMetadata iemocap() {
        CorpusMetadata c;
        c.id = "iemocap";
        c.label_map = {
            {"ang", "anger"}, {"hap", "happiness"}, {"sad", "sadness"}, {"neu", "neutral"}
        };
        c.male_speakers = std::vector<std::string>{"01M", "02M", "03M", "04M", "05M"};
        c.female_speakers = std::vector<std::string>{"01F", "02F", "03F", "04F", "05F"};
        c.label_rule = [](const std::string& n) { return slice(n, -3, std::nullopt); };
        c.speaker_rule = [](const std::string& n) { return slice(n, 3, 6); };
        // Both speakers of a session share one group
        c.speaker_groups = {0, 1, 2, 3, 4, 0, 1, 2, 3, 4};
        return c;
    }

    CorpusMetadata jl() {
        CorpusMetadata c;
        c.id = "jl";
        c.label_map = {
            {"angry", "angry"}, {"sad", "sad"}, {"neutral", "neutral"},
            {"happy", "happy"}, {"excited", "excited"}
        };
        c.male_speakers = std::vector<std::string>{"male1", "male2"};
        c.female_speakers = std::vector<std::string>{"female1", "female2"};
        c.label_rule = [](const std::string& n) {
            static const std::regex pattern(R"(^\w+\d_([a-z]+)_.*$)");
            return name_rules::regex_group(n, pattern);
        };
        c.speaker_rule = [](const std::string& n) {
            return slice(n, std::nullopt, name_rules::find(n, '_'));
        };
        return c;
    }

    CorpusMetadata msp_improv() {
        CorpusMetadata c;
        c.id = "msp-improv";
        c.label_map = {
            {"A", "angry"}, {"H", "happy"}, {"S", "sad"}, {"N", "neutral"}
        };
        c.male_speakers = std::vector<std::string>{"M01", "M02", "M03", "M04", "M05", "M06"};
        c.female_speakers = std::vector<std::string>{"F01", "F02", "F03", "F04", "F05", "F06"};
        c.label_rule = [](const std::string& n) { return char_at(n, -1); };
        c.speaker_rule = [](const std::string& n) { return slice(n, 5, 8); };
        c.speaker_groups = {0, 1, 2, 3, 4, 5, 0, 1, 2, 3, 4, 5};
        return c;
    }

    CorpusMetadata portuguese() {
        CorpusMetadata c;
        c.id = "portuguese";
        c.label_map = {
            {"angry", "angry"}, {"disgust", "disgust"}, {"fear", "fear"}, {"happy", "happy"},
            {"sad", "sad"}, {"neutral", "neutral"}, {"surprise", "surprise"}
        };
        c.speakers = {"A", "B"};
        c.label_rule = [](const std::string& n) {
            static const std::regex pattern(R"(^\d+[sp][AB]_([a-z]+)\d+$)");
            return name_rules::regex_group(n, pattern);
        };
        c.speaker_rule = [](const std::string& n) {
            return char_at(n, name_rules::find(n, '_') - 1);
        };
        return c;
    }

    CorpusMetadata ravdess() {
        CorpusMetadata c;
        c.id = "ravdess";
        c.label_map = {
            {"01", "neutral"}, {"02", "calm"}, {"03", "happy"}, {"04", "sad"},
            {"05", "angry"}, {"06", "fearful"}, {"07", "disgust"}, {"08", "surprised"}
        };
        c.male_speakers = numbered_ids("", 1, 24, 2, 2);
        c.female_speakers = numbered_ids("", 2, 24, 2, 2);
        c.label_rule = [](const std::string& n) { return slice(n, 6, 8); };
        c.speaker_rule = [](const std::string& n) { return slice(n, -2, std::nullopt); };
        return c;
    }

    CorpusMetadata savee() {
        CorpusMetadata c;
        c.id = "savee";
        // "suprise" is the label string the corpus annotations use
        c.label_map = {
            {"a", "anger"}, {"d", "disgust"}, {"f", "fear"}, {"h", "happiness"},
            {"n", "neutral"}, {"sa", "sadness"}, {"su", "suprise"}
        };
        c.arousal_groups = GroupMembership{
            {"anger", "fear", "happiness", "surprise"},
            {"disgust", "neutral", "sadness"}
        };
        c.valence_groups = GroupMembership{
            {"happiness", "neutral", "surprise"},
            {"anger", "disgust", "fear", "sadness"}
        };
        c.speakers = {"DC", "JE", "JK", "KL"};
        c.label_rule = [](const std::string& n) {
            unsigned char next = static_cast<unsigned char>(char_at(n, 4)[0]);
            return std::isdigit(next) ? char_at(n, 3) : slice(n, 3, 5);
        };
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 2); };
        return c;
    }

    CorpusMetadata semaine() {
        CorpusMetadata c;
        c.id = "semaine";
        c.speakers = numbered_ids("", 1, 24, 1, 2, {7, 8});
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 2); };
        return c;
    }

    CorpusMetadata shemo() {
        CorpusMetadata c;
        c.id = "shemo";
        c.label_map = {
            {"A", "anger"}, {"H", "happiness"}, {"N", "neutral"},
            {"S", "sadness"}, {"W", "surprise"}
        };
        c.male_speakers = numbered_ids("M", 1, 56, 1, 2);
        c.female_speakers = numbered_ids("F", 1, 31, 1, 2);
        c.label_rule = [](const std::string& n) { return char_at(n, 3); };
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 3); };
        return c;
    }

    CorpusMetadata smartkom() {
        CorpusMetadata c;
        c.id = "smartkom";
        c.label_map = {
            {"Neutral", "neutral"}, {"Freude_Erfolg", "joy"},
            {"Uberlegen_Nachdenken", "pondering"}, {"Ratlosigkeit", "helpless"},
            {"Arger_Miserfolg", "anger"}, {"Uberraschung_Verwunderung", "surprise"},
            {"Restklasse", "unknown"}
        };
        c.speakers = {
            "AAA", "AAB", "AAC", "AAD", "AAE", "AAF", "AAG", "AAH", "AAI",
            "AAJ", "AAK", "AAL", "AAM", "AAN", "AAO", "AAP", "AAQ", "AAR",
            "AAS", "AAT", "AAU", "AAV", "AAW", "AAX", "AAY", "AAZ", "ABA",
            "ABB", "ABC", "ABD", "ABE", "ABF", "ABG", "ABH", "ABI", "ABJ",
            "ABK", "ABL", "ABM", "ABN", "ABO", "ABP", "ABQ", "ABR", "ABS",
            "AIS", "AIT", "AIU", "AIV", "AIW", "AIX", "AIY", "AIZ", "AJA",
            "AJB", "AJC", "AJD", "AJE", "AJF", "AJG", "AJH", "AJI", "AJJ",
            "AJK", "AJL", "AJM", "AJN", "AJO", "AJP", "AJQ", "AJR", "AJS",
            "AJT", "AJU", "AJV", "AJW", "AJX", "AJY", "AJZ", "AKA", "AKB",
            "AKC", "AKD", "AKE", "AKF", "AKG"
        };
        c.speaker_rule = [](const std::string& n) { return slice(n, 8, 11); };
        return c;
    }

    CorpusMetadata tess() {
        CorpusMetadata c;
        c.id = "tess";
        c.label_map = {
            {"angry", "angry"}, {"disgust", "disgust"}, {"fear", "fear"}, {"happy", "happy"},
            {"ps", "surprise"}, {"sad", "sad"}, {"neutral", "neutral"}
        };
        c.speakers = {"OAF", "YAF"};
        c.label_rule = [](const std::string& n) {
            return slice(n, name_rules::rfind(n, '_') + 1, std::nullopt);
        };
        c.speaker_rule = [](const std::string& n) { return slice(n, std::nullopt, 3); };
        return c;
    }

} // namespace

std::vector<CorpusMetadata> builtin_corpora() {
    return {
        cafe(), crema_d(), demos(), emodb(), emofilm(), enterface(), iemocap(), jl(),
        msp_improv(), portuguese(), ravdess(), savee(), semaine(), shemo(), smartkom(), tess()
    };
}

} // namespace emodata
