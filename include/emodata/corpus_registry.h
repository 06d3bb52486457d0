#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <functional>
#include <regex>
#include <utility>

namespace emodata {

    /**
     * @brief Extracts a code (label code or speaker id) from an instance name
     *
     * Rules are pure and deterministic. A rule that cannot be applied to a
     * name (too short, pattern mismatch) throws std::out_of_range.
     */
    using NameRule = std::function<std::string(const std::string&)>;

    /**
     * @brief Positive/negative membership of canonical labels
     */
    struct GroupMembership {
        std::vector<std::string> positive;
        std::vector<std::string> negative;

        bool is_positive(const std::string& label) const;
    };

    /**
     * @brief Immutable per-corpus metadata
     *
     * label_map is ordered: its values, deduplicated in first-occurrence
     * order, form the class vocabulary.
     */
    struct CorpusMetadata {
        std::string id;
        std::vector<std::pair<std::string, std::string>> label_map;
        std::optional<GroupMembership> arousal_groups;
        std::optional<GroupMembership> valence_groups;
        std::optional<std::vector<std::string>> male_speakers;
        std::optional<std::vector<std::string>> female_speakers;
        std::vector<std::string> speakers;
        NameRule label_rule;        // empty for corpora without categorical labels
        NameRule speaker_rule;
        std::vector<int> speaker_groups;  // speaker index -> group index, empty = identity

        bool has_gender_split() const {
            return male_speakers.has_value() && female_speakers.has_value();
        }
        bool has_affect_groups() const {
            return arousal_groups.has_value() && valence_groups.has_value();
        }

        // Ordered, deduplicated label_map values
        std::vector<std::string> classes() const;

        // Canonical label for a label code, nullptr when the code is unknown
        const std::string* find_label(const std::string& code) const;

        // Apply the rules; failures throw UnknownLabelError / UnknownSpeakerError
        std::string label_code(const std::string& name) const;
        std::string speaker_id(const std::string& name) const;
    };

    /**
     * @brief Process-wide, read-only mapping from corpus id to metadata
     *
     * Populated once on first access. On construction every entry with
     * both gender lists gets speakers = male ++ female.
     */
    class CorpusRegistry {
    public:
        static const CorpusRegistry& instance();

        explicit CorpusRegistry(std::vector<CorpusMetadata> entries);

        // Throws UnknownCorpusError
        const CorpusMetadata& resolve(const std::string& corpus_id) const;
        bool contains(const std::string& corpus_id) const;
        std::vector<std::string> corpus_ids() const;
        size_t size() const { return corpora_.size(); }

    private:
        std::unordered_map<std::string, CorpusMetadata> corpora_;
    };

    /**
     * @brief Built-in corpus definitions
     */
    std::vector<CorpusMetadata> builtin_corpora();

    /**
     * @brief String indexing used by the name rules (negative indices count from the end)
     */
    namespace name_rules {
        // s[start:stop]; negative indices count from the end, bounds clamp
        std::string slice(const std::string& s, std::optional<long> start, std::optional<long> stop);
        // s[index]; negative counts from the end, out of range throws std::out_of_range
        std::string char_at(const std::string& s, long index);
        // s.find(c), -1 when absent
        long find(const std::string& s, char c);
        // s.rfind(c), -1 when absent
        long rfind(const std::string& s, char c);
        // First capture group of a full match, throws std::out_of_range on mismatch
        std::string regex_group(const std::string& s, const std::regex& pattern);
    } // namespace name_rules

} // namespace emodata
