#include <gtest/gtest.h>
#include "emodata/corpus_registry.h"
#include "emodata/error_handler.h"

#include <algorithm>
#include <set>

using namespace emodata;

class CorpusRegistryTest : public ::testing::Test {
protected:
    const CorpusRegistry& registry = CorpusRegistry::instance();
};

TEST_F(CorpusRegistryTest, ContainsAllBuiltinCorpora) {
    const std::vector<std::string> expected = {
        "cafe", "crema-d", "demos", "emodb", "emofilm", "enterface", "iemocap", "jl",
        "msp-improv", "portuguese", "ravdess", "savee", "semaine", "shemo", "smartkom", "tess"
    };
    EXPECT_EQ(registry.size(), expected.size());
    EXPECT_EQ(registry.corpus_ids(), expected);
    for (const auto& id : expected) {
        EXPECT_TRUE(registry.contains(id)) << id;
        EXPECT_EQ(registry.resolve(id).id, id);
    }
}

TEST_F(CorpusRegistryTest, UnknownCorpusThrows) {
    EXPECT_FALSE(registry.contains("unknown"));
    try {
        registry.resolve("unknown");
        FAIL() << "Expected UnknownCorpusError";
    } catch (const UnknownCorpusError& e) {
        EXPECT_EQ(e.get_error_code(), ErrorCode::UNKNOWN_CORPUS);
        EXPECT_NE(std::string(e.what()).find("unknown"), std::string::npos);
    }
}

TEST_F(CorpusRegistryTest, GenderedSpeakersAreMaleThenFemale) {
    for (const auto& id : registry.corpus_ids()) {
        const CorpusMetadata& corpus = registry.resolve(id);
        if (!corpus.has_gender_split()) continue;

        std::vector<std::string> expected = *corpus.male_speakers;
        expected.insert(expected.end(), corpus.female_speakers->begin(), corpus.female_speakers->end());
        EXPECT_EQ(corpus.speakers, expected) << id;
    }

    const CorpusMetadata& emodb = registry.resolve("emodb");
    ASSERT_EQ(emodb.speakers.size(), 10u);
    EXPECT_EQ(emodb.speakers.front(), "03");
    EXPECT_EQ(emodb.speakers[5], "08");
}

TEST_F(CorpusRegistryTest, SpeakerListsHaveNoDuplicates) {
    for (const auto& id : registry.corpus_ids()) {
        const CorpusMetadata& corpus = registry.resolve(id);
        std::set<std::string> unique(corpus.speakers.begin(), corpus.speakers.end());
        EXPECT_EQ(unique.size(), corpus.speakers.size()) << id;
        EXPECT_FALSE(corpus.speakers.empty()) << id;
    }
}

TEST_F(CorpusRegistryTest, ClassesFollowLabelMapOrder) {
    const CorpusMetadata& emodb = registry.resolve("emodb");
    std::vector<std::string> expected = {
        "anger", "boredom", "disgust", "fear", "happiness", "sadness", "neutral"
    };
    EXPECT_EQ(emodb.classes(), expected);
    ASSERT_NE(emodb.find_label("W"), nullptr);
    EXPECT_EQ(*emodb.find_label("W"), "anger");
    EXPECT_EQ(emodb.find_label("anger"), nullptr);
}

TEST_F(CorpusRegistryTest, SaveeKeepsMisspelledSurprise) {
    auto classes = registry.resolve("savee").classes();
    EXPECT_NE(std::find(classes.begin(), classes.end(), "suprise"), classes.end());
}

TEST_F(CorpusRegistryTest, EmodbNameRules) {
    const CorpusMetadata& emodb = registry.resolve("emodb");
    EXPECT_EQ(emodb.label_code("03a01Wa"), "W");
    EXPECT_EQ(emodb.speaker_id("03a01Wa"), "03");
    EXPECT_THROW(emodb.label_code("03a"), UnknownLabelError);
}

TEST_F(CorpusRegistryTest, IemocapNameRulesAndGroups) {
    const CorpusMetadata& iemocap = registry.resolve("iemocap");
    EXPECT_EQ(iemocap.speaker_id("Ses01F_impro01_F000_neu"), "01F");
    EXPECT_EQ(iemocap.label_code("Ses01F_impro01_F000_neu"), "neu");

    ASSERT_EQ(iemocap.speaker_groups.size(), iemocap.speakers.size());
    auto male = std::find(iemocap.speakers.begin(), iemocap.speakers.end(), "03M") - iemocap.speakers.begin();
    auto female = std::find(iemocap.speakers.begin(), iemocap.speakers.end(), "03F") - iemocap.speakers.begin();
    EXPECT_EQ(iemocap.speaker_groups[male], iemocap.speaker_groups[female]);
}

TEST_F(CorpusRegistryTest, NumberedSpeakerLists) {
    const CorpusMetadata& enterface = registry.resolve("enterface");
    EXPECT_EQ(enterface.speakers.size(), 43u);
    EXPECT_EQ(std::find(enterface.speakers.begin(), enterface.speakers.end(), "s6"),
              enterface.speakers.end());
    EXPECT_EQ(enterface.speaker_id("s12_an_1"), "s12");

    const CorpusMetadata& ravdess = registry.resolve("ravdess");
    EXPECT_EQ(ravdess.male_speakers->front(), "01");
    EXPECT_EQ(ravdess.female_speakers->front(), "02");
    EXPECT_EQ(ravdess.speakers.size(), 24u);

    const CorpusMetadata& semaine = registry.resolve("semaine");
    EXPECT_EQ(semaine.speakers.size(), 22u);
    EXPECT_FALSE(semaine.label_rule);
    EXPECT_THROW(semaine.label_code("01_x"), ConfigurationError);

    const CorpusMetadata& shemo = registry.resolve("shemo");
    EXPECT_EQ(shemo.speakers.size(), 87u);
    EXPECT_EQ(shemo.speakers.front(), "M01");
}

TEST_F(CorpusRegistryTest, AffectGroupsPartitionLabels) {
    const CorpusMetadata& emodb = registry.resolve("emodb");
    ASSERT_TRUE(emodb.has_affect_groups());
    EXPECT_TRUE(emodb.arousal_groups->is_positive("anger"));
    EXPECT_FALSE(emodb.arousal_groups->is_positive("sadness"));
    EXPECT_TRUE(emodb.valence_groups->is_positive("happiness"));
    EXPECT_FALSE(emodb.valence_groups->is_positive("anger"));
}

TEST(NameRulesTest, NegativeIndexSlicing) {
    using namespace name_rules;
    EXPECT_EQ(slice("abcdef", 1, 3), "bc");
    EXPECT_EQ(slice("abcdef", std::nullopt, 2), "ab");
    EXPECT_EQ(slice("abcdef", -3, std::nullopt), "def");
    EXPECT_EQ(slice("abcdef", -6, -3), "abc");
    EXPECT_EQ(slice("abc", 5, 9), "");
    EXPECT_EQ(slice("abc", -10, 2), "ab");

    EXPECT_EQ(char_at("abc", 0), "a");
    EXPECT_EQ(char_at("abc", -1), "c");
    EXPECT_THROW(char_at("abc", 3), std::out_of_range);

    EXPECT_EQ(find("a_b_c", '_'), 1);
    EXPECT_EQ(rfind("a_b_c", '_'), 3);
    EXPECT_EQ(find("abc", '_'), -1);
}

TEST(NameRulesTest, RegexGroup) {
    std::regex pattern("([a-z]+)_\\d+");
    EXPECT_EQ(name_rules::regex_group("anger_12", pattern), "anger");
    EXPECT_THROW(name_rules::regex_group("12_anger", pattern), std::out_of_range);
}

TEST(CorpusRegistryCustomTest, SpeakersDerivedFromGenderLists) {
    CorpusMetadata corpus;
    corpus.id = "custom";
    corpus.male_speakers = std::vector<std::string>{"m1"};
    corpus.female_speakers = std::vector<std::string>{"f1", "f2"};
    corpus.speakers = {"ignored"};

    CorpusRegistry registry({corpus});
    std::vector<std::string> expected = {"m1", "f1", "f2"};
    EXPECT_EQ(registry.resolve("custom").speakers, expected);
}
