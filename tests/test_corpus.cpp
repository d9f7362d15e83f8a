#include <gtest/gtest.h>
#include "slu/corpus.h"
#include "test_utils.h"

namespace {

const char* const kCorpus =
    "book:O a:O flight:B-obj <=> book_flight\n"
    "\n"
    "show:O flights:O at:O 10:30:B-time <=> atis_flight;atis_airfare\n"
    "hello:O <=>\n";

class CorpusTest : public ::testing::Test {
protected:
    TempDir dir;
    Vocabulary words;
    Vocabulary tags;
    Vocabulary intents;

    void SetUp() override {
        writeFile(dir.file("train"), kCorpus);
        for (const char* w : {"book", "a", "flight", "show"}) words.add(w);
        for (const char* t : {"O", "B-obj", "B-time"}) tags.add(t);
        for (const char* i : {"book_flight", "atis_flight"}) intents.add(i);
    }
};

}  // namespace

// ==================== Line parsing ====================

TEST(ParseCorpusLine, SplitsOnTheLastColon) {
    CorpusLine line = parseCorpusLine("at:O 10:30:B-time <=> atis_flight", 1);
    ASSERT_EQ(line.words.size(), 2u);
    EXPECT_EQ(line.words[1], "10:30");
    EXPECT_EQ(line.tags[1], "B-time");
    EXPECT_EQ(line.intents, std::vector<std::string>{"atis_flight"});
}

TEST(ParseCorpusLine, MultipleAndMissingIntents) {
    EXPECT_EQ(parseCorpusLine("a:O <=> x;y", 1).intents, (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(parseCorpusLine("a:O <=>", 1).intents.empty());
    EXPECT_TRUE(parseCorpusLine("a:O <=>   ", 1).intents.empty());
}

TEST(ParseCorpusLine, MalformedLinesThrow) {
    EXPECT_THROW(parseCorpusLine("book:O a:O", 3), std::runtime_error);
    EXPECT_THROW(parseCorpusLine("book a:O <=> x", 3), std::runtime_error);
    EXPECT_THROW(parseCorpusLine("book: <=> x", 3), std::runtime_error);
    EXPECT_THROW(parseCorpusLine("  <=> x", 3), std::runtime_error);
}

// ==================== Reading ====================

TEST_F(CorpusTest, ReadsIdsAndKeepsLineNumbers) {
    Dataset data = readCorpus(dir.file("train"), words, tags, intents, false);
    ASSERT_EQ(data.size(), 3u);

    const Example& first = data.examples[0];
    EXPECT_EQ(first.line_number, 1u);
    EXPECT_EQ(first.word_ids, (std::vector<int>{2, 3, 4}));
    EXPECT_EQ(first.tag_ids, (std::vector<int>{2, 2, 3}));
    EXPECT_EQ(first.intent_id, intents.getId("book_flight"));

    const Example& second = data.examples[1];
    EXPECT_EQ(second.line_number, 3u);
    EXPECT_EQ(second.words[3], "10:30");
    EXPECT_EQ(second.word_ids[1], words.getUnkId());
    EXPECT_EQ(second.intents, (std::vector<std::string>{"atis_flight", "atis_airfare"}));
    EXPECT_EQ(second.intent_ids, (std::vector<int>{intents.getId("atis_flight"), intents.getUnkId()}));
    EXPECT_EQ(second.intent_id, intents.getId("atis_flight"));
}

TEST_F(CorpusTest, EmptyIntentTrainsTowardsUnk) {
    Dataset data = readCorpus(dir.file("train"), words, tags, intents, false);
    const Example& last = data.examples[2];
    EXPECT_EQ(last.line_number, 4u);
    EXPECT_TRUE(last.intents.empty());
    EXPECT_EQ(last.intent_id, intents.getUnkId());
}

TEST_F(CorpusTest, LowercasesWordsOnRequest) {
    writeFile(dir.file("upper"), "BOOK:O <=> book_flight\n");
    EXPECT_EQ(readCorpus(dir.file("upper"), words, tags, intents, true).examples[0].word_ids[0], 2);
    EXPECT_EQ(readCorpus(dir.file("upper"), words, tags, intents, false).examples[0].word_ids[0],
              words.getUnkId());
}

TEST_F(CorpusTest, MalformedLineNamesFileAndLine) {
    writeFile(dir.file("broken"), "a:O <=> x\nbad line\n");
    try {
        readCorpus(dir.file("broken"), words, tags, intents, false);
        FAIL() << "expected a data error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
    }
}

TEST_F(CorpusTest, WordVocabularyKeepsFrequentWords) {
    writeFile(dir.file("words"),
              "a:O b:O <=> x\n"
              "a:O c:O <=> x\n"
              "A:O b:O <=> x\n");

    Vocabulary cased = buildWordVocabulary(dir.file("words"), 2, false);
    EXPECT_EQ(cased.getTokens(), (std::vector<std::string>{"<pad>", "<unk>", "a", "b"}));

    Vocabulary lowered = buildWordVocabulary(dir.file("words"), 2, true);
    EXPECT_EQ(lowered.getId("a"), 2);
    EXPECT_FALSE(lowered.contains("A"));

    Vocabulary all = buildWordVocabulary(dir.file("words"), 1, false);
    EXPECT_EQ(all.size(), 6u);
}

// ==================== Sentence features ====================

TEST_F(CorpusTest, SentenceBankAssignsLineIndices) {
    writeFile(dir.file("sen2idx"), "hello\nbook a  flight\nshow flights at 10:30\n");
    SentenceBank bank = SentenceBank::read(dir.file("sen2idx"));
    EXPECT_EQ(bank.size(), 3u);
    EXPECT_EQ(bank.lookup("book a flight"), 1);
    EXPECT_THROW(bank.lookup("book a train"), std::runtime_error);

    Dataset data = readCorpus(dir.file("train"), words, tags, intents, false);
    attachSentenceIds(data, bank);
    EXPECT_EQ(data.examples[0].sentence_id, 1);
    EXPECT_EQ(data.examples[1].sentence_id, 2);
    EXPECT_EQ(data.examples[2].sentence_id, 0);
}

TEST_F(CorpusTest, SentenceFeaturesSliceOneTokenAtATime) {
    writeFile(dir.file("sen2vec"), "1 2 3 4 5 6\n-1 -2 -3 -4 -5 -6\n");
    SentenceFeatures features = SentenceFeatures::read(dir.file("sen2vec"), 3, 2);
    EXPECT_EQ(features.numSentences(), 2u);
    EXPECT_EQ(features.tokenFeature(0, 1), (std::vector<double>{3, 4}));
    EXPECT_EQ(features.tokenFeature(1, 2), (std::vector<double>{-5, -6}));
    EXPECT_THROW(features.tokenFeature(2, 0), std::out_of_range);
    EXPECT_THROW(features.tokenFeature(0, 3), std::out_of_range);
}

TEST_F(CorpusTest, SentenceFeatureRowOfWrongWidthThrows) {
    writeFile(dir.file("sen2vec"), "1 2 3 4 5 6\n1 2 3\n");
    EXPECT_THROW(SentenceFeatures::read(dir.file("sen2vec"), 3, 2), std::runtime_error);
}
