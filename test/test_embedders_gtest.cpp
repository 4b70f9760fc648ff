#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>

#include "docintel/Embedder.hpp"
#include "emb/HashEmbedder.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"

namespace fs = std::filesystem;

static double norm(const std::vector<float>& v) {
    double s = 0.0;
    for (float x : v) s += (double)x * x;
    return std::sqrt(s);
}

TEST(EmbedderTest, CosineAndNormalize) {
    EXPECT_FLOAT_EQ(docintel::cosine({1.0f, 0.0f}, {2.0f, 0.0f}), 1.0f);
    EXPECT_FLOAT_EQ(docintel::cosine({1.0f, 0.0f}, {0.0f, 3.0f}), 0.0f);
    EXPECT_FLOAT_EQ(docintel::cosine({1.0f}, {1.0f, 2.0f}), 0.0f);
    EXPECT_FLOAT_EQ(docintel::cosine({}, {}), 0.0f);

    std::vector<float> v = {3.0f, 4.0f};
    docintel::l2_normalize(v);
    EXPECT_FLOAT_EQ(v[0], 0.6f);
    EXPECT_FLOAT_EQ(v[1], 0.8f);

    std::vector<float> zero = {0.0f, 0.0f};
    docintel::l2_normalize(zero);
    EXPECT_FLOAT_EQ(zero[0], 0.0f);
}

TEST(HashEmbedderTest, DeterministicUnitVectors) {
    const HashEmbedder emb(64);
    const auto a = emb.embed("College friends on a beach trip");
    const auto b = emb.embed("College friends on a beach trip");

    ASSERT_EQ(a.size(), 64u);
    EXPECT_EQ(a, b);
    EXPECT_NEAR(norm(a), 1.0, 1e-5);
    EXPECT_NEAR(docintel::cosine(a, b), 1.0f, 1e-5);
}

TEST(HashEmbedderTest, SharedTermsAreCloser) {
    const HashEmbedder emb;
    const auto q = emb.embed("beach trip with college friends");
    const auto near = emb.embed("a beach trip for college friends in summer");
    const auto far = emb.embed("quarterly revenue forecast spreadsheet");
    EXPECT_GT(docintel::cosine(q, near), docintel::cosine(q, far));
}

TEST(HashEmbedderTest, EmptyTextGivesZeroVector) {
    const HashEmbedder emb(16);
    const auto v = emb.embed("");
    ASSERT_EQ(v.size(), 16u);
    EXPECT_DOUBLE_EQ(norm(v), 0.0);
}

class WordPieceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "docintel_test_wordpiece";
        fs::create_directories(dir_);
        std::ofstream out(dir_ / "vocab.txt");
        // ids: 0 [PAD], 1 [UNK], 2 [CLS], 3 [SEP], 4.. pieces
        out << "[PAD]\n[UNK]\n[CLS]\n[SEP]\nun\n##aff\n##able\ntrip\n,\n";
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

TEST_F(WordPieceTest, GreedyLongestMatch) {
    WordPieceTokenizer tok;
    ASSERT_TRUE(tok.load_vocab((dir_ / "vocab.txt").string()));
    EXPECT_EQ(tok.vocab_size(), 9u);

    const std::vector<std::string> want = {"un", "##aff", "##able", ",", "trip", "[UNK]"};
    EXPECT_EQ(tok.pieces("Unaffable, TRIP zzz"), want);
}

TEST_F(WordPieceTest, EncodeWrapsAndTruncates) {
    WordPieceTokenizer tok;
    ASSERT_TRUE(tok.load_vocab((dir_ / "vocab.txt").string()));

    const std::vector<int64_t> ids = tok.encode("trip trip trip", 16);
    const std::vector<int64_t> want = {2, 7, 7, 7, 3};
    EXPECT_EQ(ids, want);

    const std::vector<int64_t> cut = tok.encode("trip trip trip", 3);
    const std::vector<int64_t> want_cut = {2, 7, 3};
    EXPECT_EQ(cut, want_cut);
}

TEST(WordPieceTokenizerTest, MissingVocab) {
    WordPieceTokenizer tok;
    EXPECT_FALSE(tok.load_vocab("/nonexistent/vocab.txt"));
}

TEST(MiniLmEmbedderTest, MissingModelIsReportedAndEmbedsNothing) {
    MiniLmEmbedder emb;
    EXPECT_FALSE(emb.init("/nonexistent/model.onnx", "/nonexistent/vocab.txt"));
    EXPECT_FALSE(emb.ready());
    EXPECT_TRUE(emb.embed("anything").empty());
    EXPECT_EQ(emb.name(), "minilm");
}
