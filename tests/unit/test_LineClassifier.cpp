#include <gtest/gtest.h>
#include "count/LineClassifier.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace lc::count;
using namespace lc::types;

class LineClassifierTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   ("linecount_classifier_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path writeFile(const std::string& name, const std::string& content) const {
        const auto path = test_dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

TEST_F(LineClassifierTest, MixedLines) {
    const auto path = writeFile("a.txt", "hello\n\n  \n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{1, 2}));
}

TEST_F(LineClassifierTest, WhitespaceOnlyLinesAreEmpty) {
    const auto path = writeFile("ws.txt", " \t \n\t\n    \n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{0, 3}));
}

TEST_F(LineClassifierTest, AnyVisibleCharacterIsNonEmpty) {
    const auto path = writeFile("code.txt", "   }\n\t;\n.\n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{3, 0}));
}

TEST_F(LineClassifierTest, TrailingLineWithoutNewlineIsCounted) {
    const auto path = writeFile("partial.txt", "first\nsecond");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{2, 0}));
}

TEST_F(LineClassifierTest, TerminatedLastLineIsNotCountedTwice) {
    const auto path = writeFile("one.txt", "x\n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{1, 0}));
}

TEST_F(LineClassifierTest, EmptyFileHasNoLines) {
    const auto path = writeFile("empty.txt", "");
    EXPECT_EQ(LineClassifier::classify(path), FileStat{});
}

TEST_F(LineClassifierTest, CrlfLineEndings) {
    const auto path = writeFile("dos.txt", "int x;\r\n\r\n  \r\n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{1, 2}));
}

TEST_F(LineClassifierTest, UnicodeWhitespaceIsEmpty) {
    // NO-BREAK SPACE, IDEOGRAPHIC SPACE, EM SPACE
    const auto path = writeFile("unicode.txt", "\xC2\xA0\xE3\x80\x80\n\xE2\x80\x83\nh\xC3\xA9llo\n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{1, 2}));
}

TEST_F(LineClassifierTest, InvalidLineDiscardsWholeFile) {
    const auto path = writeFile("corrupt.txt", "one\ntwo\nthree\n\xFF\xFE broken\nfour\n");
    EXPECT_EQ(LineClassifier::classify(path), FileStat{});
}

TEST_F(LineClassifierTest, InvalidLineCountedWhenValidationDisabled) {
    const auto path = writeFile("corrupt.txt", "one\ntwo\nthree\n\xFF\xFE broken\n");
    EXPECT_EQ(LineClassifier::classify(path, {.validate_utf8 = false}), (FileStat{4, 0}));
}

TEST_F(LineClassifierTest, OverlongEncodingIsInvalid) {
    const auto path = writeFile("overlong.txt", "ok\n\xC0\xAF\n");
    EXPECT_EQ(LineClassifier::classify(path), FileStat{});
}

TEST_F(LineClassifierTest, EncodedSurrogateIsInvalid) {
    const auto path = writeFile("surrogate.txt", "ok\n\xED\xA0\x80\n");
    EXPECT_EQ(LineClassifier::classify(path), FileStat{});
}

TEST_F(LineClassifierTest, TruncatedSequenceIsInvalid) {
    const auto path = writeFile("truncated.txt", "ok\nab\xE2\x82");
    EXPECT_EQ(LineClassifier::classify(path), FileStat{});
}

TEST_F(LineClassifierTest, FourByteSequenceIsValid) {
    const auto path = writeFile("emoji.txt", "\xF0\x9F\x98\x80\n\n");
    EXPECT_EQ(LineClassifier::classify(path), (FileStat{1, 1}));
}

TEST_F(LineClassifierTest, ClassifyingTwiceGivesSameResult) {
    const auto path = writeFile("stable.txt", "a\n\nb\n \n\tc\n");
    const auto first = LineClassifier::classify(path);
    const auto second = LineClassifier::classify(path);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, (FileStat{3, 2}));
}

TEST_F(LineClassifierTest, MissingFileThrows) {
    EXPECT_THROW(LineClassifier::classify(test_dir / "does-not-exist.txt"), std::runtime_error);
}

TEST_F(LineClassifierTest, DanglingSymlinkThrows) {
    const auto link = test_dir / "dangling.txt";
    fs::create_symlink(test_dir / "nowhere", link);
    EXPECT_THROW(LineClassifier::classify(link), std::runtime_error);
}
