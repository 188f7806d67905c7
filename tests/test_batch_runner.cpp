#include <gtest/gtest.h>
#include "utils/BatchRunner.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

class BatchRunnerTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("adfgvx_runner_" +
            std::to_string(std::chrono::system_clock::now()
                .time_since_epoch().count()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeFile(const fs::path& p, const std::string& content) {
        std::ofstream out(p, std::ios::binary);
        out << content;
    }

    // Message of the std::runtime_error thrown by execute, empty if nothing was thrown
    static std::string errorOf(const utils::BatchOptions& options) {
        try {
            utils::BatchRunner::execute(options);
        } catch (const std::runtime_error& e) {
            return e.what();
        }
        return "";
    }
};

// Exactly one of --text / --input
TEST_F(BatchRunnerTest, RequiresExactlyOneInput)
{
    utils::BatchOptions none;
    none.key = "GERMAN";
    EXPECT_EQ(errorOf(none), "Specify exactly one of --text or --input");

    utils::BatchOptions both = none;
    both.text = "ATTACK";
    both.input = root.string();
    EXPECT_EQ(errorOf(both), "Specify exactly one of --text or --input");
}

TEST_F(BatchRunnerTest, UnknownOperation)
{
    utils::BatchOptions options;
    options.operation = "sign";
    options.key = "GERMAN";
    options.text = "ATTACK";
    EXPECT_NE(errorOf(options).find("Unknown operation: sign"), std::string::npos);
}

// Klucz jest sprawdzany zanim czytamy jakiekolwiek wejscie
TEST_F(BatchRunnerTest, KeyIsRejectedBeforeInputIsRead)
{
    utils::BatchOptions options;
    options.key = "ab-cd";
    options.input = (root / "missing").string();

    std::string error = errorOf(options);
    EXPECT_NE(error.find("The key ab-cd is invalid"), std::string::npos) << error;
    EXPECT_EQ(error.find("does not exist"), std::string::npos) << error;
}

// Liczba blednych znakow sumowana po wszystkich plikach, nic nie jest zapisane
TEST_F(BatchRunnerTest, InvalidCiphertextCountedAcrossFiles)
{
    fs::path in = root / "in";
    fs::create_directories(in);
    writeFile(in / "a.txt", "ADFZ");
    writeFile(in / "b.txt", "adfgQQ");

    utils::BatchOptions options;
    options.operation = "decrypt";
    options.key = "GERMAN";
    options.input = in.string();
    options.outputDir = (root / "out").string();

    EXPECT_EQ(errorOf(options), "Found 7 invalid characters in the cipher text.");
    EXPECT_FALSE(fs::exists(root / "out"));
}

TEST_F(BatchRunnerTest, CleaningVersusRaw)
{
    utils::BatchOptions options;
    options.key = "GERMAN";
    options.text = "Attack at dawn!";

    utils::BatchOutcome cleaned = utils::BatchRunner::execute(options);
    ASSERT_EQ(cleaned.results.size(), 1u);
    EXPECT_EQ(cleaned.results[0], "XGFFGGGGDDDDGVGGGDXFXGXV");
    EXPECT_TRUE(cleaned.written.empty());

    // --raw hands the text to the cipher unchanged
    options.raw = true;
    std::string error = errorOf(options);
    EXPECT_NE(error.find("Character not in Polybius square: t"), std::string::npos) << error;

    options.text = "ATTACKATDAWN";
    utils::BatchOutcome raw = utils::BatchRunner::execute(options);
    ASSERT_EQ(raw.results.size(), 1u);
    EXPECT_EQ(raw.results[0], "XGFFGGGGDDDDGVGGGDXFXGXV");
}

TEST_F(BatchRunnerTest, RawDecryptSkipsValidation)
{
    utils::BatchOptions options;
    options.operation = "decrypt";
    options.key = "GERMAN";
    options.raw = true;
    options.text = "XGFFGGGGDDDDGVGGGDXFXGXZ";

    std::string error = errorOf(options);
    EXPECT_EQ(error.find("Found"), std::string::npos) << error;
    EXPECT_NE(error.find("ADFGVX alphabet: Z"), std::string::npos) << error;
}

// Drugi plik sie nie udaje - pierwszy tez nie moze zostac zapisany
TEST_F(BatchRunnerTest, FailingJobLeavesNoOutput)
{
    fs::path in = root / "in";
    fs::path out = root / "out";
    fs::create_directories(in);
    writeFile(in / "a.txt", "ATTACKATDAWN");
    writeFile(in / "b.txt", "attack");

    utils::BatchOptions options;
    options.key = "GERMAN";
    options.raw = true;
    options.input = in.string();
    options.outputDir = out.string();

    std::string error = errorOf(options);
    EXPECT_NE(error.find("b.txt"), std::string::npos) << error;
    EXPECT_TRUE(!fs::exists(out) || fs::is_empty(out));
}

TEST_F(BatchRunnerTest, WritesNumberedFilesAndLogsProgress)
{
    fs::path in = root / "in";
    fs::path out = root / "out";
    fs::create_directories(in);
    writeFile(in / "a.txt", "Attack at\ndawn");
    writeFile(in / "b.txt", "0123456789");

    std::ostringstream log;
    utils::BatchOptions options;
    options.key = "KEY12";
    options.input = in.string();
    options.outputDir = out.string();
    options.log = &log;

    utils::BatchOutcome outcome = utils::BatchRunner::execute(options);
    ASSERT_EQ(outcome.written.size(), 2u);
    EXPECT_EQ(outcome.written[0].filename().string(), "encrypted1.txt");
    EXPECT_EQ(outcome.written[1].filename().string(), "encrypted2.txt");
    EXPECT_EQ(outcome.results[1], "VDXXFAVDFGDXADVVDGAX");

    EXPECT_NE(log.str().find("[*] Encryption started"), std::string::npos);
    EXPECT_NE(log.str().find("[*] Wrote "), std::string::npos);

    // round trip through the written files
    utils::BatchOptions back;
    back.operation = "decrypt";
    back.key = "KEY12";
    back.input = out.string();
    utils::BatchOutcome decrypted = utils::BatchRunner::execute(back);
    ASSERT_EQ(decrypted.results.size(), 2u);
    EXPECT_EQ(decrypted.results[1], "0123456789");
}
