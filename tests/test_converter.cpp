#include <gtest/gtest.h>
#include "converter.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

class ConverterTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_converter_test");
        fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        fs::remove_all(suite_work_dir);
    }

    fs::path write_script(const std::string& name, const std::string& body) {
        fs::path p = suite_work_dir / name;
        std::ofstream f(p);
        f << "#!/bin/sh\n" << body;
        f.close();
        fs::permissions(p, fs::perms::owner_all);
        return p;
    }

    static std::vector<std::string> read_lines(const fs::path& p) {
        std::ifstream f(p);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(f, line)) lines.push_back(line);
        return lines;
    }
};

TEST_F(ConverterTest, BuildsArgumentsInFixedOrder) {
    InstallConfig config;
    config.output_node_names = "logits";
    auto args = build_converter_args("tensorflowjs_converter", config, "export/1700000000", "../web_model");

    std::vector<std::string> expected = {
        "tensorflowjs_converter",
        "--input_format=tf_saved_model",
        "--saved_model_tags=serve",
        "--output_node_names=logits",
        "export/1700000000",
        "../web_model"
    };
    EXPECT_EQ(args, expected);
}

TEST_F(ConverterTest, ResolvesNewestMatchingDirectory) {
    fs::create_directories(suite_work_dir / "export/1600000000");
    fs::create_directories(suite_work_dir / "export/1700000000");
    std::ofstream(suite_work_dir / "export/1800000000") << "a file, not an export";

    EXPECT_EQ(resolve_model_source(suite_work_dir, "export/*"), fs::path("export/1700000000"));
}

TEST_F(ConverterTest, ResolvesLiteralAndNestedPatterns) {
    fs::create_directories(suite_work_dir / "model/serving/42");
    fs::create_directories(suite_work_dir / "model/.hidden/99");

    EXPECT_EQ(resolve_model_source(suite_work_dir, "model/serving/42"), fs::path("model/serving/42"));
    // Leading dots are not matched by wildcards, as in a shell glob
    EXPECT_EQ(resolve_model_source(suite_work_dir, "model/*/*"), fs::path("model/serving/42"));
    EXPECT_EQ(resolve_model_source(suite_work_dir, "./model/serv?ng/[0-9]*"), fs::path("model/serving/42"));
}

TEST_F(ConverterTest, NoMatchIsExtractionFailure) {
    fs::create_directories(suite_work_dir / "other");
    try {
        resolve_model_source(suite_work_dir, "export/*");
        FAIL() << "Expected ExtractException";
    } catch (const ExtractException& e) {
        EXPECT_EQ(e.exit_code(), EXIT_EXTRACT_FAILED);
    }
}

TEST_F(ConverterTest, AbsolutePatternRejected) {
    EXPECT_THROW(resolve_model_source(suite_work_dir, "/export/*"), ConfigException);
}

TEST_F(ConverterTest, RunProcessReturnsExitStatus) {
    EXPECT_EQ(run_process({"/bin/sh", "-c", "exit 0"}, ""), 0);
    EXPECT_EQ(run_process({"/bin/sh", "-c", "exit 3"}, ""), 3);
}

TEST_F(ConverterTest, RunProcessReportsSignals) {
    EXPECT_EQ(run_process({"/bin/sh", "-c", "kill -TERM $$"}, ""), 128 + 15);
}

TEST_F(ConverterTest, RunProcessMissingBinaryIs127) {
    EXPECT_EQ(run_process({(suite_work_dir / "nope").string()}, ""), 127);
}

TEST_F(ConverterTest, RunProcessUsesWorkingDirectory) {
    fs::create_directories(suite_work_dir / "cwd");
    EXPECT_EQ(run_process({"/bin/sh", "-c", "pwd > here.txt"}, suite_work_dir / "cwd"), 0);

    auto lines = read_lines(suite_work_dir / "cwd/here.txt");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(fs::canonical(lines[0]), fs::canonical(suite_work_dir / "cwd"));
}

TEST_F(ConverterTest, RunConverterPassesRelativePaths) {
    InstallConfig config;
    config.work_dir = suite_work_dir / "work";
    config.output_dir = suite_work_dir / "site/model";
    config.converter = "stub_converter";
    fs::create_directories(config.work_dir / "export/1700000000");

    auto stub = write_script("stub_converter",
        "printf '%s\\n' \"$@\" > args.txt\n"
        "mkdir -p \"$5\" && echo '{}' > \"$5/model.json\"\n");

    EXPECT_NO_THROW(run_converter(stub, config));

    auto args = read_lines(config.work_dir / "args.txt");
    std::vector<std::string> expected = {
        "--input_format=tf_saved_model",
        "--saved_model_tags=serve",
        "--output_node_names=classes,probabilities",
        "export/1700000000",
        "../site/model"
    };
    EXPECT_EQ(args, expected);
    EXPECT_TRUE(fs::exists(config.output_dir / "model.json"));
}

TEST_F(ConverterTest, RunConverterPropagatesFailureStatus) {
    InstallConfig config;
    config.work_dir = suite_work_dir / "work";
    config.output_dir = suite_work_dir / "out";
    fs::create_directories(config.work_dir / "export/1");

    auto stub = write_script("failing_converter", "echo 'bad graph' >&2\nexit 5\n");

    try {
        run_converter(stub, config);
        FAIL() << "Expected ConverterException";
    } catch (const ConverterException& e) {
        EXPECT_EQ(e.exit_code(), 5);
    }
    EXPECT_FALSE(fs::exists(config.output_dir));
}
