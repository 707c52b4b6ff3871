// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Диагностика проверяется через log_path/output_path: Writer пишет в
// временные файлы, тест читает их после flush().
//
// ==============================================================================

#include <sysguard/output.hpp>
#include <sysguard/platform.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace sysguard::output::test {

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class WriterFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = platform::make_temp_file("sysguard_log");
        out_path_ = platform::make_temp_file("sysguard_out");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(log_path_, ec);
        std::filesystem::remove(out_path_, ec);
    }

    OutputConfig make_config() const {
        OutputConfig cfg;
        cfg.log_path = log_path_;
        cfg.output_path = out_path_;
        return cfg;
    }

    std::filesystem::path log_path_;
    std::filesystem::path out_path_;
};

}  // namespace

// ==============================================================================
// ANSI
// ==============================================================================

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
}

// ==============================================================================
// Writer: уровни диагностики
// ==============================================================================

TEST_F(WriterFileTest, DefaultLevelsWriteInfoWarnError) {
    {
        Writer writer(make_config());
        EXPECT_TRUE(writer.has_log_file());
        writer.info("info line");
        writer.warn("warn line");
        writer.error("error line");
        writer.debug("debug line");
        writer.trace("trace line");
    }

    std::string log = read_file(log_path_);
    EXPECT_NE(log.find("[+] info line\n"), std::string::npos);
    EXPECT_NE(log.find("[!] warn line\n"), std::string::npos);
    EXPECT_NE(log.find("[x] error line\n"), std::string::npos);
    EXPECT_EQ(log.find("debug line"), std::string::npos);
    EXPECT_EQ(log.find("trace line"), std::string::npos);
    // В лог-файл без ANSI
    EXPECT_EQ(log.find('\x1b'), std::string::npos);
}

TEST_F(WriterFileTest, QuietKeepsOnlyErrors) {
    auto cfg = make_config();
    cfg.quiet = true;
    {
        Writer writer(cfg);
        writer.info("info line");
        writer.warn("warn line");
        writer.error("error line");
    }

    std::string log = read_file(log_path_);
    EXPECT_EQ(log, "[x] error line\n");
}

TEST_F(WriterFileTest, VerboseLevels) {
    auto cfg = make_config();
    cfg.verbose = 1;
    {
        Writer writer(cfg);
        writer.debug("debug line");
        writer.trace("trace line");
    }
    std::string log = read_file(log_path_);
    EXPECT_NE(log.find("[*] debug line"), std::string::npos);
    EXPECT_EQ(log.find("trace line"), std::string::npos);

    cfg.verbose = 2;
    {
        Writer writer(cfg);
        writer.trace("trace line");
    }
    EXPECT_NE(read_file(log_path_).find("[~] trace line"), std::string::npos);
}

TEST_F(WriterFileTest, ResultsGoToOutputFile) {
    {
        Writer writer(make_config());
        writer.write(Stream::Stdout, "a");
        writer.write_line(Stream::Stdout, "b");
        writer.info("diagnostic");
    }

    EXPECT_EQ(read_file(out_path_), "ab\n");
    EXPECT_EQ(read_file(log_path_).find("ab"), std::string::npos);
}

TEST_F(WriterFileTest, ConcurrentMessagesAreNotInterleaved) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 100;
    {
        Writer writer(make_config());
        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&writer, t] {
                for (int i = 0; i < PER_THREAD; ++i) {
                    writer.info("thread-" + std::to_string(t) + "-message");
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    std::istringstream in(read_file(log_path_));
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        ++lines;
        EXPECT_EQ(line.rfind("[+] thread-", 0), 0u) << line;
        EXPECT_EQ(line.size(), std::string("[+] thread-0-message").size()) << line;
    }
    EXPECT_EQ(lines, THREADS * PER_THREAD);
}

// ==============================================================================
// JSON
// ==============================================================================

TEST_F(WriterFileTest, WriteJsonPrettyProducesParsableDocument) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    rapidjson::Value rules(rapidjson::kArrayType);
    rules.PushBack(rapidjson::Value("cpu-guard", alloc), alloc);
    doc.AddMember("rules", rules, alloc);
    {
        Writer writer(make_config());
        writer.write_json_pretty(doc);
    }

    std::string text = read_file(out_path_);
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');

    rapidjson::Document parsed;
    parsed.Parse(text.c_str());
    ASSERT_FALSE(parsed.HasParseError());
    ASSERT_TRUE(parsed["rules"].IsArray());
    EXPECT_STREQ(parsed["rules"][0u].GetString(), "cpu-guard");
}

// ==============================================================================
// Table
// ==============================================================================

TEST(TableTest, RendersHeadersAndRows) {
    Table table;
    table.set_headers({"id", "metric_type"});
    table.add_row({"cpu-guard", "cpu_usage"});
    table.add_row({"l", "load"});

    EXPECT_EQ(table.row_count(), 2u);
    std::string text = table.to_string();

    // 2 границы + заголовок + разделитель + 2 строки
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 6);
    EXPECT_NE(text.find("\xe2\x94\x8c"), std::string::npos);
    EXPECT_NE(text.find("\xe2\x94\x82 id        \xe2\x94\x82 metric_type \xe2\x94\x82"),
              std::string::npos);
    EXPECT_NE(text.find("\xe2\x94\x82 l         \xe2\x94\x82 load        \xe2\x94\x82"),
              std::string::npos);
}

TEST(TableTest, ShortRowsArePadded) {
    Table table;
    table.set_headers({"a", "b"});
    table.add_row({"x"});

    std::string text = table.to_string();
    EXPECT_NE(text.find("\xe2\x94\x82 x \xe2\x94\x82   \xe2\x94\x82"), std::string::npos);
}

}  // namespace sysguard::output::test
