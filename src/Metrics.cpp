#include<chrono>
#include<filesystem>
#include<fstream>
#include<memory>
#include<sstream>
#include<string>
#include<vector>

#include<spdlog/spdlog.h>
#include<spdlog/sinks/basic_file_sink.h>
#include<spdlog/sinks/ostream_sink.h>
#include<spdlog/sinks/stdout_color_sinks.h>
#include<doctest/doctest.h>

#include"../include/Metrics.hpp"

namespace ProximalPolicy
{
    LoggingMetricsWriter::LoggingMetricsWriter(const std::string &logDirectory, const std::string &runName)
    {
        auto startTime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        logFile = (std::filesystem::path(logDirectory) / runName / (std::to_string(startTime) + ".log")).string();

        std::vector<spdlog::sink_ptr> sinks{
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true)};
        sinks[0]->set_pattern("%^[%T %7l] %v%$");
        sinks[1]->set_pattern("%Y-%m-%d %T %v");

        logger = std::make_shared<spdlog::logger>("metrics", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        spdlog::info("Writing metrics to {}", logFile);
    }

    LoggingMetricsWriter::LoggingMetricsWriter(std::shared_ptr<spdlog::logger> logger) : logger(std::move(logger)) {}

    LoggingMetricsWriter::~LoggingMetricsWriter()
    {
        logger->flush();
    }

    void LoggingMetricsWriter::addScalar(const std::string &tag, float value, int64_t step)
    {
        logger->info("{} [{}] {}", tag, step, value);
    }

    TEST_CASE("LoggingMetricsWriter")
    {
        SUBCASE("Scalars are written one per line")
        {
            std::ostringstream stream;
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
            sink->set_pattern("%v");
            LoggingMetricsWriter writer(std::make_shared<spdlog::logger>("test-metrics", sink));

            writer.addScalar("Episode Rewards", 12.5, 3);
            writer.addScalar("Value loss", 0.25, 1);

            CHECK(stream.str() == "Episode Rewards [3] 12.5\nValue loss [1] 0.25\n");
        }

        SUBCASE("Log files are created under the run directory")
        {
            auto directory = std::filesystem::temp_directory_path() / "proximalpolicy-metrics-test";
            std::string logFile;
            {
                LoggingMetricsWriter writer(directory.string(), "CartPole-v1");
                writer.addScalar("Episode Rewards", 7, 1);
                logFile = writer.getLogFile();
            }

            CHECK(std::filesystem::path(logFile).parent_path() == directory / "CartPole-v1");
            std::ifstream file(logFile);
            std::string line;
            REQUIRE(std::getline(file, line));
            CHECK(line.find("Episode Rewards [1] 7") != std::string::npos);
            std::filesystem::remove_all(directory);
        }
    }
}
