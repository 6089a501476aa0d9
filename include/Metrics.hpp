#pragma once

#ifndef PROXIMALPOLICY_METRICS_HPP
#define PROXIMALPOLICY_METRICS_HPP

#include<memory>
#include<string>

#include<spdlog/spdlog.h>

namespace ProximalPolicy
{
    /**
     * @brief Sink for scalar training statistics
     */
    class MetricsWriter
    {
    public:
        virtual ~MetricsWriter() = default;

        /**
         * @param tag Name of the series, e.g. "Episode Rewards"
         * @param value Scalar to record
         * @param step Position on the series' x axis (episode or epoch counter)
         */
        virtual void addScalar(const std::string &tag, float value, int64_t step) = 0;
    };

    /**
     * @brief Writes scalars through a dedicated spdlog logger
     *
     * The default constructor logs to the console and to
     * `<logDirectory>/<runName>/<start time>.log`, one line per scalar.
     */
    class LoggingMetricsWriter : public MetricsWriter
    {
    private:
        std::shared_ptr<spdlog::logger> logger;
        std::string logFile;

    public:
        /**
         * @throws spdlog::spdlog_ex if the log file cannot be created
         */
        LoggingMetricsWriter(const std::string &logDirectory, const std::string &runName);

        /**
         * @brief Uses an existing logger instead of creating one
         */
        explicit LoggingMetricsWriter(std::shared_ptr<spdlog::logger> logger);

        ~LoggingMetricsWriter() override;

        void addScalar(const std::string &tag, float value, int64_t step) override;

        inline const std::string &getLogFile() const { return logFile; }
    };
}

#endif //PROXIMALPOLICY_METRICS_HPP
