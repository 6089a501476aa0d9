#include<getopt.h>

#include<cmath>
#include<sstream>
#include<stdexcept>
#include<string>
#include<type_traits>
#include<vector>

#include<fmt/format.h>
#include<doctest/doctest.h>

#include"../include/Config.hpp"

namespace ProximalPolicy
{
    namespace
    {
        enum OptionType { NONE, INT, FLOAT, STRING };

        struct OptionStruct
        {
            char shortOpt;
            std::string longOpt;
            OptionType type;
            std::string description;
        };

        const std::vector<OptionStruct> &options()
        {
            static const std::vector<OptionStruct> options{
                {'e', "env", STRING, "Gym environment id"},
                {'u', "server-url", STRING, "ZeroMQ endpoint of the gym server"},
                {'F', "frame-stack", INT, "Number of stacked observations"},
                {'x', "observation-scale", FLOAT, "Factor applied to every observation"},
                {'s', "steps-per-epoch", INT, "Environment steps collected per epoch"},
                {'n', "epochs", INT, "Number of epochs"},
                {'g', "gamma", FLOAT, "Discount factor"},
                {'c', "clip-ratio", FLOAT, "PPO clipping range"},
                {'p', "pi-lr", FLOAT, "Policy learning rate"},
                {'v', "vf-lr", FLOAT, "Value function learning rate"},
                {'P', "train-pi-iters", INT, "Maximum policy steps per epoch"},
                {'V', "train-v-iters", INT, "Value steps per epoch"},
                {'l', "lambda", FLOAT, "GAE lambda"},
                {'m', "max-ep-len", INT, "Maximum episode length"},
                {'k', "target-kl", FLOAT, "Target KL divergence"},
                {'f', "save-freq", INT, "Epochs between checkpoints"},
                {'o', "checkpoint", STRING, "Checkpoint file to write"},
                {'L', "load", STRING, "Checkpoint file to start from"},
                {'d', "log-dir", STRING, "Directory for metric logs"},
                {'E', "no-evaluate", NONE, "Skip the evaluation episodes"},
                {'D', "deterministic", NONE, "Evaluate with the most likely actions"},
                {'R', "render", NONE, "Render evaluation episodes"},
                {'t', "threads", INT, "Number of intra-op threads"},
                {'S', "seed", INT, "Random seed"},
                {'C', "cuda", NONE, "Train on the GPU"},
                {'h', "help", NONE, "Print this help"}};
            return options;
        }

        template<typename T>
        T parseNumber(const std::string &name, const std::string &text)
        {
            size_t consumed = 0;
            T value;
            try
            {
                if constexpr (std::is_same<T, int>::value)
                {
                    value = std::stoi(text, &consumed);
                }
                else
                {
                    value = std::stof(text, &consumed);
                }
            }
            catch (const std::logic_error &)
            {
                throw std::invalid_argument("Option --" + name + " expects a number, got \"" + text + "\"");
            }
            if (consumed != text.size())
            {
                throw std::invalid_argument("Option --" + name + " expects a number, got \"" + text + "\"");
            }
            return value;
        }

        void require(bool condition, const std::string &message)
        {
            if (!condition)
            {
                throw std::invalid_argument(message);
            }
        }
    }

    void TrainingConfig::validate() const
    {
        require(!envName.empty(), "envName must not be empty");
        require(!serverUrl.empty(), "serverUrl must not be empty");
        require(frameStack >= 1, "frameStack must be at least 1");
        require(std::isfinite(observationScale) && observationScale > 0, "observationScale must be positive");
        require(stepsPerEpoch > 0, "stepsPerEpoch must be positive");
        require(epochs > 0, "epochs must be positive");
        require(gamma > 0 && gamma <= 1, "gamma must be in (0, 1]");
        require(lambda >= 0 && lambda <= 1, "lambda must be in [0, 1]");
        require(clipRatio > 0 && clipRatio < 1, "clipRatio must be in (0, 1)");
        require(policyLearningRate > 0, "policyLearningRate must be positive");
        require(valueLearningRate > 0, "valueLearningRate must be positive");
        require(trainPolicyIterations >= 0, "trainPolicyIterations must not be negative");
        require(trainValueIterations >= 0, "trainValueIterations must not be negative");
        require(maxEpisodeLength > 0, "maxEpisodeLength must be positive");
        require(targetKl > 0, "targetKl must be positive");
        require(saveFrequency > 0, "saveFrequency must be positive");
        require(numThreads > 0, "numThreads must be positive");
    }

    std::string usage(const std::string &program)
    {
        std::ostringstream text;
        text << "Usage: " << program << " [options]\n";
        for (const auto &option : options())
        {
            text << fmt::format("  -{}, --{:<20} {}\n", option.shortOpt,
                                option.longOpt + (option.type == NONE ? "" : " <value>"), option.description);
        }
        return text.str();
    }

    /**
     * @details Long options may be given with a single dash, so `-env CartPole-v1` and
     * `--env CartPole-v1` are equivalent. "--enviroment" is accepted as an alias of "--env".
     */
    TrainingConfig parseArguments(int argc, char *argv[])
    {
        TrainingConfig config;

        std::string ctrlString = ":";
        std::vector<option> longOptions;
        for (const auto &opt : options())
        {
            ctrlString += opt.shortOpt;
            if (opt.type != NONE)
            {
                ctrlString += ':';
            }
            longOptions.push_back({opt.longOpt.c_str(), opt.type == NONE ? no_argument : required_argument,
                                   nullptr, opt.shortOpt});
        }
        longOptions.push_back({"enviroment", required_argument, nullptr, 'e'});
        longOptions.push_back({nullptr, 0, nullptr, 0});

        // Restart the scan; getopt keeps its position in globals
        optind = 0;
        opterr = 0;

        int c = 0;
        int optionIndex = 0;
        while ((c = getopt_long_only(argc, argv, ctrlString.c_str(), longOptions.data(), &optionIndex)) != -1)
        {
            const std::string argument = optarg != nullptr ? optarg : "";
            switch (c)
            {
                case 'e': config.envName = argument; break;
                case 'u': config.serverUrl = argument; break;
                case 'F': config.frameStack = parseNumber<int>("frame-stack", argument); break;
                case 'x': config.observationScale = parseNumber<float>("observation-scale", argument); break;
                case 's': config.stepsPerEpoch = parseNumber<int>("steps-per-epoch", argument); break;
                case 'n': config.epochs = parseNumber<int>("epochs", argument); break;
                case 'g': config.gamma = parseNumber<float>("gamma", argument); break;
                case 'c': config.clipRatio = parseNumber<float>("clip-ratio", argument); break;
                case 'p': config.policyLearningRate = parseNumber<float>("pi-lr", argument); break;
                case 'v': config.valueLearningRate = parseNumber<float>("vf-lr", argument); break;
                case 'P': config.trainPolicyIterations = parseNumber<int>("train-pi-iters", argument); break;
                case 'V': config.trainValueIterations = parseNumber<int>("train-v-iters", argument); break;
                case 'l': config.lambda = parseNumber<float>("lambda", argument); break;
                case 'm': config.maxEpisodeLength = parseNumber<int>("max-ep-len", argument); break;
                case 'k': config.targetKl = parseNumber<float>("target-kl", argument); break;
                case 'f': config.saveFrequency = parseNumber<int>("save-freq", argument); break;
                case 'o': config.checkpointPath = argument; break;
                case 'L': config.loadPath = argument; break;
                case 'd': config.logDirectory = argument; break;
                case 'E': config.evaluate = false; break;
                case 'D': config.deterministicEvaluation = true; break;
                case 'R': config.renderEvaluation = true; break;
                case 't': config.numThreads = parseNumber<int>("threads", argument); break;
                case 'S': config.seed = parseNumber<int>("seed", argument); break;
                case 'C': config.useCuda = true; break;
                case 'h': config.showUsage = true; break;
                case ':':
                    throw std::invalid_argument(std::string("Missing value for option ") + argv[optind - 1]);
                default:
                    throw std::invalid_argument(std::string("Unknown option ") + argv[optind - 1]);
            }
        }
        if (optind < argc)
        {
            throw std::invalid_argument(std::string("Unexpected argument ") + argv[optind]);
        }

        config.validate();
        return config;
    }

    static TrainingConfig parse(std::vector<std::string> arguments)
    {
        arguments.insert(arguments.begin(), "train");
        std::vector<char *> argv;
        for (auto &argument : arguments)
        {
            argv.push_back(&argument[0]);
        }
        argv.push_back(nullptr);
        return parseArguments(static_cast<int>(arguments.size()), argv.data());
    }

    TEST_CASE("TrainingConfig")
    {
        SUBCASE("Defaults are valid")
        {
            TrainingConfig config;
            CHECK_NOTHROW(config.validate());
            CHECK(config.stepsPerEpoch == 4000);
            CHECK(config.targetKl == doctest::Approx(0.01));
        }

        SUBCASE("Out of range values are rejected")
        {
            TrainingConfig config;
            config.gamma = 1.5;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);

            config = TrainingConfig();
            config.stepsPerEpoch = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);

            config = TrainingConfig();
            config.frameStack = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }
    }

    TEST_CASE("parseArguments()")
    {
        SUBCASE("No arguments gives the defaults")
        {
            auto config = parse({});
            CHECK(config.envName == "BipedalWalker-v2");
            CHECK(config.epochs == 3000);
            CHECK(config.evaluate);
        }

        SUBCASE("Single dash long options are accepted")
        {
            auto config = parse({"-env", "CartPole-v1"});
            CHECK(config.envName == "CartPole-v1");

            config = parse({"--enviroment", "LunarLander-v2"});
            CHECK(config.envName == "LunarLander-v2");
        }

        SUBCASE("Numeric and flag options")
        {
            auto config = parse({"--steps-per-epoch", "200", "-g", "0.9", "--pi-lr=3e-4",
                                 "--no-evaluate", "--deterministic", "-S", "7"});
            CHECK(config.stepsPerEpoch == 200);
            CHECK(config.gamma == doctest::Approx(0.9));
            CHECK(config.policyLearningRate == doctest::Approx(3e-4));
            CHECK(!config.evaluate);
            CHECK(config.deterministicEvaluation);
            CHECK(config.seed == 7);
        }

        SUBCASE("Help is requested without failing validation")
        {
            CHECK(parse({"--help"}).showUsage);
            CHECK(usage("train").find("--target-kl") != std::string::npos);
        }

        SUBCASE("Bad input throws")
        {
            CHECK_THROWS_AS(parse({"--epochs", "many"}), std::invalid_argument);
            CHECK_THROWS_AS(parse({"--epochs", "10x"}), std::invalid_argument);
            CHECK_THROWS_AS(parse({"--bogus"}), std::invalid_argument);
            CHECK_THROWS_AS(parse({"--gamma", "2"}), std::invalid_argument);
            CHECK_THROWS_AS(parse({"stray"}), std::invalid_argument);
            CHECK_THROWS_AS(parse({"--epochs"}), std::invalid_argument);
        }
    }
}
