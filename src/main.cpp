#include "core/automatic_selector.hpp"
#include "core/duplicate_check_runner.hpp"
#include "core/file_action_executor.hpp"
#include "core/hash_utils.hpp"
#include "core/manual_review_session.hpp"
#include "core/performance_logger.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{
    struct CliOptions
    {
        std::string folder;
        std::string config_file;
        std::optional<int> threshold;
        RunMode mode = RunMode::MANUAL_REVIEW;
        std::optional<std::string> strategy;
        std::optional<std::string> log_level;
        std::string dest;
        bool apply = false;
        bool sort = false;
        bool json_output = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Visual Dedup - find visually duplicate images" << std::endl;
        std::cout << "Usage: " << program << " <folder> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE       JSON or YAML configuration file" << std::endl;
        std::cout << "  --threshold N       Hamming distance threshold (0-64)" << std::endl;
        std::cout << "  --mode manual|auto  Manual review or automatic selection (default: manual)" << std::endl;
        std::cout << "  --strategy NAME     KEEP_BEST_QUALITY, KEEP_LAST_EDITED or KEEP_ALL_UNIQUE_VERSIONS" << std::endl;
        std::cout << "  --apply             Move the files marked for removal" << std::endl;
        std::cout << "  --sort              With KEEP_ALL_UNIQUE_VERSIONS, sort kept files into Originals/Last Edited" << std::endl;
        std::cout << "  --dest DIR          Destination for moved files" << std::endl;
        std::cout << "  --json              Print the result as JSON" << std::endl;
        std::cout << "  --log-level LEVEL   TRACE, DEBUG, INFO, WARN, ERROR or CRITICAL" << std::endl;
        std::cout << "  --help, -h          Show this help message" << std::endl;
    }

    // Returns false on a usage error
    bool parseArguments(int argc, char *argv[], CliOptions &options, bool &show_help)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto needValue = [&](std::string &out)
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Error: " << arg << " requires a value" << std::endl;
                    return false;
                }
                out = argv[++i];
                return true;
            };

            std::string value;
            if (arg == "--help" || arg == "-h")
            {
                show_help = true;
                return true;
            }
            else if (arg == "--config")
            {
                if (!needValue(options.config_file))
                    return false;
            }
            else if (arg == "--threshold")
            {
                if (!needValue(value))
                    return false;
                try
                {
                    size_t used = 0;
                    options.threshold = std::stoi(value, &used);
                    if (used != value.size())
                        throw std::invalid_argument(value);
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: invalid threshold: " << value << std::endl;
                    return false;
                }
            }
            else if (arg == "--mode")
            {
                if (!needValue(value))
                    return false;
                auto mode = DuplicateCheckRunner::parseMode(value);
                if (!mode)
                {
                    std::cerr << "Error: invalid mode: " << value << std::endl;
                    return false;
                }
                options.mode = *mode;
            }
            else if (arg == "--strategy")
            {
                if (!needValue(value))
                    return false;
                options.strategy = value;
            }
            else if (arg == "--log-level")
            {
                if (!needValue(value))
                    return false;
                options.log_level = value;
            }
            else if (arg == "--dest")
            {
                if (!needValue(options.dest))
                    return false;
            }
            else if (arg == "--apply")
                options.apply = true;
            else if (arg == "--sort")
                options.sort = true;
            else if (arg == "--json")
                options.json_output = true;
            else if (!arg.empty() && arg[0] == '-')
            {
                std::cerr << "Error: unknown option: " << arg << std::endl;
                return false;
            }
            else if (options.folder.empty())
                options.folder = arg;
            else
            {
                std::cerr << "Error: unexpected argument: " << arg << std::endl;
                return false;
            }
        }
        if (options.folder.empty())
        {
            std::cerr << "Error: no folder given" << std::endl;
            return false;
        }
        return true;
    }

    std::string currentTimestamp()
    {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string describe(const FileMetadata &metadata)
    {
        std::stringstream ss;
        ss << metadata.path << "  (" << metadata.resolution << " px, " << metadata.size << " bytes, hash "
           << HashUtils::toHex(metadata.hash) << ")";
        return ss.str();
    }

    // Drives the review session from standard input, prompting on out
    std::vector<std::string> runManualReview(const DuplicateGroups &groups, const FileMetadataMap &all_file_data,
                                             std::ostream &out)
    {
        ManualReviewSession session(groups, all_file_data);
        while (!session.isDone())
        {
            const DuplicateGroup &group = session.currentGroup();
            out << std::endl
                << "Group " << (session.currentGroupIndex() + 1) << " of " << session.groupCount() << ":" << std::endl;
            for (size_t i = 0; i < group.size(); ++i)
            {
                auto it = all_file_data.find(group[i]);
                out << "  [" << (i + 1) << "] " << (it != all_file_data.end() ? describe(it->second) : group[i]) << std::endl;
            }
            out << "Number of the file to keep, s to skip, q to stop: " << std::flush;

            std::string answer;
            if (!std::getline(std::cin, answer) || answer == "q")
                break;

            bool decided = false;
            if (answer == "s")
                decided = session.skip();
            else
            {
                try
                {
                    size_t choice = std::stoul(answer);
                    if (choice >= 1 && choice <= group.size())
                        decided = session.approve(group[choice - 1]);
                }
                catch (const std::exception &)
                {
                    decided = false;
                }
            }

            if (!decided)
            {
                out << "Invalid choice: " << answer << std::endl;
                continue;
            }
            session.next();
        }

        Logger::info("Manual review finished: " + std::to_string(session.approvedCount()) + " approved, " +
                     std::to_string(session.skippedCount()) + " skipped");
        return session.getFilesForRemoval();
    }

    void printSummary(const RunOutcome &outcome, const std::vector<std::string> &removal)
    {
        std::cout << std::endl
                  << "Folder analysis: " << outcome.scan.total_files << " files, "
                  << outcome.scan.candidate_paths.size() << " candidate images" << std::endl;
        for (const auto &[ext, count] : outcome.scan.image_extension_counts)
            std::cout << "  " << ext << ": " << count << std::endl;

        std::cout << "Duplicate groups found: " << outcome.groups.size() << std::endl;
        for (size_t i = 0; i < outcome.groups.size(); ++i)
        {
            std::cout << "Group " << (i + 1) << ":" << std::endl;
            for (const auto &path : outcome.groups[i])
                std::cout << "  " << path << std::endl;
        }

        std::cout << "Files marked for removal: " << removal.size() << std::endl;
        for (const auto &path : removal)
            std::cout << "  " << path << std::endl;

        for (const auto &record : outcome.selection.files_to_sort)
            std::cout << "Original: " << record.original << " | Last edited: " << record.edited << std::endl;
    }
}

int main(int argc, char *argv[])
{
    CliOptions options;
    bool show_help = false;
    if (!parseArguments(argc, argv, options, show_help))
    {
        printUsage(argv[0]);
        return 1;
    }
    if (show_help)
    {
        printUsage(argv[0]);
        return 0;
    }

    // stdout carries only the JSON document
    if (options.json_output)
        Logger::setConsoleStream(Logger::ConsoleStream::STDERR);

    // Configuration: defaults, then file, then command line
    PocoConfigManager config_manager;
    if (!options.config_file.empty() && !config_manager.load(options.config_file))
    {
        std::cerr << "Error: could not load configuration file " << options.config_file << std::endl;
        return 1;
    }

    nlohmann::json overrides = nlohmann::json::object();
    if (options.threshold)
        overrides["detection"]["threshold"] = *options.threshold;
    if (options.strategy)
        overrides["selection"]["strategy"] = *options.strategy;
    if (options.log_level)
        overrides["log_level"] = *options.log_level;
    config_manager.update(overrides);

    if (!config_manager.validateConfig().empty())
    {
        std::cerr << "Error: invalid configuration, see log for details" << std::endl;
        return 1;
    }

    DedupConfig config = config_manager.getDedupConfig();
    Logger::init(config.log_level);
    Logger::addFileSink((std::filesystem::path(config.log_folder) / config.log_filename).string(),
                        config.log_max_file_size_bytes);

    PerformanceLogger performance_logger(config.log_folder, config.performance_log_filename);
    auto start_time = std::chrono::steady_clock::now();

    nlohmann::json run_stats;
    run_stats["timestamp"] = currentTimestamp();
    run_stats["folder"] = options.folder;
    run_stats["mode"] = DuplicateCheckRunner::getModeName(options.mode);
    run_stats["strategy"] = SelectionStrategies::getDisplayName(config.strategy);
    run_stats["threshold"] = config.threshold;

    auto finishRun = [&]()
    {
        run_stats["total_time"] = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        performance_logger.logRun(run_stats);
    };

    DuplicateCheckRunner runner(config);
    if (!options.json_output)
    {
        runner.setProgressCallback([](int percent, const std::string &message)
                                   { std::cerr << "[" << std::setw(3) << percent << "%] " << message << std::endl; });
    }

    RunRequest request;
    request.folder = options.folder;
    request.threshold = config.threshold;
    request.mode = options.mode;
    request.strategy = config.strategy;

    RunOutcome outcome;
    try
    {
        outcome = runner.run(request);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const DuplicateCheckError &e)
    {
        std::cerr << "An error occurred during the duplicate check: " << e.what() << std::endl;
        finishRun();
        return 2;
    }
    run_stats.update(outcome.statistics);

    std::vector<std::string> removal = options.mode == RunMode::MANUAL_REVIEW
                                           ? runManualReview(outcome.groups, outcome.all_file_data,
                                                             options.json_output ? std::cerr : std::cout)
                                           : outcome.selection.files_for_removal;
    run_stats["files_marked_for_removal"] = removal.size();
    run_stats["discarded_files"] = removal;

    if (options.json_output)
    {
        nlohmann::json out;
        out["statistics"] = run_stats;
        out["groups"] = outcome.groups;
        out["files_for_removal"] = removal;
        out["files_to_sort"] = nlohmann::json::array();
        for (const auto &record : outcome.selection.files_to_sort)
            out["files_to_sort"].push_back({{"original", record.original}, {"edited", record.edited}});
        std::cout << out.dump(2) << std::endl;
    }
    else
    {
        printSummary(outcome, removal);
    }

    if (options.apply && (!removal.empty() || !outcome.selection.files_to_sort.empty()))
    {
        auto move_start = std::chrono::steady_clock::now();
        ActionPlan plan;
        plan.remains_to_process = removal;
        plan.remains_action = RemainsAction::MOVE;
        plan.remains_dest_folder = options.dest.empty()
                                       ? (std::filesystem::path(config.target_base_dir) / config.duplicates_folder_name).string()
                                       : options.dest;

        bool sorting = options.sort && options.mode == RunMode::AUTOMATIC_SELECTION &&
                       config.strategy == SelectionStrategy::KEEP_ALL_UNIQUE_VERSIONS;
        if (sorting)
        {
            plan.files_to_sort = outcome.selection.files_to_sort;
            plan.base_sort_folder = options.folder;
        }

        FileActionExecutor executor;
        if (!options.json_output)
            executor.setLogCallback([](const std::string &line)
                                    { std::cout << line << std::endl; });
        ActionReport report = executor.execute(plan);
        run_stats["move_time"] = std::chrono::duration<double>(std::chrono::steady_clock::now() - move_start).count();
        run_stats["files_moved"] = report.moved + report.sorted;
    }

    finishRun();
    return 0;
}
