#include <string>
#include <cstdio>
#include <vector>

#include <lap/core/CTypedef.hpp>
#include "CScrubClient.hpp"

using namespace scrub;
using namespace scrub::client;

void printUsage(const char* programName) {
    printf("Usage: %s [options] <command>\n", programName);
    printf("\n");
    printf("Commands:\n");
    printf("  list                         List installed applications\n");
    printf("  clean                        Purge matching entries from application stores\n");
    printf("  modify-ids                   Regenerate machine and device identifiers\n");
    printf("  all                          clean, then modify-ids\n");
    printf("\n");
    printf("Options:\n");
    printf("  -a, --app <key>              Restrict to one application (repeatable), skips the family scan\n");
    printf("      --no-family              Do not scan for VS Code like editors by directory name\n");
    printf("  -h, --help                   Show this help message\n");
    printf("\n");
    printf("Examples:\n");
    printf("  %s list\n", programName);
    printf("  %s clean --app vscode\n", programName);
    printf("  %s all\n", programName);
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::vector<std::string> appKeys;
    bool includeFamily = true;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-a" || arg == "--app") {
            if (i + 1 < argc) {
                appKeys.push_back(argv[++i]);
            } else {
                fprintf(stderr, "Error: --app requires an argument\n");
                printUsage(argv[0]);
                return 1;
            }
        } else if (arg == "--no-family") {
            includeFamily = false;
        } else if (arg.find("-") == 0) {
            fprintf(stderr, "Error: Unknown option %s\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() != 1) {
        fprintf(stderr, "Error: Exactly one command expected\n");
        printUsage(argv[0]);
        return 1;
    }

    // Initialize logging system
    ::lap::log::LogManager::getInstance().initialize();

    auto configResult = ScrubConfig::Load();
    if (!configResult.HasValue()) {
        fprintf(stderr, "Error: Invalid configuration: %s\n", std::string(configResult.Error().Message()).c_str());
        return 1;
    }

    ScrubClient client(configResult.Value());

    auto keysResult = client.ValidateKeys(appKeys);
    if (!keysResult.HasValue()) {
        fprintf(stderr, "Error: Unknown application, use 'list' to see the supported keys\n");
        return 1;
    }

    const std::string& command = args[0];

    if (command == "list") {
        printf("Supported applications:\n");
        for (const auto& descriptor : client.GetCatalog().GetDescriptors()) {
            printf("  %-18s %s\n", descriptor.key.c_str(), descriptor.displayName.c_str());
        }

        auto installed = client.ListInstalled();
        printf("\nInstalled:\n");
        if (installed.empty()) {
            printf("  none\n");
        }
        for (const auto& entry : installed) {
            printf("  %-18s %s\n", entry.first->key.c_str(), entry.second.c_str());
        }
        return 0;
    }

    lap::core::UInt32 operations = 0;
    if (command == "clean") {
        operations = static_cast<lap::core::UInt32>(ScrubOperation::kPurge);
    } else if (command == "modify-ids") {
        operations = static_cast<lap::core::UInt32>(ScrubOperation::kRegenerate);
    } else if (command == "all") {
        operations = ScrubOperation::kPurge | ScrubOperation::kRegenerate;
    } else {
        fprintf(stderr, "Error: Unknown command %s\n", command.c_str());
        printUsage(argv[0]);
        return 1;
    }

    return client.Run(operations, appKeys, includeFamily);
}
